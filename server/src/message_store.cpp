/*
 * 설명: 메시지 저장소의 상태 코드 매핑과 메모리 기반 구현을 제공한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/message_store_test.cpp
 */
#include "chatsync/message_store.hpp"

#include <algorithm>

namespace chatsync {

std::string_view ToErrorCode(MutationStatus status) {
  switch (status) {
    case MutationStatus::kApplied:
      return "ok";
    case MutationStatus::kDenied:
      return "forbidden";
    case MutationStatus::kNotFound:
      return "not_found";
    case MutationStatus::kRateLimited:
      return "rate_limited";
    case MutationStatus::kAlready:
      return "already_read";
    case MutationStatus::kUnavailable:
      return "store_unavailable";
  }
  return "store_unavailable";
}

std::string_view ToErrorMessage(MutationStatus status) {
  switch (status) {
    case MutationStatus::kApplied:
      return "처리되었습니다";
    case MutationStatus::kDenied:
      return "작성자만 수정/삭제할 수 있습니다";
    case MutationStatus::kNotFound:
      return "메시지를 찾을 수 없습니다";
    case MutationStatus::kRateLimited:
      return "수정 후 일정 시간이 지나야 다시 수정할 수 있습니다";
    case MutationStatus::kAlready:
      return "이미 읽음 처리되었습니다";
    case MutationStatus::kUnavailable:
      return "저장소를 사용할 수 없습니다";
  }
  return "저장소를 사용할 수 없습니다";
}

InMemoryMessageStore::InMemoryMessageStore(std::chrono::seconds edit_cooldown) : edit_cooldown_(edit_cooldown) {}

AppendResult InMemoryMessageStore::Append(const std::string& author, const std::string& body, TimePoint created_at) {
  std::lock_guard<std::mutex> lock(mutex_);
  ChatMessage message;
  message.id = std::to_string(next_id_++);
  message.author = author;
  message.body = body;
  message.created_at = created_at;
  index_[message.id] = messages_.size();
  messages_.push_back(message);
  return AppendResult{MutationStatus::kApplied, message};
}

ListResult InMemoryMessageStore::ListActive(std::size_t limit) {
  std::vector<ChatMessage> active;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& message : messages_) {
      if (!message.deleted) {
        active.push_back(message);
      }
    }
  }
  // 삽입 순서가 동률 타이브레이커가 되도록 stable_sort
  std::stable_sort(active.begin(), active.end(),
                   [](const ChatMessage& a, const ChatMessage& b) { return a.created_at < b.created_at; });
  if (active.size() > limit) {
    active.resize(limit);
  }
  return ListResult{MutationStatus::kApplied, std::move(active)};
}

MutationStatus InMemoryMessageStore::SoftDelete(const std::string& id, const std::string& requesting_author) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto* message = Lookup(id);
  if (!message || message->deleted) {
    return MutationStatus::kNotFound;
  }
  if (message->author != requesting_author) {
    return MutationStatus::kDenied;
  }
  message->deleted = true;
  return MutationStatus::kApplied;
}

EditResult InMemoryMessageStore::Edit(const std::string& id, const std::string& requesting_author,
                                      const std::string& new_body, TimePoint now) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto* message = Lookup(id);
  if (!message || message->deleted) {
    return EditResult{MutationStatus::kNotFound, {}, {}};
  }
  if (message->author != requesting_author) {
    return EditResult{MutationStatus::kDenied, {}, {}};
  }
  if (message->last_edit_at && now - *message->last_edit_at < edit_cooldown_) {
    return EditResult{MutationStatus::kRateLimited, {}, {}};
  }
  // lastEditAt은 뒤로 가지 않는다.
  TimePoint edited_at = message->last_edit_at ? std::max(now, *message->last_edit_at) : now;
  message->body = new_body;
  message->edited = true;
  message->last_edit_at = edited_at;
  return EditResult{MutationStatus::kApplied, new_body, edited_at};
}

MutationStatus InMemoryMessageStore::MarkRead(const std::string& id, const std::string& reader_name) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto* message = Lookup(id);
  if (!message || message->deleted) {
    return MutationStatus::kNotFound;
  }
  if (message->HasReader(reader_name)) {
    return MutationStatus::kAlready;
  }
  message->read_by.push_back(reader_name);
  return MutationStatus::kApplied;
}

std::optional<ChatMessage> InMemoryMessageStore::Find(const std::string& id) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto* message = Lookup(id);
  if (!message) {
    return std::nullopt;
  }
  return *message;
}

bool InMemoryMessageStore::OverrideLastEditAt(const std::string& id, TimePoint last_edit_at) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto* message = Lookup(id);
  if (!message) {
    return false;
  }
  message->last_edit_at = last_edit_at;
  return true;
}

ChatMessage* InMemoryMessageStore::Lookup(const std::string& id) {
  auto it = index_.find(id);
  if (it == index_.end()) {
    return nullptr;
  }
  return &messages_[it->second];
}

}  // namespace chatsync
