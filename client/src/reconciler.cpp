/*
 * 설명: 클라이언트 측 메시지 목록 재조정 로직을 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: client/tests/unit/reconciler_test.cpp
 */
#include "chatsync/client/reconciler.hpp"

#include <algorithm>
#include <utility>

#include "chatsync/events.hpp"

namespace chatsync::client {
namespace {
std::string IdFromJson(const nlohmann::json& value) {
  if (value.is_number_integer()) {
    return std::to_string(value.get<std::int64_t>());
  }
  return value.get<std::string>();
}
}  // namespace

ChatReconciler::ChatReconciler(OutboundChannel& channel, TypingAggregator& typing, Clock clock)
    : channel_(channel), typing_(typing), clock_(std::move(clock)) {}

bool ChatReconciler::HandleEvent(std::string_view event, const nlohmann::json& payload) {
  if (event == events::kMessageHistory) {
    std::vector<ChatMessage> messages;
    for (const auto& item : payload) {
      messages.push_back(MessageFromJson(item));
    }
    OnHistory(std::move(messages));
    return true;
  }
  if (event == events::kMessage) {
    OnMessage(MessageFromJson(payload));
    return true;
  }
  if (event == events::kDeleteMessage) {
    OnDelete(IdFromJson(payload.at("id")));
    return true;
  }
  if (event == events::kEditMessage) {
    std::optional<TimePoint> edit_time;
    if (payload.contains("editTime")) {
      edit_time = ParseTimestampField(payload["editTime"]);
    }
    OnEdit(IdFromJson(payload.at("id")), payload.at("newText").get<std::string>(), edit_time);
    return true;
  }
  if (event == events::kMessageRead) {
    OnRead(IdFromJson(payload.at("id")), payload.at("readerName").get<std::string>());
    return true;
  }
  if (event == events::kRoomUsers) {
    OnRoster(payload.get<std::vector<std::string>>());
    return true;
  }
  if (event == events::kTyping) {
    OnTyping(payload.at("user").get<std::string>());
    return true;
  }
  return false;
}

void ChatReconciler::OnHistory(std::vector<ChatMessage> messages) {
  std::vector<VisibleMessage> local_only;
  for (auto& entry : messages_) {
    if (entry.local_only) {
      local_only.push_back(std::move(entry));
    }
  }
  messages_.clear();
  for (auto& message : messages) {
    if (message.deleted) {
      continue;
    }
    messages_.push_back(VisibleMessage{std::move(message), false});
  }
  std::stable_sort(messages_.begin(), messages_.end(), [](const VisibleMessage& a, const VisibleMessage& b) {
    return a.message.created_at < b.message.created_at;
  });
  // 로컬 메시지도 createdAt 순서로 끼워 넣어야 이후 InsertOrdered의 정렬 전제가 유지된다.
  for (auto& entry : local_only) {
    InsertOrdered(std::move(entry));
  }
  at_bottom_ = true;
  unseen_count_ = 0;
  Notify();
}

void ChatReconciler::OnMessage(ChatMessage message) {
  if (message.deleted) {
    return;
  }
  if (auto* existing = FindMutable(message.id)) {
    existing->message = std::move(message);
    Notify();
    return;
  }
  InsertOrdered(VisibleMessage{std::move(message), false});
  if (!at_bottom_) {
    ++unseen_count_;
  }
  Notify();
}

void ChatReconciler::OnDelete(const std::string& id) {
  auto it = std::find_if(messages_.begin(), messages_.end(),
                         [&](const VisibleMessage& entry) { return !entry.local_only && entry.message.id == id; });
  if (it == messages_.end()) {
    return;
  }
  messages_.erase(it);
  Notify();
}

void ChatReconciler::OnEdit(const std::string& id, const std::string& new_text, std::optional<TimePoint> edit_time) {
  auto* entry = FindMutable(id);
  if (!entry) {
    return;
  }
  entry->message.body = new_text;
  entry->message.edited = true;
  entry->message.last_edit_at = edit_time ? edit_time : std::optional<TimePoint>(clock_());
  Notify();
}

void ChatReconciler::OnRead(const std::string& id, const std::string& reader) {
  auto* entry = FindMutable(id);
  if (!entry || entry->message.HasReader(reader)) {
    return;
  }
  entry->message.read_by.push_back(reader);
  Notify();
}

void ChatReconciler::OnRoster(std::vector<std::string> names) {
  roster_ = std::move(names);
  Notify();
}

void ChatReconciler::OnTyping(const std::string& subject) { typing_.OnTyping(subject); }

void ChatReconciler::OnScroll(double scroll_top, double viewport_height, double content_height) {
  bool at_bottom = content_height - scroll_top - viewport_height <= kBottomThresholdPx;
  bool changed = at_bottom != at_bottom_;
  at_bottom_ = at_bottom;
  if (at_bottom_ && unseen_count_ > 0) {
    unseen_count_ = 0;
    changed = true;
  }
  if (changed) {
    Notify();
  }
}

void ChatReconciler::JumpToNewest() {
  at_bottom_ = true;
  unseen_count_ = 0;
  if (on_scroll_to_end_) {
    on_scroll_to_end_();
  }
  Notify();
}

SendResult ChatReconciler::Send(const std::string& author, const std::string& text) {
  SendResult result;
  if (text.empty()) {
    return result;
  }
  auto now = clock_();
  if (channel_.IsConnected()) {
    channel_.Emit(events::kSendMessage, {{"user", author}, {"text", text}, {"time", ToIsoString(now)}});
    result.sent = true;
    return result;
  }

  ChatMessage local;
  local.id = "local-" + std::to_string(ToEpochMillis(now)) + "-" + std::to_string(++local_seq_);
  local.author = author.empty() ? std::string{kAnonymousName} : author;
  local.body = text;
  local.created_at = now;
  result.local_id = local.id;
  InsertOrdered(VisibleMessage{std::move(local), true});
  Notify();
  return result;
}

const VisibleMessage* ChatReconciler::FindMessage(std::string_view id) const {
  auto it = std::find_if(messages_.begin(), messages_.end(),
                         [&](const VisibleMessage& entry) { return entry.message.id == id; });
  return it == messages_.end() ? nullptr : &*it;
}

VisibleMessage* ChatReconciler::FindMutable(std::string_view id) {
  auto it = std::find_if(messages_.begin(), messages_.end(),
                         [&](const VisibleMessage& entry) { return !entry.local_only && entry.message.id == id; });
  return it == messages_.end() ? nullptr : &*it;
}

void ChatReconciler::InsertOrdered(VisibleMessage entry) {
  // 같은 createdAt이면 도착 순서를 유지한다.
  auto it = std::upper_bound(messages_.begin(), messages_.end(), entry.message.created_at,
                             [](const TimePoint& t, const VisibleMessage& e) { return t < e.message.created_at; });
  messages_.insert(it, std::move(entry));
}

void ChatReconciler::DetachListeners() {
  on_change_ = nullptr;
  on_scroll_to_end_ = nullptr;
}

void ChatReconciler::Notify() {
  if (on_change_) {
    on_change_();
  }
}

}  // namespace chatsync::client
