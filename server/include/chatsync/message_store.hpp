/*
 * 설명: 메시지 저장소 계약(추가, 활성 목록, 소프트 삭제, 수정, 읽음 처리)과 메모리 구현을 정의한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/message_store_test.cpp, server/tests/it/mariadb_store_it_test.cpp
 */
#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "chatsync/message.hpp"

namespace chatsync {

inline constexpr std::size_t kDefaultHistoryLimit = 500;
inline constexpr std::chrono::seconds kDefaultEditCooldown{300};

enum class MutationStatus {
  kApplied,
  kDenied,
  kNotFound,
  kRateLimited,
  kAlready,
  kUnavailable,
};

// 클라이언트에 내려보내는 message-error 코드
std::string_view ToErrorCode(MutationStatus status);
std::string_view ToErrorMessage(MutationStatus status);

struct AppendResult {
  MutationStatus status{MutationStatus::kUnavailable};
  ChatMessage message;
};

struct ListResult {
  MutationStatus status{MutationStatus::kUnavailable};
  std::vector<ChatMessage> messages;
};

struct EditResult {
  MutationStatus status{MutationStatus::kUnavailable};
  std::string body;
  TimePoint edited_at;
};

class MessageStore {
 public:
  virtual ~MessageStore() = default;

  // author/body는 호출자가 이미 정제한 값이어야 한다.
  virtual AppendResult Append(const std::string& author, const std::string& body, TimePoint created_at) = 0;
  virtual ListResult ListActive(std::size_t limit) = 0;
  virtual MutationStatus SoftDelete(const std::string& id, const std::string& requesting_author) = 0;
  virtual EditResult Edit(const std::string& id, const std::string& requesting_author, const std::string& new_body,
                          TimePoint now) = 0;
  virtual MutationStatus MarkRead(const std::string& id, const std::string& reader_name) = 0;

  // 삭제된 레코드도 반환한다 (내부 정합성 확인용).
  virtual std::optional<ChatMessage> Find(const std::string& id) = 0;
};

class InMemoryMessageStore : public MessageStore {
 public:
  explicit InMemoryMessageStore(std::chrono::seconds edit_cooldown = kDefaultEditCooldown);

  AppendResult Append(const std::string& author, const std::string& body, TimePoint created_at) override;
  ListResult ListActive(std::size_t limit) override;
  MutationStatus SoftDelete(const std::string& id, const std::string& requesting_author) override;
  EditResult Edit(const std::string& id, const std::string& requesting_author, const std::string& new_body,
                  TimePoint now) override;
  MutationStatus MarkRead(const std::string& id, const std::string& reader_name) override;
  std::optional<ChatMessage> Find(const std::string& id) override;

  // 테스트에서 수정 시각을 과거로 되돌릴 때 사용한다.
  bool OverrideLastEditAt(const std::string& id, TimePoint last_edit_at);

 private:
  ChatMessage* Lookup(const std::string& id);

  std::chrono::seconds edit_cooldown_;
  std::vector<ChatMessage> messages_;
  std::unordered_map<std::string, std::size_t> index_;
  std::uint64_t next_id_{1};
  std::mutex mutex_;
};

}  // namespace chatsync
