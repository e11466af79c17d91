/*
 * 설명: 서버 이벤트를 받아 클라이언트의 메시지 목록, 스크롤 상태, 미확인 카운터를 맞춘다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: client/tests/unit/reconciler_test.cpp
 */
#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "chatsync/client/typing_tracker.hpp"
#include "chatsync/message.hpp"

namespace chatsync::client {

// 이 픽셀 이내로 바닥에 가까우면 바닥으로 본다.
inline constexpr double kBottomThresholdPx = 60.0;

class OutboundChannel {
 public:
  virtual ~OutboundChannel() = default;
  virtual bool IsConnected() const = 0;
  virtual void Emit(std::string_view event, const nlohmann::json& payload) = 0;
};

struct VisibleMessage {
  ChatMessage message;
  // 오프라인 전송으로 생긴 로컬 전용 메시지. 서버와 다시 맞추지 않는다.
  bool local_only{false};
};

struct SendResult {
  bool sent{false};
  std::optional<std::string> local_id;
};

class ChatReconciler {
 public:
  using Clock = std::function<TimePoint()>;
  using Listener = std::function<void()>;

  ChatReconciler(OutboundChannel& channel, TypingAggregator& typing,
                 Clock clock = [] { return std::chrono::system_clock::now(); });

  // 알 수 없는 이벤트면 false. 페이로드 형식이 틀리면 nlohmann::json::exception을 던진다.
  bool HandleEvent(std::string_view event, const nlohmann::json& payload);

  void OnHistory(std::vector<ChatMessage> messages);
  void OnMessage(ChatMessage message);
  void OnDelete(const std::string& id);
  void OnEdit(const std::string& id, const std::string& new_text, std::optional<TimePoint> edit_time);
  void OnRead(const std::string& id, const std::string& reader);
  void OnRoster(std::vector<std::string> names);
  void OnTyping(const std::string& subject);

  void OnScroll(double scroll_top, double viewport_height, double content_height);
  void JumpToNewest();

  SendResult Send(const std::string& author, const std::string& text);

  const std::vector<VisibleMessage>& Messages() const { return messages_; }
  const std::vector<std::string>& Roster() const { return roster_; }
  bool IsAtBottom() const { return at_bottom_; }
  std::size_t UnseenCount() const { return unseen_count_; }
  const VisibleMessage* FindMessage(std::string_view id) const;

  void SetChangeListener(Listener listener) { on_change_ = std::move(listener); }
  void SetScrollToEndListener(Listener listener) { on_scroll_to_end_ = std::move(listener); }
  void DetachListeners();

 private:
  VisibleMessage* FindMutable(std::string_view id);
  void InsertOrdered(VisibleMessage entry);
  void Notify();

  OutboundChannel& channel_;
  TypingAggregator& typing_;
  Clock clock_;
  std::vector<VisibleMessage> messages_;
  std::vector<std::string> roster_;
  bool at_bottom_{true};
  std::size_t unseen_count_{0};
  std::uint64_t local_seq_{0};
  Listener on_change_;
  Listener on_scroll_to_end_;
};

}  // namespace chatsync::client
