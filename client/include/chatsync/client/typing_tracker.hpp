/*
 * 설명: 타이핑 표시의 수신측 만료(TypingAggregator)와 송신측 발행(TypingEmitter)을 정의한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: client/tests/unit/typing_tracker_test.cpp
 */
#pragma once

#include <chrono>
#include <functional>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <unordered_map>

#include "chatsync/client/scheduler.hpp"

namespace chatsync::client {

inline constexpr std::chrono::milliseconds kTypingExpiry{2000};

// 이름별로 하나의 만료 타이머를 유지한다. 갱신 시 기존 타이머를 취소하고 다시 건다.
class TypingAggregator {
 public:
  using ChangeHandler = std::function<void(const std::set<std::string>&)>;

  explicit TypingAggregator(DeferredScheduler& scheduler, std::chrono::milliseconds expiry = kTypingExpiry);
  ~TypingAggregator();

  TypingAggregator(const TypingAggregator&) = delete;
  TypingAggregator& operator=(const TypingAggregator&) = delete;

  void SetSelfName(std::string name);
  void OnTyping(const std::string& subject);
  bool IsActive(std::string_view subject) const;
  std::set<std::string> ActiveSubjects() const;
  void Clear();
  void SetChangeHandler(ChangeHandler handler) { on_change_ = std::move(handler); }

 private:
  void Expire(const std::string& subject);
  void NotifyChange();

  DeferredScheduler& scheduler_;
  std::chrono::milliseconds expiry_;
  std::string self_name_;
  std::unordered_map<std::string, TaskHandle> timers_;
  ChangeHandler on_change_;
};

class TypingEmitter {
 public:
  using EmitFn = std::function<void(const std::string& name)>;

  // throttle이 0이면 입력 변경마다 발행한다.
  TypingEmitter(DeferredScheduler& scheduler, EmitFn emit,
                std::chrono::milliseconds throttle = std::chrono::milliseconds{0});

  // 입력 중인 텍스트가 바뀔 때마다 호출한다. 발행했으면 true.
  bool OnComposeChanged(std::string_view text, const std::string& self_name, bool connected);
  void Reset() { last_emit_.reset(); }

 private:
  DeferredScheduler& scheduler_;
  EmitFn emit_;
  std::chrono::milliseconds throttle_;
  std::optional<std::chrono::steady_clock::time_point> last_emit_;
};

}  // namespace chatsync::client
