/*
 * 설명: 타이핑 표시 집계와 발행 로직을 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: client/tests/unit/typing_tracker_test.cpp
 */
#include "chatsync/client/typing_tracker.hpp"

#include <utility>

namespace chatsync::client {

TypingAggregator::TypingAggregator(DeferredScheduler& scheduler, std::chrono::milliseconds expiry)
    : scheduler_(scheduler), expiry_(expiry) {}

TypingAggregator::~TypingAggregator() {
  for (const auto& [subject, handle] : timers_) {
    scheduler_.Cancel(handle);
  }
}

void TypingAggregator::SetSelfName(std::string name) {
  self_name_ = std::move(name);
  auto it = timers_.find(self_name_);
  if (it != timers_.end()) {
    scheduler_.Cancel(it->second);
    timers_.erase(it);
    NotifyChange();
  }
}

void TypingAggregator::OnTyping(const std::string& subject) {
  if (subject.empty() || subject == self_name_) {
    return;
  }
  bool was_active = false;
  auto it = timers_.find(subject);
  if (it != timers_.end()) {
    scheduler_.Cancel(it->second);
    was_active = true;
  }
  timers_[subject] = scheduler_.Schedule(expiry_, [this, subject]() { Expire(subject); });
  if (!was_active) {
    NotifyChange();
  }
}

void TypingAggregator::Expire(const std::string& subject) {
  if (timers_.erase(subject) > 0) {
    NotifyChange();
  }
}

bool TypingAggregator::IsActive(std::string_view subject) const {
  return timers_.find(std::string(subject)) != timers_.end();
}

std::set<std::string> TypingAggregator::ActiveSubjects() const {
  std::set<std::string> subjects;
  for (const auto& [subject, handle] : timers_) {
    subjects.insert(subject);
  }
  return subjects;
}

void TypingAggregator::Clear() {
  if (timers_.empty()) {
    return;
  }
  for (const auto& [subject, handle] : timers_) {
    scheduler_.Cancel(handle);
  }
  timers_.clear();
  NotifyChange();
}

void TypingAggregator::NotifyChange() {
  if (on_change_) {
    on_change_(ActiveSubjects());
  }
}

TypingEmitter::TypingEmitter(DeferredScheduler& scheduler, EmitFn emit, std::chrono::milliseconds throttle)
    : scheduler_(scheduler), emit_(std::move(emit)), throttle_(throttle) {}

bool TypingEmitter::OnComposeChanged(std::string_view text, const std::string& self_name, bool connected) {
  if (text.empty() || !connected) {
    return false;
  }
  auto now = scheduler_.Now();
  if (throttle_.count() > 0 && last_emit_ && now - *last_emit_ < throttle_) {
    return false;
  }
  last_emit_ = now;
  emit_(self_name);
  return true;
}

}  // namespace chatsync::client
