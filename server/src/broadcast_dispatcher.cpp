/*
 * 설명: 연결별 EventSink로 이벤트를 팬아웃하며 수신자 하나의 실패가 나머지 전달을 막지 않게 한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/broadcast_dispatcher_test.cpp
 */
#include "chatsync/broadcast_dispatcher.hpp"

#include <exception>
#include <iterator>

namespace chatsync {

void BroadcastDispatcher::Register(ConnectionId id, const std::shared_ptr<EventSink>& sink) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = index_.find(id);
  if (it != index_.end()) {
    it->second->sink = sink;
    it->second->raw = sink.get();
  } else {
    entries_.push_back(Entry{id, sink, sink.get()});
    index_[id] = std::prev(entries_.end());
  }
  if (observability_) {
    observability_->SetWebsocketActive(entries_.size());
  }
}

void BroadcastDispatcher::Unregister(ConnectionId id, const EventSink* sink) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = index_.find(id);
  if (it == index_.end()) {
    return;
  }
  if (it->second->raw == sink) {
    entries_.erase(it->second);
    index_.erase(it);
    if (observability_) {
      observability_->SetWebsocketActive(entries_.size());
    }
  }
}

std::size_t BroadcastDispatcher::ToAll(const std::string& event, const nlohmann::json& payload) {
  auto targets = CollectTargets(nullptr);
  return FanOut(targets, event, payload);
}

std::size_t BroadcastDispatcher::ToAllExcept(ConnectionId excluded, const std::string& event,
                                             const nlohmann::json& payload) {
  auto targets = CollectTargets(&excluded);
  return FanOut(targets, event, payload);
}

bool BroadcastDispatcher::ToOne(ConnectionId id, const std::string& event, const nlohmann::json& payload) {
  std::vector<Target> targets;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = index_.find(id);
    if (it == index_.end()) {
      return false;
    }
    if (auto sink = it->second->sink.lock()) {
      targets.emplace_back(id, std::move(sink));
    }
  }
  return FanOut(targets, event, payload) == 1;
}

bool BroadcastDispatcher::ErrorToOne(ConnectionId id, const std::string& code, const std::string& message) {
  std::shared_ptr<EventSink> sink;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = index_.find(id);
    if (it == index_.end()) {
      return false;
    }
    sink = it->second->sink.lock();
  }
  if (!sink) {
    return false;
  }
  try {
    sink->SendError(code, message);
    return true;
  } catch (const std::exception& ex) {
    ReportFailure(id, "error", ex.what());
    return false;
  }
}

std::size_t BroadcastDispatcher::ActiveConnections() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return entries_.size();
}

std::vector<BroadcastDispatcher::Target> BroadcastDispatcher::CollectTargets(const ConnectionId* excluded) const {
  std::vector<Target> targets;
  std::lock_guard<std::mutex> lock(mutex_);
  targets.reserve(entries_.size());
  for (const auto& entry : entries_) {
    if (excluded && entry.id == *excluded) {
      continue;
    }
    if (auto sink = entry.sink.lock()) {
      targets.emplace_back(entry.id, std::move(sink));
    }
  }
  return targets;
}

std::size_t BroadcastDispatcher::FanOut(const std::vector<Target>& targets, const std::string& event,
                                        const nlohmann::json& payload) {
  std::size_t delivered = 0;
  {
    std::lock_guard<std::mutex> fanout_lock(fanout_mutex_);
    for (const auto& [id, sink] : targets) {
      try {
        sink->SendEvent(event, payload);
        ++delivered;
      } catch (const std::exception& ex) {
        ReportFailure(id, event, ex.what());
      }
    }
  }
  if (observability_) {
    observability_->IncrementBroadcast();
    observability_->Event(LogLevel::kDebug, "dispatch." + event, std::nullopt,
                          std::to_string(delivered) + "/" + std::to_string(targets.size()));
  }
  return delivered;
}

void BroadcastDispatcher::ReportFailure(ConnectionId id, const std::string& event, const char* reason) {
  if (!observability_) {
    return;
  }
  observability_->IncrementDeliveryFailure();
  observability_->Event(LogLevel::kWarn, "dispatch.delivery_failed", id, event + ": " + reason);
}

}  // namespace chatsync
