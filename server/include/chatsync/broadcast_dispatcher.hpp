/*
 * 설명: 연결별 이벤트 수신자(EventSink)를 관리하고 전체/발신자 제외/단일 대상으로 이벤트를 전달한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/broadcast_dispatcher_test.cpp
 */
#pragma once

#include <cstddef>
#include <list>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

#include "chatsync/connection_registry.hpp"
#include "chatsync/observability.hpp"

namespace chatsync {

// 전송 계층이 구현한다. SendEvent는 블로킹하지 않아야 하며 실패 시 예외를 던질 수 있다.
class EventSink {
 public:
  virtual ~EventSink() = default;
  virtual void SendEvent(const std::string& event, const nlohmann::json& payload) = 0;
  virtual void SendError(const std::string& code, const std::string& message) = 0;
};

class BroadcastDispatcher {
 public:
  void SetObservability(const std::shared_ptr<Observability>& observability) { observability_ = observability; }
  void Register(ConnectionId id, const std::shared_ptr<EventSink>& sink);
  void Unregister(ConnectionId id, const EventSink* sink);

  // 반환값은 전달에 성공한 수신자 수
  std::size_t ToAll(const std::string& event, const nlohmann::json& payload);
  std::size_t ToAllExcept(ConnectionId excluded, const std::string& event, const nlohmann::json& payload);
  bool ToOne(ConnectionId id, const std::string& event, const nlohmann::json& payload);
  bool ErrorToOne(ConnectionId id, const std::string& code, const std::string& message);

  std::size_t ActiveConnections() const;

 private:
  struct Entry {
    ConnectionId id;
    std::weak_ptr<EventSink> sink;
    const EventSink* raw{nullptr};
  };
  using Target = std::pair<ConnectionId, std::shared_ptr<EventSink>>;

  std::vector<Target> CollectTargets(const ConnectionId* excluded) const;
  std::size_t FanOut(const std::vector<Target>& targets, const std::string& event, const nlohmann::json& payload);
  void ReportFailure(ConnectionId id, const std::string& event, const char* reason);

  // 등록 순서를 유지해 모든 수신자가 같은 순서로 전달받도록 한다.
  std::list<Entry> entries_;
  std::unordered_map<ConnectionId, std::list<Entry>::iterator> index_;
  mutable std::mutex mutex_;
  // 팬아웃 전체를 직렬화해 수신자별 도착 순서가 호출 순서와 같도록 한다.
  std::mutex fanout_mutex_;
  std::shared_ptr<Observability> observability_;
};

}  // namespace chatsync
