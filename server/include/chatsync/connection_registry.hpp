/*
 * 설명: 살아 있는 연결 id와 표시 이름의 대응을 관리하고 접속자 명단 스냅샷을 제공한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/connection_registry_test.cpp
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <list>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace chatsync {

using ConnectionId = std::uint64_t;

struct SetNameResult {
  std::string name;
  bool changed{false};
};

class ConnectionRegistry {
 public:
  // 기본 이름("Anonymous")으로 등록하고 현재 명단을 반환한다. 이미 등록된 id면 그대로 둔다.
  std::vector<std::string> OnConnect(ConnectionId id);

  // 이름을 정제해 저장한다. 등록되지 않은 연결이면 정제 결과만 돌려준다.
  SetNameResult SetName(ConnectionId id, std::string_view raw_name);

  std::optional<std::string> NameOf(ConnectionId id) const;

  // 없는 id면 아무것도 하지 않고 false를 반환한다.
  bool OnDisconnect(ConnectionId id);

  // 접속 순서. 같은 이름이 여러 번 나올 수 있다.
  std::vector<std::string> SnapshotNames() const;
  std::size_t Size() const;

 private:
  struct Entry {
    ConnectionId id;
    std::string display_name;
  };

  std::vector<std::string> SnapshotLocked() const;

  std::list<Entry> entries_;
  std::unordered_map<ConnectionId, std::list<Entry>::iterator> index_;
  mutable std::mutex mutex_;
};

}  // namespace chatsync
