/*
 * 설명: 연결 명단을 뮤텍스로 보호된 리스트 + 인덱스로 관리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/connection_registry_test.cpp
 */
#include "chatsync/connection_registry.hpp"

#include <iterator>

#include "chatsync/message.hpp"
#include "chatsync/sanitize.hpp"

namespace chatsync {

std::vector<std::string> ConnectionRegistry::OnConnect(ConnectionId id) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (index_.count(id) == 0) {
    entries_.push_back(Entry{id, std::string(kAnonymousName)});
    index_[id] = std::prev(entries_.end());
  }
  return SnapshotLocked();
}

SetNameResult ConnectionRegistry::SetName(ConnectionId id, std::string_view raw_name) {
  auto clean = CleanDisplayName(raw_name);
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = index_.find(id);
  if (it == index_.end()) {
    return SetNameResult{clean, false};
  }
  bool changed = it->second->display_name != clean;
  it->second->display_name = clean;
  return SetNameResult{clean, changed};
}

std::optional<std::string> ConnectionRegistry::NameOf(ConnectionId id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = index_.find(id);
  if (it == index_.end()) {
    return std::nullopt;
  }
  return it->second->display_name;
}

bool ConnectionRegistry::OnDisconnect(ConnectionId id) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = index_.find(id);
  if (it == index_.end()) {
    return false;
  }
  entries_.erase(it->second);
  index_.erase(it);
  return true;
}

std::vector<std::string> ConnectionRegistry::SnapshotNames() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return SnapshotLocked();
}

std::size_t ConnectionRegistry::Size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return entries_.size();
}

std::vector<std::string> ConnectionRegistry::SnapshotLocked() const {
  std::vector<std::string> names;
  names.reserve(entries_.size());
  for (const auto& entry : entries_) {
    names.push_back(entry.display_name);
  }
  return names;
}

}  // namespace chatsync
