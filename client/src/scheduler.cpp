/*
 * 설명: steady_timer 기반 지연 작업 스케줄러를 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: client/tests/unit/typing_tracker_test.cpp
 */
#include "chatsync/client/scheduler.hpp"

#include <utility>

namespace chatsync::client {

AsioScheduler::AsioScheduler(boost::asio::any_io_executor executor) : executor_(std::move(executor)) {}

AsioScheduler::~AsioScheduler() { CancelAll(); }

TaskHandle AsioScheduler::Schedule(std::chrono::milliseconds delay, std::function<void()> task) {
  auto timer = std::make_shared<boost::asio::steady_timer>(executor_, delay);
  TaskHandle handle = 0;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    handle = next_handle_++;
    timers_[handle] = timer;
  }
  timer->async_wait([this, handle, timer, task = std::move(task)](const boost::system::error_code& ec) {
    if (ec) {
      return;
    }
    {
      std::lock_guard<std::mutex> lock(mutex_);
      auto it = timers_.find(handle);
      if (it == timers_.end() || it->second != timer) {
        return;
      }
      timers_.erase(it);
    }
    task();
  });
  return handle;
}

bool AsioScheduler::Cancel(TaskHandle handle) {
  std::shared_ptr<boost::asio::steady_timer> timer;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = timers_.find(handle);
    if (it == timers_.end()) {
      return false;
    }
    timer = std::move(it->second);
    timers_.erase(it);
  }
  timer->cancel();
  return true;
}

std::chrono::steady_clock::time_point AsioScheduler::Now() const { return std::chrono::steady_clock::now(); }

void AsioScheduler::CancelAll() {
  std::unordered_map<TaskHandle, std::shared_ptr<boost::asio::steady_timer>> timers;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    timers.swap(timers_);
  }
  for (auto& [handle, timer] : timers) {
    timer->cancel();
  }
}

}  // namespace chatsync::client
