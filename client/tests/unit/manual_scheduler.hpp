#pragma once

#include <chrono>
#include <functional>
#include <map>

#include "chatsync/client/scheduler.hpp"

namespace chatsync::client::test_support {

// 가상 시간 스케줄러. Advance()로 시간을 옮기면 기한이 지난 작업을 순서대로 실행한다.
class ManualScheduler : public DeferredScheduler {
 public:
  TaskHandle Schedule(std::chrono::milliseconds delay, std::function<void()> task) override {
    auto handle = next_handle_++;
    tasks_[handle] = Task{now_ + delay, std::move(task)};
    return handle;
  }

  bool Cancel(TaskHandle handle) override { return tasks_.erase(handle) > 0; }

  std::chrono::steady_clock::time_point Now() const override { return now_; }

  void Advance(std::chrono::milliseconds delta) {
    auto target = now_ + delta;
    while (true) {
      auto next = tasks_.end();
      for (auto it = tasks_.begin(); it != tasks_.end(); ++it) {
        if (it->second.due <= target && (next == tasks_.end() || it->second.due < next->second.due)) {
          next = it;
        }
      }
      if (next == tasks_.end()) {
        break;
      }
      now_ = next->second.due;
      auto task = std::move(next->second.fn);
      tasks_.erase(next);
      task();
    }
    now_ = target;
  }

  std::size_t Pending() const { return tasks_.size(); }

 private:
  struct Task {
    std::chrono::steady_clock::time_point due;
    std::function<void()> fn;
  };

  std::chrono::steady_clock::time_point now_{};
  TaskHandle next_handle_{1};
  std::map<TaskHandle, Task> tasks_;
};

}  // namespace chatsync::client::test_support
