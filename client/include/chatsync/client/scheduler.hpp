/*
 * 설명: 취소 가능한 지연 작업 스케줄러 추상화와 Asio 타이머 구현을 정의한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: client/tests/unit/typing_tracker_test.cpp
 */
#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <unordered_map>

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/steady_timer.hpp>

namespace chatsync::client {

using TaskHandle = std::uint64_t;

class DeferredScheduler {
 public:
  virtual ~DeferredScheduler() = default;
  virtual TaskHandle Schedule(std::chrono::milliseconds delay, std::function<void()> task) = 0;
  // 이미 실행되었거나 취소된 핸들이면 false.
  virtual bool Cancel(TaskHandle handle) = 0;
  virtual std::chrono::steady_clock::time_point Now() const = 0;
};

// 작업은 전달받은 executor(보통 클라이언트 strand) 위에서 실행된다.
class AsioScheduler : public DeferredScheduler {
 public:
  explicit AsioScheduler(boost::asio::any_io_executor executor);
  ~AsioScheduler() override;

  TaskHandle Schedule(std::chrono::milliseconds delay, std::function<void()> task) override;
  bool Cancel(TaskHandle handle) override;
  std::chrono::steady_clock::time_point Now() const override;

  void CancelAll();

 private:
  boost::asio::any_io_executor executor_;
  std::mutex mutex_;
  TaskHandle next_handle_{1};
  std::unordered_map<TaskHandle, std::shared_ptr<boost::asio::steady_timer>> timers_;
};

}  // namespace chatsync::client
