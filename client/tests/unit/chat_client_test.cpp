#include <chrono>
#include <condition_variable>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include "chatsync/client/chat_client.hpp"

using namespace chatsync::client;
using namespace std::chrono_literals;
namespace net = boost::asio;
namespace websocket = boost::beast::websocket;
using tcp = net::ip::tcp;

namespace {
// 루프백에서 WebSocket 연결 하나를 받아 클라이언트가 닫을 때까지 텍스트 프레임을 기록한다.
class RecordingServer {
 public:
  RecordingServer() : acceptor_(ioc_, tcp::endpoint{net::ip::address_v4::loopback(), 0}) {
    port_ = acceptor_.local_endpoint().port();
    acceptor_.async_accept([this](boost::beast::error_code ec, tcp::socket socket) {
      if (ec) {
        return;
      }
      ws_.emplace(std::move(socket));
      ws_->async_accept([this](boost::beast::error_code accept_ec) {
        if (!accept_ec) {
          Read();
        }
      });
    });
    thread_ = std::thread([this]() { ioc_.run(); });
  }

  ~RecordingServer() {
    ioc_.stop();
    thread_.join();
  }

  unsigned short Port() const { return port_; }

  bool WaitForClose(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    return closed_cv_.wait_for(lock, timeout, [this]() { return closed_; });
  }

  std::vector<nlohmann::json> Frames() {
    std::lock_guard<std::mutex> lock(mutex_);
    return frames_;
  }

 private:
  void Read() {
    ws_->async_read(buffer_, [this](boost::beast::error_code ec, std::size_t) {
      std::lock_guard<std::mutex> lock(mutex_);
      if (ec) {
        closed_ = true;
        closed_cv_.notify_all();
        return;
      }
      frames_.push_back(nlohmann::json::parse(boost::beast::buffers_to_string(buffer_.data())));
      buffer_.consume(buffer_.size());
      Read();
    });
  }

  net::io_context ioc_;
  tcp::acceptor acceptor_;
  unsigned short port_{0};
  std::optional<websocket::stream<tcp::socket>> ws_;
  boost::beast::flat_buffer buffer_;
  std::mutex mutex_;
  std::condition_variable closed_cv_;
  bool closed_{false};
  std::vector<nlohmann::json> frames_;
  std::thread thread_;
};

class ChatClientTest : public ::testing::Test {
 protected:
  void SetUp() override {
    ClientOptions options;
    options.host = "127.0.0.1";
    options.port = std::to_string(server_.Port());
    options.reconnect_delay = 60s;
    client_ = ChatClient::Create(ioc_, options);

    auto online = std::make_shared<std::promise<void>>();
    online_ = online->get_future();
    ClientListeners listeners;
    listeners.on_connection_changed = [online, fired = false](bool up) mutable {
      if (up && !fired) {
        fired = true;
        online->set_value();
      }
    };
    client_->SetListeners(std::move(listeners));
    client_->Start();
    io_thread_ = std::thread([this]() { ioc_.run(); });
  }

  void TearDown() override {
    client_->Stop();
    work_.reset();
    ioc_.stop();
    io_thread_.join();
  }

  RecordingServer server_;
  net::io_context ioc_;
  net::executor_work_guard<net::io_context::executor_type> work_{net::make_work_guard(ioc_)};
  std::shared_ptr<ChatClient> client_;
  std::future<void> online_;
  std::thread io_thread_;
};
}  // namespace

TEST_F(ChatClientTest, SendQueuedJustBeforeStopStillReachesServer) {
  ASSERT_EQ(online_.wait_for(5s), std::future_status::ready);
  ASSERT_TRUE(client_->IsConnected());

  // 두 작업은 같은 strand에 순서대로 쌓인다. 전송이 끊김보다 먼저 큐에 들어가야 한다.
  client_->SendText("last words");
  client_->Stop();

  ASSERT_TRUE(server_.WaitForClose(5s));
  auto frames = server_.Frames();
  ASSERT_EQ(frames.size(), 1u);
  EXPECT_EQ(frames[0]["t"], "event");
  EXPECT_EQ(frames[0]["event"], "send-message");
  EXPECT_EQ(frames[0]["p"]["text"], "last words");
  EXPECT_EQ(frames[0]["p"]["user"], "Anonymous");
  EXPECT_FALSE(client_->IsConnected());
}

TEST_F(ChatClientTest, SendBeforeConnectingBecomesLocalEcho) {
  ClientOptions options;
  options.display_name = "Alice";
  auto offline = ChatClient::Create(ioc_, options);

  auto local_count = std::make_shared<std::promise<std::size_t>>();
  auto counted = local_count->get_future();
  ClientListeners listeners;
  listeners.on_view_changed = [local_count, done = false](const ChatReconciler& view) mutable {
    std::size_t local = 0;
    for (const auto& entry : view.Messages()) {
      local += entry.local_only ? 1 : 0;
    }
    if (local > 0 && !done) {
      done = true;
      local_count->set_value(local);
    }
  };
  offline->SetListeners(std::move(listeners));
  offline->SendText("nobody hears");

  ASSERT_EQ(counted.wait_for(5s), std::future_status::ready);
  EXPECT_EQ(counted.get(), 1u);
  EXPECT_FALSE(offline->IsConnected());
  offline->Stop();
}
