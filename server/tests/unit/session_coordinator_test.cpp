#include <algorithm>
#include <cstdint>
#include <functional>
#include <limits>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include <gtest/gtest.h>

#include "chatsync/session_coordinator.hpp"

using namespace chatsync;
using namespace std::chrono_literals;

namespace {
class FakeSink : public EventSink {
 public:
  void SendEvent(const std::string& event, const nlohmann::json& payload) override {
    std::lock_guard<std::mutex> lock(mutex_);
    events_.emplace_back(event, payload);
  }
  void SendError(const std::string& code, const std::string& /*message*/) override {
    std::lock_guard<std::mutex> lock(mutex_);
    errors_.push_back(code);
  }

  std::vector<nlohmann::json> Payloads(const std::string& event) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<nlohmann::json> out;
    for (const auto& [name, payload] : events_) {
      if (name == event) {
        out.push_back(payload);
      }
    }
    return out;
  }

  std::size_t Count(const std::string& event) const { return Payloads(event).size(); }

  std::vector<std::string> Names() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> out;
    for (const auto& entry : events_) {
      out.push_back(entry.first);
    }
    return out;
  }

  std::vector<std::pair<std::string, nlohmann::json>> Events() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return events_;
  }

  std::vector<std::string> Errors() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return errors_;
  }

  void Clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    events_.clear();
    errors_.clear();
  }

 private:
  mutable std::mutex mutex_;
  std::vector<std::pair<std::string, nlohmann::json>> events_;
  std::vector<std::string> errors_;
};

// 쓰기 작업이 전부 실패하는 저장소
class UnavailableStore : public MessageStore {
 public:
  AppendResult Append(const std::string&, const std::string&, TimePoint) override {
    return AppendResult{MutationStatus::kUnavailable, {}};
  }
  ListResult ListActive(std::size_t) override { return ListResult{MutationStatus::kUnavailable, {}}; }
  MutationStatus SoftDelete(const std::string&, const std::string&) override { return MutationStatus::kUnavailable; }
  EditResult Edit(const std::string&, const std::string&, const std::string&, TimePoint) override {
    return EditResult{MutationStatus::kUnavailable, {}, {}};
  }
  MutationStatus MarkRead(const std::string&, const std::string&) override { return MutationStatus::kUnavailable; }
  std::optional<ChatMessage> Find(const std::string&) override { return std::nullopt; }
};

// 스냅샷을 뜬 직후 한 번 훅을 실행한다.
class SnapshotHookStore : public InMemoryMessageStore {
 public:
  void SetAfterSnapshot(std::function<void()> hook) { after_snapshot_ = std::move(hook); }

  ListResult ListActive(std::size_t limit) override {
    auto snapshot = InMemoryMessageStore::ListActive(limit);
    if (auto hook = std::exchange(after_snapshot_, nullptr)) {
      hook();
    }
    return snapshot;
  }

 private:
  std::function<void()> after_snapshot_;
};

class SessionCoordinatorTest : public ::testing::Test {
 protected:
  void SetUp() override { Build(std::make_shared<InMemoryMessageStore>(), CoordinatorOptions{}); }

  void Build(std::shared_ptr<MessageStore> store, CoordinatorOptions options) {
    store_ = std::move(store);
    observability_ = std::make_shared<Observability>(LogLevel::kDebug, &log_);
    registry_ = std::make_shared<ConnectionRegistry>();
    dispatcher_ = std::make_shared<BroadcastDispatcher>();
    dispatcher_->SetObservability(observability_);
    coordinator_ = std::make_shared<SessionCoordinator>(store_, registry_, dispatcher_, observability_, options,
                                                        [this]() { return now_; });
  }

  std::pair<ConnectionId, std::shared_ptr<FakeSink>> Connect() {
    auto sink = std::make_shared<FakeSink>();
    auto id = coordinator_->NextConnectionId();
    sinks_.push_back(sink);
    coordinator_->OnConnect(id, sink);
    return {id, sink};
  }

  void Send(ConnectionId id, const std::string& user, const std::string& text) {
    coordinator_->OnEvent(id, "send-message", {{"user", user}, {"text", text}});
  }

  void ClearSinks() {
    for (auto& sink : sinks_) {
      sink->Clear();
    }
  }

  std::ostringstream log_;
  TimePoint now_{FromEpochMillis(1714566645000LL)};
  std::shared_ptr<MessageStore> store_;
  std::shared_ptr<Observability> observability_;
  std::shared_ptr<ConnectionRegistry> registry_;
  std::shared_ptr<BroadcastDispatcher> dispatcher_;
  std::shared_ptr<SessionCoordinator> coordinator_;
  std::vector<std::shared_ptr<FakeSink>> sinks_;
};
}  // namespace

TEST_F(SessionCoordinatorTest, ConnectThenSendUpdatesMessageAndRoster) {
  auto [id, sink] = Connect();
  EXPECT_EQ(sink->Names(), (std::vector<std::string>{"room-users", "message-history", "room-users"}));
  EXPECT_EQ(sink->Payloads("message-history").front(), nlohmann::json::array());
  EXPECT_EQ(sink->Payloads("room-users").front(), nlohmann::json::array({"Anonymous"}));
  sink->Clear();

  Send(id, "Alice", "hi");
  EXPECT_EQ(sink->Names(), (std::vector<std::string>{"message", "room-users"}));
  auto message = sink->Payloads("message").front();
  EXPECT_EQ(message["author"], "Alice");
  EXPECT_EQ(message["body"], "hi");
  EXPECT_FALSE(message["deleted"].get<bool>());
  EXPECT_EQ(sink->Payloads("room-users").front(), nlohmann::json::array({"Alice"}));
}

TEST_F(SessionCoordinatorTest, NewcomerReceivesExistingHistory) {
  auto [alice, alice_sink] = Connect();
  Send(alice, "Alice", "first");
  auto [bob, bob_sink] = Connect();
  auto history = bob_sink->Payloads("message-history");
  ASSERT_EQ(history.size(), 1u);
  ASSERT_EQ(history.front().size(), 1u);
  EXPECT_EQ(history.front()[0]["body"], "first");
  EXPECT_EQ(alice_sink->Count("message-history"), 1u);
  EXPECT_EQ(alice_sink->Payloads("room-users").back(), nlohmann::json::array({"Alice", "Anonymous"}));
}

TEST_F(SessionCoordinatorTest, SendDuringNewcomerSnapshotStaysInNewcomerView) {
  auto hooked = std::make_shared<SnapshotHookStore>();
  Build(hooked, CoordinatorOptions{});
  auto [alice, alice_sink] = Connect();
  const ConnectionId sender_id = alice;

  std::thread sender;
  hooked->SetAfterSnapshot([this, &sender, sender_id]() {
    sender = std::thread([this, sender_id]() { Send(sender_id, "Alice", "racing"); });
    std::this_thread::sleep_for(100ms);
  });
  auto [bob, bob_sink] = Connect();
  sender.join();

  // bob이 받은 순서대로 적용한 결과 화면
  std::vector<std::string> view;
  for (const auto& [event, payload] : bob_sink->Events()) {
    if (event == "message-history") {
      view.clear();
      for (const auto& message : payload) {
        view.push_back(message["body"].get<std::string>());
      }
    } else if (event == "message") {
      view.push_back(payload["body"].get<std::string>());
    }
  }
  EXPECT_EQ(view, std::vector<std::string>{"racing"});
  EXPECT_EQ(coordinator_->History().messages.size(), 1u);
}

TEST_F(SessionCoordinatorTest, DeleteByNonAuthorIsDeniedWithoutBroadcast) {
  auto [alice, alice_sink] = Connect();
  auto [bob, bob_sink] = Connect();
  coordinator_->OnEvent(bob, "set-username", {{"name", "Bob"}});
  Send(alice, "Alice", "keep me");
  auto id = alice_sink->Payloads("message").front()["id"].get<std::string>();
  ClearSinks();

  coordinator_->OnEvent(bob, "delete-message", {{"id", id}});
  EXPECT_EQ(alice_sink->Count("delete-message"), 0u);
  EXPECT_EQ(bob_sink->Count("delete-message"), 0u);
  EXPECT_TRUE(alice_sink->Names().empty());
  auto errors = bob_sink->Payloads("message-error");
  ASSERT_EQ(errors.size(), 1u);
  EXPECT_EQ(errors.front()["code"], "forbidden");
  EXPECT_EQ(errors.front()["id"], id);

  auto found = store_->Find(id);
  ASSERT_TRUE(found.has_value());
  EXPECT_FALSE(found->deleted);
  EXPECT_EQ(coordinator_->History().messages.size(), 1u);
}

TEST_F(SessionCoordinatorTest, DenialIsSilentWhenNotificationsDisabled) {
  CoordinatorOptions options;
  options.notify_denials = false;
  Build(std::make_shared<InMemoryMessageStore>(), options);
  auto [alice, alice_sink] = Connect();
  auto [bob, bob_sink] = Connect();
  Send(alice, "Alice", "x");
  auto id = alice_sink->Payloads("message").front()["id"].get<std::string>();
  ClearSinks();

  coordinator_->OnEvent(bob, "edit-message", {{"id", id}, {"newText", "y"}});
  coordinator_->OnEvent(bob, "delete-message", {{"id", "999"}});
  EXPECT_TRUE(alice_sink->Names().empty());
  EXPECT_TRUE(bob_sink->Names().empty());
}

TEST_F(SessionCoordinatorTest, AuthorDeleteBroadcastsToAll) {
  auto [alice, alice_sink] = Connect();
  auto [bob, bob_sink] = Connect();
  Send(alice, "Alice", "oops");
  auto id = alice_sink->Payloads("message").front()["id"].get<std::string>();

  coordinator_->OnEvent(alice, "delete-message", {{"id", id}});
  ASSERT_EQ(bob_sink->Count("delete-message"), 1u);
  EXPECT_EQ(bob_sink->Payloads("delete-message").front()["id"], id);
  EXPECT_TRUE(coordinator_->History().messages.empty());
}

TEST_F(SessionCoordinatorTest, EditByAuthorBroadcastsNewTextAndTime) {
  auto [alice, alice_sink] = Connect();
  auto [bob, bob_sink] = Connect();
  Send(alice, "Alice", "helo");
  auto id = alice_sink->Payloads("message").front()["id"].get<std::string>();
  now_ += 10s;

  coordinator_->OnEvent(alice, "edit-message", {{"id", id}, {"newText", "hello"}});
  auto edits = bob_sink->Payloads("edit-message");
  ASSERT_EQ(edits.size(), 1u);
  EXPECT_EQ(edits.front()["id"], id);
  EXPECT_EQ(edits.front()["newText"], "hello");
  EXPECT_EQ(edits.front()["editTime"], ToIsoString(now_));
}

TEST_F(SessionCoordinatorTest, EditByNonAuthorNeverChangesState) {
  auto [alice, alice_sink] = Connect();
  auto [bob, bob_sink] = Connect();
  Send(alice, "Alice", "original");
  auto id = alice_sink->Payloads("message").front()["id"].get<std::string>();

  coordinator_->OnEvent(bob, "edit-message", {{"id", id}, {"newText", "changed"}});
  EXPECT_EQ(alice_sink->Count("edit-message"), 0u);
  EXPECT_EQ(store_->Find(id)->body, "original");
}

TEST_F(SessionCoordinatorTest, SecondEditInsideCooldownIsRateLimited) {
  auto [alice, alice_sink] = Connect();
  Send(alice, "Alice", "v1");
  auto id = alice_sink->Payloads("message").front()["id"].get<std::string>();

  coordinator_->OnEvent(alice, "edit-message", {{"id", id}, {"newText", "v2"}});
  now_ += 4min + 59s;
  coordinator_->OnEvent(alice, "edit-message", {{"id", id}, {"newText", "v3"}});
  EXPECT_EQ(alice_sink->Count("edit-message"), 1u);
  ASSERT_EQ(alice_sink->Count("message-error"), 1u);
  EXPECT_EQ(alice_sink->Payloads("message-error").front()["code"], "rate_limited");

  now_ += 2s;
  coordinator_->OnEvent(alice, "edit-message", {{"id", id}, {"newText", "v3"}});
  EXPECT_EQ(alice_sink->Count("edit-message"), 2u);
  EXPECT_EQ(store_->Find(id)->body, "v3");
}

TEST_F(SessionCoordinatorTest, ReadReceiptBroadcastsOnce) {
  auto [alice, alice_sink] = Connect();
  auto [bob, bob_sink] = Connect();
  coordinator_->OnEvent(bob, "set-username", "bob");
  Send(alice, "Alice", "read me");
  auto id = alice_sink->Payloads("message").front()["id"].get<std::string>();

  coordinator_->OnEvent(bob, "message-read", {{"id", id}});
  coordinator_->OnEvent(bob, "message-read", {{"id", id}});
  auto reads = alice_sink->Payloads("message-read");
  ASSERT_EQ(reads.size(), 1u);
  EXPECT_EQ(reads.front()["id"], id);
  EXPECT_EQ(reads.front()["readerName"], "bob");
  EXPECT_EQ(bob_sink->Count("message-error"), 0u);
  EXPECT_EQ(store_->Find(id)->read_by, std::vector<std::string>{"bob"});
}

TEST_F(SessionCoordinatorTest, TypingGoesToEveryoneButSender) {
  auto [alice, alice_sink] = Connect();
  auto [bob, bob_sink] = Connect();
  auto [carol, carol_sink] = Connect();
  ClearSinks();

  coordinator_->OnEvent(alice, "typing", {{"user", "Alice"}});
  EXPECT_EQ(alice_sink->Count("typing"), 0u);
  ASSERT_EQ(bob_sink->Count("typing"), 1u);
  ASSERT_EQ(carol_sink->Count("typing"), 1u);
  auto typing = bob_sink->Payloads("typing").front();
  EXPECT_EQ(typing["user"], "Alice");
  EXPECT_EQ(typing["at"], ToEpochMillis(now_));
  EXPECT_EQ(registry_->NameOf(alice), "Alice");
}

TEST_F(SessionCoordinatorTest, DisconnectBroadcastsRosterToRemaining) {
  auto [alice, alice_sink] = Connect();
  auto [bob, bob_sink] = Connect();
  coordinator_->OnEvent(bob, "set-username", {{"name", "Bob"}});
  ClearSinks();

  coordinator_->OnDisconnect(bob, bob_sink.get());
  EXPECT_EQ(alice_sink->Payloads("room-users").back(), nlohmann::json::array({"Anonymous"}));
  EXPECT_EQ(bob_sink->Count("room-users"), 0u);
  EXPECT_EQ(dispatcher_->ActiveConnections(), 1u);

  // 두 번째 해제는 명단을 바꾸지 않는다.
  coordinator_->OnDisconnect(bob, bob_sink.get());
  EXPECT_EQ(registry_->Size(), 1u);
}

TEST_F(SessionCoordinatorTest, StoreFailureIsReportedToSenderOnly) {
  Build(std::make_shared<UnavailableStore>(), CoordinatorOptions{});
  auto [alice, alice_sink] = Connect();
  auto [bob, bob_sink] = Connect();
  EXPECT_EQ(alice_sink->Count("message-history"), 0u);
  ClearSinks();

  Send(alice, "Alice", "lost");
  EXPECT_EQ(bob_sink->Count("message"), 0u);
  EXPECT_EQ(alice_sink->Count("message"), 0u);
  auto errors = alice_sink->Payloads("message-error");
  ASSERT_EQ(errors.size(), 1u);
  EXPECT_EQ(errors.front()["code"], "store_unavailable");
  EXPECT_EQ(bob_sink->Count("message-error"), 0u);
}

TEST_F(SessionCoordinatorTest, ClientTimeIsUsedWhenValid) {
  auto [alice, alice_sink] = Connect();
  coordinator_->OnEvent(alice, "send-message",
                        {{"user", "Alice"}, {"text", "dated"}, {"time", "2024-01-02T03:04:05.006Z"}});
  coordinator_->OnEvent(alice, "send-message", {{"user", "Alice"}, {"text", "undated"}, {"time", "garbage"}});
  auto messages = alice_sink->Payloads("message");
  ASSERT_EQ(messages.size(), 2u);
  EXPECT_EQ(messages[0]["createdAt"], "2024-01-02T03:04:05.006Z");
  EXPECT_EQ(messages[1]["createdAt"], ToIsoString(now_));
}

TEST_F(SessionCoordinatorTest, ClientTimeAsEpochMillisAndRangeBounds) {
  auto [alice, alice_sink] = Connect();
  coordinator_->OnEvent(alice, "send-message", {{"user", "Alice"}, {"text", "ms"}, {"time", 1704164645006LL}});
  coordinator_->OnEvent(alice, "send-message", {{"user", "Alice"}, {"text", "epoch"}, {"time", 0}});
  coordinator_->OnEvent(alice, "send-message", {{"user", "Alice"}, {"text", "before"}, {"time", -1}});
  coordinator_->OnEvent(alice, "send-message",
                        {{"user", "Alice"}, {"text", "huge"}, {"time", std::numeric_limits<std::int64_t>::max()}});
  auto messages = alice_sink->Payloads("message");
  ASSERT_EQ(messages.size(), 4u);
  EXPECT_EQ(messages[0]["createdAt"], "2024-01-02T03:04:05.006Z");
  EXPECT_EQ(messages[1]["createdAt"], "1970-01-01T00:00:00.000Z");
  EXPECT_EQ(messages[2]["createdAt"], ToIsoString(now_));
  EXPECT_EQ(messages[3]["createdAt"], ToIsoString(now_));
}

TEST_F(SessionCoordinatorTest, SanitizesAuthorAndBody) {
  auto [alice, alice_sink] = Connect();
  Send(alice, "  ", "<script>x</script><b>bold</b>");
  auto message = alice_sink->Payloads("message").front();
  EXPECT_EQ(message["author"], "Anonymous");
  EXPECT_EQ(message["body"], "bold");
}

TEST_F(SessionCoordinatorTest, MalformedEventsGetBadRequest) {
  auto [alice, alice_sink] = Connect();
  ClearSinks();
  coordinator_->OnEvent(alice, "delete-message", nlohmann::json::object());
  coordinator_->OnEvent(alice, "no-such-event", nullptr);
  EXPECT_EQ(alice_sink->Errors(), (std::vector<std::string>{"bad_request", "bad_request"}));

  Send(alice, "Alice", "");
  auto errors = alice_sink->Payloads("message-error");
  ASSERT_EQ(errors.size(), 1u);
  EXPECT_EQ(errors.front()["code"], "bad_request");
  EXPECT_EQ(alice_sink->Count("message"), 0u);
}

TEST_F(SessionCoordinatorTest, ConcurrentSendsReachEveryClientInSameOrder) {
  constexpr int kClients = 4;
  constexpr int kMessagesPerClient = 25;
  std::vector<std::pair<ConnectionId, std::shared_ptr<FakeSink>>> clients;
  for (int i = 0; i < kClients; ++i) {
    clients.push_back(Connect());
  }

  std::vector<std::thread> threads;
  for (int i = 0; i < kClients; ++i) {
    threads.emplace_back([this, &clients, i]() {
      for (int j = 0; j < kMessagesPerClient; ++j) {
        coordinator_->OnEvent(clients[i].first, "send-message",
                              {{"user", "user" + std::to_string(i)}, {"text", std::to_string(j)}});
      }
    });
  }
  for (auto& t : threads) {
    t.join();
  }

  auto ids_of = [](const std::shared_ptr<FakeSink>& sink) {
    std::vector<std::string> ids;
    for (const auto& payload : sink->Payloads("message")) {
      ids.push_back(payload["id"].get<std::string>());
    }
    return ids;
  };
  auto reference = ids_of(clients.front().second);
  ASSERT_EQ(reference.size(), static_cast<std::size_t>(kClients * kMessagesPerClient));
  for (const auto& client : clients) {
    EXPECT_EQ(ids_of(client.second), reference);
  }

  auto stored = coordinator_->History().messages;
  std::vector<std::string> stored_ids;
  for (const auto& message : stored) {
    stored_ids.push_back(message.id);
  }
  std::sort(stored_ids.begin(), stored_ids.end());
  std::sort(reference.begin(), reference.end());
  EXPECT_EQ(stored_ids, reference);
}
