#include <atomic>
#include <chrono>
#include <cstdlib>
#include <memory>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

#include <gtest/gtest.h>

#include "chatsync/mariadb_message_store.hpp"
#include "chatsync/sanitize.hpp"

using namespace std::chrono_literals;

namespace {

chatsync::DbConfig TestDbConfig() {
  chatsync::DbConfig cfg;
  const char* host = std::getenv("DB_HOST");
  const char* port = std::getenv("DB_PORT");
  const char* user = std::getenv("DB_USER");
  const char* pass = std::getenv("DB_PASSWORD");
  const char* name = std::getenv("DB_NAME");
  cfg.host = host ? host : "127.0.0.1";
  cfg.port = port ? static_cast<unsigned short>(std::stoi(port)) : 3306;
  cfg.user = user ? user : "app";
  cfg.password = pass ? pass : "app_pass";
  cfg.database = name ? name : "chat_db";
  return cfg;
}

class MariaDbStoreItTest : public ::testing::Test {
 protected:
  void SetUp() override {
    observability_ = std::make_shared<chatsync::Observability>(chatsync::LogLevel::kDebug, &log_);
    db_client_ = std::make_shared<chatsync::MariaDbClient>(TestDbConfig());
    store_ = std::make_shared<chatsync::MariaDbMessageStore>(db_client_, observability_);
    store_->EnsureSchema();
    store_->ClearAll();
  }

  chatsync::TimePoint Base() const { return chatsync::FromEpochMillis(1714566645123LL); }

  std::ostringstream log_;
  std::shared_ptr<chatsync::Observability> observability_;
  std::shared_ptr<chatsync::MariaDbClient> db_client_;
  std::shared_ptr<chatsync::MariaDbMessageStore> store_;
};

}  // namespace

TEST_F(MariaDbStoreItTest, AppendAndListRoundTripsMillisecondTimestamps) {
  auto later = store_->Append("Alice", "second", Base() + 1s);
  auto earlier = store_->Append("Bob", "first", Base());
  ASSERT_EQ(later.status, chatsync::MutationStatus::kApplied);
  ASSERT_EQ(earlier.status, chatsync::MutationStatus::kApplied);

  auto list = store_->ListActive(chatsync::kDefaultHistoryLimit);
  ASSERT_EQ(list.status, chatsync::MutationStatus::kApplied);
  ASSERT_EQ(list.messages.size(), 2u);
  EXPECT_EQ(list.messages[0].id, earlier.message.id);
  EXPECT_EQ(list.messages[0].created_at, Base());
  EXPECT_EQ(list.messages[1].body, "second");
}

TEST_F(MariaDbStoreItTest, SoftDeleteKeepsTombstone) {
  auto appended = store_->Append("Alice", "bye", Base());
  EXPECT_EQ(store_->SoftDelete(appended.message.id, "Bob"), chatsync::MutationStatus::kDenied);
  EXPECT_EQ(store_->SoftDelete(appended.message.id, "Alice"), chatsync::MutationStatus::kApplied);
  EXPECT_TRUE(store_->ListActive(10).messages.empty());
  auto found = store_->Find(appended.message.id);
  ASSERT_TRUE(found.has_value());
  EXPECT_TRUE(found->deleted);
  EXPECT_EQ(store_->SoftDelete("not-a-number", "Alice"), chatsync::MutationStatus::kNotFound);
}

TEST_F(MariaDbStoreItTest, EditHonorsCooldown) {
  auto appended = store_->Append("Alice", "v1", Base());
  auto first = store_->Edit(appended.message.id, "Alice", "v2", Base() + 1min);
  ASSERT_EQ(first.status, chatsync::MutationStatus::kApplied);
  EXPECT_EQ(store_->Edit(appended.message.id, "Alice", "v3", Base() + 1min + 4min + 59s).status,
            chatsync::MutationStatus::kRateLimited);
  EXPECT_EQ(store_->Edit(appended.message.id, "Alice", "v3", Base() + 1min + 5min + 1s).status,
            chatsync::MutationStatus::kApplied);
  auto found = store_->Find(appended.message.id);
  ASSERT_TRUE(found.has_value());
  EXPECT_EQ(found->body, "v3");
  EXPECT_TRUE(found->edited);
}

TEST_F(MariaDbStoreItTest, ConcurrentMarkReadRecordsReaderOnce) {
  auto appended = store_->Append("Bob", "read me", Base());
  std::vector<std::thread> threads;
  std::atomic<int> applied{0};
  for (int i = 0; i < 4; ++i) {
    threads.emplace_back([this, &appended, &applied]() {
      if (store_->MarkRead(appended.message.id, "alice") == chatsync::MutationStatus::kApplied) {
        applied.fetch_add(1);
      }
    });
  }
  for (auto& t : threads) {
    t.join();
  }
  EXPECT_EQ(applied.load(), 1);
  auto found = store_->Find(appended.message.id);
  ASSERT_TRUE(found.has_value());
  EXPECT_EQ(found->read_by, std::vector<std::string>{"alice"});
  auto listed = store_->ListActive(10);
  ASSERT_EQ(listed.messages.size(), 1u);
  EXPECT_EQ(listed.messages[0].read_by, std::vector<std::string>{"alice"});
}

TEST_F(MariaDbStoreItTest, NamesCompareCaseSensitively) {
  auto appended = store_->Append("Alice", "case", Base());
  EXPECT_EQ(store_->MarkRead(appended.message.id, "alice"), chatsync::MutationStatus::kApplied);
  EXPECT_EQ(store_->MarkRead(appended.message.id, "Alice"), chatsync::MutationStatus::kApplied);
  EXPECT_EQ(store_->MarkRead(appended.message.id, "Alice"), chatsync::MutationStatus::kAlready);
  EXPECT_EQ(store_->SoftDelete(appended.message.id, "alice"), chatsync::MutationStatus::kDenied);

  auto found = store_->Find(appended.message.id);
  ASSERT_TRUE(found.has_value());
  EXPECT_EQ(found->read_by.size(), 2u);
  EXPECT_TRUE(found->HasReader("alice"));
  EXPECT_TRUE(found->HasReader("Alice"));
}

TEST_F(MariaDbStoreItTest, LongestDisplayNameRoundTrips) {
  const auto name = chatsync::CleanDisplayName(std::string(400, 'n'));
  auto appended = store_->Append(name, "long", Base());
  ASSERT_EQ(appended.status, chatsync::MutationStatus::kApplied);
  EXPECT_EQ(store_->Edit(appended.message.id, name, "edited", Base() + 1s).status,
            chatsync::MutationStatus::kApplied);
  auto found = store_->Find(appended.message.id);
  ASSERT_TRUE(found.has_value());
  EXPECT_EQ(found->author, name);
}

TEST_F(MariaDbStoreItTest, UnreachableDatabaseReportsUnavailable) {
  auto cfg = TestDbConfig();
  cfg.port = 1;
  auto broken = std::make_shared<chatsync::MariaDbMessageStore>(std::make_shared<chatsync::MariaDbClient>(cfg),
                                                                observability_);
  EXPECT_EQ(broken->Append("Alice", "x", Base()).status, chatsync::MutationStatus::kUnavailable);
  EXPECT_EQ(broken->ListActive(10).status, chatsync::MutationStatus::kUnavailable);
  EXPECT_GE(observability_->Snapshot().store_failures, 2u);
}

TEST_F(MariaDbStoreItTest, TransientDeadlockIsRetried) {
  std::atomic<int> injected{0};
  db_client_->SetTransientInjector([&injected](std::size_t attempt) {
    if (attempt == 1) {
      injected.fetch_add(1);
      return true;
    }
    return false;
  });
  auto appended = store_->Append("Alice", "after retry", Base());
  db_client_->SetTransientInjector({});

  EXPECT_EQ(appended.status, chatsync::MutationStatus::kApplied);
  EXPECT_EQ(injected.load(), 1);
  EXPECT_EQ(store_->ListActive(10).messages.size(), 1u);
}

TEST_F(MariaDbStoreItTest, PersistentTransientFailureGivesUp) {
  db_client_->SetTransientInjector([](std::size_t) { return true; });
  auto appended = store_->Append("Alice", "never", Base());
  db_client_->SetTransientInjector({});

  EXPECT_EQ(appended.status, chatsync::MutationStatus::kUnavailable);
  EXPECT_TRUE(store_->ListActive(10).messages.empty());
}
