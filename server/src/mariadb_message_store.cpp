/*
 * 설명: 메시지 추가/조회/소프트 삭제/수정/읽음 처리를 MariaDB 트랜잭션으로 수행한다.
 *       변경 연산은 대상 행을 SELECT ... FOR UPDATE로 잠가 같은 id에 대한 동시 변경을 직렬화한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/it/mariadb_store_it_test.cpp
 */
#include "chatsync/mariadb_message_store.hpp"

#include <algorithm>
#include <charconv>
#include <sstream>
#include <unordered_map>

namespace chatsync {
namespace {
constexpr unsigned int kDuplicateEntry = 1062;

constexpr const char* kCreateMessages =
    "CREATE TABLE IF NOT EXISTS chat_messages ("
    " id BIGINT UNSIGNED NOT NULL AUTO_INCREMENT PRIMARY KEY,"
    " author VARCHAR(255) CHARACTER SET utf8mb4 COLLATE utf8mb4_bin NOT NULL,"
    " body TEXT NOT NULL,"
    " created_at DATETIME(3) NOT NULL,"
    " deleted TINYINT(1) NOT NULL DEFAULT 0,"
    " edited TINYINT(1) NOT NULL DEFAULT 0,"
    " last_edit_at DATETIME(3) NULL,"
    " INDEX idx_chat_messages_created (deleted, created_at, id)"
    ") DEFAULT CHARSET=utf8mb4;";

constexpr const char* kCreateReads =
    "CREATE TABLE IF NOT EXISTS chat_message_reads ("
    " message_id BIGINT UNSIGNED NOT NULL,"
    " reader_name VARCHAR(255) CHARACTER SET utf8mb4 COLLATE utf8mb4_bin NOT NULL,"
    " read_at DATETIME(3) NOT NULL,"
    " PRIMARY KEY (message_id, reader_name)"
    ") DEFAULT CHARSET=utf8mb4;";

// 이름 비교는 바이트 단위여야 한다("alice"와 "Alice"는 다른 사용자).
// 기본 콜레이션으로 이미 만들어진 테이블도 맞춘다.
constexpr const char* kBinaryAuthor =
    "ALTER TABLE chat_messages MODIFY author VARCHAR(255) CHARACTER SET utf8mb4 COLLATE utf8mb4_bin NOT NULL;";
constexpr const char* kBinaryReader =
    "ALTER TABLE chat_message_reads MODIFY reader_name VARCHAR(255) CHARACTER SET utf8mb4 COLLATE utf8mb4_bin "
    "NOT NULL;";

constexpr const char* kMessageColumns = "id, author, body, created_at, deleted, edited, last_edit_at";

std::optional<std::uint64_t> ParseId(const std::string& id) {
  std::uint64_t value = 0;
  auto [ptr, ec] = std::from_chars(id.data(), id.data() + id.size(), value);
  if (ec != std::errc{} || ptr != id.data() + id.size() || id.empty()) {
    return std::nullopt;
  }
  return value;
}

std::string ToDbTimestamp(TimePoint tp) {
  // "2024-05-01T12:30:45.123Z" -> "2024-05-01 12:30:45.123"
  auto iso = ToIsoString(tp);
  iso[10] = ' ';
  iso.pop_back();
  return iso;
}

TimePoint FromDbTimestamp(const char* text) {
  if (!text) {
    return TimePoint{};
  }
  return ParseIsoTimestamp(text).value_or(TimePoint{});
}

bool IsTrue(const char* value) { return value && value[0] == '1'; }
}  // namespace

MariaDbMessageStore::MariaDbMessageStore(std::shared_ptr<MariaDbClient> db_client,
                                         std::shared_ptr<Observability> observability,
                                         std::chrono::seconds edit_cooldown)
    : db_client_(std::move(db_client)), observability_(std::move(observability)), edit_cooldown_(edit_cooldown) {}

void MariaDbMessageStore::EnsureSchema() const {
  db_client_->WithConnectionRetry([&](MYSQL* conn) {
    db_client_->Execute(conn, kCreateMessages, "메시지 테이블 생성 실패");
    db_client_->Execute(conn, kCreateReads, "읽음 테이블 생성 실패");
    db_client_->Execute(conn, kBinaryAuthor, "작성자 콜레이션 변경 실패");
    db_client_->Execute(conn, kBinaryReader, "읽은 사람 콜레이션 변경 실패");
  });
}

AppendResult MariaDbMessageStore::Append(const std::string& author, const std::string& body, TimePoint created_at) {
  AppendResult result;
  try {
    db_client_->ExecuteTransactionWithRetry([&](MYSQL* conn) {
      std::ostringstream oss;
      oss << "INSERT INTO chat_messages(author, body, created_at) VALUES('" << db_client_->Escape(conn, author)
          << "', '" << db_client_->Escape(conn, body) << "', '" << ToDbTimestamp(created_at) << "');";
      db_client_->Execute(conn, oss.str(), "메시지 저장 실패");
      result.message = ChatMessage{};
      result.message.id = std::to_string(mysql_insert_id(conn));
      result.message.author = author;
      result.message.body = body;
      result.message.created_at = created_at;
      result.status = MutationStatus::kApplied;
      return true;
    });
  } catch (const std::exception& ex) {
    ReportFailure("store.append", ex);
    return AppendResult{MutationStatus::kUnavailable, {}};
  }
  return result;
}

ListResult MariaDbMessageStore::ListActive(std::size_t limit) {
  std::vector<ChatMessage> messages;
  try {
    db_client_->WithConnectionRetry([&](MYSQL* conn) {
      messages.clear();
      std::ostringstream oss;
      oss << "SELECT " << kMessageColumns
          << " FROM chat_messages WHERE deleted=0 ORDER BY created_at ASC, id ASC LIMIT " << limit << ";";
      auto res = db_client_->Query(conn, oss.str(), "메시지 목록 조회 실패");
      while (MYSQL_ROW row = res.Next()) {
        messages.push_back(BuildMessage(row));
      }
      LoadReaders(conn, messages);
    });
  } catch (const std::exception& ex) {
    ReportFailure("store.list_active", ex);
    return ListResult{MutationStatus::kUnavailable, {}};
  }
  return ListResult{MutationStatus::kApplied, std::move(messages)};
}

MutationStatus MariaDbMessageStore::SoftDelete(const std::string& id, const std::string& requesting_author) {
  auto numeric_id = ParseId(id);
  if (!numeric_id) {
    return MutationStatus::kNotFound;
  }
  MutationStatus status = MutationStatus::kUnavailable;
  try {
    db_client_->ExecuteTransactionWithRetry([&](MYSQL* conn) {
      std::ostringstream select;
      select << "SELECT author, deleted FROM chat_messages WHERE id=" << *numeric_id << " FOR UPDATE;";
      auto res = db_client_->Query(conn, select.str(), "삭제 대상 조회 실패");
      MYSQL_ROW row = res.Next();
      if (!row || IsTrue(row[1])) {
        status = MutationStatus::kNotFound;
        return false;
      }
      if (requesting_author != (row[0] ? row[0] : "")) {
        status = MutationStatus::kDenied;
        return false;
      }
      std::ostringstream update;
      update << "UPDATE chat_messages SET deleted=1 WHERE id=" << *numeric_id << ";";
      db_client_->Execute(conn, update.str(), "소프트 삭제 실패");
      status = MutationStatus::kApplied;
      return true;
    });
  } catch (const std::exception& ex) {
    ReportFailure("store.soft_delete", ex);
    return MutationStatus::kUnavailable;
  }
  return status;
}

EditResult MariaDbMessageStore::Edit(const std::string& id, const std::string& requesting_author,
                                     const std::string& new_body, TimePoint now) {
  auto numeric_id = ParseId(id);
  if (!numeric_id) {
    return EditResult{MutationStatus::kNotFound, {}, {}};
  }
  EditResult result;
  try {
    db_client_->ExecuteTransactionWithRetry([&](MYSQL* conn) {
      std::ostringstream select;
      select << "SELECT author, deleted, last_edit_at FROM chat_messages WHERE id=" << *numeric_id << " FOR UPDATE;";
      auto res = db_client_->Query(conn, select.str(), "수정 대상 조회 실패");
      MYSQL_ROW row = res.Next();
      if (!row || IsTrue(row[1])) {
        result = EditResult{MutationStatus::kNotFound, {}, {}};
        return false;
      }
      if (requesting_author != (row[0] ? row[0] : "")) {
        result = EditResult{MutationStatus::kDenied, {}, {}};
        return false;
      }
      TimePoint edited_at = now;
      if (row[2]) {
        auto last_edit_at = FromDbTimestamp(row[2]);
        if (now - last_edit_at < edit_cooldown_) {
          result = EditResult{MutationStatus::kRateLimited, {}, {}};
          return false;
        }
        edited_at = std::max(now, last_edit_at);
      }
      std::ostringstream update;
      update << "UPDATE chat_messages SET body='" << db_client_->Escape(conn, new_body) << "', edited=1, last_edit_at='"
             << ToDbTimestamp(edited_at) << "' WHERE id=" << *numeric_id << ";";
      db_client_->Execute(conn, update.str(), "메시지 수정 실패");
      result = EditResult{MutationStatus::kApplied, new_body, edited_at};
      return true;
    });
  } catch (const std::exception& ex) {
    ReportFailure("store.edit", ex);
    return EditResult{MutationStatus::kUnavailable, {}, {}};
  }
  return result;
}

MutationStatus MariaDbMessageStore::MarkRead(const std::string& id, const std::string& reader_name) {
  auto numeric_id = ParseId(id);
  if (!numeric_id) {
    return MutationStatus::kNotFound;
  }
  MutationStatus status = MutationStatus::kUnavailable;
  try {
    db_client_->ExecuteTransactionWithRetry([&](MYSQL* conn) {
      std::ostringstream select;
      select << "SELECT deleted FROM chat_messages WHERE id=" << *numeric_id << " FOR UPDATE;";
      auto res = db_client_->Query(conn, select.str(), "읽음 대상 조회 실패");
      MYSQL_ROW row = res.Next();
      if (!row || IsTrue(row[0])) {
        status = MutationStatus::kNotFound;
        return false;
      }
      std::ostringstream insert;
      insert << "INSERT INTO chat_message_reads(message_id, reader_name, read_at) VALUES(" << *numeric_id << ", '"
             << db_client_->Escape(conn, reader_name) << "', NOW(3));";
      if (mysql_query(conn, insert.str().c_str()) != 0) {
        if (mysql_errno(conn) == kDuplicateEntry) {
          status = MutationStatus::kAlready;
          return false;
        }
        db_client_->RaiseError(conn, "읽음 저장 실패");
      }
      status = MutationStatus::kApplied;
      return true;
    });
  } catch (const std::exception& ex) {
    ReportFailure("store.mark_read", ex);
    return MutationStatus::kUnavailable;
  }
  return status;
}

std::optional<ChatMessage> MariaDbMessageStore::Find(const std::string& id) {
  auto numeric_id = ParseId(id);
  if (!numeric_id) {
    return std::nullopt;
  }
  std::optional<ChatMessage> found;
  try {
    db_client_->WithConnectionRetry([&](MYSQL* conn) {
      std::ostringstream oss;
      oss << "SELECT " << kMessageColumns << " FROM chat_messages WHERE id=" << *numeric_id << ";";
      auto res = db_client_->Query(conn, oss.str(), "메시지 조회 실패");
      MYSQL_ROW row = res.Next();
      if (!row) {
        found.reset();
        return;
      }
      std::vector<ChatMessage> single{BuildMessage(row)};
      LoadReaders(conn, single);
      found = std::move(single.front());
    });
  } catch (const std::exception& ex) {
    ReportFailure("store.find", ex);
    return std::nullopt;
  }
  return found;
}

void MariaDbMessageStore::ClearAll() const {
  db_client_->WithConnectionRetry([&](MYSQL* conn) {
    db_client_->Execute(conn, "DELETE FROM chat_message_reads;", "읽음 테이블 초기화 실패");
    db_client_->Execute(conn, "DELETE FROM chat_messages;", "메시지 테이블 초기화 실패");
  });
}

ChatMessage MariaDbMessageStore::BuildMessage(MYSQL_ROW row) const {
  ChatMessage message;
  message.id = row[0] ? row[0] : "";
  message.author = row[1] ? row[1] : "";
  message.body = row[2] ? row[2] : "";
  message.created_at = FromDbTimestamp(row[3]);
  message.deleted = IsTrue(row[4]);
  message.edited = IsTrue(row[5]);
  if (row[6]) {
    message.last_edit_at = FromDbTimestamp(row[6]);
  }
  return message;
}

void MariaDbMessageStore::LoadReaders(MYSQL* conn, std::vector<ChatMessage>& messages) const {
  if (messages.empty()) {
    return;
  }
  std::unordered_map<std::string, std::size_t> positions;
  std::ostringstream oss;
  oss << "SELECT message_id, reader_name FROM chat_message_reads WHERE message_id IN (";
  for (std::size_t i = 0; i < messages.size(); ++i) {
    positions[messages[i].id] = i;
    oss << (i == 0 ? "" : ",") << messages[i].id;
  }
  oss << ") ORDER BY read_at ASC;";
  auto res = db_client_->Query(conn, oss.str(), "읽음 목록 조회 실패");
  while (MYSQL_ROW row = res.Next()) {
    auto it = positions.find(row[0] ? row[0] : "");
    if (it != positions.end() && row[1]) {
      messages[it->second].read_by.emplace_back(row[1]);
    }
  }
}

void MariaDbMessageStore::ReportFailure(const char* operation, const std::exception& ex) const {
  if (observability_) {
    observability_->IncrementStoreFailure();
    observability_->Event(LogLevel::kError, operation, std::nullopt, ex.what());
  }
}

}  // namespace chatsync
