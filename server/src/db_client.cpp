/*
 * 설명: MariaDB 연결과 재시도 로직을 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/it/mariadb_store_it_test.cpp
 */
#include "chatsync/db_client.hpp"

#include <chrono>
#include <random>
#include <thread>

#include <mariadb/errmsg.h>

namespace chatsync {
namespace {
constexpr std::size_t kMaxAttempts = 3;
constexpr unsigned int kDeadlock = 1213;
constexpr unsigned int kLockWaitTimeout = 1205;
}  // namespace

MariaDbClient::MariaDbClient(const DbConfig& config) : config_(config) {}

MariaDbClient::ConnectionHandle MariaDbClient::Connect() const {
  ConnectionHandle handle{mysql_init(nullptr)};
  MYSQL* raw = handle.get();
  if (!raw) {
    throw DbException("MariaDB 핸들 생성 실패", 0, true);
  }
  mysql_options(raw, MYSQL_OPT_CONNECT_TIMEOUT, &connect_timeout_seconds_);
  mysql_options(raw, MYSQL_OPT_READ_TIMEOUT, &query_timeout_seconds_);
  mysql_options(raw, MYSQL_OPT_WRITE_TIMEOUT, &query_timeout_seconds_);
  mysql_options(raw, MYSQL_SET_CHARSET_NAME, "utf8mb4");
  const auto& cfg = config_;
  if (!mysql_real_connect(raw, cfg.host.c_str(), cfg.user.c_str(), cfg.password.c_str(), cfg.database.c_str(),
                          cfg.port, nullptr, 0)) {
    RaiseError(raw, "연결 실패");
  }
  // DATETIME(3) 값은 모두 UTC로 다룬다.
  Execute(raw, "SET time_zone='+00:00', SESSION innodb_lock_wait_timeout=2;", "세션 설정 실패");
  return handle;
}

void MariaDbClient::RunWithRetry(const std::function<void(MYSQL*)>& body) const {
  for (std::size_t attempt = 1;; ++attempt) {
    try {
      auto conn = Connect();
      if (transient_injector_ && transient_injector_(attempt)) {
        throw DbException("주입된 일시 오류", kDeadlock, true);
      }
      body(conn.get());
      return;
    } catch (const DbException& ex) {
      // 연결은 catch 진입 전에 해제된다. 재시도마다 새 연결을 연다.
      if (!ex.retryable || attempt >= kMaxAttempts) {
        throw;
      }
      Backoff(attempt);
    }
  }
}

bool MariaDbClient::ExecuteTransactionWithRetry(const std::function<bool(MYSQL*)>& work) const {
  bool committed = false;
  RunWithRetry([&](MYSQL* conn) {
    committed = false;
    mysql_autocommit(conn, 0);
    try {
      if (!work(conn)) {
        mysql_rollback(conn);
        return;
      }
      if (mysql_commit(conn) != 0) {
        RaiseError(conn, "커밋 실패");
      }
      committed = true;
    } catch (const std::exception&) {
      mysql_rollback(conn);
      throw;
    }
  });
  return committed;
}

void MariaDbClient::WithConnectionRetry(const std::function<void(MYSQL*)>& work) const { RunWithRetry(work); }

void MariaDbClient::Execute(MYSQL* conn, const std::string& sql, const std::string& ctx) const {
  if (mysql_query(conn, sql.c_str()) != 0) {
    RaiseError(conn, ctx);
  }
}

ScopedResult MariaDbClient::Query(MYSQL* conn, const std::string& sql, const std::string& ctx) const {
  Execute(conn, sql, ctx);
  MYSQL_RES* res = mysql_store_result(conn);
  if (!res) {
    RaiseError(conn, ctx + " (결과 없음)");
  }
  return ScopedResult{res};
}

std::string MariaDbClient::Escape(MYSQL* conn, const std::string& value) const {
  // 최악의 경우 모든 바이트가 이스케이프되어 두 배가 된다.
  std::string out(value.size() * 2 + 1, '\0');
  out.resize(mysql_real_escape_string(conn, out.data(), value.data(), value.size()));
  return out;
}

void MariaDbClient::RaiseError(MYSQL* conn, const std::string& ctx) const {
  const unsigned int code = mysql_errno(conn);
  throw DbException(ctx + " [" + std::to_string(code) + "]: " + mysql_error(conn), code, IsRetryable(code));
}

bool MariaDbClient::IsRetryable(unsigned int code) const {
  switch (code) {
    case kDeadlock:
    case kLockWaitTimeout:
    case CR_SERVER_LOST:
    case CR_SERVER_GONE_ERROR:
    case CR_CONN_HOST_ERROR:
    case CR_SERVER_LOST_EXTENDED:
      return true;
    default:
      return false;
  }
}

void MariaDbClient::Backoff(std::size_t attempt) const {
  // 50ms, 100ms, ... 에 0~25ms 지터를 더한다.
  thread_local std::mt19937 jitter_engine{std::random_device{}()};
  std::uniform_int_distribution<int> jitter(0, 25);
  auto delay = std::chrono::milliseconds(50 << (attempt - 1)) + std::chrono::milliseconds(jitter(jitter_engine));
  std::this_thread::sleep_for(delay);
}

void MariaDbClient::SetTransientInjector(const std::function<bool(std::size_t)>& injector) {
  transient_injector_ = injector;
}

}  // namespace chatsync
