/*
 * 설명: MariaDB에 메시지와 읽음 정보를 저장하는 MessageStore 구현이다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/it/mariadb_store_it_test.cpp
 */
#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <mariadb/mysql.h>

#include "chatsync/db_client.hpp"
#include "chatsync/message_store.hpp"
#include "chatsync/observability.hpp"

namespace chatsync {

class MariaDbMessageStore : public MessageStore {
 public:
  MariaDbMessageStore(std::shared_ptr<MariaDbClient> db_client, std::shared_ptr<Observability> observability,
                      std::chrono::seconds edit_cooldown = kDefaultEditCooldown);

  // 테이블이 없으면 만든다. 실패 시 DbException을 던진다.
  void EnsureSchema() const;

  AppendResult Append(const std::string& author, const std::string& body, TimePoint created_at) override;
  ListResult ListActive(std::size_t limit) override;
  MutationStatus SoftDelete(const std::string& id, const std::string& requesting_author) override;
  EditResult Edit(const std::string& id, const std::string& requesting_author, const std::string& new_body,
                  TimePoint now) override;
  MutationStatus MarkRead(const std::string& id, const std::string& reader_name) override;
  std::optional<ChatMessage> Find(const std::string& id) override;

  void ClearAll() const;

 private:
  ChatMessage BuildMessage(MYSQL_ROW row) const;
  void LoadReaders(MYSQL* conn, std::vector<ChatMessage>& messages) const;
  void ReportFailure(const char* operation, const std::exception& ex) const;

  std::shared_ptr<MariaDbClient> db_client_;
  std::shared_ptr<Observability> observability_;
  std::chrono::seconds edit_cooldown_;
};

}  // namespace chatsync
