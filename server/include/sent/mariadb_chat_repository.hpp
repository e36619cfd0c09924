/*
 * 설명: 채팅 메시지, 읽음 표시, 스레드(방)를 MariaDB에 저장하는 저장소.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md, server/db/schema.sql
 * 테스트: server/tests/it/mariadb_repository_it_test.cpp
 */
#pragma once

#include <memory>

#include "sent/chat_repository.hpp"
#include "sent/db_client.hpp"

namespace sent {

class MariaDbChatRepository : public ChatRepository {
 public:
  explicit MariaDbChatRepository(std::shared_ptr<MariaDbClient> db_client);

  StoredMessage CreateMessage(const std::string& room_id, const Identity& sender, const std::string& content) override;
  std::vector<StoredMessage> ListMessages(const std::string& room_id, std::size_t limit, std::size_t offset) override;
  void MarkRead(const std::string& message_id, const std::string& user_id) override;
  std::string CreateThread(const std::string& title, const std::string& creator_id) override;

 private:
  void UpsertUser(MYSQL* conn, const Identity& user) const;

  std::shared_ptr<MariaDbClient> db_client_;
};

}  // namespace sent
