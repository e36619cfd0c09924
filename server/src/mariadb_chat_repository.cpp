/*
 * 설명: MariaDB 채팅 저장소 구현. DB 오류는 StoreError로 변환해 프로토콜 계층에 전달한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md, server/db/schema.sql
 * 테스트: server/tests/it/mariadb_repository_it_test.cpp
 */
#include "sent/mariadb_chat_repository.hpp"

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <sstream>
#include <utility>

namespace sent {
namespace {
constexpr unsigned int kDuplicateEntry = 1062;

std::int64_t ToEpochMillis(std::chrono::system_clock::time_point tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

std::chrono::system_clock::time_point FromEpochMillis(const char* value) {
  std::int64_t millis = value ? std::stoll(value) : 0;
  return std::chrono::system_clock::time_point(std::chrono::milliseconds(millis));
}

std::string Column(MYSQL_ROW row, int index) { return row[index] ? std::string(row[index]) : std::string{}; }
}  // namespace

MariaDbChatRepository::MariaDbChatRepository(std::shared_ptr<MariaDbClient> db_client)
    : db_client_(std::move(db_client)) {}

void MariaDbChatRepository::UpsertUser(MYSQL* conn, const Identity& user) const {
  std::ostringstream oss;
  oss << "INSERT INTO users(id, name, avatar) VALUES('" << db_client_->Escape(conn, user.user_id) << "', '"
      << db_client_->Escape(conn, user.display_name) << "', '" << db_client_->Escape(conn, user.avatar)
      << "') ON DUPLICATE KEY UPDATE name=VALUES(name), avatar=VALUES(avatar);";
  db_client_->Execute(conn, oss.str(), "사용자 정보 갱신 실패");
}

StoredMessage MariaDbChatRepository::CreateMessage(const std::string& room_id, const Identity& sender,
                                                   const std::string& content) {
  StoredMessage message;
  message.id = GenerateUuid();
  message.room_id = room_id;
  message.user_id = sender.user_id;
  message.content = content;
  message.created_at = std::chrono::time_point_cast<std::chrono::milliseconds>(std::chrono::system_clock::now());
  message.user_name = sender.display_name;
  message.user_avatar = sender.avatar;

  try {
    db_client_->ExecuteTransactionWithRetry([&](MYSQL* conn, std::size_t attempt) {
      UpsertUser(conn, sender);
      std::ostringstream oss;
      oss << "INSERT INTO messages(id, room_id, user_id, content, created_at) VALUES('"
          << db_client_->Escape(conn, message.id) << "', '" << db_client_->Escape(conn, room_id) << "', '"
          << db_client_->Escape(conn, sender.user_id) << "', '" << db_client_->Escape(conn, content)
          << "', FROM_UNIXTIME(" << ToEpochMillis(message.created_at) << " / 1000));";
      if (mysql_query(conn, oss.str().c_str()) != 0) {
        // 이전 시도의 커밋이 응답 전에 끊긴 경우 같은 id가 이미 존재한다.
        if (mysql_errno(conn) == kDuplicateEntry && attempt > 1) {
          return true;
        }
        db_client_->RaiseError(conn, "메시지 저장 실패");
      }
      return true;
    });
  } catch (const DbException& ex) {
    throw StoreError(ex.what());
  }
  return message;
}

std::vector<StoredMessage> MariaDbChatRepository::ListMessages(const std::string& room_id, std::size_t limit,
                                                               std::size_t offset) {
  std::vector<StoredMessage> messages;
  try {
    db_client_->WithConnectionRetry([&](MYSQL* conn) {
      messages.clear();
      std::ostringstream oss;
      oss << "SELECT m.id, m.room_id, m.user_id, m.content, ROUND(UNIX_TIMESTAMP(m.created_at) * 1000), "
             "COALESCE(u.name, ''), COALESCE(u.avatar, '') FROM messages m LEFT JOIN users u ON u.id = m.user_id "
             "WHERE m.room_id='"
          << db_client_->Escape(conn, room_id) << "' ORDER BY m.seq DESC LIMIT " << limit
          << " OFFSET " << offset << ";";
      db_client_->Execute(conn, oss.str(), "메시지 조회 실패");
      MYSQL_RES* res = mysql_store_result(conn);
      if (!res) {
        db_client_->RaiseError(conn, "메시지 조회 결과 없음");
      }
      while (MYSQL_ROW row = mysql_fetch_row(res)) {
        messages.push_back(StoredMessage{Column(row, 0), Column(row, 1), Column(row, 2), Column(row, 3),
                                         FromEpochMillis(row[4]), Column(row, 5), Column(row, 6)});
      }
      mysql_free_result(res);
    });
  } catch (const DbException& ex) {
    throw StoreError(ex.what());
  }
  std::reverse(messages.begin(), messages.end());
  return messages;
}

void MariaDbChatRepository::MarkRead(const std::string& message_id, const std::string& user_id) {
  try {
    db_client_->WithConnectionRetry([&](MYSQL* conn) {
      std::ostringstream oss;
      oss << "INSERT INTO message_reads(message_id, user_id, read_at) VALUES('" << db_client_->Escape(conn, message_id)
          << "', '" << db_client_->Escape(conn, user_id) << "', NOW(3)) ON DUPLICATE KEY UPDATE read_at=read_at;";
      db_client_->Execute(conn, oss.str(), "읽음 표시 저장 실패");
    });
  } catch (const DbException& ex) {
    throw StoreError(ex.what());
  }
}

std::string MariaDbChatRepository::CreateThread(const std::string& title, const std::string& creator_id) {
  const std::string room_id = GenerateUuid();
  try {
    db_client_->ExecuteTransactionWithRetry([&](MYSQL* conn, std::size_t attempt) {
      std::ostringstream room_sql;
      room_sql << "INSERT INTO rooms(id, name, is_group, created_at) VALUES('" << db_client_->Escape(conn, room_id)
               << "', '" << db_client_->Escape(conn, title) << "', 1, NOW(3));";
      if (mysql_query(conn, room_sql.str().c_str()) != 0) {
        if (mysql_errno(conn) == kDuplicateEntry && attempt > 1) {
          return true;
        }
        db_client_->RaiseError(conn, "스레드 생성 실패");
      }
      std::ostringstream member_sql;
      member_sql << "INSERT INTO room_members(room_id, user_id, role, joined_at) VALUES('"
                 << db_client_->Escape(conn, room_id) << "', '" << db_client_->Escape(conn, creator_id)
                 << "', 'admin', NOW(3));";
      db_client_->Execute(conn, member_sql.str(), "스레드 구성원 등록 실패");
      return true;
    });
  } catch (const DbException& ex) {
    throw StoreError(ex.what());
  }
  return room_id;
}

}  // namespace sent
