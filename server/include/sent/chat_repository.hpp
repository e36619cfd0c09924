/*
 * 설명: 채팅 메시지/스레드 영속화 협력자의 계약과 레코드 타입을 정의한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/protocol_handler_test.cpp, server/tests/it/mariadb_repository_it_test.cpp
 */
#pragma once

#include <chrono>
#include <cstddef>
#include <stdexcept>
#include <string>
#include <vector>

#include "sent/identity.hpp"

namespace sent {

class StoreError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

struct StoredMessage {
  std::string id;
  std::string room_id;
  std::string user_id;
  std::string content;
  std::chrono::system_clock::time_point created_at;
  std::string user_name;
  std::string user_avatar;
};

class ChatRepository {
 public:
  virtual ~ChatRepository() = default;

  virtual StoredMessage CreateMessage(const std::string& room_id, const Identity& sender,
                                      const std::string& content) = 0;
  // 최신 메시지 limit개를 오래된 순서로 반환한다. offset은 최신 메시지부터 건너뛸 개수다.
  virtual std::vector<StoredMessage> ListMessages(const std::string& room_id, std::size_t limit,
                                                  std::size_t offset) = 0;
  virtual void MarkRead(const std::string& message_id, const std::string& user_id) = 0;
  virtual std::string CreateThread(const std::string& title, const std::string& creator_id) = 0;
};

std::string GenerateUuid();

}  // namespace sent
