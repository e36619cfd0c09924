/*
 * 설명: 프로세스 내 채팅 저장소. 단일 인스턴스 실행과 테스트에 사용하며 오류 주입을 지원한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/protocol_handler_test.cpp, server/tests/e2e/chat_flow_test.cpp
 */
#pragma once

#include <functional>
#include <map>
#include <mutex>
#include <set>
#include <string_view>
#include <unordered_map>
#include <utility>

#include "sent/chat_repository.hpp"

namespace sent {

class MemoryChatRepository : public ChatRepository {
 public:
  // true를 반환하면 해당 연산이 StoreError로 실패한다. op는 "create_message", "list_messages", "mark_read", "create_thread".
  using FailureInjector = std::function<bool(std::string_view op)>;

  StoredMessage CreateMessage(const std::string& room_id, const Identity& sender, const std::string& content) override;
  std::vector<StoredMessage> ListMessages(const std::string& room_id, std::size_t limit, std::size_t offset) override;
  void MarkRead(const std::string& message_id, const std::string& user_id) override;
  std::string CreateThread(const std::string& title, const std::string& creator_id) override;

  void SetFailureInjector(FailureInjector injector);
  std::size_t CallCount() const;
  std::size_t MessageCount(const std::string& room_id) const;
  bool IsRead(const std::string& message_id, const std::string& user_id) const;
  std::vector<std::string> ThreadMembers(const std::string& room_id) const;

 private:
  void CheckFailure(std::string_view op);

  struct Thread {
    std::string title;
    std::vector<std::string> members;
  };

  mutable std::mutex mutex_;
  FailureInjector injector_;
  std::size_t call_count_{0};
  std::unordered_map<std::string, std::vector<StoredMessage>> messages_;
  std::unordered_map<std::string, std::string> message_rooms_;
  std::set<std::pair<std::string, std::string>> reads_;
  std::map<std::string, Thread> threads_;
};

}  // namespace sent
