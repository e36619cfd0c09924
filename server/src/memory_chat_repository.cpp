/*
 * 설명: 프로세스 내 채팅 저장소 구현.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/protocol_handler_test.cpp, server/tests/e2e/chat_flow_test.cpp
 */
#include "sent/memory_chat_repository.hpp"

#include <algorithm>
#include <chrono>
#include <cstddef>

namespace sent {

void MemoryChatRepository::CheckFailure(std::string_view op) {
  ++call_count_;
  if (injector_ && injector_(op)) {
    throw StoreError("주입된 저장소 오류: " + std::string(op));
  }
}

StoredMessage MemoryChatRepository::CreateMessage(const std::string& room_id, const Identity& sender,
                                                  const std::string& content) {
  std::lock_guard<std::mutex> lock(mutex_);
  CheckFailure("create_message");
  StoredMessage message{GenerateUuid(),
                        room_id,
                        sender.user_id,
                        content,
                        std::chrono::time_point_cast<std::chrono::milliseconds>(std::chrono::system_clock::now()),
                        sender.display_name,
                        sender.avatar};
  messages_[room_id].push_back(message);
  message_rooms_[message.id] = room_id;
  return message;
}

std::vector<StoredMessage> MemoryChatRepository::ListMessages(const std::string& room_id, std::size_t limit,
                                                              std::size_t offset) {
  std::lock_guard<std::mutex> lock(mutex_);
  CheckFailure("list_messages");
  auto it = messages_.find(room_id);
  if (it == messages_.end() || offset >= it->second.size()) {
    return {};
  }
  const auto& all = it->second;
  const std::size_t end = all.size() - offset;
  const std::size_t begin = end > limit ? end - limit : 0;
  return std::vector<StoredMessage>(all.begin() + static_cast<std::ptrdiff_t>(begin),
                                    all.begin() + static_cast<std::ptrdiff_t>(end));
}

void MemoryChatRepository::MarkRead(const std::string& message_id, const std::string& user_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  CheckFailure("mark_read");
  if (message_rooms_.count(message_id) == 0) {
    throw StoreError("존재하지 않는 메시지: " + message_id);
  }
  reads_.emplace(message_id, user_id);
}

std::string MemoryChatRepository::CreateThread(const std::string& title, const std::string& creator_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  CheckFailure("create_thread");
  auto room_id = GenerateUuid();
  threads_[room_id] = Thread{title, {creator_id}};
  return room_id;
}

void MemoryChatRepository::SetFailureInjector(FailureInjector injector) {
  std::lock_guard<std::mutex> lock(mutex_);
  injector_ = std::move(injector);
}

std::size_t MemoryChatRepository::CallCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return call_count_;
}

std::size_t MemoryChatRepository::MessageCount(const std::string& room_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = messages_.find(room_id);
  return it == messages_.end() ? 0 : it->second.size();
}

bool MemoryChatRepository::IsRead(const std::string& message_id, const std::string& user_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return reads_.count({message_id, user_id}) > 0;
}

std::vector<std::string> MemoryChatRepository::ThreadMembers(const std::string& room_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = threads_.find(room_id);
  return it == threads_.end() ? std::vector<std::string>{} : it->second.members;
}

}  // namespace sent
