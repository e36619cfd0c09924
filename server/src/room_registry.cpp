/*
 * 설명: 방-구성원 매핑과 연결별 역색인을 함께 갱신한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/room_registry_test.cpp
 */
#include "sent/room_registry.hpp"

namespace sent {

bool RoomRegistry::Join(const std::string& room_id, const std::shared_ptr<Connection>& conn) {
  auto& members = rooms_[room_id];
  auto [it, inserted] = members.emplace(conn->Id(), conn);
  if (inserted) {
    memberships_[conn->Id()].insert(room_id);
  }
  return inserted;
}

bool RoomRegistry::Leave(const std::string& room_id, std::uint64_t connection_id) {
  auto room_it = rooms_.find(room_id);
  if (room_it == rooms_.end()) {
    return false;
  }
  if (room_it->second.erase(connection_id) == 0) {
    return false;
  }
  if (room_it->second.empty()) {
    rooms_.erase(room_it);
  }
  auto member_it = memberships_.find(connection_id);
  if (member_it != memberships_.end()) {
    member_it->second.erase(room_id);
    if (member_it->second.empty()) {
      memberships_.erase(member_it);
    }
  }
  return true;
}

std::vector<std::string> RoomRegistry::LeaveAll(std::uint64_t connection_id) {
  auto rooms = RoomsOf(connection_id);
  for (const auto& room_id : rooms) {
    Leave(room_id, connection_id);
  }
  return rooms;
}

std::vector<std::shared_ptr<Connection>> RoomRegistry::Members(const std::string& room_id) const {
  std::vector<std::shared_ptr<Connection>> members;
  auto it = rooms_.find(room_id);
  if (it == rooms_.end()) {
    return members;
  }
  members.reserve(it->second.size());
  for (const auto& [id, conn] : it->second) {
    members.push_back(conn);
  }
  return members;
}

bool RoomRegistry::HasRoom(const std::string& room_id) const { return rooms_.count(room_id) > 0; }

bool RoomRegistry::IsMember(const std::string& room_id, std::uint64_t connection_id) const {
  auto it = rooms_.find(room_id);
  return it != rooms_.end() && it->second.count(connection_id) > 0;
}

std::vector<std::string> RoomRegistry::RoomsOf(std::uint64_t connection_id) const {
  auto it = memberships_.find(connection_id);
  if (it == memberships_.end()) {
    return {};
  }
  return std::vector<std::string>(it->second.begin(), it->second.end());
}

std::size_t RoomRegistry::MemberCount(const std::string& room_id) const {
  auto it = rooms_.find(room_id);
  return it == rooms_.end() ? 0 : it->second.size();
}

}  // namespace sent
