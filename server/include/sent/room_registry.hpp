/*
 * 설명: 방 식별자와 구독 연결 집합의 매핑을 보관한다. 브로드캐스트 코디네이터 루프만 접근한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/room_registry_test.cpp
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

#include "sent/connection.hpp"

namespace sent {

class RoomRegistry {
 public:
  // 새로 추가된 경우 true. 방은 첫 구독 시 생성된다.
  bool Join(const std::string& room_id, const std::shared_ptr<Connection>& conn);
  // 마지막 구성원이 떠나면 방 자체를 제거한다.
  bool Leave(const std::string& room_id, std::uint64_t connection_id);
  std::vector<std::string> LeaveAll(std::uint64_t connection_id);

  std::vector<std::shared_ptr<Connection>> Members(const std::string& room_id) const;
  bool HasRoom(const std::string& room_id) const;
  bool IsMember(const std::string& room_id, std::uint64_t connection_id) const;
  std::vector<std::string> RoomsOf(std::uint64_t connection_id) const;
  std::size_t RoomCount() const { return rooms_.size(); }
  std::size_t MemberCount(const std::string& room_id) const;

 private:
  // 연결 id 순서로 정렬해 브로드캐스트 순회 순서를 고정한다.
  std::unordered_map<std::string, std::map<std::uint64_t, std::shared_ptr<Connection>>> rooms_;
  std::unordered_map<std::uint64_t, std::set<std::string>> memberships_;
};

}  // namespace sent
