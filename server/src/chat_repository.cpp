/*
 * 설명: 메시지/스레드 식별자로 쓰는 UUID v4를 생성한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 */
#include "sent/chat_repository.hpp"

#include <array>
#include <cstdio>

#include <openssl/rand.h>

namespace sent {

std::string GenerateUuid() {
  std::array<unsigned char, 16> bytes{};
  if (RAND_bytes(bytes.data(), static_cast<int>(bytes.size())) != 1) {
    throw std::runtime_error("난수 생성 실패");
  }
  bytes[6] = static_cast<unsigned char>((bytes[6] & 0x0F) | 0x40);
  bytes[8] = static_cast<unsigned char>((bytes[8] & 0x3F) | 0x80);
  char buffer[37];
  std::snprintf(buffer, sizeof(buffer),
                "%02x%02x%02x%02x-%02x%02x-%02x%02x-%02x%02x-%02x%02x%02x%02x%02x%02x", bytes[0], bytes[1], bytes[2],
                bytes[3], bytes[4], bytes[5], bytes[6], bytes[7], bytes[8], bytes[9], bytes[10], bytes[11], bytes[12],
                bytes[13], bytes[14], bytes[15]);
  return std::string(buffer);
}

}  // namespace sent
