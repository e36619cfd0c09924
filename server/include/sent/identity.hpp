/*
 * 설명: 업그레이드 시점의 베어러 토큰(HS256 JWT)을 검증해 사용자 신원을 얻는다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/identity_test.cpp, server/tests/e2e/chat_flow_test.cpp
 */
#pragma once

#include <chrono>
#include <optional>
#include <string>

namespace sent {

struct Identity {
  std::string user_id;
  std::string display_name;
  std::string avatar;
};

class IdentityValidator {
 public:
  virtual ~IdentityValidator() = default;
  virtual std::optional<Identity> Validate(const std::string& token, std::string& error_code,
                                           std::string& error_message) const = 0;
};

class JwtIdentityValidator : public IdentityValidator {
 public:
  explicit JwtIdentityValidator(std::string secret);

  std::optional<Identity> Validate(const std::string& token, std::string& error_code,
                                   std::string& error_message) const override;
  std::string Issue(const Identity& identity, std::chrono::seconds ttl) const;

 private:
  std::string Sign(const std::string& signing_input) const;

  std::string secret_;
};

std::string Base64UrlEncode(const std::string& data);
std::optional<std::string> Base64UrlDecode(const std::string& text);

}  // namespace sent
