/*
 * 설명: HS256 JWT 서명 검증과 클레임 해석으로 사용자 신원을 확인한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/identity_test.cpp, server/tests/e2e/chat_flow_test.cpp
 */
#include "sent/identity.hpp"

#include <cstdint>
#include <vector>

#include <nlohmann/json.hpp>
#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>

namespace sent {
namespace {
std::vector<std::string> SplitToken(const std::string& token) {
  std::vector<std::string> parts;
  std::size_t pos = 0;
  while (true) {
    auto dot = token.find('.', pos);
    parts.push_back(token.substr(pos, dot == std::string::npos ? std::string::npos : dot - pos));
    if (dot == std::string::npos) {
      break;
    }
    pos = dot + 1;
  }
  return parts;
}

std::int64_t NowSeconds() {
  return std::chrono::duration_cast<std::chrono::seconds>(std::chrono::system_clock::now().time_since_epoch())
      .count();
}

std::string OptionalClaim(const nlohmann::json& claims, const char* key) {
  auto it = claims.find(key);
  if (it == claims.end() || !it->is_string()) {
    return {};
  }
  return it->get<std::string>();
}
}  // namespace

std::string Base64UrlEncode(const std::string& data) {
  std::vector<unsigned char> input(data.begin(), data.end());
  std::vector<unsigned char> encoded(4 * ((input.size() + 2) / 3) + 1);
  int len = EVP_EncodeBlock(encoded.data(), input.data(), static_cast<int>(input.size()));
  std::string out(encoded.begin(), encoded.begin() + len);
  for (auto& c : out) {
    if (c == '+') {
      c = '-';
    } else if (c == '/') {
      c = '_';
    }
  }
  while (!out.empty() && out.back() == '=') {
    out.pop_back();
  }
  return out;
}

std::optional<std::string> Base64UrlDecode(const std::string& text) {
  if (text.size() % 4 == 1) {
    return std::nullopt;
  }
  std::string padded = text;
  for (auto& c : padded) {
    if (c == '-') {
      c = '+';
    } else if (c == '_') {
      c = '/';
    }
  }
  std::size_t padding = 0;
  while (padded.size() % 4 != 0) {
    padded.push_back('=');
    ++padding;
  }
  if (padded.empty()) {
    return std::string{};
  }
  std::vector<unsigned char> input(padded.begin(), padded.end());
  std::vector<unsigned char> decoded(input.size() / 4 * 3);
  int len = EVP_DecodeBlock(decoded.data(), input.data(), static_cast<int>(input.size()));
  if (len < 0 || static_cast<std::size_t>(len) < padding) {
    return std::nullopt;
  }
  return std::string(decoded.begin(), decoded.begin() + (len - static_cast<int>(padding)));
}

JwtIdentityValidator::JwtIdentityValidator(std::string secret) : secret_(std::move(secret)) {}

std::string JwtIdentityValidator::Sign(const std::string& signing_input) const {
  std::vector<unsigned char> input(signing_input.begin(), signing_input.end());
  std::vector<unsigned char> digest(EVP_MAX_MD_SIZE);
  unsigned int digest_len = 0;
  HMAC(EVP_sha256(), secret_.data(), static_cast<int>(secret_.size()), input.data(), input.size(), digest.data(),
       &digest_len);
  return std::string(digest.begin(), digest.begin() + digest_len);
}

std::optional<Identity> JwtIdentityValidator::Validate(const std::string& token, std::string& error_code,
                                                       std::string& error_message) const {
  auto parts = SplitToken(token);
  if (parts.size() != 3 || parts[0].empty() || parts[1].empty() || parts[2].empty()) {
    error_code = "invalid_token";
    error_message = "토큰 형식이 올바르지 않습니다";
    return std::nullopt;
  }

  auto header_raw = Base64UrlDecode(parts[0]);
  auto payload_raw = Base64UrlDecode(parts[1]);
  auto signature = Base64UrlDecode(parts[2]);
  if (!header_raw || !payload_raw || !signature) {
    error_code = "invalid_token";
    error_message = "토큰 인코딩이 올바르지 않습니다";
    return std::nullopt;
  }

  try {
    auto header = nlohmann::json::parse(*header_raw);
    if (!header.is_object() || header.value("alg", "") != "HS256") {
      error_code = "invalid_token";
      error_message = "지원하지 않는 서명 알고리즘입니다";
      return std::nullopt;
    }

    auto expected = Sign(parts[0] + "." + parts[1]);
    if (expected.size() != signature->size() ||
        CRYPTO_memcmp(expected.data(), signature->data(), expected.size()) != 0) {
      error_code = "invalid_token";
      error_message = "토큰 서명이 올바르지 않습니다";
      return std::nullopt;
    }

    auto claims = nlohmann::json::parse(*payload_raw);
    if (!claims.is_object() || !claims.contains("user_id") || !claims["user_id"].is_string() ||
        claims["user_id"].get<std::string>().empty()) {
      error_code = "invalid_token";
      error_message = "user_id 클레임이 필요합니다";
      return std::nullopt;
    }
    auto now = NowSeconds();
    if (claims.contains("exp")) {
      if (!claims["exp"].is_number() || now >= claims["exp"].get<std::int64_t>()) {
        error_code = "token_expired";
        error_message = "토큰이 만료되었습니다";
        return std::nullopt;
      }
    }
    if (claims.contains("nbf") && claims["nbf"].is_number() && now < claims["nbf"].get<std::int64_t>()) {
      error_code = "invalid_token";
      error_message = "아직 사용할 수 없는 토큰입니다";
      return std::nullopt;
    }

    return Identity{claims["user_id"].get<std::string>(), OptionalClaim(claims, "name"),
                    OptionalClaim(claims, "avatar")};
  } catch (const nlohmann::json::exception&) {
    error_code = "invalid_token";
    error_message = "토큰 JSON 파싱 오류";
    return std::nullopt;
  }
}

std::string JwtIdentityValidator::Issue(const Identity& identity, std::chrono::seconds ttl) const {
  auto now = NowSeconds();
  nlohmann::json header{{"alg", "HS256"}, {"typ", "JWT"}};
  nlohmann::json claims{{"user_id", identity.user_id},
                        {"name", identity.display_name},
                        {"avatar", identity.avatar},
                        {"iat", now},
                        {"nbf", now},
                        {"exp", now + ttl.count()}};
  auto signing_input = Base64UrlEncode(header.dump()) + "." + Base64UrlEncode(claims.dump());
  return signing_input + "." + Base64UrlEncode(Sign(signing_input));
}

}  // namespace sent
