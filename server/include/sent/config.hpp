/*
 * 설명: 서버 환경설정 로딩과 기본값을 정의한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/chat_flow_test.cpp
 */
#pragma once

#include <cstddef>
#include <string>

namespace sent {

struct AppConfig {
  unsigned short port{8080};
  std::size_t worker_threads{0};
  std::string chat_store{"mariadb"};
  std::string db_host;
  unsigned short db_port{3306};
  std::string db_user;
  std::string db_password;
  std::string db_name;
  std::string redis_host;
  unsigned short redis_port{6379};
  std::string redis_password;
  std::size_t redis_poll_interval_ms{100};
  // 비어 있으면 시작 시 UUID를 생성한다. 방 채널에서 자신이 게시한 프레임을 구분하는 데 쓴다.
  std::string instance_id;
  std::string log_level{"info"};
  std::string jwt_secret;
  std::size_t ws_queue_limit_messages{256};
  std::size_t ws_queue_limit_bytes{1048576};
  std::size_t ws_max_message_bytes{8192};
  std::size_t ws_ping_period_ms{54000};
  std::size_t ws_pong_wait_ms{60000};
  std::size_t max_content_bytes{4000};
  std::size_t history_page_size{50};
  std::size_t history_frame_delay_ms{5};
  std::string ops_token;
};

AppConfig LoadConfigFromEnv();

}  // namespace sent
