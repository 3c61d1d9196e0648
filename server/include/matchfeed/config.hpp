/*
 * 설명: 서버 환경설정 로딩과 기본값을 정의한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/config_env_test.cpp, server/tests/e2e/live_match_flow_test.cpp
 */
#pragma once

#include <cstddef>
#include <string>

namespace matchfeed {

struct AppConfig {
  unsigned short port;
  std::string broker_mode;
  std::string redis_host;
  unsigned short redis_port;
  std::string redis_password;
  int redis_db;
  std::string log_level;
  std::size_t ws_queue_limit_messages;
  std::size_t ws_queue_limit_bytes;
  std::size_t ws_pong_wait_seconds;
  std::size_t ws_write_wait_seconds;
  std::size_t ws_max_message_bytes;
  std::size_t bridge_backoff_ms;
  std::size_t worker_threads;
};

AppConfig LoadConfigFromEnv();

}  // namespace matchfeed
