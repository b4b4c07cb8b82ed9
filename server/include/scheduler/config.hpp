/*
 * 설명: 서버 환경설정 로딩과 기본값을 정의한다.
 * 버전: v1.1.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/ops_endpoints_test.cpp
 */
#pragma once

#include <cstddef>
#include <string>

namespace scheduler {

struct AppConfig {
  unsigned short port;
  std::string db_host;
  unsigned short db_port;
  std::string db_user;
  std::string db_password;
  std::string db_name;
  std::string log_level;
  int default_max_sessions_per_week;
  // 0이면 주기적 정합성 복구를 끈다.
  std::size_t reconcile_interval_seconds;
  std::string ops_token;
};

AppConfig LoadConfigFromEnv();

}  // namespace scheduler
