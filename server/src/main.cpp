/*
 * 설명: 서버 진입점. 환경설정을 로드하고 SIGINT/SIGTERM 수신 시 I/O 루프를 멈춘 뒤 정리한다.
 * 버전: v1.1.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/ops_endpoints_test.cpp
 */
#include <csignal>
#include <exception>
#include <iostream>

#include <boost/asio/signal_set.hpp>

#include "scheduler/app.hpp"

int main() {
  using namespace scheduler;
  AppConfig config;
  try {
    config = LoadConfigFromEnv();
  } catch (const std::exception& ex) {
    std::cerr << "환경설정 값이 올바르지 않습니다: " << ex.what() << "\n";
    return 1;
  }
  ServerApp app(config);

  boost::asio::signal_set signals(app.GetContext(), SIGINT, SIGTERM);
  signals.async_wait([&app](const boost::system::error_code& ec, int signal_number) {
    if (ec) {
      return;
    }
    std::cout << "시그널 " << signal_number << " 수신, 종료를 준비합니다\n";
    app.GetContext().stop();
  });

  app.Run();
  app.Stop();
  return 0;
}
