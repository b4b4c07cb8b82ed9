/*
 * 설명: 서버 수명주기, 리스닝 스레드, 주기적 정합성 복구를 관리한다.
 * 버전: v1.2.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/ops_endpoints_test.cpp
 */
#include "scheduler/app.hpp"

#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <iostream>

#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>

#include "scheduler/http_session.hpp"

namespace scheduler {

class Listener : public std::enable_shared_from_this<Listener> {
 public:
  Listener(boost::asio::io_context& ioc, const boost::asio::ip::tcp::endpoint& endpoint, const AppConfig& config,
           std::shared_ptr<BookingService> booking_service, std::shared_ptr<AvailabilityChecker> availability,
           std::shared_ptr<WeeklyQuotaChecker> quota, std::shared_ptr<Observability> observability)
      : ioc_(ioc), acceptor_(boost::asio::make_strand(ioc)), config_(config),
        booking_service_(std::move(booking_service)), availability_(std::move(availability)),
        quota_(std::move(quota)), observability_(std::move(observability)) {
    boost::beast::error_code ec;

    acceptor_.open(endpoint.protocol(), ec);
    if (ec) {
      throw boost::beast::system_error{ec};
    }

    acceptor_.set_option(boost::asio::socket_base::reuse_address(true), ec);
    if (ec) {
      throw boost::beast::system_error{ec};
    }

    acceptor_.bind(endpoint, ec);
    if (ec) {
      throw boost::beast::system_error{ec};
    }

    acceptor_.listen(boost::asio::socket_base::max_listen_connections, ec);
    if (ec) {
      throw boost::beast::system_error{ec};
    }
  }

  void Run() { DoAccept(); }

  void Stop() {
    boost::beast::error_code ec;
    acceptor_.close(ec);
  }

 private:
  void DoAccept() {
    acceptor_.async_accept(
        boost::asio::make_strand(ioc_),
        [self = shared_from_this()](boost::beast::error_code ec, boost::asio::ip::tcp::socket socket) {
          if (!ec) {
            std::make_shared<HttpSession>(std::move(socket), self->config_, self->booking_service_,
                                          self->availability_, self->quota_, self->observability_)
                ->Run();
          }
          if (self->acceptor_.is_open()) {
            self->DoAccept();
          }
        });
  }

  boost::asio::io_context& ioc_;
  boost::asio::ip::tcp::acceptor acceptor_;
  AppConfig config_;
  std::shared_ptr<BookingService> booking_service_;
  std::shared_ptr<AvailabilityChecker> availability_;
  std::shared_ptr<WeeklyQuotaChecker> quota_;
  std::shared_ptr<Observability> observability_;
};

ServerApp::ServerApp(const AppConfig& config)
    : config_(config), ioc_(1), work_guard_(boost::asio::make_work_guard(ioc_)), reconcile_timer_(ioc_) {
  observability_ = std::make_shared<Observability>(ParseLogLevel(config.log_level).value_or(LogLevel::kInfo));
  DbConfig db_config{config.db_host, config.db_port, config.db_user, config.db_password, config.db_name};
  db_client_ = std::make_shared<MariaDbClient>(db_config);
  repository_ = std::make_shared<SessionRepository>(db_client_);
  availability_ = std::make_shared<AvailabilityChecker>(repository_, observability_);
  quota_ = std::make_shared<WeeklyQuotaChecker>(repository_, config.default_max_sessions_per_week);
  notifier_ = std::make_shared<NotificationLogSink>(db_client_);
  booking_service_ = std::make_shared<BookingService>(db_client_, repository_, availability_, quota_, notifier_,
                                                      observability_);
}

ServerApp::~ServerApp() { Stop(); }

void ServerApp::Run() {
  try {
    running_ = true;
    boost::asio::ip::tcp::endpoint endpoint{boost::asio::ip::tcp::v4(), config_.port};
    listener_ = std::make_shared<Listener>(ioc_, endpoint, config_, booking_service_, availability_, quota_,
                                           observability_);
    listener_->Run();
    ScheduleReconcile();
    std::cout << "서버 시작: 포트 " << config_.port << "\n";
    RunWorkers();
    ioc_.run();
  } catch (const std::exception& ex) {
    std::cerr << "서버 실행 중 예외: " << ex.what() << "\n";
  }
}

void ServerApp::ScheduleReconcile() {
  if (config_.reconcile_interval_seconds == 0) {
    return;
  }
  reconcile_timer_.expires_after(std::chrono::seconds(config_.reconcile_interval_seconds));
  reconcile_timer_.async_wait([this](const boost::system::error_code& ec) {
    if (ec || !running_) {
      return;
    }
    auto outcome = booking_service_->Reconcile();
    if (!outcome.ok()) {
      observability_->Warn("reconcile.deferred",
                           {{"code", outcome.error->code}, {"nextRunSeconds", config_.reconcile_interval_seconds}});
    }
    ScheduleReconcile();
  });
}

void ServerApp::RunWorkers() {
  const unsigned int thread_count = std::max(1u, std::thread::hardware_concurrency());
  // 현재 스레드도 run()을 호출하므로 워커는 thread_count - 1개만 생성한다.
  for (unsigned int i = 0; i + 1 < thread_count; ++i) {
    workers_.emplace_back([this]() { ioc_.run(); });
  }
}

void ServerApp::Stop() {
  if (!running_) {
    return;
  }
  running_ = false;
  work_guard_.reset();
  reconcile_timer_.cancel();
  if (listener_) {
    listener_->Stop();
  }
  ioc_.stop();
  for (auto& worker : workers_) {
    if (worker.joinable()) {
      worker.join();
    }
  }
}

AppConfig LoadConfigFromEnv() {
  auto get_env = [](const char* key, const char* def) -> std::string {
    const char* val = std::getenv(key);
    return val ? std::string{val} : std::string{def};
  };

  AppConfig cfg;
  cfg.port = static_cast<unsigned short>(std::stoi(get_env("SERVER_PORT", "8080")));
  cfg.db_host = get_env("DB_HOST", "mariadb");
  cfg.db_port = static_cast<unsigned short>(std::stoi(get_env("DB_PORT", "3306")));
  cfg.db_user = get_env("DB_USER", "app");
  cfg.db_password = get_env("DB_PASSWORD", "app_pass");
  cfg.db_name = get_env("DB_NAME", "studio_db");
  cfg.log_level = get_env("LOG_LEVEL", "info");
  cfg.default_max_sessions_per_week = std::stoi(get_env("DEFAULT_MAX_SESSIONS_PER_WEEK", "250"));
  cfg.reconcile_interval_seconds =
      static_cast<std::size_t>(std::stoul(get_env("RECONCILE_INTERVAL_SECONDS", "300")));
  cfg.ops_token = get_env("OPS_TOKEN", "");
  return cfg;
}

}  // namespace scheduler
