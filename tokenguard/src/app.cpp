/*
 * 설명: 만료 정리 데몬의 수명주기를 관리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 */
#include "tokenguard/app.hpp"

#include <csignal>
#include <iostream>

namespace tokenguard {

SweeperApp::SweeperApp(const AppConfig& config) : config_(config), ioc_(1), signals_(ioc_, SIGINT, SIGTERM) {
  observability_ = std::make_shared<Observability>(ParseLogLevel(config.log_level), std::cout);
  DbConfig db_config{config.db_host, config.db_port, config.db_user, config.db_password, config.db_name};
  db_client_ = std::make_shared<MariaDbClient>(db_config);
  token_store_ = std::make_shared<MariaDbTokenStore>(db_client_);
  audit_log_ = std::make_shared<MariaDbAuditLog>(db_client_);
  token_service_ = std::make_shared<AuthTokenService>(token_store_, audit_log_, std::make_shared<EnvSettingsSource>(),
                                                      TokenCodec(config.token_secret), nullptr, observability_);
  auto service = token_service_;
  sweeper_ = std::make_shared<ExpirySweeper>(
      ioc_, [service]() { return service->Cleanup(); }, std::chrono::seconds(config.sweep_interval_seconds),
      observability_);
}

SweeperApp::~SweeperApp() { Stop(); }

void SweeperApp::Run() {
  try {
    token_store_->EnsureSchema();
    audit_log_->EnsureSchema();
    running_ = true;
    signals_.async_wait([this](const boost::system::error_code& ec, int signal_number) {
      if (!ec) {
        observability_->Log(LogContext{LogLevel::kInfo, "", "sweeper.signal", std::nullopt, std::nullopt,
                                       {{"signal", signal_number}}});
        Stop();
      }
    });
    // 기동 직후 한 번 정리하고 이후 주기적으로 반복한다.
    token_service_->Cleanup();
    sweeper_->Start();
    observability_->Log(LogContext{LogLevel::kInfo, "", "sweeper.started", std::nullopt, std::nullopt,
                                   {{"intervalSeconds", config_.sweep_interval_seconds}}});
    ioc_.run();
  } catch (const std::exception& ex) {
    std::cerr << "정리 데몬 실행 중 예외: " << ex.what() << "\n";
    throw;
  }
}

void SweeperApp::Stop() {
  if (!running_.exchange(false)) {
    return;
  }
  sweeper_->Stop();
  boost::system::error_code ec;
  signals_.cancel(ec);
}

}  // namespace tokenguard
