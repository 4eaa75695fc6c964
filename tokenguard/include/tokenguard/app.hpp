/*
 * 설명: 만료 정리 데몬의 구성요소 조립과 수명주기를 관리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 */
#pragma once

#include <atomic>
#include <memory>

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>

#include "tokenguard/auth_token_service.hpp"
#include "tokenguard/config.hpp"
#include "tokenguard/db_client.hpp"
#include "tokenguard/expiry_sweeper.hpp"
#include "tokenguard/mariadb_audit_log.hpp"
#include "tokenguard/mariadb_token_store.hpp"
#include "tokenguard/observability.hpp"

namespace tokenguard {

class SweeperApp {
 public:
  explicit SweeperApp(const AppConfig& config);
  ~SweeperApp();

  void Run();
  void Stop();

 private:
  AppConfig config_;
  boost::asio::io_context ioc_;
  boost::asio::signal_set signals_;
  std::shared_ptr<Observability> observability_;
  std::shared_ptr<MariaDbClient> db_client_;
  std::shared_ptr<MariaDbTokenStore> token_store_;
  std::shared_ptr<MariaDbAuditLog> audit_log_;
  std::shared_ptr<AuthTokenService> token_service_;
  std::shared_ptr<ExpirySweeper> sweeper_;
  std::atomic<bool> running_{false};
};

}  // namespace tokenguard
