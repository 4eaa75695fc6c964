/*
 * 설명: user_auth_token_logs 테이블 기반 감사 로그.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: tokenguard/tests/it/mariadb_token_store_it_test.cpp
 */
#pragma once

#include <memory>

#include "tokenguard/audit_log.hpp"
#include "tokenguard/db_client.hpp"

namespace tokenguard {

class MariaDbAuditLog : public AuditLog {
 public:
  explicit MariaDbAuditLog(std::shared_ptr<MariaDbClient> db_client);

  void EnsureSchema() const;

  void Record(const AuditEvent& event) override;
  std::vector<std::string> ClientIpsForUser(UserId user_id) const override;
  std::size_t PurgeBefore(std::chrono::system_clock::time_point threshold) override;

  void ClearAll() const;

 private:
  std::shared_ptr<MariaDbClient> db_client_;
};

}  // namespace tokenguard
