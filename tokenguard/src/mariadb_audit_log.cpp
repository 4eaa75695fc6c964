/*
 * 설명: 감사 이벤트를 MariaDB에 추가하고 사용자별 접속 IP를 조회한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: tokenguard/tests/it/mariadb_token_store_it_test.cpp
 */
#include "tokenguard/mariadb_audit_log.hpp"

#include <sstream>

namespace tokenguard {
namespace {
std::string Quote(const std::string& escaped) { return "'" + escaped + "'"; }
}  // namespace

MariaDbAuditLog::MariaDbAuditLog(std::shared_ptr<MariaDbClient> db_client) : db_client_(std::move(db_client)) {}

void MariaDbAuditLog::EnsureSchema() const {
  db_client_->WithConnectionRetry([&](MYSQL* conn) {
    const char* sql =
        "CREATE TABLE IF NOT EXISTS user_auth_token_logs ("
        " id BIGINT NOT NULL AUTO_INCREMENT PRIMARY KEY,"
        " action VARCHAR(64) NOT NULL,"
        " user_auth_token_id BIGINT NULL,"
        " user_id BIGINT NULL,"
        " client_ip VARCHAR(64) NULL,"
        " user_agent TEXT NULL,"
        " auth_token VARCHAR(128) NULL,"
        " path TEXT NULL,"
        " created_at DATETIME(6) NOT NULL,"
        " KEY index_user_auth_token_logs_on_user_id (user_id),"
        " KEY index_user_auth_token_logs_on_created_at (created_at)"
        ") ENGINE=InnoDB;";
    if (mysql_query(conn, sql) != 0) {
      db_client_->RaiseError(conn, "감사 로그 테이블 생성 실패");
    }
    const char* widen = "ALTER TABLE user_auth_token_logs MODIFY user_agent TEXT NULL, MODIFY path TEXT NULL;";
    if (mysql_query(conn, widen) != 0) {
      db_client_->RaiseError(conn, "감사 로그 컬럼 변경 실패");
    }
  });
}

void MariaDbAuditLog::Record(const AuditEvent& event) {
  db_client_->WithConnectionRetry([&](MYSQL* conn) {
    std::ostringstream oss;
    oss << "INSERT INTO user_auth_token_logs(action, user_auth_token_id, user_id, client_ip, user_agent, auth_token, "
           "path, created_at) VALUES("
        << Quote(db_client_->Escape(conn, event.action)) << ", "
        << (event.user_auth_token_id ? std::to_string(*event.user_auth_token_id) : "NULL") << ", "
        << (event.user_id ? std::to_string(*event.user_id) : "NULL") << ", "
        << Quote(db_client_->Escape(conn, event.client_ip)) << ", " << Quote(db_client_->Escape(conn, event.user_agent))
        << ", " << Quote(db_client_->Escape(conn, event.auth_token)) << ", "
        << Quote(db_client_->Escape(conn, event.path)) << ", '" << ToSqlTimestamp(event.created_at) << "');";
    if (mysql_query(conn, oss.str().c_str()) != 0) {
      db_client_->RaiseError(conn, "감사 로그 기록 실패");
    }
  });
}

std::vector<std::string> MariaDbAuditLog::ClientIpsForUser(UserId user_id) const {
  std::vector<std::string> ips;
  db_client_->WithConnectionRetry([&](MYSQL* conn) {
    ips.clear();
    std::ostringstream oss;
    oss << "SELECT client_ip FROM user_auth_token_logs WHERE user_id = " << user_id
        << " AND client_ip IS NOT NULL AND client_ip <> '' ORDER BY id;";
    if (mysql_query(conn, oss.str().c_str()) != 0) {
      db_client_->RaiseError(conn, "접속 IP 조회 실패");
    }
    MYSQL_RES* res = mysql_store_result(conn);
    if (!res) {
      db_client_->RaiseError(conn, "접속 IP 결과 없음");
    }
    MYSQL_ROW row;
    while ((row = mysql_fetch_row(res)) != nullptr) {
      if (row[0]) {
        ips.emplace_back(row[0]);
      }
    }
    mysql_free_result(res);
  });
  return ips;
}

std::size_t MariaDbAuditLog::PurgeBefore(std::chrono::system_clock::time_point threshold) {
  std::size_t removed = 0;
  db_client_->WithConnectionRetry([&](MYSQL* conn) {
    std::ostringstream oss;
    oss << "DELETE FROM user_auth_token_logs WHERE created_at < '" << ToSqlTimestamp(threshold) << "';";
    if (mysql_query(conn, oss.str().c_str()) != 0) {
      db_client_->RaiseError(conn, "감사 로그 정리 실패");
    }
    removed = static_cast<std::size_t>(mysql_affected_rows(conn));
  });
  return removed;
}

void MariaDbAuditLog::ClearAll() const {
  db_client_->WithConnectionRetry([&](MYSQL* conn) {
    if (mysql_query(conn, "DELETE FROM user_auth_token_logs;") != 0) {
      db_client_->RaiseError(conn, "감사 로그 초기화 실패");
    }
  });
}

}  // namespace tokenguard
