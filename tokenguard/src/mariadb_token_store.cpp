/*
 * 설명: 토큰 레코드를 MariaDB에 저장하고 조건부 UPDATE로 회전/확인 표시를 처리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: tokenguard/tests/it/mariadb_token_store_it_test.cpp
 */
#include "tokenguard/mariadb_token_store.hpp"

#include <sstream>

namespace tokenguard {
namespace {
constexpr unsigned int kDuplicateEntry = 1062;

constexpr const char* kSelectColumns =
    "SELECT id, user_id, auth_token, prev_auth_token, auth_token_seen, seen_at, rotated_at, user_agent, client_ip, "
    "created_at, updated_at FROM user_auth_tokens ";

std::string Quote(const std::string& escaped) { return "'" + escaped + "'"; }
}  // namespace

MariaDbTokenStore::MariaDbTokenStore(std::shared_ptr<MariaDbClient> db_client) : db_client_(std::move(db_client)) {}

void MariaDbTokenStore::EnsureSchema() const {
  db_client_->WithConnectionRetry([&](MYSQL* conn) {
    const char* sql =
        "CREATE TABLE IF NOT EXISTS user_auth_tokens ("
        " id BIGINT NOT NULL AUTO_INCREMENT PRIMARY KEY,"
        " user_id BIGINT NOT NULL,"
        " auth_token VARCHAR(128) NOT NULL,"
        " prev_auth_token VARCHAR(128) NOT NULL,"
        " user_agent TEXT NULL,"
        " auth_token_seen TINYINT(1) NOT NULL DEFAULT 0,"
        " client_ip VARCHAR(64) NULL,"
        " rotated_at DATETIME(6) NOT NULL,"
        " seen_at DATETIME(6) NULL,"
        " created_at DATETIME(6) NOT NULL,"
        " updated_at DATETIME(6) NOT NULL,"
        " UNIQUE KEY index_user_auth_tokens_on_auth_token (auth_token),"
        " UNIQUE KEY index_user_auth_tokens_on_prev_auth_token (prev_auth_token),"
        " KEY index_user_auth_tokens_on_rotated_at (rotated_at)"
        ") ENGINE=InnoDB;";
    if (mysql_query(conn, sql) != 0) {
      db_client_->RaiseError(conn, "토큰 테이블 생성 실패");
    }
    // 이전 버전이 VARCHAR(512)로 만든 테이블도 TEXT로 맞춘다.
    if (mysql_query(conn, "ALTER TABLE user_auth_tokens MODIFY user_agent TEXT NULL;") != 0) {
      db_client_->RaiseError(conn, "토큰 테이블 컬럼 변경 실패");
    }
  });
}

AuthToken MariaDbTokenStore::Create(UserId user_id, const std::string& digest, const ClientInfo& client,
                                    TimePoint now) {
  AuthToken record;
  db_client_->WithConnectionRetry([&](MYSQL* conn) {
    std::string escaped_digest = Quote(db_client_->Escape(conn, digest));
    std::string ts = Quote(ToSqlTimestamp(now));
    std::ostringstream oss;
    oss << "INSERT INTO user_auth_tokens(user_id, auth_token, prev_auth_token, user_agent, auth_token_seen, client_ip, "
           "rotated_at, created_at, updated_at) VALUES("
        << user_id << ", " << escaped_digest << ", " << escaped_digest << ", "
        << Quote(db_client_->Escape(conn, client.user_agent)) << ", 0, "
        << Quote(db_client_->Escape(conn, client.client_ip)) << ", " << ts << ", " << ts << ", " << ts << ");";
    if (mysql_query(conn, oss.str().c_str()) != 0) {
      if (mysql_errno(conn) == kDuplicateEntry) {
        throw DuplicateDigestError(std::string("토큰 저장 실패: ") + mysql_error(conn));
      }
      db_client_->RaiseError(conn, "토큰 저장 실패");
    }
    record.id = static_cast<TokenId>(mysql_insert_id(conn));
  });
  record.user_id = user_id;
  record.auth_token = digest;
  record.prev_auth_token = digest;
  record.auth_token_seen = false;
  record.rotated_at = now;
  record.client = client;
  record.created_at = now;
  record.updated_at = now;
  return record;
}

std::optional<AuthToken> MariaDbTokenStore::FindLive(const std::string& digest, TimePoint expire_before) const {
  std::optional<AuthToken> result;
  db_client_->WithConnectionRetry([&](MYSQL* conn) {
    std::string escaped = Quote(db_client_->Escape(conn, digest));
    std::ostringstream where;
    where << "WHERE (auth_token = " << escaped << " OR prev_auth_token = " << escaped << ") AND rotated_at > '"
          << ToSqlTimestamp(expire_before) << "' LIMIT 1";
    result = SelectOne(conn, where.str());
  });
  return result;
}

std::optional<AuthToken> MariaDbTokenStore::Find(TokenId id) const {
  std::optional<AuthToken> result;
  db_client_->WithConnectionRetry([&](MYSQL* conn) {
    std::ostringstream where;
    where << "WHERE id = " << id;
    result = SelectOne(conn, where.str());
  });
  return result;
}

bool MariaDbTokenStore::TryRotate(TokenId id, const std::string& new_digest, const ClientInfo& client, TimePoint now,
                                  TimePoint safeguard_before) {
  std::uint64_t changed = 0;
  db_client_->WithConnectionRetry([&](MYSQL* conn) {
    std::string ts = Quote(ToSqlTimestamp(now));
    // MariaDB는 SET 절을 왼쪽부터 평가하므로 prev_auth_token을 auth_token보다 먼저 갱신해야 한다.
    std::ostringstream oss;
    oss << "UPDATE user_auth_tokens SET"
        << " prev_auth_token = CASE WHEN auth_token_seen THEN auth_token ELSE prev_auth_token END,"
        << " auth_token = " << Quote(db_client_->Escape(conn, new_digest)) << ","
        << " auth_token_seen = 0, seen_at = NULL,"
        << " user_agent = " << Quote(db_client_->Escape(conn, client.user_agent)) << ","
        << " client_ip = " << Quote(db_client_->Escape(conn, client.client_ip)) << ","
        << " rotated_at = " << ts << ", updated_at = " << ts << " WHERE id = " << id
        << " AND (auth_token_seen = 1 OR rotated_at < '" << ToSqlTimestamp(safeguard_before) << "');";
    changed = ExecuteUpdate(conn, oss.str(), "토큰 회전 실패");
  });
  return changed > 0;
}

bool MariaDbTokenStore::TryMarkSeen(TokenId id, const std::string& digest, TimePoint now) {
  std::uint64_t changed = 0;
  db_client_->WithConnectionRetry([&](MYSQL* conn) {
    std::string ts = Quote(ToSqlTimestamp(now));
    std::ostringstream oss;
    oss << "UPDATE user_auth_tokens SET auth_token_seen = 1, seen_at = " << ts << ", updated_at = " << ts
        << " WHERE id = " << id << " AND auth_token = " << Quote(db_client_->Escape(conn, digest))
        << " AND auth_token_seen = 0;";
    changed = ExecuteUpdate(conn, oss.str(), "토큰 확인 표시 실패");
  });
  return changed == 1;
}

int MariaDbTokenStore::TryInvalidatePrevious(TokenId id, const std::string& digest, TimePoint rotated_before) {
  std::uint64_t changed = 0;
  db_client_->WithConnectionRetry([&](MYSQL* conn) {
    std::ostringstream oss;
    oss << "UPDATE user_auth_tokens SET auth_token_seen = 0 WHERE id = " << id
        << " AND prev_auth_token = " << Quote(db_client_->Escape(conn, digest)) << " AND rotated_at < '"
        << ToSqlTimestamp(rotated_before) << "';";
    changed = ExecuteUpdate(conn, oss.str(), "이전 토큰 무효화 실패");
  });
  return static_cast<int>(changed);
}

bool MariaDbTokenStore::Destroy(TokenId id) {
  std::uint64_t changed = 0;
  db_client_->WithConnectionRetry([&](MYSQL* conn) {
    std::ostringstream oss;
    oss << "DELETE FROM user_auth_tokens WHERE id = " << id << ";";
    changed = ExecuteUpdate(conn, oss.str(), "토큰 삭제 실패");
  });
  return changed > 0;
}

std::size_t MariaDbTokenStore::DeleteRotatedBefore(TimePoint threshold) {
  std::uint64_t changed = 0;
  db_client_->WithConnectionRetry([&](MYSQL* conn) {
    std::ostringstream oss;
    oss << "DELETE FROM user_auth_tokens WHERE rotated_at < '" << ToSqlTimestamp(threshold) << "';";
    changed = ExecuteUpdate(conn, oss.str(), "만료 토큰 정리 실패");
  });
  return static_cast<std::size_t>(changed);
}

void MariaDbTokenStore::ClearAll() const {
  db_client_->WithConnectionRetry([&](MYSQL* conn) {
    if (mysql_query(conn, "DELETE FROM user_auth_tokens;") != 0) {
      db_client_->RaiseError(conn, "토큰 테이블 초기화 실패");
    }
  });
}

std::optional<AuthToken> MariaDbTokenStore::SelectOne(MYSQL* conn, const std::string& where) const {
  std::string sql = std::string(kSelectColumns) + where + ";";
  if (mysql_query(conn, sql.c_str()) != 0) {
    db_client_->RaiseError(conn, "토큰 조회 실패");
  }
  MYSQL_RES* res = mysql_store_result(conn);
  if (!res) {
    db_client_->RaiseError(conn, "토큰 조회 결과 없음");
  }
  std::optional<AuthToken> result;
  MYSQL_ROW row = mysql_fetch_row(res);
  if (row) {
    try {
      result = BuildRecord(row);
    } catch (...) {
      mysql_free_result(res);
      throw;
    }
  }
  mysql_free_result(res);
  return result;
}

std::uint64_t MariaDbTokenStore::ExecuteUpdate(MYSQL* conn, const std::string& sql, const std::string& ctx) const {
  if (mysql_query(conn, sql.c_str()) != 0) {
    if (mysql_errno(conn) == kDuplicateEntry) {
      throw DuplicateDigestError(ctx + ": " + mysql_error(conn));
    }
    db_client_->RaiseError(conn, ctx);
  }
  return static_cast<std::uint64_t>(mysql_affected_rows(conn));
}

AuthToken MariaDbTokenStore::BuildRecord(MYSQL_ROW row) const {
  AuthToken record;
  record.id = row[0] ? std::stoll(row[0]) : 0;
  record.user_id = row[1] ? std::stoll(row[1]) : 0;
  record.auth_token = row[2] ? row[2] : "";
  record.prev_auth_token = row[3] ? row[3] : "";
  record.auth_token_seen = row[4] && std::string(row[4]) != "0";
  if (row[5]) {
    record.seen_at = ParseSqlTimestamp(row[5]);
  }
  record.rotated_at = ParseSqlTimestamp(row[6]);
  record.client.user_agent = row[7] ? row[7] : "";
  record.client.client_ip = row[8] ? row[8] : "";
  record.created_at = ParseSqlTimestamp(row[9]);
  record.updated_at = ParseSqlTimestamp(row[10]);
  return record;
}

}  // namespace tokenguard
