/*
 * 설명: user_auth_tokens 테이블 기반 토큰 저장소. 상태 전이는 모두 단일 조건부 UPDATE다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: tokenguard/tests/it/mariadb_token_store_it_test.cpp
 */
#pragma once

#include <memory>

#include <mariadb/mysql.h>

#include "tokenguard/db_client.hpp"
#include "tokenguard/token_store.hpp"

namespace tokenguard {

class MariaDbTokenStore : public TokenStore {
 public:
  explicit MariaDbTokenStore(std::shared_ptr<MariaDbClient> db_client);

  void EnsureSchema() const;

  AuthToken Create(UserId user_id, const std::string& digest, const ClientInfo& client, TimePoint now) override;
  std::optional<AuthToken> FindLive(const std::string& digest, TimePoint expire_before) const override;
  std::optional<AuthToken> Find(TokenId id) const override;
  bool TryRotate(TokenId id, const std::string& new_digest, const ClientInfo& client, TimePoint now,
                 TimePoint safeguard_before) override;
  bool TryMarkSeen(TokenId id, const std::string& digest, TimePoint now) override;
  int TryInvalidatePrevious(TokenId id, const std::string& digest, TimePoint rotated_before) override;
  bool Destroy(TokenId id) override;
  std::size_t DeleteRotatedBefore(TimePoint threshold) override;

  void ClearAll() const;

 private:
  std::optional<AuthToken> SelectOne(MYSQL* conn, const std::string& where) const;
  std::uint64_t ExecuteUpdate(MYSQL* conn, const std::string& sql, const std::string& ctx) const;
  AuthToken BuildRecord(MYSQL_ROW row) const;

  std::shared_ptr<MariaDbClient> db_client_;
};

}  // namespace tokenguard
