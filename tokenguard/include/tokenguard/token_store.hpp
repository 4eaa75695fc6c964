/*
 * 설명: 토큰 레코드 저장소 계약과 메모리 구현을 정의한다.
 *       모든 상태 전이는 조건 확인과 갱신이 한 번에 일어나는 조건부 쓰기다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: tokenguard/tests/unit/in_memory_token_store_test.cpp
 */
#pragma once

#include <chrono>
#include <cstddef>
#include <map>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_map>

#include "tokenguard/auth_token.hpp"

namespace tokenguard {

class DuplicateDigestError : public std::runtime_error {
 public:
  explicit DuplicateDigestError(const std::string& message) : std::runtime_error(message) {}
};

class TokenStore {
 public:
  using TimePoint = std::chrono::system_clock::time_point;

  virtual ~TokenStore() = default;

  virtual AuthToken Create(UserId user_id, const std::string& digest, const ClientInfo& client, TimePoint now) = 0;
  // auth_token 또는 prev_auth_token이 digest와 같고 rotated_at > expire_before인 레코드
  virtual std::optional<AuthToken> FindLive(const std::string& digest, TimePoint expire_before) const = 0;
  virtual std::optional<AuthToken> Find(TokenId id) const = 0;

  // seen이거나 rotated_at < safeguard_before일 때만 회전한다.
  virtual bool TryRotate(TokenId id, const std::string& new_digest, const ClientInfo& client, TimePoint now,
                         TimePoint safeguard_before) = 0;
  // auth_token == digest이고 아직 seen이 아닐 때만 표시한다.
  virtual bool TryMarkSeen(TokenId id, const std::string& digest, TimePoint now) = 0;
  // prev_auth_token == digest이고 rotated_at < rotated_before이면 seen을 해제한다. 일치한 행 수를 반환한다.
  virtual int TryInvalidatePrevious(TokenId id, const std::string& digest, TimePoint rotated_before) = 0;

  virtual bool Destroy(TokenId id) = 0;
  virtual std::size_t DeleteRotatedBefore(TimePoint threshold) = 0;
};

class InMemoryTokenStore : public TokenStore {
 public:
  AuthToken Create(UserId user_id, const std::string& digest, const ClientInfo& client, TimePoint now) override;
  std::optional<AuthToken> FindLive(const std::string& digest, TimePoint expire_before) const override;
  std::optional<AuthToken> Find(TokenId id) const override;
  bool TryRotate(TokenId id, const std::string& new_digest, const ClientInfo& client, TimePoint now,
                 TimePoint safeguard_before) override;
  bool TryMarkSeen(TokenId id, const std::string& digest, TimePoint now) override;
  int TryInvalidatePrevious(TokenId id, const std::string& digest, TimePoint rotated_before) override;
  bool Destroy(TokenId id) override;
  std::size_t DeleteRotatedBefore(TimePoint threshold) override;

  std::size_t Size() const;

 private:
  void IndexDigests(const AuthToken& record);
  void UnindexDigests(const AuthToken& record);
  bool DigestTakenByOther(const std::string& digest, TokenId owner) const;

  TokenId next_id_{1};
  std::map<TokenId, AuthToken> records_;
  std::unordered_map<std::string, TokenId> current_index_;
  std::unordered_map<std::string, TokenId> previous_index_;
  mutable std::mutex mutex_;
};

}  // namespace tokenguard
