/*
 * 설명: 뮤텍스로 보호되는 메모리 토큰 저장소를 구현한다.
 *       저장소 단위 락이 DB 행 단위 원자성을 대신한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: tokenguard/tests/unit/in_memory_token_store_test.cpp
 */
#include "tokenguard/token_store.hpp"

namespace tokenguard {

AuthToken InMemoryTokenStore::Create(UserId user_id, const std::string& digest, const ClientInfo& client,
                                     TimePoint now) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (current_index_.count(digest) > 0 || previous_index_.count(digest) > 0) {
    throw DuplicateDigestError("이미 사용 중인 토큰 다이제스트입니다");
  }
  AuthToken record;
  record.id = next_id_++;
  record.user_id = user_id;
  record.auth_token = digest;
  record.prev_auth_token = digest;
  record.auth_token_seen = false;
  record.rotated_at = now;
  record.client = client;
  record.created_at = now;
  record.updated_at = now;
  records_.emplace(record.id, record);
  IndexDigests(record);
  return record;
}

std::optional<AuthToken> InMemoryTokenStore::FindLive(const std::string& digest, TimePoint expire_before) const {
  std::lock_guard<std::mutex> lock(mutex_);
  for (const auto* index : {&current_index_, &previous_index_}) {
    auto it = index->find(digest);
    if (it == index->end()) {
      continue;
    }
    const auto& record = records_.at(it->second);
    if (record.rotated_at > expire_before) {
      return record;
    }
  }
  return std::nullopt;
}

std::optional<AuthToken> InMemoryTokenStore::Find(TokenId id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = records_.find(id);
  if (it == records_.end()) {
    return std::nullopt;
  }
  return it->second;
}

bool InMemoryTokenStore::TryRotate(TokenId id, const std::string& new_digest, const ClientInfo& client, TimePoint now,
                                   TimePoint safeguard_before) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = records_.find(id);
  if (it == records_.end()) {
    return false;
  }
  AuthToken& record = it->second;
  if (!(record.auth_token_seen || record.rotated_at < safeguard_before)) {
    return false;
  }
  std::string next_prev = record.auth_token_seen ? record.auth_token : record.prev_auth_token;
  if (DigestTakenByOther(new_digest, id) ||
      (previous_index_.count(next_prev) > 0 && previous_index_.at(next_prev) != id)) {
    throw DuplicateDigestError("회전 대상 다이제스트가 다른 레코드와 충돌합니다");
  }
  UnindexDigests(record);
  record.prev_auth_token = next_prev;
  record.auth_token = new_digest;
  record.auth_token_seen = false;
  record.seen_at.reset();
  record.rotated_at = now;
  record.client = client;
  record.updated_at = now;
  IndexDigests(record);
  return true;
}

bool InMemoryTokenStore::TryMarkSeen(TokenId id, const std::string& digest, TimePoint now) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = records_.find(id);
  if (it == records_.end()) {
    return false;
  }
  AuthToken& record = it->second;
  if (record.auth_token != digest || record.auth_token_seen) {
    return false;
  }
  record.auth_token_seen = true;
  record.seen_at = now;
  record.updated_at = now;
  return true;
}

int InMemoryTokenStore::TryInvalidatePrevious(TokenId id, const std::string& digest, TimePoint rotated_before) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = records_.find(id);
  if (it == records_.end()) {
    return 0;
  }
  AuthToken& record = it->second;
  if (record.prev_auth_token != digest || !(record.rotated_at < rotated_before)) {
    return 0;
  }
  record.auth_token_seen = false;
  return 1;
}

bool InMemoryTokenStore::Destroy(TokenId id) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = records_.find(id);
  if (it == records_.end()) {
    return false;
  }
  UnindexDigests(it->second);
  records_.erase(it);
  return true;
}

std::size_t InMemoryTokenStore::DeleteRotatedBefore(TimePoint threshold) {
  std::lock_guard<std::mutex> lock(mutex_);
  std::size_t removed = 0;
  for (auto it = records_.begin(); it != records_.end();) {
    if (it->second.rotated_at < threshold) {
      UnindexDigests(it->second);
      it = records_.erase(it);
      ++removed;
    } else {
      ++it;
    }
  }
  return removed;
}

std::size_t InMemoryTokenStore::Size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return records_.size();
}

void InMemoryTokenStore::IndexDigests(const AuthToken& record) {
  current_index_[record.auth_token] = record.id;
  previous_index_[record.prev_auth_token] = record.id;
}

void InMemoryTokenStore::UnindexDigests(const AuthToken& record) {
  current_index_.erase(record.auth_token);
  previous_index_.erase(record.prev_auth_token);
}

bool InMemoryTokenStore::DigestTakenByOther(const std::string& digest, TokenId owner) const {
  auto it = current_index_.find(digest);
  return it != current_index_.end() && it->second != owner;
}

}  // namespace tokenguard
