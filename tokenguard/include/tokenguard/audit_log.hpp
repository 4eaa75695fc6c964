/*
 * 설명: 토큰 감사 로그 이벤트와 저장소 계약, 메모리 구현을 정의한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: tokenguard/tests/unit/auth_token_service_test.cpp, tokenguard/tests/unit/suspicious_login_test.cpp
 */
#pragma once

#include <chrono>
#include <cstddef>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "tokenguard/auth_token.hpp"

namespace tokenguard {

namespace audit_action {
constexpr const char* kGenerate = "generate";
constexpr const char* kRotate = "rotate";
constexpr const char* kDestroy = "destroy";
constexpr const char* kMissToken = "miss token";
constexpr const char* kSeenToken = "seen token";
constexpr const char* kSeenWrongToken = "seen wrong token";
constexpr const char* kPrevSeenToken = "prev seen token";
constexpr const char* kPrevSeenTokenUnchanged = "prev seen token unchanged";
}  // namespace audit_action

struct AuditEvent {
  std::string action;
  std::optional<TokenId> user_auth_token_id;
  std::optional<UserId> user_id;
  std::string auth_token;
  std::string client_ip;
  std::string user_agent;
  std::string path;
  std::chrono::system_clock::time_point created_at;
};

class AuditLog {
 public:
  virtual ~AuditLog() = default;

  virtual void Record(const AuditEvent& event) = 0;
  // 중복을 포함한 기록 순서대로의 client_ip 목록
  virtual std::vector<std::string> ClientIpsForUser(UserId user_id) const = 0;
  virtual std::size_t PurgeBefore(std::chrono::system_clock::time_point threshold) = 0;
};

class InMemoryAuditLog : public AuditLog {
 public:
  void Record(const AuditEvent& event) override;
  std::vector<std::string> ClientIpsForUser(UserId user_id) const override;
  std::size_t PurgeBefore(std::chrono::system_clock::time_point threshold) override;

  std::vector<AuditEvent> Events() const;

 private:
  std::vector<AuditEvent> events_;
  mutable std::mutex mutex_;
};

}  // namespace tokenguard
