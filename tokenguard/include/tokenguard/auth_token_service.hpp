/*
 * 설명: 세션 토큰 발급, 조회/검증, 회전, 폐기, 만료 정리를 담당한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: tokenguard/tests/unit/auth_token_service_test.cpp, tokenguard/tests/unit/rotation_concurrency_test.cpp
 */
#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>

#include "tokenguard/audit_log.hpp"
#include "tokenguard/auth_token.hpp"
#include "tokenguard/config.hpp"
#include "tokenguard/notification.hpp"
#include "tokenguard/observability.hpp"
#include "tokenguard/token_codec.hpp"
#include "tokenguard/token_store.hpp"

namespace tokenguard {

using Clock = std::function<std::chrono::system_clock::time_point()>;

struct GenerateParams {
  UserId user_id;
  ClientInfo client;
  std::string path;
  bool staff{false};
  bool impersonate{false};
  // 비어 있으면 새로 발급한다.
  std::string trace_id;
};

struct LookupOptions {
  std::string user_agent;
  std::string client_ip;
  std::string path;
  bool mark_seen{false};
  std::string trace_id;
};

struct RotateInfo {
  std::optional<std::string> user_agent;
  std::optional<std::string> client_ip;
  std::string path;
  std::string trace_id;
};

enum class TokenMatch { kCurrent, kPrevious };

struct LookupResult {
  AuthToken token;
  TokenMatch match;
  // 확인된 회전 이후 이전 토큰이 다시 제시됨. 이번 요청은 처리하되 재사용 공격일 수 있다.
  bool replay_suspected{false};

  bool Trusted() const { return !replay_suspected; }
};

class AuthTokenService {
 public:
  AuthTokenService(std::shared_ptr<TokenStore> store, std::shared_ptr<AuditLog> audit_log,
                   std::shared_ptr<SettingsSource> settings, TokenCodec codec,
                   std::shared_ptr<NotificationDispatcher> notifications,
                   std::shared_ptr<Observability> observability, Clock clock = nullptr);

  AuthToken Generate(const GenerateParams& params);
  std::optional<LookupResult> Lookup(const std::string& unhashed_token, const LookupOptions& options = {});
  // 성공하면 token을 다시 읽지 않고 갱신하며 unhashed_token을 채운다. 실패는 경합에 진 정상 결과다.
  bool Rotate(AuthToken& token, const RotateInfo& info = {});
  bool NeedsRotation(const AuthToken& token) const;
  bool Destroy(const AuthToken& token);
  std::size_t Cleanup();

  const TokenCodec& Codec() const { return codec_; }

 private:
  std::string TraceIdOr(const std::string& supplied) const;
  void Audit(const TokenPolicy& policy, const std::string& trace_id, AuditEvent event);

  std::shared_ptr<TokenStore> store_;
  std::shared_ptr<AuditLog> audit_log_;
  std::shared_ptr<SettingsSource> settings_;
  TokenCodec codec_;
  std::shared_ptr<NotificationDispatcher> notifications_;
  std::shared_ptr<Observability> observability_;
  Clock clock_;
};

}  // namespace tokenguard
