/*
 * 설명: 토큰 회전/검증 프로토콜을 구현한다. 저장소의 조건부 쓰기 결과로만 분기하고
 *       성공한 전이는 다시 읽지 않고 메모리 상태에 반영한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: tokenguard/tests/unit/auth_token_service_test.cpp, tokenguard/tests/unit/rotation_concurrency_test.cpp
 */
#include "tokenguard/auth_token_service.hpp"

namespace tokenguard {

AuthTokenService::AuthTokenService(std::shared_ptr<TokenStore> store, std::shared_ptr<AuditLog> audit_log,
                                   std::shared_ptr<SettingsSource> settings, TokenCodec codec,
                                   std::shared_ptr<NotificationDispatcher> notifications,
                                   std::shared_ptr<Observability> observability, Clock clock)
    : store_(std::move(store)), audit_log_(std::move(audit_log)), settings_(std::move(settings)),
      codec_(std::move(codec)), notifications_(std::move(notifications)), observability_(std::move(observability)),
      clock_(clock ? std::move(clock) : Clock([]() { return std::chrono::system_clock::now(); })) {}

AuthToken AuthTokenService::Generate(const GenerateParams& params) {
  auto policy = settings_->Current();
  std::string trace_id = TraceIdOr(params.trace_id);
  auto now = clock_();
  std::string token = codec_.GenerateToken();
  std::string hashed = codec_.Hash(token);

  AuthToken record = store_->Create(params.user_id, hashed, params.client, now);
  record.unhashed_token = token;

  Audit(policy, trace_id,
        AuditEvent{audit_action::kGenerate, record.id, params.user_id, hashed, params.client.client_ip,
                   params.client.user_agent, params.path, now});
  observability_->Log(LogContext{LogLevel::kInfo, trace_id, "token.generate", params.user_id, record.id, nullptr});

  if (params.staff && !params.impersonate && notifications_) {
    try {
      notifications_->Enqueue(SuspiciousLoginJob{params.user_id, params.client.client_ip, params.client.user_agent});
    } catch (const std::exception& ex) {
      observability_->IncrementNotificationFailure();
      observability_->Log(LogContext{LogLevel::kError, trace_id, "notification.enqueue_failed", params.user_id,
                                     record.id, {{"error", ex.what()}}});
    }
  }
  return record;
}

std::optional<LookupResult> AuthTokenService::Lookup(const std::string& unhashed_token, const LookupOptions& options) {
  auto policy = settings_->Current();
  std::string trace_id = TraceIdOr(options.trace_id);
  auto now = clock_();
  std::string hashed = codec_.Hash(unhashed_token);
  observability_->IncrementLookup();

  auto found = store_->FindLive(hashed, now - policy.maximum_session_age);
  if (!found) {
    observability_->IncrementMiss();
    Audit(policy, trace_id,
          AuditEvent{audit_action::kMissToken, std::nullopt, std::nullopt, hashed, options.client_ip,
                     options.user_agent, options.path, now});
    observability_->Log(LogContext{LogLevel::kDebug, trace_id, "token.miss", std::nullopt, std::nullopt,
                                   {{"path", options.path}}});
    return std::nullopt;
  }

  LookupResult result{*found, found->auth_token == hashed ? TokenMatch::kCurrent : TokenMatch::kPrevious, false};
  AuthToken& token = result.token;

  if (token.auth_token != hashed && token.prev_auth_token == hashed && token.auth_token_seen) {
    int changed = store_->TryInvalidatePrevious(token.id, hashed, now - policy.previous_token_grace);
    // 메모리 상태는 그대로 두어 잘못된 쿠키로 한 번 더 요청할 기회를 준다.
    result.replay_suspected = true;
    observability_->IncrementReplaySuspected();
    Audit(policy, trace_id,
          AuditEvent{changed == 0 ? audit_action::kPrevSeenTokenUnchanged : audit_action::kPrevSeenToken, token.id,
                     token.user_id, token.auth_token, options.client_ip, options.user_agent, options.path, now});
    observability_->Log(LogContext{LogLevel::kWarn, trace_id, "token.prev_seen", token.user_id, token.id,
                                   {{"changed", changed}, {"path", options.path}}});
  }

  if (options.mark_seen && !token.auth_token_seen && token.auth_token == hashed) {
    bool changed = store_->TryMarkSeen(token.id, hashed, now);
    if (changed) {
      token.auth_token_seen = true;
      token.seen_at = now;
      observability_->IncrementSeen();
    }
    Audit(policy, trace_id,
          AuditEvent{changed ? audit_action::kSeenToken : audit_action::kSeenWrongToken, token.id, token.user_id,
                     token.auth_token, options.client_ip, options.user_agent, options.path, now});
  }

  return result;
}

bool AuthTokenService::Rotate(AuthToken& token, const RotateInfo& info) {
  auto policy = settings_->Current();
  std::string trace_id = TraceIdOr(info.trace_id);
  auto now = clock_();
  ClientInfo client{info.user_agent ? *info.user_agent : token.client.user_agent,
                    info.client_ip ? *info.client_ip : token.client.client_ip};

  std::string raw = codec_.GenerateToken();
  std::string hashed = codec_.Hash(raw);

  if (!store_->TryRotate(token.id, hashed, client, now, now - policy.safeguard_window)) {
    observability_->IncrementRotationSkipped();
    observability_->Log(
        LogContext{LogLevel::kDebug, trace_id, "token.rotate_skipped", token.user_id, token.id, nullptr});
    return false;
  }

  if (token.auth_token_seen) {
    token.prev_auth_token = token.auth_token;
  }
  token.auth_token = hashed;
  token.auth_token_seen = false;
  token.seen_at.reset();
  token.rotated_at = now;
  token.updated_at = now;
  token.client = client;
  token.unhashed_token = raw;

  observability_->IncrementRotation();
  Audit(policy, trace_id,
        AuditEvent{audit_action::kRotate, token.id, token.user_id, token.auth_token, client.client_ip,
                   client.user_agent, info.path, now});
  observability_->Log(LogContext{LogLevel::kInfo, trace_id, "token.rotate", token.user_id, token.id, nullptr});
  return true;
}

bool AuthTokenService::NeedsRotation(const AuthToken& token) const {
  auto policy = settings_->Current();
  auto now = clock_();
  if (token.rotated_at < now - policy.rotate_interval) {
    return true;
  }
  return !token.auth_token_seen && token.rotated_at < now - policy.urgent_rotate_interval;
}

bool AuthTokenService::Destroy(const AuthToken& token) {
  auto policy = settings_->Current();
  std::string trace_id = observability_->NextTraceId();
  Audit(policy, trace_id,
        AuditEvent{audit_action::kDestroy, token.id, token.user_id, token.auth_token, token.client.client_ip,
                   token.client.user_agent, "", clock_()});
  bool removed = store_->Destroy(token.id);
  observability_->Log(LogContext{LogLevel::kInfo, trace_id, "token.destroy", token.user_id, token.id,
                                 {{"removed", removed}}});
  return removed;
}

std::size_t AuthTokenService::Cleanup() {
  auto policy = settings_->Current();
  std::string trace_id = observability_->NextTraceId();
  auto threshold = clock_() - policy.maximum_session_age - policy.rotate_interval;
  std::size_t purged_logs = 0;
  if (policy.verbose_logging) {
    purged_logs = audit_log_->PurgeBefore(threshold);
  }
  std::size_t removed = store_->DeleteRotatedBefore(threshold);
  observability_->AddSwept(removed);
  observability_->Log(LogContext{LogLevel::kInfo, trace_id, "token.cleanup", std::nullopt, std::nullopt,
                                 {{"removedTokens", removed}, {"purgedLogs", purged_logs}}});
  return removed;
}

std::string AuthTokenService::TraceIdOr(const std::string& supplied) const {
  return supplied.empty() ? observability_->NextTraceId() : supplied;
}

void AuthTokenService::Audit(const TokenPolicy& policy, const std::string& trace_id, AuditEvent event) {
  if (!policy.verbose_logging) {
    return;
  }
  try {
    audit_log_->Record(event);
  } catch (const std::exception& ex) {
    observability_->Log(LogContext{LogLevel::kError, trace_id, "audit.record_failed", event.user_id,
                                   event.user_auth_token_id, {{"action", event.action}, {"error", ex.what()}}});
  }
}

}  // namespace tokenguard
