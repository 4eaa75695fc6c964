/*
 * 설명: 환경 변수에서 데몬 설정과 토큰 정책을 읽는다.
 * 버전: v1.1.0
 * 관련 문서: DESIGN.md
 * 테스트: tokenguard/tests/unit/config_test.cpp
 */
#include "tokenguard/config.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <stdexcept>
#include <string>

namespace tokenguard {
namespace {
std::string GetEnv(const char* key, const char* def) {
  const char* val = std::getenv(key);
  return val ? std::string{val} : std::string{def};
}

// system_clock 연산이 넘치지 않도록 기간 값은 100년 이내로 제한한다.
constexpr unsigned long kMaxHours = 24UL * 365 * 100;
constexpr unsigned long kMaxSeconds = kMaxHours * 3600;
constexpr unsigned long kMaxPort = 65535;

unsigned long ParseUnsigned(const char* key, const char* def, unsigned long min_value, unsigned long max_value) {
  std::string raw = GetEnv(key, def);
  unsigned long parsed = 0;
  try {
    std::size_t idx = 0;
    if (!raw.empty() && raw[0] == '-') {
      throw std::invalid_argument(raw);
    }
    parsed = std::stoul(raw, &idx);
    if (idx != raw.size()) {
      throw std::invalid_argument(raw);
    }
  } catch (const std::logic_error&) {
    throw std::invalid_argument(std::string(key) + " 값이 올바른 정수가 아닙니다: " + raw);
  }
  if (parsed < min_value || parsed > max_value) {
    throw std::invalid_argument(std::string(key) + " 값이 허용 범위(" + std::to_string(min_value) + "-" +
                                std::to_string(max_value) + ")를 벗어났습니다: " + raw);
  }
  return parsed;
}

bool ParseBool(const char* key, const char* def) {
  std::string raw = GetEnv(key, def);
  std::transform(raw.begin(), raw.end(), raw.begin(), [](unsigned char c) { return std::tolower(c); });
  if (raw == "1" || raw == "true" || raw == "yes" || raw == "on") {
    return true;
  }
  if (raw == "0" || raw == "false" || raw == "no" || raw == "off" || raw.empty()) {
    return false;
  }
  throw std::invalid_argument(std::string(key) + " 값이 올바른 불리언이 아닙니다: " + raw);
}
}  // namespace

AppConfig LoadConfigFromEnv() {
  AppConfig cfg;
  cfg.db_host = GetEnv("DB_HOST", "mariadb");
  cfg.db_port = static_cast<unsigned short>(ParseUnsigned("DB_PORT", "3306", 1, kMaxPort));
  cfg.db_user = GetEnv("DB_USER", "app");
  cfg.db_password = GetEnv("DB_PASSWORD", "app_pass");
  cfg.db_name = GetEnv("DB_NAME", "app_db");
  cfg.log_level = GetEnv("LOG_LEVEL", "info");
  cfg.token_secret = GetEnv("AUTH_TOKEN_SECRET", "");
  cfg.sweep_interval_seconds =
      static_cast<std::size_t>(ParseUnsigned("AUTH_TOKEN_SWEEP_INTERVAL_SECONDS", "3600", 1, kMaxSeconds));
  if (cfg.token_secret.empty()) {
    throw std::invalid_argument("AUTH_TOKEN_SECRET이 비어 있습니다");
  }
  return cfg;
}

TokenPolicy EnvSettingsSource::Current() const {
  TokenPolicy policy;
  policy.rotate_interval = std::chrono::seconds(ParseUnsigned("AUTH_TOKEN_ROTATE_SECONDS", "600", 0, kMaxSeconds));
  policy.urgent_rotate_interval =
      std::chrono::seconds(ParseUnsigned("AUTH_TOKEN_URGENT_ROTATE_SECONDS", "60", 0, kMaxSeconds));
  policy.maximum_session_age = std::chrono::hours(ParseUnsigned("MAXIMUM_SESSION_AGE_HOURS", "1440", 0, kMaxHours));
  policy.verbose_logging = ParseBool("VERBOSE_AUTH_TOKEN_LOGGING", "false");
  policy.safeguard_window = std::chrono::seconds(ParseUnsigned("AUTH_TOKEN_SAFEGUARD_SECONDS", "30", 0, kMaxSeconds));
  policy.previous_token_grace =
      std::chrono::seconds(ParseUnsigned("AUTH_TOKEN_PREV_GRACE_SECONDS", "60", 0, kMaxSeconds));
  return policy;
}

StaticSettingsSource::StaticSettingsSource(const TokenPolicy& policy) : policy_(policy) {}

TokenPolicy StaticSettingsSource::Current() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return policy_;
}

void StaticSettingsSource::Update(const TokenPolicy& policy) {
  std::lock_guard<std::mutex> lock(mutex_);
  policy_ = policy;
}

}  // namespace tokenguard
