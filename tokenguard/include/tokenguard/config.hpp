/*
 * 설명: 데몬 환경설정과 토큰 정책(회전 주기, 세션 수명 등) 공급자를 정의한다.
 * 버전: v1.1.0
 * 관련 문서: DESIGN.md
 * 테스트: tokenguard/tests/unit/config_test.cpp
 */
#pragma once

#include <chrono>
#include <cstddef>
#include <mutex>
#include <string>

namespace tokenguard {

struct AppConfig {
  std::string db_host;
  unsigned short db_port;
  std::string db_user;
  std::string db_password;
  std::string db_name;
  std::string log_level;
  std::string token_secret;
  std::size_t sweep_interval_seconds;
};

AppConfig LoadConfigFromEnv();

// 사용 시점마다 다시 조회되는 정책 값들. 코어는 이 값을 캐시하지 않는다.
struct TokenPolicy {
  std::chrono::seconds rotate_interval{std::chrono::minutes(10)};
  // 클라이언트가 새 토큰을 받지 못한 것으로 보일 때 쓰는 짧은 회전 주기
  std::chrono::seconds urgent_rotate_interval{std::chrono::minutes(1)};
  std::chrono::hours maximum_session_age{std::chrono::hours(1440)};
  bool verbose_logging{false};
  std::chrono::seconds safeguard_window{std::chrono::seconds(30)};
  std::chrono::seconds previous_token_grace{std::chrono::minutes(1)};
};

class SettingsSource {
 public:
  virtual ~SettingsSource() = default;
  virtual TokenPolicy Current() const = 0;
};

class EnvSettingsSource : public SettingsSource {
 public:
  TokenPolicy Current() const override;
};

class StaticSettingsSource : public SettingsSource {
 public:
  StaticSettingsSource() = default;
  explicit StaticSettingsSource(const TokenPolicy& policy);

  TokenPolicy Current() const override;
  void Update(const TokenPolicy& policy);

 private:
  TokenPolicy policy_;
  mutable std::mutex mutex_;
};

}  // namespace tokenguard
