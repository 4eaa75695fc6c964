/*
 * 설명: staff 계정의 로그인 위치를 과거 접속 위치와 비교해 의심 로그인을 판별한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: tokenguard/tests/unit/suspicious_login_test.cpp
 */
#pragma once

#include <memory>
#include <optional>
#include <string>

#include "tokenguard/audit_log.hpp"
#include "tokenguard/geolocation.hpp"
#include "tokenguard/observability.hpp"
#include "tokenguard/principal_directory.hpp"

namespace tokenguard {

class SuspiciousLoginDetector {
 public:
  SuspiciousLoginDetector(std::shared_ptr<PrincipalDirectory> principals, std::shared_ptr<AuditLog> audit_log,
                          std::shared_ptr<GeoLocator> geo, std::shared_ptr<Observability> observability);

  // 국가 단위 위치. 알 수 없으면 std::nullopt
  std::optional<std::string> LoginLocation(const std::string& ip) const;
  bool IsSuspicious(UserId user_id, const std::string& user_ip) const;

 private:
  std::shared_ptr<PrincipalDirectory> principals_;
  std::shared_ptr<AuditLog> audit_log_;
  std::shared_ptr<GeoLocator> geo_;
  std::shared_ptr<Observability> observability_;
};

}  // namespace tokenguard
