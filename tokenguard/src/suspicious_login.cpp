/*
 * 설명: 감사 로그의 과거 IP와 지오IP 위치를 비교해 의심 로그인을 판별한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: tokenguard/tests/unit/suspicious_login_test.cpp
 */
#include "tokenguard/suspicious_login.hpp"

#include <algorithm>
#include <vector>

namespace tokenguard {

SuspiciousLoginDetector::SuspiciousLoginDetector(std::shared_ptr<PrincipalDirectory> principals,
                                                 std::shared_ptr<AuditLog> audit_log, std::shared_ptr<GeoLocator> geo,
                                                 std::shared_ptr<Observability> observability)
    : principals_(std::move(principals)), audit_log_(std::move(audit_log)), geo_(std::move(geo)),
      observability_(std::move(observability)) {}

std::optional<std::string> SuspiciousLoginDetector::LoginLocation(const std::string& ip) const {
  try {
    return geo_->Locate(ip);
  } catch (const std::exception& ex) {
    observability_->Log(LogContext{LogLevel::kWarn, "", "geo.lookup_failed", std::nullopt, std::nullopt,
                                   {{"ip", ip}, {"error", ex.what()}}});
    return std::nullopt;
  }
}

bool SuspiciousLoginDetector::IsSuspicious(UserId user_id, const std::string& user_ip) const {
  if (!principals_->IsStaff(user_id)) {
    return false;
  }

  std::vector<std::string> ips = audit_log_->ClientIpsForUser(user_id);
  // 현재 로그인으로 기록된 항목 하나만 제외한다.
  auto current = std::find(ips.begin(), ips.end(), user_ip);
  if (current != ips.end()) {
    ips.erase(current);
  }
  std::sort(ips.begin(), ips.end());
  ips.erase(std::unique(ips.begin(), ips.end()), ips.end());
  if (ips.empty()) {
    return false;
  }

  auto user_location = LoginLocation(user_ip);
  bool suspicious = std::none_of(ips.begin(), ips.end(),
                                 [&](const std::string& ip) { return user_location == LoginLocation(ip); });
  if (suspicious) {
    observability_->Log(LogContext{LogLevel::kWarn, "", "login.suspicious", user_id, std::nullopt,
                                   {{"clientIp", user_ip}, {"location", user_location.value_or("unknown")}}});
  }
  return suspicious;
}

}  // namespace tokenguard
