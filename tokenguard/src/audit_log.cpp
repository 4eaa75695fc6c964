/*
 * 설명: 메모리 감사 로그를 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 */
#include "tokenguard/audit_log.hpp"

#include <algorithm>

namespace tokenguard {

void InMemoryAuditLog::Record(const AuditEvent& event) {
  std::lock_guard<std::mutex> lock(mutex_);
  events_.push_back(event);
}

std::vector<std::string> InMemoryAuditLog::ClientIpsForUser(UserId user_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<std::string> ips;
  for (const auto& event : events_) {
    if (event.user_id && *event.user_id == user_id && !event.client_ip.empty()) {
      ips.push_back(event.client_ip);
    }
  }
  return ips;
}

std::size_t InMemoryAuditLog::PurgeBefore(std::chrono::system_clock::time_point threshold) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto before = events_.size();
  events_.erase(std::remove_if(events_.begin(), events_.end(),
                               [&](const AuditEvent& event) { return event.created_at < threshold; }),
                events_.end());
  return before - events_.size();
}

std::vector<AuditEvent> InMemoryAuditLog::Events() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return events_;
}

}  // namespace tokenguard
