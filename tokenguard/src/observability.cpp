/*
 * 설명: 구조화 JSON 로그 출력과 카운터 스냅샷을 구현한다.
 * 버전: v1.1.0
 * 관련 문서: DESIGN.md
 * 테스트: tokenguard/tests/unit/observability_test.cpp
 */
#include "tokenguard/observability.hpp"

#include <chrono>
#include <iostream>
#include <sstream>

namespace tokenguard {

LogLevel ParseLogLevel(const std::string& text) {
  if (text == "debug") {
    return LogLevel::kDebug;
  }
  if (text == "warn" || text == "warning") {
    return LogLevel::kWarn;
  }
  if (text == "error") {
    return LogLevel::kError;
  }
  return LogLevel::kInfo;
}

const char* ToString(LogLevel level) {
  switch (level) {
    case LogLevel::kDebug:
      return "debug";
    case LogLevel::kInfo:
      return "info";
    case LogLevel::kWarn:
      return "warn";
    case LogLevel::kError:
      return "error";
  }
  return "info";
}

Observability::Observability() : Observability(LogLevel::kInfo, std::cout) {}

Observability::Observability(LogLevel min_level, std::ostream& sink) : min_level_(min_level), sink_(&sink) {}

std::string Observability::NextTraceId() {
  auto now = std::chrono::steady_clock::now().time_since_epoch().count();
  std::ostringstream oss;
  oss << std::hex << now << "-" << trace_counter_.fetch_add(1);
  return oss.str();
}

void Observability::Log(const LogContext& ctx) const {
  if (static_cast<int>(ctx.level) < static_cast<int>(min_level_.load())) {
    return;
  }
  nlohmann::json log_json;
  log_json["level"] = ToString(ctx.level);
  log_json["eventName"] = ctx.name;
  if (!ctx.trace_id.empty()) {
    log_json["traceId"] = ctx.trace_id;
  }
  if (ctx.user_id) {
    log_json["userId"] = *ctx.user_id;
  }
  if (ctx.token_id) {
    log_json["tokenId"] = *ctx.token_id;
  }
  if (!ctx.detail.is_null()) {
    log_json["detail"] = ctx.detail;
  }
  std::lock_guard<std::mutex> lock(sink_mutex_);
  *sink_ << log_json.dump() << std::endl;
}

MetricsSnapshot Observability::Snapshot() const {
  MetricsSnapshot snapshot;
  snapshot.lookups = lookups_.load();
  snapshot.misses = misses_.load();
  snapshot.seen_marked = seen_marked_.load();
  snapshot.rotations = rotations_.load();
  snapshot.rotations_skipped = rotations_skipped_.load();
  snapshot.replay_suspected = replay_suspected_.load();
  snapshot.swept = swept_.load();
  snapshot.notification_failures = notification_failures_.load();
  return snapshot;
}

}  // namespace tokenguard
