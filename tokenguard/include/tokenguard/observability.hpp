/*
 * 설명: 구조화 로그와 토큰 처리 카운터를 관리한다.
 * 버전: v1.1.0
 * 관련 문서: DESIGN.md
 * 테스트: tokenguard/tests/unit/observability_test.cpp
 */
#pragma once

#include <atomic>
#include <cstdint>
#include <mutex>
#include <optional>
#include <ostream>
#include <string>

#include <nlohmann/json.hpp>

namespace tokenguard {

enum class LogLevel { kDebug = 0, kInfo = 1, kWarn = 2, kError = 3 };

LogLevel ParseLogLevel(const std::string& text);
const char* ToString(LogLevel level);

struct LogContext {
  LogLevel level{LogLevel::kInfo};
  std::string trace_id;
  std::string name;
  std::optional<long long> user_id;
  std::optional<std::int64_t> token_id;
  nlohmann::json detail;
};

struct MetricsSnapshot {
  std::uint64_t lookups{0};
  std::uint64_t misses{0};
  std::uint64_t seen_marked{0};
  std::uint64_t rotations{0};
  std::uint64_t rotations_skipped{0};
  std::uint64_t replay_suspected{0};
  std::uint64_t swept{0};
  std::uint64_t notification_failures{0};
};

class Observability {
 public:
  Observability();
  // sink 수명은 호출자가 보장한다. 테스트에서 출력을 가로챌 때 쓴다.
  Observability(LogLevel min_level, std::ostream& sink);

  std::string NextTraceId();
  void Log(const LogContext& ctx) const;
  void SetMinLevel(LogLevel level) { min_level_.store(level); }

  void IncrementLookup() { lookups_.fetch_add(1); }
  void IncrementMiss() { misses_.fetch_add(1); }
  void IncrementSeen() { seen_marked_.fetch_add(1); }
  void IncrementRotation() { rotations_.fetch_add(1); }
  void IncrementRotationSkipped() { rotations_skipped_.fetch_add(1); }
  void IncrementReplaySuspected() { replay_suspected_.fetch_add(1); }
  void AddSwept(std::uint64_t count) { swept_.fetch_add(count); }
  void IncrementNotificationFailure() { notification_failures_.fetch_add(1); }
  MetricsSnapshot Snapshot() const;

 private:
  std::atomic<LogLevel> min_level_;
  std::ostream* sink_;
  mutable std::mutex sink_mutex_;
  std::atomic<std::uint64_t> trace_counter_{0};
  std::atomic<std::uint64_t> lookups_{0};
  std::atomic<std::uint64_t> misses_{0};
  std::atomic<std::uint64_t> seen_marked_{0};
  std::atomic<std::uint64_t> rotations_{0};
  std::atomic<std::uint64_t> rotations_skipped_{0};
  std::atomic<std::uint64_t> replay_suspected_{0};
  std::atomic<std::uint64_t> swept_{0};
  std::atomic<std::uint64_t> notification_failures_{0};
};

}  // namespace tokenguard
