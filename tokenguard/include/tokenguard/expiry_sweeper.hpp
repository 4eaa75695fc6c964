/*
 * 설명: 주기적으로 만료 토큰과 오래된 감사 로그를 정리하는 타이머 루프.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: tokenguard/tests/unit/expiry_sweeper_test.cpp
 */
#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <mutex>

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>

#include "tokenguard/observability.hpp"

namespace tokenguard {

class ExpirySweeper : public std::enable_shared_from_this<ExpirySweeper> {
 public:
  // sweep은 보통 AuthTokenService::Cleanup이며 정리된 토큰 수를 반환한다.
  using SweepFn = std::function<std::size_t()>;

  ExpirySweeper(boost::asio::io_context& ioc, SweepFn sweep, std::chrono::milliseconds interval,
                std::shared_ptr<Observability> observability);

  void Start();
  void Stop();
  std::size_t CompletedRuns() const;

 private:
  void ScheduleNext();
  void OnTick(const boost::system::error_code& ec);

  boost::asio::steady_timer timer_;
  SweepFn sweep_;
  std::chrono::milliseconds interval_;
  std::shared_ptr<Observability> observability_;
  std::size_t completed_runs_{0};
  bool stopped_{true};
  mutable std::mutex mutex_;
};

}  // namespace tokenguard
