/*
 * 설명: steady_timer로 정리 작업을 반복 실행한다. 저장소 오류는 기록만 하고 다음 주기로 넘어간다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: tokenguard/tests/unit/expiry_sweeper_test.cpp
 */
#include "tokenguard/expiry_sweeper.hpp"

#include <boost/asio/post.hpp>

namespace tokenguard {

ExpirySweeper::ExpirySweeper(boost::asio::io_context& ioc, SweepFn sweep, std::chrono::milliseconds interval,
                             std::shared_ptr<Observability> observability)
    : timer_(ioc), sweep_(std::move(sweep)), interval_(interval), observability_(std::move(observability)) {}

// 타이머는 io_context 스레드에서만 건드린다. Start와 Stop은 모두 executor로 post한다.
void ExpirySweeper::Start() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!stopped_) {
      return;
    }
    stopped_ = false;
  }
  boost::asio::post(timer_.get_executor(), [self = shared_from_this()]() {
    {
      std::lock_guard<std::mutex> lock(self->mutex_);
      if (self->stopped_) {
        return;
      }
    }
    self->ScheduleNext();
  });
}

void ExpirySweeper::Stop() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    stopped_ = true;
  }
  boost::asio::post(timer_.get_executor(), [self = shared_from_this()]() { self->timer_.cancel(); });
}

std::size_t ExpirySweeper::CompletedRuns() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return completed_runs_;
}

void ExpirySweeper::ScheduleNext() {
  timer_.expires_after(interval_);
  timer_.async_wait([self = shared_from_this()](const boost::system::error_code& ec) { self->OnTick(ec); });
}

void ExpirySweeper::OnTick(const boost::system::error_code& ec) {
  if (ec) {
    return;
  }
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (stopped_) {
      return;
    }
  }
  try {
    sweep_();
  } catch (const std::exception& ex) {
    observability_->Log(LogContext{LogLevel::kError, "", "sweep.failed", std::nullopt, std::nullopt,
                                   {{"error", ex.what()}}});
  }
  {
    std::lock_guard<std::mutex> lock(mutex_);
    ++completed_runs_;
    if (stopped_) {
      return;
    }
  }
  ScheduleNext();
}

}  // namespace tokenguard
