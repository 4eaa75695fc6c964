/*
 * 설명: 의심 로그인 작업을 스레드 풀에서 비동기로 실행한다. 핸들러 실패는 호출자에게 전파되지 않는다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: tokenguard/tests/unit/notification_test.cpp
 */
#include "tokenguard/notification.hpp"

#include <boost/asio/post.hpp>

namespace tokenguard {

AsioNotificationDispatcher::AsioNotificationDispatcher(Handler handler, std::shared_ptr<Observability> observability,
                                                       std::size_t threads)
    : handler_(std::move(handler)), observability_(std::move(observability)), pool_(threads == 0 ? 1 : threads) {}

AsioNotificationDispatcher::~AsioNotificationDispatcher() { Drain(); }

void AsioNotificationDispatcher::Enqueue(const SuspiciousLoginJob& job) {
  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (!drained_) {
      boost::asio::post(pool_, [this, job]() { Run(job); });
      return;
    }
  }
  observability_->IncrementNotificationFailure();
  observability_->Log(LogContext{LogLevel::kWarn, "", "notification.rejected", job.user_id, std::nullopt,
                                 {{"reason", "dispatcher drained"}}});
}

void AsioNotificationDispatcher::Drain() {
  std::lock_guard<std::mutex> lock(state_mutex_);
  if (drained_) {
    return;
  }
  drained_ = true;
  pool_.join();
}

void AsioNotificationDispatcher::Run(const SuspiciousLoginJob& job) const {
  try {
    handler_(job);
  } catch (const std::exception& ex) {
    observability_->IncrementNotificationFailure();
    observability_->Log(LogContext{LogLevel::kError, "", "notification.failed", job.user_id, std::nullopt,
                                   {{"kind", "suspicious_login"}, {"error", ex.what()}}});
  }
}

}  // namespace tokenguard
