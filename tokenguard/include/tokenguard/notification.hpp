/*
 * 설명: 의심 로그인 알림 작업 큐 계약과 boost.asio 스레드 풀 구현.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: tokenguard/tests/unit/notification_test.cpp
 */
#pragma once

#include <functional>
#include <memory>
#include <mutex>
#include <string>

#include <boost/asio/thread_pool.hpp>

#include "tokenguard/auth_token.hpp"
#include "tokenguard/observability.hpp"

namespace tokenguard {

struct SuspiciousLoginJob {
  UserId user_id;
  std::string client_ip;
  std::string user_agent;
};

class NotificationDispatcher {
 public:
  virtual ~NotificationDispatcher() = default;
  virtual void Enqueue(const SuspiciousLoginJob& job) = 0;
};

class AsioNotificationDispatcher : public NotificationDispatcher {
 public:
  using Handler = std::function<void(const SuspiciousLoginJob&)>;

  AsioNotificationDispatcher(Handler handler, std::shared_ptr<Observability> observability,
                             std::size_t threads = 1);
  ~AsioNotificationDispatcher() override;

  void Enqueue(const SuspiciousLoginJob& job) override;
  // 대기 중인 작업을 모두 처리한 뒤 돌아온다.
  void Drain();

 private:
  void Run(const SuspiciousLoginJob& job) const;

  Handler handler_;
  std::shared_ptr<Observability> observability_;
  boost::asio::thread_pool pool_;
  // drained_ 확인과 post는 같은 락 안에서 일어나야 조인된 풀에 작업이 들어가지 않는다.
  std::mutex state_mutex_;
  bool drained_{false};
};

}  // namespace tokenguard
