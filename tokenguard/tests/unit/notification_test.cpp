#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <sstream>
#include <stdexcept>
#include <thread>
#include <vector>

#include <gtest/gtest.h>

#include "tokenguard/notification.hpp"

namespace {

TEST(AsioNotificationDispatcherTest, RunsAllQueuedJobsBeforeDrainReturns) {
  std::ostringstream sink;
  auto observability = std::make_shared<tokenguard::Observability>(tokenguard::LogLevel::kError, sink);
  std::mutex mutex;
  std::vector<tokenguard::UserId> handled;
  tokenguard::AsioNotificationDispatcher dispatcher(
      [&](const tokenguard::SuspiciousLoginJob& job) {
        std::lock_guard<std::mutex> lock(mutex);
        handled.push_back(job.user_id);
      },
      observability, 2);

  for (tokenguard::UserId id = 1; id <= 5; ++id) {
    dispatcher.Enqueue(tokenguard::SuspiciousLoginJob{id, "192.0.2.1", "ua"});
  }
  dispatcher.Drain();
  EXPECT_EQ(handled.size(), 5u);
}

TEST(AsioNotificationDispatcherTest, HandlerFailureIsContained) {
  std::ostringstream sink;
  auto observability = std::make_shared<tokenguard::Observability>(tokenguard::LogLevel::kError, sink);
  std::atomic<int> calls{0};
  tokenguard::AsioNotificationDispatcher dispatcher(
      [&](const tokenguard::SuspiciousLoginJob&) {
        calls.fetch_add(1);
        throw std::runtime_error("mailer down");
      },
      observability);

  dispatcher.Enqueue(tokenguard::SuspiciousLoginJob{9, "192.0.2.1", "ua"});
  dispatcher.Drain();
  EXPECT_EQ(calls.load(), 1);
  EXPECT_EQ(observability->Snapshot().notification_failures, 1u);
  EXPECT_NE(sink.str().find("notification.failed"), std::string::npos);
}

TEST(AsioNotificationDispatcherTest, EnqueueAfterDrainIsRejected) {
  std::ostringstream sink;
  auto observability = std::make_shared<tokenguard::Observability>(tokenguard::LogLevel::kError, sink);
  std::atomic<int> calls{0};
  tokenguard::AsioNotificationDispatcher dispatcher(
      [&](const tokenguard::SuspiciousLoginJob&) { calls.fetch_add(1); }, observability);
  dispatcher.Drain();
  dispatcher.Enqueue(tokenguard::SuspiciousLoginJob{1, "", ""});
  EXPECT_EQ(calls.load(), 0);
  EXPECT_EQ(observability->Snapshot().notification_failures, 1u);
}

TEST(AsioNotificationDispatcherTest, JobsRacingDrainAreHandledOrCounted) {
  std::ostringstream sink;
  auto observability = std::make_shared<tokenguard::Observability>(tokenguard::LogLevel::kError, sink);
  std::atomic<int> handled{0};
  tokenguard::AsioNotificationDispatcher dispatcher(
      [&](const tokenguard::SuspiciousLoginJob&) { handled.fetch_add(1); }, observability, 2);

  constexpr int kProducers = 4;
  constexpr int kJobsPerProducer = 200;
  std::atomic<bool> go{false};
  std::vector<std::thread> producers;
  for (int p = 0; p < kProducers; ++p) {
    producers.emplace_back([&, p]() {
      while (!go.load()) {
        std::this_thread::yield();
      }
      for (int i = 0; i < kJobsPerProducer; ++i) {
        dispatcher.Enqueue(tokenguard::SuspiciousLoginJob{p * kJobsPerProducer + i, "192.0.2.1", "ua"});
      }
    });
  }
  go.store(true);
  dispatcher.Drain();
  for (auto& t : producers) {
    t.join();
  }

  auto rejected = observability->Snapshot().notification_failures;
  EXPECT_EQ(static_cast<std::uint64_t>(handled.load()) + rejected,
            static_cast<std::uint64_t>(kProducers * kJobsPerProducer));
}

}  // namespace
