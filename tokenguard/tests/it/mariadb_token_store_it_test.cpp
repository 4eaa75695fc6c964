#include <atomic>
#include <chrono>
#include <cstdlib>
#include <memory>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

#include <gtest/gtest.h>
#include <mariadb/mysql.h>

#include "tokenguard/auth_token_service.hpp"
#include "tokenguard/mariadb_audit_log.hpp"
#include "tokenguard/mariadb_token_store.hpp"

namespace {

using namespace std::chrono_literals;

tokenguard::DbConfig TestDbConfig() {
  tokenguard::DbConfig cfg;
  const char* host = std::getenv("DB_HOST");
  const char* port = std::getenv("DB_PORT");
  const char* user = std::getenv("DB_USER");
  const char* pass = std::getenv("DB_PASSWORD");
  const char* name = std::getenv("DB_NAME");
  cfg.host = host ? host : "127.0.0.1";
  cfg.port = port ? static_cast<unsigned short>(std::stoi(port)) : 3306;
  cfg.user = user ? user : "app";
  cfg.password = pass ? pass : "app_pass";
  cfg.database = name ? name : "app_db";
  return cfg;
}

// DATETIME(6)에 그대로 들어가는 정밀도로 맞춘다.
std::chrono::system_clock::time_point Now() {
  return std::chrono::time_point_cast<std::chrono::microseconds>(std::chrono::system_clock::now());
}

std::shared_ptr<tokenguard::MariaDbTokenStore> BuildStore(std::shared_ptr<tokenguard::MariaDbClient> db_client) {
  auto store = std::make_shared<tokenguard::MariaDbTokenStore>(db_client);
  store->EnsureSchema();
  store->ClearAll();
  return store;
}

const tokenguard::ClientInfo kClient{"it-agent", "192.0.2.44"};

TEST(MariaDbTokenStoreItTest, CreateAndFindLive) {
  auto db_client = std::make_shared<tokenguard::MariaDbClient>(TestDbConfig());
  auto store = BuildStore(db_client);
  auto now = Now();

  auto record = store->Create(11, "digest-1", kClient, now);
  EXPECT_GT(record.id, 0);
  auto found = store->FindLive("digest-1", now - 1h);
  ASSERT_TRUE(found.has_value());
  EXPECT_EQ(found->id, record.id);
  EXPECT_EQ(found->user_id, 11);
  EXPECT_EQ(found->prev_auth_token, "digest-1");
  EXPECT_EQ(found->rotated_at, now);
  EXPECT_EQ(found->client.user_agent, "it-agent");
  EXPECT_FALSE(found->auth_token_seen);
  EXPECT_FALSE(found->seen_at.has_value());
  EXPECT_FALSE(store->FindLive("digest-1", now).has_value());

  EXPECT_THROW(store->Create(12, "digest-1", kClient, now), tokenguard::DuplicateDigestError);
}

TEST(MariaDbTokenStoreItTest, ConditionalWritesReportMatchedRows) {
  auto db_client = std::make_shared<tokenguard::MariaDbClient>(TestDbConfig());
  auto store = BuildStore(db_client);
  auto t0 = Now();
  auto record = store->Create(21, "d1", kClient, t0);

  EXPECT_FALSE(store->TryRotate(record.id, "d2", kClient, t0 + 1s, t0 - 30s));
  EXPECT_TRUE(store->TryMarkSeen(record.id, "d1", t0 + 1s));
  EXPECT_FALSE(store->TryMarkSeen(record.id, "d1", t0 + 2s));

  ASSERT_TRUE(store->TryRotate(record.id, "d2", kClient, t0 + 2s, t0 - 30s));
  auto rotated = store->Find(record.id);
  ASSERT_TRUE(rotated.has_value());
  EXPECT_EQ(rotated->auth_token, "d2");
  EXPECT_EQ(rotated->prev_auth_token, "d1");
  EXPECT_FALSE(rotated->auth_token_seen);
  EXPECT_EQ(rotated->rotated_at, t0 + 2s);

  ASSERT_TRUE(store->TryMarkSeen(record.id, "d2", t0 + 3s));
  EXPECT_EQ(store->TryInvalidatePrevious(record.id, "d1", t0 + 2s), 0);
  EXPECT_EQ(store->TryInvalidatePrevious(record.id, "d1", t0 + 62s), 1);
  EXPECT_FALSE(store->Find(record.id)->auth_token_seen);
}

TEST(MariaDbTokenStoreItTest, ConcurrentRotationHasSingleWinner) {
  auto db_client = std::make_shared<tokenguard::MariaDbClient>(TestDbConfig());
  auto store = BuildStore(db_client);
  auto t0 = Now();
  auto record = store->Create(31, "race-0", kClient, t0);
  ASSERT_TRUE(store->TryMarkSeen(record.id, "race-0", t0));

  constexpr int kRacers = 6;
  std::atomic<int> wins{0};
  std::vector<std::thread> threads;
  for (int i = 0; i < kRacers; ++i) {
    threads.emplace_back([&, i]() {
      if (store->TryRotate(record.id, "race-" + std::to_string(i + 1), kClient, t0 + 1s, t0 - 30s)) {
        wins.fetch_add(1);
      }
    });
  }
  for (auto& t : threads) {
    t.join();
  }
  EXPECT_EQ(wins.load(), 1);
  auto stored = store->Find(record.id);
  ASSERT_TRUE(stored.has_value());
  EXPECT_EQ(stored->prev_auth_token, "race-0");
}

TEST(MariaDbTokenStoreItTest, DeleteRotatedBeforeAndDestroy) {
  auto db_client = std::make_shared<tokenguard::MariaDbClient>(TestDbConfig());
  auto store = BuildStore(db_client);
  auto t0 = Now();
  store->Create(41, "old", kClient, t0 - 48h);
  auto fresh = store->Create(42, "fresh", kClient, t0);

  EXPECT_EQ(store->DeleteRotatedBefore(t0 - 1h), 1u);
  EXPECT_FALSE(store->FindLive("old", t0 - 100h).has_value());
  EXPECT_TRUE(store->Destroy(fresh.id));
  EXPECT_FALSE(store->Destroy(fresh.id));
}

TEST(MariaDbTokenStoreItTest, TransientFailureIsRetried) {
  auto db_client = std::make_shared<tokenguard::MariaDbClient>(TestDbConfig());
  auto store = BuildStore(db_client);
  auto t0 = Now();
  auto record = store->Create(51, "retry-1", kClient, t0);

  db_client->SetTransientInjector([](std::size_t attempt) { return attempt == 1; });
  EXPECT_TRUE(store->TryMarkSeen(record.id, "retry-1", t0));
  db_client->SetTransientInjector([](std::size_t) { return true; });
  EXPECT_THROW(store->Find(record.id), tokenguard::DbException);
  db_client->SetTransientInjector(nullptr);
  EXPECT_TRUE(store->Find(record.id)->auth_token_seen);
}

TEST(MariaDbTokenStoreItTest, AuditLogKeepsIpHistory) {
  auto db_client = std::make_shared<tokenguard::MariaDbClient>(TestDbConfig());
  auto audit = std::make_shared<tokenguard::MariaDbAuditLog>(db_client);
  audit->EnsureSchema();
  audit->ClearAll();
  auto t0 = Now();

  for (const char* ip : {"203.0.113.1", "203.0.113.1", "198.51.100.2"}) {
    tokenguard::AuditEvent event;
    event.action = tokenguard::audit_action::kGenerate;
    event.user_id = 61;
    event.client_ip = ip;
    event.created_at = t0;
    audit->Record(event);
  }
  tokenguard::AuditEvent stale;
  stale.action = tokenguard::audit_action::kMissToken;
  stale.client_ip = "192.0.2.9";
  stale.created_at = t0 - 72h;
  audit->Record(stale);

  auto ips = audit->ClientIpsForUser(61);
  ASSERT_EQ(ips.size(), 3u);
  EXPECT_EQ(ips[0], "203.0.113.1");
  EXPECT_EQ(ips[2], "198.51.100.2");
  EXPECT_EQ(audit->PurgeBefore(t0 - 1h), 1u);
}

TEST(MariaDbTokenStoreItTest, ServiceRotationAgainstDatabase) {
  auto db_client = std::make_shared<tokenguard::MariaDbClient>(TestDbConfig());
  auto store = BuildStore(db_client);
  auto audit = std::make_shared<tokenguard::MariaDbAuditLog>(db_client);
  audit->EnsureSchema();
  audit->ClearAll();
  tokenguard::TokenPolicy policy;
  policy.verbose_logging = true;
  std::ostringstream sink;
  auto clock_now = std::make_shared<std::chrono::system_clock::time_point>(Now());
  tokenguard::AuthTokenService service(store, audit, std::make_shared<tokenguard::StaticSettingsSource>(policy),
                                       tokenguard::TokenCodec("it-secret"), nullptr,
                                       std::make_shared<tokenguard::Observability>(tokenguard::LogLevel::kError, sink),
                                       [clock_now]() { return *clock_now; });

  tokenguard::GenerateParams params;
  params.user_id = 71;
  params.client = kClient;
  auto token = service.Generate(params);
  std::string t1 = *token.unhashed_token;
  tokenguard::LookupOptions seen;
  seen.mark_seen = true;
  token = service.Lookup(t1, seen)->token;

  *clock_now += 11min;
  ASSERT_TRUE(service.Rotate(token));
  std::string t2 = *token.unhashed_token;
  auto previous = service.Lookup(t1);
  ASSERT_TRUE(previous.has_value());
  EXPECT_EQ(previous->match, tokenguard::TokenMatch::kPrevious);
  ASSERT_TRUE(service.Lookup(t2, seen).has_value());

  *clock_now += 2min;
  auto replay = service.Lookup(t1);
  ASSERT_TRUE(replay.has_value());
  EXPECT_TRUE(replay->replay_suspected);
  EXPECT_FALSE(store->Find(token.id)->auth_token_seen);
  EXPECT_EQ(audit->ClientIpsForUser(71).size(), 2u);
}

TEST(MariaDbTokenStoreItTest, LongClientMetadataDoesNotFailIssueOrRotation) {
  auto db_client = std::make_shared<tokenguard::MariaDbClient>(TestDbConfig());
  auto store = BuildStore(db_client);
  auto audit = std::make_shared<tokenguard::MariaDbAuditLog>(db_client);
  audit->EnsureSchema();
  audit->ClearAll();
  tokenguard::TokenPolicy policy;
  policy.verbose_logging = true;
  std::ostringstream sink;
  auto observability = std::make_shared<tokenguard::Observability>(tokenguard::LogLevel::kError, sink);
  auto clock_now = std::make_shared<std::chrono::system_clock::time_point>(Now());
  tokenguard::AuthTokenService service(store, audit, std::make_shared<tokenguard::StaticSettingsSource>(policy),
                                       tokenguard::TokenCodec("it-secret"), nullptr, observability,
                                       [clock_now]() { return *clock_now; });

  const std::string long_agent(2000, 'a');
  tokenguard::GenerateParams params;
  params.user_id = 81;
  params.client = {long_agent, "192.0.2.81"};
  params.path = "/" + std::string(3000, 'p');
  tokenguard::AuthToken token;
  ASSERT_NO_THROW(token = service.Generate(params));
  EXPECT_EQ(store->Find(token.id)->client.user_agent, long_agent);

  *clock_now += 31s;
  tokenguard::RotateInfo info;
  info.user_agent = std::string(2000, 'b');
  info.path = params.path;
  bool rotated = false;
  ASSERT_NO_THROW(rotated = service.Rotate(token, info));
  EXPECT_TRUE(rotated);
  EXPECT_EQ(store->Find(token.id)->client.user_agent, *info.user_agent);
  EXPECT_TRUE(sink.str().find("audit.record_failed") == std::string::npos);
  EXPECT_EQ(audit->ClientIpsForUser(81).size(), 2u);
}

}  // namespace
