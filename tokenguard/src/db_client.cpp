/*
 * 설명: MariaDB 연결과 재시도 로직, DATETIME(6) 변환을 구현한다.
 * 버전: v1.2.0
 * 관련 문서: DESIGN.md
 * 테스트: tokenguard/tests/it/mariadb_token_store_it_test.cpp
 */
#include "tokenguard/db_client.hpp"

#include <cstdio>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <thread>

#include <mariadb/errmsg.h>

namespace tokenguard {
namespace {
constexpr std::size_t kMaxAttempts = 3;
constexpr unsigned int kDeadlock = 1213;
constexpr unsigned int kLockWaitTimeout = 1205;
}  // namespace

MariaDbClient::MariaDbClient(const DbConfig& config) : config_(config) {}

MYSQL* MariaDbClient::Connect() const {
  MYSQL* conn = mysql_init(nullptr);
  if (!conn) {
    throw DbException("MariaDB 초기화 실패", 0, true);
  }
  mysql_options(conn, MYSQL_OPT_CONNECT_TIMEOUT, &connect_timeout_seconds_);
  mysql_options(conn, MYSQL_OPT_READ_TIMEOUT, &query_timeout_seconds_);
  mysql_options(conn, MYSQL_OPT_WRITE_TIMEOUT, &query_timeout_seconds_);
  // affected rows를 "조건에 일치한 행 수"로 받아야 조건부 갱신 결과를 그대로 해석할 수 있다.
  if (!mysql_real_connect(conn, config_.host.c_str(), config_.user.c_str(), config_.password.c_str(),
                          config_.database.c_str(), config_.port, nullptr, CLIENT_FOUND_ROWS)) {
    RaiseError(conn, "연결 실패");
  }
  if (mysql_query(conn, "SET SESSION time_zone='+00:00', innodb_lock_wait_timeout=2;") != 0) {
    RaiseError(conn, "세션 변수 설정 실패");
  }
  return conn;
}

void MariaDbClient::WithConnectionRetry(const std::function<void(MYSQL*)>& work) const {
  for (std::size_t attempt = 1; attempt <= kMaxAttempts; ++attempt) {
    MYSQL* conn = nullptr;
    try {
      conn = Connect();
      if (transient_injector_ && transient_injector_(attempt)) {
        throw DbException("주입된 일시 오류", kDeadlock, true);
      }
      work(conn);
      mysql_close(conn);
      return;
    } catch (const DbException& ex) {
      if (conn) {
        mysql_close(conn);
      }
      if (ex.retryable && attempt < kMaxAttempts) {
        Backoff(attempt);
        continue;
      }
      throw;
    } catch (...) {
      if (conn) {
        mysql_close(conn);
      }
      throw;
    }
  }
}

std::string MariaDbClient::Escape(MYSQL* conn, const std::string& value) const {
  std::string escaped;
  escaped.resize(value.size() * 2 + 1);
  auto len = mysql_real_escape_string(conn, escaped.data(), value.c_str(), value.size());
  escaped.resize(len);
  return escaped;
}

void MariaDbClient::RaiseError(MYSQL* conn, const std::string& ctx) const {
  unsigned int code = mysql_errno(conn);
  bool retryable = IsRetryable(code);
  std::string message = ctx + ": " + mysql_error(conn);
  throw DbException(message, code, retryable);
}

bool MariaDbClient::IsRetryable(unsigned int code) const {
  return code == kDeadlock || code == kLockWaitTimeout || code == CR_SERVER_LOST || code == CR_SERVER_GONE_ERROR ||
         code == CR_CONN_HOST_ERROR || code == CR_SERVER_LOST_EXTENDED;
}

void MariaDbClient::Backoff(std::size_t attempt) const {
  std::size_t base_ms = 50 * (1u << (attempt - 1));
  std::random_device rd;
  std::mt19937 gen(rd());
  std::uniform_int_distribution<int> dist(0, 25);
  std::size_t delay_ms = base_ms + static_cast<std::size_t>(dist(gen));
  std::this_thread::sleep_for(std::chrono::milliseconds(delay_ms));
}

void MariaDbClient::SetTransientInjector(const std::function<bool(std::size_t)>& injector) {
  transient_injector_ = injector;
}

std::string ToSqlTimestamp(std::chrono::system_clock::time_point tp) {
  auto tt = std::chrono::system_clock::to_time_t(tp);
  auto micros = std::chrono::duration_cast<std::chrono::microseconds>(
                    tp - std::chrono::system_clock::from_time_t(tt))
                    .count();
  if (micros < 0) {
    tt -= 1;
    micros += 1000000;
  }
  std::tm tm{};
  gmtime_r(&tt, &tm);
  std::ostringstream oss;
  oss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S") << '.' << std::setw(6) << std::setfill('0') << micros;
  return oss.str();
}

std::chrono::system_clock::time_point ParseSqlTimestamp(const char* text) {
  if (!text) {
    return std::chrono::system_clock::time_point{};
  }
  std::tm tm{};
  long micros = 0;
  char fraction[8] = {0};
  int matched = std::sscanf(text, "%d-%d-%d %d:%d:%d.%6[0-9]", &tm.tm_year, &tm.tm_mon, &tm.tm_mday, &tm.tm_hour,
                            &tm.tm_min, &tm.tm_sec, fraction);
  if (matched < 6) {
    throw DbException(std::string("시각 파싱 실패: ") + text, 0, false);
  }
  if (matched == 7) {
    std::string digits(fraction);
    digits.resize(6, '0');
    micros = std::stol(digits);
  }
  tm.tm_year -= 1900;
  tm.tm_mon -= 1;
  auto tp = std::chrono::system_clock::from_time_t(timegm(&tm));
  return tp + std::chrono::microseconds(micros);
}

}  // namespace tokenguard
