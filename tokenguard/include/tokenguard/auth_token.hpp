/*
 * 설명: 세션 토큰 레코드와 클라이언트 메타데이터 타입을 정의한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 */
#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace tokenguard {

using TokenId = std::int64_t;
using UserId = long long;

struct ClientInfo {
  std::string user_agent;
  std::string client_ip;
};

struct AuthToken {
  TokenId id{0};
  UserId user_id{0};
  std::string auth_token;
  std::string prev_auth_token;
  bool auth_token_seen{false};
  std::optional<std::chrono::system_clock::time_point> seen_at;
  std::chrono::system_clock::time_point rotated_at;
  ClientInfo client;
  std::chrono::system_clock::time_point created_at;
  std::chrono::system_clock::time_point updated_at;

  // 발급/회전 직후에만 채워지며 저장소에는 기록되지 않는다.
  std::optional<std::string> unhashed_token;
};

}  // namespace tokenguard
