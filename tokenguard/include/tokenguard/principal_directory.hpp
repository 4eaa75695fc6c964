/*
 * 설명: 주체(사용자)의 권한 등급 조회 계약과 메모리 구현.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: tokenguard/tests/unit/suspicious_login_test.cpp
 */
#pragma once

#include <mutex>
#include <unordered_set>

#include "tokenguard/auth_token.hpp"

namespace tokenguard {

class PrincipalDirectory {
 public:
  virtual ~PrincipalDirectory() = default;
  // 존재하지 않는 사용자는 staff가 아니다.
  virtual bool IsStaff(UserId user_id) const = 0;
};

class InMemoryPrincipalDirectory : public PrincipalDirectory {
 public:
  void SetStaff(UserId user_id, bool staff);
  bool IsStaff(UserId user_id) const override;

 private:
  std::unordered_set<UserId> staff_;
  mutable std::mutex mutex_;
};

}  // namespace tokenguard
