/*
 * 설명: 원문 토큰 생성과 서버 비밀키 기반 다이제스트 계산을 담당한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: tokenguard/tests/unit/token_codec_test.cpp
 */
#pragma once

#include <cstddef>
#include <string>

namespace tokenguard {

class TokenCodec {
 public:
  // 비밀키를 교체하면 발급된 모든 토큰이 무효가 된다.
  explicit TokenCodec(std::string secret);

  // HMAC-SHA256(secret, token)의 소문자 16진 문자열(64자)
  std::string Hash(const std::string& token) const;
  std::string GenerateToken() const;
  bool Matches(const std::string& token, const std::string& digest) const;

  static constexpr std::size_t kTokenBytes = 16;
  static constexpr std::size_t kDigestHexLength = 64;

 private:
  std::string secret_;
};

}  // namespace tokenguard
