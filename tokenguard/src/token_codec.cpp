/*
 * 설명: OpenSSL로 토큰 난수 생성과 HMAC 다이제스트를 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: tokenguard/tests/unit/token_codec_test.cpp
 */
#include "tokenguard/token_codec.hpp"

#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <vector>

#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <openssl/rand.h>

namespace tokenguard {

namespace {
std::string BytesToHex(const unsigned char* data, std::size_t len) {
  std::ostringstream oss;
  for (std::size_t i = 0; i < len; ++i) {
    oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(data[i]);
  }
  return oss.str();
}
}  // namespace

TokenCodec::TokenCodec(std::string secret) : secret_(std::move(secret)) {
  if (secret_.empty()) {
    throw std::invalid_argument("토큰 비밀키가 비어 있습니다");
  }
}

std::string TokenCodec::Hash(const std::string& token) const {
  unsigned char output[EVP_MAX_MD_SIZE];
  unsigned int output_len = 0;
  if (!HMAC(EVP_sha256(), secret_.data(), static_cast<int>(secret_.size()),
            reinterpret_cast<const unsigned char*>(token.data()), token.size(), output, &output_len)) {
    throw std::runtime_error("토큰 다이제스트 계산 실패");
  }
  return BytesToHex(output, output_len);
}

std::string TokenCodec::GenerateToken() const {
  std::vector<unsigned char> buffer(kTokenBytes);
  if (RAND_bytes(buffer.data(), static_cast<int>(buffer.size())) != 1) {
    throw std::runtime_error("난수 생성 실패");
  }
  return BytesToHex(buffer.data(), buffer.size());
}

bool TokenCodec::Matches(const std::string& token, const std::string& digest) const {
  auto computed = Hash(token);
  if (computed.size() != digest.size()) {
    return false;
  }
  return CRYPTO_memcmp(computed.data(), digest.data(), computed.size()) == 0;
}

}  // namespace tokenguard
