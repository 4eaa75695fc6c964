/*
 * 설명: CIDR 대역 테이블로 IP의 국가 코드를 찾는다. 가장 긴 프리픽스가 우선한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: tokenguard/tests/unit/geolocation_test.cpp
 */
#include "tokenguard/geolocation.hpp"

#include <algorithm>
#include <fstream>
#include <stdexcept>

#include <boost/asio/ip/address.hpp>

namespace tokenguard {
namespace {
void ToBytes(const boost::asio::ip::address& address, bool& v6, std::array<unsigned char, 16>& out) {
  out.fill(0);
  if (address.is_v4()) {
    auto bytes = address.to_v4().to_bytes();
    std::copy(bytes.begin(), bytes.end(), out.begin());
    v6 = false;
    return;
  }
  auto v6_address = address.to_v6();
  if (v6_address.is_v4_mapped()) {
    auto bytes = boost::asio::ip::make_address_v4(boost::asio::ip::v4_mapped, v6_address).to_bytes();
    std::copy(bytes.begin(), bytes.end(), out.begin());
    v6 = false;
    return;
  }
  auto bytes = v6_address.to_bytes();
  std::copy(bytes.begin(), bytes.end(), out.begin());
  v6 = true;
}
}  // namespace

CidrGeoLocator CidrGeoLocator::FromJson(const nlohmann::json& table) {
  CidrGeoLocator locator;
  if (!table.is_object() || !table.contains("ranges") || !table["ranges"].is_array()) {
    throw std::invalid_argument("지오IP 테이블에 ranges 배열이 없습니다");
  }
  for (const auto& entry : table["ranges"]) {
    locator.AddRange(entry.at("cidr").get<std::string>(), entry.at("country").get<std::string>());
  }
  return locator;
}

CidrGeoLocator CidrGeoLocator::FromFile(const std::string& path) {
  std::ifstream in(path);
  if (!in) {
    throw std::runtime_error("지오IP 테이블을 열 수 없습니다: " + path);
  }
  nlohmann::json table;
  in >> table;
  return FromJson(table);
}

void CidrGeoLocator::AddRange(const std::string& cidr, const std::string& country) {
  auto slash = cidr.find('/');
  std::string address_text = cidr.substr(0, slash);
  boost::system::error_code ec;
  auto address = boost::asio::ip::make_address(address_text, ec);
  if (ec) {
    throw std::invalid_argument("잘못된 CIDR 주소: " + cidr);
  }
  Range range;
  ToBytes(address, range.v6, range.network);
  // ::ffff:a.b.c.d/N 은 v4 대역 a.b.c.d/(N-96)으로 저장한다.
  bool mapped = address.is_v6() && !range.v6;
  unsigned int max_len = address.is_v6() ? 128 : 32;
  unsigned int offset = mapped ? 96 : 0;
  range.prefix_len = max_len - offset;
  if (slash != std::string::npos) {
    try {
      std::size_t idx = 0;
      auto parsed = std::stoul(cidr.substr(slash + 1), &idx);
      if (idx != cidr.size() - slash - 1 || parsed > max_len || parsed < offset) {
        throw std::invalid_argument(cidr);
      }
      range.prefix_len = static_cast<unsigned int>(parsed - offset);
    } catch (const std::logic_error&) {
      throw std::invalid_argument("잘못된 CIDR 프리픽스: " + cidr);
    }
  }
  range.country = country;
  ranges_.push_back(range);
}

std::optional<std::string> CidrGeoLocator::Locate(const std::string& ip) const {
  boost::system::error_code ec;
  auto address = boost::asio::ip::make_address(ip, ec);
  if (ec) {
    return std::nullopt;
  }
  bool v6 = false;
  std::array<unsigned char, 16> bytes{};
  ToBytes(address, v6, bytes);

  const Range* best = nullptr;
  for (const auto& range : ranges_) {
    if (range.v6 != v6 || !PrefixMatches(range, bytes)) {
      continue;
    }
    if (!best || range.prefix_len > best->prefix_len) {
      best = &range;
    }
  }
  if (!best) {
    return std::nullopt;
  }
  return best->country;
}

bool CidrGeoLocator::PrefixMatches(const Range& range, const std::array<unsigned char, 16>& bytes) {
  unsigned int full_bytes = range.prefix_len / 8;
  unsigned int remaining_bits = range.prefix_len % 8;
  for (unsigned int i = 0; i < full_bytes; ++i) {
    if (range.network[i] != bytes[i]) {
      return false;
    }
  }
  if (remaining_bits == 0) {
    return true;
  }
  auto mask = static_cast<unsigned char>(0xFF << (8 - remaining_bits));
  return (range.network[full_bytes] & mask) == (bytes[full_bytes] & mask);
}

}  // namespace tokenguard
