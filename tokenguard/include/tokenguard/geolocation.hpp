/*
 * 설명: IP를 국가 수준의 대략적 위치로 변환하는 계약과 CIDR 테이블 구현을 정의한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: tokenguard/tests/unit/geolocation_test.cpp
 */
#pragma once

#include <array>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace tokenguard {

class GeoLocator {
 public:
  virtual ~GeoLocator() = default;
  // 알 수 없거나 조회에 실패하면 std::nullopt. 예외를 던지지 않는다.
  virtual std::optional<std::string> Locate(const std::string& ip) const = 0;
};

// {"ranges": [{"cidr": "203.0.113.0/24", "country": "KR"}, ...]}
class CidrGeoLocator : public GeoLocator {
 public:
  CidrGeoLocator() = default;

  static CidrGeoLocator FromJson(const nlohmann::json& table);
  static CidrGeoLocator FromFile(const std::string& path);

  void AddRange(const std::string& cidr, const std::string& country);
  std::optional<std::string> Locate(const std::string& ip) const override;
  std::size_t RangeCount() const { return ranges_.size(); }

 private:
  struct Range {
    bool v6;
    std::array<unsigned char, 16> network;
    unsigned int prefix_len;
    std::string country;
  };

  static bool PrefixMatches(const Range& range, const std::array<unsigned char, 16>& bytes);

  std::vector<Range> ranges_;
};

}  // namespace tokenguard
