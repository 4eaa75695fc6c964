#include <cstdio>
#include <fstream>
#include <stdexcept>

#include <gtest/gtest.h>

#include "tokenguard/geolocation.hpp"

namespace {

TEST(CidrGeoLocatorTest, LongestPrefixWins) {
  tokenguard::CidrGeoLocator geo;
  geo.AddRange("10.0.0.0/8", "US");
  geo.AddRange("10.20.0.0/16", "KR");
  EXPECT_EQ(geo.Locate("10.20.3.4"), std::optional<std::string>("KR"));
  EXPECT_EQ(geo.Locate("10.21.3.4"), std::optional<std::string>("US"));
  EXPECT_FALSE(geo.Locate("11.0.0.1").has_value());
}

TEST(CidrGeoLocatorTest, NonOctetPrefix) {
  tokenguard::CidrGeoLocator geo;
  geo.AddRange("192.168.0.0/20", "JP");
  EXPECT_EQ(geo.Locate("192.168.15.255"), std::optional<std::string>("JP"));
  EXPECT_FALSE(geo.Locate("192.168.16.0").has_value());
}

TEST(CidrGeoLocatorTest, Ipv6AndMappedIpv4) {
  tokenguard::CidrGeoLocator geo;
  geo.AddRange("2001:db8::/32", "DE");
  geo.AddRange("203.0.113.0/24", "KR");
  EXPECT_EQ(geo.Locate("2001:db8:1::5"), std::optional<std::string>("DE"));
  EXPECT_EQ(geo.Locate("::ffff:203.0.113.9"), std::optional<std::string>("KR"));
  EXPECT_FALSE(geo.Locate("2001:db9::1").has_value());
}

TEST(CidrGeoLocatorTest, BareAddressIsHostRoute) {
  tokenguard::CidrGeoLocator geo;
  geo.AddRange("198.51.100.7", "FR");
  EXPECT_EQ(geo.Locate("198.51.100.7"), std::optional<std::string>("FR"));
  EXPECT_FALSE(geo.Locate("198.51.100.8").has_value());
}

TEST(CidrGeoLocatorTest, InvalidInput) {
  tokenguard::CidrGeoLocator geo;
  EXPECT_THROW(geo.AddRange("not-an-ip/8", "US"), std::invalid_argument);
  EXPECT_THROW(geo.AddRange("10.0.0.0/33", "US"), std::invalid_argument);
  EXPECT_THROW(geo.AddRange("10.0.0.0/x", "US"), std::invalid_argument);
  EXPECT_EQ(geo.RangeCount(), 0u);
  EXPECT_FALSE(geo.Locate("garbage").has_value());
  EXPECT_FALSE(geo.Locate("").has_value());
}

TEST(CidrGeoLocatorTest, LoadsJsonTable) {
  auto table = nlohmann::json::parse(R"({"ranges":[{"cidr":"203.0.113.0/24","country":"KR"},
                                                    {"cidr":"192.0.2.0/24","country":"US"}]})");
  auto geo = tokenguard::CidrGeoLocator::FromJson(table);
  EXPECT_EQ(geo.RangeCount(), 2u);
  EXPECT_EQ(geo.Locate("192.0.2.1"), std::optional<std::string>("US"));
  EXPECT_THROW(tokenguard::CidrGeoLocator::FromJson(nlohmann::json::object()), std::invalid_argument);
}

TEST(CidrGeoLocatorTest, LoadsFile) {
  std::string path = ::testing::TempDir() + "tokenguard_geo_table.json";
  {
    std::ofstream out(path);
    out << R"({"ranges":[{"cidr":"2001:db8::/32","country":"DE"}]})";
  }
  auto geo = tokenguard::CidrGeoLocator::FromFile(path);
  EXPECT_EQ(geo.Locate("2001:db8::1"), std::optional<std::string>("DE"));
  std::remove(path.c_str());
  EXPECT_THROW(tokenguard::CidrGeoLocator::FromFile(path), std::runtime_error);
}

TEST(CidrGeoLocatorTest, V4MappedCidrMatchesV4Addresses) {
  tokenguard::CidrGeoLocator geo;
  geo.AddRange("::ffff:203.0.113.0/120", "KR");
  geo.AddRange("::ffff:198.51.100.7", "JP");
  EXPECT_EQ(geo.Locate("203.0.113.9"), std::optional<std::string>("KR"));
  EXPECT_EQ(geo.Locate("::ffff:203.0.113.9"), std::optional<std::string>("KR"));
  EXPECT_EQ(geo.Locate("198.51.100.7"), std::optional<std::string>("JP"));
  EXPECT_FALSE(geo.Locate("198.51.100.8").has_value());
  EXPECT_FALSE(geo.Locate("203.0.114.1").has_value());
  EXPECT_THROW(geo.AddRange("::ffff:203.0.113.0/80", "KR"), std::invalid_argument);
  EXPECT_THROW(geo.AddRange("::ffff:203.0.113.0/129", "KR"), std::invalid_argument);
}

}  // namespace
