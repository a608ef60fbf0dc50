#include <gtest/gtest.h>

#include "fsesl/network/address.h"

using namespace fsesl;
using namespace fsesl::network;

namespace {

TcpAddress parseOrFail(const std::string& text) {
  auto result = parseAddress(text);
  if (holds_alternative<Error>(result)) {
    ADD_FAILURE() << text << ": " << get<Error>(result).message;
    return TcpAddress();
  }
  return get<TcpAddress>(result);
}

bool rejects(const std::string& text) {
  auto result = parseAddress(text);
  return holds_alternative<Error>(result) &&
         get<Error>(result).code == errors::INVALID_ARGUMENT;
}

}  // namespace

TEST(AddressTest, HostAndPort) {
  TcpAddress address = parseOrFail("127.0.0.1:8021");
  EXPECT_EQ(address.host, "127.0.0.1");
  EXPECT_EQ(address.port, 8021);
  EXPECT_EQ(address.toString(), "127.0.0.1:8021");

  address = parseOrFail("pbx.example.com:65535");
  EXPECT_EQ(address.host, "pbx.example.com");
  EXPECT_EQ(address.port, 65535);
}

TEST(AddressTest, BracketedIpv6) {
  TcpAddress address = parseOrFail("[::1]:8021");
  EXPECT_EQ(address.host, "::1");
  EXPECT_EQ(address.port, 8021);
  EXPECT_EQ(address.toString(), "[::1]:8021");
}

TEST(AddressTest, RejectsMalformed) {
  EXPECT_TRUE(rejects(""));
  EXPECT_TRUE(rejects("localhost"));
  EXPECT_TRUE(rejects(":8021"));
  EXPECT_TRUE(rejects("localhost:"));
  EXPECT_TRUE(rejects("localhost:http"));
  EXPECT_TRUE(rejects("localhost:-1"));
  EXPECT_TRUE(rejects("[::1]8021"));
  EXPECT_TRUE(rejects("[::1"));
  EXPECT_TRUE(rejects("[]:8021"));
}

TEST(AddressTest, RejectsPortOutOfRange) {
  EXPECT_TRUE(rejects("localhost:0"));
  EXPECT_TRUE(rejects("localhost:65536"));
  EXPECT_TRUE(rejects("localhost:123456"));
}
