#include <gtest/gtest.h>

#include "protocol/handshake.hpp"

namespace {

constexpr const char *kBanner = "+RCLUSTER Version v1.10";

TEST(HandshakeTest, ExactBannerIsAccepted) {
  EXPECT_TRUE(proto::ValidateBanner(kBanner, kBanner, "127.0.0.1:7000"));
}

TEST(HandshakeTest, WrongBannerIsNoAcknowledgment) {
  auto st = proto::ValidateBanner("Wrong Response", kBanner, "127.0.0.1:7000");
  ASSERT_FALSE(st);
  EXPECT_EQ(st.error().kind, ErrorKind::no_acknowledgment);
  EXPECT_EQ(st.error().detail, "Wrong Response");
  EXPECT_EQ(st.error().message,
            "No acknowledgment from 127.0.0.1:7000: Wrong Response");
}

TEST(HandshakeTest, NearMissesAreRejected) {
  const std::string banner = kBanner;
  for (const std::string &received :
       {banner + "\n", banner + " ", std::string("+RCLUSTER"),
        std::string(" ") + banner, std::string("+rcluster version v1.10"),
        std::string()}) {
    auto st = proto::ValidateBanner(received, banner, "h:1");
    ASSERT_FALSE(st) << "accepted '" << received << "'";
    EXPECT_EQ(st.error().kind, ErrorKind::no_acknowledgment);
  }
}

TEST(HandshakeTest, CustomBannerIsHonoured) {
  EXPECT_TRUE(proto::ValidateBanner("HELLO", "HELLO", "h:1"));
  EXPECT_FALSE(proto::ValidateBanner(kBanner, "HELLO", "h:1"));
}

} // namespace
