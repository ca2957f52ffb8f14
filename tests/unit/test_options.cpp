#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "cli/options.hpp"

namespace {

auto Parse(std::vector<std::string> args) {
  args.insert(args.begin(), "clusterd_tester");
  std::vector<char *> argv;
  for (auto &a : args) {
    argv.push_back(a.data());
  }
  return cli::ParseArgs(static_cast<int>(argv.size()), argv.data());
}

TEST(OptionsTest, PositionalsAndDefaults) {
  auto r = Parse({"stories", "10.0.0.5", "7000"});
  ASSERT_TRUE(r.has_value()) << r.error();
  const RunOptions &o = r->run;
  EXPECT_EQ(o.directory, "stories");
  EXPECT_EQ(o.session.host, "10.0.0.5");
  EXPECT_EQ(o.session.port, "7000");
  EXPECT_EQ(o.session.mode, Mode::fast);
  EXPECT_EQ(o.session.banner, "+RCLUSTER Version v1.10");
  EXPECT_EQ(o.session.successPrefix, "+RCLUSTER");
  EXPECT_EQ(o.session.errorPrefix, "-RCLUSTER");
  EXPECT_EQ(o.session.timeout, std::chrono::seconds(10));
  EXPECT_EQ(o.extension, ".xml");
  EXPECT_EQ(o.logDir, ".");
  EXPECT_FALSE(r->help);
}

TEST(OptionsTest, OptionsMayFollowOrPrecedePositionals) {
  auto r = Parse({"--mode", "detailed", "stories", "h", "1", "-e", ".rdf",
                  "--timeout", "3", "-b", "HELLO v2", "-l", "/tmp"});
  ASSERT_TRUE(r.has_value()) << r.error();
  EXPECT_EQ(r->run.session.mode, Mode::detailed);
  EXPECT_EQ(r->run.extension, ".rdf");
  EXPECT_EQ(r->run.session.timeout, std::chrono::seconds(3));
  EXPECT_EQ(r->run.session.banner, "HELLO v2");
  EXPECT_EQ(r->run.logDir, "/tmp");
  EXPECT_EQ(r->run.directory, "stories");
}

TEST(OptionsTest, HelpShortCircuits) {
  auto r = Parse({"--help"});
  ASSERT_TRUE(r.has_value());
  EXPECT_TRUE(r->help);
}

TEST(OptionsTest, RejectsInvalidInput) {
  const std::vector<std::vector<std::string>> bad = {
      {},
      {"stories", "h"},
      {"stories", "h", "port"},
      {"stories", "h", "0"},
      {"stories", "h", "65536"},
      {"stories", "h", "7000", "extra"},
      {"stories", "h", "7000", "--mode", "slow"},
      {"stories", "h", "7000", "--mode"},
      {"stories", "h", "7000", "--timeout", "0"},
      {"stories", "h", "7000", "--timeout", "ten"},
      {"stories", "h", "7000", "--verbose"},
  };
  for (const auto &args : bad) {
    auto r = Parse(args);
    EXPECT_FALSE(r.has_value()) << "accepted argument list of size "
                                << args.size();
  }
}

TEST(OptionsTest, ModeNamesParse) {
  EXPECT_EQ(ParseMode("fast"), Mode::fast);
  EXPECT_EQ(ParseMode("detailed"), Mode::detailed);
  EXPECT_FALSE(ParseMode("FAST").has_value());
  EXPECT_EQ(ToString(Mode::detailed), "detailed");
}

} // namespace
