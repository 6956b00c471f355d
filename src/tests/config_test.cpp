#include <gtest/gtest.h>
#include <cstdlib>
#include <vector>
#include "config/server_config.hpp"

using namespace cfs::config;

class ConfigTest : public ::testing::Test {
protected:
  void SetUp() override {
    unsetenv("APPSERVER_PORT");
    unsetenv("APPSERVER_BASEURI");
  }

  void TearDown() override {
    unsetenv("APPSERVER_PORT");
    unsetenv("APPSERVER_BASEURI");
  }

  ProgramOptions parse(std::vector<const char*> args) {
    args.insert(args.begin(), "cfs_server");
    return parse_command_line(static_cast<int>(args.size()), args.data());
  }
};

TEST_F(ConfigTest, Defaults) {
  auto options = parse({});
  ASSERT_TRUE(options.valid) << options.error;
  EXPECT_FALSE(options.help);
  EXPECT_EQ(options.config.host, "0.0.0.0");
  EXPECT_EQ(options.config.port, 3000);
  EXPECT_EQ(options.config.data_dir, "data");
  EXPECT_EQ(options.config.base_uri, "http://localhost:3000");
  EXPECT_EQ(options.config.max_range_bytes, 1024u * 1024u);
  EXPECT_EQ(options.config.log_level, "info");
  EXPECT_EQ(options.config.io_timeout_seconds, 30u);
  EXPECT_TRUE(options.config.log_file.empty());
  EXPECT_TRUE(options.config.classify);
}

TEST_F(ConfigTest, AllFlags) {
  auto options = parse({"-h", "127.0.0.1", "--port", "8080", "-d", "/tmp/cfs", "-u", "https://files.example",
                        "-r", "4096", "-t", "2", "-i", "5", "-l", "cfs.log", "-v", "debug", "--no-classify"});
  ASSERT_TRUE(options.valid) << options.error;
  EXPECT_EQ(options.config.host, "127.0.0.1");
  EXPECT_EQ(options.config.port, 8080);
  EXPECT_EQ(options.config.data_dir, "/tmp/cfs");
  EXPECT_EQ(options.config.base_uri, "https://files.example");
  EXPECT_EQ(options.config.max_range_bytes, 4096u);
  EXPECT_EQ(options.config.worker_threads, 2u);
  EXPECT_EQ(options.config.io_timeout_seconds, 5u);
  EXPECT_EQ(options.config.log_file, "cfs.log");
  EXPECT_EQ(options.config.log_level, "debug");
  EXPECT_FALSE(options.config.classify);
}

TEST_F(ConfigTest, BaseUriFollowsPort) {
  auto options = parse({"-p", "9000"});
  ASSERT_TRUE(options.valid);
  EXPECT_EQ(options.config.base_uri, "http://localhost:9000");
}

TEST_F(ConfigTest, EnvironmentDefaults) {
  setenv("APPSERVER_PORT", "4000", 1);
  setenv("APPSERVER_BASEURI", "https://cdn.example", 1);

  auto options = parse({});
  ASSERT_TRUE(options.valid) << options.error;
  EXPECT_EQ(options.config.port, 4000);
  EXPECT_EQ(options.config.base_uri, "https://cdn.example");

  // Flags win over the environment
  options = parse({"-p", "5000"});
  ASSERT_TRUE(options.valid);
  EXPECT_EQ(options.config.port, 5000);
  EXPECT_EQ(options.config.base_uri, "https://cdn.example");
}

TEST_F(ConfigTest, InvalidArguments) {
  EXPECT_FALSE(parse({"-p", "70000"}).valid);
  EXPECT_FALSE(parse({"-p", "abc"}).valid);
  EXPECT_FALSE(parse({"-p"}).valid);
  EXPECT_FALSE(parse({"--frobnicate"}).valid);
  EXPECT_FALSE(parse({"-t", "0"}).valid);
  EXPECT_FALSE(parse({"-r", "0"}).valid);
  EXPECT_FALSE(parse({"--io-timeout", "0"}).valid);
  EXPECT_FALSE(parse({"-d", ""}).valid);

  auto options = parse({"--bogus"});
  EXPECT_NE(options.error.find("--bogus"), std::string::npos);

  setenv("APPSERVER_PORT", "not-a-port", 1);
  EXPECT_FALSE(parse({}).valid);
}

TEST_F(ConfigTest, Help) {
  auto options = parse({"--help"});
  EXPECT_TRUE(options.help);
  EXPECT_NE(usage("cfs_server").find("--data-dir"), std::string::npos);
}
