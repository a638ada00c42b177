#include <gtest/gtest.h>
#include <cstdio>
#include <fstream>
#include <string>
#include "SEISconfig.hpp"

using namespace SEIS;

TEST(SEISconfig, Defaults) {
  ReceiverConfig cfg;
  EXPECT_FALSE(cfg.ipv6);
  EXPECT_EQ(cfg.port, 5612);
  EXPECT_TRUE(cfg.drop_on_backward);
  EXPECT_EQ(cfg.receive_timeout_ms, 0);
  EXPECT_EQ(cfg.buffer_size, 4096u);
  EXPECT_EQ(cfg.bindAddress(), "0.0.0.0");

  cfg.ipv6 = true;
  EXPECT_EQ(cfg.bindAddress(), "::");
  cfg.bind = "::1";
  EXPECT_EQ(cfg.bindAddress(), "::1");
}

TEST(SEISconfig, ParsesFullDocument) {
  ReceiverConfig cfg;
  ASSERT_TRUE(parse_config(R"({"ipv6": true, "bind": "::1", "port": 7000,
                                "drop_on_backward": false, "receive_timeout_ms": 250})", cfg));
  EXPECT_TRUE(cfg.ipv6);
  EXPECT_EQ(cfg.bind, "::1");
  EXPECT_EQ(cfg.port, 7000);
  EXPECT_FALSE(cfg.drop_on_backward);
  EXPECT_EQ(cfg.receive_timeout_ms, 250);
}

TEST(SEISconfig, PartialDocumentKeepsOtherFields) {
  ReceiverConfig cfg;
  cfg.bind = "127.0.0.1";
  ASSERT_TRUE(parse_config(R"({"port": 9000, "comment": "ignored"})", cfg));
  EXPECT_EQ(cfg.port, 9000);
  EXPECT_EQ(cfg.bind, "127.0.0.1");
  EXPECT_TRUE(cfg.drop_on_backward);
}

TEST(SEISconfig, RejectsBadDocumentsUntouched) {
  ReceiverConfig cfg;
  cfg.port = 1234;

  EXPECT_FALSE(parse_config("not json", cfg));
  EXPECT_FALSE(parse_config("[1, 2, 3]", cfg));
  EXPECT_FALSE(parse_config(R"({"port": 70000})", cfg));
  EXPECT_FALSE(parse_config(R"({"port": "5612"})", cfg));
  EXPECT_FALSE(parse_config(R"({"port": 80, "drop_on_backward": "yes"})", cfg));
  EXPECT_FALSE(parse_config(R"({"receive_timeout_ms": -5})", cfg));
  EXPECT_FALSE(parse_config(R"({"receive_timeout_ms": 3000000000})", cfg));
  EXPECT_EQ(cfg.receive_timeout_ms, 0);
  EXPECT_EQ(cfg.port, 1234);
}

TEST(SEISconfig, LoadsFromFile) {
  const std::string path = ::testing::TempDir() + "seis_config_test.json";
  {
    std::ofstream out(path);
    out << R"({"port": 6001, "drop_on_backward": false})";
  }
  ReceiverConfig cfg;
  ASSERT_TRUE(load_config(path, cfg));
  EXPECT_EQ(cfg.port, 6001);
  EXPECT_FALSE(cfg.drop_on_backward);
  std::remove(path.c_str());

  EXPECT_FALSE(load_config(path + ".missing", cfg));
}
