#include <gtest/gtest.h>
#include <core/config.hpp>
#include <platform/platform.hpp>
#include <fstream>
#include <unistd.h>

TEST(Config, EmptyDocumentGivesDefaults) {
    auto r = Config::parse("");
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value.tmux().binary, "tmux");
    EXPECT_TRUE(r.value.tmux().socket_name.empty());
    EXPECT_EQ(r.value.tmux().command_timeout_ms, 10000);
    EXPECT_EQ(r.value.execute().timeout, std::chrono::milliseconds(30000));
    EXPECT_EQ(r.value.execute().poll_interval, std::chrono::milliseconds(250));
    EXPECT_TRUE(r.value.execute().exit_status);
    EXPECT_TRUE(r.value.log_file().empty());
}

TEST(Config, ParsesAllSections) {
    auto r = Config::parse(R"(
tmux:
  binary: /usr/local/bin/tmux
  socket_name: agents
  command_timeout_ms: 2500
execute:
  timeout: 1.5
  poll_interval_ms: 100
  exit_status: false
log_file: /var/tmp/bridge.log
)");
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value.tmux().binary, "/usr/local/bin/tmux");
    EXPECT_EQ(r.value.tmux().socket_name, "agents");
    EXPECT_EQ(r.value.tmux().command_timeout_ms, 2500);
    EXPECT_EQ(r.value.execute().timeout, std::chrono::milliseconds(1500));
    EXPECT_EQ(r.value.execute().poll_interval, std::chrono::milliseconds(100));
    EXPECT_FALSE(r.value.execute().exit_status);
    EXPECT_EQ(r.value.log_file(), "/var/tmp/bridge.log");
}

TEST(Config, PartialSectionKeepsOtherDefaults) {
    auto r = Config::parse("execute:\n  timeout: 15\n");
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value.execute().timeout, std::chrono::milliseconds(15000));
    EXPECT_EQ(r.value.execute().poll_interval, std::chrono::milliseconds(250));
    EXPECT_EQ(r.value.tmux().binary, "tmux");
}

TEST(Config, RejectsNonPositiveTimings) {
    EXPECT_TRUE(Config::parse("execute:\n  timeout: 0\n").is_err());
    EXPECT_TRUE(Config::parse("execute:\n  poll_interval_ms: -5\n").is_err());
    EXPECT_TRUE(Config::parse("tmux:\n  binary: \"\"\n").is_err());
}

TEST(Config, RejectsMalformedYaml) {
    EXPECT_TRUE(Config::parse("tmux: [unclosed").is_err());
    EXPECT_TRUE(Config::parse("- just\n- a list\n").is_err());
}

class ConfigFileTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir = platform::temp_dir() / ("tmuxbridge_cfg_" + std::to_string(::getpid()));
        fs::create_directories(dir);
    }
    void TearDown() override {
        std::error_code ec;
        fs::remove_all(dir, ec);
    }

    fs::path dir;
};

TEST_F(ConfigFileTest, MissingFileGivesDefaults) {
    auto r = Config::load_file(dir / "absent.yaml");
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value.tmux().binary, "tmux");
}

TEST_F(ConfigFileTest, DefaultFileRoundTripsAndIsNotOverwritten) {
    fs::path path = dir / "sub" / "config.yaml";
    ASSERT_TRUE(create_default_config(path).is_ok());
    ASSERT_TRUE(fs::exists(path));

    auto r = Config::load_file(path);
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value.execute().timeout, std::chrono::milliseconds(30000));

    {
        std::ofstream out(path);
        out << "execute:\n  timeout: 5\n";
    }
    ASSERT_TRUE(create_default_config(path).is_ok());
    auto again = Config::load_file(path);
    ASSERT_TRUE(again.is_ok()) << again.error;
    EXPECT_EQ(again.value.execute().timeout, std::chrono::milliseconds(5000));
}

TEST_F(ConfigFileTest, ErrorNamesTheFile) {
    fs::path path = dir / "bad.yaml";
    {
        std::ofstream out(path);
        out << "execute:\n  timeout: -1\n";
    }
    auto r = Config::load_file(path);
    ASSERT_TRUE(r.is_err());
    EXPECT_NE(r.error.find("bad.yaml"), std::string::npos);
}
