#include <gtest/gtest.h>
#include "core/config.hpp"

#include <filesystem>
#include <fstream>
#include <cstdlib>
#include <unistd.h>

namespace fs = std::filesystem;

class ConfigTest : public ::testing::Test {
protected:
    std::string test_dir;
    std::string original_home;
    bool had_home = false;

    void SetUp() override {
        // Create a temp directory for test config
        test_dir = fs::temp_directory_path() / "gatewarden-test-config";
        fs::create_directories(test_dir);

        // Save and override HOME
        const char* home = std::getenv("HOME");
        if (home) {
            had_home = true;
            original_home = home;
        }
        setenv("HOME", test_dir.c_str(), 1);
    }

    void TearDown() override {
        // Restore HOME
        if (had_home) {
            setenv("HOME", original_home.c_str(), 1);
        }
        // Cleanup
        fs::remove_all(test_dir);
    }

    std::string write_config(const std::string& yaml) {
        std::string path = test_dir + "/config.yaml";
        std::ofstream out(path);
        out << yaml;
        return path;
    }
};

TEST_F(ConfigTest, DefaultValues) {
    Config cfg;
    const AppConfig& d = cfg.data();
    ASSERT_FALSE(d.service.command.empty());
    EXPECT_EQ(d.service.command[0], "openclaw");
    EXPECT_EQ(d.service.host, "127.0.0.1");
    EXPECT_EQ(d.service.port, 18789);
    EXPECT_EQ(d.breaker.window_ms, 30000);
    EXPECT_EQ(d.breaker.max_crashes, 3);
    EXPECT_EQ(d.breaker.restart_delay_ms, 5000);
    EXPECT_EQ(d.startup_timeout_ms, 180000);
    EXPECT_EQ(d.error_path, "/tmp/gateway-startup-error");
    EXPECT_EQ(d.stderr_log, "/tmp/gateway-stderr.log");
    EXPECT_EQ(d.stderr_tail_lines, 50);
    EXPECT_EQ(d.status_port, 0);
    EXPECT_EQ(d.log_level, "info");
}

TEST_F(ConfigTest, RuntimeJobsDefaultUnderHome) {
    Config cfg;
    EXPECT_EQ(cfg.data().runtime_jobs_path, test_dir + "/.openclaw/cron/jobs.json");
}

TEST_F(ConfigTest, ExpandHome) {
    EXPECT_EQ(Config::expand_home("~/x/y"), test_dir + "/x/y");
    EXPECT_EQ(Config::expand_home("/abs/path"), "/abs/path");
    EXPECT_EQ(Config::expand_home(""), "");
}

TEST_F(ConfigTest, ConfigDirPath) {
    if (geteuid() == 0) GTEST_SKIP() << "Skipped: runs as root, config_dir ignores HOME";
    std::string dir = Config::config_dir();
    EXPECT_FALSE(dir.empty());
    EXPECT_NE(dir.find(".config/gatewarden"), std::string::npos);
}

TEST_F(ConfigTest, ConfigFilePath) {
    std::string path = Config::config_path();
    EXPECT_FALSE(path.empty());
    EXPECT_NE(path.find("config.yaml"), std::string::npos);
}

TEST_F(ConfigTest, LoadNonExistentReturnsFalse) {
    if (geteuid() == 0) GTEST_SKIP() << "Skipped: runs as root, config_dir ignores HOME";
    Config cfg;
    EXPECT_FALSE(cfg.load());
}

TEST_F(ConfigTest, LoadFromMissingFileKeepsDefaults) {
    Config cfg;
    EXPECT_FALSE(cfg.load_from(test_dir + "/nope.yaml"));
    EXPECT_EQ(cfg.data().service.port, 18789);
}

TEST_F(ConfigTest, LoadFromReadsAllSections) {
    std::string path = write_config(R"(
service:
  command: ["/usr/bin/node", "server.js"]
  env:
    NODE_ENV: production
  host: 0.0.0.0
  port: 9000
  config_path: ~/svc/config.json
  pid_file: /run/svc.pid
  lock_files: [/tmp/a.lock, ~/b.lock]
breaker:
  window_ms: 10000
  max_crashes: 5
  restart_delay_ms: 100
startup:
  timeout_ms: 2000
  probe_interval_ms: 50
shutdown:
  grace_ms: 1500
artifacts:
  error_path: /var/tmp/err
  stderr_log: /var/tmp/stderr.log
  stderr_tail_lines: 20
  stderr_keep_lines: 200
jobs:
  declared_path: /etc/svc/jobs.json
  declared_fallback_path: /etc/svc/legacy.json
  runtime_path: ~/state/jobs.json
status:
  host: 127.0.0.1
  port: 8080
logging:
  level: debug
)");

    Config cfg;
    ASSERT_TRUE(cfg.load_from(path));
    const AppConfig& d = cfg.data();

    ASSERT_EQ(d.service.command.size(), 2u);
    EXPECT_EQ(d.service.command[1], "server.js");
    EXPECT_EQ(d.service.env.at("NODE_ENV"), "production");
    EXPECT_EQ(d.service.host, "0.0.0.0");
    EXPECT_EQ(d.service.port, 9000);
    EXPECT_EQ(d.service.config_path, test_dir + "/svc/config.json");
    EXPECT_EQ(d.service.pid_file, "/run/svc.pid");
    ASSERT_EQ(d.service.lock_files.size(), 2u);
    EXPECT_EQ(d.service.lock_files[1], test_dir + "/b.lock");

    EXPECT_EQ(d.breaker.window_ms, 10000);
    EXPECT_EQ(d.breaker.max_crashes, 5);
    EXPECT_EQ(d.breaker.restart_delay_ms, 100);
    EXPECT_EQ(d.startup_timeout_ms, 2000);
    EXPECT_EQ(d.probe_interval_ms, 50);
    EXPECT_EQ(d.shutdown_grace_ms, 1500);

    EXPECT_EQ(d.error_path, "/var/tmp/err");
    EXPECT_EQ(d.stderr_log, "/var/tmp/stderr.log");
    EXPECT_EQ(d.stderr_tail_lines, 20);
    EXPECT_EQ(d.stderr_keep_lines, 200);

    EXPECT_EQ(d.declared_jobs_path, "/etc/svc/jobs.json");
    EXPECT_EQ(d.declared_jobs_fallback_path, "/etc/svc/legacy.json");
    EXPECT_EQ(d.runtime_jobs_path, test_dir + "/state/jobs.json");

    EXPECT_EQ(d.status_host, "127.0.0.1");
    EXPECT_EQ(d.status_port, 8080);
    EXPECT_EQ(d.log_level, "debug");
}

TEST_F(ConfigTest, PartialFileKeepsOtherDefaults) {
    std::string path = write_config("breaker:\n  max_crashes: 7\n");

    Config cfg;
    ASSERT_TRUE(cfg.load_from(path));
    EXPECT_EQ(cfg.data().breaker.max_crashes, 7);
    EXPECT_EQ(cfg.data().breaker.window_ms, 30000);
    EXPECT_EQ(cfg.data().service.port, 18789);
}

TEST_F(ConfigTest, LoadMalformedYamlUsesDefaults) {
    std::string path = write_config("{{{{invalid yaml!!!!");

    Config cfg;
    EXPECT_FALSE(cfg.load_from(path));
    // Should still have defaults
    EXPECT_EQ(cfg.data().service.host, "127.0.0.1");
    EXPECT_EQ(cfg.data().service.port, 18789);
}

TEST_F(ConfigTest, UnconvertibleScalarFallsBackToDefault) {
    std::string path = write_config("service:\n  port: 9000\nbreaker:\n  window_ms: soon\n");

    Config cfg;
    ASSERT_TRUE(cfg.load_from(path));
    EXPECT_EQ(cfg.data().service.port, 9000);
    EXPECT_EQ(cfg.data().breaker.window_ms, 30000);
}

TEST_F(ConfigTest, BadCommandListLeavesDefaultsUntouched) {
    std::string path = write_config("service:\n  port: 9000\n  command:\n    - {nested: map}\n");

    Config cfg;
    EXPECT_FALSE(cfg.load_from(path));
    EXPECT_EQ(cfg.data().service.port, 18789);
    EXPECT_EQ(cfg.data().service.command[0], "openclaw");
}

TEST_F(ConfigTest, BreakerSettingsAreClamped) {
    std::string path = write_config(
        "breaker:\n  window_ms: 0\n  max_crashes: -2\n  restart_delay_ms: -100\n");

    Config cfg;
    ASSERT_TRUE(cfg.load_from(path));
    EXPECT_EQ(cfg.data().breaker.window_ms, 1);
    EXPECT_EQ(cfg.data().breaker.max_crashes, 1);
    EXPECT_EQ(cfg.data().breaker.restart_delay_ms, 0);
}
