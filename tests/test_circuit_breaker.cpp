#include <gtest/gtest.h>
#include "daemon/circuit_breaker.hpp"
#include "daemon/startup_error.hpp"
#include "daemon/stderr_log.hpp"

#include <filesystem>
#include <fstream>
#include <memory>
#include <unistd.h>

namespace fs = std::filesystem;
using json = nlohmann::json;

class CircuitBreakerTest : public ::testing::Test {
protected:
    fs::path test_dir;
    std::unique_ptr<StartupErrorStore> errors;
    std::unique_ptr<StderrLog> stderr_log;
    BreakerSettings settings;  // 30s window, 3 crashes

    void SetUp() override {
        test_dir = fs::temp_directory_path() /
                   ("gatewarden-test-breaker-" + std::to_string(getpid()));
        fs::remove_all(test_dir);
        fs::create_directories(test_dir);
        errors = std::make_unique<StartupErrorStore>((test_dir / "startup-error").string());
        stderr_log = std::make_unique<StderrLog>((test_dir / "stderr.log").string());
    }

    void TearDown() override {
        fs::remove_all(test_dir);
    }

    json artifact() const {
        auto raw = errors->read_raw();
        return raw ? json::parse(*raw) : json();
    }
};

TEST_F(CircuitBreakerTest, LongUptimeNeverOpens) {
    CircuitBreaker breaker(settings, *errors, *stderr_log);
    int64_t now = 1000000;
    for (int i = 0; i < 10; ++i) {
        now += 60000;
        EXPECT_EQ(breaker.record_exit(30000, now, 1), BreakerVerdict::Restart);
    }
    EXPECT_FALSE(breaker.is_open());
    EXPECT_EQ(breaker.window().count, 0);
    EXPECT_FALSE(errors->exists());
}

TEST_F(CircuitBreakerTest, ThirdQuickCrashOpens) {
    {
        std::ofstream out(stderr_log->path());
        out << "Error: gateway token missing\n";
    }
    CircuitBreaker breaker(settings, *errors, *stderr_log);

    // Uptimes 2s, 3s, 1s
    EXPECT_EQ(breaker.record_exit(2000, 100000, 1), BreakerVerdict::Restart);
    EXPECT_EQ(breaker.window().count, 1);
    EXPECT_EQ(breaker.record_exit(3000, 108000, 1), BreakerVerdict::Restart);
    EXPECT_EQ(breaker.window().count, 2);
    EXPECT_FALSE(errors->exists());
    EXPECT_EQ(breaker.record_exit(1000, 114000, 1), BreakerVerdict::Open);
    EXPECT_TRUE(breaker.is_open());

    json a = artifact();
    EXPECT_EQ(a["error"], "circuit_breaker_open");
    EXPECT_EQ(a["crashCount"], 3);
    EXPECT_EQ(a["exitCode"], 1);
    EXPECT_EQ(a["stderr"], "Error: gateway token missing");
    EXPECT_EQ(a["message"], "Service crashed 3 times within 30s. Likely a configuration error.");
    EXPECT_TRUE(a.contains("timestamp"));
}

TEST_F(CircuitBreakerTest, LongRunResetsWindow) {
    CircuitBreaker breaker(settings, *errors, *stderr_log);
    EXPECT_EQ(breaker.record_exit(1000, 100000, 1), BreakerVerdict::Restart);
    EXPECT_EQ(breaker.record_exit(1000, 102000, 1), BreakerVerdict::Restart);
    EXPECT_EQ(breaker.record_exit(45000, 150000, 137), BreakerVerdict::Restart);
    EXPECT_EQ(breaker.window().count, 0);

    EXPECT_EQ(breaker.record_exit(1000, 152000, 1), BreakerVerdict::Restart);
    EXPECT_EQ(breaker.window().count, 1);
    EXPECT_FALSE(breaker.is_open());
}

TEST_F(CircuitBreakerTest, CrashOutsideWindowRestartsCount) {
    CircuitBreaker breaker(settings, *errors, *stderr_log);
    EXPECT_EQ(breaker.record_exit(1000, 100000, 1), BreakerVerdict::Restart);
    EXPECT_EQ(breaker.record_exit(1000, 110000, 1), BreakerVerdict::Restart);

    // First crash of the pair was 31s ago: new window
    EXPECT_EQ(breaker.record_exit(1000, 131000, 1), BreakerVerdict::Restart);
    EXPECT_EQ(breaker.window().count, 1);
    EXPECT_EQ(breaker.window().window_start_ms, 131000);
    EXPECT_FALSE(breaker.is_open());
}

TEST_F(CircuitBreakerTest, StaysOpenOnceOpened) {
    CircuitBreaker breaker(settings, *errors, *stderr_log);
    breaker.record_exit(1000, 100000, 1);
    breaker.record_exit(1000, 101000, 1);
    ASSERT_EQ(breaker.record_exit(1000, 102000, 1), BreakerVerdict::Open);

    EXPECT_EQ(breaker.record_exit(60000, 200000, 0), BreakerVerdict::Open);
    EXPECT_EQ(artifact()["crashCount"], 3);
}

TEST_F(CircuitBreakerTest, EmptyStderrIsMarked) {
    CircuitBreaker breaker(settings, *errors, *stderr_log);
    breaker.record_exit(500, 100000, 2);
    breaker.record_exit(500, 100500, 2);
    ASSERT_EQ(breaker.record_exit(500, 101000, 2), BreakerVerdict::Open);
    EXPECT_EQ(artifact()["stderr"], "(no stderr captured)");
}

TEST_F(CircuitBreakerTest, UnknownExitCodeOmitted) {
    BreakerSettings one_shot;
    one_shot.max_crashes = 1;
    CircuitBreaker breaker(one_shot, *errors, *stderr_log);
    ASSERT_EQ(breaker.record_exit(500, 100000, std::nullopt), BreakerVerdict::Open);
    EXPECT_FALSE(artifact().contains("exitCode"));
    EXPECT_EQ(artifact()["crashCount"], 1);
}

TEST_F(CircuitBreakerTest, TailHonorsLineLimit) {
    {
        std::ofstream out(stderr_log->path());
        for (int i = 1; i <= 80; ++i) out << "err " << i << "\n";
    }
    BreakerSettings one_shot;
    one_shot.max_crashes = 1;
    CircuitBreaker breaker(one_shot, *errors, *stderr_log, 2);
    ASSERT_EQ(breaker.record_exit(500, 100000, 1), BreakerVerdict::Open);
    EXPECT_EQ(artifact()["stderr"], "err 79\nerr 80");
}
