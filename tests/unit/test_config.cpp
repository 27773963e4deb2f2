#include <gtest/gtest.h>

#include <chrono>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <string>

#include "config/config_manager.h"

using namespace StrictKit;

class ConfigManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        unsetenv("STRICTKIT_LOGS_DIR");
        unsetenv("STRICTKIT_TELEMETRY");
        ConfigManager::reset();

        const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
        test_dir_ = std::filesystem::temp_directory_path() /
                    ("strictkit_config_test_" + std::to_string(stamp));
        std::filesystem::create_directories(test_dir_);
    }

    void TearDown() override {
        unsetenv("STRICTKIT_LOGS_DIR");
        unsetenv("STRICTKIT_TELEMETRY");
        ConfigManager::reset();
        std::error_code ec;
        std::filesystem::remove_all(test_dir_, ec);
    }

    std::string writeFile(const std::string& name, const std::string& content) {
        const auto path = test_dir_ / name;
        std::ofstream out(path);
        out << content;
        return path.string();
    }

    std::filesystem::path test_dir_;
};

TEST_F(ConfigManagerTest, DefaultsMatchDocumentedValues) {
    const AuditConfig cfg{};
    EXPECT_STREQ(cfg.logs_dir, "/tmp");
    EXPECT_STREQ(cfg.log_level, "INFO");
    EXPECT_EQ(cfg.secret_severity, ViolationSeverity::FAIL);
    EXPECT_FALSE(cfg.parallel_gates);
    EXPECT_TRUE(cfg.telemetry_enabled);
    EXPECT_STREQ(cfg.telemetry_endpoint, "https://www.strictkit.dev/api/telemetry");
    EXPECT_EQ(cfg.telemetry_timeout_ms, 1500u);
    EXPECT_STREQ(cfg.extra_ignore_dirs, "");
}

TEST_F(ConfigManagerTest, ParseLineKnownKeys) {
    AuditConfig cfg{};

    EXPECT_TRUE(ConfigManager::parseLine("LOGS_DIR=/var/log/strictkit", cfg));
    EXPECT_TRUE(ConfigManager::parseLine("  LOG_LEVEL = DEBUG  \n", cfg));
    EXPECT_TRUE(ConfigManager::parseLine("SECRET_SEVERITY=WARN", cfg));
    EXPECT_TRUE(ConfigManager::parseLine("PARALLEL_GATES=true", cfg));
    EXPECT_TRUE(ConfigManager::parseLine("EXTRA_IGNORE_DIRS=vendor, generated", cfg));
    EXPECT_TRUE(ConfigManager::parseLine("TELEMETRY_ENABLED=off", cfg));
    EXPECT_TRUE(ConfigManager::parseLine("TELEMETRY_ENDPOINT=http://localhost:9/t", cfg));
    EXPECT_TRUE(ConfigManager::parseLine("TELEMETRY_TIMEOUT_MS=250", cfg));

    EXPECT_STREQ(cfg.logs_dir, "/var/log/strictkit");
    EXPECT_STREQ(cfg.log_level, "DEBUG");
    EXPECT_EQ(cfg.secret_severity, ViolationSeverity::WARN);
    EXPECT_TRUE(cfg.parallel_gates);
    EXPECT_STREQ(cfg.extra_ignore_dirs, "vendor, generated");
    EXPECT_FALSE(cfg.telemetry_enabled);
    EXPECT_STREQ(cfg.telemetry_endpoint, "http://localhost:9/t");
    EXPECT_EQ(cfg.telemetry_timeout_ms, 250u);
}

TEST_F(ConfigManagerTest, CommentsAndBlankLinesAccepted) {
    AuditConfig cfg{};
    EXPECT_TRUE(ConfigManager::parseLine("", cfg));
    EXPECT_TRUE(ConfigManager::parseLine("   \n", cfg));
    EXPECT_TRUE(ConfigManager::parseLine("# LOGS_DIR=/nowhere", cfg));
    EXPECT_STREQ(cfg.logs_dir, "/tmp");
}

TEST_F(ConfigManagerTest, UnknownOrMalformedLinesRejected) {
    AuditConfig cfg{};
    EXPECT_FALSE(ConfigManager::parseLine("NOT_A_KEY=1", cfg));
    EXPECT_FALSE(ConfigManager::parseLine("LOGS_DIR /missing/equals", cfg));
}

TEST_F(ConfigManagerTest, BadValuesKeepDefaults) {
    AuditConfig cfg{};
    EXPECT_TRUE(ConfigManager::parseLine("SECRET_SEVERITY=LOUD", cfg));
    EXPECT_TRUE(ConfigManager::parseLine("PARALLEL_GATES=maybe", cfg));
    EXPECT_TRUE(ConfigManager::parseLine("TELEMETRY_TIMEOUT_MS=0", cfg));
    EXPECT_TRUE(ConfigManager::parseLine("TELEMETRY_TIMEOUT_MS=999999", cfg));
    EXPECT_TRUE(ConfigManager::parseLine("TELEMETRY_TIMEOUT_MS=12ms", cfg));

    EXPECT_EQ(cfg.secret_severity, ViolationSeverity::FAIL);
    EXPECT_FALSE(cfg.parallel_gates);
    EXPECT_EQ(cfg.telemetry_timeout_ms, 1500u);
}

TEST_F(ConfigManagerTest, BadKeysAndValuesAreReportedAfterInit) {
    // === GIVEN ===
    const std::string path = writeFile("noisy.conf",
        "SECRET_SEVERITY=LOUD\n"
        "UNKNOWN_KEY=1\n"
        "TELEMETRY_TIMEOUT_MS=0\n"
        "LOG_LEVEL=DEBUG\n");

    // === WHEN ===
    ASSERT_TRUE(ConfigManager::init(path.c_str(), nullptr));

    // === THEN ===
    ASSERT_EQ(ConfigManager::diagnosticCount(), 3u);
    EXPECT_NE(std::strstr(ConfigManager::diagnostic(0), "SECRET_SEVERITY"), nullptr);
    EXPECT_NE(std::strstr(ConfigManager::diagnostic(1), ":2: ignoring unrecognized line"), nullptr)
        << ConfigManager::diagnostic(1);
    EXPECT_NE(std::strstr(ConfigManager::diagnostic(2), "TELEMETRY_TIMEOUT_MS"), nullptr);
    EXPECT_EQ(ConfigManager::diagnostic(3), nullptr);

    // Logging is not running here; the diagnostics still reach stderr
    ::testing::internal::CaptureStderr();
    ConfigManager::reportDiagnostics();
    const std::string err = ::testing::internal::GetCapturedStderr();
    EXPECT_NE(err.find("UNKNOWN_KEY"), std::string::npos) << err;
    EXPECT_NE(err.find("SECRET_SEVERITY must be FAIL or WARN, got 'LOUD'"), std::string::npos) << err;
}

TEST_F(ConfigManagerTest, CleanFileHasNoDiagnostics) {
    const std::string path = writeFile("clean.conf", "# ok\nPARALLEL_GATES=true\n");
    ASSERT_TRUE(ConfigManager::init(path.c_str(), nullptr));
    EXPECT_EQ(ConfigManager::diagnosticCount(), 0u);

    ::testing::internal::CaptureStderr();
    ConfigManager::reportDiagnostics();
    EXPECT_TRUE(::testing::internal::GetCapturedStderr().empty());
}

TEST_F(ConfigManagerTest, DiagnosticsAreCappedAndClearedOnReinit) {
    std::string content;
    for (size_t i = 0; i < ConfigManager::MAX_DIAGNOSTICS + 8; ++i) {
        content += "BOGUS_" + std::to_string(i) + "=x\n";
    }
    const std::string noisy = writeFile("many.conf", content);
    ASSERT_TRUE(ConfigManager::init(noisy.c_str(), nullptr));
    EXPECT_EQ(ConfigManager::diagnosticCount(), ConfigManager::MAX_DIAGNOSTICS);

    const std::string clean = writeFile("clean.conf", "LOG_LEVEL=INFO\n");
    ASSERT_TRUE(ConfigManager::init(clean.c_str(), nullptr));
    EXPECT_EQ(ConfigManager::diagnosticCount(), 0u);
}

TEST_F(ConfigManagerTest, ExplicitMissingFileFailsInit) {
    const std::string missing = (test_dir_ / "does_not_exist.conf").string();
    EXPECT_FALSE(ConfigManager::init(missing.c_str(), test_dir_.c_str()));
    EXPECT_FALSE(ConfigManager::isInitialized());
}

TEST_F(ConfigManagerTest, ExplicitFileLoaded) {
    const std::string path = writeFile("custom.conf",
        "# custom settings\n"
        "SECRET_SEVERITY=WARN\n"
        "PARALLEL_GATES=1\n"
        "UNKNOWN_KEY=ignored\n");

    ASSERT_TRUE(ConfigManager::init(path.c_str(), nullptr));
    ASSERT_TRUE(ConfigManager::isInitialized());

    const AuditConfig& cfg = ConfigManager::getConfig();
    EXPECT_EQ(cfg.secret_severity, ViolationSeverity::WARN);
    EXPECT_TRUE(cfg.parallel_gates);
}

TEST_F(ConfigManagerTest, ProjectFileFoundUnderRoot) {
    writeFile(ConfigManager::DEFAULT_FILE_NAME, "LOG_LEVEL=WARN\n");

    ASSERT_TRUE(ConfigManager::init(nullptr, test_dir_.c_str()));
    EXPECT_STREQ(ConfigManager::getConfig().log_level, "WARN");
}

TEST_F(ConfigManagerTest, NoFileMeansDefaults) {
    ASSERT_TRUE(ConfigManager::init(nullptr, test_dir_.c_str()));
    EXPECT_STREQ(ConfigManager::getConfig().log_level, "INFO");
    EXPECT_TRUE(ConfigManager::getConfig().is_valid);
}

TEST_F(ConfigManagerTest, EnvironmentOverridesFile) {
    writeFile(ConfigManager::DEFAULT_FILE_NAME,
        "LOGS_DIR=/from/file\n"
        "TELEMETRY_ENABLED=true\n");
    setenv("STRICTKIT_LOGS_DIR", "/from/env", 1);
    setenv("STRICTKIT_TELEMETRY", "off", 1);

    ASSERT_TRUE(ConfigManager::init(nullptr, test_dir_.c_str()));
    EXPECT_STREQ(ConfigManager::getConfig().logs_dir, "/from/env");
    EXPECT_FALSE(ConfigManager::getConfig().telemetry_enabled);
}

TEST_F(ConfigManagerTest, TelemetryOnlyDisabledByExactOff) {
    setenv("STRICTKIT_TELEMETRY", "no", 1);
    AuditConfig cfg{};
    ConfigManager::applyEnvOverrides(cfg);
    EXPECT_TRUE(cfg.telemetry_enabled);
}

TEST_F(ConfigManagerTest, OverlongValueTruncatedSafely) {
    AuditConfig cfg{};
    const std::string long_dir = "LOGS_DIR=/" + std::string(600, 'x');
    EXPECT_TRUE(ConfigManager::parseLine(long_dir.c_str(), cfg));
    EXPECT_EQ(std::strlen(cfg.logs_dir), sizeof(cfg.logs_dir) - 1);
}
