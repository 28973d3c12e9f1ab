/**
 * @file test_settings.cpp
 * @brief INI 설정 로드 단위 테스트 (Qt6 Core 빌드에서만)
 */

#include <gtest/gtest.h>

#include "cli/scan_settings.h"

#include <filesystem>
#include <fstream>

#include <unistd.h>

namespace fs = std::filesystem;

using namespace clonescan::core;
using namespace clonescan::cli;

class ScanSettingsTest : public ::testing::Test {
protected:
    fs::path dir_;

    void SetUp() override {
        auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        dir_ = fs::temp_directory_path() /
               ("clonescan_settings_" + std::to_string(::getpid()) + "_" + info->name());
        fs::create_directories(dir_);
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(dir_, ec);
    }

    QString writeIni(const std::string& content) {
        fs::path path = dir_ / "clonescan.ini";
        std::ofstream ofs(path);
        ofs << content;
        return QString::fromStdString(path.string());
    }
};

// 1. [scan], [oracle] 그룹의 값 적용
TEST_F(ScanSettingsTest, LoadsAllKeys) {
    auto path = writeIni(
        "[scan]\n"
        "threshold=0.8\n"
        "cap=20\n"
        "connect_timeout=5\n"
        "read_timeout=7\n"
        "concurrency=2\n"
        "max_body_bytes=262144\n"
        "strategy=oracle\n"
        "history=/tmp/clonescan-history.csv\n"
        "\n"
        "[oracle]\n"
        "binary=/usr/local/bin/dnstwist\n"
        "timeout=45\n");

    auto config = loadScanSettings(path);
    ASSERT_TRUE(config.has_value());
    EXPECT_DOUBLE_EQ(config->threshold, 0.8);
    EXPECT_EQ(config->candidate_cap, 20);
    EXPECT_EQ(config->connect_timeout.count(), 5);
    EXPECT_EQ(config->read_timeout.count(), 7);
    EXPECT_EQ(config->max_concurrent_fetches, 2);
    EXPECT_EQ(config->max_body_bytes, 262144u);
    EXPECT_EQ(config->strategy, CandidateStrategy::RegistrationOracle);
    EXPECT_EQ(config->history_path, "/tmp/clonescan-history.csv");
    EXPECT_EQ(config->oracle_binary, "/usr/local/bin/dnstwist");
    EXPECT_EQ(config->oracle_timeout.count(), 45);
}

// 2. 없는 키는 기본값, 범위 밖 값은 보정
TEST_F(ScanSettingsTest, KeepsDefaultsAndClamps) {
    auto path = writeIni(
        "[scan]\n"
        "threshold=0.2\n"
        "strategy=whois\n");

    auto config = loadScanSettings(path);
    ASSERT_TRUE(config.has_value());
    EXPECT_DOUBLE_EQ(config->threshold, ScanConfig::kMinThreshold)
        << "임계값은 하한으로 보정되어야 합니다";
    EXPECT_EQ(config->strategy, CandidateStrategy::LocalPermutation)
        << "알 수 없는 전략은 기본값을 유지해야 합니다";
    EXPECT_EQ(config->candidate_cap, 50);
    EXPECT_EQ(config->oracle_binary, "dnstwist");
}

// 3. 없는 파일 → std::nullopt
TEST_F(ScanSettingsTest, MissingFileFails) {
    auto path = QString::fromStdString((dir_ / "absent.ini").string());
    EXPECT_FALSE(loadScanSettings(path).has_value());
}
