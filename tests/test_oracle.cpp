/**
 * @file test_oracle.cpp
 * @brief 외부 등록 확인 도구 연동 단위 테스트
 *
 * 테스트 대상:
 *   - runProcess: 표준 출력 수집, 종료 코드, 기한 초과, 실행 파일 없음
 *   - RegistrationOracleSource::parseOutput: 등록 필터, DNS 정보, 형식 오류
 *   - RegistrationOracleSource::generate: 임시 셸 스크립트로 만든 가짜 도구
 */

#include <gtest/gtest.h>

#include "core/subprocess.h"
#include "scan/candidate_source.h"
#include "scan/registration_oracle_source.h"

#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>

#include <unistd.h>

namespace fs = std::filesystem;

using namespace clonescan::core;
using namespace clonescan::scan;

namespace {

constexpr const char* kOracleOutput = R"([
  {"fuzzer": "*original", "domain": "bank.com", "registered": true,
   "dns_a": ["93.184.216.34"], "dns_ns": ["ns1.bank.com"]},
  {"fuzzer": "addition", "domain": "banka.com", "registered": true,
   "dns_a": ["203.0.113.7", "203.0.113.8"], "dns_ns": ["ns1.parking.net"], "dns_mx": ["mx.parking.net"]},
  {"fuzzer": "homoglyph", "domain": "bamk.com", "registered": false},
  {"fuzzer": "tld-swap", "domain": "bank.net"},
  {"fuzzer": "hyphenation", "domain": "ba-nk.com", "registered": true}
])";

} // namespace

// ============================================================
// runProcess 테스트
// ============================================================

class SubprocessTest : public ::testing::Test {
protected:
    fs::path dir_;

    void SetUp() override {
        auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        dir_ = fs::temp_directory_path() /
               ("clonescan_oracle_" + std::to_string(::getpid()) + "_" + info->name());
        fs::create_directories(dir_);
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(dir_, ec);
    }

    /**
     * @brief 실행 가능한 셸 스크립트 작성
     */
    std::string writeScript(const std::string& name, const std::string& body) {
        fs::path path = dir_ / name;
        {
            std::ofstream ofs(path);
            ofs << "#!/bin/sh\n" << body << "\n";
        }
        fs::permissions(path, fs::perms::owner_all, fs::perm_options::replace);
        return path.string();
    }
};

// 1. 표준 출력과 종료 코드 수집
TEST_F(SubprocessTest, CapturesStdoutAndExitCode) {
    auto script = writeScript("echo.sh", "echo \"$@\"\nexit 0");

    auto result = runProcess({script, "--registered", "--json", "bank.com"},
                             std::chrono::seconds{5});
    EXPECT_TRUE(result.started);
    EXPECT_FALSE(result.timed_out);
    EXPECT_EQ(result.exit_code, 0);
    EXPECT_TRUE(result.ok());
    EXPECT_EQ(result.stdout_data, "--registered --json bank.com\n");
}

// 2. 0이 아닌 종료 코드
TEST_F(SubprocessTest, ReportsNonZeroExit) {
    auto script = writeScript("fail.sh", "echo '[]'\nexit 3");

    auto result = runProcess({script}, std::chrono::seconds{5});
    EXPECT_TRUE(result.started);
    EXPECT_EQ(result.exit_code, 3);
    EXPECT_FALSE(result.ok());
}

// 3. 기한 초과 시 종료 후 timed_out
TEST_F(SubprocessTest, KillsOnTimeout) {
    auto script = writeScript("slow.sh", "sleep 10");

    auto start = std::chrono::steady_clock::now();
    auto result = runProcess({script}, std::chrono::milliseconds{500});
    auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_TRUE(result.timed_out);
    EXPECT_FALSE(result.ok());
    EXPECT_LT(elapsed, std::chrono::seconds{5})
        << "기한을 넘긴 프로세스는 즉시 종료되어야 합니다";
}

// 4. 실행 파일 없음
TEST_F(SubprocessTest, MissingBinaryIsNotStarted) {
    auto result = runProcess({(dir_ / "no-such-tool").string()}, std::chrono::seconds{2});
    EXPECT_FALSE(result.started);
    EXPECT_FALSE(result.ok());
    EXPECT_FALSE(result.error_message.empty());
}

// ============================================================
// RegistrationOracleSource 파싱 테스트
// ============================================================

// 5. 등록된 레코드만, 대상 자신 제외, DNS 정보 유지
TEST(OracleParseTest, KeepsRegisteredRecords) {
    auto parsed = RegistrationOracleSource::parseOutput(kOracleOutput, "bank.com", 50);
    ASSERT_TRUE(parsed.has_value());
    ASSERT_EQ(parsed->size(), 2u);

    const auto& first = (*parsed)[0];
    EXPECT_EQ(first.domain, "banka.com");
    EXPECT_EQ(first.rule, "addition");
    ASSERT_TRUE(first.dns.has_value());
    EXPECT_EQ(first.dns->a, (std::vector<std::string>{"203.0.113.7", "203.0.113.8"}));
    EXPECT_EQ(first.dns->ns, (std::vector<std::string>{"ns1.parking.net"}));
    EXPECT_EQ(first.dns->mx, (std::vector<std::string>{"mx.parking.net"}));

    const auto& second = (*parsed)[1];
    EXPECT_EQ(second.domain, "ba-nk.com");
    ASSERT_TRUE(second.dns.has_value());
    EXPECT_TRUE(second.dns->empty()) << "DNS 필드가 없으면 빈 목록이어야 합니다";
}

// 6. 상한 적용
TEST(OracleParseTest, AppliesCap) {
    auto parsed = RegistrationOracleSource::parseOutput(kOracleOutput, "bank.com", 1);
    ASSERT_TRUE(parsed.has_value());
    ASSERT_EQ(parsed->size(), 1u);
    EXPECT_EQ(parsed->front().domain, "banka.com");
}

// 7. 형식 오류 → std::nullopt
TEST(OracleParseTest, RejectsMalformedOutput) {
    EXPECT_FALSE(RegistrationOracleSource::parseOutput("not json", "bank.com", 50));
    EXPECT_FALSE(RegistrationOracleSource::parseOutput("{\"domain\": \"x.com\"}", "bank.com", 50))
        << "최상위가 배열이 아니면 형식 오류입니다";
    EXPECT_FALSE(RegistrationOracleSource::parseOutput("[{\"registered\": true}]", "bank.com", 50))
        << "domain이 없으면 형식 오류입니다";
    EXPECT_FALSE(RegistrationOracleSource::parseOutput(
        "[{\"domain\": \"x.com\", \"registered\": true, \"dns_a\": \"1.2.3.4\"}]", "bank.com", 50))
        << "dns_a가 배열이 아니면 형식 오류입니다";
    EXPECT_FALSE(RegistrationOracleSource::parseOutput(
        "[{\"domain\": \"x.com\", \"registered\": \"yes\"}]", "bank.com", 50));
    EXPECT_FALSE(RegistrationOracleSource::parseOutput("", "bank.com", 50));
}

// 8. 빈 배열 → 빈 목록 (오류 아님)
TEST(OracleParseTest, EmptyArrayIsEmptySet) {
    auto parsed = RegistrationOracleSource::parseOutput("[]", "bank.com", 50);
    ASSERT_TRUE(parsed.has_value());
    EXPECT_TRUE(parsed->empty());
}

// ============================================================
// RegistrationOracleSource 실행 테스트
// ============================================================

// 9. 명령줄 구성
TEST(OracleSourceTest, BuildsCommandLine) {
    RegistrationOracleSource source("dnstwist", std::chrono::seconds{30}, 50);
    EXPECT_EQ(source.commandLine("bank.com"),
              (std::vector<std::string>{"dnstwist", "--registered", "--json", "bank.com"}));
}

// 10. 가짜 도구의 정상 출력
TEST_F(SubprocessTest, OracleSourceUsesToolOutput) {
    auto script = writeScript("oracle.sh",
        std::string("cat <<'EOF'\n") + kOracleOutput + "\nEOF");

    RegistrationOracleSource source(script, std::chrono::seconds{5}, 50);
    auto candidates = source.generate("https://Bank.com/login");

    ASSERT_EQ(candidates.size(), 2u);
    EXPECT_EQ(candidates[0].domain, "banka.com");
    EXPECT_EQ(candidates[1].domain, "ba-nk.com");
}

// 11. 도구 실패 (없음, 기한 초과, 비정상 종료, 형식 오류) → 빈 후보, 예외 없음
TEST_F(SubprocessTest, OracleFailuresYieldEmptySet) {
    RegistrationOracleSource missing((dir_ / "dnstwist").string(), std::chrono::seconds{2}, 50);
    EXPECT_TRUE(missing.generate("bank.com").empty());

    RegistrationOracleSource slow(writeScript("slow.sh", "sleep 10"), std::chrono::seconds{1}, 50);
    EXPECT_TRUE(slow.generate("bank.com").empty());

    RegistrationOracleSource failing(
        writeScript("fail.sh", std::string("cat <<'EOF'\n") + kOracleOutput + "\nEOF\nexit 1"),
        std::chrono::seconds{5}, 50);
    EXPECT_TRUE(failing.generate("bank.com").empty())
        << "비정상 종료 시 출력은 무시되어야 합니다";

    RegistrationOracleSource garbage(writeScript("garbage.sh", "echo 'Traceback: oops'"),
                                     std::chrono::seconds{5}, 50);
    EXPECT_TRUE(garbage.generate("bank.com").empty());
}

// 12. 전략에 따른 생성기 선택
TEST(OracleSourceTest, FactorySelectsStrategy) {
    ScanConfig config;
    config.strategy = CandidateStrategy::RegistrationOracle;
    auto oracle = makeCandidateSource(config);
    EXPECT_EQ(oracle->name(), "RegistrationOracle");

    config.strategy = CandidateStrategy::LocalPermutation;
    auto local = makeCandidateSource(config);
    EXPECT_EQ(local->name(), "LocalPermutation");
}
