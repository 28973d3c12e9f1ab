/**
 * @file main.cpp
 * @brief CloneScan 메인 진입점
 *
 * QCoreApplication 초기화, CLI 인수 파싱, 시그널 핸들링,
 * 스캔 실행과 히스토리 기록을 수행합니다.
 *
 * CLI 옵션:
 *   --config <파일>        INI 설정 파일
 *   --threshold <값>       유사도 임계값 (0.40 ~ 0.95, 기본: 0.60)
 *   --cap <개수>           대상당 최대 후보 수 (기본: 50)
 *   --strategy <이름>      후보 생성 전략: local | oracle (기본: local)
 *   --concurrency <개수>   대상당 동시 페치 수 (기본: 4)
 *   --history <파일>       히스토리 CSV (기본: history.csv)
 *   --output <파일>        이번 결과를 CSV로 내보내기
 *   --targets-file <파일>  대상 목록 파일 (한 줄에 하나, # 주석)
 *   --show-history         히스토리 출력 (최신순) 후 종료
 *   --clear-history        히스토리 삭제 후 종료
 */

#include <QCoreApplication>
#include <QCommandLineParser>
#include <QCommandLineOption>
#include <QFile>

#include <algorithm>
#include <csignal>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "cli/scan_settings.h"
#include "core/cancellation.h"
#include "core/domain_normalizer.h"
#include "core/scan_config.h"
#include "data/finding_csv.h"
#include "data/history_store.h"
#include "network/http_client.h"
#include "network/page_fetcher.h"
#include "scan/candidate_source.h"
#include "scan/scan_orchestrator.h"

using namespace clonescan;

namespace {

// 종료 코드
constexpr int kExitOk = 0;
constexpr int kExitStoreError = 1;
constexpr int kExitUsageError = 2;

// ============================================================
// 전역 상태 (시그널 핸들러에서 접근)
// ============================================================

/// 진행 중인 스캔의 취소 토큰
core::CancellationToken* g_cancel_token = nullptr;

/**
 * @brief UNIX 시그널 핸들러
 *
 * SIGINT(Ctrl+C), SIGTERM 수신 시 진행 중인 스캔을 취소합니다.
 * 이미 계산된 Finding은 그대로 기록됩니다.
 */
void signalHandler(int /*signum*/) {
    if (g_cancel_token) {
        g_cancel_token->cancel();
    }
}

/**
 * @brief 시그널 핸들러 설치
 */
void installSignalHandlers() {
    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);
    // SIGPIPE 무시 (소켓 에러 방지)
    std::signal(SIGPIPE, SIG_IGN);
}

// ============================================================
// 출력 헬퍼
// ============================================================

void printFinding(const core::Finding& f) {
    std::cout << "  " << std::left << std::setw(32) << f.suspect_domain
              << std::fixed << std::setprecision(3) << f.similarity
              << "  " << f.url;
    if (f.dns) {
        std::cout << "  [A: " << f.dns->a.size()
                  << ", NS: " << f.dns->ns.size()
                  << ", MX: " << f.dns->mx.size() << "]";
    }
    std::cout << std::endl;
}

int showHistory(const data::HistoryStore& store) {
    auto records = store.loadAll();
    if (records.empty()) {
        std::cout << "히스토리가 비어 있습니다." << std::endl;
        return kExitOk;
    }

    data::sortNewestFirst(records);
    std::cout << "히스토리 " << records.size() << "건 (최신순)" << std::endl;
    for (const auto& record : records) {
        std::cout << "  " << record.timestamp << "  " << std::left << std::setw(24)
                  << record.target;
        printFinding(record);
    }
    return kExitOk;
}

/**
 * @brief 대상 목록 파일 읽기
 */
std::optional<std::vector<std::string>> readTargetsFile(const QString& path) {
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly | QIODevice::Text)) {
        std::cerr << "[CloneScan] 대상 목록 파일을 열 수 없습니다: "
                  << path.toStdString() << std::endl;
        return std::nullopt;
    }
    QByteArray content = file.readAll();
    auto targets = core::parseTargetList(std::string_view(content.constData(),
                                                          static_cast<size_t>(content.size())));
    if (!targets) {
        std::cerr << "[CloneScan] 잘못된 대상 (" << path.toStdString() << ":"
                  << targets.error().line << "): '" << targets.error().entry << "'"
                  << std::endl;
        return std::nullopt;
    }
    return std::move(*targets);
}

bool exportCsv(const std::string& path, const std::vector<core::Finding>& findings) {
    std::ofstream ofs(path, std::ios::binary | std::ios::trunc);
    if (!ofs) {
        return false;
    }
    data::writeFindingsCsv(ofs, findings);
    ofs.flush();
    return static_cast<bool>(ofs);
}

} // anonymous namespace


// ============================================================
// 메인 함수
// ============================================================

int main(int argc, char* argv[]) {
    // ---- Qt 애플리케이션 초기화 ----
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName("CloneScan");
    QCoreApplication::setApplicationVersion("0.3.0");

    // ---- CLI 인수 파싱 ----
    QCommandLineParser parser;
    parser.setApplicationDescription(
        "CloneScan — 유사 도메인 복제 사이트 탐지기"
    );
    parser.addHelpOption();
    parser.addVersionOption();
    parser.addPositionalArgument("targets", "대상 도메인 또는 URL", "[targets...]");

    QCommandLineOption configOption("config", "INI 설정 파일", "file");
    QCommandLineOption thresholdOption("threshold", "유사도 임계값 (0.40 ~ 0.95)", "value");
    QCommandLineOption capOption("cap", "대상당 최대 후보 수", "count");
    QCommandLineOption strategyOption("strategy", "후보 생성 전략 (local | oracle)", "name");
    QCommandLineOption concurrencyOption("concurrency", "대상당 동시 페치 수", "count");
    QCommandLineOption historyOption("history", "히스토리 CSV 경로", "file");
    QCommandLineOption outputOption("output", "이번 결과를 CSV로 내보내기", "file");
    QCommandLineOption targetsFileOption("targets-file", "대상 목록 파일 (한 줄에 하나)", "file");
    QCommandLineOption showHistoryOption("show-history", "히스토리 출력 (최신순)");
    QCommandLineOption clearHistoryOption("clear-history", "히스토리 삭제");

    parser.addOptions({configOption, thresholdOption, capOption, strategyOption,
                       concurrencyOption, historyOption, outputOption,
                       targetsFileOption, showHistoryOption, clearHistoryOption});

    parser.process(app);

    // ---- 설정 ----
    core::ScanConfig config;
    if (parser.isSet(configOption)) {
        auto loaded = cli::loadScanSettings(parser.value(configOption), config);
        if (!loaded) {
            return kExitUsageError;
        }
        config = *loaded;
    }

    bool ok = true;
    if (parser.isSet(thresholdOption)) {
        config.threshold = parser.value(thresholdOption).toDouble(&ok);
        if (!ok) {
            std::cerr << "[CloneScan] 잘못된 임계값: "
                      << parser.value(thresholdOption).toStdString() << std::endl;
            return kExitUsageError;
        }
    }
    if (parser.isSet(capOption)) {
        config.candidate_cap = parser.value(capOption).toInt(&ok);
        if (!ok) {
            std::cerr << "[CloneScan] 잘못된 후보 상한: "
                      << parser.value(capOption).toStdString() << std::endl;
            return kExitUsageError;
        }
    }
    if (parser.isSet(concurrencyOption)) {
        config.max_concurrent_fetches = parser.value(concurrencyOption).toInt(&ok);
        if (!ok) {
            std::cerr << "[CloneScan] 잘못된 동시 페치 수: "
                      << parser.value(concurrencyOption).toStdString() << std::endl;
            return kExitUsageError;
        }
    }
    if (parser.isSet(strategyOption)) {
        auto strategy = core::parseStrategy(parser.value(strategyOption).toStdString());
        if (!strategy) {
            std::cerr << "[CloneScan] 알 수 없는 전략: "
                      << parser.value(strategyOption).toStdString() << std::endl;
            return kExitUsageError;
        }
        config.strategy = *strategy;
    }
    if (parser.isSet(historyOption)) {
        config.history_path = parser.value(historyOption).toStdString();
    }
    config = config.validated();

    data::HistoryStore history(config.history_path);

    // ---- 히스토리 명령 ----
    if (parser.isSet(clearHistoryOption)) {
        auto cleared = history.clear();
        if (!cleared) {
            std::cerr << "[CloneScan] " << cleared.error().message << std::endl;
            return kExitStoreError;
        }
        std::cout << "[CloneScan] 히스토리 삭제 완료: " << config.history_path << std::endl;
        return kExitOk;
    }
    if (parser.isSet(showHistoryOption)) {
        return showHistory(history);
    }

    // ---- 대상 목록 ----
    std::vector<std::string> targets;
    if (parser.isSet(targetsFileOption)) {
        auto from_file = readTargetsFile(parser.value(targetsFileOption));
        if (!from_file) {
            return kExitUsageError;
        }
        targets = std::move(*from_file);
    }
    QString positional = parser.positionalArguments().join('\n');
    auto from_args = core::parseTargetList(positional.toStdString());
    if (!from_args) {
        std::cerr << "[CloneScan] 잘못된 대상: '" << from_args.error().entry << "'" << std::endl;
        return kExitUsageError;
    }
    for (auto& target : *from_args) {
        if (std::find(targets.begin(), targets.end(), target) == targets.end()) {
            targets.push_back(std::move(target));
        }
    }

    // ---- 시그널 핸들러 설치 ----
    core::CancellationToken cancel_token;
    g_cancel_token = &cancel_token;
    installSignalHandlers();

    // ---- 스캔 ----
    network::HttpClient::globalInit();

    scan::ScanOrchestrator orchestrator(
        config,
        scan::makeCandidateSource(config),
        std::make_shared<network::HttpPageFetcher>(config)
    );
    orchestrator.setProgressCallback([](size_t index, size_t total, const std::string& target) {
        std::cout << "[CloneScan] (" << index << "/" << total << ") " << target << std::endl;
    });

    std::cout << "[CloneScan] 임계값 " << config.threshold
              << ", 후보 상한 " << config.candidate_cap
              << ", 전략 " << core::strategyName(config.strategy) << std::endl;

    auto results = orchestrator.scanAll(targets, config.threshold, cancel_token);

    network::HttpClient::globalCleanup();
    g_cancel_token = nullptr;

    if (!results) {
        std::cerr << "[CloneScan] " << results.error().message << std::endl;
        return kExitUsageError;
    }

    // ---- 결과 출력 ----
    for (const auto& result : *results) {
        std::cout << result.target << " — " << scan::statusName(result.status)
                  << " (후보 " << result.candidates_fetched << "/"
                  << result.candidates_total << ", Finding "
                  << result.findings.size() << ")" << std::endl;
        if (!result.error_message.empty()) {
            std::cout << "  오류: " << result.error_message << std::endl;
        }
        for (const auto& finding : result.findings) {
            printFinding(finding);
        }
    }

    auto findings = scan::ScanOrchestrator::collectFindings(*results);

    int exit_code = kExitOk;

    if (parser.isSet(outputOption)) {
        std::string output_path = parser.value(outputOption).toStdString();
        if (exportCsv(output_path, findings)) {
            std::cout << "[CloneScan] CSV 내보내기 완료: " << output_path << std::endl;
        } else {
            std::cerr << "[CloneScan] CSV 내보내기 실패: " << output_path << std::endl;
            exit_code = kExitStoreError;
        }
    }

    // ---- 히스토리 기록 ----
    auto appended = history.append(findings);
    if (!appended) {
        std::cerr << "[CloneScan] 히스토리 기록 실패: " << appended.error().message << std::endl;
        return kExitStoreError;
    }

    std::cout << "[CloneScan] 완료: Finding " << findings.size() << "개" << std::endl;
    return exit_code;
}
