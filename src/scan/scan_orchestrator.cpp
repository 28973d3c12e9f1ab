/**
 * @file scan_orchestrator.cpp
 * @brief 대상별 스캔 파이프라인 구현
 */

#include "scan_orchestrator.h"
#include "similarity_scorer.h"
#include "core/domain_normalizer.h"
#include "core/worker_group.h"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cmath>
#include <cstdint>
#include <iostream>
#include <system_error>
#include <unordered_set>

namespace clonescan::scan {

namespace {

int64_t nowSeconds() {
    return std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

double roundTo3(double value) {
    return std::round(value * 1000.0) / 1000.0;
}

} // namespace

const char* statusName(ScanStatus status) {
    switch (status) {
        case ScanStatus::Completed:    return "completed";
        case ScanStatus::NoCanonical:  return "no-canonical";
        case ScanStatus::NoCandidates: return "no-candidates";
        case ScanStatus::Cancelled:    return "cancelled";
        case ScanStatus::Failed:       return "failed";
    }
    return "unknown";
}

// ============================================================
// 생성자 / 설정
// ============================================================

ScanOrchestrator::ScanOrchestrator(
    const core::ScanConfig& config,
    std::shared_ptr<CandidateSource> source,
    std::shared_ptr<network::PageFetcher> fetcher
)
    : config_(config.validated()),
      source_(std::move(source)),
      fetcher_(std::move(fetcher)) {}

void ScanOrchestrator::setProgressCallback(TargetProgressCallback callback) {
    progress_callback_ = std::move(callback);
}

// ============================================================
// 대상 하나 스캔
// ============================================================

TargetScanResult ScanOrchestrator::scan(
    const std::string& target,
    double threshold,
    const core::CancellationToken& token
) {
    TargetScanResult result;
    result.target = core::normalizeDomain(target).host();

    if (result.target.empty()) {
        result.status = ScanStatus::Failed;
        result.error_message = "대상 도메인을 해석할 수 없습니다: '" + target + "'";
        return result;
    }

    // 1. FetchCanonical
    auto canonical = fetcher_->fetchWithFallback(result.target, token);
    if (token.isCancelled()) {
        result.status = ScanStatus::Cancelled;
        return result;
    }
    if (!canonical) {
        std::cout << "[ScanOrchestrator] " << result.target
                  << ": 정식 페이지를 가져오지 못했습니다 — 후보 평가 생략" << std::endl;
        result.status = ScanStatus::NoCanonical;
        return result;
    }

    // 2. GenerateCandidates (대상 자신 제외, 상한 적용)
    std::vector<core::CandidateDomain> candidates;
    {
        auto generated = source_->generate(result.target);
        std::unordered_set<std::string> seen{result.target};
        for (auto& candidate : generated) {
            if (candidates.size() >= static_cast<size_t>(config_.candidate_cap)) break;
            if (candidate.domain.empty() || !seen.insert(candidate.domain).second) continue;
            candidates.push_back(std::move(candidate));
        }
    }
    result.candidates_total = candidates.size();

    if (candidates.empty()) {
        std::cout << "[ScanOrchestrator] " << result.target
                  << ": 후보 없음 (" << source_->name() << ")" << std::endl;
        result.status = ScanStatus::NoCandidates;
        return result;
    }

    std::cout << "[ScanOrchestrator] " << result.target << ": 후보 "
              << candidates.size() << "개 평가 시작 (" << source_->name() << ")" << std::endl;

    // 3~4. ScoreCandidates + Filter: 후보별 슬롯에 기록하여 생성 순서 유지
    const size_t count = candidates.size();
    std::vector<std::optional<core::Finding>> slots(count);
    std::vector<uint8_t> fetched_flags(count, 0);
    std::atomic<size_t> next_index{0};

    auto worker = [&]() {
        while (!token.isCancelled()) {
            size_t index = next_index.fetch_add(1);
            if (index >= count) break;

            bool fetched = false;
            try {
                slots[index] = evaluateCandidate(result.target, canonical->text,
                                                 candidates[index], threshold, token, fetched);
            } catch (const std::exception& e) {
                std::cerr << "[ScanOrchestrator] 후보 평가 오류 ("
                          << candidates[index].domain << "): " << e.what() << std::endl;
            }
            fetched_flags[index] = fetched ? 1 : 0;
        }
    };

    const size_t num_workers = std::min(count, static_cast<size_t>(config_.max_concurrent_fetches));
    if (num_workers <= 1) {
        worker();
    } else {
        core::WorkerGroup workers;
        try {
            for (size_t i = 0; i < num_workers; ++i) {
                workers.spawn(worker);
            }
        } catch (const std::system_error& e) {
            // 시작된 워커만으로 계속 (하나도 없으면 현재 스레드에서 처리)
            std::cerr << "[ScanOrchestrator] 워커 스레드 생성 실패 ("
                      << workers.size() << "/" << num_workers << "): " << e.what() << std::endl;
            if (workers.size() == 0) {
                worker();
            }
        }
        workers.joinAll();
    }

    // 5. Done
    for (size_t i = 0; i < count; ++i) {
        if (fetched_flags[i]) ++result.candidates_fetched;
        if (slots[i]) result.findings.push_back(std::move(*slots[i]));
    }

    result.status = token.isCancelled() ? ScanStatus::Cancelled : ScanStatus::Completed;

    std::cout << "[ScanOrchestrator] " << result.target << ": "
              << result.candidates_fetched << "/" << count << " 후보 페이지 수집, "
              << "Finding " << result.findings.size() << "개 ("
              << statusName(result.status) << ")" << std::endl;
    return result;
}

std::optional<core::Finding> ScanOrchestrator::evaluateCandidate(
    const std::string& target,
    const std::string& canonical_text,
    const core::CandidateDomain& candidate,
    double threshold,
    const core::CancellationToken& token,
    bool& fetched
) {
    fetched = false;

    auto page = fetcher_->fetchWithFallback(candidate.domain, token);
    if (!page) {
        return std::nullopt;
    }
    fetched = true;

    double score = SimilarityScorer::ratio(canonical_text, page->text);
    if (score < threshold) {
        return std::nullopt;
    }

    core::Finding finding;
    finding.timestamp = nowSeconds();
    finding.target = target;
    finding.suspect_domain = candidate.domain;
    finding.similarity = roundTo3(score);
    finding.url = page->url;
    if (candidate.dns && !candidate.dns->empty()) {
        finding.dns = candidate.dns;
    }
    return finding;
}

// ============================================================
// 여러 대상 스캔
// ============================================================

std::expected<std::vector<TargetScanResult>, ScanError> ScanOrchestrator::scanAll(
    const std::vector<std::string>& targets,
    double threshold,
    const core::CancellationToken& token
) {
    if (targets.empty()) {
        return std::unexpected(ScanError{"최소 한 개의 대상 도메인을 입력하세요."});
    }
    for (const auto& target : targets) {
        if (!core::isValidHost(core::normalizeDomain(target).host())) {
            return std::unexpected(ScanError{"잘못된 대상 도메인: '" + target + "'"});
        }
    }

    std::vector<TargetScanResult> results;
    results.reserve(targets.size());

    for (size_t i = 0; i < targets.size(); ++i) {
        if (progress_callback_) {
            progress_callback_(i + 1, targets.size(), targets[i]);
        }

        if (token.isCancelled()) {
            TargetScanResult skipped;
            skipped.target = core::normalizeDomain(targets[i]).host();
            skipped.status = ScanStatus::Cancelled;
            results.push_back(std::move(skipped));
            continue;
        }

        try {
            results.push_back(scan(targets[i], threshold, token));
        } catch (const std::exception& e) {
            std::cerr << "[ScanOrchestrator] " << targets[i] << " 스캔 실패: "
                      << e.what() << std::endl;
            TargetScanResult failed;
            failed.target = core::normalizeDomain(targets[i]).host();
            failed.status = ScanStatus::Failed;
            failed.error_message = e.what();
            results.push_back(std::move(failed));
        }
    }

    return results;
}

std::vector<core::Finding> ScanOrchestrator::collectFindings(
    const std::vector<TargetScanResult>& results
) {
    std::vector<core::Finding> all;
    for (const auto& result : results) {
        all.insert(all.end(), result.findings.begin(), result.findings.end());
    }
    return all;
}

} // namespace clonescan::scan
