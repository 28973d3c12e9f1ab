#pragma once

/**
 * @file scan_orchestrator.h
 * @brief 대상별 스캔 파이프라인
 *
 * 대상 하나에 대해 다음 단계를 진행합니다.
 *   FetchCanonical → GenerateCandidates → ScoreCandidates → Filter → Done
 * 정식 페이지를 가져오지 못하면(NoCanonical) 후보를 시도하지 않고,
 * 후보가 없으면(NoCandidates) 빈 결과를 반환합니다.
 *
 * 후보 페치는 설정된 동시 실행 수 이하의 워커 스레드가 나눠 처리하며,
 * 결과는 후보 생성 순서를 유지합니다.
 */

#include "candidate_source.h"
#include "core/cancellation.h"
#include "core/finding.h"
#include "core/scan_config.h"
#include "network/page_fetcher.h"

#include <cstddef>
#include <expected>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace clonescan::scan {

/**
 * @brief 대상 스캔 종료 상태
 */
enum class ScanStatus {
    Completed,      ///< 모든 후보 평가 완료
    NoCanonical,    ///< 정식 페이지 수집 실패 (후보 미시도)
    NoCandidates,   ///< 생성된 후보 없음
    Cancelled,      ///< 취소됨 (이미 계산된 Finding은 유효)
    Failed          ///< 잘못된 대상 또는 내부 오류
};

/**
 * @brief 대상 하나의 스캔 결과
 */
struct TargetScanResult {
    std::string target;
    ScanStatus status{ScanStatus::Completed};
    std::vector<core::Finding> findings;    ///< 후보 생성 순서
    size_t candidates_total{0};             ///< 생성된 후보 수
    size_t candidates_fetched{0};           ///< 페이지를 얻은 후보 수
    std::string error_message;
};

/**
 * @brief 스캔 시작 전 입력 오류
 */
struct ScanError {
    std::string message;
};

/// 진행률 콜백: (현재 대상 인덱스 1부터, 전체 대상 수, 대상)
using TargetProgressCallback = std::function<void(size_t, size_t, const std::string&)>;

class ScanOrchestrator {
public:
    /**
     * @param config 스캔 설정 (validated() 적용됨)
     * @param source 후보 생성기
     * @param fetcher 페이지 수집기 (여러 스레드에서 동시에 호출됨)
     */
    ScanOrchestrator(
        const core::ScanConfig& config,
        std::shared_ptr<CandidateSource> source,
        std::shared_ptr<network::PageFetcher> fetcher
    );

    /**
     * @brief 대상 하나 스캔
     * @param target 대상 도메인 또는 URL
     * @param threshold 유사도 임계값 (이상이면 Finding)
     * @param token 취소 토큰
     */
    [[nodiscard]] TargetScanResult scan(
        const std::string& target,
        double threshold,
        const core::CancellationToken& token = {}
    );

    /**
     * @brief 여러 대상 스캔
     *
     * 빈 목록이나 유효한 호스트가 아닌 대상이 있으면 스캔을 시작하지 않고 ScanError.
     * 대상끼리는 독립적이며, 한 대상의 실패가 다른 대상을 중단시키지 않습니다.
     */
    [[nodiscard]] std::expected<std::vector<TargetScanResult>, ScanError> scanAll(
        const std::vector<std::string>& targets,
        double threshold,
        const core::CancellationToken& token = {}
    );

    /**
     * @brief 진행률 콜백 설정
     */
    void setProgressCallback(TargetProgressCallback callback);

    /**
     * @brief 결과 목록의 Finding을 순서대로 합침
     */
    [[nodiscard]] static std::vector<core::Finding> collectFindings(
        const std::vector<TargetScanResult>& results
    );

    [[nodiscard]] const core::ScanConfig& config() const { return config_; }

private:
    core::ScanConfig config_;
    std::shared_ptr<CandidateSource> source_;
    std::shared_ptr<network::PageFetcher> fetcher_;
    TargetProgressCallback progress_callback_;

    /**
     * @brief 후보 하나 평가 (페이지 없음/임계값 미달이면 std::nullopt)
     * @param fetched 페이지를 얻었으면 true로 설정
     */
    std::optional<core::Finding> evaluateCandidate(
        const std::string& target,
        const std::string& canonical_text,
        const core::CandidateDomain& candidate,
        double threshold,
        const core::CancellationToken& token,
        bool& fetched
    );
};

/**
 * @brief 상태 → 문자열 (로그용)
 */
[[nodiscard]] const char* statusName(ScanStatus status);

} // namespace clonescan::scan
