#pragma once

/**
 * @file scan_config.h
 * @brief 스캔 설정 구조체
 *
 * 임계값, 후보 상한, 타임아웃, 후보 생성 전략을 한 곳에 모읍니다.
 * 오케스트레이터에 값으로 전달되며 전역 상태를 두지 않습니다.
 */

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace clonescan::core {

/**
 * @brief 후보 도메인 생성 전략
 */
enum class CandidateStrategy {
    LocalPermutation,   ///< 규칙 기반 로컬 생성 (등록 여부 확인 없음)
    RegistrationOracle  ///< 외부 도구(dnstwist) 위임, 등록 도메인만
};

/**
 * @brief 스캔 설정
 */
struct ScanConfig {
    static constexpr double kMinThreshold = 0.40;
    static constexpr double kMaxThreshold = 0.95;
    static constexpr size_t kDefaultMaxBodyBytes = 1024 * 1024;

    double threshold{0.60};                         ///< 유사도 임계값
    int candidate_cap{50};                          ///< 스캔당 최대 후보 수
    std::chrono::seconds connect_timeout{10};       ///< 연결 수립 타임아웃
    std::chrono::seconds read_timeout{10};          ///< 전송(읽기) 타임아웃
    int max_concurrent_fetches{4};                  ///< 대상당 동시 페치 수
    size_t max_body_bytes{kDefaultMaxBodyBytes};    ///< 페이지 본문 크기 상한

    CandidateStrategy strategy{CandidateStrategy::LocalPermutation};
    std::string oracle_binary{"dnstwist"};          ///< 오라클 실행 파일
    std::chrono::seconds oracle_timeout{30};        ///< 오라클 실행 타임아웃

    std::string user_agent{"CloneScanner/0.3 (+msp)"};
    std::string history_path{"history.csv"};

    /**
     * @brief 범위를 벗어난 값을 보정한 사본
     *
     * 임계값은 [0.40, 0.95], 상한/동시성은 최소 1, 타임아웃은 최소 1초.
     * 본문 상한 0은 기본값(1 MiB)으로 바꿉니다.
     */
    [[nodiscard]] ScanConfig validated() const;
};

/**
 * @brief 전략 이름 ("local" / "oracle") 파싱
 */
[[nodiscard]] std::optional<CandidateStrategy> parseStrategy(std::string_view name);

/**
 * @brief 전략 → 이름
 */
[[nodiscard]] std::string_view strategyName(CandidateStrategy strategy);

} // namespace clonescan::core
