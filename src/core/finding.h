#pragma once

/**
 * @file finding.h
 * @brief 스캔 결과 데이터 모델
 *
 * 후보 도메인, DNS 메타데이터, 탐지 결과(Finding)를 정의합니다.
 * 히스토리 저장소는 Finding을 그대로 HistoryRecord로 보존합니다.
 */

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace clonescan::core {

/**
 * @brief 오라클 도구가 보고한 DNS 레코드 목록
 */
struct DnsMetadata {
    std::vector<std::string> a;     ///< A 레코드 (IPv4)
    std::vector<std::string> ns;    ///< NS 레코드
    std::vector<std::string> mx;    ///< MX 레코드

    [[nodiscard]] bool empty() const {
        return a.empty() && ns.empty() && mx.empty();
    }

    bool operator==(const DnsMetadata&) const = default;
};

/**
 * @brief 생성된 후보 도메인
 */
struct CandidateDomain {
    std::string domain;                 ///< 정규화된 도메인 (대상 도메인과 달라야 함)
    std::string rule;                   ///< 생성 규칙 이름 (prefix, tld-swap, 오라클 fuzzer 등)
    std::optional<DnsMetadata> dns;     ///< 오라클 전략일 때만 존재
};

/// Finding 기본 비고
inline constexpr const char* kDefaultFindingNote = "HTML-similar (simple text ratio)";

/**
 * @brief 임계값 이상으로 유사한 후보 도메인 탐지 결과
 *
 * 생성 후에는 변경하지 않습니다.
 */
struct Finding {
    int64_t timestamp{0};               ///< 평가 시각 (epoch 초)
    std::string target;                 ///< 보호 대상 도메인
    std::string suspect_domain;         ///< 의심 도메인
    double similarity{0.0};             ///< 유사도 (소수점 3자리 반올림)
    std::string url;                    ///< 페이지를 제공한 URL
    std::optional<DnsMetadata> dns;     ///< DNS 메타데이터 (오라클 전략)
    std::string notes{kDefaultFindingNote};

    bool operator==(const Finding&) const = default;
};

/// 히스토리에 보존된 Finding
using HistoryRecord = Finding;

} // namespace clonescan::core
