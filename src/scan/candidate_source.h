#pragma once

/**
 * @file candidate_source.h
 * @brief 후보 도메인 생성기 인터페이스
 *
 * 로컬 순열 생성과 외부 등록 확인 도구(오라클)를 같은 계약으로 다룹니다.
 * 호출자는 설정으로 구현을 고르며 구체 타입에 따라 분기하지 않습니다.
 */

#include "core/finding.h"
#include "core/scan_config.h"

#include <memory>
#include <string>
#include <vector>

namespace clonescan::scan {

/**
 * @brief 후보 도메인 생성기
 */
class CandidateSource {
public:
    virtual ~CandidateSource() = default;

    /**
     * @brief 대상 도메인의 후보 생성
     * @param target 대상 도메인 (정규화 전 입력도 허용)
     * @return 중복 없는 후보 목록 (대상 자신은 포함하지 않음, 실패 시 빈 목록)
     */
    [[nodiscard]] virtual std::vector<core::CandidateDomain> generate(
        const std::string& target
    ) = 0;

    /**
     * @brief 생성기 이름 (로그용)
     */
    [[nodiscard]] virtual std::string name() const = 0;
};

/**
 * @brief 설정에 따른 생성기 생성
 */
[[nodiscard]] std::unique_ptr<CandidateSource> makeCandidateSource(
    const core::ScanConfig& config
);

} // namespace clonescan::scan
