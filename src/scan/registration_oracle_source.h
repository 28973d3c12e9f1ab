#pragma once

/**
 * @file registration_oracle_source.h
 * @brief 외부 등록 확인 도구 기반 후보 생성기
 *
 * dnstwist 같은 도메인 순열 + DNS 등록 확인 도구를 하위 프로세스로 실행하고
 * JSON 출력에서 registered=true 인 레코드만 후보로 사용합니다.
 * 도구 누락, 타임아웃, 비정상 종료, 잘못된 출력은 모두 빈 목록입니다.
 */

#include "candidate_source.h"

#include <chrono>
#include <optional>
#include <string_view>

namespace clonescan::scan {

class RegistrationOracleSource : public CandidateSource {
public:
    /**
     * @param binary 오라클 실행 파일 (PATH 검색)
     * @param timeout 실행 기한
     * @param cap 최대 후보 수
     */
    RegistrationOracleSource(std::string binary, std::chrono::seconds timeout, int cap);

    [[nodiscard]] std::vector<core::CandidateDomain> generate(
        const std::string& target
    ) override;

    [[nodiscard]] std::string name() const override { return "RegistrationOracle"; }

    /**
     * @brief 오라클 명령줄 구성
     */
    [[nodiscard]] std::vector<std::string> commandLine(const std::string& host) const;

    /**
     * @brief 오라클 JSON 출력 파싱
     *
     * 최상위가 배열이 아니거나 레코드 형식이 어긋나면 std::nullopt.
     * 대상 자신, 중복, 미등록 레코드는 건너뜁니다.
     * @param json 도구 표준 출력
     * @param target 정규화된 대상 호스트
     * @param cap 최대 후보 수
     */
    [[nodiscard]] static std::optional<std::vector<core::CandidateDomain>> parseOutput(
        std::string_view json,
        const std::string& target,
        size_t cap
    );

private:
    std::string binary_;
    std::chrono::seconds timeout_;
    int cap_;
};

} // namespace clonescan::scan
