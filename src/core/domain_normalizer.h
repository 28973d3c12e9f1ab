#pragma once

/**
 * @file domain_normalizer.h
 * @brief 도메인/URL 정규화
 *
 * 원시 입력에서 스킴, 사용자 정보, 포트, 경로를 제거하고 소문자로 바꾼 뒤
 * 마지막 점을 기준으로 (이름, 접미사) 쌍으로 분리합니다.
 * 예외를 던지지 않으며, 잘못된 입력은 가능한 범위에서 분리합니다.
 */

#include <expected>
#include <string>
#include <string_view>
#include <vector>

namespace clonescan::core {

/**
 * @brief 정규화된 도메인
 *
 * "bank.com" → name="bank", suffix=".com"
 * "shop.bank.co" → name="shop.bank", suffix=".co"
 * "localhost" → name="localhost", suffix=""
 */
struct DomainParts {
    std::string name;
    std::string suffix;     ///< 점 포함, 라벨이 하나뿐이면 빈 문자열

    /// name + suffix
    [[nodiscard]] std::string host() const { return name + suffix; }

    bool operator==(const DomainParts&) const = default;
};

/**
 * @brief 도메인 또는 URL 정규화
 */
[[nodiscard]] DomainParts normalizeDomain(std::string_view raw);

/**
 * @brief URL에서 호스트만 추출 (소문자)
 */
[[nodiscard]] std::string extractHost(std::string_view raw);

/**
 * @brief 스캔 대상으로 쓸 수 있는 호스트인지 검사
 *
 * [a-z0-9.-] 문자만 허용하며 빈 라벨("..", 앞쪽 점)은 거부합니다.
 */
[[nodiscard]] bool isValidHost(std::string_view host);

/**
 * @brief 대상 목록의 잘못된 항목
 */
struct TargetListError {
    size_t line{0};         ///< 1부터 시작하는 줄 번호
    std::string entry;      ///< 공백 제거된 원본 항목
};

/**
 * @brief 여러 줄 대상 목록 파싱
 *
 * 줄 단위로 공백을 제거하고, 빈 줄과 '#' 주석을 건너뛰며,
 * 정규화 후 중복을 순서대로 제거합니다.
 * 유효한 호스트가 아닌 항목이 하나라도 있으면 첫 항목을 오류로 반환합니다.
 */
[[nodiscard]] std::expected<std::vector<std::string>, TargetListError> parseTargetList(
    std::string_view text
);

} // namespace clonescan::core
