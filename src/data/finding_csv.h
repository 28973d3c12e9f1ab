#pragma once

/**
 * @file finding_csv.h
 * @brief Finding ↔ CSV 변환
 *
 * 열 구성: timestamp,target,suspect_domain,similarity,url,ip,ns,mx,notes
 * DNS 목록은 ", "로 연결하며, 쉼표/따옴표/줄바꿈을 포함한 필드는
 * 큰따옴표로 감쌉니다 (RFC 4180).
 */

#include "core/finding.h"

#include <array>
#include <iosfwd>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace clonescan::data {

/// 히스토리/내보내기 CSV 열 이름
inline constexpr std::array<std::string_view, 9> kFindingColumns = {
    "timestamp", "target", "suspect_domain", "similarity",
    "url", "ip", "ns", "mx", "notes"
};

/**
 * @brief CSV 헤더 줄 (줄바꿈 제외)
 */
[[nodiscard]] std::string findingCsvHeader();

/**
 * @brief Finding 한 행 (줄바꿈 제외)
 */
[[nodiscard]] std::string encodeFindingRow(const core::Finding& finding);

/**
 * @brief 헤더 + 모든 행 출력
 */
void writeFindingsCsv(std::ostream& out, const std::vector<core::Finding>& findings);

/**
 * @brief CSV 문서 파싱
 *
 * 헤더가 다르거나, 열 수가 맞지 않거나, 숫자 필드를 읽을 수 없으면 std::nullopt.
 * 빈 문서는 빈 목록입니다.
 */
[[nodiscard]] std::optional<std::vector<core::Finding>> parseFindingsCsv(std::string_view text);

/**
 * @brief 필드 하나를 CSV 규칙에 맞게 인용
 */
[[nodiscard]] std::string quoteCsvField(std::string_view field);

} // namespace clonescan::data
