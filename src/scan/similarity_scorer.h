#pragma once

/**
 * @file similarity_scorer.h
 * @brief 페이지 텍스트 유사도 (Ratcliff/Obershelp)
 *
 * ratio = 2·M / (len(a) + len(b))
 * M은 가장 긴 공통 부분 문자열을 찾고 그 좌/우 나머지 구간에서 같은 과정을
 * 반복해 얻은 일치 블록 길이의 합입니다.
 *
 * 리터럴 텍스트만 비교하므로 공통 보일러플레이트(메뉴, 광고)나 의도적으로
 * 삽입한 잡음 텍스트에 영향을 받습니다.
 */

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace clonescan::scan {

class SimilarityScorer {
public:
    /**
     * @brief 두 페이지 텍스트의 유사도
     * @return [0, 1], 어느 한쪽이 없거나 비어 있으면 0
     */
    [[nodiscard]] static double similarity(
        const std::optional<std::string>& a,
        const std::optional<std::string>& b
    );

    /**
     * @brief 두 문자열의 유사도 (대칭)
     */
    [[nodiscard]] static double ratio(std::string_view a, std::string_view b);

    /**
     * @brief 일치 블록 길이의 합 M (대칭)
     */
    [[nodiscard]] static size_t matchedLength(std::string_view a, std::string_view b);
};

} // namespace clonescan::scan
