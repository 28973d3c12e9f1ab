/**
 * @file similarity_scorer.cpp
 * @brief Ratcliff/Obershelp 유사도 구현
 *
 * 최장 일치 탐색은 b의 문자별 위치 색인을 사용해 같은 문자가 나오는 위치만
 * 방문합니다. 행마다 건드린 칸만 되돌려 행 버퍼를 재사용합니다.
 */

#include "similarity_scorer.h"

#include <array>
#include <cstdint>
#include <tuple>
#include <utility>
#include <vector>

namespace clonescan::scan {

namespace {

struct Match {
    size_t a_pos{0};
    size_t b_pos{0};
    size_t size{0};
};

class BlockMatcher {
public:
    BlockMatcher(std::string_view a, std::string_view b)
        : a_(a), b_(b), prev_(b.size() + 1, 0), curr_(b.size() + 1, 0) {
        for (size_t j = 0; j < b_.size(); ++j) {
            positions_[static_cast<unsigned char>(b_[j])].push_back(j);
        }
    }

    /**
     * @brief 일치 블록 길이의 합
     */
    size_t totalMatched() {
        size_t total = 0;

        // (alo, ahi, blo, bhi) 구간 스택
        std::vector<std::tuple<size_t, size_t, size_t, size_t>> ranges;
        ranges.emplace_back(0, a_.size(), 0, b_.size());

        while (!ranges.empty()) {
            auto [alo, ahi, blo, bhi] = ranges.back();
            ranges.pop_back();

            Match m = longestMatch(alo, ahi, blo, bhi);
            if (m.size == 0) continue;

            total += m.size;
            if (alo < m.a_pos && blo < m.b_pos) {
                ranges.emplace_back(alo, m.a_pos, blo, m.b_pos);
            }
            if (m.a_pos + m.size < ahi && m.b_pos + m.size < bhi) {
                ranges.emplace_back(m.a_pos + m.size, ahi, m.b_pos + m.size, bhi);
            }
        }
        return total;
    }

private:
    /**
     * @brief a[alo:ahi], b[blo:bhi] 구간의 최장 공통 부분 문자열
     *
     * 길이가 같으면 a에서 가장 먼저 시작하는 것, 그다음 b에서 먼저 시작하는 것.
     */
    Match longestMatch(size_t alo, size_t ahi, size_t blo, size_t bhi) {
        Match best{alo, blo, 0};

        for (size_t i = alo; i < ahi; ++i) {
            curr_touched_.clear();
            const auto& js = positions_[static_cast<unsigned char>(a_[i])];

            for (size_t j : js) {
                if (j < blo) continue;
                if (j >= bhi) break;

                // prev_[j]: (i-1, j-1)에서 끝나는 일치 길이
                size_t k = prev_[j] + 1;
                curr_[j + 1] = k;
                curr_touched_.push_back(j + 1);

                if (k > best.size) {
                    best = {i + 1 - k, j + 1 - k, k};
                }
            }

            for (size_t idx : prev_touched_) prev_[idx] = 0;
            std::swap(prev_, curr_);
            std::swap(prev_touched_, curr_touched_);
        }

        for (size_t idx : prev_touched_) prev_[idx] = 0;
        prev_touched_.clear();
        return best;
    }

    std::string_view a_;
    std::string_view b_;
    std::array<std::vector<size_t>, 256> positions_;
    std::vector<size_t> prev_;
    std::vector<size_t> curr_;
    std::vector<size_t> prev_touched_;
    std::vector<size_t> curr_touched_;
};

} // namespace

double SimilarityScorer::similarity(
    const std::optional<std::string>& a,
    const std::optional<std::string>& b
) {
    if (!a || !b) return 0.0;
    return ratio(*a, *b);
}

double SimilarityScorer::ratio(std::string_view a, std::string_view b) {
    if (a.empty() || b.empty()) return 0.0;
    if (a == b) return 1.0;

    size_t matched = matchedLength(a, b);
    double value = 2.0 * static_cast<double>(matched) /
                   static_cast<double>(a.size() + b.size());
    return value > 1.0 ? 1.0 : value;
}

size_t SimilarityScorer::matchedLength(std::string_view a, std::string_view b) {
    // 인자 순서와 무관한 결과를 위해 (길이, 내용) 순으로 정렬
    if (a.size() > b.size() || (a.size() == b.size() && a > b)) {
        std::swap(a, b);
    }
    if (a.empty()) return 0;

    BlockMatcher matcher(a, b);
    return matcher.totalMatched();
}

} // namespace clonescan::scan
