#pragma once

/**
 * @file local_permutation_source.h
 * @brief 규칙 기반 후보 도메인 생성기
 *
 * 등록 여부를 확인하지 않는 결정적 생성기입니다.
 *   1. 접두어 (하이픈 유무)          loginbank.com, login-bank.com
 *   2. 접미어 (하이픈 유무)          banksecure.com, bank-secure.com
 *   3. 서브도메인 라벨               secure.bank.com
 *   4. 최상위 접미사 교체            bank.net, bank.co
 *   5. 로그인/보안 조합형            secure-login-bank.com
 */

#include "candidate_source.h"

namespace clonescan::scan {

class LocalPermutationSource : public CandidateSource {
public:
    /**
     * @param cap 최대 후보 수 (1 미만이면 1)
     */
    explicit LocalPermutationSource(int cap);

    [[nodiscard]] std::vector<core::CandidateDomain> generate(
        const std::string& target
    ) override;

    [[nodiscard]] std::string name() const override { return "LocalPermutation"; }

    [[nodiscard]] int cap() const { return cap_; }

private:
    int cap_;
};

} // namespace clonescan::scan
