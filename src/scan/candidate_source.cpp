/**
 * @file candidate_source.cpp
 * @brief 후보 생성기 팩토리
 */

#include "candidate_source.h"
#include "local_permutation_source.h"
#include "registration_oracle_source.h"

namespace clonescan::scan {

std::unique_ptr<CandidateSource> makeCandidateSource(const core::ScanConfig& config) {
    switch (config.strategy) {
        case core::CandidateStrategy::RegistrationOracle:
            return std::make_unique<RegistrationOracleSource>(
                config.oracle_binary, config.oracle_timeout, config.candidate_cap);
        case core::CandidateStrategy::LocalPermutation:
            break;
    }
    return std::make_unique<LocalPermutationSource>(config.candidate_cap);
}

} // namespace clonescan::scan
