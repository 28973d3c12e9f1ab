/**
 * @file scan_config.cpp
 * @brief 스캔 설정 검증
 */

#include "scan_config.h"

#include <algorithm>
#include <cctype>
#include <string>

namespace clonescan::core {

ScanConfig ScanConfig::validated() const {
    ScanConfig config = *this;

    config.threshold = std::clamp(config.threshold, kMinThreshold, kMaxThreshold);
    config.candidate_cap = std::max(1, config.candidate_cap);
    config.max_concurrent_fetches = std::max(1, config.max_concurrent_fetches);

    // 0초 타임아웃은 libcurl에서 "무제한"이므로 허용하지 않음
    const auto one = std::chrono::seconds{1};
    config.connect_timeout = std::max(one, config.connect_timeout);
    config.read_timeout = std::max(one, config.read_timeout);
    config.oracle_timeout = std::max(one, config.oracle_timeout);

    if (config.max_body_bytes == 0) {
        config.max_body_bytes = kDefaultMaxBodyBytes;
    }

    if (config.user_agent.empty()) {
        config.user_agent = ScanConfig{}.user_agent;
    }
    return config;
}

std::optional<CandidateStrategy> parseStrategy(std::string_view name) {
    std::string lower(name);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return std::tolower(c); });

    if (lower == "local" || lower == "permutation") {
        return CandidateStrategy::LocalPermutation;
    }
    if (lower == "oracle" || lower == "dnstwist") {
        return CandidateStrategy::RegistrationOracle;
    }
    return std::nullopt;
}

std::string_view strategyName(CandidateStrategy strategy) {
    switch (strategy) {
        case CandidateStrategy::LocalPermutation:
            return "local";
        case CandidateStrategy::RegistrationOracle:
            return "oracle";
    }
    return "local";
}

} // namespace clonescan::core
