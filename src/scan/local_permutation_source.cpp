/**
 * @file local_permutation_source.cpp
 * @brief 규칙 기반 후보 도메인 생성기 구현
 */

#include "local_permutation_source.h"
#include "core/domain_normalizer.h"

#include <algorithm>
#include <array>
#include <string_view>
#include <unordered_set>

namespace clonescan::scan {

namespace {

// 사칭 사이트가 흔히 쓰는 어휘
constexpr std::array<std::string_view, 8> kPrefixes = {
    "login", "secure", "my", "account", "online", "web", "portal", "app"
};

constexpr std::array<std::string_view, 8> kSuffixes = {
    "login", "secure", "online", "support", "portal", "app", "verify", "help"
};

constexpr std::array<std::string_view, 5> kSubdomains = {
    "www", "login", "secure", "mail", "account"
};

constexpr std::array<std::string_view, 11> kAlternateSuffixes = {
    ".com", ".net", ".org", ".co", ".info", ".biz", ".io",
    ".online", ".site", ".xyz", ".app"
};

constexpr std::string_view kFallbackSuffix = ".com";

/**
 * @brief 순서를 유지하며 중복/대상/상한을 처리하는 수집기
 */
class CandidateCollector {
public:
    CandidateCollector(std::unordered_set<std::string> excluded, size_t cap)
        : seen_(std::move(excluded)), cap_(cap) {}

    void add(std::string domain, std::string_view rule) {
        if (full()) return;
        if (!seen_.insert(domain).second) return;
        candidates_.push_back({std::move(domain), std::string(rule), std::nullopt});
    }

    [[nodiscard]] bool full() const { return candidates_.size() >= cap_; }

    std::vector<core::CandidateDomain> take() { return std::move(candidates_); }

private:
    std::unordered_set<std::string> seen_;
    size_t cap_;
    std::vector<core::CandidateDomain> candidates_;
};

} // namespace

LocalPermutationSource::LocalPermutationSource(int cap)
    : cap_(std::max(1, cap)) {}

std::vector<core::CandidateDomain> LocalPermutationSource::generate(
    const std::string& target
) {
    const core::DomainParts parts = core::normalizeDomain(target);
    if (parts.name.empty()) {
        return {};
    }

    const std::string& name = parts.name;
    const std::string suffix = parts.suffix.empty()
        ? std::string(kFallbackSuffix) : parts.suffix;

    // 대상 자신 (접미사가 없던 입력은 .com 보정본도) 제외
    CandidateCollector out({parts.host(), name + suffix}, static_cast<size_t>(cap_));

    // 1. 접두어
    for (auto prefix : kPrefixes) {
        out.add(std::string(prefix) + name + suffix, "prefix");
        out.add(std::string(prefix) + "-" + name + suffix, "prefix");
    }

    // 2. 접미어
    for (auto word : kSuffixes) {
        out.add(name + std::string(word) + suffix, "suffix");
        out.add(name + "-" + std::string(word) + suffix, "suffix");
    }

    // 3. 서브도메인
    for (auto label : kSubdomains) {
        out.add(std::string(label) + "." + name + suffix, "subdomain");
    }

    // 4. 최상위 접미사 교체
    for (auto alternate : kAlternateSuffixes) {
        if (alternate == suffix) continue;
        out.add(name + std::string(alternate), "tld-swap");
    }

    // 5. 로그인/보안 조합형
    out.add("secure-login-" + name + suffix, "compound");
    out.add(name + "-secure-login" + suffix, "compound");
    out.add("login-" + name + "-secure" + suffix, "compound");
    out.add(name + "-account-verify" + suffix, "compound");

    return out.take();
}

} // namespace clonescan::scan
