/**
 * @file domain_normalizer.cpp
 * @brief 도메인/URL 정규화 구현
 */

#include "domain_normalizer.h"

#include <algorithm>
#include <cctype>
#include <sstream>
#include <unordered_set>

namespace clonescan::core {

namespace {

std::string_view trimView(std::string_view s) {
    const char* ws = " \t\n\r\f\v";
    auto begin = s.find_first_not_of(ws);
    if (begin == std::string_view::npos) return {};
    auto end = s.find_last_not_of(ws);
    return s.substr(begin, end - begin + 1);
}

} // namespace

std::string extractHost(std::string_view raw) {
    std::string domain(trimView(raw));

    // 프로토콜 제거
    auto protocol_end = domain.find("://");
    if (protocol_end != std::string::npos) {
        domain = domain.substr(protocol_end + 3);
    }

    // 경로/쿼리/프래그먼트 제거
    auto path_pos = domain.find_first_of("/?#");
    if (path_pos != std::string::npos) {
        domain = domain.substr(0, path_pos);
    }

    // 사용자 정보 제거 (user:pass@host)
    auto at_pos = domain.rfind('@');
    if (at_pos != std::string::npos) {
        domain = domain.substr(at_pos + 1);
    }

    // 포트 제거
    auto port_pos = domain.find(':');
    if (port_pos != std::string::npos) {
        domain = domain.substr(0, port_pos);
    }

    // 루트 점 제거 ("bank.com." → "bank.com")
    while (!domain.empty() && domain.back() == '.') {
        domain.pop_back();
    }

    std::transform(domain.begin(), domain.end(), domain.begin(),
                   [](unsigned char c) { return std::tolower(c); });

    return domain;
}

DomainParts normalizeDomain(std::string_view raw) {
    DomainParts parts;
    std::string host = extractHost(raw);

    auto dot = host.rfind('.');
    if (dot == std::string::npos || dot == 0) {
        // 라벨이 하나뿐 (또는 ".com" 같은 비정상 입력)
        parts.name = std::move(host);
        return parts;
    }

    parts.name = host.substr(0, dot);
    parts.suffix = host.substr(dot);
    return parts;
}

bool isValidHost(std::string_view host) {
    if (host.empty() || host.front() == '.' || host.find("..") != std::string_view::npos) {
        return false;
    }
    return std::all_of(host.begin(), host.end(), [](unsigned char c) {
        return (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '.' || c == '-';
    });
}

std::expected<std::vector<std::string>, TargetListError> parseTargetList(
    std::string_view text
) {
    std::vector<std::string> targets;
    std::unordered_set<std::string> seen;

    std::istringstream stream{std::string(text)};
    std::string line;
    size_t line_number = 0;
    while (std::getline(stream, line)) {
        ++line_number;
        auto trimmed = trimView(line);
        if (trimmed.empty() || trimmed.front() == '#') continue;

        std::string host = normalizeDomain(trimmed).host();
        if (!isValidHost(host)) {
            return std::unexpected(TargetListError{line_number, std::string(trimmed)});
        }

        if (seen.insert(host).second) {
            targets.push_back(std::move(host));
        }
    }
    return targets;
}

} // namespace clonescan::core
