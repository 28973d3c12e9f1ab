/**
 * @file registration_oracle_source.cpp
 * @brief 외부 등록 확인 도구 기반 후보 생성기 구현
 */

#include "registration_oracle_source.h"
#include "core/domain_normalizer.h"
#include "core/subprocess.h"

#include <json/json.h>

#include <algorithm>
#include <iostream>
#include <memory>
#include <unordered_set>

namespace clonescan::scan {

namespace {

/**
 * @brief 문자열 배열 필드 읽기
 *
 * 필드가 없거나 null이면 빈 목록, 배열이 아니거나 문자열이 아닌 원소가 있으면 false.
 */
bool readStringList(const Json::Value& record, const char* key, std::vector<std::string>& out) {
    const Json::Value& field = record[key];
    if (field.isNull()) return true;
    if (!field.isArray()) return false;

    for (const auto& item : field) {
        if (!item.isString()) return false;
        std::string value = item.asString();
        if (!value.empty()) out.push_back(std::move(value));
    }
    return true;
}

} // namespace

RegistrationOracleSource::RegistrationOracleSource(
    std::string binary, std::chrono::seconds timeout, int cap)
    : binary_(std::move(binary)), timeout_(timeout), cap_(std::max(1, cap)) {}

std::vector<std::string> RegistrationOracleSource::commandLine(const std::string& host) const {
    return {binary_, "--registered", "--json", host};
}

std::vector<core::CandidateDomain> RegistrationOracleSource::generate(
    const std::string& target
) {
    const std::string host = core::normalizeDomain(target).host();
    if (host.empty()) {
        return {};
    }

    auto result = core::runProcess(commandLine(host), timeout_);
    if (!result.ok()) {
        std::cerr << "[OracleSource] " << binary_ << " 실행 실패 (" << host << "): "
                  << (result.error_message.empty()
                          ? "종료 코드 " + std::to_string(result.exit_code)
                          : result.error_message)
                  << " — 후보 없이 진행" << std::endl;
        return {};
    }

    auto candidates = parseOutput(result.stdout_data, host, static_cast<size_t>(cap_));
    if (!candidates) {
        std::cerr << "[OracleSource] " << binary_ << " 출력 형식 오류 (" << host
                  << ") — 후보 없이 진행" << std::endl;
        return {};
    }

    std::cout << "[OracleSource] " << host << ": 등록된 후보 "
              << candidates->size() << "개" << std::endl;
    return std::move(*candidates);
}

std::optional<std::vector<core::CandidateDomain>> RegistrationOracleSource::parseOutput(
    std::string_view json,
    const std::string& target,
    size_t cap
) {
    Json::CharReaderBuilder builder;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());

    Json::Value root;
    std::string errors;
    if (!reader->parse(json.data(), json.data() + json.size(), &root, &errors)) {
        return std::nullopt;
    }
    if (!root.isArray()) {
        return std::nullopt;
    }

    std::vector<core::CandidateDomain> candidates;
    std::unordered_set<std::string> seen{target};

    for (const auto& record : root) {
        if (!record.isObject()) return std::nullopt;

        const Json::Value& domain_field = record["domain"];
        const Json::Value& registered_field = record["registered"];
        if (!domain_field.isString()) return std::nullopt;
        if (!registered_field.isNull() && !registered_field.isBool()) return std::nullopt;

        core::DnsMetadata dns;
        if (!readStringList(record, "dns_a", dns.a) ||
            !readStringList(record, "dns_ns", dns.ns) ||
            !readStringList(record, "dns_mx", dns.mx)) {
            return std::nullopt;
        }

        if (!registered_field.asBool()) continue;
        if (candidates.size() >= cap) continue;

        std::string domain = core::extractHost(domain_field.asString());
        if (domain.empty() || !seen.insert(domain).second) continue;

        core::CandidateDomain candidate;
        candidate.domain = std::move(domain);
        const Json::Value& fuzzer = record["fuzzer"];
        candidate.rule = fuzzer.isString() ? fuzzer.asString() : "oracle";
        candidate.dns = std::move(dns);
        candidates.push_back(std::move(candidate));
    }

    return candidates;
}

} // namespace clonescan::scan
