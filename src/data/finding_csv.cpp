/**
 * @file finding_csv.cpp
 * @brief Finding ↔ CSV 변환 구현
 */

#include "finding_csv.h"

#include <charconv>
#include <iomanip>
#include <ostream>
#include <sstream>

namespace clonescan::data {

namespace {

using CsvRow = std::vector<std::string>;

std::string joinList(const std::vector<std::string>& items) {
    std::string joined;
    for (const auto& item : items) {
        if (!joined.empty()) joined += ", ";
        joined += item;
    }
    return joined;
}

std::vector<std::string> splitList(std::string_view text) {
    std::vector<std::string> items;
    size_t start = 0;
    while (start <= text.size()) {
        size_t comma = text.find(',', start);
        if (comma == std::string_view::npos) comma = text.size();

        std::string_view item = text.substr(start, comma - start);
        while (!item.empty() && item.front() == ' ') item.remove_prefix(1);
        while (!item.empty() && item.back() == ' ') item.remove_suffix(1);
        if (!item.empty()) items.emplace_back(item);

        start = comma + 1;
    }
    return items;
}

std::string formatSimilarity(double value) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(3) << value;
    return oss.str();
}

/**
 * @brief CSV 텍스트 → 행 목록 (인용 필드 내 줄바꿈 허용)
 *
 * 닫히지 않은 인용이 있으면 std::nullopt. 빈 줄은 건너뜁니다.
 */
std::optional<std::vector<CsvRow>> splitCsv(std::string_view text) {
    std::vector<CsvRow> rows;
    CsvRow row;
    std::string field;
    bool in_quotes = false;
    bool field_started = false;

    auto endRow = [&]() {
        row.push_back(std::move(field));
        field.clear();
        field_started = false;
        // 빈 줄 무시
        if (!(row.size() == 1 && row.front().empty())) {
            rows.push_back(std::move(row));
        }
        row.clear();
    };

    for (size_t i = 0; i < text.size(); ++i) {
        char c = text[i];

        if (in_quotes) {
            if (c == '"') {
                if (i + 1 < text.size() && text[i + 1] == '"') {
                    field.push_back('"');
                    ++i;
                } else {
                    in_quotes = false;
                }
            } else {
                field.push_back(c);
            }
            continue;
        }

        switch (c) {
            case '"':
                if (!field_started) {
                    in_quotes = true;
                    field_started = true;
                } else {
                    field.push_back(c);
                }
                break;
            case ',':
                row.push_back(std::move(field));
                field.clear();
                field_started = false;
                break;
            case '\r':
                break;
            case '\n':
                endRow();
                break;
            default:
                field.push_back(c);
                field_started = true;
                break;
        }
    }

    if (in_quotes) {
        return std::nullopt;
    }
    if (field_started || !field.empty() || !row.empty()) {
        endRow();
    }
    return rows;
}

std::optional<core::Finding> decodeRow(const CsvRow& row) {
    if (row.size() != kFindingColumns.size()) {
        return std::nullopt;
    }

    core::Finding finding;

    const std::string& ts = row[0];
    auto [ts_end, ts_ec] = std::from_chars(ts.data(), ts.data() + ts.size(), finding.timestamp);
    if (ts_ec != std::errc{} || ts_end != ts.data() + ts.size()) {
        return std::nullopt;
    }

    const std::string& sim = row[3];
    auto [sim_end, sim_ec] = std::from_chars(sim.data(), sim.data() + sim.size(), finding.similarity);
    if (sim_ec != std::errc{} || sim_end != sim.data() + sim.size()) {
        return std::nullopt;
    }

    finding.target = row[1];
    finding.suspect_domain = row[2];
    finding.url = row[4];

    core::DnsMetadata dns;
    dns.a = splitList(row[5]);
    dns.ns = splitList(row[6]);
    dns.mx = splitList(row[7]);
    if (!dns.empty()) {
        finding.dns = std::move(dns);
    }

    finding.notes = row[8];
    return finding;
}

} // namespace

std::string quoteCsvField(std::string_view field) {
    if (field.find_first_of(",\"\r\n") == std::string_view::npos) {
        return std::string(field);
    }

    std::string quoted = "\"";
    for (char c : field) {
        if (c == '"') quoted += "\"\"";
        else quoted.push_back(c);
    }
    quoted.push_back('"');
    return quoted;
}

std::string findingCsvHeader() {
    std::string header;
    for (size_t i = 0; i < kFindingColumns.size(); ++i) {
        if (i > 0) header.push_back(',');
        header += kFindingColumns[i];
    }
    return header;
}

std::string encodeFindingRow(const core::Finding& finding) {
    static const core::DnsMetadata kNoDns;
    const core::DnsMetadata& dns = finding.dns ? *finding.dns : kNoDns;

    const std::string fields[] = {
        std::to_string(finding.timestamp),
        finding.target,
        finding.suspect_domain,
        formatSimilarity(finding.similarity),
        finding.url,
        joinList(dns.a),
        joinList(dns.ns),
        joinList(dns.mx),
        finding.notes,
    };

    std::string line;
    for (size_t i = 0; i < std::size(fields); ++i) {
        if (i > 0) line.push_back(',');
        line += quoteCsvField(fields[i]);
    }
    return line;
}

void writeFindingsCsv(std::ostream& out, const std::vector<core::Finding>& findings) {
    out << findingCsvHeader() << '\n';
    for (const auto& finding : findings) {
        out << encodeFindingRow(finding) << '\n';
    }
}

std::optional<std::vector<core::Finding>> parseFindingsCsv(std::string_view text) {
    auto rows = splitCsv(text);
    if (!rows) {
        return std::nullopt;
    }

    std::vector<core::Finding> findings;
    if (rows->empty()) {
        return findings;
    }

    // 헤더 확인
    const CsvRow& header = rows->front();
    if (header.size() != kFindingColumns.size()) {
        return std::nullopt;
    }
    for (size_t i = 0; i < header.size(); ++i) {
        if (header[i] != kFindingColumns[i]) {
            return std::nullopt;
        }
    }

    findings.reserve(rows->size() - 1);
    for (size_t i = 1; i < rows->size(); ++i) {
        auto finding = decodeRow((*rows)[i]);
        if (!finding) {
            return std::nullopt;
        }
        findings.push_back(std::move(*finding));
    }
    return findings;
}

} // namespace clonescan::data
