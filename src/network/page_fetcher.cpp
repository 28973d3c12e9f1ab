/**
 * @file page_fetcher.cpp
 * @brief 페이지 수집기 구현
 */

#include "page_fetcher.h"

#include <algorithm>
#include <cctype>
#include <iostream>

namespace clonescan::network {

// ============================================================
// PageFetcher
// ============================================================

std::optional<FetchedPage> PageFetcher::fetchWithFallback(
    const std::string& host,
    const core::CancellationToken& token
) {
    if (auto page = fetch("https://" + host, token)) {
        return page;
    }
    if (token.isCancelled()) {
        return std::nullopt;
    }
    return fetch("http://" + host, token);
}

// ============================================================
// HttpPageFetcher
// ============================================================

HttpPageFetcher::HttpPageFetcher(const core::ScanConfig& config)
    : user_agent_(config.user_agent),
      connect_timeout_(config.connect_timeout),
      read_timeout_(config.read_timeout),
      max_body_bytes_(config.max_body_bytes) {}

std::optional<FetchedPage> HttpPageFetcher::fetch(
    const std::string& url,
    const core::CancellationToken& token
) {
    if (token.isCancelled()) {
        return std::nullopt;
    }

    HttpClient client;
    client.setUserAgent(user_agent_);
    client.setDefaultHeader("Accept", "text/html,application/xhtml+xml,text/plain;q=0.9,*/*;q=0.5");

    HttpRequest request;
    request.url = url;
    request.connect_timeout = connect_timeout_;
    request.read_timeout = read_timeout_;
    request.follow_redirects = true;
    request.max_body_bytes = max_body_bytes_;

    // 취소 토큰 확인 → false 반환 시 libcurl이 전송 중단
    auto response = client.send(request, [token](size_t, size_t) {
        return !token.isCancelled();
    });

    if (response.aborted) {
        std::cout << "[PageFetcher] 취소로 중단: " << url << std::endl;
        return std::nullopt;
    }

    return toPage(url, response);
}

std::optional<FetchedPage> HttpPageFetcher::toPage(
    const std::string& url,
    const HttpResponse& response
) {
    if (!response.isOk() || response.body_too_large) {
        return std::nullopt;
    }

    std::string content_type = response.contentType();
    if (!isTextContentType(content_type)) {
        return std::nullopt;
    }

    FetchedPage page;
    page.text = collapseWhitespace(response.body);
    if (page.text.empty()) {
        return std::nullopt;
    }
    page.content_type = std::move(content_type);
    page.url = url;
    page.status_code = response.status_code;
    return page;
}

bool HttpPageFetcher::isTextContentType(std::string_view content_type) {
    std::string lower(content_type);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    // text/html, text/plain 등
    return lower.find("text/") != std::string::npos;
}

std::string HttpPageFetcher::collapseWhitespace(std::string_view body) {
    std::string result;
    result.reserve(body.size());

    bool pending_space = false;
    for (char c : body) {
        if (std::isspace(static_cast<unsigned char>(c))) {
            pending_space = !result.empty();
            continue;
        }
        if (pending_space) {
            result.push_back(' ');
            pending_space = false;
        }
        result.push_back(c);
    }
    return result;
}

} // namespace clonescan::network
