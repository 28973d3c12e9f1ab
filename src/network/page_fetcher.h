#pragma once

/**
 * @file page_fetcher.h
 * @brief 페이지 수집기
 *
 * 후보 URL에 GET 요청을 보내고 상태 코드/Content-Type 정책을 적용한 뒤
 * 공백을 정규화한 페이지 텍스트를 반환합니다. 네트워크 오류, 타임아웃,
 * HTML이 아닌 응답, 오류 상태는 모두 "페이지 없음"(std::nullopt)입니다.
 */

#include "core/cancellation.h"
#include "core/scan_config.h"
#include "http_client.h"

#include <optional>
#include <string>
#include <string_view>

namespace clonescan::network {

/**
 * @brief 수집된 페이지
 */
struct FetchedPage {
    std::string text;           ///< 공백 정규화된 본문
    std::string content_type;   ///< Content-Type 헤더
    std::string url;            ///< 페이지를 제공한 요청 URL
    int status_code{0};
};

/**
 * @brief 페이지 수집기 인터페이스
 */
class PageFetcher {
public:
    virtual ~PageFetcher() = default;

    /**
     * @brief 단일 URL 수집
     * @param url 요청 URL (스킴 포함)
     * @param token 취소 토큰 (취소되면 전송 중단 후 std::nullopt)
     * @return 페이지 또는 std::nullopt
     */
    [[nodiscard]] virtual std::optional<FetchedPage> fetch(
        const std::string& url,
        const core::CancellationToken& token
    ) = 0;

    /**
     * @brief https:// 시도 후 실패 시 http:// 재시도
     *
     * 두 시도는 각각 전체 타임아웃을 사용합니다.
     * @param host 스킴 없는 호스트
     */
    [[nodiscard]] std::optional<FetchedPage> fetchWithFallback(
        const std::string& host,
        const core::CancellationToken& token
    );
};

/**
 * @brief libcurl 기반 페이지 수집기
 *
 * 호출마다 별도 HttpClient를 생성하므로 여러 스레드에서 동시에 호출할 수 있습니다.
 */
class HttpPageFetcher : public PageFetcher {
public:
    explicit HttpPageFetcher(const core::ScanConfig& config);

    [[nodiscard]] std::optional<FetchedPage> fetch(
        const std::string& url,
        const core::CancellationToken& token
    ) override;

    /**
     * @brief 응답에 수집 정책 적용
     *
     * 2xx + text/html 또는 text/* 일 때만 페이지를 반환합니다.
     * 본문 크기 상한을 넘은 응답은 페이지 없음입니다.
     * 정규화 후 본문이 비어 있으면 페이지 없음으로 봅니다.
     */
    [[nodiscard]] static std::optional<FetchedPage> toPage(
        const std::string& url,
        const HttpResponse& response
    );

    /**
     * @brief HTML/텍스트 Content-Type 여부 (대소문자 무시)
     */
    [[nodiscard]] static bool isTextContentType(std::string_view content_type);

    /**
     * @brief 연속 공백을 공백 하나로 축약하고 앞뒤 공백 제거
     */
    [[nodiscard]] static std::string collapseWhitespace(std::string_view body);

private:
    std::string user_agent_;
    std::chrono::seconds connect_timeout_;
    std::chrono::seconds read_timeout_;
    size_t max_body_bytes_;
};

} // namespace clonescan::network
