#pragma once

/**
 * @file http_client.h
 * @brief HTTP/HTTPS 클라이언트 (libcurl 래퍼)
 *
 * libcurl을 래핑하여 페이지 수집용 GET 요청을 처리합니다.
 * 연결 타임아웃과 읽기 타임아웃을 각각 적용하며, 진행률 콜백으로
 * 전송 중인 요청을 중단할 수 있습니다.
 */

#include <cstddef>
#include <string>
#include <memory>
#include <functional>
#include <unordered_map>
#include <chrono>

namespace clonescan::network {

/**
 * @brief HTTP 요청 구조체
 */
struct HttpRequest {
    std::string url;

    // 타임아웃 설정 (전체 전송 상한은 연결+읽기)
    std::chrono::seconds connect_timeout{10};   ///< 연결 수립
    std::chrono::seconds read_timeout{10};      ///< 수신 정체 허용 시간

    // 리다이렉션 설정 (최대 10회)
    bool follow_redirects{true};

    /// 본문 크기 상한 (0이면 제한 없음), 넘으면 전송 중단
    size_t max_body_bytes{0};
};

/**
 * @brief HTTP 응답 구조체
 */
struct HttpResponse {
    int status_code{0};
    std::unordered_map<std::string, std::string> headers;  ///< 키는 소문자
    std::string body;

    // 에러 정보
    bool success{false};
    bool aborted{false};                ///< 콜백에 의해 중단됨
    bool body_too_large{false};         ///< max_body_bytes 초과로 중단됨
    std::string error_message;

    /**
     * @brief 응답 성공 여부 (2xx)
     */
    [[nodiscard]] bool isOk() const {
        return success && status_code >= 200 && status_code < 300;
    }

    /**
     * @brief Content-Type 헤더 (없으면 빈 문자열)
     */
    [[nodiscard]] std::string contentType() const {
        auto it = headers.find("content-type");
        return it != headers.end() ? it->second : std::string{};
    }
};

/**
 * @brief 진행률 콜백
 * @param downloaded 다운로드된 바이트
 * @param total 전체 바이트 (알 수 없으면 0)
 * @return false를 반환하면 전송 중단
 */
using ProgressCallback = std::function<bool(size_t downloaded, size_t total)>;

/**
 * @brief HTTP 클라이언트
 *
 * 클라이언트당 CURL 핸들 하나를 사용합니다. 스레드 안전하지 않으므로
 * 병렬 수집에는 스레드마다 별도 인스턴스를 사용합니다.
 */
class HttpClient {
public:
    HttpClient();
    ~HttpClient();

    // 복사 금지
    HttpClient(const HttpClient&) = delete;
    HttpClient& operator=(const HttpClient&) = delete;

    /**
     * @brief libcurl 전역 초기화 (프로세스당 한 번, 스레드 생성 전)
     */
    static void globalInit();

    /**
     * @brief libcurl 전역 정리
     */
    static void globalCleanup();

    /**
     * @brief GET 요청 실행 (동기)
     * @param request 요청 정보
     * @param progress_cb 진행률 콜백 (선택, false 반환 시 중단)
     * @return HTTP 응답 (예외를 던지지 않음)
     */
    [[nodiscard]] HttpResponse send(
        const HttpRequest& request,
        ProgressCallback progress_cb = nullptr
    );

    /**
     * @brief User-Agent 설정
     */
    void setUserAgent(const std::string& user_agent);

    /**
     * @brief 기본 헤더 추가 (모든 요청에 적용)
     */
    void setDefaultHeader(const std::string& key, const std::string& value);

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace clonescan::network
