/**
 * @file http_client.cpp
 * @brief HTTP/HTTPS 클라이언트 구현 (libcurl 래퍼)
 */

#include "http_client.h"

#include <curl/curl.h>
#include <cctype>
#include <iostream>

namespace clonescan::network {

/**
 * @brief HttpClient 내부 구현 (PIMPL)
 */
struct HttpClient::Impl {
    CURL* curl{nullptr};
    std::string user_agent{"CloneScanner/0.3 (+msp)"};
    std::unordered_map<std::string, std::string> default_headers;
};

namespace {

constexpr long kMaxRedirects = 10;

/**
 * @brief 본문 수신 버퍼 (크기 상한 포함)
 */
struct BodySink {
    std::string data;
    size_t limit{0};        ///< 0이면 제한 없음
    bool exceeded{false};
};

} // namespace

// ============================================================
// libcurl 콜백 함수들
// ============================================================

/**
 * @brief 응답 데이터 수신 콜백
 */
static size_t writeCallback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* sink = static_cast<BodySink*>(userdata);
    size_t total_size = size * nmemb;
    if (sink->limit > 0 && sink->data.size() + total_size > sink->limit) {
        sink->exceeded = true;
        return 0;  // 반환 크기가 다르면 libcurl이 CURLE_WRITE_ERROR로 중단
    }
    sink->data.append(ptr, total_size);
    return total_size;
}

/**
 * @brief 응답 헤더 수신 콜백
 *
 * 리다이렉션마다 새 상태 줄이 오므로, 상태 줄을 만나면 이전 헤더를 비워
 * 최종 응답의 헤더만 남깁니다.
 */
static size_t headerCallback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* headers = static_cast<std::unordered_map<std::string, std::string>*>(userdata);
    size_t total_size = size * nmemb;
    std::string header_line(ptr, total_size);

    // 줄바꿈 제거
    while (!header_line.empty() &&
           (header_line.back() == '\r' || header_line.back() == '\n')) {
        header_line.pop_back();
    }

    if (header_line.starts_with("HTTP/")) {
        headers->clear();
        return total_size;
    }

    // 헤더 파싱 (Key: Value 형식)
    auto colon_pos = header_line.find(':');
    if (colon_pos != std::string::npos) {
        std::string key = header_line.substr(0, colon_pos);
        std::string value = header_line.substr(colon_pos + 1);

        // 앞뒤 공백 제거
        while (!value.empty() && value.front() == ' ') value.erase(value.begin());
        while (!value.empty() && value.back() == ' ') value.pop_back();

        // 소문자로 정규화
        std::string lower_key;
        for (char c : key) lower_key += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));

        (*headers)[lower_key] = value;
    }

    return total_size;
}

/**
 * @brief 진행률 콜백 래퍼
 */
struct ProgressData {
    ProgressCallback callback;
    bool aborted{false};
};

static int progressCallback(void* clientp, curl_off_t dltotal, curl_off_t dlnow,
                             curl_off_t /*ultotal*/, curl_off_t /*ulnow*/) {
    auto* data = static_cast<ProgressData*>(clientp);
    if (data && data->callback) {
        bool should_continue = data->callback(
            static_cast<size_t>(dlnow),
            static_cast<size_t>(dltotal)
        );
        if (!should_continue) {
            data->aborted = true;
            return 1;  // 중단
        }
    }
    return 0;
}

// ============================================================
// 전역 초기화/정리
// ============================================================

void HttpClient::globalInit() {
    curl_global_init(CURL_GLOBAL_ALL);
    std::cout << "[HttpClient] libcurl 전역 초기화 완료" << std::endl;
}

void HttpClient::globalCleanup() {
    curl_global_cleanup();
    std::cout << "[HttpClient] libcurl 전역 정리 완료" << std::endl;
}

// ============================================================
// 생성자/소멸자
// ============================================================

HttpClient::HttpClient() : impl_(std::make_unique<Impl>()) {
    impl_->curl = curl_easy_init();
    if (!impl_->curl) {
        std::cerr << "[HttpClient] CURL 핸들 생성 실패!" << std::endl;
    }
}

HttpClient::~HttpClient() {
    if (impl_ && impl_->curl) {
        curl_easy_cleanup(impl_->curl);
    }
}

// ============================================================
// 요청 실행
// ============================================================

HttpResponse HttpClient::send(
    const HttpRequest& request,
    ProgressCallback progress_cb
) {
    HttpResponse response;

    if (!impl_->curl) {
        response.success = false;
        response.error_message = "CURL 핸들이 초기화되지 않았습니다.";
        return response;
    }

    curl_easy_reset(impl_->curl);

    curl_easy_setopt(impl_->curl, CURLOPT_URL, request.url.c_str());
    curl_easy_setopt(impl_->curl, CURLOPT_HTTPGET, 1L);
    curl_easy_setopt(impl_->curl, CURLOPT_USERAGENT, impl_->user_agent.c_str());

    // 멀티스레드 환경에서 DNS 타임아웃 시 시그널 사용 금지
    curl_easy_setopt(impl_->curl, CURLOPT_NOSIGNAL, 1L);

    // 헤더 설정
    struct curl_slist* header_list = nullptr;

    for (const auto& [key, value] : impl_->default_headers) {
        std::string header = key + ": " + value;
        header_list = curl_slist_append(header_list, header.c_str());
    }
    if (header_list) {
        curl_easy_setopt(impl_->curl, CURLOPT_HTTPHEADER, header_list);
    }

    // 응답 데이터 콜백 (Content-Length를 알면 MAXFILESIZE로 먼저 거부)
    BodySink sink;
    sink.limit = request.max_body_bytes;
    curl_easy_setopt(impl_->curl, CURLOPT_WRITEFUNCTION, writeCallback);
    curl_easy_setopt(impl_->curl, CURLOPT_WRITEDATA, &sink);
    if (request.max_body_bytes > 0) {
        curl_easy_setopt(impl_->curl, CURLOPT_MAXFILESIZE_LARGE,
                         static_cast<curl_off_t>(request.max_body_bytes));
    }

    // 응답 헤더 콜백
    std::unordered_map<std::string, std::string> response_headers;
    curl_easy_setopt(impl_->curl, CURLOPT_HEADERFUNCTION, headerCallback);
    curl_easy_setopt(impl_->curl, CURLOPT_HEADERDATA, &response_headers);

    // 타임아웃 설정: 연결 수립, 수신 정체(1바이트/초 미만), 전체 상한
    auto transfer_timeout = request.connect_timeout + request.read_timeout;
    curl_easy_setopt(impl_->curl, CURLOPT_CONNECTTIMEOUT,
                     static_cast<long>(request.connect_timeout.count()));
    curl_easy_setopt(impl_->curl, CURLOPT_LOW_SPEED_LIMIT, 1L);
    curl_easy_setopt(impl_->curl, CURLOPT_LOW_SPEED_TIME,
                     static_cast<long>(request.read_timeout.count()));
    curl_easy_setopt(impl_->curl, CURLOPT_TIMEOUT,
                     static_cast<long>(transfer_timeout.count()));

    // 리다이렉션 설정
    curl_easy_setopt(impl_->curl, CURLOPT_FOLLOWLOCATION,
                     request.follow_redirects ? 1L : 0L);
    curl_easy_setopt(impl_->curl, CURLOPT_MAXREDIRS, kMaxRedirects);

    // 압축 응답 자동 해제
    curl_easy_setopt(impl_->curl, CURLOPT_ACCEPT_ENCODING, "");

    // 진행률 콜백
    ProgressData prog_data{progress_cb};
    if (progress_cb) {
        curl_easy_setopt(impl_->curl, CURLOPT_XFERINFOFUNCTION, progressCallback);
        curl_easy_setopt(impl_->curl, CURLOPT_XFERINFODATA, &prog_data);
        curl_easy_setopt(impl_->curl, CURLOPT_NOPROGRESS, 0L);
    }

    CURLcode res = curl_easy_perform(impl_->curl);

    if (res == CURLE_OK) {
        response.success = true;

        long http_code = 0;
        curl_easy_getinfo(impl_->curl, CURLINFO_RESPONSE_CODE, &http_code);
        response.status_code = static_cast<int>(http_code);
    } else {
        response.success = false;
        response.aborted = prog_data.aborted;
        response.body_too_large = sink.exceeded || res == CURLE_FILESIZE_EXCEEDED;
        response.error_message = curl_easy_strerror(res);
        if (response.body_too_large) {
            std::cout << "[HttpClient] 본문 크기 상한(" << request.max_body_bytes
                      << " 바이트) 초과로 중단: " << request.url << std::endl;
        } else if (!response.aborted) {
            std::cerr << "[HttpClient] 요청 실패: " << response.error_message
                      << " (URL: " << request.url << ")" << std::endl;
        }
    }

    if (response.success) {
        response.body = std::move(sink.data);
    }
    response.headers = std::move(response_headers);

    if (header_list) {
        curl_slist_free_all(header_list);
    }

    return response;
}

// ============================================================
// 설정
// ============================================================

void HttpClient::setUserAgent(const std::string& user_agent) {
    impl_->user_agent = user_agent;
}

void HttpClient::setDefaultHeader(const std::string& key, const std::string& value) {
    impl_->default_headers[key] = value;
}

} // namespace clonescan::network
