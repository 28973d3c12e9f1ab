#pragma once

/**
 * @file subprocess.h
 * @brief 외부 프로세스 실행 (타임아웃 포함)
 *
 * fork/exec로 프로그램을 실행하고 표준 출력을 수집합니다.
 * 실행 기한을 넘기면 프로세스를 종료(SIGKILL)하고 timed_out을 설정합니다.
 */

#include <chrono>
#include <string>
#include <vector>

namespace clonescan::core {

/**
 * @brief 프로세스 실행 결과
 */
struct ProcessResult {
    bool started{false};        ///< exec 성공 여부
    bool timed_out{false};      ///< 기한 초과로 종료됨
    int exit_code{-1};          ///< 정상 종료 시 종료 코드
    std::string stdout_data;    ///< 수집된 표준 출력
    std::string error_message;  ///< 실패 사유

    /**
     * @brief 정상 종료 + 종료 코드 0
     */
    [[nodiscard]] bool ok() const {
        return started && !timed_out && exit_code == 0;
    }
};

/**
 * @brief 프로그램 실행
 * @param argv argv[0]은 실행 파일 (PATH 검색)
 * @param timeout 실행 기한
 * @return 실행 결과 (예외를 던지지 않음)
 */
[[nodiscard]] ProcessResult runProcess(
    const std::vector<std::string>& argv,
    std::chrono::milliseconds timeout
);

} // namespace clonescan::core
