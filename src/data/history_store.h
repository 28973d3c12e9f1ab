#pragma once

/**
 * @file history_store.h
 * @brief 탐지 히스토리 저장소 (추가 전용 CSV)
 *
 * 모든 스캔의 Finding을 CSV 파일 하나에 순서대로 보존합니다.
 * 추가는 "기존 읽기 → 이어 붙이기 → 임시 파일 기록 → rename 교체" 한 가지
 * 경로로만 이루어지며, 같은 파일에 대한 추가는 프로세스 내에서 직렬화됩니다.
 * 읽기는 잠금 없이 수행합니다 (rename 교체로 항상 완전한 파일을 봄).
 */

#include "core/finding.h"

#include <expected>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace clonescan::data {

/**
 * @brief 저장소 오류 코드
 */
enum class StoreErrorCode {
    WriteFailed,    ///< 임시 파일 기록 실패
    RenameFailed,   ///< 임시 파일 → 본 파일 교체 실패
    RemoveFailed    ///< 삭제 실패
};

/**
 * @brief 저장소 오류
 */
struct StoreError {
    StoreErrorCode code{StoreErrorCode::WriteFailed};
    std::string message;
};

class HistoryStore {
public:
    /**
     * @param path 히스토리 CSV 경로 (없으면 첫 추가 시 생성)
     */
    explicit HistoryStore(std::filesystem::path path);
    ~HistoryStore();

    // 복사 금지
    HistoryStore(const HistoryStore&) = delete;
    HistoryStore& operator=(const HistoryStore&) = delete;

    /**
     * @brief Finding 추가
     *
     * 빈 목록이면 아무것도 하지 않습니다. 실패 시 기존 파일은 그대로 남습니다.
     * 기존 파일을 해석할 수 없으면 "<path>.corrupt-<epoch>"로 보관한 뒤 새로 씁니다.
     */
    [[nodiscard]] std::expected<void, StoreError> append(
        const std::vector<core::Finding>& findings
    );

    /**
     * @brief 전체 기록 (추가 순서)
     *
     * 파일이 없거나 해석할 수 없으면 빈 목록.
     */
    [[nodiscard]] std::vector<core::HistoryRecord> loadAll() const;

    /**
     * @brief 전체 삭제 (파일이 없으면 아무것도 하지 않음)
     */
    [[nodiscard]] std::expected<void, StoreError> clear();

    [[nodiscard]] const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
    std::shared_ptr<std::mutex> write_mutex_;   ///< 같은 경로의 저장소끼리 공유

    /**
     * @brief 경로별 쓰기 뮤텍스 (프로세스 전역 레지스트리)
     */
    static std::shared_ptr<std::mutex> mutexFor(const std::filesystem::path& path);

    /**
     * @brief 파일 읽기 (없음: 빈 목록, 해석 불가: std::nullopt)
     */
    [[nodiscard]] std::optional<std::vector<core::HistoryRecord>> readFile() const;

    /**
     * @brief 임시 파일에 기록 후 rename으로 교체
     */
    [[nodiscard]] std::expected<void, StoreError> replaceFile(
        const std::vector<core::HistoryRecord>& records
    );
};

/**
 * @brief 최신순 정렬 (timestamp 내림차순, 같은 시각은 추가 순서 유지)
 */
void sortNewestFirst(std::vector<core::HistoryRecord>& records);

} // namespace clonescan::data
