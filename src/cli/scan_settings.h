#pragma once

/**
 * @file scan_settings.h
 * @brief INI 설정 파일 → ScanConfig
 *
 * 인식하는 키:
 *   [scan]   threshold, cap, connect_timeout, read_timeout, concurrency,
 *            strategy, user_agent, history
 *   [oracle] binary, timeout
 * 없는 키는 기본값을 유지합니다.
 */

#include "core/scan_config.h"

#include <QString>

#include <optional>

namespace clonescan::cli {

/**
 * @brief INI 파일에서 설정 로드
 * @param ini_path 설정 파일 경로
 * @param base 파일에 없는 항목의 값
 * @return 설정 (파일이 없거나 읽을 수 없으면 std::nullopt)
 */
[[nodiscard]] std::optional<core::ScanConfig> loadScanSettings(
    const QString& ini_path,
    const core::ScanConfig& base = {}
);

} // namespace clonescan::cli
