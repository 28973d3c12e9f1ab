/**
 * @file scan_settings.cpp
 * @brief INI 설정 로드 구현
 */

#include "scan_settings.h"

#include <QFileInfo>
#include <QSettings>

#include <iostream>

namespace clonescan::cli {

namespace {

std::chrono::seconds readSeconds(const QSettings& s, const QString& key,
                                 std::chrono::seconds fallback) {
    bool ok = false;
    int value = s.value(key, static_cast<int>(fallback.count())).toInt(&ok);
    return ok ? std::chrono::seconds(value) : fallback;
}

} // namespace

std::optional<core::ScanConfig> loadScanSettings(
    const QString& ini_path,
    const core::ScanConfig& base
) {
    if (!QFileInfo::exists(ini_path)) {
        std::cerr << "[ScanSettings] 설정 파일이 없습니다: "
                  << ini_path.toStdString() << std::endl;
        return std::nullopt;
    }

    QSettings s(ini_path, QSettings::IniFormat);
    if (s.status() != QSettings::NoError) {
        std::cerr << "[ScanSettings] 설정 파일을 읽을 수 없습니다: "
                  << ini_path.toStdString() << std::endl;
        return std::nullopt;
    }

    core::ScanConfig config = base;

    // [scan]
    bool ok = false;
    double threshold = s.value("scan/threshold", base.threshold).toDouble(&ok);
    if (ok) config.threshold = threshold;

    int cap = s.value("scan/cap", base.candidate_cap).toInt(&ok);
    if (ok) config.candidate_cap = cap;

    int concurrency = s.value("scan/concurrency", base.max_concurrent_fetches).toInt(&ok);
    if (ok) config.max_concurrent_fetches = concurrency;

    qulonglong max_body = s.value("scan/max_body_bytes",
        static_cast<qulonglong>(base.max_body_bytes)).toULongLong(&ok);
    if (ok) config.max_body_bytes = static_cast<size_t>(max_body);

    config.connect_timeout = readSeconds(s, "scan/connect_timeout", base.connect_timeout);
    config.read_timeout = readSeconds(s, "scan/read_timeout", base.read_timeout);

    if (s.contains("scan/strategy")) {
        QString name = s.value("scan/strategy").toString();
        auto strategy = core::parseStrategy(name.toStdString());
        if (strategy) {
            config.strategy = *strategy;
        } else {
            std::cerr << "[ScanSettings] 알 수 없는 전략 '" << name.toStdString()
                      << "' — 기본값 유지" << std::endl;
        }
    }

    config.user_agent = s.value("scan/user_agent",
        QString::fromStdString(base.user_agent)).toString().toStdString();
    config.history_path = s.value("scan/history",
        QString::fromStdString(base.history_path)).toString().toStdString();

    // [oracle]
    config.oracle_binary = s.value("oracle/binary",
        QString::fromStdString(base.oracle_binary)).toString().toStdString();
    config.oracle_timeout = readSeconds(s, "oracle/timeout", base.oracle_timeout);

    std::cout << "[ScanSettings] 설정 로드 완료: " << ini_path.toStdString() << std::endl;
    return config.validated();
}

} // namespace clonescan::cli
