/**
 * @file history_store.cpp
 * @brief 탐지 히스토리 저장소 구현
 */

#include "history_store.h"
#include "finding_csv.h"

#include <algorithm>
#include <chrono>
#include <fstream>
#include <iostream>
#include <sstream>
#include <unordered_map>

namespace fs = std::filesystem;

namespace clonescan::data {

// ============================================================
// 생성자 / 소멸자
// ============================================================

HistoryStore::HistoryStore(fs::path path)
    : path_(std::move(path)), write_mutex_(mutexFor(path_)) {}

HistoryStore::~HistoryStore() = default;

std::shared_ptr<std::mutex> HistoryStore::mutexFor(const fs::path& path) {
    static std::mutex registry_mutex;
    static std::unordered_map<std::string, std::weak_ptr<std::mutex>> registry;

    std::error_code ec;
    fs::path key = fs::weakly_canonical(fs::absolute(path, ec), ec);
    if (ec) key = path.lexically_normal();

    std::lock_guard lock(registry_mutex);
    auto& slot = registry[key.string()];
    auto existing = slot.lock();
    if (existing) return existing;

    auto created = std::make_shared<std::mutex>();
    slot = created;
    return created;
}

// ============================================================
// 추가 / 조회 / 삭제
// ============================================================

std::expected<void, StoreError> HistoryStore::append(
    const std::vector<core::Finding>& findings
) {
    if (findings.empty()) {
        return {};
    }

    std::lock_guard lock(*write_mutex_);

    auto existing = readFile();
    std::vector<core::HistoryRecord> records;

    if (existing) {
        records = std::move(*existing);
    } else {
        // 해석할 수 없는 파일은 덮어쓰기 전에 보관
        auto epoch = std::chrono::duration_cast<std::chrono::seconds>(
            std::chrono::system_clock::now().time_since_epoch()).count();
        fs::path backup = path_;
        backup += ".corrupt-" + std::to_string(epoch);

        std::error_code ec;
        fs::rename(path_, backup, ec);
        if (ec) {
            return std::unexpected(StoreError{
                StoreErrorCode::RenameFailed,
                "손상된 히스토리 보관 실패: " + ec.message()});
        }
        std::cerr << "[HistoryStore] 히스토리 파일을 해석할 수 없어 보관했습니다: "
                  << backup.string() << std::endl;
    }

    records.insert(records.end(), findings.begin(), findings.end());

    auto replaced = replaceFile(records);
    if (!replaced) {
        std::cerr << "[HistoryStore] 기록 실패: " << replaced.error().message << std::endl;
        return replaced;
    }

    std::cout << "[HistoryStore] " << findings.size() << "개 추가 (총 "
              << records.size() << "개)" << std::endl;
    return {};
}

std::vector<core::HistoryRecord> HistoryStore::loadAll() const {
    auto records = readFile();
    if (!records) {
        std::cerr << "[HistoryStore] 히스토리 파일을 해석할 수 없습니다 — 빈 기록으로 처리: "
                  << path_.string() << std::endl;
        return {};
    }
    return std::move(*records);
}

std::expected<void, StoreError> HistoryStore::clear() {
    std::lock_guard lock(*write_mutex_);

    std::error_code ec;
    fs::remove(path_, ec);
    if (ec) {
        return std::unexpected(StoreError{
            StoreErrorCode::RemoveFailed,
            "히스토리 삭제 실패 (" + path_.string() + "): " + ec.message()});
    }
    return {};
}

// ============================================================
// 내부 헬퍼
// ============================================================

std::optional<std::vector<core::HistoryRecord>> HistoryStore::readFile() const {
    std::error_code ec;
    if (!fs::exists(path_, ec)) {
        return std::vector<core::HistoryRecord>{};
    }

    std::ifstream ifs(path_, std::ios::binary);
    if (!ifs) {
        return std::nullopt;
    }

    std::ostringstream buffer;
    buffer << ifs.rdbuf();
    if (ifs.bad()) {
        return std::nullopt;
    }

    return parseFindingsCsv(buffer.str());
}

std::expected<void, StoreError> HistoryStore::replaceFile(
    const std::vector<core::HistoryRecord>& records
) {
    fs::path temp_path = path_;
    temp_path += ".tmp";

    {
        std::ofstream ofs(temp_path, std::ios::binary | std::ios::trunc);
        if (!ofs) {
            return std::unexpected(StoreError{
                StoreErrorCode::WriteFailed,
                "임시 파일을 열 수 없습니다: " + temp_path.string()});
        }

        writeFindingsCsv(ofs, records);
        ofs.flush();
        if (!ofs) {
            std::error_code ec;
            fs::remove(temp_path, ec);
            return std::unexpected(StoreError{
                StoreErrorCode::WriteFailed,
                "임시 파일 기록 실패: " + temp_path.string()});
        }
    }

    std::error_code ec;
    fs::rename(temp_path, path_, ec);
    if (ec) {
        std::error_code remove_ec;
        fs::remove(temp_path, remove_ec);
        return std::unexpected(StoreError{
            StoreErrorCode::RenameFailed,
            "히스토리 교체 실패 (" + path_.string() + "): " + ec.message()});
    }
    return {};
}

void sortNewestFirst(std::vector<core::HistoryRecord>& records) {
    std::stable_sort(records.begin(), records.end(),
                     [](const core::HistoryRecord& a, const core::HistoryRecord& b) {
                         return a.timestamp > b.timestamp;
                     });
}

} // namespace clonescan::data
