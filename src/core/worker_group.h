#pragma once

/**
 * @file worker_group.h
 * @brief 작업 스레드 묶음
 *
 * 소멸 시 시작된 모든 스레드를 join합니다. 스레드 생성 도중 예외가 나도
 * 이미 시작된 스레드가 joinable 상태로 파괴되지 않습니다.
 */

#include <cstddef>
#include <thread>
#include <utility>
#include <vector>

namespace clonescan::core {

class WorkerGroup {
public:
    WorkerGroup() = default;
    ~WorkerGroup() { joinAll(); }

    WorkerGroup(const WorkerGroup&) = delete;
    WorkerGroup& operator=(const WorkerGroup&) = delete;

    /**
     * @brief 스레드 시작 (생성 실패 시 std::system_error)
     */
    template <typename Fn>
    void spawn(Fn&& fn) {
        threads_.emplace_back(std::forward<Fn>(fn));
    }

    void joinAll() {
        for (auto& t : threads_) {
            if (t.joinable()) t.join();
        }
        threads_.clear();
    }

    [[nodiscard]] size_t size() const { return threads_.size(); }

private:
    std::vector<std::thread> threads_;
};

} // namespace clonescan::core
