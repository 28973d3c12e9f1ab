#pragma once

/**
 * @file cancellation.h
 * @brief 스캔 취소 토큰
 *
 * 복사본끼리 같은 플래그를 공유합니다. 기본 생성된 토큰도 유효하며
 * cancel()을 호출하지 않는 한 취소되지 않습니다.
 */

#include <atomic>
#include <memory>

namespace clonescan::core {

class CancellationToken {
public:
    CancellationToken() : flag_(std::make_shared<std::atomic<bool>>(false)) {}

    void cancel() { flag_->store(true); }

    [[nodiscard]] bool isCancelled() const { return flag_->load(); }

private:
    std::shared_ptr<std::atomic<bool>> flag_;
};

} // namespace clonescan::core
