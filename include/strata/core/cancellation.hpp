#pragma once

#include <atomic>
#include <memory>

namespace strata {

/**
 * @brief Read side of a cancellation signal
 *
 * A default-constructed token is never cancelled. Tokens are cheap to copy and
 * all copies observe the same flag.
 */
class CancellationToken {
public:
    CancellationToken() = default;

    [[nodiscard]] bool is_cancelled() const noexcept {
        return flag_ && flag_->load(std::memory_order_acquire);
    }

private:
    friend class CancellationSource;
    explicit CancellationToken(std::shared_ptr<std::atomic<bool>> flag) : flag_(std::move(flag)) {}

    std::shared_ptr<std::atomic<bool>> flag_;
};

/**
 * @brief Write side of a cancellation signal
 */
class CancellationSource {
public:
    CancellationSource() : flag_(std::make_shared<std::atomic<bool>>(false)) {}

    [[nodiscard]] CancellationToken token() const { return CancellationToken(flag_); }

    void cancel() noexcept { flag_->store(true, std::memory_order_release); }

    [[nodiscard]] bool is_cancelled() const noexcept { return flag_->load(std::memory_order_acquire); }

private:
    std::shared_ptr<std::atomic<bool>> flag_;
};

} // namespace strata
