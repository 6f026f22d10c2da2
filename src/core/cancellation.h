#pragma once
#include <atomic>
#include <memory>
#include <utility>

// Cooperative cancellation for a running audit.
// The source is held by whoever may cancel (CLI deadline, signal handler,
// tests); tokens are handed to the probe client and the workers, which poll
// them between and during transfers.

class CancellationToken {
public:
    /**
     * @brief A token that can never be cancelled
     */
    CancellationToken() = default;

    bool cancelled() const {
        return flag_ && flag_->load(std::memory_order_acquire);
    }

private:
    friend class CancellationSource;
    explicit CancellationToken(std::shared_ptr<std::atomic<bool>> flag)
        : flag_(std::move(flag)) {}

    std::shared_ptr<std::atomic<bool>> flag_;
};

class CancellationSource {
public:
    CancellationSource() : flag_(std::make_shared<std::atomic<bool>>(false)) {}

    void cancel() { flag_->store(true, std::memory_order_release); }

    bool cancelled() const { return flag_->load(std::memory_order_acquire); }

    CancellationToken token() const { return CancellationToken(flag_); }

private:
    std::shared_ptr<std::atomic<bool>> flag_;
};
