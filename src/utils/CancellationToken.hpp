#pragma once
#include <atomic>
#include <memory>

namespace Unclutter {

// Copies share one flag. A default-constructed token can still be cancelled
// through any of its copies.
class CancellationToken {
public:
    CancellationToken() : state_(std::make_shared<std::atomic<bool>>(false)) {}

    void Cancel() const { state_->store(true, std::memory_order_release); }
    bool IsCancelled() const { return state_->load(std::memory_order_acquire); }

private:
    std::shared_ptr<std::atomic<bool>> state_;
};

}
