// Copyright (c) 2026 changcheng967. All rights reserved.

#include <reel/core/permit_pool.hpp>

namespace reel::core {

//=============================================================================
// Permit
//=============================================================================

PermitPool::Permit& PermitPool::Permit::operator=(Permit&& other) noexcept {
    if (this != &other) {
        release();
        pool_ = other.pool_;
        other.pool_ = nullptr;
    }
    return *this;
}

void PermitPool::Permit::release() noexcept {
    if (pool_) {
        pool_->give_back();
        pool_ = nullptr;
    }
}

//=============================================================================
// PermitPool
//=============================================================================

PermitPool::PermitPool(std::uint32_t permits) noexcept
    : available_(permits) {}

std::optional<PermitPool::Permit> PermitPool::acquire() {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this] { return closed_ || available_ > 0; });
    if (closed_) {
        return std::nullopt;
    }
    --available_;
    return Permit(this);
}

void PermitPool::close() noexcept {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
    }
    cv_.notify_all();
}

bool PermitPool::closed() const noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

std::uint32_t PermitPool::available() const noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    return available_;
}

void PermitPool::give_back() noexcept {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ++available_;
    }
    cv_.notify_one();
}

} // namespace reel::core
