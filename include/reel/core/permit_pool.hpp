// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <optional>

namespace reel::core {

// Counting semaphore that can be closed. Once closed no permit is handed out
// again and every blocked acquire() returns std::nullopt.
class PermitPool {
public:
    // Returns its slot to the pool on destruction
    class Permit {
    public:
        Permit(Permit&& other) noexcept : pool_(other.pool_) { other.pool_ = nullptr; }
        Permit& operator=(Permit&& other) noexcept;
        ~Permit() { release(); }

        Permit(const Permit&) = delete;
        Permit& operator=(const Permit&) = delete;

    private:
        friend class PermitPool;
        explicit Permit(PermitPool* pool) noexcept : pool_(pool) {}
        void release() noexcept;

        PermitPool* pool_;
    };

    explicit PermitPool(std::uint32_t permits) noexcept;

    PermitPool(const PermitPool&) = delete;
    PermitPool& operator=(const PermitPool&) = delete;

    // Blocks until a permit is free; std::nullopt once the pool is closed
    [[nodiscard]] std::optional<Permit> acquire();

    void close() noexcept;

    [[nodiscard]] bool closed() const noexcept;
    [[nodiscard]] std::uint32_t available() const noexcept;

private:
    void give_back() noexcept;

    std::uint32_t available_;
    bool closed_{false};
    mutable std::mutex mutex_;
    std::condition_variable cv_;
};

} // namespace reel::core
