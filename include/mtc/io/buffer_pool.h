// =============================================================================
// mtc - Chunk Buffer Pool
// =============================================================================
// Reusable byte buffers for chunk payloads.
//
// Workers acquire a ManagedBuffer for every chunk they read or produce. The
// buffer returns its storage to the pool when destroyed, so every exit path
// (commit, failure, cancellation) releases it exactly once. Released storage
// is retained for reuse up to a configurable number of free buffers.
//
// The pool must outlive every buffer it hands out.
// =============================================================================

#ifndef MTC_IO_BUFFER_POOL_H
#define MTC_IO_BUFFER_POOL_H

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <span>
#include <vector>

namespace mtc::io {

class BufferPool;

/// @brief Default number of free buffers a pool keeps for reuse.
inline constexpr std::size_t kDefaultRetainedBuffers = 16;

// =============================================================================
// ManagedBuffer
// =============================================================================

/// @brief Owned byte buffer that returns its storage to a pool on destruction.
class ManagedBuffer {
public:
    ManagedBuffer() = default;

    /// @brief Take ownership of storage, returning it to pool (if any) later.
    ManagedBuffer(std::unique_ptr<std::uint8_t[]> storage, std::size_t capacity,
                  BufferPool* pool) noexcept;

    ~ManagedBuffer();

    ManagedBuffer(const ManagedBuffer&) = delete;
    ManagedBuffer& operator=(const ManagedBuffer&) = delete;
    ManagedBuffer(ManagedBuffer&& other) noexcept;
    ManagedBuffer& operator=(ManagedBuffer&& other) noexcept;

    [[nodiscard]] std::uint8_t* data() noexcept { return storage_.get(); }
    [[nodiscard]] const std::uint8_t* data() const noexcept { return storage_.get(); }

    [[nodiscard]] std::size_t capacity() const noexcept { return capacity_; }

    /// @brief Number of valid bytes.
    [[nodiscard]] std::size_t size() const noexcept { return size_; }

    /// @brief Set the valid byte count, clamped to capacity.
    void setSize(std::size_t size) noexcept { size_ = std::min(size, capacity_); }

    [[nodiscard]] bool valid() const noexcept { return storage_ != nullptr; }

    [[nodiscard]] bool empty() const noexcept { return size_ == 0; }

    [[nodiscard]] std::span<std::uint8_t> span() noexcept { return {storage_.get(), size_}; }
    [[nodiscard]] std::span<const std::uint8_t> span() const noexcept {
        return {storage_.get(), size_};
    }

    /// @brief Return the storage to its pool now and leave this buffer empty.
    void reset() noexcept;

private:
    std::unique_ptr<std::uint8_t[]> storage_;
    std::size_t capacity_ = 0;
    std::size_t size_ = 0;
    BufferPool* pool_ = nullptr;
};

// =============================================================================
// BufferPool
// =============================================================================

/// @brief Counters describing pool usage over its lifetime.
struct BufferPoolStats {
    std::uint64_t acquireCount = 0;
    std::uint64_t releaseCount = 0;
    /// @brief Acquisitions that needed a fresh allocation.
    std::uint64_t allocationCount = 0;
    std::uint64_t outstanding = 0;
    std::uint64_t peakOutstanding = 0;
    std::size_t retainedBuffers = 0;
    std::size_t retainedBytes = 0;
};

/// @brief Thread-safe pool of variable-capacity byte buffers.
class BufferPool {
public:
    explicit BufferPool(std::size_t maxRetained = kDefaultRetainedBuffers);

    ~BufferPool();

    BufferPool(const BufferPool&) = delete;
    BufferPool& operator=(const BufferPool&) = delete;
    BufferPool(BufferPool&&) = delete;
    BufferPool& operator=(BufferPool&&) = delete;

    /// @brief Acquire a buffer with capacity of at least minCapacity bytes.
    /// @note Reuses the smallest retained buffer that fits, otherwise
    ///       allocates. The returned buffer has size() == 0.
    [[nodiscard]] ManagedBuffer acquire(std::size_t minCapacity);

    [[nodiscard]] BufferPoolStats stats() const;

    /// @brief Free all retained storage.
    void trim();

private:
    friend class ManagedBuffer;

    struct FreeBuffer {
        std::unique_ptr<std::uint8_t[]> storage;
        std::size_t capacity = 0;
    };

    void recycle(std::unique_ptr<std::uint8_t[]> storage, std::size_t capacity) noexcept;

    std::size_t maxRetained_;
    std::vector<FreeBuffer> free_;
    BufferPoolStats stats_;
    mutable std::mutex mutex_;
};

}  // namespace mtc::io

#endif  // MTC_IO_BUFFER_POOL_H
