// =============================================================================
// mtc - Chunk Buffer Pool Implementation
// =============================================================================

#include "mtc/io/buffer_pool.h"

#include "mtc/common/logger.h"

namespace mtc::io {

// =============================================================================
// ManagedBuffer Implementation
// =============================================================================

ManagedBuffer::ManagedBuffer(std::unique_ptr<std::uint8_t[]> storage, std::size_t capacity,
                             BufferPool* pool) noexcept
    : storage_(std::move(storage)), capacity_(capacity), size_(0), pool_(pool) {}

ManagedBuffer::~ManagedBuffer() {
    reset();
}

ManagedBuffer::ManagedBuffer(ManagedBuffer&& other) noexcept
    : storage_(std::move(other.storage_)),
      capacity_(other.capacity_),
      size_(other.size_),
      pool_(other.pool_) {
    other.capacity_ = 0;
    other.size_ = 0;
    other.pool_ = nullptr;
}

ManagedBuffer& ManagedBuffer::operator=(ManagedBuffer&& other) noexcept {
    if (this != &other) {
        reset();

        storage_ = std::move(other.storage_);
        capacity_ = other.capacity_;
        size_ = other.size_;
        pool_ = other.pool_;

        other.capacity_ = 0;
        other.size_ = 0;
        other.pool_ = nullptr;
    }
    return *this;
}

void ManagedBuffer::reset() noexcept {
    if (storage_ && pool_) {
        pool_->recycle(std::move(storage_), capacity_);
    }
    storage_.reset();
    capacity_ = 0;
    size_ = 0;
    pool_ = nullptr;
}

// =============================================================================
// BufferPool Implementation
// =============================================================================

BufferPool::BufferPool(std::size_t maxRetained) : maxRetained_(maxRetained) {
    free_.reserve(maxRetained_);
}

BufferPool::~BufferPool() {
    const auto outstanding = stats().outstanding;
    if (outstanding != 0) {
        MTC_LOG_WARNING("BufferPool destroyed with {} buffers outstanding", outstanding);
    }
}

ManagedBuffer BufferPool::acquire(std::size_t minCapacity) {
    std::unique_lock lock(mutex_);

    ++stats_.acquireCount;
    ++stats_.outstanding;
    stats_.peakOutstanding = std::max(stats_.peakOutstanding, stats_.outstanding);

    auto best = free_.end();
    for (auto it = free_.begin(); it != free_.end(); ++it) {
        if (it->capacity >= minCapacity && (best == free_.end() || it->capacity < best->capacity)) {
            best = it;
        }
    }

    if (best != free_.end()) {
        FreeBuffer reused = std::move(*best);
        free_.erase(best);
        stats_.retainedBytes -= reused.capacity;
        stats_.retainedBuffers = free_.size();
        return ManagedBuffer(std::move(reused.storage), reused.capacity, this);
    }

    ++stats_.allocationCount;
    lock.unlock();

    // Allocate outside the lock; a zero request still yields valid storage.
    const std::size_t capacity = std::max<std::size_t>(minCapacity, 1);
    try {
        return ManagedBuffer(std::make_unique_for_overwrite<std::uint8_t[]>(capacity), capacity,
                             this);
    } catch (...) {
        lock.lock();
        --stats_.outstanding;
        throw;
    }
}

void BufferPool::recycle(std::unique_ptr<std::uint8_t[]> storage, std::size_t capacity) noexcept {
    std::lock_guard lock(mutex_);

    ++stats_.releaseCount;
    --stats_.outstanding;

    if (free_.size() < maxRetained_) {
        free_.push_back(FreeBuffer{std::move(storage), capacity});
        stats_.retainedBytes += capacity;
        stats_.retainedBuffers = free_.size();
    }
}

BufferPoolStats BufferPool::stats() const {
    std::lock_guard lock(mutex_);
    return stats_;
}

void BufferPool::trim() {
    std::lock_guard lock(mutex_);
    free_.clear();
    stats_.retainedBuffers = 0;
    stats_.retainedBytes = 0;
}

}  // namespace mtc::io
