#include "BufferSource.hpp"

#include <utility>

// ====================================================================================================
// DefaultBufferSource
// ====================================================================================================

Buffer DefaultBufferSource::get() {
    return Buffer(kBufferSize);
}

void DefaultBufferSource::put(Buffer) {
    // Nothing to reuse
}

// ====================================================================================================
// PooledBufferSource
// ====================================================================================================

PooledBufferSource::PooledBufferSource(size_t buffer_size, size_t max_pooled)
    : buffer_size(buffer_size), max_pooled(max_pooled) {}

Buffer PooledBufferSource::get() {
    {
        std::lock_guard<std::mutex> lock(mutex);
        if (!free_list.empty()) {
            Buffer buf = std::move(free_list.back());
            free_list.pop_back();
            return buf;
        }
    }
    return Buffer(buffer_size);
}

void PooledBufferSource::put(Buffer buf) {
    if (buf.size() != buffer_size) {
        return;
    }
    std::lock_guard<std::mutex> lock(mutex);
    if (free_list.size() < max_pooled) {
        free_list.push_back(std::move(buf));
    }
}

size_t PooledBufferSource::pooled() const {
    std::lock_guard<std::mutex> lock(mutex);
    return free_list.size();
}

// ====================================================================================================
// BufferLease
// ====================================================================================================

BufferLease::BufferLease(BufferSource& source)
    : source(source), buf(source.get()) {}

BufferLease::~BufferLease() {
    source.put(std::move(buf));
}
