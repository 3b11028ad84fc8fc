#ifndef BUFFER_SOURCE_HPP
#define BUFFER_SOURCE_HPP

#include <cstddef>
#include <memory>
#include <mutex>
#include <vector>

using Buffer = std::vector<char>;

/**
 * BufferSource - Supplies scratch buffers for relaying tunnel traffic
 *
 * Implementations must allow get() and put() from many sessions at once.
 * A buffer handed out by get() is used by one relay direction only and is
 * not touched by the caller after put().
 */
class BufferSource {
public:
    virtual ~BufferSource() = default;

    virtual Buffer get() = 0;
    virtual void put(Buffer buf) = 0;
};

/**
 * DefaultBufferSource - Allocates a fresh 32 KiB buffer on every get()
 */
class DefaultBufferSource : public BufferSource {
public:
    static constexpr size_t kBufferSize = 32768;

    Buffer get() override;
    void put(Buffer buf) override;
};

/**
 * PooledBufferSource - Keeps returned buffers for reuse
 *
 * At most `max_pooled` buffers are retained; extra ones are freed.
 * Buffers of the wrong size are never pooled.
 */
class PooledBufferSource : public BufferSource {
public:
    explicit PooledBufferSource(size_t buffer_size = DefaultBufferSource::kBufferSize,
                                size_t max_pooled = 256);

    Buffer get() override;
    void put(Buffer buf) override;

    size_t pooled() const;

private:
    const size_t buffer_size;
    const size_t max_pooled;
    mutable std::mutex mutex;
    std::vector<Buffer> free_list;
};

/**
 * BufferLease - Holds a buffer from a BufferSource and returns it on scope exit
 */
class BufferLease {
public:
    explicit BufferLease(BufferSource& source);
    ~BufferLease();

    BufferLease(const BufferLease&) = delete;
    BufferLease& operator=(const BufferLease&) = delete;

    Buffer& buffer() { return buf; }

private:
    BufferSource& source;
    Buffer buf;
};

#endif // BUFFER_SOURCE_HPP
