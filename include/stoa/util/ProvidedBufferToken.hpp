#pragma once

#include <cstddef>
#include <functional>

namespace stoa {

/**
 * Borrowed view of one io_uring provided buffer. The buffer goes back to the
 * ring when the token is destroyed, so consumers copy what they keep.
 */
class ProvidedBufferToken {
public:
    using RecycleCallback = std::function<void(unsigned)>;

    ProvidedBufferToken(RecycleCallback recycle_cb, unsigned buf_id, char* data, size_t size)
        : recycle_cb_(std::move(recycle_cb)), buf_id_(buf_id), data_(data), size_(size) {}

    ~ProvidedBufferToken() {
        if (data_ && recycle_cb_) {
            recycle_cb_(buf_id_);
        }
    }

    ProvidedBufferToken(const ProvidedBufferToken&) = delete;
    ProvidedBufferToken& operator=(const ProvidedBufferToken&) = delete;

    const char* data() const { return data_; }
    size_t size() const { return size_; }
    unsigned buffer_id() const { return buf_id_; }

private:
    RecycleCallback recycle_cb_;
    unsigned buf_id_;
    char* data_;
    size_t size_;
};

} // namespace stoa
