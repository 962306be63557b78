#ifndef URLFS_SLICE_H
#define URLFS_SLICE_H

#include <cassert>
#include <cstddef>
#include <cstring>
#include <string>

// Non-owning view over a caller-provided byte buffer. The read path hands
// the kernel's buffer to the remote source through a Slice and shrinks it
// to the number of bytes actually produced.
class Slice {
  public:
    Slice() : data_(nullptr), size_(0) {}

    // Refers to d[0, n-1].
    Slice(char *d, size_t n) : data_(d), size_(n) {}

    char *data() { return data_; }
    const char *data() const { return data_; }

    size_t size() const { return size_; }

    bool empty() const { return size_ == 0; }

    // Copies n bytes from src to the front of the slice and shrinks it to n.
    void assign(const char *src, size_t n) {
        assert(n <= size_);
        std::memcpy(data_, src, n);
        size_ = n;
    }

    // Setter to update the size, e.g., after a read operation.
    void set_size(size_t new_size) {
        assert(new_size <= size_);
        size_ = new_size;
    }

    std::string to_string() const { return std::string(data_, size_); }

  private:
    char *data_;
    size_t size_;
};

#endif // URLFS_SLICE_H
