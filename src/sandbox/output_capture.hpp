#pragma once

#include <cstddef>
#include <string>

namespace sandkeep::sandbox {

// Keeps the first `cap` bytes of a stream and remembers whether more arrived.
class CappedBuffer {
public:
    explicit CappedBuffer(std::size_t cap) : cap_(cap) {}

    void Append(const char* data, std::size_t size);

    const std::string& Data() const { return data_; }
    bool Overflowed() const { return overflowed_; }

private:
    std::size_t cap_;
    std::string data_;
    bool overflowed_ = false;
};

// Replaces every invalid UTF-8 sequence with U+FFFD.
std::string SanitizeUtf8(const std::string& bytes);

}  // namespace sandkeep::sandbox
