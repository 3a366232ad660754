#pragma once

#include <cstdint>
#include <cstring>
#include <array>
#include <utility>
#include <vector>

namespace vrlnc {

using Bytes = std::vector<uint8_t>;

// little-endian, u64 length prefixes, fixed 32-byte elements
class ByteWriter {
    Bytes out_;

public:
    void reserve(size_t n) { out_.reserve(n); }

    void put_u8(uint8_t v) { out_.push_back(v); }

    void put_u64(uint64_t v) {
        for (int i = 0; i < 8; i++) out_.push_back((uint8_t)(v >> (i * 8)));
    }

    void put_raw(const uint8_t* data, size_t len) {
        out_.insert(out_.end(), data, data + len);
    }

    template<size_t N>
    void put_array(const std::array<uint8_t, N>& a) {
        put_raw(a.data(), N);
    }

    Bytes take() { return std::move(out_); }
};

class ByteReader {
    const uint8_t* data_;
    size_t len_;
    size_t pos_ = 0;

public:
    ByteReader(const uint8_t* data, size_t len) : data_(data), len_(len) {}

    size_t remaining() const { return len_ - pos_; }
    bool done() const { return pos_ == len_; }

    bool get_u8(uint8_t& v) {
        if (remaining() < 1) return false;
        v = data_[pos_++];
        return true;
    }

    bool get_u64(uint64_t& v) {
        if (remaining() < 8) return false;
        v = 0;
        for (int i = 0; i < 8; i++) v |= (uint64_t)data_[pos_ + i] << (i * 8);
        pos_ += 8;
        return true;
    }

    bool get_raw(uint8_t* out, size_t len) {
        if (remaining() < len) return false;
        memcpy(out, data_ + pos_, len);
        pos_ += len;
        return true;
    }

    template<size_t N>
    bool get_array(std::array<uint8_t, N>& a) {
        return get_raw(a.data(), N);
    }

    // length prefix of a sequence of elem_size-byte items, checked against the bytes left
    bool get_count(uint64_t& n, size_t elem_size, size_t limit) {
        if (!get_u64(n)) return false;
        if (n > limit) return false;
        return n <= remaining() / elem_size;
    }
};

}
