// AGORA - Serialization Header
// Copyright (c) 2024 AGORA Developers
// MIT License
//
// Serialization primitives for persisted governance records and storage keys.
// Values are little-endian; key components that must sort numerically are
// written big-endian.

#ifndef AGORA_CORE_SERIALIZE_H
#define AGORA_CORE_SERIALIZE_H

#include "agora/core/types.h"
#include <algorithm>
#include <cstdint>
#include <cstddef>
#include <cstring>
#include <ios>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace agora {

// ============================================================================
// Constants
// ============================================================================

/// Maximum size for serialized containers to prevent memory exhaustion
static constexpr uint64_t MAX_SIZE = 0x02000000;  // 32 MB

/// Maximum number of elements reserved up front when reading a vector
static constexpr uint64_t MAX_VECTOR_RESERVE = 4096;

// ============================================================================
// Endianness Helpers
// ============================================================================

namespace detail {

inline uint16_t ToLE16(uint16_t host) {
#if defined(__BYTE_ORDER__) && __BYTE_ORDER__ == __ORDER_BIG_ENDIAN__
    return __builtin_bswap16(host);
#else
    return host;
#endif
}

inline uint32_t ToLE32(uint32_t host) {
#if defined(__BYTE_ORDER__) && __BYTE_ORDER__ == __ORDER_BIG_ENDIAN__
    return __builtin_bswap32(host);
#else
    return host;
#endif
}

inline uint64_t ToLE64(uint64_t host) {
#if defined(__BYTE_ORDER__) && __BYTE_ORDER__ == __ORDER_BIG_ENDIAN__
    return __builtin_bswap64(host);
#else
    return host;
#endif
}

inline uint64_t ToBE64(uint64_t host) {
#if defined(__BYTE_ORDER__) && __BYTE_ORDER__ == __ORDER_BIG_ENDIAN__
    return host;
#else
    return __builtin_bswap64(host);
#endif
}

inline uint16_t FromLE16(uint16_t little) { return ToLE16(little); }
inline uint32_t FromLE32(uint32_t little) { return ToLE32(little); }
inline uint64_t FromLE64(uint64_t little) { return ToLE64(little); }
inline uint64_t FromBE64(uint64_t big) { return ToBE64(big); }

} // namespace detail

// ============================================================================
// DataStream - In-memory byte buffer for serialization
// ============================================================================

class DataStream {
public:
    using value_type = uint8_t;
    using size_type = std::size_t;

private:
    std::vector<uint8_t> data_;
    size_type read_pos_ = 0;

public:
    DataStream() = default;
    explicit DataStream(std::vector<uint8_t> data) : data_(std::move(data)) {}
    DataStream(const uint8_t* data, size_type len) : data_(data, data + len) {}

    /// Unread bytes remaining
    size_type size() const noexcept { return data_.size() - read_pos_; }
    bool empty() const noexcept { return size() == 0; }

    void clear() {
        data_.clear();
        read_pos_ = 0;
    }

    /// Pointer to unread data
    const uint8_t* data() const noexcept { return data_.data() + read_pos_; }

    /// Unread data as a string (storage values and keys)
    std::string str() const {
        return std::string(reinterpret_cast<const char*>(data()), size());
    }

    void Write(const uint8_t* src, size_type len) {
        data_.insert(data_.end(), src, src + len);
    }

    void Write(const char* src, size_type len) {
        Write(reinterpret_cast<const uint8_t*>(src), len);
    }

    void Read(uint8_t* dst, size_type len) {
        if (len > size()) {
            throw std::ios_base::failure("DataStream::Read(): end of data");
        }
        std::memcpy(dst, data_.data() + read_pos_, len);
        read_pos_ += len;
    }

    void Read(char* dst, size_type len) {
        Read(reinterpret_cast<uint8_t*>(dst), len);
    }

    template<typename T>
    DataStream& operator<<(const T& obj);

    template<typename T>
    DataStream& operator>>(T& obj);
};

// ============================================================================
// Low-Level Serialization Functions
// ============================================================================

template<typename Stream>
inline void ser_writedata8(Stream& s, uint8_t obj) {
    s.Write(&obj, 1);
}

template<typename Stream>
inline void ser_writedata16(Stream& s, uint16_t obj) {
    obj = detail::ToLE16(obj);
    s.Write(reinterpret_cast<const uint8_t*>(&obj), 2);
}

template<typename Stream>
inline void ser_writedata32(Stream& s, uint32_t obj) {
    obj = detail::ToLE32(obj);
    s.Write(reinterpret_cast<const uint8_t*>(&obj), 4);
}

template<typename Stream>
inline void ser_writedata64(Stream& s, uint64_t obj) {
    obj = detail::ToLE64(obj);
    s.Write(reinterpret_cast<const uint8_t*>(&obj), 8);
}

/// Big-endian write, used for key components that must sort numerically
template<typename Stream>
inline void ser_writedata64be(Stream& s, uint64_t obj) {
    obj = detail::ToBE64(obj);
    s.Write(reinterpret_cast<const uint8_t*>(&obj), 8);
}

template<typename Stream>
inline uint8_t ser_readdata8(Stream& s) {
    uint8_t obj;
    s.Read(&obj, 1);
    return obj;
}

template<typename Stream>
inline uint16_t ser_readdata16(Stream& s) {
    uint16_t obj;
    s.Read(reinterpret_cast<uint8_t*>(&obj), 2);
    return detail::FromLE16(obj);
}

template<typename Stream>
inline uint32_t ser_readdata32(Stream& s) {
    uint32_t obj;
    s.Read(reinterpret_cast<uint8_t*>(&obj), 4);
    return detail::FromLE32(obj);
}

template<typename Stream>
inline uint64_t ser_readdata64(Stream& s) {
    uint64_t obj;
    s.Read(reinterpret_cast<uint8_t*>(&obj), 8);
    return detail::FromLE64(obj);
}

template<typename Stream>
inline uint64_t ser_readdata64be(Stream& s) {
    uint64_t obj;
    s.Read(reinterpret_cast<uint8_t*>(&obj), 8);
    return detail::FromBE64(obj);
}

// ============================================================================
// CompactSize Encoding
// ============================================================================
//   size <  253        -- 1 byte
//   size <= 0xFFFF     -- 3 bytes (0xFD + 2 bytes little-endian)
//   size <= 0xFFFFFFFF -- 5 bytes (0xFE + 4 bytes little-endian)
//   size >  0xFFFFFFFF -- 9 bytes (0xFF + 8 bytes little-endian)

template<typename Stream>
void WriteCompactSize(Stream& s, uint64_t size) {
    if (size < 253) {
        ser_writedata8(s, static_cast<uint8_t>(size));
    } else if (size <= 0xFFFF) {
        ser_writedata8(s, 0xFD);
        ser_writedata16(s, static_cast<uint16_t>(size));
    } else if (size <= 0xFFFFFFFF) {
        ser_writedata8(s, 0xFE);
        ser_writedata32(s, static_cast<uint32_t>(size));
    } else {
        ser_writedata8(s, 0xFF);
        ser_writedata64(s, size);
    }
}

template<typename Stream>
uint64_t ReadCompactSize(Stream& s) {
    uint8_t marker = ser_readdata8(s);
    uint64_t size = 0;

    if (marker < 253) {
        size = marker;
    } else if (marker == 253) {
        size = ser_readdata16(s);
        if (size < 253) {
            throw std::ios_base::failure("non-canonical ReadCompactSize()");
        }
    } else if (marker == 254) {
        size = ser_readdata32(s);
        if (size < 0x10000) {
            throw std::ios_base::failure("non-canonical ReadCompactSize()");
        }
    } else {
        size = ser_readdata64(s);
        if (size < 0x100000000ULL) {
            throw std::ios_base::failure("non-canonical ReadCompactSize()");
        }
    }

    if (size > MAX_SIZE) {
        throw std::ios_base::failure("ReadCompactSize(): size too large");
    }
    return size;
}

// ============================================================================
// Container Declarations
// ============================================================================

template<typename Stream>
void Serialize(Stream& s, const std::string& str);
template<typename Stream>
void Unserialize(Stream& s, std::string& str);
template<typename Stream>
void Serialize(Stream& s, const std::vector<uint8_t>& v);
template<typename Stream>
void Unserialize(Stream& s, std::vector<uint8_t>& v);
template<typename Stream, typename T>
void Serialize(Stream& s, const std::vector<T>& v);
template<typename Stream, typename T>
void Unserialize(Stream& s, std::vector<T>& v);
template<typename Stream, typename T>
void Serialize(Stream& s, const std::optional<T>& opt);
template<typename Stream, typename T>
void Unserialize(Stream& s, std::optional<T>& opt);
template<typename Stream, typename K, typename V>
void Serialize(Stream& s, const std::pair<K, V>& p);
template<typename Stream, typename K, typename V>
void Unserialize(Stream& s, std::pair<K, V>& p);
template<typename Stream, typename K, typename V>
void Serialize(Stream& s, const std::map<K, V>& m);
template<typename Stream, typename K, typename V>
void Unserialize(Stream& s, std::map<K, V>& m);

// ============================================================================
// Basic Types
// ============================================================================

template<typename Stream>
inline void Serialize(Stream& s, uint8_t a) { ser_writedata8(s, a); }

template<typename Stream>
inline void Unserialize(Stream& s, uint8_t& a) { a = ser_readdata8(s); }

template<typename Stream>
inline void Serialize(Stream& s, uint32_t a) { ser_writedata32(s, a); }

template<typename Stream>
inline void Unserialize(Stream& s, uint32_t& a) { a = ser_readdata32(s); }

template<typename Stream>
inline void Serialize(Stream& s, uint64_t a) { ser_writedata64(s, a); }

template<typename Stream>
inline void Unserialize(Stream& s, uint64_t& a) { a = ser_readdata64(s); }

template<typename Stream>
inline void Serialize(Stream& s, bool a) { ser_writedata8(s, a ? 1 : 0); }

template<typename Stream>
inline void Unserialize(Stream& s, bool& a) {
    uint8_t raw = ser_readdata8(s);
    if (raw > 1) {
        throw std::ios_base::failure("Unserialize(): invalid bool");
    }
    a = (raw == 1);
}

// ============================================================================
// Strings and Byte Vectors
// ============================================================================

template<typename Stream>
void Serialize(Stream& s, const std::string& str) {
    WriteCompactSize(s, str.size());
    if (!str.empty()) {
        s.Write(str.data(), str.size());
    }
}

template<typename Stream>
void Unserialize(Stream& s, std::string& str) {
    uint64_t size = ReadCompactSize(s);
    str.resize(size);
    if (size > 0) {
        s.Read(&str[0], size);
    }
}

template<typename Stream>
void Serialize(Stream& s, const std::vector<uint8_t>& v) {
    WriteCompactSize(s, v.size());
    if (!v.empty()) {
        s.Write(v.data(), v.size());
    }
}

template<typename Stream>
void Unserialize(Stream& s, std::vector<uint8_t>& v) {
    uint64_t size = ReadCompactSize(s);
    v.resize(size);
    if (size > 0) {
        s.Read(v.data(), size);
    }
}

// ============================================================================
// Containers
// ============================================================================

template<typename Stream, typename T>
void Serialize(Stream& s, const std::vector<T>& v) {
    WriteCompactSize(s, v.size());
    for (const auto& item : v) {
        Serialize(s, item);
    }
}

template<typename Stream, typename T>
void Unserialize(Stream& s, std::vector<T>& v) {
    uint64_t size = ReadCompactSize(s);
    v.clear();
    v.reserve(std::min(size, MAX_VECTOR_RESERVE));
    for (uint64_t i = 0; i < size; ++i) {
        T item;
        Unserialize(s, item);
        v.push_back(std::move(item));
    }
}

/// Optional values carry a one-byte presence flag
template<typename Stream, typename T>
void Serialize(Stream& s, const std::optional<T>& opt) {
    Serialize(s, opt.has_value());
    if (opt) {
        Serialize(s, *opt);
    }
}

template<typename Stream, typename T>
void Unserialize(Stream& s, std::optional<T>& opt) {
    bool present = false;
    Unserialize(s, present);
    if (!present) {
        opt.reset();
        return;
    }
    T value;
    Unserialize(s, value);
    opt = std::move(value);
}

template<typename Stream, typename K, typename V>
void Serialize(Stream& s, const std::pair<K, V>& p) {
    Serialize(s, p.first);
    Serialize(s, p.second);
}

template<typename Stream, typename K, typename V>
void Unserialize(Stream& s, std::pair<K, V>& p) {
    Unserialize(s, p.first);
    Unserialize(s, p.second);
}

template<typename Stream, typename K, typename V>
void Serialize(Stream& s, const std::map<K, V>& m) {
    WriteCompactSize(s, m.size());
    for (const auto& entry : m) {
        Serialize(s, entry.first);
        Serialize(s, entry.second);
    }
}

template<typename Stream, typename K, typename V>
void Unserialize(Stream& s, std::map<K, V>& m) {
    uint64_t size = ReadCompactSize(s);
    m.clear();
    for (uint64_t i = 0; i < size; ++i) {
        K key;
        V value;
        Unserialize(s, key);
        Unserialize(s, value);
        if (!m.emplace(std::move(key), std::move(value)).second) {
            throw std::ios_base::failure("Unserialize(): duplicate map key");
        }
    }
}

// ============================================================================
// DataStream Stream Operators
// ============================================================================

template<typename T>
DataStream& DataStream::operator<<(const T& obj) {
    Serialize(*this, obj);
    return *this;
}

template<typename T>
DataStream& DataStream::operator>>(T& obj) {
    Unserialize(*this, obj);
    return *this;
}

} // namespace agora

#endif // AGORA_CORE_SERIALIZE_H
