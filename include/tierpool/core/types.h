// TIERPOOL - Core Types Header
// Copyright (c) 2024 TIERPOOL Developers
// MIT License
//
// Fundamental value types shared by every module: amounts, epochs,
// fixed-width hashes and participant addresses.

#ifndef TIERPOOL_CORE_TYPES_H
#define TIERPOOL_CORE_TYPES_H

#include <array>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <limits>
#include <string>
#include <vector>

namespace tierpool {

// ============================================================================
// Basic Types
// ============================================================================

/// Single byte type
using Byte = uint8_t;

/// Amount in smallest units of the custodied asset
using Amount = int64_t;

/// Externally advanced epoch counter
using Epoch = uint64_t;

/// One whole token in base units
constexpr Amount COIN = 100000000LL;

/// Largest amount any single balance or aggregate may hold
constexpr Amount MAX_AMOUNT = std::numeric_limits<Amount>::max();

/// Check if amount is in valid range
inline bool MoneyRange(Amount value) {
    return value >= 0 && value <= MAX_AMOUNT;
}

/// True when a + b would not fit in an Amount (both non-negative)
inline bool AdditionOverflows(Amount a, Amount b) {
    return b > MAX_AMOUNT - a;
}

/**
 * floor(value * numerator / denominator) without intermediate overflow.
 * All arguments must be non-negative and denominator non-zero; the result
 * must fit in an Amount, which holds whenever numerator <= denominator.
 */
inline Amount MulDiv(Amount value, Amount numerator, Amount denominator) {
    unsigned __int128 product = static_cast<unsigned __int128>(value) *
                                static_cast<unsigned __int128>(numerator);
    return static_cast<Amount>(product / static_cast<unsigned __int128>(denominator));
}

// ============================================================================
// Hash Templates
// ============================================================================

/// Fixed-width opaque byte string, stored and displayed in natural order
template<size_t BITS>
class BaseHash {
public:
    static constexpr size_t SIZE = BITS / 8;

    /// Default constructor - creates null hash
    BaseHash() noexcept {
        data_.fill(0);
    }

    /// Construct from byte array
    explicit BaseHash(const std::array<Byte, SIZE>& data) noexcept
        : data_(data) {}

    /// Construct from raw bytes (short input is zero padded)
    BaseHash(const Byte* data, size_t len) noexcept {
        data_.fill(0);
        if (data && len > 0) {
            std::memcpy(data_.data(), data, len < SIZE ? len : SIZE);
        }
    }

    /// Check if hash is all zeros
    bool IsNull() const noexcept {
        for (auto b : data_) {
            if (b != 0) return false;
        }
        return true;
    }

    /// Set hash to all zeros
    void SetNull() noexcept {
        data_.fill(0);
    }

    constexpr size_t size() const noexcept { return SIZE; }

    Byte& operator[](size_t idx) { return data_[idx]; }
    const Byte& operator[](size_t idx) const { return data_[idx]; }

    Byte* data() noexcept { return data_.data(); }
    const Byte* data() const noexcept { return data_.data(); }

    Byte* begin() noexcept { return data_.data(); }
    const Byte* begin() const noexcept { return data_.data(); }
    Byte* end() noexcept { return data_.data() + SIZE; }
    const Byte* end() const noexcept { return data_.data() + SIZE; }

    bool operator==(const BaseHash& other) const noexcept {
        return data_ == other.data_;
    }

    bool operator!=(const BaseHash& other) const noexcept {
        return !(*this == other);
    }

    bool operator<(const BaseHash& other) const noexcept {
        return data_ < other.data_;
    }

    /// Lowercase hex, first byte first
    std::string ToHex() const;

    /// Parse hex (optional 0x prefix); throws std::invalid_argument
    static BaseHash FromHex(const std::string& hex);

protected:
    std::array<Byte, SIZE> data_;
};

// ============================================================================
// Specific Hash Types
// ============================================================================

/// 256-bit hash (32 bytes)
class Hash256 : public BaseHash<256> {
public:
    using BaseHash<256>::BaseHash;
    Hash256() = default;
    Hash256(const BaseHash<256>& h) : BaseHash<256>(h) {}

    static Hash256 FromHex(const std::string& hex) {
        return Hash256(BaseHash<256>::FromHex(hex));
    }
};

/// 160-bit hash (20 bytes)
class Hash160 : public BaseHash<160> {
public:
    using BaseHash<160>::BaseHash;
    Hash160() = default;
    Hash160(const BaseHash<160>& h) : BaseHash<160>(h) {}

    static Hash160 FromHex(const std::string& hex) {
        return Hash160(BaseHash<160>::FromHex(hex));
    }
};

/// Participant / operator identity. The all-zero value is the null sentinel.
using Address = Hash160;

} // namespace tierpool

#endif // TIERPOOL_CORE_TYPES_H
