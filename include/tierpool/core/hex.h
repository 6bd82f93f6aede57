// TIERPOOL - Hex Encoding/Decoding Utilities
// Copyright (c) 2024 TIERPOOL Developers
// MIT License

#ifndef TIERPOOL_CORE_HEX_H
#define TIERPOOL_CORE_HEX_H

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace tierpool {

// Use uint8_t directly to avoid circular dependency with types.h
using HexByte = uint8_t;

/// Convert bytes to lowercase hex string
std::string BytesToHex(const HexByte* data, size_t len);
std::string BytesToHex(const std::vector<HexByte>& data);

template<size_t N>
std::string BytesToHex(const std::array<HexByte, N>& data) {
    return BytesToHex(data.data(), N);
}

/// Convert hex string to bytes (0x prefix allowed); throws std::invalid_argument
std::vector<HexByte> HexToBytes(const std::string& hex);

/// Check if string is valid, even-length hex (0x prefix allowed)
bool IsValidHex(const std::string& str);

/// Remove a leading "0x" / "0X"
std::string StripHexPrefix(const std::string& hex);

} // namespace tierpool

#endif // TIERPOOL_CORE_HEX_H
