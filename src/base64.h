#pragma once

#include <string>
#include <vector>
#include <cstdint>
#include <cstddef>

namespace sharebox {
namespace base64 {

/**
 * Encode binary data with the standard alphabet and '=' padding
 * @param data Pointer to the data
 * @param size Number of bytes
 * @return Encoded text
 */
std::string encode(const uint8_t* data, size_t size);

inline std::string encode(const std::vector<uint8_t>& data) {
    return encode(data.data(), data.size());
}

/**
 * Decode standard-alphabet base64 text.
 * Padding is optional; whitespace is ignored; any other character outside the alphabet fails.
 * @param input Encoded text
 * @param output Decoded bytes (replaced on success)
 * @return true if the input was valid base64
 */
bool decode(const std::string& input, std::vector<uint8_t>& output);

} // namespace base64
} // namespace sharebox
