#include "base64.h"
#include <array>

namespace sharebox {
namespace base64 {

namespace {

const char kAlphabet[] = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

// -1: invalid, -2: padding, -3: whitespace
const std::array<int8_t, 256>& decode_table() {
    static const std::array<int8_t, 256> table = [] {
        std::array<int8_t, 256> t{};
        t.fill(-1);
        for (int i = 0; i < 64; i++) {
            t[static_cast<unsigned char>(kAlphabet[i])] = static_cast<int8_t>(i);
        }
        t[static_cast<unsigned char>('=')] = -2;
        t[static_cast<unsigned char>(' ')] = -3;
        t[static_cast<unsigned char>('\t')] = -3;
        t[static_cast<unsigned char>('\r')] = -3;
        t[static_cast<unsigned char>('\n')] = -3;
        return t;
    }();
    return table;
}

} // anonymous namespace

std::string encode(const uint8_t* data, size_t size) {
    std::string result;
    result.reserve(((size + 2) / 3) * 4);
    
    size_t i = 0;
    for (; i + 2 < size; i += 3) {
        uint32_t triple = (static_cast<uint32_t>(data[i]) << 16) |
                          (static_cast<uint32_t>(data[i + 1]) << 8) |
                          static_cast<uint32_t>(data[i + 2]);
        result += kAlphabet[(triple >> 18) & 0x3F];
        result += kAlphabet[(triple >> 12) & 0x3F];
        result += kAlphabet[(triple >> 6) & 0x3F];
        result += kAlphabet[triple & 0x3F];
    }
    
    size_t remaining = size - i;
    if (remaining == 1) {
        uint32_t triple = static_cast<uint32_t>(data[i]) << 16;
        result += kAlphabet[(triple >> 18) & 0x3F];
        result += kAlphabet[(triple >> 12) & 0x3F];
        result += "==";
    } else if (remaining == 2) {
        uint32_t triple = (static_cast<uint32_t>(data[i]) << 16) |
                          (static_cast<uint32_t>(data[i + 1]) << 8);
        result += kAlphabet[(triple >> 18) & 0x3F];
        result += kAlphabet[(triple >> 12) & 0x3F];
        result += kAlphabet[(triple >> 6) & 0x3F];
        result += '=';
    }
    
    return result;
}

bool decode(const std::string& input, std::vector<uint8_t>& output) {
    const auto& table = decode_table();
    
    std::vector<uint8_t> result;
    result.reserve((input.size() / 4) * 3);
    
    uint32_t accumulator = 0;
    int bits_collected = 0;
    size_t symbols = 0;
    size_t padding = 0;
    
    for (char ch : input) {
        int8_t value = table[static_cast<unsigned char>(ch)];
        if (value == -3) {
            continue;
        }
        if (value == -1) {
            return false;
        }
        if (value == -2) {
            padding++;
            continue;
        }
        if (padding > 0) {
            // Data after padding
            return false;
        }
        
        accumulator = (accumulator << 6) | static_cast<uint32_t>(value);
        bits_collected += 6;
        symbols++;
        if (bits_collected >= 8) {
            bits_collected -= 8;
            result.push_back(static_cast<uint8_t>((accumulator >> bits_collected) & 0xFF));
        }
    }
    
    // A single trailing symbol cannot encode a byte
    if (symbols % 4 == 1 || padding > 2) {
        return false;
    }
    if (padding > 0 && (symbols + padding) % 4 != 0) {
        return false;
    }
    
    output.swap(result);
    return true;
}

} // namespace base64
} // namespace sharebox
