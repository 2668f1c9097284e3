#include <quarry/core/base64.h>

#include <array>

namespace quarry {

namespace {

constexpr char kAlphabet[] = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

constexpr std::array<int8_t, 256> makeReverseTable() {
    std::array<int8_t, 256> table{};
    for (auto& v : table) {
        v = -1;
    }
    for (int i = 0; i < 64; ++i) {
        table[static_cast<unsigned char>(kAlphabet[i])] = static_cast<int8_t>(i);
    }
    return table;
}

constexpr auto kReverse = makeReverseTable();

} // namespace

std::string base64Encode(std::span<const uint8_t> data) {
    std::string out;
    out.reserve(((data.size() + 2) / 3) * 4);
    const size_t len = data.size();
    for (size_t i = 0; i < len; i += 3) {
        uint32_t n = static_cast<uint32_t>(data[i]) << 16;
        if (i + 1 < len)
            n |= static_cast<uint32_t>(data[i + 1]) << 8;
        if (i + 2 < len)
            n |= static_cast<uint32_t>(data[i + 2]);

        out += kAlphabet[(n >> 18) & 0x3F];
        out += kAlphabet[(n >> 12) & 0x3F];
        out += (i + 1 < len) ? kAlphabet[(n >> 6) & 0x3F] : '=';
        out += (i + 2 < len) ? kAlphabet[n & 0x3F] : '=';
    }
    return out;
}

Result<std::vector<uint8_t>> base64Decode(std::string_view encoded) {
    if (encoded.size() % 4 != 0) {
        return Error{ErrorCode::Parsing, "Malformed base64: length is not a multiple of 4"};
    }
    std::vector<uint8_t> out;
    out.reserve(encoded.size() / 4 * 3);
    for (size_t i = 0; i < encoded.size(); i += 4) {
        uint32_t n = 0;
        int padding = 0;
        for (size_t k = 0; k < 4; ++k) {
            char c = encoded[i + k];
            if (c == '=') {
                if (i + 4 != encoded.size() || k < 2) {
                    return Error{ErrorCode::Parsing, "Malformed base64: unexpected padding"};
                }
                ++padding;
                n <<= 6;
                continue;
            }
            if (padding > 0) {
                return Error{ErrorCode::Parsing, "Malformed base64: data after padding"};
            }
            auto v = kReverse[static_cast<unsigned char>(c)];
            if (v < 0) {
                return Error{ErrorCode::Parsing, "Malformed base64: invalid character"};
            }
            n = (n << 6) | static_cast<uint32_t>(v);
        }
        out.push_back(static_cast<uint8_t>((n >> 16) & 0xFF));
        if (padding < 2)
            out.push_back(static_cast<uint8_t>((n >> 8) & 0xFF));
        if (padding < 1)
            out.push_back(static_cast<uint8_t>(n & 0xFF));
    }
    return out;
}

} // namespace quarry
