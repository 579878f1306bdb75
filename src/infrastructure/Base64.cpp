#include "infrastructure/Base64.hpp"
#include <array>
#include <cctype>

namespace marklens::infrastructure {

namespace {

constexpr char kAlphabet[] = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

const std::array<int, 256>& ReverseTable() {
    static const std::array<int, 256> table = [] {
        std::array<int, 256> t{};
        t.fill(-1);
        for (int i = 0; i < 64; ++i) {
            t[static_cast<unsigned char>(kAlphabet[i])] = i;
        }
        return t;
    }();
    return table;
}

} // namespace

std::string Base64::Encode(const std::string& bytes) {
    std::string out;
    out.reserve(((bytes.size() + 2) / 3) * 4);

    std::size_t i = 0;
    for (; i + 2 < bytes.size(); i += 3) {
        unsigned int chunk = (static_cast<unsigned char>(bytes[i]) << 16)
                           | (static_cast<unsigned char>(bytes[i + 1]) << 8)
                           | static_cast<unsigned char>(bytes[i + 2]);
        out.push_back(kAlphabet[(chunk >> 18) & 0x3F]);
        out.push_back(kAlphabet[(chunk >> 12) & 0x3F]);
        out.push_back(kAlphabet[(chunk >> 6) & 0x3F]);
        out.push_back(kAlphabet[chunk & 0x3F]);
    }

    std::size_t rest = bytes.size() - i;
    if (rest == 1) {
        unsigned int chunk = static_cast<unsigned char>(bytes[i]) << 16;
        out.push_back(kAlphabet[(chunk >> 18) & 0x3F]);
        out.push_back(kAlphabet[(chunk >> 12) & 0x3F]);
        out += "==";
    } else if (rest == 2) {
        unsigned int chunk = (static_cast<unsigned char>(bytes[i]) << 16)
                           | (static_cast<unsigned char>(bytes[i + 1]) << 8);
        out.push_back(kAlphabet[(chunk >> 18) & 0x3F]);
        out.push_back(kAlphabet[(chunk >> 12) & 0x3F]);
        out.push_back(kAlphabet[(chunk >> 6) & 0x3F]);
        out.push_back('=');
    }
    return out;
}

std::optional<std::string> Base64::Decode(const std::string& text) {
    const auto& table = ReverseTable();
    std::string out;
    out.reserve(text.size() * 3 / 4);

    unsigned int buffer = 0;
    int bits = 0;
    std::size_t padding = 0;
    std::size_t symbols = 0;

    for (char ch : text) {
        unsigned char c = static_cast<unsigned char>(ch);
        if (std::isspace(c)) continue;
        if (c == '=') {
            ++padding;
            continue;
        }
        if (padding > 0 || table[c] < 0) {
            return std::nullopt;
        }
        buffer = (buffer << 6) | static_cast<unsigned int>(table[c]);
        bits += 6;
        ++symbols;
        if (bits >= 8) {
            bits -= 8;
            out.push_back(static_cast<char>((buffer >> bits) & 0xFF));
        }
    }

    if (padding > 2 || (symbols + padding) % 4 == 1) {
        return std::nullopt;
    }
    return out;
}

std::optional<Base64::DataUri> Base64::DecodeDataUri(const std::string& uri) {
    DataUri result;
    std::string payload = uri;

    if (uri.rfind("data:", 0) == 0) {
        std::size_t comma = uri.find(',');
        if (comma == std::string::npos) return std::nullopt;
        std::string meta = uri.substr(5, comma - 5);
        const std::string marker = ";base64";
        if (meta.size() < marker.size() || meta.compare(meta.size() - marker.size(), marker.size(), marker) != 0) {
            return std::nullopt;
        }
        result.mimeType = meta.substr(0, meta.size() - marker.size());
        payload = uri.substr(comma + 1);
    }

    auto decoded = Decode(payload);
    if (!decoded) return std::nullopt;
    result.data = std::move(*decoded);
    return result;
}

} // namespace marklens::infrastructure
