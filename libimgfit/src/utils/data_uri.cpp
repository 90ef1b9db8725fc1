#include "../../include/data_uri.hpp"
#include "../../include/errors.hpp"
#include "../../include/image_types.hpp"
#include <algorithm>
#include <array>
#include <cctype>

namespace {

constexpr std::string_view kBase64Marker = "base64,";
constexpr std::string_view kAlphabet =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

// reverse lookup, -1 for characters outside the alphabet
constexpr std::array<int, 256> make_decode_table() {
    std::array<int, 256> table{};
    table.fill(-1);
    for (std::size_t i = 0; i < kAlphabet.size(); ++i) {
        table[static_cast<unsigned char>(kAlphabet[i])] = static_cast<int>(i);
    }
    return table;
}

constexpr auto kDecodeTable = make_decode_table();

bool is_space(const char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

std::string_view trim(std::string_view s) {
    while (!s.empty() && is_space(s.front())) s.remove_prefix(1);
    while (!s.empty() && is_space(s.back())) s.remove_suffix(1);
    return s;
}

bool iequals(const std::string_view a, const std::string_view b) {
    return std::equal(a.begin(), a.end(), b.begin(), b.end(),
                      [](const char x, const char y) {
                          return std::tolower(static_cast<unsigned char>(x)) ==
                                 std::tolower(static_cast<unsigned char>(y));
                      });
}

} // namespace

namespace imgfit {

std::optional<std::size_t> estimate_bytes_from_data_uri(const std::string_view data_uri) {
    const auto index = data_uri.find(kBase64Marker);
    if (index == std::string_view::npos) {
        return std::nullopt;
    }

    const std::string_view payload = trim(data_uri.substr(index + kBase64Marker.size()));
    if (payload.empty()) {
        return 0;
    }

    long long padding = 0;
    if (payload.ends_with("==")) {
        padding = 2;
    } else if (payload.ends_with('=')) {
        padding = 1;
    }

    const long long estimate = static_cast<long long>(payload.size()) * 3 / 4 - padding;
    return static_cast<std::size_t>(std::max(0LL, estimate));
}

std::string base64_encode(const std::span<const std::uint8_t> data) {
    std::string out;
    out.reserve((data.size() + 2) / 3 * 4);

    std::size_t i = 0;
    for (; i + 3 <= data.size(); i += 3) {
        const std::uint32_t triple = (static_cast<std::uint32_t>(data[i]) << 16) |
                                     (static_cast<std::uint32_t>(data[i + 1]) << 8) |
                                     static_cast<std::uint32_t>(data[i + 2]);
        out.push_back(kAlphabet[(triple >> 18) & 0x3F]);
        out.push_back(kAlphabet[(triple >> 12) & 0x3F]);
        out.push_back(kAlphabet[(triple >> 6) & 0x3F]);
        out.push_back(kAlphabet[triple & 0x3F]);
    }

    const std::size_t rest = data.size() - i;
    if (rest == 1) {
        const std::uint32_t v = static_cast<std::uint32_t>(data[i]) << 16;
        out.push_back(kAlphabet[(v >> 18) & 0x3F]);
        out.push_back(kAlphabet[(v >> 12) & 0x3F]);
        out.append("==");
    } else if (rest == 2) {
        const std::uint32_t v = (static_cast<std::uint32_t>(data[i]) << 16) |
                                (static_cast<std::uint32_t>(data[i + 1]) << 8);
        out.push_back(kAlphabet[(v >> 18) & 0x3F]);
        out.push_back(kAlphabet[(v >> 12) & 0x3F]);
        out.push_back(kAlphabet[(v >> 6) & 0x3F]);
        out.push_back('=');
    }
    return out;
}

std::vector<std::uint8_t> base64_decode(const std::string_view encoded) {
    std::vector<std::uint8_t> out;
    out.reserve(encoded.size() / 4 * 3);

    std::uint32_t acc = 0;
    int bits = 0;
    int sextets = 0;
    int padding = 0;

    for (const char c : encoded) {
        if (is_space(c)) {
            continue;
        }
        if (c == '=') {
            ++padding;
            if (padding > 2) {
                throw DataUriError("base64: too much padding");
            }
            continue;
        }
        if (padding > 0) {
            throw DataUriError("base64: data after padding");
        }
        const int value = kDecodeTable[static_cast<unsigned char>(c)];
        if (value < 0) {
            throw DataUriError(std::string("base64: invalid character '") + c + "'");
        }
        acc = (acc << 6) | static_cast<std::uint32_t>(value);
        bits += 6;
        ++sextets;
        if (bits >= 8) {
            bits -= 8;
            out.push_back(static_cast<std::uint8_t>((acc >> bits) & 0xFF));
        }
    }

    // a lone trailing sextet cannot encode a byte
    if (sextets % 4 == 1) {
        throw DataUriError("base64: truncated input");
    }
    if (padding > 0 && (sextets + padding) % 4 != 0) {
        throw DataUriError("base64: invalid padding");
    }
    return out;
}

std::string make_data_uri(const std::string_view mime_type,
                          const std::span<const std::uint8_t> data) {
    std::string uri = "data:";
    uri.append(mime_type);
    uri.append(";base64,");
    uri.append(base64_encode(data));
    return uri;
}

DataUri parse_data_uri(std::string_view uri) {
    uri = trim(uri);
    constexpr std::string_view scheme = "data:";
    if (uri.size() < scheme.size() || !iequals(uri.substr(0, scheme.size()), scheme)) {
        throw DataUriError("not a data URI");
    }
    uri.remove_prefix(scheme.size());

    const auto comma = uri.find(',');
    if (comma == std::string_view::npos) {
        throw DataUriError("data URI has no payload separator");
    }
    std::string_view header = uri.substr(0, comma);
    const std::string_view payload = uri.substr(comma + 1);

    constexpr std::string_view base64_param = ";base64";
    if (header.size() < base64_param.size() ||
        !iequals(header.substr(header.size() - base64_param.size()), base64_param)) {
        throw DataUriError("only base64 data URIs are supported");
    }
    header.remove_suffix(base64_param.size());

    DataUri result;
    result.mime_type = std::string(trim(header.substr(0, header.find(';'))));
    std::ranges::transform(result.mime_type, result.mime_type.begin(),
                           [](const unsigned char c) { return static_cast<char>(std::tolower(c)); });
    result.bytes = base64_decode(payload);
    return result;
}

std::string OptimizedResult::data_uri() const {
    return make_data_uri(mime_type, data);
}

} // namespace imgfit
