/**
 * @file data_uri.hpp
 * @brief Base64 and "data:" URI helpers.
 */

#ifndef IMGFIT_DATA_URI_HPP
#define IMGFIT_DATA_URI_HPP

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace imgfit {

/**
 * @brief Payload of a parsed data URI.
 */
struct DataUri {
    std::string mime_type;           ///< Media type, empty if the URI omits it
    std::vector<std::uint8_t> bytes; ///< Decoded payload
};

/**
 * @brief Byte length a base64 data URI decodes to, computed from its length only.
 *
 * Locates the "base64," marker, trims surrounding whitespace from the
 * payload and returns floor(len * 3 / 4 - pad), where pad is the number
 * of trailing '=' characters (0, 1 or 2). An empty payload yields 0.
 *
 * @param data_uri Any string containing a base64 payload after "base64,".
 * @return The decoded byte count, or std::nullopt if the marker is absent.
 */
[[nodiscard]] std::optional<std::size_t> estimate_bytes_from_data_uri(std::string_view data_uri);

/**
 * @brief Standard base64 (RFC 4648, padded) encoding.
 */
[[nodiscard]] std::string base64_encode(std::span<const std::uint8_t> data);

/**
 * @brief Decodes standard padded or unpadded base64. ASCII whitespace is skipped.
 * @throws DataUriError on characters outside the alphabet or misplaced padding.
 */
[[nodiscard]] std::vector<std::uint8_t> base64_decode(std::string_view encoded);

/**
 * @brief Builds "data:<mime_type>;base64,<payload>".
 */
[[nodiscard]] std::string make_data_uri(std::string_view mime_type,
                                        std::span<const std::uint8_t> data);

/**
 * @brief Parses "data:[<mime>][;param=value]*;base64,<payload>".
 * @throws DataUriError if the scheme is missing, the payload is not base64
 * encoded or cannot be decoded.
 */
[[nodiscard]] DataUri parse_data_uri(std::string_view uri);

} // namespace imgfit

#endif // IMGFIT_DATA_URI_HPP
