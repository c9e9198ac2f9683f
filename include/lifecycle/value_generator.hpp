#pragma once

#include "core/error.hpp"
#include "core/secure_string.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>

namespace kvault {

enum class Charset : uint8_t {
    ALPHANUMERIC,
    ALPHANUMERIC_SYMBOLS,
    HEX,
    BASE64,
    NUMERIC,
    UPPERCASE,
    LOWERCASE
};

/**
 * @brief Random secret values for rotate
 *
 * Characters are drawn uniformly from the charset: bytes from RAND_bytes are
 * rejected above the largest multiple of the alphabet size.
 */
struct RandomValueGenerator {
    static constexpr size_t kDefaultLength = 32;
    static constexpr size_t kMaxLength = 25 * 1024;

    size_t length = kDefaultLength;
    Charset charset = Charset::ALPHANUMERIC;

    /// VALIDATION for length 0 or above kMaxLength, INTERNAL if the CSPRNG fails.
    [[nodiscard]] Result<SecureString> generate() const;

    [[nodiscard]] static std::string_view alphabet(Charset charset);
    [[nodiscard]] static std::optional<Charset> parse_charset(std::string_view name);
};

} // namespace kvault
