#include "lifecycle/value_generator.hpp"
#include "core/utils.hpp"

#include <openssl/rand.h>

#include <array>
#include <format>
#include <string>

namespace kvault {

std::string_view RandomValueGenerator::alphabet(Charset charset) {
    switch (charset) {
        case Charset::ALPHANUMERIC:
            return "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789";
        case Charset::ALPHANUMERIC_SYMBOLS:
            return "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789"
                   "!@#$%^&*()_+-=[]{}|;:,.<>?";
        case Charset::HEX:
            return "0123456789ABCDEF";
        case Charset::BASE64:
            return "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
        case Charset::NUMERIC:
            return "0123456789";
        case Charset::UPPERCASE:
            return "ABCDEFGHIJKLMNOPQRSTUVWXYZ";
        case Charset::LOWERCASE:
            return "abcdefghijklmnopqrstuvwxyz";
        default:
            return "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789";
    }
}

std::optional<Charset> RandomValueGenerator::parse_charset(std::string_view name) {
    const auto lower = utils::to_lower(name);
    if (lower == "alphanumeric") return Charset::ALPHANUMERIC;
    if (lower == "alphanumeric_symbols" || lower == "alphanumeric-symbols" || lower == "symbols") {
        return Charset::ALPHANUMERIC_SYMBOLS;
    }
    if (lower == "hex") return Charset::HEX;
    if (lower == "base64") return Charset::BASE64;
    if (lower == "numeric") return Charset::NUMERIC;
    if (lower == "uppercase") return Charset::UPPERCASE;
    if (lower == "lowercase") return Charset::LOWERCASE;
    return std::nullopt;
}

Result<SecureString> RandomValueGenerator::generate() const {
    if (length == 0) {
        return Result<SecureString>::error(ErrorCode::VALIDATION,
            "Generated value length must be at least 1");
    }
    if (length > kMaxLength) {
        return Result<SecureString>::error(ErrorCode::VALIDATION, std::format(
            "Generated value length {} exceeds {}", length, kMaxLength));
    }

    const std::string_view chars = alphabet(charset);
    const auto n = static_cast<unsigned>(chars.size());
    // Largest multiple of n that fits in a byte; bytes at or above it are rejected
    const unsigned limit = 256u - (256u % n);

    std::string out;
    out.reserve(length);

    std::array<unsigned char, 64> pool{};
    while (out.size() < length) {
        if (RAND_bytes(pool.data(), static_cast<int>(pool.size())) != 1) {
            OPENSSL_cleanse(pool.data(), pool.size());
            utils::secure_wipe(out);
            return Result<SecureString>::error(ErrorCode::INTERNAL, "RAND_bytes failed");
        }
        for (const unsigned char b : pool) {
            if (b >= limit) continue;
            out += chars[b % n];
            if (out.size() == length) break;
        }
    }
    OPENSSL_cleanse(pool.data(), pool.size());

    return Result<SecureString>::ok(SecureString::adopt(out));
}

} // namespace kvault
