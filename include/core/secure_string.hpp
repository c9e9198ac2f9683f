#pragma once

#include <openssl/crypto.h>

#include <cstddef>
#include <string>
#include <string_view>
#include <utility>

namespace kvault {

/**
 * @brief Move-only owner of sensitive text (secret values, bearer tokens)
 *
 * The whole allocation is overwritten with OPENSSL_cleanse before it is
 * released, on destruction, on wipe(), and on the moved-from side of a move.
 * Copies are explicit via clone().
 */
class SecureString {
public:
    SecureString() = default;
    explicit SecureString(std::string_view text) : data_(text) {}

    // Takes ownership; the caller's buffer is wiped.
    static SecureString adopt(std::string& text) {
        SecureString s(text);
        cleanse(text);
        return s;
    }

    SecureString(const SecureString&) = delete;
    SecureString& operator=(const SecureString&) = delete;

    SecureString(SecureString&& other) noexcept : data_(other.data_) {
        other.wipe();
    }

    SecureString& operator=(SecureString&& other) noexcept {
        if (this != &other) {
            wipe();
            data_ = other.data_;
            other.wipe();
        }
        return *this;
    }

    ~SecureString() { wipe(); }

    [[nodiscard]] SecureString clone() const { return SecureString(view()); }

    [[nodiscard]] std::string_view view() const noexcept { return data_; }
    [[nodiscard]] const char* data() const noexcept { return data_.data(); }
    [[nodiscard]] size_t size() const noexcept { return data_.size(); }
    [[nodiscard]] bool empty() const noexcept { return data_.empty(); }

    void wipe() noexcept { cleanse(data_); }

    bool operator==(const SecureString& other) const noexcept {
        return data_.size() == other.data_.size() &&
               CRYPTO_memcmp(data_.data(), other.data_.data(), data_.size()) == 0;
    }

private:
    static void cleanse(std::string& s) noexcept {
        if (s.capacity() > 0) {
            OPENSSL_cleanse(s.data(), s.capacity());
        }
        s.clear();
    }

    std::string data_;
};

} // namespace kvault
