// Copyright (c) 2026 changcheng967. All rights reserved.

#include <reel/core/checksum.hpp>
#include <openssl/evp.h>
#include <array>

namespace reel::core {

std::expected<std::string, std::error_code> md5_hex(std::string_view data) noexcept {
    std::array<unsigned char, EVP_MAX_MD_SIZE> digest{};
    unsigned int digest_len = 0;

    if (EVP_Digest(data.data(), data.size(), digest.data(), &digest_len, EVP_md5(), nullptr) != 1) {
        return std::unexpected(std::make_error_code(std::errc::not_supported));
    }

    static constexpr char HEX[] = "0123456789abcdef";
    try {
        std::string out;
        out.reserve(digest_len * 2);
        for (unsigned int i = 0; i < digest_len; ++i) {
            out += HEX[digest[i] >> 4];
            out += HEX[digest[i] & 0x0f];
        }
        return out;
    } catch (const std::bad_alloc&) {
        return std::unexpected(std::make_error_code(std::errc::not_enough_memory));
    }
}

} // namespace reel::core
