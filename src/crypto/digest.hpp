#pragma once

#include "core/result.hpp"
#include <array>
#include <cstdint>
#include <string>
#include <string_view>

namespace atelier::crypto {

constexpr size_t DIGEST_SIZE = 32;

using Digest = std::array<uint8_t, DIGEST_SIZE>;

/**
 * Initialize libsodium. Safe to call more than once.
 */
[[nodiscard]] Result<void, Error> init();

/**
 * BLAKE2b-256 of `bytes`. Requires init().
 */
[[nodiscard]] Digest digest(std::string_view bytes);

[[nodiscard]] std::string to_hex(const Digest& value);

/**
 * Hex digest, the form stored in sync records.
 */
[[nodiscard]] inline std::string digest_hex(std::string_view bytes) {
    return to_hex(digest(bytes));
}

} // namespace atelier::crypto
