#include "crypto/digest.hpp"

#include <sodium.h>

namespace atelier::crypto {

Result<void, Error> init() {
    // 0 = initialized now, 1 = already initialized.
    if (sodium_init() < 0) {
        return Result<void, Error>::err(Error{"Failed to initialize libsodium"});
    }
    return Result<void, Error>::ok();
}

Digest digest(std::string_view bytes) {
    Digest out{};
    crypto_generichash(out.data(), out.size(),
                       reinterpret_cast<const unsigned char*>(bytes.data()), bytes.size(),
                       nullptr, 0);
    return out;
}

std::string to_hex(const Digest& value) {
    std::string hex(value.size() * 2 + 1, '\0');
    sodium_bin2hex(hex.data(), hex.size(), value.data(), value.size());
    hex.resize(value.size() * 2);
    return hex;
}

} // namespace atelier::crypto
