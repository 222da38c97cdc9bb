#include "chunkdrive/server/session_store.hpp"

#include <array>

#include <sodium.h>

#include "chunkdrive/crypto.hpp"

namespace chunkdrive::server
{

    std::string generate_session_id()
    {
        crypto::ensure_sodium_init();
        std::array<unsigned char, 16> raw{};
        randombytes_buf(raw.data(), raw.size());
        std::array<char, raw.size() * 2 + 1> hex{};
        sodium_bin2hex(hex.data(), hex.size(), raw.data(), raw.size());
        return std::string(hex.data(), raw.size() * 2);
    }

} // namespace chunkdrive::server
