/**
 * ChunkDrive - Content digests built on libsodium (BLAKE2b via crypto_generichash).
 */
#pragma once

#include <cstddef>
#include <filesystem>
#include <span>
#include <string>

#include <sodium.h>

namespace chunkdrive::crypto
{

    void ensure_sodium_init();

    // Incremental BLAKE2b-256; finish() may be called once.
    class Digest
    {
    public:
        Digest();

        Digest(const Digest &) = delete;
        Digest &operator=(const Digest &) = delete;

        void update(std::span<const std::byte> data);

        std::string finish_hex();

    private:
        crypto_generichash_state state_{};
        bool finished_{false};
    };

    std::string hash_bytes(std::span<const std::byte> data);

    std::string hash_file(const std::filesystem::path &path);

} // namespace chunkdrive::crypto
