#include "chunkdrive/crypto.hpp"

#include <array>
#include <fstream>
#include <mutex>
#include <stdexcept>
#include <vector>

namespace chunkdrive::crypto
{

    namespace
    {

        std::string to_hex(std::span<const unsigned char> data)
        {
            static constexpr char kHexDigits[] = "0123456789abcdef";
            std::string result(data.size() * 2, '\0');
            for (std::size_t i = 0; i < data.size(); ++i)
            {
                result[2 * i] = kHexDigits[(data[i] >> 4) & 0x0F];
                result[2 * i + 1] = kHexDigits[data[i] & 0x0F];
            }
            return result;
        }

    } // namespace

    void ensure_sodium_init()
    {
        static std::once_flag flag;
        std::call_once(flag, []
                       {
            if (sodium_init() < 0)
            {
                throw std::runtime_error("libsodium initialization failed");
            } });
    }

    Digest::Digest()
    {
        ensure_sodium_init();
        if (crypto_generichash_init(&state_, nullptr, 0, crypto_generichash_BYTES) != 0)
        {
            throw std::runtime_error("crypto_generichash_init failed");
        }
    }

    void Digest::update(std::span<const std::byte> data)
    {
        if (finished_)
        {
            throw std::logic_error("Digest already finished");
        }
        if (crypto_generichash_update(&state_, reinterpret_cast<const unsigned char *>(data.data()), data.size()) != 0)
        {
            throw std::runtime_error("crypto_generichash_update failed");
        }
    }

    std::string Digest::finish_hex()
    {
        if (finished_)
        {
            throw std::logic_error("Digest already finished");
        }
        finished_ = true;
        std::array<unsigned char, crypto_generichash_BYTES> digest{};
        if (crypto_generichash_final(&state_, digest.data(), digest.size()) != 0)
        {
            throw std::runtime_error("crypto_generichash_final failed");
        }
        return to_hex(digest);
    }

    std::string hash_bytes(std::span<const std::byte> data)
    {
        Digest digest;
        digest.update(data);
        return digest.finish_hex();
    }

    std::string hash_file(const std::filesystem::path &path)
    {
        std::ifstream file(path, std::ios::binary);
        if (!file.is_open())
        {
            throw std::runtime_error("Failed to open file for hashing: " + path.string());
        }
        Digest digest;
        std::vector<char> buffer(256 * 1024);
        while (file)
        {
            file.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
            const auto count = static_cast<std::size_t>(file.gcount());
            if (count > 0)
            {
                digest.update(std::as_bytes(std::span(buffer.data(), count)));
            }
        }
        if (file.bad())
        {
            throw std::runtime_error("Read error while hashing: " + path.string());
        }
        return digest.finish_hex();
    }

} // namespace chunkdrive::crypto
