#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

#include "chunkdrive/chunking.hpp"

namespace chunkdrive::server
{

    enum class StoreBackend
    {
        Json,
        Sqlite
    };

    struct ServerConfig
    {
        std::string address{"0.0.0.0"};
        std::uint16_t port{0};
        std::filesystem::path root;
        std::size_t worker_threads{0};
        std::uint64_t chunk_size{kDefaultChunkSize};
        std::chrono::seconds orphan_age{std::chrono::hours{24}};
        // Zero disables the periodic sweep; CLEANUP requests still work.
        std::chrono::seconds cleanup_interval{std::chrono::hours{1}};
        StoreBackend store{StoreBackend::Json};
        bool archive_check{true};
        std::optional<std::filesystem::path> log_file;
    };

    // Throws std::invalid_argument naming the first unusable setting.
    void validate_config(const ServerConfig &config);

} // namespace chunkdrive::server
