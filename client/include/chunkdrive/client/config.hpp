#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

#include "chunkdrive/chunking.hpp"

namespace chunkdrive::client
{

    enum class ClientCommand
    {
        Upload,
        Resume,
        Finalize,
        Cleanup,
        Status
    };

    struct ClientConfig
    {
        std::string host;
        std::uint16_t port{};
        ClientCommand command{ClientCommand::Upload};
        // Local file for upload, session id for finalize/status.
        std::string argument;
        std::size_t concurrency{3};
        std::uint32_t max_retries{10};
        std::chrono::milliseconds initial_backoff{1000};
        std::uint64_t chunk_size{kDefaultChunkSize};
        std::optional<std::uint64_t> max_age_seconds;
        std::optional<std::filesystem::path> log_path;
    };

    ClientConfig parse_arguments(int argc, char *argv[]);

} // namespace chunkdrive::client
