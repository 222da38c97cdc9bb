#include "chunkdrive/client/config.hpp"

#include <filesystem>
#include <stdexcept>
#include <string>

namespace chunkdrive::client
{

    namespace
    {

        constexpr const char *kUsage =
            "Usage: chunkdrive-client <server>:<port> <upload FILE | resume | finalize ID | status ID | cleanup>\n"
            "       [--concurrency N] [--retries N] [--backoff-ms MS] [--chunk-size BYTES] [--max-age SECONDS]\n"
            "       [--log FILE]";

        std::string require_value(int &index, int argc, char *argv[], const std::string &flag)
        {
            if (index >= argc)
            {
                throw std::runtime_error(flag + " requires a value");
            }
            return argv[index++];
        }

    } // namespace

    ClientConfig parse_arguments(int argc, char *argv[])
    {
        if (argc < 3)
        {
            throw std::runtime_error(kUsage);
        }

        ClientConfig config;
        int index = 1;
        const std::string endpoint = argv[index++];

        const auto colon_pos = endpoint.rfind(':');
        if (colon_pos == std::string::npos || colon_pos == 0)
        {
            throw std::runtime_error("Expected endpoint format host:port");
        }
        config.host = endpoint.substr(0, colon_pos);
        config.port = static_cast<std::uint16_t>(std::stoi(endpoint.substr(colon_pos + 1)));

        const std::string command = argv[index++];
        if (command == "upload")
        {
            config.command = ClientCommand::Upload;
            config.argument = require_value(index, argc, argv, "upload");
        }
        else if (command == "resume")
        {
            config.command = ClientCommand::Resume;
        }
        else if (command == "finalize")
        {
            config.command = ClientCommand::Finalize;
            config.argument = require_value(index, argc, argv, "finalize");
        }
        else if (command == "status")
        {
            config.command = ClientCommand::Status;
            config.argument = require_value(index, argc, argv, "status");
        }
        else if (command == "cleanup")
        {
            config.command = ClientCommand::Cleanup;
        }
        else
        {
            throw std::runtime_error("Unknown command: " + command + "\n" + kUsage);
        }

        while (index < argc)
        {
            const std::string arg = argv[index++];
            if (arg == "--log")
            {
                config.log_path = std::filesystem::path(require_value(index, argc, argv, arg));
            }
            else if (arg == "--concurrency")
            {
                config.concurrency = static_cast<std::size_t>(std::stoul(require_value(index, argc, argv, arg)));
                if (config.concurrency == 0)
                {
                    throw std::runtime_error("--concurrency must be at least 1");
                }
            }
            else if (arg == "--retries")
            {
                config.max_retries = static_cast<std::uint32_t>(std::stoul(require_value(index, argc, argv, arg)));
            }
            else if (arg == "--backoff-ms")
            {
                config.initial_backoff = std::chrono::milliseconds(std::stoll(require_value(index, argc, argv, arg)));
            }
            else if (arg == "--chunk-size")
            {
                config.chunk_size = std::stoull(require_value(index, argc, argv, arg));
                if (config.chunk_size == 0)
                {
                    throw std::runtime_error("--chunk-size must be positive");
                }
            }
            else if (arg == "--max-age")
            {
                config.max_age_seconds = std::stoull(require_value(index, argc, argv, arg));
            }
            else
            {
                throw std::runtime_error("Unknown argument: " + arg);
            }
        }

        return config;
    }

} // namespace chunkdrive::client
