#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <functional>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "chunkdrive/server/server.hpp"
#include "chunkdrive/version.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace
{

    void print_usage(const char *program_name)
    {
        std::cout << "ChunkDrive server " << chunkdrive::version() << "\n"
                  << "Usage: " << program_name
                  << " --port <PORT> --root <ROOT> [--address <ADDRESS>] [--threads <N>] [--chunk-size <bytes>]\n"
                     "       [--orphan-age <seconds>] [--cleanup-interval <seconds>] [--store json|sqlite]\n"
                     "       [--no-archive-check] [--log <FILE>] [--verbose]\n";
    }

    std::optional<std::string> read_option(int &index, int argc, char *argv[])
    {
        if (index + 1 >= argc)
        {
            return std::nullopt;
        }
        ++index;
        return std::string(argv[index]);
    }

} // namespace

int main(int argc, char *argv[])
{
    using chunkdrive::server::Server;
    using chunkdrive::server::ServerConfig;
    using chunkdrive::server::StoreBackend;

    ServerConfig config;
    bool verbose = false;

    try
    {
        for (int i = 1; i < argc; ++i)
        {
            const std::string arg = argv[i];
            // Options taking a value share the same missing-value handling.
            const auto with_value = [&](const std::function<void(const std::string &)> &apply)
            {
                auto value = read_option(i, argc, argv);
                if (!value)
                {
                    std::cerr << "Missing value for " << arg << std::endl;
                    print_usage(argv[0]);
                    std::exit(EXIT_FAILURE);
                }
                apply(*value);
            };

            if (arg == "--port")
            {
                with_value([&](const std::string &value)
                           { config.port = static_cast<std::uint16_t>(std::stoi(value)); });
            }
            else if (arg == "--root")
            {
                with_value([&](const std::string &value)
                           { config.root = std::filesystem::path(value); });
            }
            else if (arg == "--address")
            {
                with_value([&](const std::string &value)
                           { config.address = value; });
            }
            else if (arg == "--threads")
            {
                with_value([&](const std::string &value)
                           { config.worker_threads = static_cast<std::size_t>(std::stoul(value)); });
            }
            else if (arg == "--chunk-size")
            {
                with_value([&](const std::string &value)
                           { config.chunk_size = std::stoull(value); });
            }
            else if (arg == "--orphan-age")
            {
                with_value([&](const std::string &value)
                           { config.orphan_age = std::chrono::seconds(std::stoll(value)); });
            }
            else if (arg == "--cleanup-interval")
            {
                with_value([&](const std::string &value)
                           { config.cleanup_interval = std::chrono::seconds(std::stoll(value)); });
            }
            else if (arg == "--store")
            {
                with_value([&](const std::string &value)
                           {
                    if (value == "json")
                    {
                        config.store = StoreBackend::Json;
                    }
                    else if (value == "sqlite")
                    {
                        config.store = StoreBackend::Sqlite;
                    }
                    else
                    {
                        throw std::invalid_argument("Unknown store backend: " + value);
                    } });
            }
            else if (arg == "--no-archive-check")
            {
                config.archive_check = false;
            }
            else if (arg == "--log")
            {
                with_value([&](const std::string &value)
                           { config.log_file = std::filesystem::path(value); });
            }
            else if (arg == "--verbose")
            {
                verbose = true;
            }
            else if (arg == "--help" || arg == "-h")
            {
                print_usage(argv[0]);
                return EXIT_SUCCESS;
            }
            else
            {
                std::cerr << "Unknown argument: " << arg << std::endl;
                print_usage(argv[0]);
                return EXIT_FAILURE;
            }
        }
    }
    catch (const std::exception &ex)
    {
        std::cerr << "Invalid argument: " << ex.what() << std::endl;
        print_usage(argv[0]);
        return EXIT_FAILURE;
    }

    try
    {
        chunkdrive::server::validate_config(config);
    }
    catch (const std::invalid_argument &ex)
    {
        std::cerr << ex.what() << std::endl;
        print_usage(argv[0]);
        return EXIT_FAILURE;
    }

    try
    {
        std::vector<spdlog::sink_ptr> sinks;
        sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
        if (config.log_file)
        {
            sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(config.log_file->string(), true));
        }
        auto logger = std::make_shared<spdlog::logger>("server", sinks.begin(), sinks.end());
        logger->set_level(verbose ? spdlog::level::debug : spdlog::level::info);
        logger->set_pattern("%Y-%m-%d %H:%M:%S [%^%l%$] %v");
        spdlog::set_default_logger(logger);
        spdlog::info("Starting ChunkDrive server {} on {}:{}", chunkdrive::version(), config.address, config.port);

        Server server(std::move(config));
        server.run();
    }
    catch (const std::exception &ex)
    {
        std::cerr << "Server failed: " << ex.what() << std::endl;
        spdlog::error("Fatal error: {}", ex.what());
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
