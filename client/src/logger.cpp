#include "chunkdrive/client/logger.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/null_sink.h>

#include <iostream>
#include <vector>

namespace chunkdrive::client
{

    Logger::Logger(const std::optional<std::filesystem::path> &path)
    {
        std::vector<spdlog::sink_ptr> sinks;
        try
        {
            if (path)
            {
                sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(path->string(), true));
            }
        }
        catch (const spdlog::spdlog_ex &ex)
        {
            std::cerr << "[warning] cannot open log file: " << ex.what() << std::endl;
            sinks.clear();
        }
        if (sinks.empty())
        {
            sinks.push_back(std::make_shared<spdlog::sinks::null_sink_mt>());
        }
        sink_ = std::make_shared<spdlog::logger>("client", sinks.begin(), sinks.end());
        sink_->set_pattern("%Y-%m-%d %H:%M:%S.%e [%l] %v");
        sink_->set_level(spdlog::level::info);
        // Retries and failures reach the file even if the process dies right after.
        sink_->flush_on(spdlog::level::warn);
    }

} // namespace chunkdrive::client
