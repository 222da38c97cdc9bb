#pragma once

#include <filesystem>
#include <iterator>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include <spdlog/logger.h>
#include <spdlog/spdlog.h>

namespace chunkdrive::client
{

    /**
     * Transfer log of the client, written to --log when given. Lines carry a tag naming the
     * concern (rpc, upload, retry, chunk) and the arguments concatenated as the message.
     * Without a usable path every call is discarded.
     */
    class Logger
    {
    public:
        explicit Logger(const std::optional<std::filesystem::path> &path);

        template <typename... Args>
        void log(std::string_view tag, Args &&...args)
        {
            write(spdlog::level::info, tag, std::forward<Args>(args)...);
        }

        // Recoverable trouble, such as a chunk attempt that will be retried.
        template <typename... Args>
        void warn(std::string_view tag, Args &&...args)
        {
            write(spdlog::level::warn, tag, std::forward<Args>(args)...);
        }

        template <typename... Args>
        void error(std::string_view tag, Args &&...args)
        {
            write(spdlog::level::err, tag, std::forward<Args>(args)...);
        }

    private:
        template <typename... Args>
        void write(spdlog::level::level_enum level, std::string_view tag, Args &&...args)
        {
            if (!sink_->should_log(level))
            {
                return;
            }
            spdlog::fmt_lib::memory_buffer message;
            (spdlog::fmt_lib::format_to(std::back_inserter(message), "{}", std::forward<Args>(args)), ...);
            sink_->log(level, "[{}] {}", tag, std::string_view(message.data(), message.size()));
        }

        std::shared_ptr<spdlog::logger> sink_;
    };

} // namespace chunkdrive::client
