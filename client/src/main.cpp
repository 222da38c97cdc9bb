#include <cstdlib>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <iterator>
#include <sstream>
#include <string>

#include "chunkdrive/client/config.hpp"
#include "chunkdrive/client/logger.hpp"
#include "chunkdrive/client/pending_upload_store.hpp"
#include "chunkdrive/client/tcp_transport.hpp"
#include "chunkdrive/client/transfer_scheduler.hpp"
#include "chunkdrive/version.hpp"

namespace
{

    using namespace chunkdrive::client;

    std::string human_bytes(double bytes)
    {
        static constexpr const char *kUnits[] = {"B", "KiB", "MiB", "GiB", "TiB"};
        std::size_t unit = 0;
        while (bytes >= 1024.0 && unit + 1 < std::size(kUnits))
        {
            bytes /= 1024.0;
            ++unit;
        }
        std::ostringstream oss;
        oss << std::fixed << std::setprecision(unit == 0 ? 0 : 1) << bytes << ' ' << kUnits[unit];
        return oss.str();
    }

    void print_progress(const TransferStatus &status)
    {
        if (status.state == TransferState::Idle)
        {
            return;
        }
        std::size_t done = 0;
        for (const auto &chunk : status.chunks)
        {
            if (chunk.state == ChunkState::Success)
            {
                ++done;
            }
        }
        std::cout << "\rUploaded " << human_bytes(static_cast<double>(status.uploaded_bytes)) << " / "
                  << human_bytes(static_cast<double>(status.total_bytes)) << " (" << done << '/'
                  << status.chunks.size() << " chunks) " << human_bytes(status.bytes_per_second) << "/s ETA "
                  << static_cast<std::uint64_t>(status.eta_seconds) << "s   " << std::flush;
    }

    bool run_upload(const ClientConfig &config, UploadTransport &transport, PendingUploadStore &pending,
                    Logger &logger, const std::filesystem::path &local_path)
    {
        std::error_code ec;
        const auto total_size = std::filesystem::file_size(local_path, ec);
        if (ec)
        {
            std::cerr << "ERROR: cannot read " << local_path.string() << ": " << ec.message() << std::endl;
            return false;
        }
        const auto filename = local_path.filename().string();
        pending.record(local_path, filename, total_size);

        SchedulerOptions options{
            .concurrency = config.concurrency,
            .max_retries = config.max_retries,
            .initial_backoff = config.initial_backoff,
            .chunk_size = config.chunk_size,
        };
        TransferScheduler scheduler(transport, local_path, filename, options, logger);
        scheduler.on_progress(print_progress);
        scheduler.on_session([&](const std::string &session_id)
                             { pending.set_session(local_path, session_id); });

        const auto result = scheduler.start();
        std::cout << std::endl;
        if (result.state != TransferState::Completed)
        {
            std::cerr << "ERROR: " << result.error.value_or("upload failed") << std::endl;
            if (!result.session_id.empty())
            {
                std::cerr << "Session " << result.session_id << " can be resumed with 'resume'" << std::endl;
            }
            return false;
        }

        pending.remove(local_path);
        std::cout << "OK " << filename << " session=" << result.session_id << std::endl;
        if (result.finalize && result.finalize->hash)
        {
            std::cout << "hash " << *result.finalize->hash << std::endl;
        }
        if (result.finalize && result.finalize->files && !result.finalize->files->empty())
        {
            std::cout << "archive entries:" << std::endl;
            for (const auto &entry : *result.finalize->files)
            {
                std::cout << "  " << entry << std::endl;
            }
        }
        return true;
    }

    bool run_resume(const ClientConfig &config, UploadTransport &transport, PendingUploadStore &pending,
                    Logger &logger)
    {
        const auto entries = pending.entries();
        if (entries.empty())
        {
            std::cout << "No pending uploads" << std::endl;
            return true;
        }
        bool all_ok = true;
        for (const auto &entry : entries)
        {
            if (!std::filesystem::exists(entry.local_path))
            {
                std::cerr << "[warning] " << entry.local_path.string() << " no longer exists; dropping" << std::endl;
                pending.remove(entry.local_path);
                continue;
            }
            std::cout << "> UPLOAD " << entry.local_path.generic_string() << std::endl;
            all_ok = run_upload(config, transport, pending, logger, entry.local_path) && all_ok;
        }
        return all_ok;
    }

} // namespace

int main(int argc, char *argv[])
{
    try
    {
        auto config = parse_arguments(argc, argv);
        Logger logger(config.log_path);
        logger.log("client", "chunkdrive-client ", chunkdrive::version());
        TcpTransport transport(config.host, config.port, logger);
        PendingUploadStore pending;

        bool ok = true;
        switch (config.command)
        {
        case ClientCommand::Upload:
            ok = run_upload(config, transport, pending, logger, std::filesystem::path(config.argument));
            break;
        case ClientCommand::Resume:
            ok = run_resume(config, transport, pending, logger);
            break;
        case ClientCommand::Finalize:
        {
            const auto response = transport.finalize(config.argument);
            std::cout << response.status;
            if (response.hash)
            {
                std::cout << ' ' << *response.hash;
            }
            if (response.message)
            {
                std::cout << " (" << *response.message << ')';
            }
            std::cout << std::endl;
            ok = response.status == "completed";
            break;
        }
        case ClientCommand::Status:
        {
            const auto info = transport.status(config.argument);
            std::cout << info.session_id << ' ' << info.filename << ' '
                      << chunkdrive::protocol::to_string(info.status) << ' ' << info.completed_chunks << '/'
                      << info.total_chunks << " chunks";
            if (info.final_hash)
            {
                std::cout << " hash=" << *info.final_hash;
            }
            std::cout << std::endl;
            break;
        }
        case ClientCommand::Cleanup:
            std::cout << "Cleaned " << transport.cleanup(config.max_age_seconds) << " orphaned uploads" << std::endl;
            break;
        }
        return ok ? EXIT_SUCCESS : EXIT_FAILURE;
    }
    catch (const std::exception &ex)
    {
        std::cerr << "ERROR: " << ex.what() << std::endl;
        return EXIT_FAILURE;
    }
}
