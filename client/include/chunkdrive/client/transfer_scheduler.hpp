/**
 * ChunkDrive - Client-side parallel chunk upload with retry and progress reporting.
 */
#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <filesystem>
#include <fstream>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "chunkdrive/chunking.hpp"
#include "chunkdrive/client/logger.hpp"
#include "chunkdrive/client/transport.hpp"
#include "chunkdrive/protocol.hpp"

namespace chunkdrive::client
{

    enum class ChunkState
    {
        Pending,
        Uploading,
        Success,
        Error
    };

    enum class TransferState
    {
        Idle,
        Uploading,
        Completed,
        Error
    };

    std::string_view to_string(ChunkState state) noexcept;
    std::string_view to_string(TransferState state) noexcept;

    struct ChunkProgress
    {
        ChunkState state{ChunkState::Pending};
        std::uint32_t attempts{};
    };

    struct TransferStatus
    {
        std::string session_id;
        std::uint64_t total_bytes{};
        std::uint64_t uploaded_bytes{};
        std::vector<ChunkProgress> chunks;
        TransferState state{TransferState::Idle};
        double bytes_per_second{};
        double eta_seconds{};
        std::optional<std::string> error;
        std::optional<protocol::FinalizeResponse> finalize;
    };

    struct SchedulerOptions
    {
        std::size_t concurrency{3};
        // Retries after the first attempt; a chunk is tried at most max_retries + 1 times.
        std::uint32_t max_retries{10};
        std::chrono::milliseconds initial_backoff{1000};
        std::uint64_t chunk_size{kDefaultChunkSize};
    };

    // Hands every queued index to exactly one caller.
    class ChunkQueue
    {
    public:
        void push(std::uint64_t index);
        std::optional<std::uint64_t> pop();
        std::size_t size() const;
        void clear();

    private:
        mutable std::mutex mutex_;
        std::deque<std::uint64_t> indices_;
    };

    /**
     * Uploads one local file through an UploadTransport.
     *
     * start() performs the handshake, skips chunks the server already holds, runs `concurrency`
     * worker threads over the remaining indices and finalizes once every chunk succeeded. A chunk
     * that exhausts its retries (or is rejected by the server) aborts the whole transfer: idle
     * workers stop picking up work and sleeping workers wake early, while in-flight sends finish.
     *
     * The progress callback receives a snapshot after every state change. Calls are serialised but
     * may come from any worker thread; the callback must not throw.
     */
    class TransferScheduler
    {
    public:
        using ProgressCallback = std::function<void(const TransferStatus &)>;
        using SessionCallback = std::function<void(const std::string &)>;

        TransferScheduler(UploadTransport &transport, std::filesystem::path source, std::string filename,
                          SchedulerOptions options, Logger &logger);

        void on_progress(ProgressCallback callback);
        // Invoked on the calling thread once the handshake assigned a session id.
        void on_session(SessionCallback callback);

        TransferStatus start();

        TransferStatus snapshot() const;

    private:
        void worker_loop();
        bool transfer_chunk(std::ifstream &input, std::uint64_t index);
        bool wait_backoff(std::chrono::milliseconds delay);
        void request_abort();
        bool aborted() const noexcept { return abort_.load(); }

        void set_chunk_state(std::uint64_t index, ChunkState state);
        void mark_chunk_success(std::uint64_t index, std::uint64_t bytes);
        void mark_chunk_failed(std::uint64_t index, const std::string &message);
        TransferStatus fail(const std::string &message);
        TransferStatus snapshot_locked() const;
        void emit();

        UploadTransport &transport_;
        std::filesystem::path source_;
        std::string filename_;
        SchedulerOptions options_;
        Logger &logger_;
        ProgressCallback progress_;
        SessionCallback session_callback_;

        mutable std::mutex state_mutex_;
        std::string session_id_;
        std::uint64_t total_bytes_{};
        std::uint64_t uploaded_bytes_{};
        std::vector<ChunkProgress> chunks_;
        TransferState state_{TransferState::Idle};
        std::optional<std::string> error_;
        std::optional<protocol::FinalizeResponse> finalize_;
        std::chrono::steady_clock::time_point started_{};

        ChunkQueue queue_;
        std::atomic<bool> abort_{false};
        std::mutex backoff_mutex_;
        std::condition_variable backoff_cv_;
        std::mutex callback_mutex_;
    };

} // namespace chunkdrive::client
