#include "chunkdrive/client/transfer_scheduler.hpp"

#include <algorithm>
#include <set>
#include <stdexcept>
#include <thread>

namespace chunkdrive::client
{

    std::string_view to_string(ChunkState state) noexcept
    {
        switch (state)
        {
        case ChunkState::Pending:
            return "PENDING";
        case ChunkState::Uploading:
            return "UPLOADING";
        case ChunkState::Success:
            return "SUCCESS";
        case ChunkState::Error:
            return "ERROR";
        }
        return "UNKNOWN";
    }

    std::string_view to_string(TransferState state) noexcept
    {
        switch (state)
        {
        case TransferState::Idle:
            return "IDLE";
        case TransferState::Uploading:
            return "UPLOADING";
        case TransferState::Completed:
            return "COMPLETED";
        case TransferState::Error:
            return "ERROR";
        }
        return "UNKNOWN";
    }

    void ChunkQueue::push(std::uint64_t index)
    {
        std::lock_guard lock(mutex_);
        indices_.push_back(index);
    }

    std::optional<std::uint64_t> ChunkQueue::pop()
    {
        std::lock_guard lock(mutex_);
        if (indices_.empty())
        {
            return std::nullopt;
        }
        const auto index = indices_.front();
        indices_.pop_front();
        return index;
    }

    std::size_t ChunkQueue::size() const
    {
        std::lock_guard lock(mutex_);
        return indices_.size();
    }

    void ChunkQueue::clear()
    {
        std::lock_guard lock(mutex_);
        indices_.clear();
    }

    TransferScheduler::TransferScheduler(UploadTransport &transport, std::filesystem::path source, std::string filename,
                                         SchedulerOptions options, Logger &logger)
        : transport_(transport),
          source_(std::move(source)),
          filename_(std::move(filename)),
          options_(options),
          logger_(logger)
    {
        if (options_.chunk_size == 0)
        {
            throw std::invalid_argument("Chunk size must be positive");
        }
        options_.concurrency = std::max<std::size_t>(options_.concurrency, 1);
    }

    void TransferScheduler::on_progress(ProgressCallback callback)
    {
        progress_ = std::move(callback);
    }

    void TransferScheduler::on_session(SessionCallback callback)
    {
        session_callback_ = std::move(callback);
    }

    TransferStatus TransferScheduler::start()
    {
        std::error_code ec;
        const auto total_size = std::filesystem::file_size(source_, ec);
        if (ec)
        {
            return fail("Cannot read " + source_.string() + ": " + ec.message());
        }
        const auto total_chunks = chunk_count(total_size, options_.chunk_size);
        // Indices an aborted earlier run never picked up.
        queue_.clear();
        {
            std::lock_guard lock(state_mutex_);
            total_bytes_ = total_size;
            uploaded_bytes_ = 0;
            chunks_.assign(total_chunks, ChunkProgress{});
            state_ = TransferState::Uploading;
            error_.reset();
            finalize_.reset();
            started_ = std::chrono::steady_clock::now();
        }
        abort_ = false;
        emit();

        protocol::HandshakeResponse handshake;
        try
        {
            handshake = transport_.handshake(protocol::HandshakeRequest{
                .filename = filename_,
                .total_size = total_size,
                .total_chunks = total_chunks,
            });
        }
        catch (const std::exception &ex)
        {
            return fail(std::string("Handshake failed: ") + ex.what());
        }
        logger_.log("upload", "session=", handshake.session_id, " existing=", handshake.existing_chunks.size(), '/',
                    total_chunks);

        const std::set<std::uint64_t> existing(handshake.existing_chunks.begin(), handshake.existing_chunks.end());
        {
            std::lock_guard lock(state_mutex_);
            session_id_ = handshake.session_id;
            for (std::uint64_t index = 0; index < total_chunks; ++index)
            {
                if (existing.contains(index))
                {
                    chunks_[index].state = ChunkState::Success;
                    uploaded_bytes_ += chunk_length(index, total_size, options_.chunk_size);
                }
                else
                {
                    queue_.push(index);
                }
            }
        }
        if (session_callback_)
        {
            session_callback_(handshake.session_id);
        }
        emit();

        const auto worker_count = std::min(options_.concurrency, queue_.size());
        std::vector<std::thread> workers;
        workers.reserve(worker_count);
        for (std::size_t i = 0; i < worker_count; ++i)
        {
            workers.emplace_back([this]
                                 { worker_loop(); });
        }
        for (auto &worker : workers)
        {
            worker.join();
        }

        bool incomplete = false;
        {
            std::lock_guard lock(state_mutex_);
            const bool all_done = std::all_of(chunks_.begin(), chunks_.end(), [](const ChunkProgress &chunk)
                                              { return chunk.state == ChunkState::Success; });
            if (aborted() || !all_done)
            {
                incomplete = true;
                state_ = TransferState::Error;
                if (!error_)
                {
                    error_ = "Upload incomplete";
                }
            }
        }
        if (incomplete)
        {
            emit();
            return snapshot();
        }

        protocol::FinalizeResponse response;
        try
        {
            response = transport_.finalize(handshake.session_id);
        }
        catch (const std::exception &ex)
        {
            return fail(std::string("Finalize failed: ") + ex.what());
        }
        if (response.status != "completed")
        {
            return fail("Finalize reported " + response.status +
                        (response.message ? ": " + *response.message : std::string{}));
        }

        {
            std::lock_guard lock(state_mutex_);
            state_ = TransferState::Completed;
            finalize_ = std::move(response);
        }
        logger_.log("upload", "session=", handshake.session_id, " completed");
        emit();
        return snapshot();
    }

    TransferStatus TransferScheduler::snapshot() const
    {
        std::lock_guard lock(state_mutex_);
        return snapshot_locked();
    }

    void TransferScheduler::worker_loop()
    {
        std::ifstream input(source_, std::ios::binary);
        if (!input.is_open())
        {
            {
                std::lock_guard lock(state_mutex_);
                if (!error_)
                {
                    error_ = "Cannot open " + source_.string();
                }
            }
            request_abort();
            return;
        }

        while (!aborted())
        {
            const auto index = queue_.pop();
            if (!index)
            {
                break;
            }
            if (!transfer_chunk(input, *index))
            {
                request_abort();
            }
        }
    }

    bool TransferScheduler::transfer_chunk(std::ifstream &input, std::uint64_t index)
    {
        const auto offset = chunk_offset(index, options_.chunk_size);
        const auto length = chunk_length(index, total_bytes_, options_.chunk_size);
        std::vector<std::byte> buffer(length);
        input.clear();
        input.seekg(static_cast<std::streamoff>(offset));
        input.read(reinterpret_cast<char *>(buffer.data()), static_cast<std::streamsize>(length));
        if (static_cast<std::uint64_t>(input.gcount()) != length)
        {
            mark_chunk_failed(index, "Short read of chunk " + std::to_string(index) + " from " + source_.string());
            return false;
        }

        auto delay = options_.initial_backoff;
        for (std::uint32_t attempt = 0;; ++attempt)
        {
            set_chunk_state(index, ChunkState::Uploading);
            try
            {
                transport_.upload_chunk(session_id_, index, buffer);
                mark_chunk_success(index, length);
                return true;
            }
            catch (const ServerError &ex)
            {
                if (!ex.retryable())
                {
                    mark_chunk_failed(index, "Chunk " + std::to_string(index) + " rejected: " + ex.what());
                    return false;
                }
                logger_.warn("retry", "chunk=", index, " attempt=", attempt + 1, " server_error=", ex.what());
            }
            catch (const TransportError &ex)
            {
                logger_.warn("retry", "chunk=", index, " attempt=", attempt + 1, " transport_error=", ex.what());
            }
            catch (const std::exception &ex)
            {
                mark_chunk_failed(index, "Chunk " + std::to_string(index) + " failed: " + ex.what());
                return false;
            }

            if (attempt >= options_.max_retries)
            {
                mark_chunk_failed(index, "Chunk " + std::to_string(index) + " failed after " +
                                             std::to_string(attempt + 1) + " attempts");
                return false;
            }
            if (!wait_backoff(delay))
            {
                set_chunk_state(index, ChunkState::Pending);
                return false;
            }
            delay *= 2;
        }
    }

    bool TransferScheduler::wait_backoff(std::chrono::milliseconds delay)
    {
        std::unique_lock lock(backoff_mutex_);
        backoff_cv_.wait_for(lock, delay, [this]
                             { return aborted(); });
        return !aborted();
    }

    void TransferScheduler::request_abort()
    {
        {
            std::lock_guard lock(backoff_mutex_);
            abort_ = true;
        }
        backoff_cv_.notify_all();
    }

    void TransferScheduler::set_chunk_state(std::uint64_t index, ChunkState state)
    {
        {
            std::lock_guard lock(state_mutex_);
            auto &chunk = chunks_[index];
            chunk.state = state;
            if (state == ChunkState::Uploading)
            {
                ++chunk.attempts;
            }
        }
        emit();
    }

    void TransferScheduler::mark_chunk_success(std::uint64_t index, std::uint64_t bytes)
    {
        {
            std::lock_guard lock(state_mutex_);
            chunks_[index].state = ChunkState::Success;
            uploaded_bytes_ += bytes;
        }
        emit();
    }

    void TransferScheduler::mark_chunk_failed(std::uint64_t index, const std::string &message)
    {
        logger_.error("chunk", message);
        {
            std::lock_guard lock(state_mutex_);
            chunks_[index].state = ChunkState::Error;
            if (!error_)
            {
                error_ = message;
            }
        }
        emit();
    }

    TransferStatus TransferScheduler::fail(const std::string &message)
    {
        logger_.error("upload", message);
        {
            std::lock_guard lock(state_mutex_);
            state_ = TransferState::Error;
            error_ = message;
        }
        emit();
        return snapshot();
    }

    TransferStatus TransferScheduler::snapshot_locked() const
    {
        TransferStatus status;
        status.session_id = session_id_;
        status.total_bytes = total_bytes_;
        status.uploaded_bytes = uploaded_bytes_;
        status.chunks = chunks_;
        status.state = state_;
        status.error = error_;
        status.finalize = finalize_;
        if (state_ != TransferState::Idle)
        {
            const std::chrono::duration<double> elapsed = std::chrono::steady_clock::now() - started_;
            if (elapsed.count() > 0)
            {
                status.bytes_per_second = static_cast<double>(uploaded_bytes_) / elapsed.count();
            }
            if (status.bytes_per_second > 0)
            {
                const auto remaining = total_bytes_ > uploaded_bytes_ ? total_bytes_ - uploaded_bytes_ : 0;
                status.eta_seconds = static_cast<double>(remaining) / status.bytes_per_second;
            }
        }
        return status;
    }

    void TransferScheduler::emit()
    {
        if (!progress_)
        {
            return;
        }
        // Snapshot under the callback lock so deliveries follow state order.
        std::lock_guard lock(callback_mutex_);
        progress_(snapshot());
    }

} // namespace chunkdrive::client
