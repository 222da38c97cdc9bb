#pragma once

#include <asio/io_context.hpp>
#include <asio/ip/tcp.hpp>
#include <asio/signal_set.hpp>
#include <asio/steady_timer.hpp>
#include <memory>
#include <thread>
#include <vector>

#include "chunkdrive/server/archive_inspector.hpp"
#include "chunkdrive/server/chunk_writer.hpp"
#include "chunkdrive/server/config.hpp"
#include "chunkdrive/server/session_store.hpp"
#include "chunkdrive/server/upload_coordinator.hpp"

namespace chunkdrive::server
{

    class Connection;

    class Server
    {
    public:
        explicit Server(ServerConfig config);

        void run();

    private:
        void accept_next();
        void on_accept(std::error_code ec, asio::ip::tcp::socket socket);
        void schedule_cleanup();
        void run_cleanup();
        void handle_signal();

        ServerConfig config_;
        asio::io_context io_context_;
        asio::ip::tcp::acceptor acceptor_;
        asio::signal_set signals_;
        asio::steady_timer cleanup_timer_;

        std::unique_ptr<SessionStore> store_;
        ChunkWriter writer_;
        std::unique_ptr<ArchiveInspector> inspector_;
        UploadSessionCoordinator coordinator_;

        std::vector<std::thread> workers_;
    };

} // namespace chunkdrive::server
