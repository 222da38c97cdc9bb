#include "chunkdrive/server/server.hpp"

#include <asio/ip/address.hpp>

#include <csignal>
#include <thread>

#include <spdlog/spdlog.h>

#include "chunkdrive/server/connection.hpp"
#include "chunkdrive/server/json_session_store.hpp"
#include "chunkdrive/server/sqlite_session_store.hpp"

namespace chunkdrive::server
{

    namespace
    {

        constexpr auto kDatabaseFile = ".chunkdrive/sessions.db";

        std::size_t resolve_worker_threads(std::size_t requested)
        {
            if (requested > 0)
            {
                return requested;
            }
            const auto hardware = std::thread::hardware_concurrency();
            return hardware == 0 ? 2 : hardware;
        }

        std::unique_ptr<SessionStore> make_store(const ServerConfig &config)
        {
            if (config.store == StoreBackend::Sqlite)
            {
                return std::make_unique<SqliteSessionStore>(config.root / kDatabaseFile);
            }
            return std::make_unique<JsonSessionStore>(config.root);
        }

        std::unique_ptr<ArchiveInspector> make_inspector(const ServerConfig &config)
        {
            if (config.archive_check)
            {
                return std::make_unique<ZipArchiveInspector>();
            }
            return std::make_unique<NullArchiveInspector>();
        }

    } // namespace

    Server::Server(ServerConfig config)
        : config_(std::move(config)),
          io_context_(static_cast<int>(resolve_worker_threads(config_.worker_threads))),
          acceptor_(io_context_),
          signals_(io_context_),
          cleanup_timer_(io_context_),
          store_(make_store(config_)),
          writer_(config_.root),
          inspector_(make_inspector(config_)),
          coordinator_(*store_, writer_, *inspector_, config_.chunk_size)
    {
        const auto address = asio::ip::make_address(config_.address);
        const asio::ip::tcp::endpoint endpoint(address, config_.port);
        acceptor_.open(endpoint.protocol());
        acceptor_.set_option(asio::ip::tcp::acceptor::reuse_address(true));
        acceptor_.bind(endpoint);
        acceptor_.listen();

        spdlog::info("Listening on {}:{} with root {} (chunk size {} bytes, {} store)", config_.address, config_.port,
                     config_.root.string(), config_.chunk_size,
                     config_.store == StoreBackend::Sqlite ? "sqlite" : "json");

        signals_.add(SIGINT);
        signals_.add(SIGTERM);
        signals_.async_wait([this](const std::error_code &ec, int /*signal*/)
                            {
        if (!ec) {
            handle_signal();
        } });
    }

    void Server::run()
    {
        accept_next();
        run_cleanup();
        schedule_cleanup();

        const auto worker_count = resolve_worker_threads(config_.worker_threads);
        workers_.reserve(worker_count > 0 ? worker_count - 1 : 0);
        for (std::size_t i = 1; i < worker_count; ++i)
        {
            workers_.emplace_back([this]
                                  { io_context_.run(); });
        }
        spdlog::info("Server event loop running with {} threads", worker_count);
        io_context_.run();

        for (auto &worker : workers_)
        {
            if (worker.joinable())
            {
                worker.join();
            }
        }
    }

    void Server::accept_next()
    {
        acceptor_.async_accept([this](const std::error_code &ec, asio::ip::tcp::socket socket)
                               { on_accept(ec, std::move(socket)); });
    }

    void Server::on_accept(std::error_code ec, asio::ip::tcp::socket socket)
    {
        if (!ec)
        {
            ConnectionServices services{coordinator_, config_.orphan_age};
            auto connection = std::make_shared<Connection>(std::move(socket), services);
            connection->start();
        }
        if (!ec || ec == asio::error::operation_aborted)
        {
            if (acceptor_.is_open())
            {
                accept_next();
            }
        }
        else
        {
            spdlog::error("Accept error: {}", ec.message());
            accept_next();
        }
    }

    void Server::schedule_cleanup()
    {
        if (config_.cleanup_interval.count() <= 0)
        {
            return;
        }
        cleanup_timer_.expires_after(config_.cleanup_interval);
        cleanup_timer_.async_wait([this](const std::error_code &ec)
                                  {
            if (ec)
            {
                return;
            }
            run_cleanup();
            schedule_cleanup(); });
    }

    void Server::run_cleanup()
    {
        try
        {
            const auto cleaned = coordinator_.cleanup_orphans(config_.orphan_age);
            if (cleaned > 0)
            {
                spdlog::info("Orphan sweep reclaimed {} sessions", cleaned);
            }
        }
        catch (const std::exception &ex)
        {
            spdlog::error("Orphan sweep failed: {}", ex.what());
        }
    }

    void Server::handle_signal()
    {
        std::error_code ec;
        acceptor_.close(ec);
        cleanup_timer_.cancel();
        io_context_.stop();
        spdlog::info("Signal received, shutting down");
    }

} // namespace chunkdrive::server
