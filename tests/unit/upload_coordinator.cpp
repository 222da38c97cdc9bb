#include <algorithm>
#include <atomic>
#include <cassert>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <span>
#include <string>
#include <thread>
#include <vector>

#include "chunkdrive/chunking.hpp"
#include "chunkdrive/crypto.hpp"
#include "chunkdrive/server/archive_inspector.hpp"
#include "chunkdrive/server/chunk_writer.hpp"
#include "chunkdrive/server/json_session_store.hpp"
#include "chunkdrive/server/sqlite_session_store.hpp"
#include "chunkdrive/server/upload_coordinator.hpp"
#include "test_support.hpp"

using namespace chunkdrive;
using namespace chunkdrive::server;
using namespace chunkdrive::testing;

namespace
{

    enum class Backend
    {
        Json,
        Sqlite
    };

    std::unique_ptr<SessionStore> open_store(const std::filesystem::path &root, Backend backend)
    {
        if (backend == Backend::Sqlite)
        {
            return std::make_unique<SqliteSessionStore>(root / ".chunkdrive" / "sessions.db");
        }
        return std::make_unique<JsonSessionStore>(root);
    }

    // Storage root, store, writer and a coordinator whose clock the test controls.
    class Fixture
    {
    public:
        Fixture(const std::string &name, Backend backend, std::uint64_t chunk_size,
                std::unique_ptr<ArchiveInspector> inspector = std::make_unique<NullArchiveInspector>())
            : root_(fresh_directory(name + (backend == Backend::Json ? "_json" : "_sqlite"))),
              store_(open_store(root_, backend)),
              writer_(root_),
              inspector_(std::move(inspector)),
              now_(std::chrono::time_point_cast<std::chrono::seconds>(std::chrono::system_clock::now())),
              coordinator_(*store_, writer_, *inspector_, chunk_size, [this]
                           { return now_; })
        {
        }

        ~Fixture()
        {
            cleanup_path(root_);
        }

        Fixture(const Fixture &) = delete;
        Fixture &operator=(const Fixture &) = delete;

        UploadSessionCoordinator &coordinator() { return coordinator_; }
        SessionStore &store() { return *store_; }
        ChunkWriter &writer() { return writer_; }
        void advance(std::chrono::seconds delta) { now_ += delta; }

    private:
        std::filesystem::path root_;
        std::unique_ptr<SessionStore> store_;
        ChunkWriter writer_;
        std::unique_ptr<ArchiveInspector> inspector_;
        std::chrono::system_clock::time_point now_;
        UploadSessionCoordinator coordinator_;
    };

    std::span<const std::byte> chunk_of(const std::vector<std::byte> &data, std::uint64_t index,
                                        std::uint64_t chunk_size)
    {
        return std::span<const std::byte>(data).subspan(chunk_offset(index, chunk_size),
                                                        chunk_length(index, data.size(), chunk_size));
    }

    template <typename Fn>
    ErrorCode expect_error(Fn &&fn)
    {
        try
        {
            fn();
        }
        catch (const CoordinatorError &err)
        {
            return err.code();
        }
        assert(false && "expected CoordinatorError");
        return ErrorCode::Ok;
    }

    void test_resumed_upload_end_to_end(Backend backend)
    {
        constexpr std::uint64_t mib = 1024 * 1024;
        constexpr std::uint64_t chunk_size = 5 * mib;
        Fixture fixture("chunkdrive_coord_e2e", backend, chunk_size);
        auto &coordinator = fixture.coordinator();
        const auto data = patterned(12 * mib);

        const auto first = coordinator.handshake("video.bin", data.size(), 3);
        assert(first.created);
        assert(first.existing_chunks.empty());

        coordinator.accept_chunk(first.session_id, 0, chunk_of(data, 0, chunk_size));
        coordinator.accept_chunk(first.session_id, 2, chunk_of(data, 2, chunk_size));

        // Client restarts: same file, same session, resume set {0, 2}.
        const auto resumed = coordinator.handshake("video.bin", data.size(), 3);
        assert(!resumed.created);
        assert(resumed.session_id == first.session_id);
        assert((resumed.existing_chunks == std::vector<std::uint64_t>{0, 2}));

        coordinator.accept_chunk(first.session_id, 1, chunk_of(data, 1, chunk_size));
        assert(coordinator.completed_count(first.session_id) == 3);

        const auto outcome = coordinator.finalize(first.session_id);
        assert(outcome.performed);
        assert(outcome.status == SessionStatus::Completed);
        assert(outcome.hash == crypto::hash_bytes(data));
        assert(outcome.final_path.has_value());
        assert(outcome.final_path->filename() == first.session_id + "_video.bin");

        const auto stored = read_all(*outcome.final_path);
        assert(stored.size() == data.size());
        assert(std::equal(stored.begin(), stored.end(), data.begin(), [](std::uint8_t a, std::byte b)
                          { return a == std::to_integer<std::uint8_t>(b); }));
        assert(!std::filesystem::exists(fixture.writer().scratch_path(first.session_id)));

        const auto session = coordinator.status(first.session_id);
        assert(session.status == SessionStatus::Completed);
        assert(session.final_hash == outcome.hash);

        // Finalizing again is informational and changes nothing.
        const auto repeat = coordinator.finalize(first.session_id);
        assert(!repeat.performed);
        assert(repeat.status == SessionStatus::Completed);
        assert(repeat.hash == outcome.hash);

        // A completed session is not resumed; the same file starts over.
        const auto fresh = coordinator.handshake("video.bin", data.size(), 3);
        assert(fresh.created);
        assert(fresh.session_id != first.session_id);
    }

    void test_validation_rejects_without_mutation(Backend backend)
    {
        constexpr std::uint64_t chunk_size = 1000;
        Fixture fixture("chunkdrive_coord_validation", backend, chunk_size);
        auto &coordinator = fixture.coordinator();

        assert(expect_error([&]
                            { coordinator.handshake("", 10, 1); }) == ErrorCode::InvalidPayload);
        assert(expect_error([&]
                            { coordinator.handshake("../etc/passwd", 10, 1); }) == ErrorCode::InvalidPayload);
        assert(expect_error([&]
                            { coordinator.handshake("a.bin", 0, 0); }) == ErrorCode::InvalidPayload);
        assert(expect_error([&]
                            { coordinator.handshake("a.bin", 2500, 2); }) == ErrorCode::InvalidPayload);
        assert(fixture.store().uploading_older_than(std::chrono::system_clock::time_point::max()).empty());

        const auto session = coordinator.handshake("a.bin", 2500, 3);
        const auto payload = patterned(1000);
        assert(expect_error([&]
                            { coordinator.accept_chunk(session.session_id, 3, payload); }) ==
               ErrorCode::InvalidPayload);
        assert(expect_error([&]
                            { coordinator.accept_chunk(session.session_id, 2, payload); }) ==
               ErrorCode::InvalidPayload);
        assert(expect_error([&]
                            { coordinator.accept_chunk("unknown", 0, payload); }) == ErrorCode::NotFound);
        assert(expect_error([&]
                            { coordinator.finalize("unknown"); }) == ErrorCode::NotFound);
        assert(expect_error([&]
                            { coordinator.status("unknown"); }) == ErrorCode::NotFound);

        assert(coordinator.completed_count(session.session_id) == 0);
        assert(std::filesystem::file_size(fixture.writer().scratch_path(session.session_id)) == 0);

        // The last chunk carries the remainder.
        coordinator.accept_chunk(session.session_id, 2, std::span<const std::byte>(payload).first(500));
        assert(coordinator.completed_count(session.session_id) == 1);
    }

    void test_duplicate_and_permuted_chunks(Backend backend)
    {
        constexpr std::uint64_t chunk_size = 4096;
        Fixture fixture("chunkdrive_coord_order", backend, chunk_size);
        auto &coordinator = fixture.coordinator();
        const auto data = patterned(chunk_size * 5 + 123, 3);
        const auto chunks = chunk_count(data.size(), chunk_size);

        const auto in_order = coordinator.handshake("in_order.bin", data.size(), chunks);
        for (std::uint64_t i = 0; i < chunks; ++i)
        {
            coordinator.accept_chunk(in_order.session_id, i, chunk_of(data, i, chunk_size));
        }

        const auto shuffled = coordinator.handshake("shuffled.bin", data.size(), chunks);
        for (const std::uint64_t i : {5u, 0u, 3u, 3u, 1u, 5u, 4u, 2u, 0u})
        {
            coordinator.accept_chunk(shuffled.session_id, i, chunk_of(data, i, chunk_size));
        }
        assert(coordinator.completed_count(shuffled.session_id) == chunks);

        const auto a = coordinator.finalize(in_order.session_id);
        const auto b = coordinator.finalize(shuffled.session_id);
        assert(a.performed && b.performed);
        assert(a.hash == b.hash);
        assert(read_all(*a.final_path) == read_all(*b.final_path));
    }

    void test_parallel_chunk_acceptance(Backend backend)
    {
        constexpr std::uint64_t chunk_size = 2048;
        Fixture fixture("chunkdrive_coord_parallel", backend, chunk_size);
        auto &coordinator = fixture.coordinator();
        const auto data = patterned(chunk_size * 16 + 7, 11);
        const auto chunks = chunk_count(data.size(), chunk_size);
        const auto session = coordinator.handshake("parallel.bin", data.size(), chunks);

        std::atomic<std::uint64_t> next{0};
        std::vector<std::thread> workers;
        for (int w = 0; w < 4; ++w)
        {
            workers.emplace_back([&]
                                 {
                for (auto index = next++; index < chunks; index = next++)
                {
                    coordinator.accept_chunk(session.session_id, index, chunk_of(data, index, chunk_size));
                } });
        }
        for (auto &worker : workers)
        {
            worker.join();
        }

        const auto outcome = coordinator.finalize(session.session_id);
        assert(outcome.performed);
        assert(outcome.hash == crypto::hash_bytes(data));
    }

    void test_concurrent_finalize_single_winner(Backend backend)
    {
        constexpr std::uint64_t chunk_size = 1024;
        Fixture fixture("chunkdrive_coord_finalize_race", backend, chunk_size);
        auto &coordinator = fixture.coordinator();
        const auto data = patterned(chunk_size * 3, 5);
        const auto session = coordinator.handshake("race.bin", data.size(), 3);
        for (std::uint64_t i = 0; i < 3; ++i)
        {
            coordinator.accept_chunk(session.session_id, i, chunk_of(data, i, chunk_size));
        }

        constexpr int callers = 8;
        std::vector<FinalizeOutcome> outcomes(callers);
        std::vector<std::thread> threads;
        for (int i = 0; i < callers; ++i)
        {
            threads.emplace_back([&, i]
                                 { outcomes[static_cast<std::size_t>(i)] = coordinator.finalize(session.session_id); });
        }
        for (auto &thread : threads)
        {
            thread.join();
        }

        const auto performed = std::count_if(outcomes.begin(), outcomes.end(), [](const FinalizeOutcome &outcome)
                                             { return outcome.performed; });
        assert(performed == 1);
        for (const auto &outcome : outcomes)
        {
            assert(outcome.status == SessionStatus::Completed || outcome.status == SessionStatus::Processing);
        }
        assert(coordinator.status(session.session_id).status == SessionStatus::Completed);
        const auto files_dir = fixture.writer().scratch_path(session.session_id).parent_path().parent_path() / "files";
        assert(std::distance(std::filesystem::directory_iterator(files_dir), std::filesystem::directory_iterator{}) ==
               1);
    }

    void test_missing_chunks_fail_session(Backend backend)
    {
        constexpr std::uint64_t chunk_size = 1000;
        Fixture fixture("chunkdrive_coord_missing", backend, chunk_size);
        auto &coordinator = fixture.coordinator();
        const auto data = patterned(2500);
        const auto session = coordinator.handshake("partial.bin", data.size(), 3);
        coordinator.accept_chunk(session.session_id, 0, chunk_of(data, 0, chunk_size));
        coordinator.accept_chunk(session.session_id, 2, chunk_of(data, 2, chunk_size));

        bool caught = false;
        try
        {
            coordinator.finalize(session.session_id);
        }
        catch (const CoordinatorError &err)
        {
            caught = true;
            assert(err.code() == ErrorCode::IntegrityFailure);
            assert(std::string(err.what()) == "Missing chunks. Expected 3, got 2");
        }
        assert(caught);
        assert(coordinator.status(session.session_id).status == SessionStatus::Failed);

        // FAILED is terminal.
        assert(expect_error([&]
                            { coordinator.accept_chunk(session.session_id, 1, chunk_of(data, 1, chunk_size)); }) ==
               ErrorCode::Conflict);
        const auto again = coordinator.finalize(session.session_id);
        assert(!again.performed);
        assert(again.status == SessionStatus::Failed);

        const auto retry = coordinator.handshake("partial.bin", data.size(), 3);
        assert(retry.created);
        assert(retry.session_id != session.session_id);
        assert(retry.existing_chunks.empty());
    }

    void test_archive_validation(Backend backend)
    {
        constexpr std::uint64_t chunk_size = 64;
        Fixture fixture("chunkdrive_coord_archive", backend, chunk_size, std::make_unique<ZipArchiveInspector>());
        auto &coordinator = fixture.coordinator();

        const auto staging = fresh_directory("chunkdrive_coord_archive_src");
        write_zip(staging / "bundle.zip", {"a.txt", "dir/", "dir/b.txt"});
        const auto raw = read_all(staging / "bundle.zip");
        std::vector<std::byte> zip(raw.size());
        std::transform(raw.begin(), raw.end(), zip.begin(), [](std::uint8_t b)
                       { return std::byte{b}; });
        cleanup_path(staging);

        const auto chunks = chunk_count(zip.size(), chunk_size);
        const auto good = coordinator.handshake("bundle.zip", zip.size(), chunks);
        for (std::uint64_t i = 0; i < chunks; ++i)
        {
            coordinator.accept_chunk(good.session_id, i, chunk_of(zip, i, chunk_size));
        }
        const auto outcome = coordinator.finalize(good.session_id);
        assert(outcome.performed);
        assert((outcome.files == std::vector<std::string>{"a.txt", "dir/b.txt"}));

        const auto junk = patterned(200);
        const auto junk_chunks = chunk_count(junk.size(), chunk_size);
        const auto bad = coordinator.handshake("fake.zip", junk.size(), junk_chunks);
        for (std::uint64_t i = 0; i < junk_chunks; ++i)
        {
            coordinator.accept_chunk(bad.session_id, i, chunk_of(junk, i, chunk_size));
        }
        assert(expect_error([&]
                            { coordinator.finalize(bad.session_id); }) == ErrorCode::IntegrityFailure);
        assert(coordinator.status(bad.session_id).status == SessionStatus::Failed);
    }

    void test_orphan_cleanup(Backend backend)
    {
        constexpr std::uint64_t chunk_size = 100;
        Fixture fixture("chunkdrive_coord_cleanup", backend, chunk_size);
        auto &coordinator = fixture.coordinator();
        const auto data = patterned(250);

        const auto orphan = coordinator.handshake("orphan.bin", data.size(), 3);
        coordinator.accept_chunk(orphan.session_id, 0, chunk_of(data, 0, chunk_size));

        const auto completed = coordinator.handshake("done.bin", data.size(), 3);
        for (std::uint64_t i = 0; i < 3; ++i)
        {
            coordinator.accept_chunk(completed.session_id, i, chunk_of(data, i, chunk_size));
        }
        assert(coordinator.finalize(completed.session_id).performed);

        const auto processing = coordinator.handshake("busy.bin", data.size(), 3);
        assert(fixture.store().transition_status(processing.session_id, SessionStatus::Uploading,
                                                 SessionStatus::Processing));

        fixture.advance(std::chrono::hours(23));
        const auto young = coordinator.handshake("young.bin", data.size(), 3);

        fixture.advance(std::chrono::hours(1) + std::chrono::seconds(1));
        assert(coordinator.cleanup_orphans(std::chrono::hours(24)) == 1);

        assert(!fixture.store().find(orphan.session_id).has_value());
        assert(coordinator.completed_count(orphan.session_id) == 0);
        assert(!std::filesystem::exists(fixture.writer().scratch_path(orphan.session_id)));
        assert(fixture.store().find(completed.session_id)->status == SessionStatus::Completed);
        assert(fixture.store().find(processing.session_id)->status == SessionStatus::Processing);
        assert(fixture.store().find(young.session_id)->status == SessionStatus::Uploading);

        assert(coordinator.cleanup_orphans(std::chrono::hours(24)) == 0);

        // A client returning after cleanup gets a brand new session.
        const auto restarted = coordinator.handshake("orphan.bin", data.size(), 3);
        assert(restarted.created);
        assert(restarted.existing_chunks.empty());
    }

    void test_cleanup_age_bounds(Backend backend)
    {
        constexpr std::uint64_t chunk_size = 100;
        Fixture fixture("chunkdrive_coord_cleanup_bounds", backend, chunk_size);
        auto &coordinator = fixture.coordinator();
        const auto fresh = coordinator.handshake("fresh.zip", 150, 2);

        assert(expect_error([&]
                            { coordinator.cleanup_orphans(std::chrono::seconds(-1)); }) == ErrorCode::InvalidPayload);
        assert(expect_error([&]
                            { coordinator.cleanup_orphans(std::chrono::seconds(0)); }) == ErrorCode::InvalidPayload);
        // The wire value -1 arrives as 2^64 - 1 and turns negative when narrowed.
        const std::uint64_t wrapped = static_cast<std::uint64_t>(-1);
        assert(expect_error([&]
                            { coordinator.cleanup_orphans(std::chrono::seconds(static_cast<std::int64_t>(wrapped))); }) ==
               ErrorCode::InvalidPayload);

        // Ages longer than the clock can represent remove nothing.
        assert(coordinator.cleanup_orphans(std::chrono::seconds::max()) == 0);
        assert(coordinator.cleanup_orphans(std::chrono::hours(24 * 365 * 100)) == 0);
        assert(fixture.store().find(fresh.session_id)->status == SessionStatus::Uploading);
    }

    void run_for(Backend backend)
    {
        test_resumed_upload_end_to_end(backend);
        test_validation_rejects_without_mutation(backend);
        test_duplicate_and_permuted_chunks(backend);
        test_parallel_chunk_acceptance(backend);
        test_concurrent_finalize_single_winner(backend);
        test_missing_chunks_fail_session(backend);
        test_archive_validation(backend);
        test_orphan_cleanup(backend);
        test_cleanup_age_bounds(backend);
    }

} // namespace

void run_upload_coordinator_tests()
{
    run_for(Backend::Json);
    run_for(Backend::Sqlite);
}
