#include <algorithm>
#include <atomic>
#include <cassert>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iterator>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "chunkdrive/server/archive_inspector.hpp"
#include "chunkdrive/server/chunk_writer.hpp"
#include "chunkdrive/server/config.hpp"
#include "chunkdrive/server/json_session_store.hpp"
#include "chunkdrive/server/sqlite_session_store.hpp"
#include "test_support.hpp"

using namespace chunkdrive;
using namespace chunkdrive::server;
using namespace chunkdrive::testing;

namespace
{

    void test_chunk_writer_positional()
    {
        const auto root = std::filesystem::temp_directory_path() / "chunkdrive_writer_test";
        cleanup_path(root);
        ChunkWriter writer(root);
        writer.create_scratch("s1");

        // Out of order, with a duplicate of chunk 0.
        assert(writer.write_at("s1", 8, filled(4, 0x03)) == 4);
        assert(writer.write_at("s1", 0, filled(4, 0x01)) == 4);
        assert(writer.write_at("s1", 4, filled(4, 0x02)) == 4);
        assert(writer.write_at("s1", 0, filled(4, 0x01)) == 4);

        const auto scratch = read_all(writer.scratch_path("s1"));
        assert(scratch.size() == 12);
        assert(std::all_of(scratch.begin(), scratch.begin() + 4, [](auto b)
                           { return b == 0x01; }));
        assert(std::all_of(scratch.begin() + 4, scratch.begin() + 8, [](auto b)
                           { return b == 0x02; }));
        assert(std::all_of(scratch.begin() + 8, scratch.end(), [](auto b)
                           { return b == 0x03; }));

        const auto final_path = writer.assemble("s1", "data.bin");
        assert(final_path.filename() == "s1_data.bin");
        assert(std::filesystem::exists(final_path));
        assert(!std::filesystem::exists(writer.scratch_path("s1")));
        assert(!writer.remove_scratch("s1"));

        bool caught = false;
        try
        {
            (void)writer.assemble("missing", "x.bin");
        }
        catch (const StorageError &)
        {
            caught = true;
        }
        assert(caught);

        // Once assembled, a late chunk must not bring the scratch file back.
        caught = false;
        try
        {
            (void)writer.write_at("s1", 0, filled(4, 0x01));
        }
        catch (const StorageError &)
        {
            caught = true;
        }
        assert(caught);
        assert(!std::filesystem::exists(writer.scratch_path("s1")));

        writer.create_scratch("s2");
        assert(writer.write_at("s2", 0, filled(2, 0x09)) == 2);
        writer.create_scratch("s2");
        assert(read_all(writer.scratch_path("s2")).size() == 2);
        assert(writer.remove_scratch("s2"));

        cleanup_path(root);
    }

    void test_zip_inspector()
    {
        const auto root = std::filesystem::temp_directory_path() / "chunkdrive_zip_test";
        cleanup_path(root);
        std::filesystem::create_directories(root);

        const auto archive = root / "ok.zip";
        write_zip(archive, {"docs/", "docs/readme.txt", "image.png"});
        ZipArchiveInspector inspector;
        const auto names = inspector.inspect(archive);
        assert(names.size() == 2);
        assert(names[0] == "docs/readme.txt");
        assert(names[1] == "image.png");

        std::vector<std::string> many;
        for (int i = 0; i < 15; ++i)
        {
            many.push_back("file" + std::to_string(i) + ".txt");
        }
        const auto big = root / "many.zip";
        write_zip(big, many);
        assert(inspector.inspect(big).size() == 10);

        const auto plain = root / "plain.bin";
        {
            std::ofstream out(plain, std::ios::binary);
            out << std::string(100, 'x');
        }
        bool caught = false;
        try
        {
            (void)inspector.inspect(plain);
        }
        catch (const ArchiveError &)
        {
            caught = true;
        }
        assert(caught);

        // An archive cut off before its central directory.
        const auto whole = read_all(archive);
        const auto truncated = root / "truncated.zip";
        {
            std::ofstream out(truncated, std::ios::binary);
            out.write(reinterpret_cast<const char *>(whole.data()), static_cast<std::streamsize>(whole.size() / 2));
        }
        caught = false;
        try
        {
            (void)inspector.inspect(truncated);
        }
        catch (const ArchiveError &)
        {
            caught = true;
        }
        assert(caught);

        NullArchiveInspector null_inspector;
        assert(null_inspector.inspect(plain).empty());

        cleanup_path(root);
    }

    // Behaviour every SessionStore backend must share.
    void exercise_store_contract(const std::function<std::unique_ptr<SessionStore>()> &open_store)
    {
        const auto now = std::chrono::system_clock::now();
        auto store = open_store();

        const auto first = store->find_or_create_uploading("a.zip", 100, 2, now);
        assert(first.created);
        assert(first.session.status == SessionStatus::Uploading);
        assert(first.session.id.size() == 32);

        const auto again = store->find_or_create_uploading("a.zip", 100, 2, now);
        assert(!again.created);
        assert(again.session.id == first.session.id);

        const auto other = store->find_or_create_uploading("a.zip", 101, 2, now);
        assert(other.created);
        assert(other.session.id != first.session.id);

        const auto &id = first.session.id;
        store->upsert_chunk(id, 1, ChunkStatus::Uploading);
        assert(store->count_completed(id) == 0);
        store->upsert_chunk(id, 1, ChunkStatus::Completed);
        store->upsert_chunk(id, 0, ChunkStatus::Completed);
        store->upsert_chunk(id, 0, ChunkStatus::Completed);
        assert(store->count_completed(id) == 2);
        assert((store->completed_chunks(id) == std::vector<std::uint64_t>{0, 1}));

        assert(store->transition_status(id, SessionStatus::Uploading, SessionStatus::Processing));
        assert(!store->transition_status(id, SessionStatus::Uploading, SessionStatus::Processing));
        assert(store->find(id)->status == SessionStatus::Processing);

        // A processing session no longer matches the live lookup.
        const auto replacement = store->find_or_create_uploading("a.zip", 100, 2, now);
        assert(replacement.created);
        assert(replacement.session.id != id);

        store->mark_completed(id, "hash", "/tmp/final");
        const auto completed = store->find(id);
        assert(completed->status == SessionStatus::Completed);
        assert(completed->final_hash == std::string("hash"));
        assert(completed->final_path == std::filesystem::path("/tmp/final"));

        store->mark_failed(other.session.id);
        assert(store->find(other.session.id)->status == SessionStatus::Failed);

        const auto old = store->find_or_create_uploading("old.zip", 5, 1, now - std::chrono::hours(48));
        const auto orphans = store->uploading_older_than(now - std::chrono::hours(24));
        assert(orphans.size() == 1);
        assert(orphans[0].id == old.session.id);

        store->upsert_chunk(old.session.id, 0, ChunkStatus::Completed);
        store->delete_chunks(old.session.id);
        store->delete_session(old.session.id);
        assert(!store->find(old.session.id).has_value());
        assert(store->count_completed(old.session.id) == 0);
        store->delete_session(old.session.id);

        assert(!store->find("no-such-session").has_value());
        assert(!store->transition_status("no-such-session", SessionStatus::Uploading, SessionStatus::Processing));

        // State survives reopening.
        store.reset();
        auto reopened = open_store();
        const auto persisted = reopened->find(id);
        assert(persisted.has_value());
        assert(persisted->status == SessionStatus::Completed);
        assert(persisted->filename == "a.zip");
        assert(reopened->count_completed(id) == 2);
        const auto live = reopened->find_or_create_uploading("a.zip", 100, 2, now);
        assert(!live.created);
        assert(live.session.id == replacement.session.id);
    }

    // Many callers racing for the same UPLOADING -> PROCESSING transition.
    void exercise_store_cas_race(SessionStore &store)
    {
        const auto session = store.find_or_create_uploading("race.bin", 10, 1, std::chrono::system_clock::now());
        std::atomic<int> winners{0};
        std::vector<std::thread> threads;
        for (int i = 0; i < 8; ++i)
        {
            threads.emplace_back([&]
                                 {
                if (store.transition_status(session.session.id, SessionStatus::Uploading, SessionStatus::Processing))
                {
                    ++winners;
                } });
        }
        for (auto &thread : threads)
        {
            thread.join();
        }
        assert(winners == 1);
    }

    void test_json_session_store()
    {
        const auto root = std::filesystem::temp_directory_path() / "chunkdrive_json_store_test";
        cleanup_path(root);
        exercise_store_contract([&]
                                { return std::make_unique<JsonSessionStore>(root); });
        JsonSessionStore store(root);
        exercise_store_cas_race(store);

        // A corrupt document is skipped on load.
        {
            std::ofstream out(root / ".chunkdrive" / "sessions" / "broken.json");
            out << "{not json";
        }
        JsonSessionStore reloaded(root);
        assert(!reloaded.find("broken").has_value());

        cleanup_path(root);
    }

    void test_json_store_failed_write_leaves_record_unchanged()
    {
        const auto root = std::filesystem::temp_directory_path() / "chunkdrive_json_store_write_failure";
        cleanup_path(root);
        JsonSessionStore store(root);
        const auto created = store.find_or_create_uploading("a.zip", 100, 2, std::chrono::system_clock::now());
        const auto &id = created.session.id;

        // A directory squatting on the temp file name makes every write of this record fail.
        const auto blocker = root / ".chunkdrive" / "sessions" / (id + ".json.tmp");
        std::filesystem::create_directories(blocker);

        const auto fails = [](const std::function<void()> &fn)
        {
            try
            {
                fn();
            }
            catch (const StorageError &)
            {
                return true;
            }
            return false;
        };
        assert(fails([&]
                     { store.transition_status(id, SessionStatus::Uploading, SessionStatus::Processing); }));
        assert(store.find(id)->status == SessionStatus::Uploading);
        assert(fails([&]
                     { store.upsert_chunk(id, 0, ChunkStatus::Completed); }));
        assert(store.count_completed(id) == 0);
        assert(fails([&]
                     { store.mark_failed(id); }));
        assert(store.find(id)->status == SessionStatus::Uploading);

        std::filesystem::remove_all(blocker);
        assert(store.transition_status(id, SessionStatus::Uploading, SessionStatus::Processing));
        JsonSessionStore reloaded(root);
        assert(reloaded.find(id)->status == SessionStatus::Processing);

        cleanup_path(root);
    }

    void test_sqlite_session_store()
    {
        const auto root = std::filesystem::temp_directory_path() / "chunkdrive_sqlite_store_test";
        cleanup_path(root);
        const auto database = root / ".chunkdrive" / "sessions.db";
        exercise_store_contract([&]
                                { return std::make_unique<SqliteSessionStore>(database); });
        SqliteSessionStore store(database);
        exercise_store_cas_race(store);
        cleanup_path(root);
    }

    void test_session_ids_unique()
    {
        const auto a = generate_session_id();
        const auto b = generate_session_id();
        assert(a.size() == 32);
        assert(a != b);
        assert(std::all_of(a.begin(), a.end(), [](char ch)
                           { return (ch >= '0' && ch <= '9') || (ch >= 'a' && ch <= 'f'); }));
    }

    void test_server_config_validation()
    {
        ServerConfig config;
        config.port = 9000;
        config.root = "/srv/chunkdrive";
        validate_config(config);

        const auto rejected = [](ServerConfig candidate)
        {
            try
            {
                validate_config(candidate);
            }
            catch (const std::invalid_argument &)
            {
                return true;
            }
            return false;
        };

        auto negative_age = config;
        negative_age.orphan_age = std::chrono::seconds(-5);
        assert(rejected(negative_age));

        auto zero_age = config;
        zero_age.orphan_age = std::chrono::seconds(0);
        assert(rejected(zero_age));

        auto no_root = config;
        no_root.root.clear();
        assert(rejected(no_root));

        auto negative_interval = config;
        negative_interval.cleanup_interval = std::chrono::seconds(-1);
        assert(rejected(negative_interval));

        auto sweep_disabled = config;
        sweep_disabled.cleanup_interval = std::chrono::seconds(0);
        assert(!rejected(sweep_disabled));
    }

} // namespace

void run_server_component_tests()
{
    test_server_config_validation();
    test_chunk_writer_positional();
    test_zip_inspector();
    test_session_ids_unique();
    test_json_session_store();
    test_json_store_failed_write_leaves_record_unchanged();
    test_sqlite_session_store();
}
