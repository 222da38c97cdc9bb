#include "chunkdrive/server/json_session_store.hpp"

#include <algorithm>
#include <fstream>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace chunkdrive::server
{

    namespace
    {
        constexpr auto kSessionsDir = ".chunkdrive/sessions";
        constexpr auto kDocumentExtension = ".json";

        std::int64_t to_epoch_seconds(std::chrono::system_clock::time_point time)
        {
            return std::chrono::duration_cast<std::chrono::seconds>(time.time_since_epoch()).count();
        }

        SessionStatus parse_session_status(const std::string &label)
        {
            auto status = protocol::session_status_from_string(label);
            if (!status)
            {
                throw StorageError("Unknown session status in record: " + label);
            }
            return *status;
        }

        nlohmann::json to_document(const UploadSession &session, const std::map<std::uint64_t, ChunkStatus> &chunks)
        {
            nlohmann::json chunk_json = nlohmann::json::object();
            for (const auto &[index, status] : chunks)
            {
                chunk_json[std::to_string(index)] = protocol::to_string(status);
            }
            nlohmann::json document = {
                {"id", session.id},
                {"filename", session.filename},
                {"total_size", session.total_size},
                {"total_chunks", session.total_chunks},
                {"status", protocol::to_string(session.status)},
                {"created_at", to_epoch_seconds(session.created_at)},
                {"chunks", std::move(chunk_json)},
            };
            if (session.final_hash)
            {
                document["final_hash"] = *session.final_hash;
            }
            if (session.final_path)
            {
                document["final_path"] = session.final_path->generic_string();
            }
            return document;
        }

    } // namespace

    JsonSessionStore::JsonSessionStore(std::filesystem::path storage_root)
        : directory_(std::move(storage_root) / kSessionsDir)
    {
        std::filesystem::create_directories(directory_);
        load_existing();
    }

    SessionLookup JsonSessionStore::find_or_create_uploading(const std::string &filename, std::uint64_t total_size,
                                                             std::uint64_t total_chunks,
                                                             std::chrono::system_clock::time_point now)
    {
        std::lock_guard lock(mutex_);
        const auto existing = std::find_if(records_.begin(), records_.end(), [&](const auto &item)
                                           {
            const auto &session = item.second.session;
            return session.status == SessionStatus::Uploading && session.filename == filename &&
                   session.total_size == total_size; });
        if (existing != records_.end())
        {
            return {.session = existing->second.session, .created = false};
        }

        Record record{};
        record.session.id = generate_session_id();
        record.session.filename = filename;
        record.session.total_size = total_size;
        record.session.total_chunks = total_chunks;
        record.session.status = SessionStatus::Uploading;
        record.session.created_at = std::chrono::time_point_cast<std::chrono::seconds>(now);
        persist(record);
        auto [it, inserted] = records_.emplace(record.session.id, std::move(record));
        return {.session = it->second.session, .created = inserted};
    }

    std::optional<UploadSession> JsonSessionStore::find(const std::string &session_id) const
    {
        std::lock_guard lock(mutex_);
        auto it = records_.find(session_id);
        if (it == records_.end())
        {
            return std::nullopt;
        }
        return it->second.session;
    }

    void JsonSessionStore::upsert_chunk(const std::string &session_id, std::uint64_t chunk_index, ChunkStatus status)
    {
        std::lock_guard lock(mutex_);
        auto record = require(session_id);
        record.chunks[chunk_index] = status;
        commit(std::move(record));
    }

    std::vector<std::uint64_t> JsonSessionStore::completed_chunks(const std::string &session_id) const
    {
        std::lock_guard lock(mutex_);
        std::vector<std::uint64_t> result;
        auto it = records_.find(session_id);
        if (it == records_.end())
        {
            return result;
        }
        for (const auto &[index, status] : it->second.chunks)
        {
            if (status == ChunkStatus::Completed)
            {
                result.push_back(index);
            }
        }
        return result;
    }

    std::uint64_t JsonSessionStore::count_completed(const std::string &session_id) const
    {
        std::lock_guard lock(mutex_);
        auto it = records_.find(session_id);
        if (it == records_.end())
        {
            return 0;
        }
        return static_cast<std::uint64_t>(std::count_if(it->second.chunks.begin(), it->second.chunks.end(),
                                                        [](const auto &item)
                                                        { return item.second == ChunkStatus::Completed; }));
    }

    bool JsonSessionStore::transition_status(const std::string &session_id, SessionStatus expected,
                                             SessionStatus desired)
    {
        std::lock_guard lock(mutex_);
        auto it = records_.find(session_id);
        if (it == records_.end() || it->second.session.status != expected)
        {
            return false;
        }
        auto record = it->second;
        record.session.status = desired;
        commit(std::move(record));
        return true;
    }

    void JsonSessionStore::mark_completed(const std::string &session_id, const std::string &final_hash,
                                          const std::filesystem::path &final_path)
    {
        std::lock_guard lock(mutex_);
        auto record = require(session_id);
        record.session.status = SessionStatus::Completed;
        record.session.final_hash = final_hash;
        record.session.final_path = final_path;
        commit(std::move(record));
    }

    void JsonSessionStore::mark_failed(const std::string &session_id)
    {
        std::lock_guard lock(mutex_);
        auto record = require(session_id);
        record.session.status = SessionStatus::Failed;
        commit(std::move(record));
    }

    std::vector<UploadSession> JsonSessionStore::uploading_older_than(std::chrono::system_clock::time_point cutoff) const
    {
        std::lock_guard lock(mutex_);
        std::vector<UploadSession> result;
        for (const auto &[id, record] : records_)
        {
            if (record.session.status == SessionStatus::Uploading && record.session.created_at < cutoff)
            {
                result.push_back(record.session);
            }
        }
        return result;
    }

    void JsonSessionStore::delete_chunks(const std::string &session_id)
    {
        std::lock_guard lock(mutex_);
        auto it = records_.find(session_id);
        if (it == records_.end() || it->second.chunks.empty())
        {
            return;
        }
        auto record = it->second;
        record.chunks.clear();
        commit(std::move(record));
    }

    void JsonSessionStore::delete_session(const std::string &session_id)
    {
        std::lock_guard lock(mutex_);
        records_.erase(session_id);
        std::error_code ec;
        std::filesystem::remove(document_path(session_id), ec);
        if (ec)
        {
            throw StorageError("Failed to remove session record " + session_id + ": " + ec.message());
        }
    }

    std::filesystem::path JsonSessionStore::document_path(const std::string &session_id) const
    {
        return directory_ / (session_id + kDocumentExtension);
    }

    void JsonSessionStore::load_existing()
    {
        for (const auto &entry : std::filesystem::directory_iterator(directory_))
        {
            if (!entry.is_regular_file() || entry.path().extension() != kDocumentExtension)
            {
                continue;
            }
            try
            {
                std::ifstream in(entry.path());
                const auto document = nlohmann::json::parse(in);

                Record record{};
                record.session.id = document.at("id").get<std::string>();
                record.session.filename = document.at("filename").get<std::string>();
                record.session.total_size = document.at("total_size").get<std::uint64_t>();
                record.session.total_chunks = document.at("total_chunks").get<std::uint64_t>();
                record.session.status = parse_session_status(document.at("status").get<std::string>());
                record.session.created_at = std::chrono::system_clock::time_point{
                    std::chrono::seconds{document.value("created_at", 0LL)}};
                if (auto it = document.find("final_hash"); it != document.end())
                {
                    record.session.final_hash = it->get<std::string>();
                }
                if (auto it = document.find("final_path"); it != document.end())
                {
                    record.session.final_path = std::filesystem::path(it->get<std::string>());
                }
                for (const auto &[key, value] : document.value("chunks", nlohmann::json::object()).items())
                {
                    const auto label = value.get<std::string>();
                    auto status = protocol::chunk_status_from_string(label);
                    if (!status)
                    {
                        throw StorageError("Unknown chunk status in record: " + label);
                    }
                    record.chunks[std::stoull(key)] = *status;
                }
                records_[record.session.id] = std::move(record);
            }
            catch (const std::exception &ex)
            {
                spdlog::warn("Skipping unreadable session record {}: {}", entry.path().string(), ex.what());
            }
        }
        spdlog::debug("Loaded {} session records from {}", records_.size(), directory_.string());
    }

    void JsonSessionStore::persist(const Record &record) const
    {
        const auto path = document_path(record.session.id);
        auto temp_path = path;
        temp_path += ".tmp";
        {
            std::ofstream out(temp_path, std::ios::trunc);
            out << to_document(record.session, record.chunks).dump(2);
            out.flush();
            if (!out)
            {
                throw StorageError("Failed to write session record " + temp_path.string());
            }
        }
        std::error_code ec;
        std::filesystem::rename(temp_path, path, ec);
        if (ec)
        {
            throw StorageError("Failed to commit session record " + path.string() + ": " + ec.message());
        }
    }

    // The in-memory record only changes once its document is safely on disk.
    void JsonSessionStore::commit(Record record)
    {
        persist(record);
        auto id = record.session.id;
        records_.insert_or_assign(std::move(id), std::move(record));
    }

    const JsonSessionStore::Record &JsonSessionStore::require(const std::string &session_id) const
    {
        auto it = records_.find(session_id);
        if (it == records_.end())
        {
            throw StorageError("Unknown session " + session_id);
        }
        return it->second;
    }

} // namespace chunkdrive::server
