#include "chunkdrive/client/pending_upload_store.hpp"

#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <stdexcept>

#include <nlohmann/json.hpp>

namespace chunkdrive::client
{

    PendingUploadStore::PendingUploadStore() : PendingUploadStore(default_state_path()) {}

    PendingUploadStore::PendingUploadStore(std::filesystem::path state_path) : state_path_(std::move(state_path))
    {
        load();
    }

    std::optional<PendingUploadStore::Entry> PendingUploadStore::find(const std::filesystem::path &local_path) const
    {
        const auto normalized = normalize_path(local_path);
        const auto it = std::find_if(entries_.begin(), entries_.end(), [&](const Entry &entry)
                                     { return entry.local_path == normalized; });
        if (it == entries_.end())
        {
            return std::nullopt;
        }
        return *it;
    }

    void PendingUploadStore::record(const std::filesystem::path &local_path, const std::string &filename,
                                    std::uint64_t total_size)
    {
        auto it = find_entry(local_path);
        if (it == entries_.end())
        {
            entries_.push_back(Entry{normalize_path(local_path), filename, total_size, std::nullopt});
        }
        else if (it->filename != filename || it->total_size != total_size)
        {
            // The file changed since the last attempt; the old session no longer applies.
            it->filename = filename;
            it->total_size = total_size;
            it->session_id.reset();
        }
        save();
    }

    void PendingUploadStore::set_session(const std::filesystem::path &local_path, const std::string &session_id)
    {
        auto it = find_entry(local_path);
        if (it != entries_.end())
        {
            it->session_id = session_id;
            save();
        }
    }

    void PendingUploadStore::remove(const std::filesystem::path &local_path)
    {
        auto it = find_entry(local_path);
        if (it != entries_.end())
        {
            entries_.erase(it);
            save();
        }
    }

    std::filesystem::path PendingUploadStore::default_state_path()
    {
        if (const char *home = std::getenv("HOME"))
        {
            return std::filesystem::path(home) / ".chunkdrive" / "pending.json";
        }
        return std::filesystem::path(".chunkdrive") / "pending.json";
    }

    void PendingUploadStore::load()
    {
        entries_.clear();
        if (!std::filesystem::exists(state_path_))
        {
            return;
        }
        std::ifstream in(state_path_);
        if (!in.is_open())
        {
            throw std::runtime_error("Cannot read pending upload ledger " + state_path_.string());
        }
        nlohmann::json json;
        try
        {
            in >> json;
        }
        catch (const nlohmann::json::parse_error &ex)
        {
            throw std::runtime_error("Corrupt pending upload ledger " + state_path_.string() + ": " + ex.what());
        }
        if (!json.is_array())
        {
            return;
        }
        for (const auto &item : json)
        {
            Entry entry;
            entry.local_path = normalize_path(std::filesystem::path(item.value("local", std::string{})));
            entry.filename = item.value("filename", std::string{});
            entry.total_size = item.value("total", 0ULL);
            if (auto it = item.find("session"); it != item.end() && it->is_string())
            {
                entry.session_id = it->get<std::string>();
            }
            if (!entry.filename.empty() && entry.total_size > 0)
            {
                entries_.push_back(std::move(entry));
            }
        }
    }

    void PendingUploadStore::save() const
    {
        const auto dir = state_path_.parent_path();
        if (!dir.empty())
        {
            std::filesystem::create_directories(dir);
        }
        nlohmann::json json = nlohmann::json::array();
        for (const auto &entry : entries_)
        {
            nlohmann::json item{{"local", entry.local_path.generic_string()},
                                {"filename", entry.filename},
                                {"total", entry.total_size}};
            if (entry.session_id)
            {
                item["session"] = *entry.session_id;
            }
            json.push_back(std::move(item));
        }
        std::ofstream out(state_path_, std::ios::trunc);
        if (!out.is_open())
        {
            throw std::runtime_error("Cannot write pending upload ledger " + state_path_.string());
        }
        out << json.dump(2);
        if (!out)
        {
            throw std::runtime_error("Failed to write pending upload ledger " + state_path_.string());
        }
    }

    std::vector<PendingUploadStore::Entry>::iterator PendingUploadStore::find_entry(
        const std::filesystem::path &local_path)
    {
        const auto normalized = normalize_path(local_path);
        return std::find_if(entries_.begin(), entries_.end(), [&](const Entry &entry)
                            { return entry.local_path == normalized; });
    }

    std::filesystem::path PendingUploadStore::normalize_path(const std::filesystem::path &path)
    {
        std::error_code ec;
        auto absolute = std::filesystem::absolute(path, ec);
        if (ec)
        {
            absolute = path;
        }
        return absolute.lexically_normal();
    }

} // namespace chunkdrive::client
