#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace chunkdrive::client
{

    /**
     * JSON ledger of uploads that have started but not yet completed, keyed by local path.
     * Every mutation is written through to disk.
     */
    class PendingUploadStore
    {
    public:
        struct Entry
        {
            std::filesystem::path local_path;
            std::string filename;
            std::uint64_t total_size{};
            std::optional<std::string> session_id;
        };

        PendingUploadStore();
        explicit PendingUploadStore(std::filesystem::path state_path);

        const std::vector<Entry> &entries() const noexcept { return entries_; }

        std::optional<Entry> find(const std::filesystem::path &local_path) const;

        void record(const std::filesystem::path &local_path, const std::string &filename, std::uint64_t total_size);

        void set_session(const std::filesystem::path &local_path, const std::string &session_id);

        void remove(const std::filesystem::path &local_path);

        static std::filesystem::path default_state_path();

    private:
        void load();
        void save() const;
        std::vector<Entry>::iterator find_entry(const std::filesystem::path &local_path);
        static std::filesystem::path normalize_path(const std::filesystem::path &path);

        std::filesystem::path state_path_;
        std::vector<Entry> entries_;
    };

} // namespace chunkdrive::client
