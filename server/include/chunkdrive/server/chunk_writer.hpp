#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <span>
#include <string>

namespace chunkdrive::server
{

    /**
     * Positional writes into per-session scratch files and the final rename.
     *
     * Scratch files live at <root>/scratch/<session_id>.bin and assembled files at
     * <root>/files/<session_id>_<filename>. Knows nothing about sessions beyond their id.
     */
    class ChunkWriter
    {
    public:
        explicit ChunkWriter(std::filesystem::path storage_root);

        // Creates the empty scratch file if it does not exist yet. Leaves existing content alone.
        void create_scratch(const std::string &session_id);

        // Writes bytes at offset without touching any other range and fsyncs before returning.
        // The scratch file must already exist; a write after assemble() fails instead of recreating it.
        std::size_t write_at(const std::string &session_id, std::uint64_t offset, std::span<const std::byte> bytes);

        // Renames the scratch file into the files directory; atomic on the same volume.
        std::filesystem::path assemble(const std::string &session_id, const std::string &final_name);

        // Returns false when no scratch file existed.
        bool remove_scratch(const std::string &session_id);

        std::filesystem::path scratch_path(const std::string &session_id) const;

    private:
        std::filesystem::path scratch_dir_;
        std::filesystem::path files_dir_;
    };

} // namespace chunkdrive::server
