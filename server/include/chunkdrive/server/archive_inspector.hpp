#pragma once

#include <cstddef>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <vector>

namespace chunkdrive::server
{

    class ArchiveError : public std::runtime_error
    {
    public:
        using std::runtime_error::runtime_error;
    };

    // Structural sanity check run on an assembled file; throws ArchiveError when it fails.
    class ArchiveInspector
    {
    public:
        virtual ~ArchiveInspector() = default;

        virtual std::vector<std::string> inspect(const std::filesystem::path &path) const = 0;
    };

    /**
     * Opens the file read-only with libzip and lists the first max_entries file names from its
     * central directory. Directory entries are skipped.
     */
    class ZipArchiveInspector : public ArchiveInspector
    {
    public:
        explicit ZipArchiveInspector(std::size_t max_entries = 10);

        std::vector<std::string> inspect(const std::filesystem::path &path) const override;

    private:
        std::size_t max_entries_;
    };

    // Accepts any file.
    class NullArchiveInspector : public ArchiveInspector
    {
    public:
        std::vector<std::string> inspect(const std::filesystem::path &path) const override;
    };

} // namespace chunkdrive::server
