#include "chunkdrive/server/archive_inspector.hpp"

#include <memory>

#include <zip.h>

namespace chunkdrive::server
{

    namespace
    {
        // Read-only handles are released without writing anything back.
        struct ZipDiscard
        {
            void operator()(zip_t *archive) const
            {
                zip_discard(archive);
            }
        };

        using ZipHandle = std::unique_ptr<zip_t, ZipDiscard>;

        std::string describe_open_error(int code)
        {
            zip_error_t error;
            zip_error_init_with_code(&error, code);
            std::string message = zip_error_strerror(&error);
            zip_error_fini(&error);
            return message;
        }

    } // namespace

    ZipArchiveInspector::ZipArchiveInspector(std::size_t max_entries) : max_entries_(max_entries) {}

    std::vector<std::string> ZipArchiveInspector::inspect(const std::filesystem::path &path) const
    {
        int error = 0;
        ZipHandle archive(zip_open(path.c_str(), ZIP_RDONLY, &error));
        if (!archive)
        {
            throw ArchiveError("Not a valid ZIP archive: " + describe_open_error(error));
        }

        const auto count = zip_get_num_entries(archive.get(), 0);
        if (count < 0)
        {
            throw ArchiveError(std::string("Cannot read ZIP central directory: ") + zip_strerror(archive.get()));
        }

        std::vector<std::string> names;
        for (zip_int64_t index = 0; index < count && names.size() < max_entries_; ++index)
        {
            const char *name = zip_get_name(archive.get(), static_cast<zip_uint64_t>(index), ZIP_FL_ENC_GUESS);
            if (name == nullptr)
            {
                throw ArchiveError(std::string("Corrupt ZIP entry: ") + zip_strerror(archive.get()));
            }
            std::string entry(name);
            if (entry.empty() || entry.back() != '/')
            {
                names.push_back(std::move(entry));
            }
        }
        return names;
    }

    std::vector<std::string> NullArchiveInspector::inspect(const std::filesystem::path & /*path*/) const
    {
        return {};
    }

} // namespace chunkdrive::server
