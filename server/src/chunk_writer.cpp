#include "chunkdrive/server/chunk_writer.hpp"

#include <cerrno>
#include <cstring>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include "chunkdrive/server/session_store.hpp"

namespace chunkdrive::server
{

    namespace
    {
        constexpr auto kScratchDir = "scratch";
        constexpr auto kFilesDir = "files";

        [[noreturn]] void throw_errno(const std::string &what, const std::filesystem::path &path, int error)
        {
            throw StorageError(what + " " + path.string() + ": " + std::strerror(error));
        }

        // Closes the descriptor on scope exit.
        class FileDescriptor
        {
        public:
            explicit FileDescriptor(int fd) : fd_(fd) {}
            ~FileDescriptor()
            {
                if (fd_ >= 0)
                {
                    ::close(fd_);
                }
            }
            FileDescriptor(const FileDescriptor &) = delete;
            FileDescriptor &operator=(const FileDescriptor &) = delete;

            int get() const { return fd_; }

            int release()
            {
                const int fd = fd_;
                fd_ = -1;
                return fd;
            }

        private:
            int fd_;
        };
    } // namespace

    ChunkWriter::ChunkWriter(std::filesystem::path storage_root)
        : scratch_dir_(storage_root / kScratchDir), files_dir_(storage_root / kFilesDir)
    {
        std::filesystem::create_directories(scratch_dir_);
        std::filesystem::create_directories(files_dir_);
    }

    void ChunkWriter::create_scratch(const std::string &session_id)
    {
        const auto path = scratch_path(session_id);
        FileDescriptor fd(::open(path.c_str(), O_WRONLY | O_CREAT | O_CLOEXEC, 0644));
        if (fd.get() < 0)
        {
            throw_errno("Failed to create scratch file", path, errno);
        }
        if (::close(fd.release()) != 0)
        {
            throw_errno("Failed to close scratch file", path, errno);
        }
    }

    std::size_t ChunkWriter::write_at(const std::string &session_id, std::uint64_t offset,
                                      std::span<const std::byte> bytes)
    {
        const auto path = scratch_path(session_id);
        FileDescriptor fd(::open(path.c_str(), O_WRONLY | O_CLOEXEC));
        if (fd.get() < 0)
        {
            throw_errno("Failed to open scratch file", path, errno);
        }

        std::size_t written = 0;
        while (written < bytes.size())
        {
            const auto result = ::pwrite(fd.get(), bytes.data() + written, bytes.size() - written,
                                         static_cast<off_t>(offset + written));
            if (result < 0)
            {
                if (errno == EINTR)
                {
                    continue;
                }
                throw_errno("Failed to write scratch file", path, errno);
            }
            written += static_cast<std::size_t>(result);
        }

        if (::fsync(fd.get()) != 0)
        {
            throw_errno("Failed to sync scratch file", path, errno);
        }
        if (::close(fd.release()) != 0)
        {
            throw_errno("Failed to close scratch file", path, errno);
        }
        return written;
    }

    std::filesystem::path ChunkWriter::assemble(const std::string &session_id, const std::string &final_name)
    {
        const auto source = scratch_path(session_id);
        const auto destination = files_dir_ / (session_id + "_" + final_name);
        std::error_code ec;
        std::filesystem::rename(source, destination, ec);
        if (ec)
        {
            throw StorageError("Failed to assemble " + source.string() + " into " + destination.string() + ": " +
                               ec.message());
        }
        return destination;
    }

    bool ChunkWriter::remove_scratch(const std::string &session_id)
    {
        const auto path = scratch_path(session_id);
        std::error_code ec;
        const bool removed = std::filesystem::remove(path, ec);
        if (ec)
        {
            throw StorageError("Failed to remove scratch file " + path.string() + ": " + ec.message());
        }
        return removed;
    }

    std::filesystem::path ChunkWriter::scratch_path(const std::string &session_id) const
    {
        return scratch_dir_ / (session_id + ".bin");
    }

} // namespace chunkdrive::server
