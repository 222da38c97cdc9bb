#include "chunkdrive/server/config.hpp"

#include <stdexcept>

namespace chunkdrive::server
{

    void validate_config(const ServerConfig &config)
    {
        if (config.port == 0)
        {
            throw std::invalid_argument("--port is required");
        }
        if (config.root.empty())
        {
            throw std::invalid_argument("--root is required");
        }
        if (config.chunk_size == 0)
        {
            throw std::invalid_argument("--chunk-size must be positive");
        }
        if (config.orphan_age.count() <= 0)
        {
            throw std::invalid_argument("--orphan-age must be positive");
        }
        if (config.cleanup_interval.count() < 0)
        {
            throw std::invalid_argument("--cleanup-interval must not be negative");
        }
    }

} // namespace chunkdrive::server
