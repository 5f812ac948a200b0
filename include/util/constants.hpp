#pragma once
#include <cstddef>
#include <cstdlib>
#include <string>
#include <string_view>

#include "util/log.hpp"

namespace constants
{
inline constexpr std::size_t MB = 1024 * 1024;

inline constexpr std::size_t DEFAULT_MAX_FILE_MB    = 100;
inline constexpr std::size_t DEFAULT_MAX_PENDING_MB = 512;
inline constexpr std::size_t DEFAULT_CHUNK_SIZE     = 262144;  // upload client default
inline constexpr std::size_t MAX_NAME_LEN           = 255;
inline constexpr std::size_t DEFAULT_PREVIEW_CHARS  = 200;

// Control socket path (Unix domain socket)
[[maybe_unused]] static std::string ctl_sock_path()
{
    if (const char *p = std::getenv("CHUNKYARD_CTL_SOCK"); p && *p)
    {
        return std::string(p);
    }
    // fallback to default
    const char *home = std::getenv("HOME");
    std::string base = home && *home ? std::string(home) : "/tmp";
    std::string sock_path = base + "/.cache/chunkyard/ctl.sock";
    LOG_DEBUG("Default control socket %s", sock_path.c_str());
    return sock_path;
}

}  // namespace constants
