#pragma once
#include <chrono>
#include <cstddef>
#include <string>

namespace util
{

struct Config
{
    std::string               log_level{"info"};
    std::string               ctl_sock;
    std::size_t               max_file_bytes{0};
    std::size_t               max_pending_bytes{0};
    std::chrono::seconds      evict_after{3600};
    std::chrono::milliseconds sweep_interval{1000};
    std::size_t               client_preview_chars{0};
    std::size_t               workers{4};
};

// Read CHUNKYARD_* variables. Out-of-range or malformed values are logged and
// replaced with the default.
Config load_config_from_env();

// Parse an unsigned decimal env var within [lo, hi]; returns defv otherwise.
unsigned long env_ulong(const char *name, unsigned long defv, unsigned long lo, unsigned long hi);

}  // namespace util
