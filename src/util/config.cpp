#include <cstdlib>
#include <string>

#include "ctl/ipc.hpp"
#include "util/config.hpp"
#include "util/constants.hpp"
#include "util/log.hpp"

namespace util
{

unsigned long env_ulong(const char *name, unsigned long defv, unsigned long lo, unsigned long hi)
{
    const char *e = std::getenv(name);
    if (!e || !*e)
        return defv;

    char         *p = nullptr;
    unsigned long v = std::strtoul(e, &p, 10);
    if (p && *p == '\0' && e[0] != '-' && v >= lo && v <= hi)
    {
        LOG_INFO("Using %s=%lu", name, v);
        return v;
    }
    LOG_WARN("Ignoring invalid %s='%s' (expect %lu..%lu)", name, e, lo, hi);
    return defv;
}

Config load_config_from_env()
{
    Config cfg;

    if (const char *lv = std::getenv("CHUNKYARD_LOG_LEVEL"); lv && *lv)
        cfg.log_level = lv;

    cfg.ctl_sock = ipc::expand_user(constants::ctl_sock_path());

    cfg.max_file_bytes =
        env_ulong("CHUNKYARD_MAX_FILE_MB", constants::DEFAULT_MAX_FILE_MB, 1, 1000) *
        constants::MB;
    cfg.max_pending_bytes =
        env_ulong("CHUNKYARD_MAX_PENDING_MB", constants::DEFAULT_MAX_PENDING_MB, 1, 65536) *
        constants::MB;
    cfg.evict_after =
        std::chrono::seconds(env_ulong("CHUNKYARD_EVICT_AFTER_SEC", 3600, 1, 604800));
    cfg.sweep_interval =
        std::chrono::milliseconds(env_ulong("CHUNKYARD_SWEEP_INTERVAL_MS", 1000, 10, 600000));
    cfg.client_preview_chars = env_ulong("CHUNKYARD_CLIENT_PREVIEW_CHARS",
                                         constants::DEFAULT_PREVIEW_CHARS, 0, 100000);
    cfg.workers = env_ulong("CHUNKYARD_WORKERS", ipc::DEFAULT_WORKERS, 1, 64);
    return cfg;
}

}  // namespace util
