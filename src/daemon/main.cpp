#include <cstdlib>
#include <memory>
#include <string>

#include "app/sweeper.hpp"
#include "app/upload_service.hpp"
#include "crypto/fingerprint.hpp"
#include "ctl/commands.hpp"
#include "ctl/ipc.hpp"
#include "util/config.hpp"
#include "util/constants.hpp"
#include "util/log.hpp"

int main()
{
    // log level from env var
    if (const char *log_level = std::getenv("CHUNKYARD_LOG_LEVEL"))
        chunkyard::set_log_level_by_name(log_level);

    if (!crypto::ensure_sodium_init())
    {
        LOG_ERROR("libsodium init failed");
        return 1;
    }

    const util::Config cfg = util::load_config_from_env();
    LOG_SYSTEM("Config: sock=%s max_file=%zuMB max_pending=%zuMB evict_after=%llds workers=%zu",
               cfg.ctl_sock.c_str(), cfg.max_file_bytes / constants::MB,
               cfg.max_pending_bytes / constants::MB, (long long)cfg.evict_after.count(),
               cfg.workers);

    app::ServiceOptions opts;
    opts.limits.max_file_bytes    = cfg.max_file_bytes;
    opts.limits.max_pending_bytes = cfg.max_pending_bytes;
    opts.preview_chars            = cfg.client_preview_chars;

    app::UploadService svc(opts, std::make_unique<crypto::Sha256Fingerprinter>());

    // reaper for uploads that never complete
    app::Sweeper sweeper(svc, cfg.evict_after, cfg.sweep_interval);
    sweeper.start();

    auto on_line = [&svc](const std::string &line) { return ctl::dispatch(svc, line); };

    LOG_SYSTEM("Listening on %s", cfg.ctl_sock.c_str());
    const bool ok = ipc::start_server(cfg.ctl_sock, on_line, cfg.workers);
    sweeper.stop();
    if (!ok)
    {
        LOG_ERROR("start_server failed");
        return 1;
    }
    LOG_SYSTEM("Received QUIT command, exiting...");
    return 0;
}
