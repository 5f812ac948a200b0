// tests/test_env.cpp
#include <cstdlib>
#include <filesystem>
#include <gtest/gtest.h>
#include <string>

#include "util/config.hpp"
#include "util/constants.hpp"
#include "util/log.hpp"

// ENV guard
struct EnvGuard
{
    std::string key, old_val;
    bool        had = false;
    explicit EnvGuard(const char *k) : key(k)
    {
        const char *v = std::getenv(k);
        if (v)
        {
            had     = true;
            old_val = v;
        }
    }
    void set(const std::string &v) const { ::setenv(key.c_str(), v.c_str(), 1); }
    void unset() const { ::unsetenv(key.c_str()); }
    ~EnvGuard()
    {
        if (had)
            ::setenv(key.c_str(), old_val.c_str(), 1);
        else
            ::unsetenv(key.c_str());
    }
};

TEST(Env_CtlSockPath, FromEnv)
{
    EnvGuard          g("CHUNKYARD_CTL_SOCK");
    const std::string want = "/tmp/chunkyard-test.sock";
    g.set(want);
    chunkyard::set_log_level(chunkyard::Level::Debug);

    // no fallback log when env is set
    testing::internal::CaptureStderr();
    std::string got = constants::ctl_sock_path();
    std::string err = testing::internal::GetCapturedStderr();

    EXPECT_EQ(got, want);
    EXPECT_TRUE(err.find("Default control socket") == std::string::npos);
}

TEST(Env_CtlSockPath, DefaultFromHomeAndLogs)
{
    EnvGuard g_sock("CHUNKYARD_CTL_SOCK");
    g_sock.unset();
    chunkyard::set_log_level(chunkyard::Level::Debug);

    EnvGuard              g_home("HOME");
    std::filesystem::path tmp = std::filesystem::temp_directory_path() / "chunkyard-home";
    std::filesystem::create_directories(tmp);
    g_home.set(tmp.string());

    testing::internal::CaptureStderr();
    std::string got = constants::ctl_sock_path();
    std::string err = testing::internal::GetCapturedStderr();

    std::string want = (tmp / ".cache/chunkyard/ctl.sock").string();
    EXPECT_EQ(got, want);
    EXPECT_NE(err.find("Default control socket " + want), std::string::npos);
}

TEST(Env_Config, Defaults)
{
    EnvGuard g1("CHUNKYARD_MAX_FILE_MB");
    EnvGuard g2("CHUNKYARD_MAX_PENDING_MB");
    EnvGuard g3("CHUNKYARD_EVICT_AFTER_SEC");
    EnvGuard g4("CHUNKYARD_WORKERS");
    EnvGuard g5("CHUNKYARD_CLIENT_PREVIEW_CHARS");
    g1.unset();
    g2.unset();
    g3.unset();
    g4.unset();
    g5.unset();

    const util::Config cfg = util::load_config_from_env();
    EXPECT_EQ(cfg.max_file_bytes, 100 * constants::MB);
    EXPECT_EQ(cfg.max_pending_bytes, 512 * constants::MB);
    EXPECT_EQ(cfg.evict_after, std::chrono::seconds(3600));
    EXPECT_EQ(cfg.workers, 4u);
    EXPECT_EQ(cfg.client_preview_chars, constants::DEFAULT_PREVIEW_CHARS);
}

TEST(Env_Config, OverridesAndInvalid)
{
    EnvGuard g1("CHUNKYARD_MAX_FILE_MB");
    EnvGuard g2("CHUNKYARD_WORKERS");
    EnvGuard g3("CHUNKYARD_EVICT_AFTER_SEC");
    g1.set("7");
    g2.set("0");     // out of range
    g3.set("12x");   // malformed
    chunkyard::set_log_level(chunkyard::Level::Info);

    testing::internal::CaptureStderr();
    const util::Config cfg = util::load_config_from_env();
    std::string        err = testing::internal::GetCapturedStderr();

    EXPECT_EQ(cfg.max_file_bytes, 7 * constants::MB);
    EXPECT_EQ(cfg.workers, 4u);
    EXPECT_EQ(cfg.evict_after, std::chrono::seconds(3600));
    EXPECT_NE(err.find("Using CHUNKYARD_MAX_FILE_MB=7"), std::string::npos);
    EXPECT_NE(err.find("Ignoring invalid CHUNKYARD_WORKERS"), std::string::npos);
    EXPECT_NE(err.find("Ignoring invalid CHUNKYARD_EVICT_AFTER_SEC"), std::string::npos);
}

TEST(Env_Config, EnvUlongRange)
{
    EnvGuard g("CHUNKYARD_TEST_ULONG");
    g.unset();
    EXPECT_EQ(util::env_ulong("CHUNKYARD_TEST_ULONG", 5, 1, 10), 5ul);
    g.set("10");
    EXPECT_EQ(util::env_ulong("CHUNKYARD_TEST_ULONG", 5, 1, 10), 10ul);
    g.set("11");
    EXPECT_EQ(util::env_ulong("CHUNKYARD_TEST_ULONG", 5, 1, 10), 5ul);
    g.set("-3");
    EXPECT_EQ(util::env_ulong("CHUNKYARD_TEST_ULONG", 5, 1, 10), 5ul);
}

TEST(LogLevel, FiltersByThreshold)
{
    using namespace chunkyard;

    // ERROR-only: WARN should be suppressed, ERROR should appear
    set_log_level_by_name("ERROR");
    testing::internal::CaptureStderr();
    LOG_WARN("should_not_print_warn");
    std::string out1 = testing::internal::GetCapturedStderr();
    EXPECT_TRUE(out1.find("should_not_print_warn") == std::string::npos);

    testing::internal::CaptureStderr();
    LOG_ERROR("should_print_error");
    std::string out2 = testing::internal::GetCapturedStderr();
    EXPECT_NE(out2.find("should_print_error"), std::string::npos);

    // SYSTEM lines are never filtered
    testing::internal::CaptureStderr();
    LOG_SYSTEM("system_visible");
    std::string out3 = testing::internal::GetCapturedStderr();
    EXPECT_NE(out3.find("[SYSTEM] system_visible"), std::string::npos);

    // DEBUG: DEBUG should appear
    set_log_level_by_name("DEBUG");
    testing::internal::CaptureStderr();
    LOG_DEBUG("debug_visible");
    std::string out4 = testing::internal::GetCapturedStderr();
    EXPECT_NE(out4.find("debug_visible"), std::string::npos);
}

TEST(LogLevel, FatalAborts)
{
    EXPECT_DEATH(LOG_FATAL("invariant broken: %d", 42), "invariant broken: 42");
}
