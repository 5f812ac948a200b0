#include <atomic>
#include <cerrno>
#include <condition_variable>
#include <cstddef>
#include <cstdlib>
#include <cstring>
#include <deque>
#include <exception>
#include <fcntl.h>
#include <filesystem>
#include <mutex>
#include <sys/socket.h>
#include <sys/un.h>
#include <thread>
#include <unistd.h>
#include <vector>

#include "ctl/ipc.hpp"
#include "proto/wire.hpp"
#include "util/errors.hpp"
#include "util/log.hpp"

namespace ipc
{
namespace fs = std::filesystem;

static bool ensure_parent_dir(const std::string &sock_path)
{
    std::error_code ec;
    fs::path        p(sock_path);
    fs::path        dir = p.parent_path();
    if (dir.empty())
        return true;  // socket in CWD

    if (!fs::exists(dir, ec))
    {
        if (!fs::create_directories(dir, ec))
        {
            LOG_ERROR("create_directories(%s) failed: %s", dir.string().c_str(),
                      ec.message().c_str());
            return false;
        }
        // Enforce 0700 on a directory we created
        fs::permissions(dir, fs::perms::owner_all, fs::perm_options::replace, ec);
        if (ec)
        {
            LOG_WARN("permissions(%s, 0700) failed: %s", dir.string().c_str(),
                     ec.message().c_str());
        }
    }
    return true;
}

static void set_cloexec(int fd)
{
    int fd_flags = fcntl(fd, F_GETFD, 0);
    if (fd_flags != -1)
        fcntl(fd, F_SETFD, fd_flags | FD_CLOEXEC);
}

static bool fill_addr(const std::string &sock_path, sockaddr_un &addr, socklen_t &addr_len)
{
    std::memset(&addr, 0, sizeof(addr));
    if (sock_path.empty())
    {
        errno = EINVAL;
        LOG_ERROR("Invalid socket path");
        return false;
    }
    if (sock_path.size() >= sizeof(addr.sun_path))
    {
        errno = ENAMETOOLONG;
        LOG_ERROR("Path name too long for AF_UNIX: %s", sock_path.c_str());
        return false;
    }
    addr.sun_family = AF_UNIX;
    std::strncpy(addr.sun_path, sock_path.c_str(), sizeof(addr.sun_path) - 1);
    addr.sun_path[sizeof(addr.sun_path) - 1] = '\0';
    addr_len = static_cast<socklen_t>(offsetof(struct sockaddr_un, sun_path) +
                                      std::strlen(addr.sun_path) + 1);
    return true;
}

static bool send_all(int fd, const char *buf, size_t len)
{
    size_t sent = 0;
    while (sent < len)
    {
        ssize_t n = send(fd, buf + sent, len - sent, MSG_NOSIGNAL);
        if (n > 0)
        {
            sent += static_cast<size_t>(n);
            continue;
        }
        if (n == -1 && errno == EINTR)
            continue;
        LOG_ERROR("send() failed: %s", std::strerror(errno));
        return false;
    }
    return true;
}

// Read up to the first '\n'. Returns false on error or an oversized line.
static bool recv_line(int fd, std::string &line)
{
    char buf[64 * 1024];
    while (1)
    {
        ssize_t n = recv(fd, buf, sizeof(buf), 0);
        if (n > 0)
        {
            line.append(buf, static_cast<size_t>(n));
            if (std::memchr(buf, '\n', static_cast<size_t>(n)) != nullptr)
                break;
            if (line.size() > MAX_LINE)
            {
                LOG_WARN("request line over %zu bytes, dropping connection", MAX_LINE);
                return false;
            }
            continue;
        }
        if (n == 0)
            break;  // EOF
        if (n == -1 && errno == EINTR)
            continue;
        LOG_ERROR("recv() failed: %s", std::strerror(errno));
        return false;
    }

    // take first line only
    auto pos = line.find('\n');
    if (pos != std::string::npos)
        line.resize(pos);
    // trim optional '\r'
    if (!line.empty() && line.back() == '\r')
        line.pop_back();
    return true;
}

namespace
{
struct ConnQueue
{
    std::mutex              mu;
    std::condition_variable cv;
    std::deque<int>         fds;
    bool                    stop = false;
};
}  // namespace

bool start_server(const std::string &sock_path, LineHandler on_line, std::size_t workers)
{
    sockaddr_un addr{};
    socklen_t   addr_len = 0;
    if (!fill_addr(sock_path, addr, addr_len))
        return false;

    // ensure parent directory exists (mkdir -p)
    if (!ensure_parent_dir(sock_path))
        return false;

    (void)::unlink(sock_path.c_str());  // stale socket from a previous run

    int fd = socket(AF_UNIX, SOCK_STREAM, 0);
    if (fd == -1)
    {
        LOG_ERROR("socket() failed: %s", std::strerror(errno));
        return false;
    }
    set_cloexec(fd);

    if (bind(fd, reinterpret_cast<sockaddr *>(&addr), addr_len) == -1)
    {
        int saved = errno;
        close(fd);
        errno = saved;
        LOG_ERROR("bind() failed: %s", std::strerror(errno));
        return false;
    }
    if (listen(fd, 64) == -1)
    {
        int saved = errno;
        close(fd);
        unlink(sock_path.c_str());
        errno = saved;
        LOG_ERROR("listen() failed: %s", std::strerror(errno));
        return false;
    }

    LOG_DEBUG("Listening on %s (%zu workers)", sock_path.c_str(), workers);

    std::atomic<bool> quitting{false};
    ConnQueue         q;

    auto serve_one = [&](int cfd) {
        std::string first;
        if (!recv_line(cfd, first))
        {
            close(cfd);
            return;  // keep server alive; accept next connection
        }
        std::string reply;
        try
        {
            if (on_line)
                reply = on_line(first);
        }
        catch (const std::exception &e)
        {
            // one failed request must not take the worker down
            LOG_ERROR("handler failed: %s", e.what());
            reply = std::string("ERR ") + chunkyard::errc_name(chunkyard::Errc::Internal);
        }
        reply.push_back('\n');
        (void)send_all(cfd, reply.data(), reply.size());  // client may not wait for it
        close(cfd);

        const auto words = proto::split_words(first);
        if (!words.empty() && words[0] == proto::CMD_QUIT)
        {
            quitting.store(true);
            ::shutdown(fd, SHUT_RDWR);  // wakes accept()
        }
    };

    if (workers == 0)
        workers = 1;
    std::vector<std::thread> pool;
    pool.reserve(workers);
    for (std::size_t i = 0; i < workers; ++i)
    {
        pool.emplace_back([&] {
            while (1)
            {
                int cfd = -1;
                {
                    std::unique_lock<std::mutex> lk(q.mu);
                    q.cv.wait(lk, [&] { return q.stop || !q.fds.empty(); });
                    if (q.fds.empty())
                        return;  // stop requested and drained
                    cfd = q.fds.front();
                    q.fds.pop_front();
                }
                serve_one(cfd);
            }
        });
    }

    bool ok = true;
    while (!quitting.load())
    {
        int newfd = accept(fd, nullptr, nullptr);
        if (newfd == -1)
        {
            if (errno == EINTR)
                continue;
            if (quitting.load())
                break;
            LOG_ERROR("accept() failed: %s", std::strerror(errno));
            ok = false;
            break;
        }
        set_cloexec(newfd);
        {
            std::lock_guard<std::mutex> lk(q.mu);
            q.fds.push_back(newfd);
        }
        q.cv.notify_one();
    }

    {
        std::lock_guard<std::mutex> lk(q.mu);
        q.stop = true;
    }
    q.cv.notify_all();
    for (auto &t : pool)
        t.join();

    close(fd);
    unlink(sock_path.c_str());
    return ok;
}

bool send_line(const std::string &sock_path, const std::string &line, std::string *reply)
{
    sockaddr_un addr{};
    socklen_t   addr_len = 0;
    if (line.empty())
    {
        errno = EINVAL;
        LOG_ERROR("Invalid line or socket path");
        return false;
    }
    if (!fill_addr(sock_path, addr, addr_len))
        return false;

    int fd = socket(AF_UNIX, SOCK_STREAM, 0);
    if (fd == -1)
    {
        LOG_ERROR("socket() failed: %s", std::strerror(errno));
        return false;
    }
    set_cloexec(fd);

    // connect
    if (connect(fd, reinterpret_cast<sockaddr *>(&addr), addr_len) == -1)
    {
        int saved = errno;
        close(fd);
        errno = saved;
        LOG_ERROR("connect() failed: %s", std::strerror(errno));
        return false;
    }

    LOG_DEBUG("Sending line (%zu bytes)", line.size());
    bool ok = send_all(fd, line.data(), line.size());
    if (ok && line.back() != '\n')
        ok = send_all(fd, "\n", 1);
    if (!ok)
    {
        close(fd);
        return false;
    }

    if (reply)
    {
        reply->clear();
        ::shutdown(fd, SHUT_WR);
        if (!recv_line(fd, *reply))
        {
            close(fd);
            return false;
        }
    }

    close(fd);
    return true;
}

std::string expand_user(const std::string &p)
{
    // expand leading '~' or '~/' to $HOME
    if (!p.empty() && p[0] == '~' && (p.size() == 1 || p[1] == '/'))
    {
        const char *home = std::getenv("HOME");
        if (home && (*home))  // non-empty
        {
            return (p.size() == 1) ? std::string(home) : std::string(home) + p.substr(1);
        }
    }
    return p;
}

}  // namespace ipc
