#pragma once
#include <cstddef>
#include <functional>
#include <string>

namespace ipc
{

// Returns the reply line (without '\n') for one request line.
using LineHandler = std::function<std::string(const std::string &)>;

inline constexpr std::size_t MAX_LINE        = 64 * 1024 * 1024;
inline constexpr std::size_t DEFAULT_WORKERS = 4;

// Serve one request line per connection on `workers` threads until a QUIT
// line arrives. Blocks; the socket file is removed on return.
bool start_server(const std::string &sock_path,
                  LineHandler        on_line,
                  std::size_t        workers = DEFAULT_WORKERS);

// Send one line (newline appended if missing). When `reply` is set, wait for
// the server's reply line and store it there.
bool send_line(const std::string &sock_path, const std::string &line, std::string *reply = nullptr);

std::string expand_user(const std::string &path);

}  // namespace ipc
