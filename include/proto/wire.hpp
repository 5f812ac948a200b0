#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

/*
Control socket: one request line, one reply line per connection.

CLI:
  file bytes
    -> make_chunks(project, filename, bytes, chunk_size)
       -> for each Chunk: encode_chunk_line(c)   // "CHUNK p f idx total <base64|->"
            -> ipc::send_line(sock, line, &reply)

Daemon:
  ipc::start_server(sock, handler)
    -> parse_chunk_line(line)   // validate names, numbers, base64
        -> UploadService::submit_chunk(...)
*/

namespace proto
{

inline constexpr std::string_view CMD_CHUNK     = "CHUNK";
inline constexpr std::string_view CMD_SUMMARIZE = "SUMMARIZE";
inline constexpr std::string_view CMD_PUSH      = "PUSH";
inline constexpr std::string_view CMD_LIST      = "LIST";
inline constexpr std::string_view CMD_STATUS    = "STATUS";
inline constexpr std::string_view CMD_INFO      = "INFO";
inline constexpr std::string_view CMD_DELETE    = "DELETE";
inline constexpr std::string_view CMD_EVICT     = "EVICT";
inline constexpr std::string_view CMD_QUIT      = "QUIT";

inline constexpr std::string_view EMPTY_PAYLOAD = "-";

struct Chunk
{
    std::string               project;
    std::string               filename;
    std::uint32_t             index = 0;
    std::uint32_t             total = 0;
    std::vector<std::uint8_t> payload;
};

// TX
std::vector<Chunk> make_chunks(const std::string               &project,
                               const std::string               &filename,
                               const std::vector<std::uint8_t> &content,
                               std::size_t                      chunk_size);
std::string        encode_chunk_line(const Chunk &c);
// RX
std::optional<Chunk> parse_chunk_line(std::string_view line);

// 1..255 printable bytes, no whitespace, no '/'
bool valid_name(std::string_view s);

std::vector<std::string> split_words(std::string_view line);
bool                     parse_u32(std::string_view s, std::uint32_t &out);

}  // namespace proto
