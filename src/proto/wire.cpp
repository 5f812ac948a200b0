#include <algorithm>
#include <cctype>
#include <cstdint>
#include <limits>

#include "crypto/fingerprint.hpp"
#include "proto/wire.hpp"
#include "util/constants.hpp"
#include "util/log.hpp"

namespace proto
{

std::vector<Chunk> make_chunks(const std::string               &project,
                               const std::string               &filename,
                               const std::vector<std::uint8_t> &content,
                               std::size_t                      chunk_size)
{
    if (chunk_size < 1)
    {
        LOG_ERROR("make_chunks: invalid chunk_size (%zu)", chunk_size);
        return {};
    }
    std::vector<Chunk> out;
    if (content.empty())
    {
        // an empty file is one empty chunk
        Chunk c;
        c.project  = project;
        c.filename = filename;
        c.index    = 0;
        c.total    = 1;
        out.push_back(std::move(c));
        return out;
    }

    const std::size_t num_chunks = (content.size() + chunk_size - 1) / chunk_size;
    if (num_chunks > std::numeric_limits<std::uint32_t>::max())
    {
        LOG_ERROR("make_chunks: content too large (%zu bytes, needs %zu chunks)", content.size(),
                  num_chunks);
        return {};
    }

    out.reserve(num_chunks);
    for (std::size_t i = 0; i < num_chunks; i++)
    {
        std::size_t start = i * chunk_size;
        std::size_t take  = std::min(chunk_size, content.size() - start);
        Chunk       c;
        c.project  = project;
        c.filename = filename;
        c.index    = static_cast<std::uint32_t>(i);
        c.total    = static_cast<std::uint32_t>(num_chunks);
        c.payload.assign(content.begin() + start, content.begin() + start + take);
        out.push_back(std::move(c));
    }
    return out;
}

std::string encode_chunk_line(const Chunk &c)
{
    std::string line;
    line.reserve(64 + c.project.size() + c.filename.size() + c.payload.size() * 4 / 3);
    line += CMD_CHUNK;
    line += ' ';
    line += c.project;
    line += ' ';
    line += c.filename;
    line += ' ';
    line += std::to_string(c.index);
    line += ' ';
    line += std::to_string(c.total);
    line += ' ';
    if (c.payload.empty())
        line += EMPTY_PAYLOAD;
    else
        line += crypto::to_base64(c.payload.data(), c.payload.size());
    return line;
}

std::optional<Chunk> parse_chunk_line(std::string_view line)
{
    auto w = split_words(line);
    if (w.size() != 6 || w[0] != CMD_CHUNK)
    {
        LOG_WARN("parse: malformed CHUNK line (%zu fields)", w.size());
        return std::nullopt;
    }
    Chunk c;
    if (!valid_name(w[1]) || !valid_name(w[2]))
    {
        LOG_WARN("parse: invalid project or filename");
        return std::nullopt;
    }
    c.project  = w[1];
    c.filename = w[2];
    if (!parse_u32(w[3], c.index) || !parse_u32(w[4], c.total))
    {
        LOG_WARN("parse: bad index/total (%s/%s)", w[3].c_str(), w[4].c_str());
        return std::nullopt;
    }
    if (w[5] != EMPTY_PAYLOAD)
    {
        auto bytes = crypto::from_base64(w[5]);
        if (!bytes)
        {
            LOG_WARN("parse: payload is not base64");
            return std::nullopt;
        }
        c.payload = std::move(*bytes);
    }
    // index/total semantics are checked by the store so the error has a name
    return c;
}

bool valid_name(std::string_view s)
{
    if (s.empty() || s.size() > constants::MAX_NAME_LEN)
        return false;
    for (unsigned char c : s)
    {
        if (!std::isgraph(c) || c == '/')
            return false;
    }
    return s != "." && s != "..";
}

std::vector<std::string> split_words(std::string_view line)
{
    std::vector<std::string> out;
    std::size_t              i = 0;
    while (i < line.size())
    {
        while (i < line.size() && (line[i] == ' ' || line[i] == '\t' || line[i] == '\r'))
            i++;
        std::size_t j = i;
        while (j < line.size() && line[j] != ' ' && line[j] != '\t' && line[j] != '\r')
            j++;
        if (j > i)
            out.emplace_back(line.substr(i, j - i));
        i = j;
    }
    return out;
}

bool parse_u32(std::string_view s, std::uint32_t &out)
{
    if (s.empty() || s.size() > 10)
        return false;
    std::uint64_t v = 0;
    for (char ch : s)
    {
        if (ch < '0' || ch > '9')
            return false;
        v = v * 10 + static_cast<std::uint64_t>(ch - '0');
    }
    if (v > std::numeric_limits<std::uint32_t>::max())
        return false;
    out = static_cast<std::uint32_t>(v);
    return true;
}

}  // namespace proto
