#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "crypto/fingerprint.hpp"
#include "ctl/commands.hpp"
#include "proto/wire.hpp"
#include "util/log.hpp"
#include "util/time.hpp"

namespace ctl
{

using chunkyard::Errc;

std::string err_reply(Errc e)
{
    std::string out = "ERR ";
    out += chunkyard::errc_name(e);
    if (chunkyard::is_retryable(e))
        out += " retry";
    return out;
}

static std::string b64(const std::string &s)
{
    return crypto::to_base64(reinterpret_cast<const std::uint8_t *>(s.data()), s.size());
}

static std::string on_chunk(app::UploadService &svc, const std::string &line)
{
    auto c = proto::parse_chunk_line(line);
    if (!c)
        return err_reply(Errc::InvalidArgument);

    app::SubmitResult res;
    const Errc rc = svc.submit_chunk(c->project, c->filename, c->index, c->total,
                                     std::move(c->payload), res);
    if (rc != Errc::Ok)
        return err_reply(rc);

    std::string out = "OK " + res.status;
    if (res.fingerprint_hex && res.size)
        out += " " + *res.fingerprint_hex + " " + std::to_string(*res.size);
    return out;
}

static std::string on_summarize(app::UploadService &svc, const std::string &project)
{
    app::SummaryRecord rec;
    const Errc         rc = svc.generate_summary(project, rec);
    if (rc != Errc::Ok)
        return err_reply(rc);
    return "OK " + std::string(app::state_name(rec.state)) + " " + b64(rec.admin_text) + " " +
           b64(rec.client_text);
}

static std::string on_push(app::UploadService &svc, const std::string &project)
{
    app::SummaryRecord rec;
    const Errc         rc = svc.push_summary(project, rec);
    if (rc != Errc::Ok)
        return err_reply(rc);
    return "OK " + std::string(app::state_name(rec.state)) + " " +
           util::iso8601(rec.delivered_at.value_or(rec.generated_at));
}

static std::string on_list(app::UploadService &svc, const std::string &project)
{
    const auto  files = svc.list_files(project);
    std::string out   = "OK " + std::to_string(files.size());
    for (const auto &f : files)
        out += " " + f.filename + ":" + std::to_string(f.size) + ":" + f.fingerprint_hex;
    return out;
}

static std::string on_status(app::UploadService &svc, const std::string &project)
{
    std::optional<app::SummaryRecord> rec;
    const Errc                        rc = svc.summary_status(project, rec);
    if (rc != Errc::Ok)
        return err_reply(rc);
    if (!rec)
        return "OK none";
    if (rec->delivered_at)
        return "OK delivered " + util::iso8601(*rec->delivered_at);
    return "OK generated " + util::iso8601(rec->generated_at);
}

static std::string on_info(app::UploadService &svc, const std::string &project,
                           const std::string &filename)
{
    app::FileInfo info;
    const Errc    rc = svc.file_info(project, filename, info);
    if (rc != Errc::Ok)
        return err_reply(rc);
    return "OK " + info.filename + " " + std::to_string(info.size) + " " + info.fingerprint_hex +
           " " + util::iso8601(info.assembled_at);
}

static std::string on_delete(app::UploadService &svc, const std::string &project,
                             const std::string &filename)
{
    const Errc rc = svc.remove_file(project, filename);
    if (rc != Errc::Ok)
        return err_reply(rc);
    return "OK deleted";
}

std::string dispatch(app::UploadService &svc, const std::string &line)
{
    // CHUNK lines carry the payload; everything else is a few words
    if (line.compare(0, proto::CMD_CHUNK.size() + 1, "CHUNK ") == 0)
        return on_chunk(svc, line);

    const auto w = proto::split_words(line);
    if (w.empty())
        return err_reply(Errc::InvalidArgument);

    const std::string &cmd = w[0];
    LOG_INFO("CMD: %s", line.c_str());

    if (cmd == proto::CMD_QUIT)
        return "OK bye";

    if (cmd == proto::CMD_EVICT)
    {
        std::uint32_t secs = 0;
        if (w.size() != 2 || !proto::parse_u32(w[1], secs))
            return err_reply(Errc::InvalidArgument);
        auto keys = svc.evict_stale(std::chrono::seconds(secs));
        return "OK evicted " + std::to_string(keys.size());
    }

    using FileHandler = std::function<std::string(app::UploadService &, const std::string &,
                                                  const std::string &)>;
    static const std::unordered_map<std::string, FileHandler> per_file = {
        {std::string(proto::CMD_INFO), on_info},
        {std::string(proto::CMD_DELETE), on_delete},
    };
    auto fit = per_file.find(cmd);
    if (fit != per_file.end())
    {
        if (w.size() != 3 || !proto::valid_name(w[1]) || !proto::valid_name(w[2]))
            return err_reply(Errc::InvalidArgument);
        return fit->second(svc, w[1], w[2]);
    }

    using Handler = std::function<std::string(app::UploadService &, const std::string &)>;
    static const std::unordered_map<std::string, Handler> per_project = {
        {std::string(proto::CMD_SUMMARIZE), on_summarize},
        {std::string(proto::CMD_PUSH), on_push},
        {std::string(proto::CMD_LIST), on_list},
        {std::string(proto::CMD_STATUS), on_status},
    };

    auto it = per_project.find(cmd);
    if (it == per_project.end())
    {
        LOG_WARN("unknown command: %s", cmd.c_str());
        return err_reply(Errc::InvalidArgument);
    }
    if (w.size() != 2 || !proto::valid_name(w[1]))
        return err_reply(Errc::InvalidArgument);
    return it->second(svc, w[1]);
}

}  // namespace ctl
