#include <utility>

#include "app/upload_service.hpp"
#include "proto/wire.hpp"
#include "util/log.hpp"

namespace app
{

using chunkyard::Errc;

static std::unique_ptr<crypto::Fingerprinter> or_default(std::unique_ptr<crypto::Fingerprinter> fp)
{
    if (fp)
        return fp;
    return std::make_unique<crypto::Sha256Fingerprinter>();
}

static std::unique_ptr<Summarizer> or_default(std::unique_ptr<Summarizer> s, std::size_t preview)
{
    if (s)
        return s;
    return std::make_unique<TruncatingSummarizer>(preview);
}

UploadService::UploadService(ServiceOptions                         opts,
                             std::unique_ptr<crypto::Fingerprinter> fp,
                             std::unique_ptr<Summarizer>            sum)
    : fp_(or_default(std::move(fp))),
      summarizer_(or_default(std::move(sum), opts.preview_chars)),
      chunks_(opts.limits, opts.steady_clock),
      registry_(),
      assembler_(chunks_, registry_, *fp_, opts.wall_clock),
      lifecycle_(registry_, *summarizer_, opts.wall_clock)
{
    LOG_DEBUG("upload service up: fingerprint=%s max_file=%zu max_pending=%zu", fp_->name(),
              opts.limits.max_file_bytes, opts.limits.max_pending_bytes);
}

Errc UploadService::submit_chunk(const std::string &project,
                                 const std::string &filename,
                                 std::uint32_t      chunk_index,
                                 std::uint32_t      total_chunks,
                                 Bytes              payload,
                                 SubmitResult      &out)
{
    if (!proto::valid_name(project) || !proto::valid_name(filename))
        return Errc::InvalidArgument;

    AssembleOutcome oc;
    const Errc      rc = assembler_.on_chunk_received({project, filename}, chunk_index,
                                                      total_chunks, std::move(payload), oc);
    if (rc != Errc::Ok)
        return rc;

    out = SubmitResult{};
    switch (oc.status)
    {
        case AssembleStatus::StoredIncomplete:
            out.status = "stored";
            return Errc::Ok;
        case AssembleStatus::AssembledNow:
            out.status = "assembled";
            break;
        case AssembleStatus::AlreadyAssembled:
            out.status = "duplicate";
            break;
    }
    out.fingerprint_hex = crypto::to_hex(oc.file->fingerprint);
    out.size            = oc.file->size();
    return Errc::Ok;
}

Errc UploadService::generate_summary(const std::string &project, SummaryRecord &out)
{
    return lifecycle_.generate(project, out);
}

Errc UploadService::push_summary(const std::string &project, SummaryRecord &out)
{
    return lifecycle_.push(project, out);
}

Errc UploadService::summary_status(const std::string &project, std::optional<SummaryRecord> &out)
{
    return lifecycle_.status(project, out);
}

static FileInfo info_of(const AssembledFile &f)
{
    return FileInfo{f.filename, f.size(), crypto::to_hex(f.fingerprint), f.assembled_at};
}

std::vector<FileInfo> UploadService::list_files(const std::string &project) const
{
    std::vector<FileInfo> out;
    for (const auto &f : registry_.list_files(project))
        out.push_back(info_of(*f));
    return out;
}

Errc UploadService::file_info(const std::string &project,
                              const std::string &filename,
                              FileInfo          &out) const
{
    if (!proto::valid_name(project) || !proto::valid_name(filename))
        return Errc::InvalidArgument;
    auto f = registry_.find_file(project, filename);
    if (!f)
        return Errc::UnknownFile;
    out = info_of(*f);
    return Errc::Ok;
}

Errc UploadService::remove_file(const std::string &project, const std::string &filename)
{
    if (!proto::valid_name(project) || !proto::valid_name(filename))
        return Errc::InvalidArgument;
    if (!registry_.remove_file(project, filename))
        return Errc::UnknownFile;
    chunks_.forget({project, filename});
    LOG_INFO("removed %s/%s", project.c_str(), filename.c_str());
    return Errc::Ok;
}

std::vector<store::UploadKey> UploadService::evict_stale(std::chrono::steady_clock::duration age)
{
    auto keys = chunks_.evict_older_than(age);
    if (!keys.empty())
        LOG_INFO("evicted %zu stale upload(s), %zu bytes still pending", keys.size(),
                 chunks_.pending_bytes());
    return keys;
}

}  // namespace app
