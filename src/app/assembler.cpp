#include <memory>
#include <utility>

#include "app/assembler.hpp"
#include "util/log.hpp"

namespace app
{

using chunkyard::Errc;

Assembler::Assembler(store::ChunkStore           &chunks,
                     ProjectRegistry             &registry,
                     const crypto::Fingerprinter &fp,
                     util::WallClock              clock)
    : chunks_(chunks), registry_(registry), fp_(fp), clock_(std::move(clock))
{
}

Bytes Assembler::merge(std::vector<Bytes> &&parts)
{
    std::size_t total = 0;
    for (const auto &p : parts)
        total += p.size();

    Bytes out;
    out.reserve(total);
    for (auto &p : parts)
    {
        if (!p.empty())
            out.insert(out.end(), p.begin(), p.end());
        Bytes().swap(p);  // release as we go
    }
    return out;
}

namespace
{
// Hands the key back to the store if assembly unwinds before finish().
class ClaimGuard
{
  public:
    ClaimGuard(store::ChunkStore &chunks, const store::UploadKey &key)
        : chunks_(chunks), key_(key)
    {
    }
    ~ClaimGuard()
    {
        if (armed_)
            chunks_.abort(key_);
    }
    ClaimGuard(const ClaimGuard &)            = delete;
    ClaimGuard &operator=(const ClaimGuard &) = delete;

    void release() { armed_ = false; }

  private:
    store::ChunkStore      &chunks_;
    const store::UploadKey &key_;
    bool                    armed_ = true;
};
}  // namespace

FilePtr Assembler::assemble(const store::UploadKey &key)
{
    auto parts = chunks_.take_assembled_parts(key);
    if (!parts)
    {
        // we hold the claim, so the parts must be there
        LOG_FATAL("claim held for %s/%s but no parts to take", key.project.c_str(),
                  key.filename.c_str());
    }
    ClaimGuard        guard(chunks_, key);
    const std::size_t n = parts->size();

    auto file          = std::make_shared<AssembledFile>();
    file->project      = key.project;
    file->filename     = key.filename;
    file->content      = merge(std::move(*parts));
    file->fingerprint  = fp_.compute(file->content);
    file->assembled_at = clock_();

    FilePtr done = std::move(file);
    registry_.record_file(done);
    chunks_.finish(key, std::shared_ptr<const Bytes>(done, &done->content));
    guard.release();

    LOG_SYSTEM("[ASSEMBLED] %s/%s %zu bytes from %zu chunks %s=%s", key.project.c_str(),
               key.filename.c_str(), done->size(), n, fp_.name(),
               crypto::to_hex(done->fingerprint).c_str());
    return done;
}

Errc Assembler::on_chunk_received(const store::UploadKey &key,
                                  std::uint32_t           chunk_index,
                                  std::uint32_t           total_chunks,
                                  Bytes                   payload,
                                  AssembleOutcome        &out)
{
    store::PutOutcome put = store::PutOutcome::Incomplete;
    Errc              rc  = chunks_.put(key, chunk_index, total_chunks, std::move(payload), put);
    if (rc == Errc::Ok && put == store::PutOutcome::Duplicate &&
        !registry_.find_file(key.project, key.filename))
    {
        // the file was removed after it was assembled; this is a new upload.
        // A Duplicate put leaves the payload untouched.
        chunks_.forget(key);
        rc = chunks_.put(key, chunk_index, total_chunks, std::move(payload), put);
    }
    if (rc != Errc::Ok)
    {
        LOG_WARN("%s/%s chunk %u/%u rejected: %s", key.project.c_str(), key.filename.c_str(),
                 chunk_index, total_chunks, chunkyard::errc_name(rc));
        return rc;
    }

    switch (put)
    {
        case store::PutOutcome::Incomplete:
            out.status = AssembleStatus::StoredIncomplete;
            out.file   = nullptr;
            return Errc::Ok;

        case store::PutOutcome::Complete:
            out.status = AssembleStatus::AssembledNow;
            out.file   = assemble(key);
            return Errc::Ok;

        case store::PutOutcome::Claimed:
            LOG_DEBUG("%s/%s is being assembled by another caller", key.project.c_str(),
                      key.filename.c_str());
            return Errc::AssemblyInProgress;

        case store::PutOutcome::Duplicate:
            if (auto f = registry_.find_file(key.project, key.filename))
            {
                out.status = AssembleStatus::AlreadyAssembled;
                out.file   = std::move(f);
                return Errc::Ok;
            }
            return Errc::AssemblyInProgress;
    }
    return Errc::Ok;
}

}  // namespace app
