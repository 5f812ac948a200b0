#include <algorithm>
#include <utility>

#include "crypto/fingerprint.hpp"
#include "store/chunk_store.hpp"
#include "util/log.hpp"

namespace store
{

using chunkyard::Errc;

ChunkStore::ChunkStore(Limits limits, util::SteadyClock clock)
    : limits_(limits), clock_(std::move(clock))
{
}

std::shared_ptr<ChunkStore::Slot> ChunkStore::find_slot(const UploadKey &key) const
{
    std::shared_lock<std::shared_mutex> lk(map_mu_);
    auto                                it = slots_.find(key);
    return it == slots_.end() ? nullptr : it->second;
}

std::shared_ptr<ChunkStore::Slot> ChunkStore::find_or_create_slot(const UploadKey &key)
{
    if (auto s = find_slot(key))
        return s;
    std::unique_lock<std::shared_mutex> lk(map_mu_);
    auto [it, inserted] = slots_.try_emplace(key, nullptr);
    if (inserted)
        it->second = std::make_shared<Slot>();
    return it->second;
}

bool ChunkStore::matches_retired(const Slot   &s,
                                 std::uint32_t idx,
                                 std::uint32_t total,
                                 const Tag    &t) const
{
    return !s.retired_tags.empty() && s.retired_tags.size() == total && idx < total &&
           s.retired_tags[idx] == t;
}

void ChunkStore::clear_retired(Slot &s)
{
    s.retired_tags.clear();
    s.retired_offsets.clear();
    s.retired_content.reset();
}

void ChunkStore::drop_placeholders(PendingUpload &p)
{
    for (auto it = p.parts.begin(); it != p.parts.end();)
    {
        if (it->second.retired)
            it = p.parts.erase(it);
        else
            ++it;
    }
    p.retired_bytes = 0;
    p.retired_parts = 0;
}

std::size_t ChunkStore::retired_size(const Slot &s, std::uint32_t idx)
{
    return s.retired_offsets[idx + 1] - s.retired_offsets[idx];
}

bool ChunkStore::reserve_bytes(std::size_t n)
{
    std::size_t cur = pending_bytes_.load();
    do
    {
        if (cur + n > limits_.max_pending_bytes || cur + n < cur)
            return false;
    } while (!pending_bytes_.compare_exchange_weak(cur, cur + n));
    return true;
}

void ChunkStore::release_bytes(std::size_t n)
{
    pending_bytes_.fetch_sub(n);
}

Errc ChunkStore::put(const UploadKey &key,
                     std::uint32_t    idx,
                     std::uint32_t    total,
                     Bytes          &&payload,
                     PutOutcome      &out)
{
    if (total == 0)
        return Errc::InvalidChunkCount;
    if (idx >= total)
        return Errc::InvalidChunkIndex;
    if (payload.size() > limits_.max_file_bytes)
        return Errc::FileTooLarge;

    // hash outside the critical section
    const Tag tag = crypto::chunk_tag(payload.data(), payload.size());

    for (;;)
    {
        auto                        slot = find_or_create_slot(key);
        std::lock_guard<std::mutex> lk(slot->mu);
        if (slot->dead)
            continue;  // swept between lookup and lock; look again

        const bool retired = matches_retired(*slot, idx, total, tag);
        switch (slot->phase)
        {
            case Phase::Claimed:
            case Phase::Assembling:
                out = PutOutcome::Claimed;
                return Errc::Ok;
            case Phase::Idle:
                break;
            case Phase::Pending:
            {
                PendingUpload &cur = *slot->pending;
                if (cur.total != total && cur.retired_parts == cur.parts.size())
                {
                    // only late duplicates so far; the new declaration wins
                    LOG_DEBUG("%s/%s: dropping %zu late duplicate(s) for a %u chunk upload",
                              key.project.c_str(), key.filename.c_str(), cur.parts.size(), total);
                    slot->pending.reset();
                    slot->phase = Phase::Idle;
                    break;
                }
                // a straggler from the previous upload never touches the new one
                if (retired && (cur.total != total || cur.parts.count(idx)))
                {
                    out = PutOutcome::Duplicate;
                    return Errc::Ok;
                }
                if (cur.total != total)
                {
                    LOG_WARN("%s/%s: total_chunks %u != declared %u", key.project.c_str(),
                             key.filename.c_str(), total, cur.total);
                    return Errc::InconsistentTotalChunks;
                }
                break;
            }
        }

        PendingUpload    *p        = slot->pending.get();
        const std::size_t held     = p ? p->bytes : 0;
        const std::size_t held_ret = p ? p->retired_bytes : 0;
        std::size_t       old_size = 0;  // reserved bytes the new chunk replaces
        std::size_t       old_ret  = 0;  // placeholder bytes it replaces
        if (p)
        {
            auto it = p->parts.find(idx);
            if (it != p->parts.end())
            {
                if (it->second.retired)
                    old_ret = retired_size(*slot, idx);
                else
                    old_size = it->second.data.size();
            }
        }

        std::size_t next     = held;
        std::size_t next_ret = held_ret;
        if (retired)
            next_ret += payload.size();
        else
            next = held - old_size + payload.size();
        next_ret -= old_ret;

        if (next + next_ret > limits_.max_file_bytes)
            return Errc::FileTooLarge;
        if (!retired)
        {
            if (payload.size() > old_size && !reserve_bytes(payload.size() - old_size))
            {
                LOG_WARN("pending byte cap reached (%zu bytes held)", pending_bytes_.load());
                return Errc::PendingLimitExceeded;
            }
            if (payload.size() < old_size)
                release_bytes(old_size - payload.size());
        }

        if (!p)
        {
            slot->pending        = std::make_unique<PendingUpload>();
            slot->pending->total = total;
            slot->phase          = Phase::Pending;
            p                    = slot->pending.get();
            LOG_DEBUG("new upload %s/%s (%u chunks)", key.project.c_str(), key.filename.c_str(),
                      total);
        }
        else if (p->parts.count(idx))
        {
            LOG_DEBUG("duplicate chunk %s/%s #%u, overwriting", key.project.c_str(),
                      key.filename.c_str(), idx);
        }

        Part &part = p->parts[idx];
        if (part.retired)
            p->retired_parts--;
        part.tag     = tag;
        part.retired = retired;
        if (retired)
        {
            // the bytes are already held by the retired content
            Bytes().swap(part.data);
            p->retired_parts++;
        }
        else
        {
            part.data = std::move(payload);
        }
        p->bytes         = next;
        p->retired_bytes = next_ret;
        p->last_seen     = clock_();

        if (p->parts.size() == p->total)
        {
            if (p->retired_parts == p->total)
            {
                // the same bytes as the last assembly arrived again
                LOG_DEBUG("%s/%s resent unchanged, keeping previous assembly",
                          key.project.c_str(), key.filename.c_str());
                release_bytes(p->bytes);
                slot->pending.reset();
                slot->phase = Phase::Idle;
                out         = PutOutcome::Duplicate;
                return Errc::Ok;
            }
            slot->phase = Phase::Claimed;
            out         = PutOutcome::Complete;
        }
        else if (retired)
        {
            LOG_DEBUG("late duplicate %s/%s #%u", key.project.c_str(), key.filename.c_str(), idx);
            out = PutOutcome::Duplicate;
        }
        else
        {
            out = PutOutcome::Incomplete;
        }
        return Errc::Ok;
    }
}

std::optional<std::vector<Bytes>> ChunkStore::take_assembled_parts(const UploadKey &key)
{
    auto slot = find_slot(key);
    if (!slot)
        return std::nullopt;

    std::lock_guard<std::mutex> lk(slot->mu);
    if (slot->phase != Phase::Claimed || !slot->pending)
        return std::nullopt;

    PendingUpload &p = *slot->pending;
    // keys are unique and < total, so size == total means exactly 0..total-1
    if (p.parts.size() != p.total)
        return std::nullopt;

    std::vector<Bytes> out;
    out.reserve(p.total);
    slot->staged_tags.clear();
    slot->staged_sizes.clear();
    slot->staged_tags.reserve(p.total);
    slot->staged_sizes.reserve(p.total);
    for (auto &kv : p.parts)
    {
        Part &part = kv.second;
        if (part.retired)
        {
            const Bytes      &src = *slot->retired_content;
            const std::size_t off = slot->retired_offsets[kv.first];
            const std::size_t end = slot->retired_offsets[kv.first + 1];
            part.data.assign(src.begin() + off, src.begin() + end);
        }
        slot->staged_tags.push_back(part.tag);
        slot->staged_sizes.push_back(part.data.size());
        out.push_back(std::move(part.data));
    }

    release_bytes(p.bytes);
    slot->pending.reset();
    slot->phase = Phase::Assembling;
    return out;
}

void ChunkStore::finish(const UploadKey &key, std::shared_ptr<const Bytes> content)
{
    auto slot = find_slot(key);
    if (!slot)
        return;
    std::lock_guard<std::mutex> lk(slot->mu);
    if (slot->phase != Phase::Assembling)
        return;

    clear_retired(*slot);
    std::vector<std::size_t> offsets;
    offsets.reserve(slot->staged_sizes.size() + 1);
    std::size_t off = 0;
    for (std::size_t n : slot->staged_sizes)
    {
        offsets.push_back(off);
        off += n;
    }
    offsets.push_back(off);

    if (content && content->size() == off)
    {
        slot->retired_tags    = std::move(slot->staged_tags);
        slot->retired_offsets = std::move(offsets);
        slot->retired_content = std::move(content);
    }
    else
    {
        LOG_WARN("%s/%s: assembled content does not match its chunks, not retiring",
                 key.project.c_str(), key.filename.c_str());
    }
    slot->staged_tags.clear();
    slot->staged_sizes.clear();
    slot->phase = Phase::Idle;
}

void ChunkStore::abort(const UploadKey &key)
{
    auto slot = find_slot(key);
    if (!slot)
        return;
    std::lock_guard<std::mutex> lk(slot->mu);
    if (slot->phase != Phase::Assembling)
        return;
    LOG_WARN("%s/%s: assembly aborted, chunks must be sent again", key.project.c_str(),
             key.filename.c_str());
    slot->staged_tags.clear();
    slot->staged_sizes.clear();
    slot->phase = Phase::Idle;
}

void ChunkStore::forget(const UploadKey &key)
{
    std::unique_lock<std::shared_mutex> lk(map_mu_);
    auto                                it = slots_.find(key);
    if (it == slots_.end())
        return;

    auto                        slot = it->second;
    std::lock_guard<std::mutex> g(slot->mu);
    if (slot->phase == Phase::Claimed || slot->phase == Phase::Assembling)
        return;

    clear_retired(*slot);
    if (slot->phase == Phase::Pending)
    {
        drop_placeholders(*slot->pending);
        if (slot->pending->parts.empty())
        {
            release_bytes(slot->pending->bytes);
            slot->pending.reset();
            slot->phase = Phase::Idle;
        }
    }
    if (slot->phase == Phase::Idle)
    {
        slot->dead = true;
        slots_.erase(it);
    }
}

std::vector<UploadKey> ChunkStore::evict_older_than(std::chrono::steady_clock::duration age)
{
    std::vector<UploadKey> evicted;
    const auto             now = clock_();

    std::unique_lock<std::shared_mutex> lk(map_mu_);
    for (auto it = slots_.begin(); it != slots_.end();)
    {
        auto slot = it->second;  // keep alive past erase
        {
            std::lock_guard<std::mutex> g(slot->mu);
            if (slot->phase == Phase::Pending && now - slot->pending->last_seen > age)
            {
                LOG_SYSTEM("[EVICT] %s/%s: %zu/%u chunks, %zu bytes", it->first.project.c_str(),
                           it->first.filename.c_str(), slot->pending->parts.size(),
                           slot->pending->total, slot->pending->bytes);
                release_bytes(slot->pending->bytes);
                slot->pending.reset();
                slot->phase = Phase::Idle;
                evicted.push_back(it->first);
            }
            if (slot->phase == Phase::Idle && slot->retired_tags.empty())
            {
                slot->dead = true;
                it         = slots_.erase(it);
                continue;
            }
        }
        ++it;
    }
    return evicted;
}

std::size_t ChunkStore::pending_count() const
{
    std::shared_lock<std::shared_mutex> lk(map_mu_);
    std::size_t                         n = 0;
    for (const auto &kv : slots_)
    {
        std::lock_guard<std::mutex> g(kv.second->mu);
        if (kv.second->phase == Phase::Pending || kv.second->phase == Phase::Claimed)
            n++;
    }
    return n;
}

std::size_t ChunkStore::received_count(const UploadKey &key) const
{
    auto slot = find_slot(key);
    if (!slot)
        return 0;
    std::lock_guard<std::mutex> lk(slot->mu);
    return slot->pending ? slot->pending->parts.size() : 0;
}

}  // namespace store
