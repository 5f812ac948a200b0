#pragma once
#include <array>
#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "crypto/fingerprint.hpp"
#include "util/errors.hpp"
#include "util/time.hpp"

/*
Upload lifecycle of one UploadKey inside the store:

  (none) --put--> Pending --last index--> Claimed --take--> Assembling --finish--> Retired
                     ^                                           |                    |
                     |                                         abort                  |
                     +------------------- put -------------------+--------------------+

Exactly one put() observes Complete and owns the claim. Every other put for
the key while Claimed/Assembling reports Claimed. A Retired key remembers a
short tag per chunk and the assembled content, so a late duplicate can be
told apart from a re-upload. A chunk equal to the retired one is recorded as
a placeholder that holds no pending bytes and is reported as Duplicate. If
a re-upload completes around placeholders, take() fills them from the
retired content. An upload made only of placeholders completes as
Duplicate without a claim.

Retired state lives as long as the slot. forget() drops it, which the
service does when the file leaves the registry, so retained slots are
bounded by the number of assembled files still listed.
*/

namespace store
{

using Bytes = std::vector<std::uint8_t>;

struct UploadKey
{
    std::string project;
    std::string filename;

    bool operator==(const UploadKey &o) const
    {
        return project == o.project && filename == o.filename;
    }
};

struct UploadKeyHash
{
    std::size_t operator()(const UploadKey &k) const
    {
        const std::size_t h1 = std::hash<std::string>{}(k.project);
        const std::size_t h2 = std::hash<std::string>{}(k.filename);
        return h1 ^ (h2 + 0x9e3779b97f4a7c15ULL + (h1 << 6) + (h1 >> 2));
    }
};

enum class PutOutcome
{
    Incomplete,  // stored, more indices missing
    Complete,    // stored, all indices present, caller owns the claim
    Claimed,     // complete already; another caller is assembling
    Duplicate,   // matches a chunk of the last assembled upload
};

struct Limits
{
    std::size_t max_file_bytes    = 100 * 1024 * 1024;
    std::size_t max_pending_bytes = 512 * 1024 * 1024;
};

class ChunkStore
{
  public:
    explicit ChunkStore(Limits limits = {}, util::SteadyClock clock = util::steady_now);

    ChunkStore(const ChunkStore &)            = delete;
    ChunkStore &operator=(const ChunkStore &) = delete;

    // Store one chunk. The write and the completeness check are one critical
    // section per key: exactly one caller sees Complete for an upload.
    // `payload` is moved from only when the chunk is stored as data; a
    // Duplicate or an error leaves it intact.
    chunkyard::Errc put(const UploadKey &key,
                        std::uint32_t    chunk_index,
                        std::uint32_t    total_chunks,
                        Bytes          &&payload,
                        PutOutcome      &out);

    // Hand the payloads (ordered by chunk index) to the claim owner and
    // destroy the pending upload. Returns nullopt unless the key is Claimed.
    std::optional<std::vector<Bytes>> take_assembled_parts(const UploadKey &key);

    // Assembling -> Retired, once the assembled file is visible to readers.
    // `content` is the merged file; it backs placeholders of later uploads.
    void finish(const UploadKey &key, std::shared_ptr<const Bytes> content);

    // Assembling -> Idle without retiring anything, when assembly failed.
    // The parts are gone; the uploader has to send the chunks again.
    void abort(const UploadKey &key);

    // Forget the retired state of `key` and any placeholders relying on it.
    // No effect while the key is Claimed or Assembling.
    void forget(const UploadKey &key);

    // Drop pending uploads idle for longer than `age`. Claimed uploads stay.
    std::vector<UploadKey> evict_older_than(std::chrono::steady_clock::duration age);

    std::size_t pending_bytes() const { return pending_bytes_.load(); }
    std::size_t pending_count() const;
    std::size_t received_count(const UploadKey &key) const;

  private:
    using Tag = std::array<std::uint8_t, crypto::CHUNK_TAG_SIZE>;

    struct Part
    {
        Tag   tag{};
        bool  retired = false;  // placeholder: data comes from the retired content
        Bytes data;
    };

    struct PendingUpload
    {
        std::uint32_t                         total         = 0;
        std::size_t                           bytes         = 0;  // reserved, excludes placeholders
        std::size_t                           retired_bytes = 0;
        std::uint32_t                         retired_parts = 0;
        std::map<std::uint32_t, Part>         parts;  // index -> payload
        std::chrono::steady_clock::time_point last_seen;
    };

    enum class Phase
    {
        Idle,        // no pending upload (maybe retired tags)
        Pending,
        Claimed,
        Assembling,
    };

    struct Slot
    {
        std::mutex                     mu;
        Phase                          phase = Phase::Idle;
        bool                           dead  = false;  // unlinked from the map
        std::unique_ptr<PendingUpload> pending;
        std::vector<Tag>               retired_tags;     // index -> tag of the last assembly
        std::vector<std::size_t>       retired_offsets;  // index -> offset, plus the end
        std::shared_ptr<const Bytes>   retired_content;
        std::vector<Tag>               staged_tags;   // become retired on finish()
        std::vector<std::size_t>       staged_sizes;
    };

    std::shared_ptr<Slot> find_slot(const UploadKey &key) const;
    std::shared_ptr<Slot> find_or_create_slot(const UploadKey &key);

    bool matches_retired(const Slot &s, std::uint32_t idx, std::uint32_t total, const Tag &t) const;
    static void clear_retired(Slot &s);
    static void drop_placeholders(PendingUpload &p);
    static std::size_t retired_size(const Slot &s, std::uint32_t idx);
    bool reserve_bytes(std::size_t n);
    void release_bytes(std::size_t n);

    Limits                                                           limits_;
    util::SteadyClock                                                clock_;
    mutable std::shared_mutex                                        map_mu_;
    std::unordered_map<UploadKey, std::shared_ptr<Slot>, UploadKeyHash> slots_;
    std::atomic<std::size_t>                                         pending_bytes_{0};
};

}  // namespace store
