#pragma once
#include <cstdint>
#include <vector>

#include "app/project_registry.hpp"
#include "app/records.hpp"
#include "crypto/fingerprint.hpp"
#include "store/chunk_store.hpp"
#include "util/errors.hpp"
#include "util/time.hpp"

namespace app
{

enum class AssembleStatus
{
    StoredIncomplete,
    AssembledNow,
    AlreadyAssembled,
};

struct AssembleOutcome
{
    AssembleStatus status = AssembleStatus::StoredIncomplete;
    FilePtr        file;  // set unless StoredIncomplete
};

class Assembler
{
  public:
    Assembler(store::ChunkStore           &chunks,
              ProjectRegistry             &registry,
              const crypto::Fingerprinter &fp,
              util::WallClock              clock = util::wall_now);

    // Store the chunk; the caller that completes the upload merges it,
    // fingerprints it and records it. A concurrent duplicate of the final
    // chunk gets AlreadyAssembled, or AssemblyInProgress while the winner is
    // still merging.
    chunkyard::Errc on_chunk_received(const store::UploadKey &key,
                                      std::uint32_t           chunk_index,
                                      std::uint32_t           total_chunks,
                                      Bytes                   payload,
                                      AssembleOutcome        &out);

    static Bytes merge(std::vector<Bytes> &&parts);

  private:
    FilePtr assemble(const store::UploadKey &key);

    store::ChunkStore           &chunks_;
    ProjectRegistry             &registry_;
    const crypto::Fingerprinter &fp_;
    util::WallClock              clock_;
};

}  // namespace app
