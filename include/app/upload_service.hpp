#pragma once
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "app/assembler.hpp"
#include "app/project_registry.hpp"
#include "app/summarizer.hpp"
#include "app/summary_lifecycle.hpp"
#include "crypto/fingerprint.hpp"
#include "store/chunk_store.hpp"
#include "util/constants.hpp"
#include "util/errors.hpp"
#include "util/time.hpp"

namespace app
{

struct ServiceOptions
{
    store::Limits     limits{};
    std::size_t       preview_chars = constants::DEFAULT_PREVIEW_CHARS;
    util::WallClock   wall_clock    = util::wall_now;
    util::SteadyClock steady_clock  = util::steady_now;
};

struct SubmitResult
{
    std::string                status;  // "stored" | "assembled" | "duplicate"
    std::optional<std::string> fingerprint_hex;
    std::optional<std::size_t> size;
};

struct FileInfo
{
    std::string                           filename;
    std::size_t                           size = 0;
    std::string                           fingerprint_hex;
    std::chrono::system_clock::time_point assembled_at;
};

// All upload state of one process. Independent instances share nothing.
class UploadService
{
  public:
    explicit UploadService(ServiceOptions                         opts = {},
                           std::unique_ptr<crypto::Fingerprinter> fp   = nullptr,
                           std::unique_ptr<Summarizer>            sum  = nullptr);

    UploadService(const UploadService &)            = delete;
    UploadService &operator=(const UploadService &) = delete;

    chunkyard::Errc submit_chunk(const std::string &project,
                                 const std::string &filename,
                                 std::uint32_t      chunk_index,
                                 std::uint32_t      total_chunks,
                                 Bytes              payload,
                                 SubmitResult      &out);

    chunkyard::Errc generate_summary(const std::string &project, SummaryRecord &out);
    chunkyard::Errc push_summary(const std::string &project, SummaryRecord &out);
    chunkyard::Errc summary_status(const std::string &project, std::optional<SummaryRecord> &out);

    std::vector<FileInfo>          list_files(const std::string &project) const;
    chunkyard::Errc                file_info(const std::string &project,
                                             const std::string &filename,
                                             FileInfo          &out) const;
    // Removes the file and the store's memory of it, so the same bytes can
    // be uploaded again as a new file.
    chunkyard::Errc                remove_file(const std::string &project,
                                               const std::string &filename);
    std::vector<store::UploadKey>  evict_stale(std::chrono::steady_clock::duration age);

    store::ChunkStore           &chunks() { return chunks_; }
    ProjectRegistry             &registry() { return registry_; }
    const crypto::Fingerprinter &fingerprinter() const { return *fp_; }

  private:
    std::unique_ptr<crypto::Fingerprinter> fp_;
    std::unique_ptr<Summarizer>            summarizer_;
    store::ChunkStore                      chunks_;
    ProjectRegistry                        registry_;
    Assembler                              assembler_;
    SummaryLifecycle                       lifecycle_;
};

}  // namespace app
