#pragma once
#include <functional>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "app/records.hpp"
#include "util/errors.hpp"

namespace app
{

// Assembled files and the summary record of every project, created lazily on
// the first write. Readers always get a consistent snapshot.
class ProjectRegistry
{
  public:
    // Append, or replace the entry with the same filename (last assembly wins).
    void record_file(FilePtr file);

    // Arrival order. Unknown projects yield an empty list.
    std::vector<FilePtr> list_files(const std::string &project) const;
    FilePtr              find_file(const std::string &project, const std::string &filename) const;
    bool                 has_project(const std::string &project) const;

    // Drop one file. The project and its summary stay.
    bool remove_file(const std::string &project, const std::string &filename);

    std::optional<SummaryRecord> get_summary(const std::string &project) const;
    void                         set_summary(const SummaryRecord &rec);

    // Read-modify-write of a project's summary under the registry lock. A
    // project is only created when `fn` leaves a record behind.
    using SummaryUpdate = std::function<chunkyard::Errc(std::optional<SummaryRecord> &)>;
    chunkyard::Errc update_summary(const std::string &project, const SummaryUpdate &fn);

  private:
    struct ProjectState
    {
        std::string                  name;
        std::vector<FilePtr>         files;
        std::optional<SummaryRecord> summary;
    };

    mutable std::shared_mutex                     mu_;
    std::unordered_map<std::string, ProjectState> projects_;
};

}  // namespace app
