#pragma once
#include <optional>
#include <string>

#include "app/project_registry.hpp"
#include "app/records.hpp"
#include "app/summarizer.hpp"
#include "util/errors.hpp"
#include "util/time.hpp"

namespace app
{

/*
Per project: NONE -> GENERATED -> DELIVERED.
  generate: any state -> GENERATED (always overwrites)
  push:     GENERATED -> DELIVERED; DELIVERED -> DELIVERED (unchanged record)
            NONE -> NoSummaryToPush
*/
class SummaryLifecycle
{
  public:
    SummaryLifecycle(ProjectRegistry  &registry,
                     const Summarizer &summarizer,
                     util::WallClock   clock = util::wall_now);

    chunkyard::Errc generate(const std::string &project, SummaryRecord &out);
    chunkyard::Errc push(const std::string &project, SummaryRecord &out);

    // UnknownProject when nothing was ever recorded for the project.
    chunkyard::Errc status(const std::string &project, std::optional<SummaryRecord> &out) const;

  private:
    ProjectRegistry  &registry_;
    const Summarizer &summarizer_;
    util::WallClock   clock_;
};

}  // namespace app
