#include <utility>

#include "app/summary_lifecycle.hpp"
#include "util/log.hpp"

namespace app
{

using chunkyard::Errc;

SummaryLifecycle::SummaryLifecycle(ProjectRegistry  &registry,
                                   const Summarizer &summarizer,
                                   util::WallClock   clock)
    : registry_(registry), summarizer_(summarizer), clock_(std::move(clock))
{
}

Errc SummaryLifecycle::generate(const std::string &project, SummaryRecord &out)
{
    const auto files = registry_.list_files(project);  // snapshot
    if (files.empty())
        return Errc::NoFilesForProject;

    SummaryRecord rec;
    rec.project      = project;
    rec.admin_text   = summarizer_.admin_text(project, files);
    rec.client_text  = summarizer_.client_text(project, files);
    rec.state        = SummaryState::Generated;
    rec.generated_at = clock_();
    rec.delivered_at.reset();

    registry_.set_summary(rec);
    LOG_INFO("summary generated for %s (%zu files)", project.c_str(), files.size());
    out = std::move(rec);
    return Errc::Ok;
}

Errc SummaryLifecycle::push(const std::string &project, SummaryRecord &out)
{
    return registry_.update_summary(project, [&](std::optional<SummaryRecord> &rec) {
        if (!rec)
            return Errc::NoSummaryToPush;

        if (rec->state == SummaryState::Generated)
        {
            rec->state        = SummaryState::Delivered;
            rec->delivered_at = clock_();
            LOG_SYSTEM("[PUSH] %s delivered at %s", project.c_str(),
                       util::iso8601(*rec->delivered_at).c_str());
        }
        else
        {
            LOG_DEBUG("%s already delivered", project.c_str());
        }
        out = *rec;
        return Errc::Ok;
    });
}

Errc SummaryLifecycle::status(const std::string &project, std::optional<SummaryRecord> &out) const
{
    if (!registry_.has_project(project))
        return Errc::UnknownProject;
    out = registry_.get_summary(project);
    return Errc::Ok;
}

}  // namespace app
