#include <algorithm>
#include <mutex>

#include "app/project_registry.hpp"
#include "util/log.hpp"

namespace app
{

using chunkyard::Errc;

void ProjectRegistry::record_file(FilePtr file)
{
    if (!file)
        return;

    std::unique_lock<std::shared_mutex> lk(mu_);
    ProjectState                       &st = projects_[file->project];
    if (st.name.empty())
        st.name = file->project;

    auto same = [&](const FilePtr &f) { return f->filename == file->filename; };
    auto it   = std::find_if(st.files.begin(), st.files.end(), same);
    if (it != st.files.end())
    {
        LOG_INFO("replacing %s/%s", file->project.c_str(), file->filename.c_str());
        st.files.erase(it);
    }
    st.files.push_back(std::move(file));
}

std::vector<FilePtr> ProjectRegistry::list_files(const std::string &project) const
{
    std::shared_lock<std::shared_mutex> lk(mu_);
    auto                                it = projects_.find(project);
    if (it == projects_.end())
        return {};
    return it->second.files;
}

FilePtr ProjectRegistry::find_file(const std::string &project, const std::string &filename) const
{
    std::shared_lock<std::shared_mutex> lk(mu_);
    auto                                it = projects_.find(project);
    if (it == projects_.end())
        return nullptr;
    for (const auto &f : it->second.files)
    {
        if (f->filename == filename)
            return f;
    }
    return nullptr;
}

bool ProjectRegistry::has_project(const std::string &project) const
{
    std::shared_lock<std::shared_mutex> lk(mu_);
    return projects_.count(project) != 0;
}

bool ProjectRegistry::remove_file(const std::string &project, const std::string &filename)
{
    std::unique_lock<std::shared_mutex> lk(mu_);
    auto                                it = projects_.find(project);
    if (it == projects_.end())
        return false;

    auto &files = it->second.files;
    auto  same  = [&](const FilePtr &f) { return f->filename == filename; };
    auto  fit   = std::find_if(files.begin(), files.end(), same);
    if (fit == files.end())
        return false;
    files.erase(fit);
    return true;
}

std::optional<SummaryRecord> ProjectRegistry::get_summary(const std::string &project) const
{
    std::shared_lock<std::shared_mutex> lk(mu_);
    auto                                it = projects_.find(project);
    if (it == projects_.end())
        return std::nullopt;
    return it->second.summary;
}

void ProjectRegistry::set_summary(const SummaryRecord &rec)
{
    std::unique_lock<std::shared_mutex> lk(mu_);
    ProjectState                       &st = projects_[rec.project];
    if (st.name.empty())
        st.name = rec.project;
    st.summary = rec;
}

Errc ProjectRegistry::update_summary(const std::string &project, const SummaryUpdate &fn)
{
    std::unique_lock<std::shared_mutex> lk(mu_);
    auto                                it = projects_.find(project);
    if (it != projects_.end())
        return fn(it->second.summary);

    std::optional<SummaryRecord> tmp;
    const Errc                   rc = fn(tmp);
    if (tmp)
    {
        ProjectState &st = projects_[project];
        st.name          = project;
        st.summary       = std::move(tmp);
    }
    return rc;
}

}  // namespace app
