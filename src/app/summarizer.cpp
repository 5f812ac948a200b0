#include <cctype>
#include <sstream>

#include "app/summarizer.hpp"
#include "crypto/fingerprint.hpp"
#include "util/time.hpp"

namespace app
{

std::string TruncatingSummarizer::preview(const Bytes &content) const
{
    const std::size_t n = content.size() < preview_chars_ ? content.size() : preview_chars_;
    std::string       out;
    out.reserve(n + 3);
    for (std::size_t i = 0; i < n; ++i)
    {
        const unsigned char c = content[i];
        // keep summaries single-line and printable
        out.push_back(std::isprint(c) ? static_cast<char>(c) : '.');
    }
    if (content.size() > n)
        out += "...";
    return out;
}

std::string TruncatingSummarizer::admin_text(const std::string          &project,
                                             const std::vector<FilePtr> &files) const
{
    std::size_t total = 0;
    for (const auto &f : files)
        total += f->size();

    std::ostringstream ss;
    ss << "project " << project << ": " << files.size() << " file(s), " << total << " bytes\n";
    for (const auto &f : files)
    {
        ss << "- " << f->filename << " size=" << f->size()
           << " fingerprint=" << crypto::to_hex(f->fingerprint)
           << " assembled_at=" << util::iso8601(f->assembled_at) << "\n";
        if (preview_chars_ > 0)
            ss << "  " << preview(f->content) << "\n";
    }
    return ss.str();
}

std::string TruncatingSummarizer::client_text(const std::string          &project,
                                              const std::vector<FilePtr> &files) const
{
    std::ostringstream ss;
    ss << "project " << project << ": " << files.size() << " file(s)\n";
    for (const auto &f : files)
    {
        ss << "- " << f->filename << " (" << f->size() << " bytes)\n";
        if (preview_chars_ > 0)
            ss << "  " << preview(f->content) << "\n";
    }
    return ss.str();
}

}  // namespace app
