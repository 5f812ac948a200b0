#pragma once
#include <cstddef>
#include <string>
#include <vector>

#include "app/records.hpp"

namespace app
{

// Turns a project's assembled files into the two summary texts.
class Summarizer
{
  public:
    virtual ~Summarizer() = default;

    // Full detail for the operator: names, sizes, fingerprints.
    virtual std::string admin_text(const std::string &project,
                                   const std::vector<FilePtr> &files) const = 0;
    // Externally safe view: no fingerprints or timestamps.
    virtual std::string client_text(const std::string &project,
                                    const std::vector<FilePtr> &files) const = 0;
};

// Head-of-content preview, cut at `preview_chars` bytes.
class TruncatingSummarizer : public Summarizer
{
  public:
    explicit TruncatingSummarizer(std::size_t preview_chars) : preview_chars_(preview_chars) {}

    std::string admin_text(const std::string &project,
                           const std::vector<FilePtr> &files) const override;
    std::string client_text(const std::string &project,
                            const std::vector<FilePtr> &files) const override;

    std::string preview(const Bytes &content) const;

  private:
    std::size_t preview_chars_;
};

}  // namespace app
