#pragma once
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace app
{

using Bytes = std::vector<std::uint8_t>;

// Immutable once built by the Assembler; shared by registry readers.
struct AssembledFile
{
    std::string                           project;
    std::string                           filename;
    Bytes                                 content;
    Bytes                                 fingerprint;
    std::chrono::system_clock::time_point assembled_at;

    std::size_t size() const { return content.size(); }
};

using FilePtr = std::shared_ptr<const AssembledFile>;

enum class SummaryState
{
    Generated,
    Delivered
};

inline const char *state_name(SummaryState s)
{
    return s == SummaryState::Generated ? "generated" : "delivered";
}

struct SummaryRecord
{
    std::string                                          project;
    std::string                                          admin_text;
    std::string                                          client_text;
    SummaryState                                         state = SummaryState::Generated;
    std::chrono::system_clock::time_point                generated_at;
    std::optional<std::chrono::system_clock::time_point> delivered_at;
};

}  // namespace app
