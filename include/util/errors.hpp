#pragma once

namespace chunkyard
{

// Recoverable failures. Every one maps to an "ERR <name>" reply at the gateway.
enum class Errc
{
    Ok = 0,
    InvalidArgument,
    InvalidChunkCount,
    InvalidChunkIndex,
    InconsistentTotalChunks,
    AssemblyInProgress,  // transient: resubmit the same chunk
    FileTooLarge,
    PendingLimitExceeded,
    UnknownProject,
    UnknownFile,
    NoFilesForProject,
    NoSummaryToPush,
    Internal,  // a request handler threw
};

inline const char *errc_name(Errc e)
{
    switch (e)
    {
        case Errc::Ok:
            return "Ok";
        case Errc::InvalidArgument:
            return "InvalidArgument";
        case Errc::InvalidChunkCount:
            return "InvalidChunkCount";
        case Errc::InvalidChunkIndex:
            return "InvalidChunkIndex";
        case Errc::InconsistentTotalChunks:
            return "InconsistentTotalChunks";
        case Errc::AssemblyInProgress:
            return "AssemblyInProgress";
        case Errc::FileTooLarge:
            return "FileTooLarge";
        case Errc::PendingLimitExceeded:
            return "PendingLimitExceeded";
        case Errc::UnknownProject:
            return "UnknownProject";
        case Errc::UnknownFile:
            return "UnknownFile";
        case Errc::NoFilesForProject:
            return "NoFilesForProject";
        case Errc::NoSummaryToPush:
            return "NoSummaryToPush";
        case Errc::Internal:
            return "Internal";
    }
    return "?";
}

inline bool is_retryable(Errc e)
{
    return e == Errc::AssemblyInProgress;
}

}  // namespace chunkyard
