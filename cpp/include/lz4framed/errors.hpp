#pragma once

#include <stdexcept>
#include <string>

namespace lz4framed {

// Error codes follow the LZ4F error names so callers familiar with liblz4 can map them 1:1.
enum class ErrorCode {
    Generic = 1,
    MaxBlockSizeInvalid,
    BlockModeInvalid,
    ContentChecksumFlagInvalid,
    CompressionLevelInvalid,
    HeaderVersionWrong,
    BlockChecksumInvalid,
    ReservedFlagSet,
    AllocationFailed,
    SrcSizeTooLarge,
    DstMaxSizeTooSmall,
    FrameHeaderIncomplete,
    FrameTypeUnknown,
    FrameSizeWrong,
    SrcPtrWrong,
    DecompressionFailed,
    HeaderChecksumInvalid,
    ContentChecksumInvalid,
    FrameDecodingAlreadyStarted,
    FrameIncomplete
};

enum class ErrorKind {
    Usage,      // caller bug: wrong context, wrong state, bad option
    Format,     // structurally invalid frame
    Corruption, // checksum or payload mismatch
    Incomplete  // input ended early; output already returned stays valid
};

const char* error_name(ErrorCode code);
const char* error_kind_name(ErrorKind kind);

class Error : public std::runtime_error {
public:
    Error(ErrorCode code, ErrorKind kind, const std::string& detail);

    ErrorCode code() const { return code_; }
    ErrorKind kind() const { return kind_; }
    const std::string& detail() const { return detail_; }

private:
    ErrorCode code_;
    ErrorKind kind_;
    std::string detail_;
};

// Same code and kind, with a note appended to the detail.
Error with_context(const Error& error, const std::string& note);

// Shorthands used throughout the codec.
[[noreturn]] void throw_usage(ErrorCode code, const std::string& detail);
[[noreturn]] void throw_format(ErrorCode code, const std::string& detail);
[[noreturn]] void throw_corruption(ErrorCode code, const std::string& detail);
[[noreturn]] void throw_incomplete(ErrorCode code, const std::string& detail);

} // namespace lz4framed
