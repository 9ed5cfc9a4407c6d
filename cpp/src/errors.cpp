#include "lz4framed/errors.hpp"

namespace lz4framed {

const char* error_name(ErrorCode code) {
    switch (code) {
        case ErrorCode::Generic: return "ERROR_GENERIC";
        case ErrorCode::MaxBlockSizeInvalid: return "ERROR_maxBlockSize_invalid";
        case ErrorCode::BlockModeInvalid: return "ERROR_blockMode_invalid";
        case ErrorCode::ContentChecksumFlagInvalid: return "ERROR_contentChecksumFlag_invalid";
        case ErrorCode::CompressionLevelInvalid: return "ERROR_compressionLevel_invalid";
        case ErrorCode::HeaderVersionWrong: return "ERROR_headerVersion_wrong";
        case ErrorCode::BlockChecksumInvalid: return "ERROR_blockChecksum_invalid";
        case ErrorCode::ReservedFlagSet: return "ERROR_reservedFlag_set";
        case ErrorCode::AllocationFailed: return "ERROR_allocation_failed";
        case ErrorCode::SrcSizeTooLarge: return "ERROR_srcSize_tooLarge";
        case ErrorCode::DstMaxSizeTooSmall: return "ERROR_dstMaxSize_tooSmall";
        case ErrorCode::FrameHeaderIncomplete: return "ERROR_frameHeader_incomplete";
        case ErrorCode::FrameTypeUnknown: return "ERROR_frameType_unknown";
        case ErrorCode::FrameSizeWrong: return "ERROR_frameSize_wrong";
        case ErrorCode::SrcPtrWrong: return "ERROR_srcPtr_wrong";
        case ErrorCode::DecompressionFailed: return "ERROR_decompressionFailed";
        case ErrorCode::HeaderChecksumInvalid: return "ERROR_headerChecksum_invalid";
        case ErrorCode::ContentChecksumInvalid: return "ERROR_contentChecksum_invalid";
        case ErrorCode::FrameDecodingAlreadyStarted: return "ERROR_frameDecoding_alreadyStarted";
        case ErrorCode::FrameIncomplete: return "ERROR_frame_incomplete";
    }
    return "ERROR_unknown";
}

const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Usage: return "usage";
        case ErrorKind::Format: return "format";
        case ErrorKind::Corruption: return "corruption";
        case ErrorKind::Incomplete: return "incomplete";
    }
    return "unknown";
}

Error::Error(ErrorCode code, ErrorKind kind, const std::string& detail)
    : std::runtime_error("[" + std::string(error_name(code)) + "] " + detail),
      code_(code),
      kind_(kind),
      detail_(detail) {}

Error with_context(const Error& error, const std::string& note) {
    return Error(error.code(), error.kind(), error.detail() + " (" + note + ")");
}

void throw_usage(ErrorCode code, const std::string& detail) {
    throw Error(code, ErrorKind::Usage, detail);
}

void throw_format(ErrorCode code, const std::string& detail) {
    throw Error(code, ErrorKind::Format, detail);
}

void throw_corruption(ErrorCode code, const std::string& detail) {
    throw Error(code, ErrorKind::Corruption, detail);
}

void throw_incomplete(ErrorCode code, const std::string& detail) {
    throw Error(code, ErrorKind::Incomplete, detail);
}

} // namespace lz4framed
