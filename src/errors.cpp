#include "hxfer/errors.hpp"

namespace hxfer {

const char* reason_name(AbortReason r) {
    switch (r) {
        case AbortReason::None:              return "None";
        case AbortReason::KeyWrap:           return "KeyWrapError";
        case AbortReason::KeyUnwrap:         return "KeyUnwrapError";
        case AbortReason::HeaderLimit:       return "HeaderLimitError";
        case AbortReason::FrameSize:         return "FrameSizeError";
        case AbortReason::ChunkAuth:         return "ChunkAuthError";
        case AbortReason::DigestMismatch:    return "DigestMismatchError";
        case AbortReason::SignatureMismatch: return "SignatureMismatchError";
        case AbortReason::ChannelClosed:     return "ChannelClosed";
        case AbortReason::Protocol:          return "ProtocolError";
        case AbortReason::Io:                return "IoError";
        case AbortReason::Internal:          return "InternalError";
    }
    return "Unknown";
}

} // namespace hxfer
