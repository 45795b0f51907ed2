// =============================================================================
// qpx - Decode Options Implementation
// =============================================================================

#include "qpx/format/decode_options.h"

namespace qpx::format {

VoidResult DecodeOptions::validate() const {
    switch (checksumPolicy) {
        case ChecksumPolicy::kIgnore:
        case ChecksumPolicy::kWarn:
        case ChecksumPolicy::kVerify:
            break;
        default:
            return makeVoidError(ErrorCode::kInvalidArgument, "unknown checksum policy");
    }
    return pool.validate();
}

}  // namespace qpx::format
