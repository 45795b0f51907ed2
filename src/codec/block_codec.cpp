// =============================================================================
// qpx - Block Codec Factory
// =============================================================================

#include "qpx/codec/block_codec.h"

#include "qpx/codec/quicklz_codec.h"

namespace qpx::codec {

std::shared_ptr<const BlockCodec> makeDefaultCodec() {
    return std::make_shared<const QuickLZCodec>();
}

}  // namespace qpx::codec
