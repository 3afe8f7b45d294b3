#include "codec/stream_item.hpp"

namespace streamcorpus {
namespace codec {

std::shared_ptr<const MessageCodec> default_codec() {
  static const std::shared_ptr<const MessageCodec> codec = std::make_shared<TypedCodec<StreamItem>>("StreamItem");
  return codec;
}

std::shared_ptr<const MessageCodec> legacy_codec() {
  static const std::shared_ptr<const MessageCodec> codec = std::make_shared<TypedCodec<StreamItemV0_1_0>>("StreamItem_v0_1_0");
  return codec;
}

} // namespace codec
} // namespace streamcorpus
