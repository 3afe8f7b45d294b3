#ifndef STREAMCORPUS_CODEC_STREAM_ITEM_HPP
#define STREAMCORPUS_CODEC_STREAM_ITEM_HPP

#include <memory>
#include "streamcorpus_types.h"
#include "codec/message.hpp"
#include "codec/thrift_message.hpp"

namespace streamcorpus {
namespace codec {

using schema::Versions;
using schema::StreamTime;
using schema::ContentItem;
using schema::ContentItem_v0_1_0;

// Default record type of a chunk
using StreamItem = ThriftMessage<schema::StreamItem>;
// First released schema, kept so that old chunks stay readable
using StreamItemV0_1_0 = ThriftMessage<schema::StreamItem_v0_1_0>;

// Codec used by chunks unless another one is supplied
std::shared_ptr<const MessageCodec> default_codec();
std::shared_ptr<const MessageCodec> legacy_codec();

} // namespace codec
} // namespace streamcorpus

#endif // STREAMCORPUS_CODEC_STREAM_ITEM_HPP
