#ifndef STREAMCORPUS_CODEC_THRIFT_MESSAGE_HPP
#define STREAMCORPUS_CODEC_THRIFT_MESSAGE_HPP

#include <functional>
#include <thrift/protocol/TProtocol.h>
#include "codec/message.hpp"

namespace streamcorpus {
namespace codec {

using ProtocolAction = std::function<void(apache::thrift::protocol::TProtocol&)>;

// Runs a generated write() against a binary protocol that feeds the sink
void write_binary(stream::ByteSink& sink, const ProtocolAction& write);
// Runs a generated read() against a binary protocol fed from the source.
// Short input, bad lengths and bad wire types surface as DecodeError.
void read_binary(stream::ByteSource& source, const ProtocolAction& read);

// A chunk record whose fields and wire layout come from a Thrift generated struct
template <typename T>
class ThriftMessage : public Message, public T {
public:
  ThriftMessage() = default;
  explicit ThriftMessage(const T& fields) : T(fields) {}

  void encode(stream::ByteSink& sink) const override {
    write_binary(sink, [this](apache::thrift::protocol::TProtocol& protocol) {
      this->T::write(&protocol);
    });
  }

  void decode(stream::ByteSource& source) override {
    read_binary(source, [this](apache::thrift::protocol::TProtocol& protocol) {
      this->T::read(&protocol);
    });
  }
};

} // namespace codec
} // namespace streamcorpus

#endif // STREAMCORPUS_CODEC_THRIFT_MESSAGE_HPP
