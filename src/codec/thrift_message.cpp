#include "codec/thrift_message.hpp"
#include <cstdint>
#include <memory>
#include <thrift/Thrift.h>
#include <thrift/protocol/TBinaryProtocol.h>
#include <thrift/transport/TVirtualTransport.h>
#include <boost/log/trivial.hpp>

namespace streamcorpus {
namespace codec {

namespace {

namespace protocol = apache::thrift::protocol;
namespace transport = apache::thrift::transport;

// Upper bounds that reject corrupt lengths before allocating
constexpr int32_t MAX_STRING_LENGTH = 256 * 1024 * 1024;
constexpr int32_t MAX_CONTAINER_SIZE = 16 * 1024 * 1024;

// Transport writing straight into a ByteSink, no framing or buffering of its own
class SinkTransport : public transport::TVirtualTransport<SinkTransport> {
public:
  explicit SinkTransport(stream::ByteSink& sink) : sink_(sink) {}

  void write(const uint8_t* buf, uint32_t len) {
    sink_.write(buf, len);
  }

private:
  stream::ByteSink& sink_;
};

// Transport reading straight from a ByteSource. A zero count ends the input,
// which readAll() reports as END_OF_FILE.
class SourceTransport : public transport::TVirtualTransport<SourceTransport> {
public:
  explicit SourceTransport(stream::ByteSource& source) : source_(source) {}

  uint32_t read(uint8_t* buf, uint32_t len) {
    return static_cast<uint32_t>(source_.read(buf, len));
  }

private:
  stream::ByteSource& source_;
};

} // namespace

void write_binary(stream::ByteSink& sink, const ProtocolAction& write) {
  auto sink_transport = std::make_shared<SinkTransport>(sink);
  protocol::TBinaryProtocolT<SinkTransport> binary(sink_transport);

  try {
    write(binary);
  }
  catch (const apache::thrift::TException& e) {
    BOOST_LOG_TRIVIAL(error) << "Thrift codec: Failed to encode record: " << e.what();
    throw EncodeError(e.what());
  }
}

void read_binary(stream::ByteSource& source, const ProtocolAction& read) {
  auto source_transport = std::make_shared<SourceTransport>(source);
  protocol::TBinaryProtocolT<SourceTransport> binary(source_transport);
  binary.setStringSizeLimit(MAX_STRING_LENGTH);
  binary.setContainerSizeLimit(MAX_CONTAINER_SIZE);

  try {
    read(binary);
  }
  catch (const apache::thrift::TException& e) {
    BOOST_LOG_TRIVIAL(debug) << "Thrift codec: Failed to decode record: " << e.what();
    throw DecodeError(e.what());
  }
}

} // namespace codec
} // namespace streamcorpus
