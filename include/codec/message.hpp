#ifndef STREAMCORPUS_CODEC_MESSAGE_HPP
#define STREAMCORPUS_CODEC_MESSAGE_HPP

#include <memory>
#include <stdexcept>
#include <string>
#include <typeinfo>
#include "stream/byte_stream.hpp"

namespace streamcorpus {
namespace codec {

// Raised by a message decoder when the bytes at the cursor do not form a complete record
class DecodeError : public std::runtime_error {
public:
  explicit DecodeError(const std::string& message)
    : std::runtime_error("Decode error: " + message) {}
};

// Raised when a record cannot be written in its wire format
class EncodeError : public std::runtime_error {
public:
  explicit EncodeError(const std::string& message)
    : std::runtime_error("Encode error: " + message) {}
};

// One record of a chunk. Encoders emit their own framing, the chunk adds none.
class Message {
public:
  virtual ~Message() = default;

  // Writes this message to the sink
  virtual void encode(stream::ByteSink& sink) const = 0;
  // Reads this message from the cursor, throws DecodeError on malformed input
  virtual void decode(stream::ByteSource& source) = 0;
};

// Creates empty messages for a chunk to decode into
class MessageCodec {
public:
  virtual ~MessageCodec() = default;

  virtual std::unique_ptr<Message> new_empty() const = 0;
  virtual std::string name() const = 0;
};

template <typename T>
class TypedCodec : public MessageCodec {
public:
  explicit TypedCodec(std::string name = typeid(T).name()) : name_(std::move(name)) {}

  std::unique_ptr<Message> new_empty() const override {
    return std::make_unique<T>();
  }

  std::string name() const override { return name_; }

private:
  std::string name_;
};

// Checked downcast from a decoded record to the concrete schema type
template <typename T>
const T& message_as(const Message& message) {
  return dynamic_cast<const T&>(message);
}

} // namespace codec
} // namespace streamcorpus

#endif // STREAMCORPUS_CODEC_MESSAGE_HPP
