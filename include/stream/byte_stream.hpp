#ifndef STREAMCORPUS_BYTE_STREAM_HPP
#define STREAMCORPUS_BYTE_STREAM_HPP

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace streamcorpus {

using Bytes = std::vector<uint8_t>;

inline Bytes to_bytes(const std::string& text) {
  return Bytes(text.begin(), text.end());
}

inline std::string to_string(const Bytes& bytes) {
  return std::string(bytes.begin(), bytes.end());
}

namespace stream {

// Something codecs can pull raw bytes from
class ByteSource {
public:
  virtual ~ByteSource() = default;

  // Reads up to size bytes, returns the number actually read (short only at end of input)
  virtual std::size_t read(void* data, std::size_t size) = 0;
  // True when no further byte can be read
  virtual bool at_end() = 0;
};

// Something codecs can push raw bytes into
class ByteSink {
public:
  virtual ~ByteSink() = default;

  virtual void write(const void* data, std::size_t size) = 0;
};

// Collects written bytes in memory, used to encode a single record
class BufferSink : public ByteSink {
public:
  void write(const void* data, std::size_t size) override {
    const auto* begin = static_cast<const uint8_t*>(data);
    buffer_.insert(buffer_.end(), begin, begin + size);
  }

  const Bytes& bytes() const { return buffer_; }

private:
  Bytes buffer_;
};

// Reads from a byte buffer it does not own
class BufferSource : public ByteSource {
public:
  explicit BufferSource(const Bytes& buffer) : buffer_(buffer) {}

  std::size_t read(void* data, std::size_t size) override;
  bool at_end() override { return position_ >= buffer_.size(); }

private:
  const Bytes& buffer_;
  std::size_t position_ = 0;
};

} // namespace stream
} // namespace streamcorpus

#endif // STREAMCORPUS_BYTE_STREAM_HPP
