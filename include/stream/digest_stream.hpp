#ifndef STREAMCORPUS_DIGEST_STREAM_HPP
#define STREAMCORPUS_DIGEST_STREAM_HPP

#include <istream>
#include <ostream>
#include <memory>
#include <string>
#include "stream/byte_stream.hpp"

namespace streamcorpus {
namespace stream {

// Forward declaration for OpenSSL digest context
struct DigestContext;

// Running MD5 over every byte passed to update()
class Md5Digest {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  Md5Digest();
  ~Md5Digest();

  Md5Digest(Md5Digest&&) noexcept;
  Md5Digest& operator=(Md5Digest&&) noexcept;

  // ---- DIGEST OPERATIONS ----
  void update(const void* data, std::size_t size);
  // Hex digest of everything seen so far, the running state is left untouched
  std::string hexdigest() const;
  // Drops everything seen so far
  void reset();

  // Convenience for digesting a whole buffer
  static std::string of(const Bytes& data);

private:
  std::unique_ptr<DigestContext> context_;
};

// Wraps a readable stream and digests every byte handed out by read()
class DigestInputStream : public ByteSource {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  explicit DigestInputStream(std::shared_ptr<std::istream> input);


  // ---- STREAM OPERATIONS ----
  std::size_t read(void* data, std::size_t size) override;
  bool at_end() override;
  // Seeks the source back to its start and restarts the digest.
  // Returns false when the source cannot seek.
  bool rewind();
  void close();


  // ---- GETTERS ----
  std::string hexdigest() const { return digest_.hexdigest(); }
  std::size_t bytes_read() const { return bytes_read_; }
  std::istream& raw() { return *input_; }

private:
  // ---- PARAMETERS ----
  std::shared_ptr<std::istream> input_;
  Md5Digest digest_;
  std::size_t bytes_read_ = 0;
};

// Wraps a writable stream and digests every byte passed to write()
class DigestOutputStream : public ByteSink {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  explicit DigestOutputStream(std::shared_ptr<std::ostream> output);


  // ---- STREAM OPERATIONS ----
  void write(const void* data, std::size_t size) override;
  void flush();
  // Flushes and closes the underlying stream if it is a file stream
  void close();


  // ---- GETTERS ----
  std::string hexdigest() const { return digest_.hexdigest(); }
  std::size_t bytes_written() const { return bytes_written_; }

private:
  // ---- PARAMETERS ----
  std::shared_ptr<std::ostream> output_;
  Md5Digest digest_;
  std::size_t bytes_written_ = 0;
};

} // namespace stream
} // namespace streamcorpus

#endif // STREAMCORPUS_DIGEST_STREAM_HPP
