#ifndef STREAMCORPUS_CHUNK_HPP
#define STREAMCORPUS_CHUNK_HPP

#include <cstddef>
#include <filesystem>
#include <istream>
#include <iterator>
#include <memory>
#include <optional>
#include <ostream>
#include <sstream>
#include <string>
#include "chunk/chunk_error.hpp"
#include "codec/message.hpp"
#include "codec/stream_item.hpp"
#include "stream/digest_stream.hpp"

namespace streamcorpus {

namespace pipeline {
class TransformPipeline;
}

namespace chunk {

enum class Mode {
  Write,
  Append,
  Read
};

const char* mode_to_string(Mode mode);

using CodecPtr = std::shared_ptr<const codec::MessageCodec>;

// Reader/writer for a batch of messages stored back to back in one byte store.
// A chunk is used by one writer or one reader at a time, callers serialize access.
class Chunk {
public:
  // Single pass input iterator over the decoded records.
  // Refers to its chunk by address: moving or destroying the chunk invalidates
  // every outstanding iterator, call begin() again on the moved-to chunk.
  class iterator {
  public:
    using iterator_category = std::input_iterator_tag;
    using value_type = std::shared_ptr<codec::Message>;
    using difference_type = std::ptrdiff_t;
    using pointer = const value_type*;
    using reference = const value_type&;

    iterator() = default;

    reference operator*() const { return current_; }
    pointer operator->() const { return &current_; }
    iterator& operator++();

    bool operator==(const iterator& other) const { return chunk_ == other.chunk_; }
    bool operator!=(const iterator& other) const { return chunk_ != other.chunk_; }

  private:
    friend class Chunk;
    explicit iterator(Chunk* chunk);

    Chunk* chunk_ = nullptr;
    value_type current_;
  };

  // Extensions that mark a compressed, read only chunk file
  static bool is_compressed_path(const std::filesystem::path& path);


  // ---- NAMED CONSTRUCTORS ----
  // Empty chunk writing to an in-memory buffer
  static Chunk create(CodecPtr codec = codec::default_codec());
  // Opens or creates a chunk file. Compressed files are decompressed into memory first.
  static Chunk from_path(const std::filesystem::path& path, Mode mode = Mode::Read,
                         CodecPtr codec = codec::default_codec());
  static Chunk from_path(const std::filesystem::path& path, Mode mode, CodecPtr codec,
                         pipeline::TransformPipeline& pipeline);
  // Reads from, or appends to, a copy of the given bytes
  static Chunk from_buffer(const Bytes& data, Mode mode = Mode::Read,
                           CodecPtr codec = codec::default_codec());
  // Reads from a stream the caller already opened
  static Chunk from_input_handle(std::shared_ptr<std::istream> input,
                                 CodecPtr codec = codec::default_codec());
  // Writes to a stream the caller already opened
  static Chunk from_output_handle(std::shared_ptr<std::ostream> output, Mode mode = Mode::Write,
                                  CodecPtr codec = codec::default_codec());


  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  ~Chunk();

  Chunk(Chunk&& other) noexcept;
  Chunk& operator=(Chunk&& other) noexcept;
  Chunk(const Chunk&) = delete;
  Chunk& operator=(const Chunk&) = delete;


  // ---- CORE OPERATIONS ----
  // Encodes the message onto the end of the chunk
  void add(const codec::Message& message);
  // Flushes output, freezes the digest and releases the stream. Safe to call twice.
  void close();
  // Rewinds seekable sources and starts decoding records
  iterator begin();
  iterator end() { return iterator(); }


  // ---- QUERY OPERATIONS ----
  // MD5 hex digest of the bytes moved so far, frozen once closed
  std::string digest() const;
  // Records written so far, or records consumed so far by iteration
  std::size_t length() const { return count_; }
  Mode mode() const { return mode_; }
  bool is_closed() const { return closed_; }
  // Contents of an in-memory chunk
  Bytes data() const;

private:
  // ---- PARAMETERS ----
  Mode mode_;
  CodecPtr codec_;
  std::size_t count_ = 0;
  std::size_t pass_index_ = 0;
  bool closed_ = false;
  bool pass_started_ = false;
  std::optional<std::string> frozen_digest_;
  std::unique_ptr<stream::DigestOutputStream> output_;
  std::unique_ptr<stream::DigestInputStream> input_;
  std::shared_ptr<std::stringstream> memory_;


  // ---- INITIALIZATION ----
  Chunk(Mode mode, CodecPtr codec);
  void attach_input(std::shared_ptr<std::istream> input);
  void attach_output(std::shared_ptr<std::ostream> output);


  // ---- RECORD DECODING ----
  // Decodes the next record, or returns null at a clean end of stream
  std::shared_ptr<codec::Message> read_next();
  void ensure_open(const char* operation) const;
};

std::ostream& operator<<(std::ostream& out, const Chunk& chunk);

// Encodes a single message as the bytes of a one-record chunk
Bytes serialize(const codec::Message& message);
// Decodes a blob that must hold exactly one record
std::shared_ptr<codec::Message> deserialize(const Bytes& blob,
                                            CodecPtr codec = codec::default_codec());

} // namespace chunk
} // namespace streamcorpus

#endif // STREAMCORPUS_CHUNK_HPP
