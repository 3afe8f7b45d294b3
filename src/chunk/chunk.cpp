#include "chunk/chunk.hpp"
#include "pipeline/transform_pipeline.hpp"
#include <fstream>
#include <utility>
#include <boost/log/trivial.hpp>

namespace streamcorpus {
namespace chunk {

const char* mode_to_string(Mode mode) {
  switch (mode) {
    case Mode::Write:  return "write";
    case Mode::Append: return "append";
    case Mode::Read:   return "read";
    default:           return "unknown";
  }
}

bool Chunk::is_compressed_path(const std::filesystem::path& path) {
  return path.extension() == ".xz";
}

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

Chunk::Chunk(Mode mode, CodecPtr codec) : mode_(mode), codec_(std::move(codec)) {
  if (!codec_) {
    throw PreconditionError("a message codec is required");
  }
}

Chunk::~Chunk() {
  if (closed_ || (!output_ && !input_)) {
    return;
  }
  try {
    close();
  }
  catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "Chunk: Failed to close chunk on destruction: " << e.what();
  }
}

Chunk::Chunk(Chunk&& other) noexcept
  : mode_(other.mode_)
  , codec_(std::move(other.codec_))
  , count_(std::exchange(other.count_, 0))
  , pass_index_(std::exchange(other.pass_index_, 0))
  , closed_(std::exchange(other.closed_, false))
  , pass_started_(std::exchange(other.pass_started_, false))
  , frozen_digest_(std::exchange(other.frozen_digest_, std::nullopt))
  , output_(std::move(other.output_))
  , input_(std::move(other.input_))
  , memory_(std::move(other.memory_)) {}

Chunk& Chunk::operator=(Chunk&& other) noexcept {
  if (this != &other) {
    if (!closed_ && (output_ || input_)) {
      try {
        close();
      }
      catch (const std::exception& e) {
        BOOST_LOG_TRIVIAL(error) << "Chunk: Failed to close chunk before reassignment: " << e.what();
      }
    }
    mode_ = other.mode_;
    codec_ = std::move(other.codec_);
    count_ = std::exchange(other.count_, 0);
    pass_index_ = std::exchange(other.pass_index_, 0);
    closed_ = std::exchange(other.closed_, false);
    pass_started_ = std::exchange(other.pass_started_, false);
    frozen_digest_ = std::exchange(other.frozen_digest_, std::nullopt);
    output_ = std::move(other.output_);
    input_ = std::move(other.input_);
    memory_ = std::move(other.memory_);
  }
  return *this;
}

void Chunk::attach_input(std::shared_ptr<std::istream> input) {
  input_ = std::make_unique<stream::DigestInputStream>(std::move(input));
}

void Chunk::attach_output(std::shared_ptr<std::ostream> output) {
  output_ = std::make_unique<stream::DigestOutputStream>(std::move(output));
}

//==============================================
// NAMED CONSTRUCTORS
//==============================================

Chunk Chunk::create(CodecPtr codec) {
  Chunk chunk(Mode::Write, std::move(codec));
  chunk.memory_ = std::make_shared<std::stringstream>(std::ios::in | std::ios::out | std::ios::binary);
  chunk.attach_output(chunk.memory_);
  BOOST_LOG_TRIVIAL(debug) << "Chunk: Created in-memory chunk for writing";
  return chunk;
}

Chunk Chunk::from_path(const std::filesystem::path& path, Mode mode, CodecPtr codec) {
  if (is_compressed_path(path) && mode == Mode::Read && std::filesystem::exists(path)) {
    pipeline::TransformPipeline pipeline(pipeline::load_pipeline_config());
    return from_path(path, mode, std::move(codec), pipeline);
  }

  BOOST_LOG_TRIVIAL(info) << "Chunk: Opening " << path.string() << " for " << mode_to_string(mode);

  if (std::filesystem::exists(path)) {
    if (mode == Mode::Write) {
      throw PreconditionError("mode=write would overwrite existing " + path.string());
    }
    if (is_compressed_path(path)) {
      throw PreconditionError("mode=" + std::string(mode_to_string(mode)) + " for compressed " + path.string());
    }

    Chunk chunk(mode, std::move(codec));
    if (mode == Mode::Read) {
      auto file = std::make_shared<std::ifstream>(path, std::ios::in | std::ios::binary);
      if (!*file) {
        throw ChunkError("Chunk: Failed to open " + path.string());
      }
      chunk.attach_input(std::move(file));
    } else {
      auto file = std::make_shared<std::ofstream>(path, std::ios::out | std::ios::app | std::ios::binary);
      if (!*file) {
        throw ChunkError("Chunk: Failed to open " + path.string());
      }
      chunk.attach_output(std::move(file));
    }
    return chunk;
  }

  if (mode == Mode::Read) {
    throw PreconditionError(path.string() + " does not exist but mode=read");
  }
  if (is_compressed_path(path)) {
    throw PreconditionError("compressed chunk files are read only: " + path.string());
  }

  Chunk chunk(mode, std::move(codec));

  // Create parent directories for new chunk files
  if (path.has_parent_path() && !std::filesystem::exists(path.parent_path())) {
    std::filesystem::create_directories(path.parent_path());
    BOOST_LOG_TRIVIAL(debug) << "Chunk: Created directory " << path.parent_path().string();
  }

  auto openmode = std::ios::out | std::ios::binary | (mode == Mode::Append ? std::ios::app : std::ios::trunc);
  auto file = std::make_shared<std::ofstream>(path, openmode);
  if (!*file) {
    throw ChunkError("Chunk: Failed to create " + path.string());
  }
  chunk.attach_output(std::move(file));
  return chunk;
}

Chunk Chunk::from_path(const std::filesystem::path& path, Mode mode, CodecPtr codec,
                       pipeline::TransformPipeline& pipeline) {
  if (!is_compressed_path(path) || !std::filesystem::exists(path) || mode != Mode::Read) {
    return from_path(path, mode, std::move(codec));
  }

  BOOST_LOG_TRIVIAL(info) << "Chunk: Decompressing " << path.string() << " into memory";

  std::ifstream file(path, std::ios::in | std::ios::binary);
  if (!file) {
    throw ChunkError("Chunk: Failed to open " + path.string());
  }
  Bytes compressed((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
  if (file.bad()) {
    throw ChunkError("Chunk: Failed to read " + path.string());
  }

  pipeline::PipelineResult result = pipeline.decrypt_and_uncompress(compressed);
  for (const auto& message : result.diagnostics) {
    BOOST_LOG_TRIVIAL(warning) << "Chunk: Decompression of " << path.string() << " reported: " << message;
  }
  return from_buffer(result.data, Mode::Read, std::move(codec));
}

Chunk Chunk::from_buffer(const Bytes& data, Mode mode, CodecPtr codec) {
  if (mode == Mode::Write) {
    throw PreconditionError("mode=write but a data buffer was supplied");
  }

  Chunk chunk(mode, std::move(codec));
  std::string contents(data.begin(), data.end());

  if (mode == Mode::Read) {
    chunk.memory_ = std::make_shared<std::stringstream>(contents, std::ios::in | std::ios::out | std::ios::binary);
    chunk.attach_input(chunk.memory_);
  } else {
    // Seeded contents are not part of the digest, only appended bytes are
    chunk.memory_ = std::make_shared<std::stringstream>(contents, std::ios::in | std::ios::out | std::ios::binary);
    chunk.memory_->seekp(0, std::ios::end);
    chunk.attach_output(chunk.memory_);
  }

  BOOST_LOG_TRIVIAL(debug) << "Chunk: Wrapped " << data.size() << " byte buffer for " << mode_to_string(mode);
  return chunk;
}

Chunk Chunk::from_input_handle(std::shared_ptr<std::istream> input, CodecPtr codec) {
  if (!input) {
    throw PreconditionError("null input handle");
  }
  Chunk chunk(Mode::Read, std::move(codec));
  chunk.attach_input(std::move(input));
  return chunk;
}

Chunk Chunk::from_output_handle(std::shared_ptr<std::ostream> output, Mode mode, CodecPtr codec) {
  if (!output) {
    throw PreconditionError("null output handle");
  }
  if (mode == Mode::Read) {
    throw PreconditionError("an output handle cannot be opened with mode=read");
  }
  Chunk chunk(mode, std::move(codec));
  chunk.attach_output(std::move(output));
  return chunk;
}

//==============================================
// CORE OPERATIONS
//==============================================

void Chunk::add(const codec::Message& message) {
  if (mode_ == Mode::Read) {
    throw InvalidModeError("cannot add to a chunk opened for reading");
  }
  ensure_open("add");

  // Encode the whole record first so a failing encoder leaves no partial record behind
  stream::BufferSink record;
  message.encode(record);
  output_->write(record.bytes().data(), record.bytes().size());

  ++count_;
  BOOST_LOG_TRIVIAL(trace) << "Chunk: Added record " << count_ << " of " << record.bytes().size() << " bytes";
}

void Chunk::close() {
  if (closed_) {
    return;
  }

  if (output_) {
    output_->close();
    frozen_digest_ = output_->hexdigest();
    output_.reset();
  }
  if (input_) {
    frozen_digest_ = input_->hexdigest();
    input_->close();
    input_.reset();
  }
  closed_ = true;

  BOOST_LOG_TRIVIAL(info) << "Chunk: Closed chunk with " << count_ << " records, md5 "
                          << frozen_digest_.value_or("<none>");
}

Chunk::iterator Chunk::begin() {
  if (mode_ != Mode::Read) {
    throw InvalidModeError("cannot iterate over a chunk opened for " + std::string(mode_to_string(mode_)));
  }
  ensure_open("iterate");

  // Seek to the start so the chunk can be read more than once; pipes can only be read once
  if (!input_->rewind() && pass_started_) {
    throw ResourceStateError("input is not seekable and has already been read");
  }
  pass_started_ = true;
  pass_index_ = 0;
  return iterator(this);
}

//==============================================
// QUERY OPERATIONS
//==============================================

std::string Chunk::digest() const {
  if (frozen_digest_) {
    return *frozen_digest_;
  }
  if (output_) {
    return output_->hexdigest();
  }
  if (input_) {
    return input_->hexdigest();
  }
  throw ResourceStateError("no input or output stream attached");
}

Bytes Chunk::data() const {
  if (!memory_) {
    throw ResourceStateError("chunk is not backed by memory");
  }
  if (output_) {
    output_->flush();
  }
  std::string contents = memory_->str();
  return Bytes(contents.begin(), contents.end());
}

//==============================================
// RECORD DECODING
//==============================================

std::shared_ptr<codec::Message> Chunk::read_next() {
  ensure_open("iterate");

  // Running out of input between records is the normal end of a chunk;
  // running out inside a record means the chunk was truncated
  if (input_->at_end()) {
    BOOST_LOG_TRIVIAL(debug) << "Chunk: End of stream after " << pass_index_ << " records";
    return nullptr;
  }

  std::shared_ptr<codec::Message> message = codec_->new_empty();
  try {
    message->decode(*input_);
  }
  catch (const codec::DecodeError& e) {
    BOOST_LOG_TRIVIAL(error) << "Chunk: Failed to decode record " << pass_index_ << ": " << e.what();
    throw MalformedRecordError("record " + std::to_string(pass_index_) + " (" + codec_->name() + "): " + e.what());
  }

  ++pass_index_;
  ++count_;
  return message;
}

void Chunk::ensure_open(const char* operation) const {
  if (closed_) {
    throw InvalidModeError(std::string("cannot ") + operation + " a closed chunk");
  }
  if (!output_ && !input_) {
    throw ResourceStateError(std::string("cannot ") + operation + " without an attached stream");
  }
}

//==============================================
// ITERATOR
//==============================================

Chunk::iterator::iterator(Chunk* chunk) : chunk_(chunk) {
  ++(*this);
}

Chunk::iterator& Chunk::iterator::operator++() {
  if (!chunk_) {
    return *this;
  }
  current_ = chunk_->read_next();
  if (!current_) {
    chunk_ = nullptr;
  }
  return *this;
}

//==============================================
// FREE FUNCTIONS
//==============================================

std::ostream& operator<<(std::ostream& out, const Chunk& chunk) {
  return out << "Chunk(len=" << chunk.length() << ")";
}

Bytes serialize(const codec::Message& message) {
  auto chunk = Chunk::create(codec::default_codec());
  chunk.add(message);
  chunk.close();
  return chunk.data();
}

std::shared_ptr<codec::Message> deserialize(const Bytes& blob, CodecPtr codec) {
  auto chunk = Chunk::from_buffer(blob, Mode::Read, std::move(codec));
  std::vector<std::shared_ptr<codec::Message>> messages(chunk.begin(), chunk.end());
  if (messages.size() != 1) {
    throw MalformedRecordError("got " + std::to_string(messages.size()) +
                               " messages to deserialize instead of one");
  }
  return messages.front();
}

} // namespace chunk
} // namespace streamcorpus
