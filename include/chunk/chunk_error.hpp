#ifndef STREAMCORPUS_CHUNK_ERROR_HPP
#define STREAMCORPUS_CHUNK_ERROR_HPP

#include <stdexcept>
#include <string>

namespace streamcorpus {
namespace chunk {

class ChunkError : public std::runtime_error {
public:
  explicit ChunkError(const std::string& message)
    : std::runtime_error(message) {}
};

// Operation not allowed in the chunk's open mode, or after close
class InvalidModeError : public ChunkError {
public:
  explicit InvalidModeError(const std::string& message)
    : ChunkError("Invalid mode: " + message) {}
};

// A record started but could not be decoded
class MalformedRecordError : public ChunkError {
public:
  explicit MalformedRecordError(const std::string& message)
    : ChunkError("Malformed record: " + message) {}
};

// The chunk has no stream to serve the request from
class ResourceStateError : public ChunkError {
public:
  explicit ResourceStateError(const std::string& message)
    : ChunkError("Resource state: " + message) {}
};

// Illegal combination of source, mode and file existence at construction
class PreconditionError : public ChunkError {
public:
  explicit PreconditionError(const std::string& message)
    : ChunkError("Precondition violated: " + message) {}
};

} // namespace chunk
} // namespace streamcorpus

#endif // STREAMCORPUS_CHUNK_ERROR_HPP
