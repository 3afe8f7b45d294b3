#ifndef STREAMCORPUS_PIPELINE_ERROR_HPP
#define STREAMCORPUS_PIPELINE_ERROR_HPP

#include <stdexcept>
#include <string>

namespace streamcorpus {
namespace pipeline {

class PipelineError : public std::runtime_error {
public:
  explicit PipelineError(const std::string& message)
    : std::runtime_error(message) {}
};

// External tool missing, exited non-zero, timed out, or complained on a strict stage
class ExternalToolFailure : public PipelineError {
public:
  ExternalToolFailure(const std::string& tool, const std::string& message)
    : PipelineError("External tool failure (" + tool + "): " + message)
    , tool_(tool) {}

  const std::string& tool() const { return tool_; }

private:
  std::string tool_;
};

class ScratchDirectoryError : public PipelineError {
public:
  explicit ScratchDirectoryError(const std::string& message)
    : PipelineError("Scratch directory error: " + message) {}
};

} // namespace pipeline
} // namespace streamcorpus

#endif // STREAMCORPUS_PIPELINE_ERROR_HPP
