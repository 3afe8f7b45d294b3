#include "pipeline/pipeline_config.hpp"
#include "pipeline/pipeline_error.hpp"
#include <cstdlib>
#include <stdexcept>
#include <boost/log/trivial.hpp>

namespace streamcorpus {
namespace pipeline {

namespace {

// Returns the variable's value, or an empty string when unset
std::string read_env(const char* name) {
  const char* value = std::getenv(name);
  return value ? std::string(value) : std::string();
}

std::chrono::seconds parse_timeout(const std::string& value) {
  std::size_t consumed = 0;
  long long seconds = 0;
  try {
    seconds = std::stoll(value, &consumed);
  } catch (const std::logic_error&) {
    throw PipelineError("Pipeline config: STREAMCORPUS_TOOL_TIMEOUT is not a number: " + value);
  }
  if (consumed != value.size() || seconds <= 0) {
    throw PipelineError("Pipeline config: STREAMCORPUS_TOOL_TIMEOUT must be a positive integer: " + value);
  }
  return std::chrono::seconds(seconds);
}

} // namespace

PipelineConfig load_pipeline_config() {
  PipelineConfig config;

  if (auto value = read_env("STREAMCORPUS_XZ"); !value.empty()) {
    config.compressor = value;
  }
  if (auto value = read_env("STREAMCORPUS_GPG"); !value.empty()) {
    config.gpg = value;
  }
  if (auto value = read_env("STREAMCORPUS_SCRATCH_DIR"); !value.empty()) {
    config.scratch_root = value;
  }
  if (auto value = read_env("STREAMCORPUS_TOOL_TIMEOUT"); !value.empty()) {
    config.tool_timeout = parse_timeout(value);
  }

  BOOST_LOG_TRIVIAL(debug) << "Pipeline config: compressor=" << config.compressor
                           << " gpg=" << config.gpg
                           << " scratch_root=" << config.scratch_root.string()
                           << " timeout=" << config.tool_timeout.count() << "s";
  return config;
}

} // namespace pipeline
} // namespace streamcorpus
