#pragma once

#include <chrono>
#include <filesystem>
#include <string>

namespace streamcorpus {
namespace pipeline {

struct PipelineConfig {
  // Compression tool, called with --compress / --decompress
  std::string compressor{"xz"};
  // Trust-management tool used for key import, encryption and decryption
  std::string gpg{"gpg"};
  // Parent of the per-call scratch key stores
  std::filesystem::path scratch_root{std::filesystem::temp_directory_path()};
  // Upper bound on a single external process
  std::chrono::seconds tool_timeout{600};
  std::string default_recipient{"trec-kba"};
};

// Defaults overridden by STREAMCORPUS_XZ, STREAMCORPUS_GPG,
// STREAMCORPUS_SCRATCH_DIR and STREAMCORPUS_TOOL_TIMEOUT (seconds)
PipelineConfig load_pipeline_config();

} // namespace pipeline
} // namespace streamcorpus
