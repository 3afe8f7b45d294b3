#ifndef STREAMCORPUS_TRANSFORM_STAGE_HPP
#define STREAMCORPUS_TRANSFORM_STAGE_HPP

#include <filesystem>
#include <memory>
#include <string>
#include <vector>
#include "stream/byte_stream.hpp"

namespace streamcorpus {
namespace pipeline {

// Output of one stage together with whatever it reported on the side
struct StageResult {
  Bytes output;
  std::vector<std::string> diagnostics;
};

// One whole-buffer transform: the full input goes in, the full output comes back
class TransformStage {
public:
  virtual ~TransformStage() = default;

  virtual StageResult run(const Bytes& input) = 0;
  virtual std::string name() const = 0;
};

// Builds the stages a pipeline chains together
class StageFactory {
public:
  virtual ~StageFactory() = default;

  virtual std::unique_ptr<TransformStage> compressor() = 0;
  virtual std::unique_ptr<TransformStage> decompressor() = 0;
  // Imports the key file into the key store, run with empty input
  virtual std::unique_ptr<TransformStage> key_importer(const std::filesystem::path& keystore,
                                                       const std::filesystem::path& key) = 0;
  virtual std::unique_ptr<TransformStage> encryptor(const std::filesystem::path& keystore,
                                                    const std::string& recipient) = 0;
  virtual std::unique_ptr<TransformStage> decryptor(const std::filesystem::path& keystore) = 0;
};

} // namespace pipeline
} // namespace streamcorpus

#endif // STREAMCORPUS_TRANSFORM_STAGE_HPP
