#ifndef STREAMCORPUS_TRANSFORM_PIPELINE_HPP
#define STREAMCORPUS_TRANSFORM_PIPELINE_HPP

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "pipeline/pipeline_config.hpp"
#include "pipeline/pipeline_error.hpp"
#include "pipeline/scratch_directory.hpp"
#include "pipeline/transform_stage.hpp"

namespace streamcorpus {
namespace pipeline {

// Diagnostics are advisory text from stages that are allowed to talk;
// callers should read them even when no exception was thrown
struct PipelineResult {
  std::vector<std::string> diagnostics;
  Bytes data;
};

// Chains whole-buffer external transforms:
//   write path: compress -> encrypt
//   read path:  decrypt  -> decompress
// Each keyed stage runs against its own scratch key store, removed on every exit path.
// Separate calls share nothing but the scratch root and may run concurrently.
class TransformPipeline {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  explicit TransformPipeline(const PipelineConfig& config);
  TransformPipeline(std::shared_ptr<StageFactory> stages,
                    std::shared_ptr<ScratchDirectoryFactory> scratch,
                    std::string default_recipient = "trec-kba");


  // ---- PIPELINE OPERATIONS ----
  // Compresses the data, then encrypts it for the recipient when a public key file is given
  PipelineResult compress_and_encrypt(const Bytes& data,
                                      const std::optional<std::filesystem::path>& public_key = std::nullopt);
  PipelineResult compress_and_encrypt(const Bytes& data,
                                      const std::optional<std::filesystem::path>& public_key,
                                      const std::string& recipient);
  // Decrypts the data when a private key file is given, then decompresses it
  PipelineResult decrypt_and_uncompress(const Bytes& data,
                                        const std::optional<std::filesystem::path>& private_key = std::nullopt);

private:
  // ---- PARAMETERS ----
  std::shared_ptr<StageFactory> stages_;
  std::shared_ptr<ScratchDirectoryFactory> scratch_;
  std::string default_recipient_;


  // ---- STAGE EXECUTION ----
  // Strict stages fail on any diagnostic output, others append it to the log
  Bytes run_stage(TransformStage& stage, const Bytes& input, bool strict,
                  std::vector<std::string>& diagnostics);
  // Imports the key into a fresh scratch key store and runs the stage made for that store
  template <typename MakeStage>
  Bytes run_keyed_stage(const std::filesystem::path& key, MakeStage make_stage, const Bytes& input,
                        std::vector<std::string>& diagnostics);
};

} // namespace pipeline
} // namespace streamcorpus

#endif // STREAMCORPUS_TRANSFORM_PIPELINE_HPP
