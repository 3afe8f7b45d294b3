#include "pipeline/transform_pipeline.hpp"
#include "pipeline/process_stage.hpp"
#include <boost/log/trivial.hpp>

namespace streamcorpus {
namespace pipeline {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

TransformPipeline::TransformPipeline(const PipelineConfig& config)
  : TransformPipeline(std::make_shared<ProcessStageFactory>(config),
                      std::make_shared<UuidScratchDirectoryFactory>(config.scratch_root),
                      config.default_recipient) {}

TransformPipeline::TransformPipeline(std::shared_ptr<StageFactory> stages,
                                     std::shared_ptr<ScratchDirectoryFactory> scratch,
                                     std::string default_recipient)
  : stages_(std::move(stages))
  , scratch_(std::move(scratch))
  , default_recipient_(std::move(default_recipient)) {
  if (!stages_ || !scratch_) {
    throw PipelineError("Transform pipeline: stage and scratch directory factories are required");
  }
}

//==============================================
// PIPELINE OPERATIONS
//==============================================

PipelineResult TransformPipeline::compress_and_encrypt(const Bytes& data,
                                                       const std::optional<std::filesystem::path>& public_key) {
  return compress_and_encrypt(data, public_key, default_recipient_);
}

PipelineResult TransformPipeline::compress_and_encrypt(const Bytes& data,
                                                       const std::optional<std::filesystem::path>& public_key,
                                                       const std::string& recipient) {
  BOOST_LOG_TRIVIAL(info) << "Transform pipeline: Compressing " << data.size() << " bytes"
                          << (public_key ? " and encrypting for " + recipient : std::string());

  PipelineResult result;
  auto compressor = stages_->compressor();
  result.data = run_stage(*compressor, data, true, result.diagnostics);

  if (public_key) {
    result.data = run_keyed_stage(*public_key,
                                  [&](const std::filesystem::path& keystore) {
                                    return stages_->encryptor(keystore, recipient);
                                  },
                                  result.data, result.diagnostics);
  }

  BOOST_LOG_TRIVIAL(info) << "Transform pipeline: Produced " << result.data.size() << " bytes with "
                          << result.diagnostics.size() << " diagnostic message(s)";
  return result;
}

PipelineResult TransformPipeline::decrypt_and_uncompress(const Bytes& data,
                                                         const std::optional<std::filesystem::path>& private_key) {
  BOOST_LOG_TRIVIAL(info) << "Transform pipeline: " << (private_key ? "Decrypting and decompressing " : "Decompressing ")
                          << data.size() << " bytes";

  PipelineResult result;
  Bytes compressed;
  if (private_key) {
    compressed = run_keyed_stage(*private_key,
                                 [&](const std::filesystem::path& keystore) {
                                   return stages_->decryptor(keystore);
                                 },
                                 data, result.diagnostics);
  } else {
    compressed = data;
  }

  auto decompressor = stages_->decompressor();
  result.data = run_stage(*decompressor, compressed, true, result.diagnostics);

  BOOST_LOG_TRIVIAL(info) << "Transform pipeline: Restored " << result.data.size() << " bytes with "
                          << result.diagnostics.size() << " diagnostic message(s)";
  return result;
}

//==============================================
// STAGE EXECUTION
//==============================================

Bytes TransformPipeline::run_stage(TransformStage& stage, const Bytes& input, bool strict,
                                   std::vector<std::string>& diagnostics) {
  StageResult result = stage.run(input);

  if (!result.diagnostics.empty()) {
    if (strict) {
      BOOST_LOG_TRIVIAL(error) << "Transform pipeline: Stage " << stage.name()
                               << " reported diagnostics: " << result.diagnostics.front();
      throw ExternalToolFailure(stage.name(), "unexpected diagnostic output: " + result.diagnostics.front());
    }
    BOOST_LOG_TRIVIAL(warning) << "Transform pipeline: Stage " << stage.name() << " reported "
                               << result.diagnostics.size() << " diagnostic message(s)";
    diagnostics.insert(diagnostics.end(), result.diagnostics.begin(), result.diagnostics.end());
  }
  return std::move(result.output);
}

template <typename MakeStage>
Bytes TransformPipeline::run_keyed_stage(const std::filesystem::path& key, MakeStage make_stage,
                                         const Bytes& input, std::vector<std::string>& diagnostics) {
  if (!std::filesystem::exists(key)) {
    BOOST_LOG_TRIVIAL(error) << "Transform pipeline: Key material not found: " << key.string();
    throw PipelineError("Transform pipeline: key material not found: " + key.string());
  }

  // Removed when this scope exits, whether the stage succeeds or throws
  ScratchDirectory keystore = scratch_->acquire();

  auto importer = stages_->key_importer(keystore.path(), key);
  StageResult imported = importer->run(Bytes());
  for (const auto& message : imported.diagnostics) {
    diagnostics.push_back("Key import logged to stderr, read carefully:\n\n" + message);
  }

  auto stage = make_stage(keystore.path());
  return run_stage(*stage, input, false, diagnostics);
}

} // namespace pipeline
} // namespace streamcorpus
