#ifndef STREAMCORPUS_PROCESS_STAGE_HPP
#define STREAMCORPUS_PROCESS_STAGE_HPP

#include <chrono>
#include <string>
#include <vector>
#include "pipeline/pipeline_config.hpp"
#include "pipeline/transform_stage.hpp"

namespace streamcorpus {
namespace pipeline {

// Runs an external program with the input on stdin and collects stdout and stderr
class ProcessStage : public TransformStage {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  ProcessStage(std::string name, std::string executable, std::vector<std::string> args,
               std::chrono::seconds timeout);


  // ---- STAGE OPERATIONS ----
  StageResult run(const Bytes& input) override;
  std::string name() const override { return name_; }


  // ---- GETTERS ----
  const std::string& executable() const { return executable_; }
  const std::vector<std::string>& args() const { return args_; }

private:
  // ---- PARAMETERS ----
  std::string name_;
  std::string executable_;
  std::vector<std::string> args_;
  std::chrono::seconds timeout_;
};

// Stages backed by xz and gpg
class ProcessStageFactory : public StageFactory {
public:
  explicit ProcessStageFactory(PipelineConfig config);

  std::unique_ptr<TransformStage> compressor() override;
  std::unique_ptr<TransformStage> decompressor() override;
  std::unique_ptr<TransformStage> key_importer(const std::filesystem::path& keystore,
                                               const std::filesystem::path& key) override;
  std::unique_ptr<TransformStage> encryptor(const std::filesystem::path& keystore,
                                            const std::string& recipient) override;
  std::unique_ptr<TransformStage> decryptor(const std::filesystem::path& keystore) override;

private:
  PipelineConfig config_;

  // Arguments shared by every gpg call against a scratch key store
  std::vector<std::string> gpg_base_args(const std::filesystem::path& keystore) const;
};

} // namespace pipeline
} // namespace streamcorpus

#endif // STREAMCORPUS_PROCESS_STAGE_HPP
