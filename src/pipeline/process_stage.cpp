#include "pipeline/process_stage.hpp"
#include "pipeline/pipeline_error.hpp"
#include <future>
#include <system_error>
#include <boost/asio/buffer.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/process.hpp>
#include <boost/log/trivial.hpp>

namespace streamcorpus {
namespace pipeline {

namespace bp = boost::process;

namespace {

// Resolves a bare tool name through PATH, a name with a slash is taken as is
boost::filesystem::path resolve_executable(const std::string& stage, const std::string& executable) {
  if (executable.find('/') != std::string::npos) {
    boost::filesystem::path path(executable);
    if (!boost::filesystem::exists(path)) {
      throw ExternalToolFailure(stage, "executable not found: " + executable);
    }
    return path;
  }

  auto path = bp::search_path(executable);
  if (path.empty()) {
    throw ExternalToolFailure(stage, "executable not found on PATH: " + executable);
  }
  return path;
}

} // namespace

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

ProcessStage::ProcessStage(std::string name, std::string executable, std::vector<std::string> args,
                           std::chrono::seconds timeout)
  : name_(std::move(name))
  , executable_(std::move(executable))
  , args_(std::move(args))
  , timeout_(timeout) {}

//==============================================
// STAGE OPERATIONS
//==============================================

StageResult ProcessStage::run(const Bytes& input) {
  BOOST_LOG_TRIVIAL(info) << "Process stage: Running " << name_ << " (" << executable_
                          << ") over " << input.size() << " bytes";

  auto executable = resolve_executable(name_, executable_);

  bool exited = false;
  int exit_code = -1;
  std::error_code exit_error;

  boost::asio::io_context ioc;
  std::future<std::vector<char>> stdout_data;
  std::future<std::vector<char>> stderr_data;

  // Feed the whole input and drain both outputs concurrently so that neither pipe can fill up.
  // The exit is observed on the same context, so one deadline covers output and exit.
  bp::child child;
  try {
    child = bp::child(executable, bp::args(args_),
                      bp::std_in < boost::asio::buffer(input),
                      bp::std_out > stdout_data,
                      bp::std_err > stderr_data,
                      bp::on_exit = [&](int code, const std::error_code& ec) {
                        exited = true;
                        exit_code = code;
                        exit_error = ec;
                      },
                      ioc);
  }
  catch (const bp::process_error& e) {
    BOOST_LOG_TRIVIAL(error) << "Process stage: Failed to launch " << name_ << ": " << e.what();
    throw ExternalToolFailure(name_, std::string("failed to launch: ") + e.what());
  }

  ioc.run_for(timeout_);

  if (!ioc.stopped() || !exited) {
    BOOST_LOG_TRIVIAL(error) << "Process stage: " << name_ << " did not finish within "
                             << timeout_.count() << "s, terminating";
    std::error_code ec;
    child.terminate(ec);
    if (ec) {
      BOOST_LOG_TRIVIAL(warning) << "Process stage: Failed to terminate " << name_ << ": " << ec.message();
    }
    throw ExternalToolFailure(name_, "timed out after " + std::to_string(timeout_.count()) + "s");
  }

  if (exit_error) {
    throw ExternalToolFailure(name_, "failed to wait for process: " + exit_error.message());
  }

  StageResult result;
  auto out = stdout_data.get();
  auto err = stderr_data.get();
  result.output.assign(out.begin(), out.end());
  if (!err.empty()) {
    result.diagnostics.emplace_back(err.begin(), err.end());
  }

  if (exit_code != 0) {
    std::string detail = "exited with status " + std::to_string(exit_code);
    if (!result.diagnostics.empty()) {
      detail += ": " + result.diagnostics.front();
    }
    BOOST_LOG_TRIVIAL(error) << "Process stage: " << name_ << " " << detail;
    throw ExternalToolFailure(name_, detail);
  }

  BOOST_LOG_TRIVIAL(info) << "Process stage: " << name_ << " produced " << result.output.size()
                          << " bytes";
  return result;
}

//==============================================
// STAGE FACTORY
//==============================================

ProcessStageFactory::ProcessStageFactory(PipelineConfig config) : config_(std::move(config)) {}

std::unique_ptr<TransformStage> ProcessStageFactory::compressor() {
  return std::make_unique<ProcessStage>("compress", config_.compressor,
                                        std::vector<std::string>{"--compress"}, config_.tool_timeout);
}

std::unique_ptr<TransformStage> ProcessStageFactory::decompressor() {
  return std::make_unique<ProcessStage>("decompress", config_.compressor,
                                        std::vector<std::string>{"--decompress"}, config_.tool_timeout);
}

std::unique_ptr<TransformStage> ProcessStageFactory::key_importer(const std::filesystem::path& keystore,
                                                                  const std::filesystem::path& key) {
  auto args = gpg_base_args(keystore);
  args.insert(args.end(), {"--import", key.string()});
  return std::make_unique<ProcessStage>("import-key", config_.gpg, std::move(args), config_.tool_timeout);
}

std::unique_ptr<TransformStage> ProcessStageFactory::encryptor(const std::filesystem::path& keystore,
                                                               const std::string& recipient) {
  // No compression inside gpg, the data is already compressed. "--output -" must come before "--encrypt -".
  auto args = gpg_base_args(keystore);
  args.insert(args.end(), {"-r", recipient, "-z", "0", "--trust-model", "always",
                           "--output", "-", "--encrypt", "-"});
  return std::make_unique<ProcessStage>("encrypt", config_.gpg, std::move(args), config_.tool_timeout);
}

std::unique_ptr<TransformStage> ProcessStageFactory::decryptor(const std::filesystem::path& keystore) {
  auto args = gpg_base_args(keystore);
  args.insert(args.end(), {"--trust-model", "always", "--output", "-", "--decrypt", "-"});
  return std::make_unique<ProcessStage>("decrypt", config_.gpg, std::move(args), config_.tool_timeout);
}

std::vector<std::string> ProcessStageFactory::gpg_base_args(const std::filesystem::path& keystore) const {
  return {"--no-permission-warning", "--batch", "--homedir", keystore.string()};
}

} // namespace pipeline
} // namespace streamcorpus
