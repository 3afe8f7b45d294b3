#include "pipeline/scratch_directory.hpp"
#include "pipeline/pipeline_error.hpp"
#include <system_error>
#include <utility>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <boost/log/trivial.hpp>

namespace streamcorpus {
namespace pipeline {

//==============================================
// SCRATCH DIRECTORY
//==============================================

ScratchDirectory::ScratchDirectory(std::filesystem::path path) : path_(std::move(path)) {
  BOOST_LOG_TRIVIAL(debug) << "Scratch directory: Acquired " << path_.string();
}

ScratchDirectory::~ScratchDirectory() {
  release();
}

ScratchDirectory::ScratchDirectory(ScratchDirectory&& other) noexcept
  : path_(std::exchange(other.path_, std::filesystem::path())) {}

ScratchDirectory& ScratchDirectory::operator=(ScratchDirectory&& other) noexcept {
  if (this != &other) {
    release();
    path_ = std::exchange(other.path_, std::filesystem::path());
  }
  return *this;
}

void ScratchDirectory::release() noexcept {
  if (path_.empty()) {
    return;
  }

  std::error_code ec;
  std::filesystem::remove_all(path_, ec);
  if (ec) {
    BOOST_LOG_TRIVIAL(warning) << "Scratch directory: Failed to remove " << path_.string()
                               << ": " << ec.message();
  } else {
    BOOST_LOG_TRIVIAL(debug) << "Scratch directory: Removed " << path_.string();
  }
  path_.clear();
}

//==============================================
// UUID NAMED FACTORY
//==============================================

UuidScratchDirectoryFactory::UuidScratchDirectoryFactory(std::filesystem::path root, std::string prefix)
  : root_(std::move(root))
  , prefix_(std::move(prefix)) {}

ScratchDirectory UuidScratchDirectoryFactory::acquire() {
  std::error_code ec;
  std::filesystem::create_directories(root_, ec);
  if (ec) {
    throw ScratchDirectoryError("failed to create root " + root_.string() + ": " + ec.message());
  }

  // A generator per call, boost's random_generator is not safe to share between threads
  boost::uuids::random_generator generator;
  std::filesystem::path path = root_ / (prefix_ + boost::uuids::to_string(generator()));

  // create_directory reports false instead of reusing a directory that is already there
  bool created = std::filesystem::create_directory(path, ec);
  if (ec) {
    throw ScratchDirectoryError("failed to create " + path.string() + ": " + ec.message());
  }
  if (!created) {
    BOOST_LOG_TRIVIAL(error) << "Scratch directory: Name collision on " << path.string();
    throw ScratchDirectoryError("directory already exists: " + path.string());
  }

  ScratchDirectory directory(path);

  // Key material is private to the owning user
  std::filesystem::permissions(path, std::filesystem::perms::owner_all,
                               std::filesystem::perm_options::replace, ec);
  if (ec) {
    throw ScratchDirectoryError("failed to restrict permissions on " + path.string() + ": " + ec.message());
  }
  return directory;
}

} // namespace pipeline
} // namespace streamcorpus
