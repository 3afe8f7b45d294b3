#ifndef STREAMCORPUS_SCRATCH_DIRECTORY_HPP
#define STREAMCORPUS_SCRATCH_DIRECTORY_HPP

#include <filesystem>
#include <string>

namespace streamcorpus {
namespace pipeline {

// Owns a directory and removes it, with everything in it, when destroyed
class ScratchDirectory {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  // Takes ownership of an existing directory
  explicit ScratchDirectory(std::filesystem::path path);
  ~ScratchDirectory();

  ScratchDirectory(ScratchDirectory&& other) noexcept;
  ScratchDirectory& operator=(ScratchDirectory&& other) noexcept;
  ScratchDirectory(const ScratchDirectory&) = delete;
  ScratchDirectory& operator=(const ScratchDirectory&) = delete;


  // ---- OPERATIONS ----
  const std::filesystem::path& path() const { return path_; }
  // Removes the directory now instead of at destruction
  void release() noexcept;

private:
  std::filesystem::path path_;
};

// Hands out scratch directories that no other call can be using
class ScratchDirectoryFactory {
public:
  virtual ~ScratchDirectoryFactory() = default;

  virtual ScratchDirectory acquire() = 0;
};

// Names each directory after a fresh random UUID under a common root
class UuidScratchDirectoryFactory : public ScratchDirectoryFactory {
public:
  explicit UuidScratchDirectoryFactory(std::filesystem::path root,
                                       std::string prefix = "streamcorpus-keystore-");

  ScratchDirectory acquire() override;

  const std::filesystem::path& root() const { return root_; }

private:
  std::filesystem::path root_;
  std::string prefix_;
};

} // namespace pipeline
} // namespace streamcorpus

#endif // STREAMCORPUS_SCRATCH_DIRECTORY_HPP
