#ifndef CORE_WORKSPACE_HPP
#define CORE_WORKSPACE_HPP

#include <atomic>
#include <memory>
#include <string>
#include <vector>

#include "util/file.hpp"

namespace core {

// Isolated directory owned by a single submission. Files written by the
// submission live in the box subdirectory, which is both the classpath and
// the working directory of the subprocesses. The directory is removed when
// the workspace is destroyed.
class Workspace {
 public:
  static const constexpr char* kBoxDir = "box";

  const std::string& Path() const;
  std::string BoxPath() const;

  // Writes a file inside the box. Throws std::invalid_argument for paths
  // that are absolute, contain "." or ".." segments or unusual characters.
  void WriteText(const std::string& relative_path, const std::string& text);
  void WriteBytes(const std::string& relative_path, const std::string& bytes);

  // Reads a file inside the box, with the same path rules as WriteText.
  std::string ReadBytes(const std::string& relative_path) const;

  // Returns the paths, relative to the box, of all the regular files in it.
  std::vector<std::string> ListFiles() const;

  // Recursively deletes the workspace. Deletion errors are logged and
  // otherwise ignored; calling Destroy again does nothing.
  void Destroy();
  bool Destroyed() const { return dir_ == nullptr; }

  ~Workspace();
  Workspace(Workspace&&) noexcept = default;
  Workspace& operator=(Workspace&&) noexcept = default;
  Workspace(const Workspace&) = delete;
  Workspace& operator=(const Workspace&) = delete;

 private:
  friend class WorkspaceManager;
  explicit Workspace(std::unique_ptr<util::TempDir> dir);

  std::string BoxFile(const std::string& relative_path) const;

  std::unique_ptr<util::TempDir> dir_;
};

// Creates uniquely named workspaces under a base directory.
class WorkspaceManager {
 public:
  explicit WorkspaceManager(std::string base_directory);

  // Creates a fresh workspace with an empty box. Throws std::system_error if
  // the directories cannot be created.
  Workspace Create();

  const std::string& BaseDirectory() const { return base_directory_; }

 private:
  std::string base_directory_;
  std::atomic<uint64_t> next_id_{0};
};

// Returns true if path is a safe relative path inside a workspace box.
bool IsValidRelativePath(const std::string& path);

}  // namespace core

#endif
