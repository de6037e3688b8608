#include "core/workspace.hpp"

#include <ctype.h>

#include <algorithm>
#include <stdexcept>

#include "absl/memory/memory.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_split.h"
#include "glog/logging.h"

namespace core {

constexpr const char* Workspace::kBoxDir;

namespace {
bool IsIllegalChar(char c) {
  return !isalnum(static_cast<unsigned char>(c)) && c != '.' && c != '-' &&
         c != '_' && c != '$' && c != '/';
}
}  // namespace

bool IsValidRelativePath(const std::string& path) {
  if (path.empty() || path[0] == '/') return false;
  if (std::find_if(path.begin(), path.end(), IsIllegalChar) != path.end()) {
    return false;
  }
  for (absl::string_view segment : absl::StrSplit(path, '/')) {
    if (segment.empty() || segment == "." || segment == "..") return false;
  }
  return true;
}

Workspace::Workspace(std::unique_ptr<util::TempDir> dir)
    : dir_(std::move(dir)) {}

Workspace::~Workspace() { Destroy(); }

const std::string& Workspace::Path() const {
  if (dir_ == nullptr) throw std::logic_error("Workspace already destroyed");
  return dir_->Path();
}

std::string Workspace::BoxPath() const {
  return util::File::JoinPath(Path(), kBoxDir);
}

std::string Workspace::BoxFile(const std::string& relative_path) const {
  if (!IsValidRelativePath(relative_path)) {
    throw std::invalid_argument("Invalid file name: " + relative_path);
  }
  return util::File::JoinPath(BoxPath(), relative_path);
}

void Workspace::WriteText(const std::string& relative_path,
                          const std::string& text) {
  WriteBytes(relative_path, text);
}

void Workspace::WriteBytes(const std::string& relative_path,
                           const std::string& bytes) {
  util::File::Write(BoxFile(relative_path), bytes, /*overwrite=*/true);
}

std::string Workspace::ReadBytes(const std::string& relative_path) const {
  return util::File::Read(BoxFile(relative_path));
}

std::vector<std::string> Workspace::ListFiles() const {
  std::string box = BoxPath();
  std::vector<std::string> files;
  for (const std::string& path : util::File::ListFiles(box)) {
    files.push_back(path.substr(box.size() + 1));
  }
  return files;
}

void Workspace::Destroy() {
  if (dir_ == nullptr) return;
  VLOG(1) << "Removing workspace " << dir_->Path();
  // TempDir logs removal failures instead of throwing.
  dir_.reset();
}

WorkspaceManager::WorkspaceManager(std::string base_directory)
    : base_directory_(std::move(base_directory)) {}

Workspace WorkspaceManager::Create() {
  std::string prefix = absl::StrCat("ws-", next_id_++, "-");
  auto dir = absl::make_unique<util::TempDir>(base_directory_, prefix);
  Workspace workspace(std::move(dir));
  util::File::MakeDirs(workspace.BoxPath());
  VLOG(1) << "Created workspace " << workspace.Path();
  return workspace;
}

}  // namespace core
