#include "util/file.hpp"

#include <stdlib.h>
#include <string.h>

#include <algorithm>
#include <memory>

#include "glog/logging.h"

#if defined(__unix__) || defined(__linux__) || defined(__APPLE__)
#include <fcntl.h>
#include <ftw.h>
#include <sys/stat.h>
#include <unistd.h>

namespace {

const constexpr char* kPathSeparators = "/";

bool MkDir(const std::string& dir) {
  return mkdir(dir.c_str(), S_IRWXU | S_IRWXG | S_IXOTH) != -1 ||
         errno == EEXIST;
}

bool OsRemove(const std::string& path) { return remove(path.c_str()) != -1; }

std::vector<std::string> OsListFiles(const std::string& path) {
  thread_local std::vector<std::string> files;
  files.clear();
  if (nftw(path.c_str(),
           [](const char* fpath, const struct stat* sb, int typeflags,
              struct FTW* ftwbuf) {
             if (typeflags == FTW_F) files.emplace_back(fpath);
             return 0;
           },
           64, FTW_PHYS | FTW_MOUNT) == -1) {
    throw std::system_error(errno, std::system_category(), "nftw " + path);
  }
  std::vector<std::string> ret;
  ret.swap(files);
  std::sort(ret.begin(), ret.end());
  return ret;
}

// Returns the first errno hit while removing the tree, or 0.
int OsRemoveTree(const std::string& path) {
  thread_local int first_error;
  first_error = 0;
  int ret = nftw(path.c_str(),
                 [](const char* fpath, const struct stat* sb, int typeflags,
                    struct FTW* ftwbuf) {
                   if (remove(fpath) == -1 && first_error == 0) {
                     first_error = errno;
                   }
                   return 0;
                 },
                 64, FTW_DEPTH | FTW_PHYS | FTW_MOUNT);
  if (ret == -1) return errno;
  return first_error;
}

std::string OsTempDir(const std::string& path, const std::string& prefix) {
  std::string tmp = util::File::JoinPath(path, prefix + "XXXXXX");
  std::unique_ptr<char[]> data{strdup(tmp.c_str())};
  if (mkdtemp(data.get()) == nullptr) {
    return "";
  }
  return data.get();
}

int OsTempFile(const std::string& path, std::string* tmp) {
  *tmp = path + ".XXXXXX";
  std::unique_ptr<char[]> data{strdup(tmp->c_str())};
  int fd = mkostemp(data.get(), O_CLOEXEC);
  *tmp = data.get();
  return fd;
}

// Returns errno, or 0 on success.
int OsAtomicMove(const std::string& src, const std::string& dst,
                 bool overwrite = false, bool exist_ok = true) {
  if (overwrite) {
    if (rename(src.c_str(), dst.c_str()) == -1) return errno;
    return 0;
  }
  if (link(src.c_str(), dst.c_str()) == -1) {
    int error = errno;
    remove(src.c_str());
    if (!exist_ok || error != EEXIST) return error;
    return 0;
  }
  if (remove(src.c_str()) == -1) return errno != ENOENT ? errno : 0;
  return 0;
}

int OsRead(const std::string& path, uint64_t limit, std::string* contents,
           bool* truncated) {
  int fd = open(path.c_str(), O_CLOEXEC | O_RDONLY);
  if (fd == -1) return errno;
  char buf[util::kChunkSize] = {};
  ssize_t amount = 0;
  while (contents->size() < limit) {
    uint64_t to_read =
        std::min<uint64_t>(util::kChunkSize, limit - contents->size());
    amount = read(fd, buf, to_read);
    if (amount == -1 && errno == EINTR) continue;
    if (amount <= 0) break;
    contents->append(buf, amount);
  }
  if (amount == -1) {
    int error = errno;
    close(fd);
    return error;
  }
  if (truncated != nullptr) {
    // Peek one more byte to tell a file of exactly limit bytes apart.
    *truncated = contents->size() == limit && read(fd, buf, 1) > 0;
  }
  return close(fd) == -1 ? errno : 0;
}

int OsWrite(const std::string& path, const std::string& contents,
            bool overwrite, bool exist_ok) {
  std::string temp_file;
  int fd = OsTempFile(path, &temp_file);
  if (fd == -1) return errno;
  size_t pos = 0;
  while (pos < contents.size()) {
    ssize_t written = write(fd, contents.data() + pos, contents.size() - pos);
    if (written == -1 && errno == EINTR) continue;
    if (written == -1) {
      int error = errno;
      close(fd);
      remove(temp_file.c_str());
      return error;
    }
    pos += written;
  }
  if (close(fd) == -1) {
    int error = errno;
    remove(temp_file.c_str());
    return error;
  }
  return OsAtomicMove(temp_file, path, overwrite, exist_ok);
}

}  // namespace
#endif

namespace util {

std::string File::Read(const std::string& path, uint64_t limit,
                       bool* truncated) {
  std::string contents;
  int err = OsRead(path, limit, &contents, truncated);
  if (err) throw std::system_error(err, std::system_category(), "Read " + path);
  return contents;
}

void File::Write(const std::string& path, const std::string& contents,
                 bool overwrite, bool exist_ok) {
  MakeDirs(BaseDir(path));
  if (!overwrite && Size(path) >= 0) {
    if (exist_ok) return;
    throw std::system_error(EEXIST, std::system_category(), "Write " + path);
  }
  int err = OsWrite(path, contents, overwrite, exist_ok);
  if (err) {
    throw std::system_error(err, std::system_category(), "Write " + path);
  }
}

std::vector<std::string> File::ListFiles(const std::string& path) {
  return OsListFiles(path);
}

void File::MakeDirs(const std::string& path) {
  if (path.empty()) return;
  uint64_t pos = 0;
  while (pos != std::string::npos) {
    pos = path.find_first_of(kPathSeparators, pos + 1);
    if (!MkDir(path.substr(0, pos))) {
      throw std::system_error(errno, std::system_category(), "mkdir " + path);
    }
  }
}

void File::Remove(const std::string& path) {
  if (!OsRemove(path)) {
    throw std::system_error(errno, std::system_category(), "remove " + path);
  }
}

void File::RemoveTree(const std::string& path) {
  int err = OsRemoveTree(path);
  if (err) {
    throw std::system_error(err, std::system_category(), "removetree " + path);
  }
}

std::string File::JoinPath(const std::string& first,
                           const std::string& second) {
  if (!second.empty() && strchr(kPathSeparators, second[0]) != nullptr) {
    return second;
  }
  return first + kPathSeparators[0] + second;
}

std::string File::BaseDir(const std::string& path) {
  if (path.find_last_of(kPathSeparators) == std::string::npos) return "";
  return path.substr(0, path.find_last_of(kPathSeparators));
}

std::string File::BaseName(const std::string& path) {
  return path.substr(path.find_last_of(kPathSeparators) + 1);
}

int64_t File::Size(const std::string& path) {
  struct stat st {};
  if (stat(path.c_str(), &st) != 0) {
    return -1;
  }
  return st.st_size;
}

TempDir::TempDir(const std::string& base, const std::string& prefix) {
  File::MakeDirs(base);
  path_ = OsTempDir(base, prefix);
  if (path_.empty()) {
    throw std::system_error(errno, std::system_category(), "mkdtemp");
  }
}
void TempDir::Keep() { keep_ = true; }
const std::string& TempDir::Path() const { return path_; }
TempDir::~TempDir() {
  if (keep_ || moved_) return;
  try {
    File::RemoveTree(path_);
  } catch (const std::system_error& e) {
    LOG(WARNING) << "Could not remove " << path_ << ": " << e.what();
  }
}

}  // namespace util
