#include "sandbox/unix.hpp"

#include <algorithm>
#include <chrono>
#include <thread>

#include <errno.h>
#include <fcntl.h>
#include <limits.h>
#include <signal.h>
#include <stdlib.h>
#include <string.h>
#include <sys/resource.h>
#include <sys/stat.h>
#include <sys/time.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include "sandbox/memory_watcher.hpp"

namespace {
char* mystrerror(int err, char* buf, size_t buf_size) {
#ifdef _GNU_SOURCE
  return strerror_r(err, buf, buf_size);
#else
  strerror_r(err, buf, buf_size);
  return buf;
#endif
}

std::string ErrnoMessage(const char* prefix, int err) {
  char buf[1024] = {};
  return std::string(prefix) + ": " + mystrerror(err, buf, sizeof(buf));
}

void FillCStrings(const std::vector<std::string>& in,
                  std::vector<std::vector<char>>* storage,
                  std::vector<char*>* out) {
  storage->clear();
  out->clear();
  for (const std::string& s : in) {
    storage->emplace_back(s.begin(), s.end());
    storage->back().push_back(0);
  }
  for (std::vector<char>& s : *storage) out->push_back(s.data());
  out->push_back(nullptr);
}

int64_t ToMillis(const struct timeval& tv) {
  return static_cast<int64_t>(tv.tv_sec) * 1000 + tv.tv_usec / 1000;
}
}  // namespace

namespace sandbox {

static const constexpr size_t kStrErrorBufSize = 2048;

bool Unix::Execute(const ExecutionOptions& options, ExecutionInfo* info,
                   std::string* error_msg) {
  options_ = &options;
  if (!Setup(error_msg)) return false;
  if (!DoFork(error_msg)) return false;
  return Wait(info, error_msg);
}

bool Unix::Setup(std::string* error_msg) {
  std::vector<std::string> argv{options_->executable};
  argv.insert(argv.end(), options_->args.begin(), options_->args.end());
  FillCStrings(argv, &arg_storage_, &args_);
  FillCStrings(options_->env, &env_storage_, &env_);

  if (pipe(pipe_fds_) == -1) {
    *error_msg = ErrnoMessage("pipe", errno);
    return false;
  }
  if (fcntl(pipe_fds_[0], F_SETFD, FD_CLOEXEC) == -1 ||
      fcntl(pipe_fds_[1], F_SETFD, FD_CLOEXEC) == -1) {
    *error_msg = ErrnoMessage("fcntl", errno);
    close(pipe_fds_[0]);
    close(pipe_fds_[1]);
    return false;
  }
  return true;
}

bool Unix::DoFork(std::string* error_msg) {
  int fork_result = fork();
  if (fork_result == -1) {
    *error_msg = ErrnoMessage("fork", errno);
    close(pipe_fds_[0]);
    close(pipe_fds_[1]);
    return false;
  }
  if (fork_result == 0) Child();
  child_pid_ = fork_result;
  return true;
}

void Unix::Child() {
  close(pipe_fds_[0]);
  auto die2 = [this](const char* prefix, const char* err) {
    char buf[kStrErrorBufSize + 64 + 2] = {};
    strncat(buf, prefix, 64);
    strncat(buf, ": ", 2);
    strncat(buf, err, kStrErrorBufSize);
    int len = strlen(buf);
    if (write(pipe_fds_[1], &len, sizeof(len)) == sizeof(len)) {
      if (write(pipe_fds_[1], buf, len) != len) _Exit(1);
    }
    close(pipe_fds_[1]);
    _Exit(1);
  };

  auto die = [&die2](const char* prefix, int err) {
    char buf[kStrErrorBufSize] = {};
    die2(prefix, mystrerror(err, buf, kStrErrorBufSize));
  };

  // New session and process group, so that the whole tree can be killed and
  // terminal signals are not delivered to it.
  if (setsid() == -1) die("setsid", errno);

  const char* stdin_file = options_->stdin_file.empty()
                               ? "/dev/null"
                               : options_->stdin_file.c_str();
  int stdin_fd = open(stdin_file, O_RDONLY | O_CLOEXEC);
  if (stdin_fd == -1) die("open", errno);
  int stdout_fd = -1;
  int stderr_fd = -1;
  if (!options_->stdout_file.empty()) {
    stdout_fd = open(options_->stdout_file.c_str(),
                     O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC,
                     S_IRUSR | S_IWUSR);
    if (stdout_fd == -1) die("creat", errno);
  }
  if (options_->redirect_stderr_to_stdout) {
    stderr_fd = stdout_fd;
  } else if (!options_->stderr_file.empty()) {
    stderr_fd = open(options_->stderr_file.c_str(),
                     O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC,
                     S_IRUSR | S_IWUSR);
    if (stderr_fd == -1) die("creat", errno);
  }

  if (chdir(options_->root.c_str()) == -1) {
    die("chdir", errno);
  }

  // Handle I/O redirection.
#define DUP(field, fd)                          \
  if (field##_fd != -1) {                       \
    int ret = dup2(field##_fd, fd);             \
    if (ret == -1) die("redir " #field, errno); \
  }
  DUP(stdin, STDIN_FILENO);
  DUP(stdout, STDOUT_FILENO);
  DUP(stderr, STDERR_FILENO);
#undef DUP

  // Set resource limits.
  struct rlimit rlim;
#define SET_RLIM(res, value)                    \
  {                                             \
    rlim_t lim = value;                         \
    if (lim) {                                  \
      rlim.rlim_cur = lim;                      \
      rlim.rlim_max = lim;                      \
      if (setrlimit(RLIMIT_##res, &rlim) < 0) { \
        die("setrlim " #res, errno);            \
      }                                         \
    }                                           \
  }

  SET_RLIM(AS, options_->memory_limit_kb * 1024);
  // Round up, so that a limit below one second is not dropped.
  SET_RLIM(CPU, (options_->cpu_limit_millis + 999) / 1000);
  SET_RLIM(FSIZE, options_->max_file_size_kb * 1024);
  SET_RLIM(NOFILE, options_->max_files);
  SET_RLIM(NPROC, options_->max_procs);
  SET_RLIM(STACK, options_->max_stack_kb * 1024);
#undef SET_RLIM

  int count = 0;
  do {
    execve(options_->executable.c_str(), args_.data(), env_.data());
    usleep(100);
    // A binary that was just written may still be open for writing somewhere.
  } while (errno == ETXTBSY && count++ < 16);
  die("exec", errno);
  // [[noreturn]] does not work on lambdas...
  _Exit(1);
}

bool Unix::Wait(ExecutionInfo* info, std::string* error_msg) {
  close(pipe_fds_[1]);
  int error_len = 0;
  if (read(pipe_fds_[0], &error_len, sizeof(error_len)) == sizeof(error_len)) {
    char error[PIPE_BUF] = {};
    if (error_len < 0 || error_len >= PIPE_BUF) error_len = PIPE_BUF - 1;
    ssize_t got = read(pipe_fds_[0], error, error_len);
    close(pipe_fds_[0]);
    *error_msg = got > 0 ? std::string(error, got) : "child setup failed";
    int status = 0;
    while (waitpid(child_pid_, &status, 0) == -1 && errno == EINTR) {
    }
    return false;
  }
  close(pipe_fds_[0]);

  MemoryWatcher memory_watcher(child_pid_);

  auto program_start = std::chrono::steady_clock::now();
  auto elapsed_millis = [&program_start]() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::steady_clock::now() - program_start)
        .count();
  };

  // wait4 instead of waitpid, as it also returns the resource usage of the
  // child.
  int child_status = 0;
  bool has_exited = false;
  struct rusage rusage {};
  while (true) {
    int ret = wait4(child_pid_, &child_status, WNOHANG, &rusage);
    if (ret == -1 && errno != EINTR) {
      *error_msg = ErrnoMessage("wait4", errno);
      memory_watcher.Stop();
      kill(-child_pid_, SIGKILL);
      return false;
    }
    if (ret == child_pid_) {
      has_exited = true;
      break;
    }
    if (options_->wall_limit_millis &&
        elapsed_millis() >= options_->wall_limit_millis) {
      info->wall_limit_exceeded = true;
      break;
    }
    if (options_->memory_limit_kb &&
        memory_watcher.PeakKb() > options_->memory_limit_kb) {
      break;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
  if (!has_exited) {
    if (kill(-child_pid_, SIGKILL) == -1 && kill(child_pid_, SIGKILL) == -1 &&
        errno != ESRCH) {
      *error_msg = ErrnoMessage("kill", errno);
      memory_watcher.Stop();
      return false;
    }
    int ret = 0;
    while ((ret = wait4(child_pid_, &child_status, 0, &rusage)) == -1 &&
           errno == EINTR) {
    }
    if (ret != child_pid_) {
      *error_msg = ErrnoMessage("wait4", errno);
      memory_watcher.Stop();
      return false;
    }
  }
  info->wall_time_millis = elapsed_millis();
  memory_watcher.Stop();
  // Leftover processes of the group do not outlive the execution.
  kill(-child_pid_, SIGKILL);

  info->memory_usage_kb =
      std::max<int64_t>(memory_watcher.PeakKb(), rusage.ru_maxrss);
  info->status_code = WIFEXITED(child_status) ? WEXITSTATUS(child_status) : 0;
  info->signal = WIFSIGNALED(child_status) ? WTERMSIG(child_status) : 0;
  info->cpu_time_millis = ToMillis(rusage.ru_utime);
  info->sys_time_millis = ToMillis(rusage.ru_stime);
  return true;
}

}  // namespace sandbox
