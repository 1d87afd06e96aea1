#include "child_process.hpp"

#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <mutex>
#include <string>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>
#include <vector>

extern char** environ;

namespace toolagent {
namespace {

static void CloseFd(int* fd) {
  if (*fd >= 0) {
    close(*fd);
    *fd = -1;
  }
}

// Splits a pipe into lines. Once `wake_fd` becomes readable the reader
// drains what is already buffered in the pipe and then reports end of
// stream, even if another process still holds the write end.
class LineReader {
 public:
  LineReader(int fd, int wake_fd) : fd_(fd), wake_fd_(wake_fd) {}

  bool ReadLine(std::string* line) {
    for (;;) {
      auto nl = buf_.find('\n');
      if (nl != std::string::npos) {
        *line = buf_.substr(0, nl);
        buf_.erase(0, nl + 1);
        if (!line->empty() && line->back() == '\r') line->pop_back();
        return true;
      }
      if (fd_ < 0 || eof_) return TakeTail(line);

      pollfd fds[2] = {{fd_, POLLIN, 0}, {wake_fd_, POLLIN, 0}};
      const int timeout_ms = draining_ ? 0 : -1;
      int r = poll(fds, draining_ ? 1 : 2, timeout_ms);
      if (r < 0) {
        if (errno == EINTR) continue;
        eof_ = true;
        continue;
      }
      if (r == 0) {
        eof_ = true;
        continue;
      }
      if (fds[0].revents & (POLLIN | POLLHUP | POLLERR)) {
        char chunk[4096];
        ssize_t n = read(fd_, chunk, sizeof(chunk));
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) {
          eof_ = true;
          continue;
        }
        buf_.append(chunk, static_cast<size_t>(n));
        continue;
      }
      if (!draining_ && (fds[1].revents & POLLIN)) draining_ = true;
    }
  }

 private:
  bool TakeTail(std::string* line) {
    if (buf_.empty()) return false;
    *line = std::move(buf_);
    buf_.clear();
    return true;
  }

  int fd_;
  int wake_fd_;
  bool draining_ = false;
  bool eof_ = false;
  std::string buf_;
};

class PosixChildProcess : public IChildProcess {
 public:
  PosixChildProcess(pid_t pid, int stdin_fd, int stdout_fd, int stderr_fd, int wake_read_fd, int wake_write_fd)
      : pid_(pid), stdin_fd_(stdin_fd), stdout_fd_(stdout_fd), stderr_fd_(stderr_fd),
        wake_read_fd_(wake_read_fd), wake_write_fd_(wake_write_fd),
        stdout_reader_(stdout_fd, wake_read_fd), stderr_reader_(stderr_fd, wake_read_fd) {}

  ~PosixChildProcess() override {
    CloseFd(&stdin_fd_);
    CloseFd(&stdout_fd_);
    CloseFd(&stderr_fd_);
    CloseFd(&wake_read_fd_);
    CloseFd(&wake_write_fd_);
  }

  int Pid() const override {
    return static_cast<int>(pid_);
  }

  bool WriteStdin(const std::string& data, std::string* err) override {
    std::lock_guard<std::mutex> lock(write_mu_);
    if (stdin_fd_ < 0) {
      if (err) *err = "stdin closed";
      return false;
    }
    size_t off = 0;
    while (off < data.size()) {
      ssize_t n = write(stdin_fd_, data.data() + off, data.size() - off);
      if (n < 0) {
        if (errno == EINTR) continue;
        if (err) *err = std::string("write failed: ") + std::strerror(errno);
        return false;
      }
      off += static_cast<size_t>(n);
    }
    return true;
  }

  bool ReadStdoutLine(std::string* line) override {
    return stdout_reader_.ReadLine(line);
  }

  bool ReadStderrLine(std::string* line) override {
    return stderr_reader_.ReadLine(line);
  }

  // Signals go to the child's process group so helpers it forked go too.
  void Terminate() override {
    std::lock_guard<std::mutex> lock(state_mu_);
    if (!reaped_) SignalGroup(SIGTERM);
  }

  void Kill() override {
    std::lock_guard<std::mutex> lock(state_mu_);
    if (!reaped_) SignalGroup(SIGKILL);
  }

  int WaitForExit() override {
    int status = 0;
    for (;;) {
      pid_t r = waitpid(pid_, &status, 0);
      if (r < 0 && errno == EINTR) continue;
      break;
    }
    {
      std::lock_guard<std::mutex> lock(state_mu_);
      reaped_ = true;
    }
    {
      std::lock_guard<std::mutex> lock(write_mu_);
      CloseFd(&stdin_fd_);
    }
    // Leftover holders of the output pipes must not keep the readers alive.
    const char wake = 'x';
    ssize_t ignored = write(wake_write_fd_, &wake, 1);
    (void)ignored;
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
    return -1;
  }

 private:
  void SignalGroup(int sig) {
    if (kill(-pid_, sig) == -1) kill(pid_, sig);
  }

  pid_t pid_;
  int stdin_fd_;
  int stdout_fd_;
  int stderr_fd_;
  int wake_read_fd_;
  int wake_write_fd_;
  LineReader stdout_reader_;
  LineReader stderr_reader_;
  std::mutex write_mu_;
  std::mutex state_mu_;
  bool reaped_ = false;
};

// Parent environment with the configured entries overlaid.
static std::vector<std::string> BuildEnvironment(const std::map<std::string, std::string>& overrides) {
  std::vector<std::string> out;
  for (char** e = environ; e && *e; ++e) {
    std::string kv(*e);
    auto eq = kv.find('=');
    std::string key = eq == std::string::npos ? kv : kv.substr(0, eq);
    if (overrides.count(key)) continue;
    out.push_back(std::move(kv));
  }
  for (const auto& [k, v] : overrides) out.push_back(k + "=" + v);
  return out;
}

}  // namespace

PosixProcessLauncher::PosixProcessLauncher() {
  static std::once_flag once;
  std::call_once(once, []() { std::signal(SIGPIPE, SIG_IGN); });
}

std::unique_ptr<IChildProcess> PosixProcessLauncher::Launch(const ProcessSpec& spec, std::string* err) {
  if (spec.command.empty()) {
    if (err) *err = "empty command";
    return nullptr;
  }

  int stdin_pipe[2] = {-1, -1};
  int stdout_pipe[2] = {-1, -1};
  int stderr_pipe[2] = {-1, -1};
  int status_pipe[2] = {-1, -1};
  int wake_pipe[2] = {-1, -1};
  auto close_all = [&]() {
    for (int* p : {stdin_pipe, stdout_pipe, stderr_pipe, status_pipe, wake_pipe}) {
      CloseFd(&p[0]);
      CloseFd(&p[1]);
    }
  };
  if (pipe2(stdin_pipe, O_CLOEXEC) == -1 || pipe2(stdout_pipe, O_CLOEXEC) == -1 ||
      pipe2(stderr_pipe, O_CLOEXEC) == -1 || pipe2(status_pipe, O_CLOEXEC) == -1 ||
      pipe2(wake_pipe, O_CLOEXEC) == -1) {
    if (err) *err = std::string("pipe failed: ") + std::strerror(errno);
    close_all();
    return nullptr;
  }

  // Everything the child touches is prepared before fork.
  std::vector<char*> argv;
  argv.push_back(const_cast<char*>(spec.command.c_str()));
  for (const auto& a : spec.args) argv.push_back(const_cast<char*>(a.c_str()));
  argv.push_back(nullptr);
  auto env_storage = BuildEnvironment(spec.env);
  std::vector<char*> envp;
  for (auto& kv : env_storage) envp.push_back(kv.data());
  envp.push_back(nullptr);

  pid_t pid = fork();
  if (pid == -1) {
    if (err) *err = std::string("fork failed: ") + std::strerror(errno);
    close_all();
    return nullptr;
  }

  if (pid == 0) {
    setpgid(0, 0);
    dup2(stdin_pipe[0], STDIN_FILENO);
    dup2(stdout_pipe[1], STDOUT_FILENO);
    dup2(stderr_pipe[1], STDERR_FILENO);
    execvpe(spec.command.c_str(), argv.data(), envp.data());
    int code = errno;
    ssize_t ignored = write(status_pipe[1], &code, sizeof(code));
    (void)ignored;
    _exit(127);
  }

  // Also set from the child; EACCES here only means the child already exec'd.
  setpgid(pid, pid);
  CloseFd(&stdin_pipe[0]);
  CloseFd(&stdout_pipe[1]);
  CloseFd(&stderr_pipe[1]);
  CloseFd(&status_pipe[1]);

  int exec_errno = 0;
  ssize_t n;
  do {
    n = read(status_pipe[0], &exec_errno, sizeof(exec_errno));
  } while (n < 0 && errno == EINTR);
  CloseFd(&status_pipe[0]);
  if (n > 0) {
    int status = 0;
    waitpid(pid, &status, 0);
    if (err) *err = "exec " + spec.command + " failed: " + std::strerror(exec_errno);
    close_all();
    return nullptr;
  }

  return std::make_unique<PosixChildProcess>(pid, stdin_pipe[1], stdout_pipe[0], stderr_pipe[0], wake_pipe[0],
                                             wake_pipe[1]);
}

}  // namespace toolagent
