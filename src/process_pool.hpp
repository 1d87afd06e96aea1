#pragma once

#include "child_process.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace toolagent {

// Called on the process's stdout reader thread, once per line. Returns true
// when the listener consumed the line.
using LineListener = std::function<bool(const std::string& line)>;
// Called once on the exit watcher thread after all stdout lines were delivered.
using ExitListener = std::function<void(int exit_code)>;

struct ProcessInfo {
  std::string process_key;
  int pid = -1;
  std::string command;
  std::vector<std::string> args;
  int reference_count = 0;
  std::vector<std::string> referencing_servers;
};

class ProcessPool;

// Owns exactly one reference to a pooled process. Holds a token, never a
// pointer to the process itself.
class ProcessHandle {
 public:
  ProcessHandle() = default;
  ~ProcessHandle();
  ProcessHandle(const ProcessHandle&) = delete;
  ProcessHandle& operator=(const ProcessHandle&) = delete;
  ProcessHandle(ProcessHandle&& other) noexcept;
  ProcessHandle& operator=(ProcessHandle&& other) noexcept;

  bool Valid() const {
    return pool_ != nullptr && !disposed_;
  }
  const std::string& ServerName() const {
    return server_name_;
  }
  const std::string& ProcessKey() const {
    return key_;
  }
  int Pid() const {
    return pid_;
  }

  bool IsAlive() const;
  bool WriteLine(const std::string& line, std::string* err);
  // Ids are unique across every handle sharing the process.
  std::optional<std::string> NextRequestId();
  bool SetListeners(LineListener on_line, ExitListener on_exit);

  // Releases the reference. A second call logs a warning and does nothing.
  void Dispose();

 private:
  friend class ProcessPool;
  ProcessHandle(ProcessPool* pool, std::string key, uint64_t generation, std::string server_name, int pid);

  ProcessPool* pool_ = nullptr;
  std::string key_;
  uint64_t generation_ = 0;
  std::string server_name_;
  int pid_ = -1;
  uint64_t listener_id_ = 0;
  bool disposed_ = false;
};

// Reference-counted registry of shared child processes keyed by launch
// configuration. A process is terminated exactly once, when its last handle
// is released, or dropped from the pool when it exits on its own.
class ProcessPool {
 public:
  ProcessPool();
  explicit ProcessPool(std::unique_ptr<IProcessLauncher> launcher);
  ~ProcessPool();
  ProcessPool(const ProcessPool&) = delete;
  ProcessPool& operator=(const ProcessPool&) = delete;

  static std::string MakeProcessKey(const ProcessSpec& spec);

  std::optional<ProcessHandle> Acquire(const std::string& server_name, const ProcessSpec& spec, std::string* err);
  void Release(ProcessHandle* handle);

  std::vector<ProcessInfo> Stats();
  size_t Size();
  void ShutdownAll();

  void SetTerminateGrace(std::chrono::milliseconds grace) {
    terminate_grace_ = grace;
  }

 private:
  friend class ProcessHandle;
  class ManagedProcess;

  std::shared_ptr<ManagedProcess> Find(const std::string& key, uint64_t generation);
  void ReleaseReference(const std::string& key, uint64_t generation, const std::string& server_name, uint64_t listener_id);
  void OnProcessExited(ManagedProcess* process);
  // Destroys retired processes whose exit callbacks are done, or all of them.
  void ReapRetired(bool wait_for_watchers = false);

  std::unique_ptr<IProcessLauncher> launcher_;
  std::chrono::milliseconds terminate_grace_{5000};

  std::mutex mu_;
  uint64_t next_generation_ = 1;
  std::unordered_map<std::string, std::shared_ptr<ManagedProcess>> processes_;
  std::vector<std::shared_ptr<ManagedProcess>> retired_;
};

}  // namespace toolagent
