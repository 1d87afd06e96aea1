#include "process_pool.hpp"

#include "config.hpp"

#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <iostream>
#include <iterator>
#include <map>
#include <set>
#include <string>
#include <thread>
#include <utility>

namespace toolagent {
namespace {

static std::string Join(const std::vector<std::string>& parts, const std::string& sep) {
  std::string out;
  for (size_t i = 0; i < parts.size(); i++) {
    if (i) out += sep;
    out += parts[i];
  }
  return out;
}

}  // namespace

class ProcessPool::ManagedProcess {
 public:
  ManagedProcess(ProcessPool* pool, std::string key, uint64_t generation, ProcessSpec spec,
                 std::unique_ptr<IChildProcess> child)
      : pool_(pool), key_(std::move(key)), generation_(generation), spec_(std::move(spec)), child_(std::move(child)) {}

  // The watcher joins the pumps itself, so it is joined first.
  ~ManagedProcess() {
    for (auto* t : {&watch_thread_, &stdout_thread_, &stderr_thread_}) {
      if (t->joinable()) t->join();
    }
  }

  void Start() {
    stdout_thread_ = std::thread([this]() { PumpStdout(); });
    stderr_thread_ = std::thread([this]() { PumpStderr(); });
    watch_thread_ = std::thread([this]() { WatchExit(); });
  }

  const std::string& Key() const {
    return key_;
  }
  uint64_t Generation() const {
    return generation_;
  }
  const ProcessSpec& Spec() const {
    return spec_;
  }
  int Pid() const {
    return child_->Pid();
  }

  // Reference bookkeeping is serialized by the pool mutex.
  void AddReference(const std::string& server_name) {
    ref_count_++;
    servers_.insert(server_name);
    std::cout << "[pool] ref+ server=" << server_name << " key=" << key_ << " refs=" << ref_count_ << "\n";
  }
  int DropReference(const std::string& server_name) {
    if (ref_count_ > 0) {
      ref_count_--;
      auto it = servers_.find(server_name);
      if (it != servers_.end()) servers_.erase(it);
      std::cout << "[pool] ref- server=" << server_name << " key=" << key_ << " refs=" << ref_count_ << "\n";
    }
    return ref_count_;
  }
  int RefCount() const {
    return ref_count_;
  }
  std::vector<std::string> Servers() const {
    return std::vector<std::string>(servers_.begin(), servers_.end());
  }

  bool Exited() const {
    return exited_.load();
  }
  // True once every exit callback has run.
  bool Finished() const {
    return finished_.load();
  }

  bool Write(const std::string& data, std::string* err) {
    if (exited_.load()) {
      if (err) *err = "process exited";
      return false;
    }
    return child_->WriteStdin(data, err);
  }

  std::string NextRequestId() {
    return std::to_string(next_request_id_.fetch_add(1));
  }

  uint64_t AddListener(LineListener on_line, ExitListener on_exit) {
    std::lock_guard<std::mutex> lock(listener_mu_);
    uint64_t id = next_listener_id_++;
    listeners_[id] = Listener{std::move(on_line), std::move(on_exit)};
    return id;
  }

  // Waits for an in-flight dispatch to finish before returning.
  void RemoveListener(uint64_t id) {
    if (id == 0) return;
    std::lock_guard<std::mutex> lock(listener_mu_);
    listeners_.erase(id);
  }

  // SIGTERM, then SIGKILL once the grace period has elapsed.
  void Shutdown(std::chrono::milliseconds grace) {
    if (!exited_.load()) {
      std::cout << "[pool] terminate pid=" << Pid() << " key=" << key_ << "\n";
      child_->Terminate();
    }
    if (!WaitExited(grace)) {
      std::cout << "[pool] kill pid=" << Pid() << " key=" << key_ << " reason=grace_elapsed\n";
      child_->Kill();
      WaitExited(std::chrono::milliseconds::max());
    }
  }

 private:
  struct Listener {
    LineListener on_line;
    ExitListener on_exit;
  };

  bool WaitExited(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(exit_mu_);
    if (timeout == std::chrono::milliseconds::max()) {
      exit_cv_.wait(lock, [&]() { return exited_.load(); });
      return true;
    }
    return exit_cv_.wait_for(lock, timeout, [&]() { return exited_.load(); });
  }

  void PumpStdout() {
    std::string line;
    while (child_->ReadStdoutLine(&line)) {
      if (line.find_first_not_of(" \t\r") == std::string::npos) continue;
      if (IsVerboseLogging()) std::cout << "[stdio] << pid=" << Pid() << " " << line << "\n";
      bool claimed = false;
      {
        std::lock_guard<std::mutex> lock(listener_mu_);
        for (auto& [_, l] : listeners_) {
          if (l.on_line && l.on_line(line)) {
            claimed = true;
            break;
          }
        }
      }
      if (!claimed) std::cout << "[pool] orphaned line pid=" << Pid() << " key=" << key_ << "\n";
    }
  }

  void PumpStderr() {
    std::string line;
    while (child_->ReadStderrLine(&line)) {
      if (IsVerboseLogging() && !line.empty()) std::cout << "[stderr] pid=" << Pid() << " " << line << "\n";
    }
  }

  // Marks the process exited as soon as it is reaped, so writes fail and
  // Acquire respawns. The pumps stop once they have drained what the child
  // wrote, which bounds the join even when a grandchild still holds the
  // output pipes. Listeners see every line before their exit callback.
  void WatchExit() {
    const int code = child_->WaitForExit();
    {
      std::lock_guard<std::mutex> lock(exit_mu_);
      exited_.store(true);
    }
    exit_cv_.notify_all();
    std::cout << "[pool] exited pid=" << Pid() << " code=" << code << " key=" << key_ << "\n";

    if (stdout_thread_.joinable()) stdout_thread_.join();
    if (stderr_thread_.joinable()) stderr_thread_.join();
    {
      std::lock_guard<std::mutex> lock(listener_mu_);
      for (auto& [_, l] : listeners_) {
        if (l.on_exit) l.on_exit(code);
      }
    }
    pool_->OnProcessExited(this);
    finished_.store(true);
  }

  ProcessPool* pool_;
  std::string key_;
  uint64_t generation_;
  ProcessSpec spec_;
  std::unique_ptr<IChildProcess> child_;

  int ref_count_ = 0;
  std::multiset<std::string> servers_;
  std::atomic<uint64_t> next_request_id_{0};

  std::mutex listener_mu_;
  uint64_t next_listener_id_ = 1;
  std::map<uint64_t, Listener> listeners_;

  std::mutex exit_mu_;
  std::condition_variable exit_cv_;
  std::atomic<bool> exited_{false};
  std::atomic<bool> finished_{false};

  std::thread stdout_thread_;
  std::thread stderr_thread_;
  std::thread watch_thread_;
};

ProcessHandle::ProcessHandle(ProcessPool* pool, std::string key, uint64_t generation, std::string server_name, int pid)
    : pool_(pool), key_(std::move(key)), generation_(generation), server_name_(std::move(server_name)), pid_(pid) {}

ProcessHandle::~ProcessHandle() {
  if (pool_ && !disposed_) Dispose();
}

ProcessHandle::ProcessHandle(ProcessHandle&& other) noexcept
    : pool_(std::exchange(other.pool_, nullptr)),
      key_(std::move(other.key_)),
      generation_(other.generation_),
      server_name_(std::move(other.server_name_)),
      pid_(other.pid_),
      listener_id_(std::exchange(other.listener_id_, 0)),
      disposed_(other.disposed_) {}

ProcessHandle& ProcessHandle::operator=(ProcessHandle&& other) noexcept {
  if (this == &other) return *this;
  if (pool_ && !disposed_) Dispose();
  pool_ = std::exchange(other.pool_, nullptr);
  key_ = std::move(other.key_);
  generation_ = other.generation_;
  server_name_ = std::move(other.server_name_);
  pid_ = other.pid_;
  listener_id_ = std::exchange(other.listener_id_, 0);
  disposed_ = other.disposed_;
  return *this;
}

bool ProcessHandle::IsAlive() const {
  if (!Valid()) return false;
  auto p = pool_->Find(key_, generation_);
  return p && !p->Exited();
}

bool ProcessHandle::WriteLine(const std::string& line, std::string* err) {
  if (!Valid()) {
    if (err) *err = "process handle disposed";
    return false;
  }
  auto p = pool_->Find(key_, generation_);
  if (!p) {
    if (err) *err = "process exited";
    return false;
  }
  if (IsVerboseLogging()) std::cout << "[stdio] >> pid=" << pid_ << " " << line << "\n";
  return p->Write(line + "\n", err);
}

std::optional<std::string> ProcessHandle::NextRequestId() {
  if (!Valid()) return std::nullopt;
  auto p = pool_->Find(key_, generation_);
  if (!p) return std::nullopt;
  return p->NextRequestId();
}

bool ProcessHandle::SetListeners(LineListener on_line, ExitListener on_exit) {
  if (!Valid()) return false;
  auto p = pool_->Find(key_, generation_);
  if (!p) return false;
  p->RemoveListener(listener_id_);
  listener_id_ = p->AddListener(std::move(on_line), std::move(on_exit));
  return true;
}

void ProcessHandle::Dispose() {
  if (disposed_) {
    std::cout << "[pool] warning double dispose server=" << server_name_ << " key=" << key_ << "\n";
    return;
  }
  if (!pool_) return;
  disposed_ = true;
  pool_->ReleaseReference(key_, generation_, server_name_, std::exchange(listener_id_, 0));
}

ProcessPool::ProcessPool() : ProcessPool(std::make_unique<PosixProcessLauncher>()) {}

ProcessPool::ProcessPool(std::unique_ptr<IProcessLauncher> launcher) : launcher_(std::move(launcher)) {}

ProcessPool::~ProcessPool() {
  ShutdownAll();
}

std::string ProcessPool::MakeProcessKey(const ProcessSpec& spec) {
  std::vector<std::string> env_pairs;
  env_pairs.reserve(spec.env.size());
  for (const auto& [k, v] : spec.env) env_pairs.push_back(k + "=" + v);
  std::sort(env_pairs.begin(), env_pairs.end());
  return spec.command + "::" + Join(spec.args, "|") + "::" + Join(env_pairs, "|");
}

std::optional<ProcessHandle> ProcessPool::Acquire(const std::string& server_name, const ProcessSpec& spec, std::string* err) {
  ReapRetired();
  const auto key = MakeProcessKey(spec);
  std::lock_guard<std::mutex> lock(mu_);

  auto it = processes_.find(key);
  if (it != processes_.end() && !it->second->Exited()) {
    auto& p = it->second;
    std::cout << "[pool] reuse server=" << server_name << " pid=" << p->Pid() << " key=" << key << "\n";
    p->AddReference(server_name);
    return ProcessHandle(this, key, p->Generation(), server_name, p->Pid());
  }

  std::cout << "[pool] spawn server=" << server_name << " command=" << spec.command << " args=" << Join(spec.args, " ")
            << "\n";
  std::string spawn_err;
  auto child = launcher_->Launch(spec, &spawn_err);
  if (!child) {
    std::cout << "[pool] spawn failed server=" << server_name << " error=" << spawn_err << "\n";
    if (err) *err = spawn_err.empty() ? "spawn failed" : spawn_err;
    return std::nullopt;
  }

  const uint64_t generation = next_generation_++;
  auto p = std::make_shared<ManagedProcess>(this, key, generation, spec, std::move(child));
  p->AddReference(server_name);
  if (it != processes_.end()) {
    retired_.push_back(std::move(it->second));
    processes_.erase(it);
  }
  processes_[key] = p;
  p->Start();
  std::cout << "[pool] registered pid=" << p->Pid() << " key=" << key << "\n";
  return ProcessHandle(this, key, generation, server_name, p->Pid());
}

void ProcessPool::Release(ProcessHandle* handle) {
  if (handle) handle->Dispose();
}

std::shared_ptr<ProcessPool::ManagedProcess> ProcessPool::Find(const std::string& key, uint64_t generation) {
  std::lock_guard<std::mutex> lock(mu_);
  auto it = processes_.find(key);
  if (it == processes_.end() || it->second->Generation() != generation) return nullptr;
  return it->second;
}

void ProcessPool::ReleaseReference(const std::string& key, uint64_t generation, const std::string& server_name,
                                   uint64_t listener_id) {
  std::shared_ptr<ManagedProcess> victim;
  {
    std::lock_guard<std::mutex> lock(mu_);
    auto it = processes_.find(key);
    if (it == processes_.end() || it->second->Generation() != generation) {
      auto rit = std::find_if(retired_.begin(), retired_.end(), [&](const std::shared_ptr<ManagedProcess>& p) {
        return p->Key() == key && p->Generation() == generation;
      });
      if (rit != retired_.end()) {
        // Replaced after exiting; its watcher may still be dispatching.
        (*rit)->RemoveListener(listener_id);
        (*rit)->DropReference(server_name);
      } else {
        std::cout << "[pool] release ignored server=" << server_name << " key=" << key << " reason=not_found\n";
      }
    } else {
      auto& p = it->second;
      p->RemoveListener(listener_id);
      if (p->DropReference(server_name) == 0) {
        victim = std::move(p);
        processes_.erase(it);
      }
    }
  }
  if (victim) {
    victim->Shutdown(terminate_grace_);
    victim.reset();
  }
  ReapRetired();
}

void ProcessPool::OnProcessExited(ManagedProcess* process) {
  std::lock_guard<std::mutex> lock(mu_);
  auto it = processes_.find(process->Key());
  if (it == processes_.end() || it->second.get() != process) return;
  std::cout << "[pool] cleanup key=" << process->Key() << " refs=" << process->RefCount() << "\n";
  retired_.push_back(std::move(it->second));
  processes_.erase(it);
}

void ProcessPool::ReapRetired(bool wait_for_watchers) {
  std::vector<std::shared_ptr<ManagedProcess>> dead;
  {
    std::lock_guard<std::mutex> lock(mu_);
    if (wait_for_watchers) {
      dead.swap(retired_);
    } else {
      auto split = std::stable_partition(retired_.begin(), retired_.end(),
                                         [](const std::shared_ptr<ManagedProcess>& p) { return !p->Finished(); });
      std::move(split, retired_.end(), std::back_inserter(dead));
      retired_.erase(split, retired_.end());
    }
  }
  dead.clear();
}

std::vector<ProcessInfo> ProcessPool::Stats() {
  std::vector<ProcessInfo> out;
  std::lock_guard<std::mutex> lock(mu_);
  out.reserve(processes_.size());
  for (const auto& [key, p] : processes_) {
    ProcessInfo info;
    info.process_key = key;
    info.pid = p->Pid();
    info.command = p->Spec().command;
    info.args = p->Spec().args;
    info.reference_count = p->RefCount();
    info.referencing_servers = p->Servers();
    out.push_back(std::move(info));
  }
  return out;
}

size_t ProcessPool::Size() {
  std::lock_guard<std::mutex> lock(mu_);
  return processes_.size();
}

void ProcessPool::ShutdownAll() {
  std::vector<std::shared_ptr<ManagedProcess>> all;
  {
    std::lock_guard<std::mutex> lock(mu_);
    for (auto& [_, p] : processes_) all.push_back(std::move(p));
    processes_.clear();
  }
  if (!all.empty()) std::cout << "[pool] shutdown processes=" << all.size() << "\n";
  for (auto& p : all) p->Shutdown(terminate_grace_);
  all.clear();
  ReapRetired(true);
}

}  // namespace toolagent
