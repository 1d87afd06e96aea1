#pragma once

#include <map>
#include <memory>
#include <string>
#include <vector>

namespace toolagent {

struct ProcessSpec {
  std::string command;
  std::vector<std::string> args;
  std::map<std::string, std::string> env;
};

// One running OS process with piped stdin/stdout/stderr.
// Each Read* method is called from a single dedicated thread.
class IChildProcess {
 public:
  virtual ~IChildProcess() = default;

  virtual int Pid() const = 0;
  virtual bool WriteStdin(const std::string& data, std::string* err) = 0;
  // Blocks until a full line is available. Returns false at end of stream.
  virtual bool ReadStdoutLine(std::string* line) = 0;
  virtual bool ReadStderrLine(std::string* line) = 0;
  virtual void Terminate() = 0;
  virtual void Kill() = 0;
  // Blocks until the process has exited and returns its exit code.
  virtual int WaitForExit() = 0;
};

class IProcessLauncher {
 public:
  virtual ~IProcessLauncher() = default;
  virtual std::unique_ptr<IChildProcess> Launch(const ProcessSpec& spec, std::string* err) = 0;
};

class PosixProcessLauncher : public IProcessLauncher {
 public:
  PosixProcessLauncher();
  std::unique_ptr<IChildProcess> Launch(const ProcessSpec& spec, std::string* err) override;
};

}  // namespace toolagent
