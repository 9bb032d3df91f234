#include <bundler/posix_command_runner.h>

#include <bundler/errors.h>

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <iostream>
#include <stdexcept>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>

extern char **environ;

namespace bundler {
namespace {

// Written by the child to the close-on-exec pipe when launch fails.
struct LaunchFailure {
  int step = 0;
  int error = 0;
};

constexpr int kStepChdir = 1;
constexpr int kStepExec = 2;

std::vector<std::string> ChildEnvironment(
    const std::vector<std::pair<std::string, std::string>> &overrides) {
  std::vector<std::string> entries;
  for (char **entry = environ; entry != nullptr && *entry != nullptr;
       ++entry) {
    const std::string_view text(*entry);
    const auto separator = text.find('=');
    const auto key = text.substr(0, separator);
    bool overridden = false;
    for (const auto &[name, value] : overrides) {
      if (name == key) {
        overridden = true;
        break;
      }
    }
    if (!overridden) {
      entries.emplace_back(text);
    }
  }
  for (const auto &[name, value] : overrides) {
    entries.push_back(name + "=" + value);
  }
  return entries;
}

std::vector<char *> ToPointers(std::vector<std::string> &values) {
  std::vector<char *> pointers;
  pointers.reserve(values.size() + 1);
  for (auto &value : values) {
    pointers.push_back(value.data());
  }
  pointers.push_back(nullptr);
  return pointers;
}

void WriteFailure(int fd, int step) {
  const LaunchFailure failure{step, errno};
  const auto written = write(fd, &failure, sizeof(failure));
  (void)written;
  _exit(127);
}

void RedirectToDevNull() {
  const int null_fd = open("/dev/null", O_WRONLY);
  if (null_fd < 0) {
    return;
  }
  dup2(null_fd, STDOUT_FILENO);
  dup2(null_fd, STDERR_FILENO);
  close(null_fd);
}

bool IsExecutableFile(const std::filesystem::path &path) {
  std::error_code error;
  return std::filesystem::is_regular_file(path, error) &&
         access(path.c_str(), X_OK) == 0;
}

} // namespace

PosixProcess::PosixProcess(pid_t pid) : pid_(pid) {}

ExitStatus PosixProcess::Wait() {
  if (waited_) {
    throw std::logic_error("Process " + std::to_string(pid_) +
                           " was already waited on");
  }
  int status = 0;
  while (waitpid(pid_, &status, 0) == -1) {
    if (errno != EINTR) {
      throw std::system_error(errno, std::generic_category(),
                              "waitpid " + std::to_string(pid_));
    }
  }
  waited_ = true;
  if (WIFEXITED(status)) {
    return ExitStatus::Exited(WEXITSTATUS(status));
  }
  if (WIFSIGNALED(status)) {
    return ExitStatus::Signaled(WTERMSIG(status));
  }
  return ExitStatus::Exited(status);
}

PosixCommandRunner::PosixCommandRunner(std::string search_path,
                                       std::shared_ptr<Logger> logger)
    : search_path_(std::move(search_path)),
      logger_(EnsureLogger(std::move(logger))) {}

std::optional<std::filesystem::path>
PosixCommandRunner::FindProgram(const std::string &name) const {
  if (name.find('/') != std::string::npos) {
    if (IsExecutableFile(name)) {
      return std::filesystem::path(name);
    }
    return std::nullopt;
  }

  std::size_t start = 0;
  while (start <= search_path_.size()) {
    auto end = search_path_.find(':', start);
    if (end == std::string::npos) {
      end = search_path_.size();
    }
    const auto directory = search_path_.substr(start, end - start);
    const auto candidate =
        std::filesystem::path(directory.empty() ? "." : directory) / name;
    if (IsExecutableFile(candidate)) {
      return candidate;
    }
    start = end + 1;
  }
  return std::nullopt;
}

pid_t PosixCommandRunner::Launch(const Command &command) {
  // Resolved against the captured search path, not the child's PATH.
  const auto found = FindProgram(command.program);
  if (!found) {
    throw ExecutableNotFound(command.program);
  }
  // The child changes directory before exec.
  const auto executable = std::filesystem::absolute(*found);

  std::vector<std::string> argv_storage;
  argv_storage.push_back(command.program);
  argv_storage.insert(argv_storage.end(), command.args.begin(),
                      command.args.end());
  auto argv = ToPointers(argv_storage);
  auto env_storage = ChildEnvironment(command.env);
  auto envp = ToPointers(env_storage);

  int pipe_fds[2];
  if (pipe(pipe_fds) != 0) {
    throw std::system_error(errno, std::generic_category(), "pipe");
  }
  fcntl(pipe_fds[0], F_SETFD, FD_CLOEXEC);
  fcntl(pipe_fds[1], F_SETFD, FD_CLOEXEC);

  // Buffered output would otherwise be duplicated into the child.
  std::cout.flush();
  std::cerr.flush();
  std::fflush(nullptr);

  const pid_t pid = fork();
  if (pid == -1) {
    const int error = errno;
    close(pipe_fds[0]);
    close(pipe_fds[1]);
    throw std::system_error(error, std::generic_category(),
                            "fork " + command.program);
  }

  if (pid == 0) {
    close(pipe_fds[0]);
    if (command.cwd && chdir(command.cwd->c_str()) != 0) {
      WriteFailure(pipe_fds[1], kStepChdir);
    }
    if (command.quiet) {
      RedirectToDevNull();
    }
    environ = envp.data();
    execv(executable.c_str(), argv.data());
    WriteFailure(pipe_fds[1], kStepExec);
  }

  close(pipe_fds[1]);
  LaunchFailure failure;
  ssize_t received = 0;
  do {
    received = read(pipe_fds[0], &failure, sizeof(failure));
  } while (received == -1 && errno == EINTR);
  close(pipe_fds[0]);

  if (received == static_cast<ssize_t>(sizeof(failure))) {
    int ignored = 0;
    while (waitpid(pid, &ignored, 0) == -1 && errno == EINTR) {
    }
    if (failure.step == kStepChdir) {
      throw FilesystemError("change directory to", *command.cwd);
    }
    if (failure.error == ENOENT || failure.error == EACCES ||
        failure.error == ENOTDIR) {
      throw ExecutableNotFound(command.program);
    }
    throw std::system_error(failure.error, std::generic_category(),
                            "exec " + command.program);
  }

  logger_->Log(LogLevel::kDebug, "Launched process",
               {{"program", command.program}, {"pid", std::to_string(pid)}});
  return pid;
}

ExitStatus PosixCommandRunner::Run(const Command &command) {
  PosixProcess process(Launch(command));
  return process.Wait();
}

std::unique_ptr<RunningProcess>
PosixCommandRunner::Spawn(const Command &command) {
  return std::make_unique<PosixProcess>(Launch(command));
}

} // namespace bundler
