#pragma once

#include <bundler/dry_run_planner.h>
#include <bundler/interfaces.h>
#include <bundler/logging.h>
#include <bundler/models.h>

#include <cstddef>
#include <filesystem>
#include <memory>
#include <string>
#include <variant>
#include <vector>

namespace bundler {

// What to write once a task's process is confirmed successful.
struct SnapshotAndStamp {
  ParameterSnapshot snapshot;
  std::filesystem::path stamp;
};

struct StampOnly {
  std::filesystem::path stamp;
};

struct NoFinalization {};

using Finalization = std::variant<SnapshotAndStamp, StampOnly, NoFinalization>;

// Writes the snapshot before the stamp.
void ApplyFinalization(const Finalization &finalization,
                       FilesystemActions &actions);

enum class TaskState { kPending, kRunning, kSucceeded, kFinalized, kFailed };

std::string TaskStateName(TaskState state);

// Pending -> Running -> {Succeeded -> Finalized | Failed}
class Task {
public:
  Task(std::string name, StageKind kind, Finalization finalization);

  void Start(std::unique_ptr<RunningProcess> process);
  ExitStatus Wait();
  void Finalize(FilesystemActions &actions);

  const std::string &Name() const { return name_; }
  StageKind Kind() const { return kind_; }
  TaskState State() const { return state_; }
  const ExitStatus &Status() const { return status_; }
  const Finalization &FinalizationData() const { return finalization_; }

private:
  void Expect(TaskState expected, const char *operation) const;

  std::string name_;
  StageKind kind_;
  Finalization finalization_;
  std::unique_ptr<RunningProcess> process_;
  TaskState state_ = TaskState::kPending;
  ExitStatus status_;
};

struct TaskOutcome {
  std::string name;
  StageKind kind = StageKind::kFrontendBuild;
  TaskState state = TaskState::kPending;
  ExitStatus status;
};

// Owns the tasks of one run and resolves them in registration order.
// On a failure the remaining tasks are neither signalled nor waited on.
class TaskCoordinator {
public:
  TaskCoordinator(FilesystemActions &actions,
                  std::shared_ptr<Logger> logger = nullptr);

  void Register(Task task);
  // Throws TaskFailed for the first failed task in registration order.
  void WaitAll();

  std::size_t Registered() const { return tasks_.size(); }
  std::size_t Unresolved() const { return tasks_.size() - next_; }
  const std::vector<TaskOutcome> &Outcomes() const { return outcomes_; }

private:
  FilesystemActions *actions_;
  std::shared_ptr<Logger> logger_;
  std::vector<Task> tasks_;
  std::size_t next_ = 0;
  std::vector<TaskOutcome> outcomes_;
};

} // namespace bundler
