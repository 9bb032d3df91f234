#include <bundler/task_coordinator.h>

#include <bundler/errors.h>

#include <stdexcept>
#include <type_traits>
#include <utility>

namespace bundler {

std::string TaskStateName(TaskState state) {
  switch (state) {
  case TaskState::kPending:
    return "pending";
  case TaskState::kRunning:
    return "running";
  case TaskState::kSucceeded:
    return "succeeded";
  case TaskState::kFinalized:
    return "finalized";
  case TaskState::kFailed:
    return "failed";
  }
  return "unknown";
}

void ApplyFinalization(const Finalization &finalization,
                       FilesystemActions &actions) {
  std::visit(
      [&](const auto &data) {
        using Data = std::decay_t<decltype(data)>;
        if constexpr (std::is_same_v<Data, SnapshotAndStamp>) {
          actions.WriteFile(data.snapshot.file, data.snapshot.content);
          actions.WriteStamp(data.stamp);
        } else if constexpr (std::is_same_v<Data, StampOnly>) {
          actions.WriteStamp(data.stamp);
        }
      },
      finalization);
}

Task::Task(std::string name, StageKind kind, Finalization finalization)
    : name_(std::move(name)), kind_(kind),
      finalization_(std::move(finalization)) {}

void Task::Expect(TaskState expected, const char *operation) const {
  if (state_ != expected) {
    throw std::logic_error(std::string("Task '") + name_ + "' cannot " +
                           operation + " while " + TaskStateName(state_));
  }
}

void Task::Start(std::unique_ptr<RunningProcess> process) {
  Expect(TaskState::kPending, "start");
  if (!process) {
    throw std::invalid_argument("Task '" + name_ + "' started without a process");
  }
  process_ = std::move(process);
  state_ = TaskState::kRunning;
}

ExitStatus Task::Wait() {
  Expect(TaskState::kRunning, "be waited on");
  status_ = process_->Wait();
  process_.reset();
  state_ = status_.Success() ? TaskState::kSucceeded : TaskState::kFailed;
  return status_;
}

void Task::Finalize(FilesystemActions &actions) {
  Expect(TaskState::kSucceeded, "be finalized");
  ApplyFinalization(finalization_, actions);
  state_ = TaskState::kFinalized;
}

TaskCoordinator::TaskCoordinator(FilesystemActions &actions,
                                 std::shared_ptr<Logger> logger)
    : actions_(&actions), logger_(EnsureLogger(std::move(logger))) {}

void TaskCoordinator::Register(Task task) {
  if (task.State() != TaskState::kRunning) {
    throw std::logic_error("Only running tasks can be registered: " +
                           task.Name());
  }
  logger_->Log(LogLevel::kDebug, "Registered task",
               {{"task", task.Name()},
                {"position", std::to_string(tasks_.size())}});
  tasks_.push_back(std::move(task));
}

void TaskCoordinator::WaitAll() {
  while (next_ < tasks_.size()) {
    auto &task = tasks_[next_];
    ++next_;

    logger_->Log(LogLevel::kInfo, "Waiting for " + task.Name() + "...");
    const auto status = task.Wait();
    if (!status.Success()) {
      outcomes_.push_back(
          TaskOutcome{task.Name(), task.Kind(), task.State(), status});
      logger_->Log(LogLevel::kDebug, "Task failed",
                   {{"task", task.Name()}, {"status", status.Describe()},
                    {"unresolved", std::to_string(Unresolved())}});
      throw TaskFailed(task.Name(), status);
    }

    task.Finalize(*actions_);
    outcomes_.push_back(
        TaskOutcome{task.Name(), task.Kind(), task.State(), status});
    logger_->Log(LogLevel::kInfo, task.Name() + " completed");
  }
}

} // namespace bundler
