/**
 * @file scheduler.cpp
 * @brief Scheduler implementation
 *
 * @details Implements the task table and its worker pool:
 *
 *          - Fixed pool of `bound` worker threads, each running one task at
 *            a time
 *
 *          - All record mutations under one mutex; executors run outside it
 *
 *          - Snapshots are stamped (batch position, elapsed, ETA) and
 *            replaced wholesale, then pushed to listeners outside the lock
 */

#include "crf_target/scheduler.hpp"

#include <algorithm>
#include <exception>
#include <filesystem>
#include <utility>

#include <fmt/core.h>

#include "crf_target/logging.hpp"
#include "crf_target/system.hpp"

namespace crf_target {

namespace fs = std::filesystem;

// **---- EntryReporter ----**

/**
 * @class Scheduler::EntryReporter
 * @brief Routes one running task's reports into its record.
 */
class Scheduler::EntryReporter : public TaskReporter {
  Scheduler &owner;
  std::string id;

public:
  EntryReporter(Scheduler &scheduler, std::string task_id)
      : owner(scheduler), id(std::move(task_id)) {}

  void progress(const ProgressSnapshot &snapshot) override {
    owner.publish(id, snapshot);
  }

  void warning(const Status &status) override {
    std::lock_guard<std::mutex> lock(owner.mutex);
    auto it = owner.entries.find(id);
    if (it != owner.entries.end())
      it->second.task.warnings.push_back(status.describe());
  }

  void selected(int quality, double score) override {
    std::lock_guard<std::mutex> lock(owner.mutex);
    auto it = owner.entries.find(id);
    if (it != owner.entries.end()) {
      it->second.task.selected_quality = quality;
      it->second.task.selected_score = score;
    }
  }
};

// **---- Construction ----**

Scheduler::Scheduler(TaskExecutor &task_executor, int max_concurrent)
    : executor(task_executor), bound(std::max(1, max_concurrent)) {
  workers.reserve(bound);
  for (int i = 0; i < bound; ++i)
    workers.emplace_back(&Scheduler::worker_loop, this, i);
}

Scheduler::~Scheduler() { shutdown(); }

std::string Scheduler::generate_id() {
  std::string id;
  do {
    id = fmt::format("task-{:04d}", ++next_id);
  } while (entries.count(id) != 0);
  return id;
}

// **---- Queue management ----**

Status Scheduler::enqueue(const std::string &id, const TaskConfig &config,
                          std::string *assigned_id) {
  Status st = validate(config);
  if (!st.is_ok())
    return st;

  std::lock_guard<std::mutex> lock(mutex);
  if (stopping)
    return Status(ErrorCode::InvalidState, "scheduler is shut down");

  std::string task_id = id.empty() ? generate_id() : id;
  if (entries.count(task_id) != 0) {
    return Status(ErrorCode::DuplicateTask,
                  fmt::format("task {} already exists", task_id));
  }

  Entry entry;
  entry.task.id = task_id;
  entry.task.config = config;
  entry.task.status = TaskStatus::Queued;
  entry.task.progress.task_id = task_id;
  entry.task.progress.current_file_name =
      fs::path(config.input_path).filename().string();

  entries.emplace(task_id, std::move(entry));
  order.push_back(task_id);
  if (assigned_id)
    *assigned_id = task_id;

  LOG_DEBUG("[Task {}] Queued {}", task_id, config.input_path);
  return Status::ok();
}

Status Scheduler::remove(const std::string &id) {
  std::lock_guard<std::mutex> lock(mutex);
  auto it = entries.find(id);
  if (it == entries.end())
    return Status(ErrorCode::NotFound, fmt::format("no task {}", id));
  TaskStatus status = it->second.task.status;
  if (status == TaskStatus::Running) {
    return Status(ErrorCode::InvalidState,
                  fmt::format("task {} is running; cancel it instead", id));
  }
  if (status != TaskStatus::Queued) {
    return Status(ErrorCode::InvalidState,
                  fmt::format("task {} is {}; only queued tasks can be removed",
                              id, to_string(status)));
  }

  entries.erase(it);
  order.erase(std::remove(order.begin(), order.end(), id), order.end());
  ready.erase(std::remove(ready.begin(), ready.end(), id), ready.end());
  state_cv.notify_all();
  return Status::ok();
}

Status Scheduler::start(const std::string &id) {
  {
    std::lock_guard<std::mutex> lock(mutex);
    if (stopping)
      return Status(ErrorCode::InvalidState, "scheduler is shut down");

    auto it = entries.find(id);
    if (it == entries.end())
      return Status(ErrorCode::NotFound, fmt::format("no task {}", id));

    Task &task = it->second.task;
    if (task.status != TaskStatus::Queued) {
      return Status(ErrorCode::InvalidState,
                    fmt::format("task {} is {}", id, to_string(task.status)));
    }
    if (task.start_requested)
      return Status::ok();

    task.start_requested = true;
    ready.push_back(id);
  }
  work_cv.notify_one();
  return Status::ok();
}

void Scheduler::start_all() {
  {
    std::lock_guard<std::mutex> lock(mutex);
    if (stopping)
      return;
    for (const auto &id : order) {
      auto it = entries.find(id);
      if (it == entries.end())
        continue;
      Task &task = it->second.task;
      if (task.status == TaskStatus::Queued && !task.start_requested) {
        task.start_requested = true;
        ready.push_back(id);
      }
    }
  }
  work_cv.notify_all();
}

Status Scheduler::cancel(const std::string &id) {
  std::unique_lock<std::mutex> lock(mutex);
  auto it = entries.find(id);
  if (it == entries.end())
    return Status(ErrorCode::NotFound, fmt::format("no task {}", id));

  Task &task = it->second.task;
  switch (task.status) {
  case TaskStatus::Queued:
    task.status = TaskStatus::Cancelled;
    task.start_requested = false;
    ready.erase(std::remove(ready.begin(), ready.end(), id), ready.end());
    LOG_INFO("[Task {}] Cancelled while queued", id);
    state_cv.notify_all();
    return Status::ok();

  case TaskStatus::Running: {
    LOG_INFO("[Task {}] Cancelling...", id);
    it->second.token->cancel();

    /// The worker reaps processes and deletes temp files before it
    /// changes the status
    state_cv.wait(lock, [this, &id] {
      auto e = entries.find(id);
      return e == entries.end() || e->second.task.status != TaskStatus::Running;
    });

    auto e = entries.find(id);
    if (e == entries.end() || e->second.task.status == TaskStatus::Cancelled)
      return Status::ok();
    return Status(ErrorCode::InvalidState,
                  fmt::format("task {} finished as {} before cancellation", id,
                              to_string(e->second.task.status)));
  }

  case TaskStatus::Cancelled:
    return Status::ok();

  case TaskStatus::Completed:
  case TaskStatus::Failed:
  default:
    return Status(ErrorCode::InvalidState,
                  fmt::format("task {} already {}", id,
                              to_string(task.status)));
  }
}

// **---- Views ----**

std::vector<Task> Scheduler::list() const {
  std::lock_guard<std::mutex> lock(mutex);
  std::vector<Task> out;
  out.reserve(order.size());
  for (const auto &id : order)
    out.push_back(entries.at(id).task);
  return out;
}

Status Scheduler::progress(const std::string &id,
                           ProgressSnapshot &out) const {
  std::lock_guard<std::mutex> lock(mutex);
  auto it = entries.find(id);
  if (it == entries.end())
    return Status(ErrorCode::NotFound, fmt::format("no task {}", id));
  out = it->second.task.progress;
  return Status::ok();
}

std::vector<ProgressSnapshot> Scheduler::progress_all() const {
  std::lock_guard<std::mutex> lock(mutex);
  std::vector<ProgressSnapshot> out;
  out.reserve(order.size());
  for (const auto &id : order)
    out.push_back(entries.at(id).task.progress);
  return out;
}

int Scheduler::subscribe(ProgressListener listener) {
  std::lock_guard<std::mutex> lock(mutex);
  int handle = next_listener++;
  listeners.emplace(handle, std::move(listener));
  return handle;
}

void Scheduler::unsubscribe(int handle) {
  std::lock_guard<std::mutex> lock(mutex);
  listeners.erase(handle);
}

void Scheduler::publish(const std::string &id,
                        const ProgressSnapshot &snapshot) {
  ProgressSnapshot stamped = snapshot;
  std::vector<ProgressListener> targets;
  {
    std::lock_guard<std::mutex> lock(mutex);
    auto it = entries.find(id);
    if (it == entries.end())
      return;

    Entry &e = it->second;
    stamped.task_id = id;
    if (stamped.current_file_name.empty())
      stamped.current_file_name = e.task.progress.current_file_name;
    stamped.current_file_count = e.task.progress.current_file_count;
    stamped.total_files = e.task.progress.total_files;
    stamped.elapsed_sec = std::chrono::duration<double>(
                              std::chrono::steady_clock::now() - e.started_at)
                              .count();
    stamped.eta = format_eta(stamped.fps, stamped.current_frame,
                             stamped.total_frames);
    e.task.progress = stamped;

    targets.reserve(listeners.size());
    for (const auto &l : listeners)
      targets.push_back(l.second);
  }

  for (const auto &listener : targets)
    listener(stamped);
}

// **---- Folder batches ----**

Status Scheduler::submit_folder(const std::string &root,
                                const std::string &output_dir,
                                const TaskConfig &config_template,
                                std::vector<std::string> &ids) {
  ids.clear();

  std::vector<std::string> files;
  Status st = scan_all(root, scan_counter, files);
  if (!st.is_ok())
    return st;

  LOG_INFO("Found {} media files under {}", files.size(), root);

  const uint64_t total = files.size();
  for (uint64_t i = 0; i < total; ++i) {
    TaskConfig config = config_template;
    config.input_path = files[i];
    /// Mirror the input's subfolder so equal stems never share an output
    fs::path rel = fs::path(files[i]).lexically_relative(root).parent_path();
    if (rel.empty() || rel == "." || *rel.begin() == "..")
      rel.clear();
    config.output_path = (fs::path(output_dir) / rel /
                          output_file_name(files[i], config_template))
                             .string();

    std::string id;
    st = enqueue("", config, &id);
    if (!st.is_ok()) {
      LOG_ERROR("Cannot queue {}: {}", files[i], st.describe());
      return st;
    }

    ids.push_back(id);
    std::lock_guard<std::mutex> lock(mutex);
    auto it = entries.find(id);
    if (it == entries.end())
      continue;
    ProgressSnapshot &p = it->second.task.progress;
    p.current_file_count = i + 1;
    p.total_files = total;
  }
  return Status::ok();
}

// **---- Lifecycle ----**

int Scheduler::running_count() const {
  std::lock_guard<std::mutex> lock(mutex);
  return running;
}

void Scheduler::wait_idle() {
  std::unique_lock<std::mutex> lock(mutex);
  state_cv.wait(lock, [this] {
    return running == 0 && (ready.empty() || stopping);
  });
}

void Scheduler::shutdown() {
  {
    std::lock_guard<std::mutex> lock(mutex);
    stopping = true;
    for (auto &kv : entries) {
      if (kv.second.task.status == TaskStatus::Running && kv.second.token)
        kv.second.token->cancel();
    }
    for (const auto &id : ready) {
      auto it = entries.find(id);
      if (it != entries.end())
        it->second.task.start_requested = false;
    }
    ready.clear();
  }
  work_cv.notify_all();
  state_cv.notify_all();

  for (auto &w : workers) {
    if (w.joinable())
      w.join();
  }
  workers.clear();
}

void Scheduler::worker_loop(int worker_id) {
  for (;;) {
    std::string id;
    TaskConfig config;
    CancelTokenPtr token;
    {
      std::unique_lock<std::mutex> lock(mutex);
      work_cv.wait(lock, [this] { return stopping || !ready.empty(); });
      if (stopping)
        return;

      id = ready.front();
      ready.pop_front();
      auto it = entries.find(id);
      if (it == entries.end() || it->second.task.status != TaskStatus::Queued ||
          !it->second.task.start_requested)
        continue;

      Entry &e = it->second;
      e.task.status = TaskStatus::Running;
      e.task.start_requested = false;
      e.token = CancelToken::create();
      e.started_at = std::chrono::steady_clock::now();
      config = e.task.config;
      token = e.token;
      running++;
    }

    LOG_PHASE("[Task {}] Started on worker {}", id, worker_id);

    EntryReporter reporter(*this, id);
    Status st;
    try {
      st = executor.execute(id, config, reporter, token);
    } catch (const std::exception &e) {
      st = Status(ErrorCode::InvalidState,
                  fmt::format("unexpected exception: {}", e.what()));
    }

    TaskStatus final_status;
    if (st.is_ok()) {
      final_status = TaskStatus::Completed;
    } else if (st.is_cancelled() || token->is_cancelled()) {
      final_status = TaskStatus::Cancelled;
    } else {
      final_status = TaskStatus::Failed;
    }

    {
      std::lock_guard<std::mutex> lock(mutex);
      auto it = entries.find(id);
      if (it != entries.end()) {
        it->second.task.status = final_status;
        if (final_status == TaskStatus::Failed)
          it->second.task.error = st.describe();
      }
      running--;
    }
    state_cv.notify_all();

    switch (final_status) {
    case TaskStatus::Completed:
      LOG_SUCCESS("[Task {}] Completed", id);
      break;
    case TaskStatus::Cancelled:
      LOG_WARN("[Task {}] Cancelled", id);
      break;
    default:
      LOG_ERROR("[Task {}] Failed: {}", id, st.describe());
      break;
    }
  }
}

} // namespace crf_target
