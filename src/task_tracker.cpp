#include "task_tracker.h"
#include "log.h"
#include "util.h"

#include <algorithm>
#include <unordered_set>

namespace mfs {

TaskStatus classify_status(const std::string& status) {
    const std::string s = to_lower(status);
    if (s == "success") return TaskStatus::Success;
    if (s == "failed") return TaskStatus::Failed;
    if (s == "processing") return TaskStatus::Processing;
    return TaskStatus::Pending;
}

const char* task_status_name(TaskStatus s) {
    switch (s) {
        case TaskStatus::Pending:    return "pending";
        case TaskStatus::Processing: return "processing";
        case TaskStatus::Success:    return "success";
        case TaskStatus::Failed:     return "failed";
    }
    return "pending";
}

int display_progress(const UploadTask& t) {
    return std::min(std::max(t.progress, 0), 100);
}

TaskTracker::TaskTracker(UploaderApi& api, std::string address, int page_size)
    : api_(api), address_(std::move(address)), page_size_(page_size > 0 ? page_size : 10) {}

bool TaskTracker::load(Error& e) {
    TaskPage page;
    if (!api_.list_tasks(address_, 0, page_size_, page, e)) return false;
    state_.tasks.clear();
    append(std::move(page.tasks));
    state_.cursor = page.next_cursor;
    state_.has_more = page.has_more;
    state_.loaded = true;
    log_debug(LogCategory::TASK, "tasks: loaded " + std::to_string(state_.tasks.size()) +
              (state_.has_more ? " (more available)" : ""));
    return true;
}

bool TaskTracker::load_more(Error& e) {
    if (!state_.has_more) return fail(e, ErrKind::InvalidInput, "No more tasks");
    TaskPage page;
    if (!api_.list_tasks(address_, state_.cursor, page_size_, page, e)) return false;
    append(std::move(page.tasks));
    // a cursor that does not move would page forever
    const bool stuck = page.next_cursor == state_.cursor;
    state_.cursor = page.next_cursor;
    state_.has_more = page.has_more && !stuck;
    if (stuck && page.has_more) log_warn(LogCategory::TASK, "tasks: cursor did not advance, paging stopped");
    return true;
}

void TaskTracker::append(std::vector<UploadTask>&& page) {
    std::unordered_set<std::string> seen;
    for (const auto& t : state_.tasks) seen.insert(t.task_id);
    for (auto& t : page) {
        if (!t.task_id.empty() && !seen.insert(t.task_id).second) continue;
        state_.tasks.push_back(std::move(t));
    }
}

const UploadTask* TaskTracker::find(const std::string& task_id) const {
    for (const auto& t : state_.tasks) if (t.task_id == task_id) return &t;
    return nullptr;
}

}
