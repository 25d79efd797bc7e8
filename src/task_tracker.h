#pragma once
#include <cstdint>
#include <string>
#include <vector>

#include "api_client.h"
#include "errors.h"
#include "upload_types.h"

namespace mfs {

TaskStatus classify_status(const std::string& status);
const char* task_status_name(TaskStatus s);
// 0..100
int display_progress(const UploadTask& t);

// Locally cached listing of the caller's backend tasks.
struct TaskListState {
    std::vector<UploadTask> tasks;
    int64_t cursor{0};
    bool    has_more{false};
    bool    loaded{false};
};

class TaskTracker {
public:
    TaskTracker(UploaderApi& api, std::string address, int page_size = 10);

    // Replaces the list with the first page.
    bool load(Error& e);
    // Appends the next page. Refused (InvalidInput) when the backend reported no more.
    bool load_more(Error& e);

    const TaskListState& state() const { return state_; }
    const UploadTask* find(const std::string& task_id) const;

private:
    UploaderApi& api_;
    std::string address_;
    int page_size_;
    TaskListState state_;

    void append(std::vector<UploadTask>&& page);
};

}
