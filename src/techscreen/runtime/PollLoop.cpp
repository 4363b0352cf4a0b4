#include <techscreen/runtime/PollLoop.hpp>

#include <utility>
#include <vector>

namespace TS::Runtime {

struct PollLoop::Tasks {
    std::uint64_t                 next_id = 1;
    std::map<std::uint64_t, Task> entries;
};

PollLoop::Handle::Handle(Handle&& other) noexcept
    : tasks_(std::move(other.tasks_)), id_(std::exchange(other.id_, 0)) {}

auto PollLoop::Handle::operator=(Handle&& other) noexcept -> Handle& {
    if (this != &other) {
        cancel();
        tasks_ = std::move(other.tasks_);
        id_    = std::exchange(other.id_, 0);
    }
    return *this;
}

PollLoop::Handle::~Handle() {
    cancel();
}

void PollLoop::Handle::cancel() {
    if (auto tasks = tasks_.lock()) {
        tasks->entries.erase(id_);
    }
    tasks_.reset();
    id_ = 0;
}

auto PollLoop::Handle::scheduled() const -> bool {
    auto tasks = tasks_.lock();
    return tasks && tasks->entries.contains(id_);
}

PollLoop::PollLoop()
    : tasks_(std::make_shared<Tasks>()) {}

auto PollLoop::schedule(Task task) -> Handle {
    auto const id = tasks_->next_id++;
    tasks_->entries.emplace(id, std::move(task));
    return Handle{tasks_, id};
}

auto PollLoop::runOnce(Route::TimePoint now) -> std::size_t {
    std::vector<std::uint64_t> ids;
    ids.reserve(tasks_->entries.size());
    for (auto const& [id, task] : tasks_->entries) {
        ids.push_back(id);
    }

    std::size_t ran = 0;
    for (auto const id : ids) {
        // A task may cancel others (or itself) while running.
        auto it = tasks_->entries.find(id);
        if (it == tasks_->entries.end()) {
            continue;
        }
        auto task = it->second;
        ++ran;
        if (!task(now)) {
            tasks_->entries.erase(id);
        }
    }
    return ran;
}

auto PollLoop::size() const -> std::size_t {
    return tasks_->entries.size();
}

} // namespace TS::Runtime
