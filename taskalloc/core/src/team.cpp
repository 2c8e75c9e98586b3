#include <taskalloc/core/team.hpp>
#include <taskalloc/core/error.hpp>

#include <algorithm>
#include <utility>

namespace taskalloc::core {

Member& Team::add_member(Member member) {
    if (find_member(member.id()) != nullptr) {
        throw DuplicateIdError("duplicate member id '" + member.id() + "'");
    }
    members_.push_back(std::move(member));
    return members_.back();
}

Task& Team::add_task(Task task) {
    if (find_task(task.id()) != nullptr) {
        throw DuplicateIdError("duplicate task id '" + task.id() + "'");
    }
    tasks_.push_back(std::move(task));
    return tasks_.back();
}

void Team::remove_member(const std::string& id) {
    auto it = std::find_if(members_.begin(), members_.end(),
                           [&](const Member& m) { return m.id() == id; });
    if (it == members_.end()) {
        throw NotFoundError("no member with id '" + id + "'");
    }
    members_.erase(it);

    for (auto& task : tasks_) {
        if (task.assigned_member() == id) {
            task.clear_assignment();
        }
    }
}

void Team::remove_task(const std::string& id) {
    auto it = std::find_if(tasks_.begin(), tasks_.end(),
                           [&](const Task& t) { return t.id() == id; });
    if (it == tasks_.end()) {
        throw NotFoundError("no task with id '" + id + "'");
    }
    tasks_.erase(it);
}

Member* Team::find_member(const std::string& id) {
    auto it = std::find_if(members_.begin(), members_.end(),
                           [&](const Member& m) { return m.id() == id; });
    return it != members_.end() ? &*it : nullptr;
}

const Member* Team::find_member(const std::string& id) const {
    auto it = std::find_if(members_.begin(), members_.end(),
                           [&](const Member& m) { return m.id() == id; });
    return it != members_.end() ? &*it : nullptr;
}

Task* Team::find_task(const std::string& id) {
    auto it = std::find_if(tasks_.begin(), tasks_.end(),
                           [&](const Task& t) { return t.id() == id; });
    return it != tasks_.end() ? &*it : nullptr;
}

const Task* Team::find_task(const std::string& id) const {
    auto it = std::find_if(tasks_.begin(), tasks_.end(),
                           [&](const Task& t) { return t.id() == id; });
    return it != tasks_.end() ? &*it : nullptr;
}

void reset_workloads(Team& team) noexcept {
    for (auto& member : team.members()) {
        member.reset_workload();
    }
    for (auto& task : team.tasks()) {
        task.clear_assignment();
    }
}

} // namespace taskalloc::core
