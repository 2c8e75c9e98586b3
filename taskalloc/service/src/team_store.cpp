#include <taskalloc/service/team_store.hpp>

#include <taskalloc/algo/greedy_allocator.hpp>

#include <utility>

namespace taskalloc::service {

TeamStore::TeamStore()
    : TeamStore(core::Team{}) {}

TeamStore::TeamStore(core::Team team, std::unique_ptr<algo::Allocator> allocator)
    : team_(std::move(team))
    , allocator_(std::move(allocator)) {
    if (!allocator_) {
        allocator_ = std::make_unique<algo::GreedyAllocator>();
    }
}

core::Team TeamStore::snapshot() const {
    std::lock_guard lock(mutex_);
    return team_;
}

std::vector<core::Member> TeamStore::members() const {
    std::lock_guard lock(mutex_);
    auto members = team_.members();
    return {members.begin(), members.end()};
}

std::vector<core::Task> TeamStore::tasks() const {
    std::lock_guard lock(mutex_);
    auto tasks = team_.tasks();
    return {tasks.begin(), tasks.end()};
}

void TeamStore::replace(core::Team team) {
    std::lock_guard lock(mutex_);
    team_ = std::move(team);
}

void TeamStore::add_member(core::Member member) {
    std::lock_guard lock(mutex_);
    team_.add_member(std::move(member));
}

void TeamStore::add_task(core::Task task) {
    std::lock_guard lock(mutex_);
    team_.add_task(std::move(task));
}

void TeamStore::remove_member(const std::string& id) {
    std::lock_guard lock(mutex_);
    team_.remove_member(id);
}

void TeamStore::remove_task(const std::string& id) {
    std::lock_guard lock(mutex_);
    team_.remove_task(id);
}

io::AllocationReport TeamStore::allocate() {
    std::lock_guard lock(mutex_);
    auto result = allocator_->allocate(team_);
    auto report = io::build_report(result);
    team_ = std::move(result.state);
    return report;
}

void TeamStore::reset() {
    std::lock_guard lock(mutex_);
    core::reset_workloads(team_);
}

void TeamStore::set_trace_writer(core::TraceWriter* writer) {
    std::lock_guard lock(mutex_);
    allocator_->set_trace_writer(writer);
}

} // namespace taskalloc::service
