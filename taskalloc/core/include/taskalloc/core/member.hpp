#pragma once

#include <map>
#include <optional>
#include <string>

namespace taskalloc::core {

/// @brief A worker that can take tasks up to a bounded number of hours.
/// @ingroup core_model
///
/// A member holds a set of competencies, each rated with a proficiency
/// level (roughly 1-10). The competency set is the key set of the
/// proficiency map: a competency absent from the map is not held and
/// contributes nothing to a match score.
///
/// The current workload is the only mutable state. Allocators reset it at
/// the start of every run and commit task hours as tasks are accepted,
/// maintaining `current_workload() <= max_capacity()`.
///
/// @see Task, Team, algo::Scorer
class Member {
public:
    /// @brief Proficiency level per competency name.
    using Competencies = std::map<std::string, double>;

    /// @brief Construct a new Member.
    /// @param id               Unique member identifier.
    /// @param name             Display name.
    /// @param competencies     Competency name to proficiency level.
    /// @param max_capacity     Maximum workload in hours (must be > 0).
    /// @param current_workload Hours already committed (defaults to 0).
    /// @throws InvalidEntityError if @p max_capacity is not a positive
    ///         finite number, @p current_workload is negative or not finite,
    ///         or a proficiency level is negative or not finite.
    Member(std::string id, std::string name, Competencies competencies,
           double max_capacity, double current_workload = 0.0);

    /// @brief Get the unique member identifier.
    [[nodiscard]] const std::string& id() const noexcept { return id_; }

    /// @brief Get the display name.
    [[nodiscard]] const std::string& name() const noexcept { return name_; }

    /// @brief Get the full competency map.
    [[nodiscard]] const Competencies& competencies() const noexcept { return competencies_; }

    /// @brief Check whether the member holds a competency.
    [[nodiscard]] bool has_competency(const std::string& competency) const;

    /// @brief Look up the proficiency level for a competency.
    /// @return The level, or std::nullopt if the competency is not held.
    [[nodiscard]] std::optional<double> proficiency(const std::string& competency) const;

    /// @brief Hours committed so far.
    [[nodiscard]] double current_workload() const noexcept { return current_workload_; }

    /// @brief Maximum number of hours this member can take.
    [[nodiscard]] double max_capacity() const noexcept { return max_capacity_; }

    /// @brief Hours still available: max_capacity() - current_workload().
    [[nodiscard]] double remaining_capacity() const noexcept {
        return max_capacity_ - current_workload_;
    }

    /// @brief Fraction of capacity already committed.
    /// @return current_workload() / max_capacity().
    [[nodiscard]] double workload_ratio() const noexcept {
        return current_workload_ / max_capacity_;
    }

    /// @brief Check whether @p hours more would still fit.
    ///
    /// Uses strict exceedance: a task that fills the member exactly to
    /// capacity is accepted.
    ///
    /// @param hours Additional hours.
    /// @return true if `current_workload() + hours <= max_capacity()`.
    [[nodiscard]] bool can_take(double hours) const noexcept {
        return current_workload_ + hours <= max_capacity_;
    }

    /// @brief Add @p hours to the current workload.
    /// @throws InvalidEntityError if the result would exceed max_capacity().
    void commit(double hours);

    /// @brief Set the current workload back to zero.
    void reset_workload() noexcept { current_workload_ = 0.0; }

private:
    std::string id_;
    std::string name_;
    Competencies competencies_;
    double max_capacity_;
    double current_workload_;
};

} // namespace taskalloc::core
