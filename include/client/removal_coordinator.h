// include/client/removal_coordinator.h
#pragma once

#include "../storage_error/result.h"

#include <functional>
#include <string>
#include <vector>

namespace mapstore {

/**
 * @brief Ordered list of cleanup steps that must all succeed before an
 * entity is physically deleted.
 *
 * run() stops at the first failing step and returns its error, annotated
 * with the step name; later steps do not run.
 */
class RemovalCoordinator {
public:
    using Step = std::function<Status()>;

    explicit RemovalCoordinator(std::string subject) : subject_(std::move(subject)) {}

    RemovalCoordinator& addStep(std::string name, Step step);

    Status run() const;

    size_t stepCount() const { return steps_.size(); }

private:
    struct NamedStep {
        std::string name;
        Step action;
    };

    std::string subject_;
    std::vector<NamedStep> steps_;
};

} // namespace mapstore
