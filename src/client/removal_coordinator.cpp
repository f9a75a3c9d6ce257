// src/client/removal_coordinator.cpp
#include "../../include/client/removal_coordinator.h"
#include "../../include/storage_error/error_utils.h"
#include "../../include/debug_utils.h"

namespace mapstore {

RemovalCoordinator& RemovalCoordinator::addStep(std::string name, Step step) {
    steps_.push_back(NamedStep{std::move(name), std::move(step)});
    return *this;
}

Status RemovalCoordinator::run() const {
    for (const NamedStep& step : steps_) {
        LOG_TRACE("[RemovalCoordinator] ", subject_, ": running step '", step.name, "'");
        MAPSTORE_RETURN_IF_ERROR(step.action().mapError([this, &step](StorageError e) {
            LOG_WARN("[RemovalCoordinator] ", subject_, ": step '", step.name, "' failed: ", e.toString());
            e.withContext("removal_step", step.name);
            return e;
        }));
    }
    return Status();
}

} // namespace mapstore
