// include/client/user_client_references.h
#pragma once

#include "../storage_error/result.h"

#include <string>

namespace mapstore {

/**
 * @brief Hook into the user domain, run before a client is removed so that
 * user-side references to it (consents, service-account links) are dropped.
 * Plugged in by the embedding application.
 */
class UserClientReferences {
public:
    virtual ~UserClientReferences() = default;

    // `client_id` is the client's storage id.
    virtual Status preRemove(const std::string& realm_id, const std::string& client_id) = 0;
};

// For deployments without a user domain.
class NoUserClientReferences : public UserClientReferences {
public:
    Status preRemove(const std::string&, const std::string&) override { return Status(); }
};

} // namespace mapstore
