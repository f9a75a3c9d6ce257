// include/role/role_provider.h
#pragma once

#include "role_entity.h"
#include "../storage/transaction.h"
#include "../storage/transaction_manager.h"
#include "../storage_error/result.h"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace mapstore {

/**
 * @brief Realm and client roles of one request, backed by its own
 * transaction enlisted in the request's TransactionManager.
 */
template<typename K>
class RoleProvider {
public:
    using Entity = RoleEntity<K>;
    using Store = EntityStore<K, Entity>;

    RoleProvider(Store& store, TransactionManager& transaction_manager);

    /**
     * @brief Creates a realm role, or a client role when `client_id` is set.
     * @throws StorageError MODEL_DUPLICATE when the key, or the name within
     *         the same realm and client, is taken.
     */
    Entity addRole(const std::string& realm_id, const std::string& name,
                   const std::optional<std::string>& client_id = std::nullopt,
                   const std::optional<std::string>& id = std::nullopt);

    std::optional<Entity> getRoleById(const std::string& realm_id, const std::string& id);
    std::optional<Entity> getClientRole(const std::string& realm_id, const std::string& client_id, const std::string& name);

    // Ordered by name.
    std::vector<Entity> getClientRoles(const std::string& realm_id, const std::string& client_id);

    bool removeRole(const std::string& realm_id, const std::string& id);

    // Removes every role of the client and returns the removed role ids.
    Result<std::vector<std::string>> removeRoles(const std::string& realm_id, const std::string& client_id);

    Transaction<K, Entity>& transaction() { return *tx_; }

private:
    CriteriaBuilder<Entity> clientRoleCriteria(const std::string& realm_id, const std::string& client_id) const;

    std::shared_ptr<Transaction<K, Entity>> tx_;
};

} // namespace mapstore
