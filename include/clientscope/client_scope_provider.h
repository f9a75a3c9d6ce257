// include/clientscope/client_scope_provider.h
#pragma once

#include "client_scope_entity.h"
#include "../storage/transaction.h"
#include "../storage/transaction_manager.h"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace mapstore {

template<typename K>
class ClientScopeProvider {
public:
    using Entity = ClientScopeEntity<K>;
    using Store = EntityStore<K, Entity>;

    ClientScopeProvider(Store& store, TransactionManager& transaction_manager);

    /**
     * @throws StorageError MODEL_DUPLICATE when the key, or the name within
     *         the realm, is taken.
     */
    Entity addClientScope(const std::string& realm_id, const std::string& name, const std::string& protocol,
                          const std::optional<std::string>& id = std::nullopt);

    std::optional<Entity> getClientScopeById(const std::string& realm_id, const std::string& id);

    // Ordered by name.
    std::vector<Entity> getClientScopes(const std::string& realm_id);

    bool removeClientScope(const std::string& realm_id, const std::string& id);

    Transaction<K, Entity>& transaction() { return *tx_; }

private:
    std::shared_ptr<Transaction<K, Entity>> tx_;
};

} // namespace mapstore
