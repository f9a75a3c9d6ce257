// src/clientscope/client_scope_provider.cpp
#include "../../include/clientscope/client_scope_provider.h"
#include "../../include/debug_utils.h"

namespace mapstore {

template<typename K>
ClientScopeProvider<K>::ClientScopeProvider(Store& store, TransactionManager& transaction_manager)
    : tx_(std::make_shared<Transaction<K, Entity>>(store)) {
    transaction_manager.enlist(tx_);
}

template<typename K>
ClientScopeEntity<K> ClientScopeProvider<K>::addClientScope(const std::string& realm_id, const std::string& name,
                                                            const std::string& protocol,
                                                            const std::optional<std::string>& id) {
    if (realm_id.empty() || name.empty()) {
        throw StorageError(ErrorCode::INVALID_VALUE, "Client scope needs a realm and a name");
    }
    LOG_TRACE("[ClientScopeProvider] addClientScope(", realm_id, ", ", name, ", ", protocol, ")");

    CriteriaBuilder<Entity> same_name = tx_->createCriteriaBuilder();
    same_name.compare(client_scope_fields::REALM_ID, FilterOperator::EQUAL, realm_id)
        .compare(client_scope_fields::NAME, FilterOperator::EQUAL, name);
    if (tx_->count(QueryParameters<Entity>::withCriteria(same_name)) > 0) {
        throw StorageError(ErrorCode::MODEL_DUPLICATE, "Client scope exists: " + name).withContext("realm", realm_id);
    }

    const KeyConvertor<K>& convertor = tx_->keyConvertor();
    Entity scope(id ? convertor.fromString(*id) : convertor.newUniqueKey(), realm_id);
    scope.setName(name);
    scope.setProtocol(protocol);
    try {
        tx_->create(scope);
    } catch (const StorageError& e) {
        if (e.code != ErrorCode::DUPLICATE_KEY) {
            throw;
        }
        throw StorageError(ErrorCode::MODEL_DUPLICATE, "Client scope exists: " + convertor.toString(scope.getId()))
            .withUnderlyingError(e.code);
    }
    return scope;
}

template<typename K>
std::optional<ClientScopeEntity<K>> ClientScopeProvider<K>::getClientScopeById(const std::string& realm_id,
                                                                               const std::string& id) {
    std::optional<K> key = tx_->keyConvertor().fromStringSafe(id);
    if (!key) {
        return std::nullopt;
    }
    auto handle = tx_->read(*key);
    if (!handle || handle->get().getRealmId() != realm_id) {
        return std::nullopt;
    }
    return handle->get();
}

template<typename K>
std::vector<ClientScopeEntity<K>> ClientScopeProvider<K>::getClientScopes(const std::string& realm_id) {
    std::vector<Entity> scopes;
    if (realm_id.empty()) {
        return scopes;
    }
    CriteriaBuilder<Entity> criteria = tx_->createCriteriaBuilder();
    criteria.compare(client_scope_fields::REALM_ID, FilterOperator::EQUAL, realm_id);
    auto params = QueryParameters<Entity>::withCriteria(criteria);
    params.orderBy(client_scope_fields::NAME, IndexSortOrder::ASCENDING);
    for (const auto& handle : tx_->read(params)) {
        scopes.push_back(handle->get());
    }
    return scopes;
}

template<typename K>
bool ClientScopeProvider<K>::removeClientScope(const std::string& realm_id, const std::string& id) {
    if (!getClientScopeById(realm_id, id)) {
        return false;
    }
    LOG_TRACE("[ClientScopeProvider] removeClientScope(", realm_id, ", ", id, ")");
    return tx_->remove(tx_->keyConvertor().fromString(id));
}

template class ClientScopeProvider<std::string>;
template class ClientScopeProvider<Uuid>;
template class ClientScopeProvider<uint64_t>;

} // namespace mapstore
