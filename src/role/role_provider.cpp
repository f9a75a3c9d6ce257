// src/role/role_provider.cpp
#include "../../include/role/role_provider.h"
#include "../../include/debug_utils.h"

namespace mapstore {

template<typename K>
RoleProvider<K>::RoleProvider(Store& store, TransactionManager& transaction_manager)
    : tx_(std::make_shared<Transaction<K, Entity>>(store)) {
    transaction_manager.enlist(tx_);
}

template<typename K>
CriteriaBuilder<RoleEntity<K>> RoleProvider<K>::clientRoleCriteria(const std::string& realm_id,
                                                                   const std::string& client_id) const {
    CriteriaBuilder<Entity> criteria = tx_->createCriteriaBuilder();
    criteria.compare(role_fields::REALM_ID, FilterOperator::EQUAL, realm_id)
        .compare(role_fields::CLIENT_ID, FilterOperator::EQUAL, client_id);
    return criteria;
}

template<typename K>
RoleEntity<K> RoleProvider<K>::addRole(const std::string& realm_id, const std::string& name,
                                       const std::optional<std::string>& client_id,
                                       const std::optional<std::string>& id) {
    if (realm_id.empty() || name.empty()) {
        throw StorageError(ErrorCode::INVALID_VALUE, "Role needs a realm and a name");
    }
    LOG_TRACE("[RoleProvider] addRole(", realm_id, ", ", name, ", ", client_id.value_or(""), ")");

    CriteriaBuilder<Entity> same_name = clientRoleCriteria(realm_id, client_id.value_or(""));
    same_name.compare(role_fields::NAME, FilterOperator::EQUAL, name);
    if (tx_->count(QueryParameters<Entity>::withCriteria(same_name)) > 0) {
        throw StorageError(ErrorCode::MODEL_DUPLICATE, "Role exists: " + name)
            .withContext("realm", realm_id)
            .withContext("client", client_id.value_or(""));
    }

    const KeyConvertor<K>& convertor = tx_->keyConvertor();
    Entity role(id ? convertor.fromString(*id) : convertor.newUniqueKey(), realm_id);
    role.setName(name);
    role.setClientId(client_id.value_or(""));
    try {
        tx_->create(role);
    } catch (const StorageError& e) {
        if (e.code != ErrorCode::DUPLICATE_KEY) {
            throw;
        }
        throw StorageError(ErrorCode::MODEL_DUPLICATE, "Role exists: " + convertor.toString(role.getId()))
            .withUnderlyingError(e.code);
    }
    return role;
}

template<typename K>
std::optional<RoleEntity<K>> RoleProvider<K>::getRoleById(const std::string& realm_id, const std::string& id) {
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
std::optional<RoleEntity<K>> RoleProvider<K>::getClientRole(const std::string& realm_id, const std::string& client_id,
                                                            const std::string& name) {
    CriteriaBuilder<Entity> criteria = clientRoleCriteria(realm_id, client_id);
    criteria.compare(role_fields::NAME, FilterOperator::EQUAL, name);
    auto first = tx_->read(QueryParameters<Entity>::withCriteria(criteria)).first();
    if (!first) {
        return std::nullopt;
    }
    return (*first)->get();
}

template<typename K>
std::vector<RoleEntity<K>> RoleProvider<K>::getClientRoles(const std::string& realm_id, const std::string& client_id) {
    std::vector<Entity> roles;
    if (realm_id.empty() || client_id.empty()) {
        return roles;
    }
    auto params = QueryParameters<Entity>::withCriteria(clientRoleCriteria(realm_id, client_id));
    params.orderBy(role_fields::NAME, IndexSortOrder::ASCENDING);
    for (const auto& handle : tx_->read(params)) {
        roles.push_back(handle->get());
    }
    return roles;
}

template<typename K>
bool RoleProvider<K>::removeRole(const std::string& realm_id, const std::string& id) {
    if (!getRoleById(realm_id, id)) {
        return false;
    }
    LOG_TRACE("[RoleProvider] removeRole(", realm_id, ", ", id, ")");
    return tx_->remove(tx_->keyConvertor().fromString(id));
}

template<typename K>
Result<std::vector<std::string>> RoleProvider<K>::removeRoles(const std::string& realm_id, const std::string& client_id) {
    std::vector<std::string> removed;
    try {
        for (const Entity& role : getClientRoles(realm_id, client_id)) {
            tx_->remove(role.getId());
            removed.push_back(tx_->keyConvertor().toString(role.getId()));
        }
    } catch (const StorageError& e) {
        return e;
    }
    LOG_TRACE("[RoleProvider] removeRoles(", realm_id, ", ", client_id, ") removed ", removed.size(), " role(s)");
    return removed;
}

template class RoleProvider<std::string>;
template class RoleProvider<Uuid>;
template class RoleProvider<uint64_t>;

} // namespace mapstore
