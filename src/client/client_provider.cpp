// src/client/client_provider.cpp
#include "../../include/client/client_provider.h"
#include "../../include/client/removal_coordinator.h"
#include "../../include/storage_error/error_utils.h"
#include "../../include/debug_utils.h"

#include <exception>

namespace mapstore {

template<typename K>
ClientProvider<K>::ClientProvider(Store& store, Dependencies deps, ClientProviderConfig config,
                                  std::vector<PostCreateHook> post_create_hooks)
    : tx_(std::make_shared<Transaction<K, Entity>>(store)),
      deps_(deps),
      config_(std::move(config)),
      post_create_hooks_(std::move(post_create_hooks)) {
    deps_.transaction_manager.enlist(tx_);
}

template<typename K>
typename ClientProvider<K>::AdapterPtr ClientProvider<K>::toAdapter(HandlePtr handle) {
    return std::make_shared<ClientAdapter<K>>(std::move(handle), tx_->keyConvertor(), deps_.event_bus,
                                              deps_.node_registry);
}

template<typename K>
CriteriaBuilder<ClientEntity<K>> ClientProvider<K>::realmCriteria(const std::string& realm_id) const {
    CriteriaBuilder<Entity> criteria = tx_->createCriteriaBuilder();
    criteria.compare(client_fields::REALM_ID, FilterOperator::EQUAL, realm_id);
    return criteria;
}

template<typename K>
LazySequence<typename ClientProvider<K>::AdapterPtr> ClientProvider<K>::readAdapters(
    const QueryParameters<Entity>& params) {
    return tx_->read(params).map([this](const HandlePtr& handle) { return toAdapter(handle); });
}

template<typename K>
std::string ClientProvider<K>::effectiveProtocol(const ClientAdapter<K>& client) const {
    return client.getProtocol().value_or(config_.default_protocol);
}

template<typename K>
Result<typename ClientProvider<K>::HandlePtr> ClientProvider<K>::findClient(const std::string& realm_id,
                                                                           const std::string& id) {
    std::optional<K> key = tx_->keyConvertor().fromStringSafe(id);
    HandlePtr handle = key ? tx_->read(*key) : nullptr;
    if (!handle) {
        return StorageError(ErrorCode::KEY_NOT_FOUND, "Client not found").withContext("id", id);
    }
    if (realm_id.empty() || handle->get().getRealmId() != realm_id) {
        return StorageError(ErrorCode::TENANT_MISMATCH, "Client belongs to another realm")
            .withContext("id", id)
            .withContext("realm", realm_id);
    }
    return handle;
}

template<typename K>
typename ClientProvider<K>::AdapterPtr ClientProvider<K>::addClient(const std::string& realm_id,
                                                                    const std::optional<std::string>& id,
                                                                    const std::optional<std::string>& client_id) {
    if (realm_id.empty()) {
        throw StorageError(ErrorCode::INVALID_VALUE, "Client needs a realm");
    }
    const KeyConvertor<K>& convertor = tx_->keyConvertor();
    K key = id ? convertor.fromString(*id) : convertor.newUniqueKey();
    std::string key_string = convertor.toString(key);
    LOG_TRACE("[ClientProvider] addClient(", realm_id, ", ", key_string, ", ", client_id.value_or(key_string), ")");

    Entity entity(key, realm_id);
    entity.setClientId(client_id.value_or(key_string));
    entity.setEnabled(true);
    entity.setStandardFlowEnabled(true);

    HandlePtr handle;
    try {
        handle = tx_->create(entity);
    } catch (const StorageError& e) {
        if (e.code != ErrorCode::DUPLICATE_KEY) {
            throw;
        }
        throw StorageError(ErrorCode::MODEL_DUPLICATE, "Client exists: " + key_string)
            .withUnderlyingError(e.code)
            .withContext("realm", realm_id);
    }

    AdapterPtr client = toAdapter(handle);
    deps_.event_bus.publish(ClientCreatedEvent<K>{*client});
    client->updateClient();

    try {
        for (const PostCreateHook& hook : post_create_hooks_) {
            hook(*client);
        }
    } catch (const std::exception& e) {
        LOG_WARN("[ClientProvider] Post-create hook failed for client ", key_string, ": ", e.what(),
                 ". Withdrawing the create.");
        tx_->remove(key);
        throw;
    }
    return client;
}

template<typename K>
typename ClientProvider<K>::AdapterPtr ClientProvider<K>::getClientById(const std::string& realm_id,
                                                                        const std::string& id) {
    if (id.empty()) {
        return nullptr;
    }
    LOG_TRACE("[ClientProvider] getClientById(", realm_id, ", ", id, ")");
    Result<HandlePtr> found = findClient(realm_id, id);
    if (!found) {
        LOG_TRACE("[ClientProvider] getClientById: ", error_utils::errorCodeToString(found.error().code));
        return nullptr;
    }
    return toAdapter(found.value());
}

template<typename K>
typename ClientProvider<K>::AdapterPtr ClientProvider<K>::getClientByClientId(const std::string& realm_id,
                                                                              const std::string& client_id) {
    if (realm_id.empty() || client_id.empty()) {
        return nullptr;
    }
    LOG_TRACE("[ClientProvider] getClientByClientId(", realm_id, ", ", client_id, ")");
    CriteriaBuilder<Entity> criteria = realmCriteria(realm_id);
    criteria.compare(client_fields::CLIENT_ID, FilterOperator::ILIKE, client_id);
    std::optional<AdapterPtr> first = readAdapters(QueryParameters<Entity>::withCriteria(criteria)).first();
    return first ? *first : nullptr;
}

template<typename K>
LazySequence<typename ClientProvider<K>::AdapterPtr> ClientProvider<K>::getClients(const std::string& realm_id) {
    if (realm_id.empty()) {
        return LazySequence<AdapterPtr>::empty();
    }
    auto params = QueryParameters<Entity>::withCriteria(realmCriteria(realm_id));
    params.orderBy(client_fields::CLIENT_ID, IndexSortOrder::ASCENDING);
    return readAdapters(params);
}

template<typename K>
LazySequence<typename ClientProvider<K>::AdapterPtr> ClientProvider<K>::getClients(const std::string& realm_id,
                                                                                   std::optional<size_t> first,
                                                                                   std::optional<size_t> max) {
    if (realm_id.empty()) {
        return LazySequence<AdapterPtr>::empty();
    }
    auto params = QueryParameters<Entity>::withCriteria(realmCriteria(realm_id));
    params.pagination(first, max, client_fields::CLIENT_ID);
    return readAdapters(params);
}

template<typename K>
LazySequence<typename ClientProvider<K>::AdapterPtr> ClientProvider<K>::searchClientsByClientId(
    const std::string& realm_id, const std::string& client_id, std::optional<size_t> first, std::optional<size_t> max) {
    if (realm_id.empty()) {
        return LazySequence<AdapterPtr>::empty();
    }
    CriteriaBuilder<Entity> criteria = realmCriteria(realm_id);
    criteria.compare(client_fields::CLIENT_ID, FilterOperator::ILIKE, "%" + client_id + "%");
    auto params = QueryParameters<Entity>::withCriteria(criteria);
    params.pagination(first, max, client_fields::CLIENT_ID);
    return readAdapters(params);
}

template<typename K>
LazySequence<typename ClientProvider<K>::AdapterPtr> ClientProvider<K>::searchClientsByAttributes(
    const std::string& realm_id, const std::map<std::string, std::string>& attributes, std::optional<size_t> first,
    std::optional<size_t> max) {
    if (realm_id.empty()) {
        return LazySequence<AdapterPtr>::empty();
    }
    CriteriaBuilder<Entity> criteria = realmCriteria(realm_id);
    for (const auto& [name, value] : attributes) {
        criteria.compare(client_fields::ATTRIBUTE, FilterOperator::EQUAL, name, value);
    }
    auto params = QueryParameters<Entity>::withCriteria(criteria);
    params.pagination(first, max, client_fields::CLIENT_ID);
    return readAdapters(params);
}

template<typename K>
LazySequence<typename ClientProvider<K>::AdapterPtr> ClientProvider<K>::getAlwaysDisplayInConsoleClients(
    const std::string& realm_id) {
    return getClients(realm_id).filter([](const AdapterPtr& c) { return c->isAlwaysDisplayInConsole(); });
}

template<typename K>
size_t ClientProvider<K>::getClientsCount(const std::string& realm_id) {
    if (realm_id.empty()) {
        return 0;
    }
    return tx_->count(QueryParameters<Entity>::withCriteria(realmCriteria(realm_id)));
}

template<typename K>
std::map<std::string, std::set<std::string>> ClientProvider<K>::getAllRedirectUrisOfEnabledClients(
    const std::string& realm_id) {
    std::map<std::string, std::set<std::string>> result;
    if (realm_id.empty()) {
        return result;
    }
    CriteriaBuilder<Entity> criteria = realmCriteria(realm_id);
    criteria.compare(client_fields::ENABLED, FilterOperator::EQUAL, true);
    for (const HandlePtr& handle : tx_->read(QueryParameters<Entity>::withCriteria(criteria))) {
        const Entity& client = handle->get();
        if (!client.getRedirectUris().empty()) {
            result.emplace(tx_->keyConvertor().toString(client.getId()), client.getRedirectUris());
        }
    }
    return result;
}

template<typename K>
bool ClientProvider<K>::removeClient(const std::string& realm_id, const std::string& id) {
    if (id.empty()) {
        return false;
    }
    AdapterPtr client = getClientById(realm_id, id);
    if (!client) {
        return false;
    }
    LOG_TRACE("[ClientProvider] removeClient(", realm_id, ", ", id, ")");

    RemovalCoordinator coordinator("client " + id);
    coordinator
        .addStep("user references", [&]() { return deps_.users.preRemove(realm_id, id); })
        .addStep("client roles", [&]() -> Status {
            std::vector<std::string> removed_roles;
            MAPSTORE_ASSIGN_OR_RETURN(removed_roles, deps_.roles.removeRoles(realm_id, id));
            for (const std::string& role_id : removed_roles) {
                MAPSTORE_RETURN_IF_ERROR(preRemove(realm_id, role_id));
            }
            return Status();
        });

    Status cascade = coordinator.run();
    if (!cascade) {
        deps_.transaction_manager.setRollbackOnly();
        const StorageError& cause = cascade.error();
        StorageError failure(ErrorCode::CASCADE_FAILED, "Client removal aborted: " + cause.message);
        failure.withUnderlyingError(cause.code).withDetails(cause.details).withContext("client", id);
        auto step = cause.context.find("removal_step");
        if (step != cause.context.end()) {
            failure.withContext("removal_step", step->second);
        }
        LOG_ERROR("[ClientProvider] ", failure.toString());
        throw failure;
    }

    // Observers still see the client; the delete below is only buffered.
    deps_.event_bus.publish(ClientRemovedEvent<K>{*client});

    K key = client->getKey();
    tx_->remove(key);
    deps_.node_registry.clear(key);
    return true;
}

template<typename K>
void ClientProvider<K>::removeClients(const std::string& realm_id) {
    LOG_TRACE("[ClientProvider] removeClients(", realm_id, ")");
    // All ids are read before the first removal changes the result set.
    std::vector<std::string> ids;
    for (const AdapterPtr& client : getClients(realm_id)) {
        ids.push_back(client->getId());
    }
    for (const std::string& id : ids) {
        removeClient(realm_id, id);
    }
}

template<typename K>
void ClientProvider<K>::addClientScopes(const std::string& realm_id, ClientAdapter<K>& client,
                                        const std::vector<ClientScope>& scopes, bool default_scope) {
    if (!findClient(realm_id, client.getId())) {
        return;
    }
    std::string protocol = effectiveProtocol(client);
    LOG_TRACE("[ClientProvider] addClientScopes(", realm_id, ", ", client.getId(), ", ", scopes.size(),
              " scope(s), default=", default_scope, ")");

    std::map<std::string, ClientScope> existing = getClientScopes(realm_id, client, true);
    for (auto& [name, scope] : getClientScopes(realm_id, client, false)) {
        existing.emplace(name, scope);
    }
    const std::map<std::string, bool>& attached = client.entity().getClientScopeFlags();

    for (const ClientScope& scope : scopes) {
        std::string scope_id = tx_->keyConvertor().toString(scope.getId());
        if (scope.getRealmId() != realm_id || existing.count(scope.getName()) > 0 ||
            attached.count(scope_id) > 0 || scope.getProtocol() != protocol) {
            continue;
        }
        client.handle()->modify([&](Entity& e) { e.addClientScope(scope_id, default_scope); });
        existing.emplace(scope.getName(), scope);
    }
}

template<typename K>
void ClientProvider<K>::removeClientScope(const std::string& realm_id, ClientAdapter<K>& client,
                                          const std::string& scope_id) {
    if (!findClient(realm_id, client.getId())) {
        return;
    }
    LOG_TRACE("[ClientProvider] removeClientScope(", realm_id, ", ", client.getId(), ", ", scope_id, ")");
    client.handle()->modify([&](Entity& e) { e.removeClientScope(scope_id); });
}

template<typename K>
std::map<std::string, ClientScopeEntity<K>> ClientProvider<K>::getClientScopes(const std::string& realm_id,
                                                                               ClientAdapter<K>& client,
                                                                               bool default_scope) {
    std::map<std::string, ClientScope> result;
    if (!findClient(realm_id, client.getId())) {
        return result;
    }
    std::string protocol = effectiveProtocol(client);
    for (const std::string& scope_id : client.getClientScopeIds(default_scope)) {
        std::optional<ClientScope> scope = deps_.client_scopes.getClientScopeById(realm_id, scope_id);
        if (scope && scope->getProtocol() == protocol) {
            result.emplace(scope->getName(), *scope);
        }
    }
    return result;
}

template<typename K>
Status ClientProvider<K>::preRemove(const std::string& realm_id, const std::string& role_id) {
    if (realm_id.empty()) {
        return Status();
    }
    try {
        CriteriaBuilder<Entity> criteria = realmCriteria(realm_id);
        criteria.compare(client_fields::SCOPE_MAPPING_ROLE, FilterOperator::EQUAL, role_id);
        // Materialized first: removing the mapping takes the client out of the result set.
        std::vector<HandlePtr> affected = tx_->read(QueryParameters<Entity>::withCriteria(criteria)).toVector();
        for (const HandlePtr& handle : affected) {
            handle->modify([&](Entity& e) { e.deleteScopeMapping(role_id); });
        }
        LOG_TRACE("[ClientProvider] preRemove(", realm_id, ", role ", role_id, ") updated ", affected.size(),
                  " client(s)");
    } catch (const StorageError& e) {
        return e;
    }
    return Status();
}

template class ClientProvider<std::string>;
template class ClientProvider<Uuid>;
template class ClientProvider<uint64_t>;

} // namespace mapstore
