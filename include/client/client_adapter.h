// include/client/client_adapter.h
#pragma once

#include "client_entity.h"
#include "client_events.h"
#include "node_registry.h"
#include "../events/event_bus.h"
#include "../key_convertor.h"
#include "../storage/entity_handle.h"
#include "../debug_utils.h"

#include <memory>

namespace mapstore {

/**
 * @brief Client view handed out by ClientProvider.
 *
 * Reads and writes go through the transaction's change-tracked handle, so
 * every adapter of one client within one transaction sees the same state
 * and setters need no explicit save. Node registration bypasses the
 * transaction and goes to the shared NodeRegistry.
 */
template<typename K>
class ClientAdapter {
public:
    using Entity = ClientEntity<K>;
    using HandlePtr = std::shared_ptr<EntityHandle<Entity>>;

    ClientAdapter(HandlePtr handle, const KeyConvertor<K>& convertor, EventBus& bus, NodeRegistry<K>& nodes)
        : handle_(std::move(handle)), convertor_(convertor), bus_(bus), nodes_(nodes) {}

    std::string getId() const { return convertor_.toString(handle_->get().getId()); }
    const K& getKey() const { return handle_->get().getId(); }
    const std::string& getRealmId() const { return handle_->get().getRealmId(); }
    const Entity& entity() const { return handle_->get(); }
    const HandlePtr& handle() const { return handle_; }

    const std::string& getClientId() const { return entity().getClientId(); }
    void setClientId(std::string client_id) {
        handle_->modify([&](Entity& e) { e.setClientId(std::move(client_id)); });
    }

    const std::string& getName() const { return entity().getName(); }
    void setName(std::string name) {
        handle_->modify([&](Entity& e) { e.setName(std::move(name)); });
    }

    const std::string& getDescription() const { return entity().getDescription(); }
    void setDescription(std::string description) {
        handle_->modify([&](Entity& e) { e.setDescription(std::move(description)); });
    }

    const std::optional<std::string>& getProtocol() const { return entity().getProtocol(); }
    void setProtocol(std::optional<std::string> protocol) {
        handle_->modify([&](Entity& e) { e.setProtocol(std::move(protocol)); });
    }

    bool isEnabled() const { return entity().isEnabled(); }
    void setEnabled(bool enabled) {
        handle_->modify([=](Entity& e) { e.setEnabled(enabled); });
    }

    bool isStandardFlowEnabled() const { return entity().isStandardFlowEnabled(); }
    void setStandardFlowEnabled(bool enabled) {
        handle_->modify([=](Entity& e) { e.setStandardFlowEnabled(enabled); });
    }

    bool isAlwaysDisplayInConsole() const { return entity().isAlwaysDisplayInConsole(); }
    void setAlwaysDisplayInConsole(bool display) {
        handle_->modify([=](Entity& e) { e.setAlwaysDisplayInConsole(display); });
    }

    const std::set<std::string>& getRedirectUris() const { return entity().getRedirectUris(); }
    void setRedirectUris(std::set<std::string> uris) {
        handle_->modify([&](Entity& e) { e.setRedirectUris(std::move(uris)); });
    }
    void addRedirectUri(const std::string& uri) {
        handle_->modify([&](Entity& e) { e.addRedirectUri(uri); });
    }
    void removeRedirectUri(const std::string& uri) {
        handle_->modify([&](Entity& e) { e.removeRedirectUri(uri); });
    }

    const std::set<std::string>& getWebOrigins() const { return entity().getWebOrigins(); }
    void addWebOrigin(const std::string& origin) {
        handle_->modify([&](Entity& e) { e.addWebOrigin(origin); });
    }
    void removeWebOrigin(const std::string& origin) {
        handle_->modify([&](Entity& e) { e.removeWebOrigin(origin); });
    }

    std::vector<std::string> getAttribute(const std::string& name) const { return entity().getAttribute(name); }
    const std::map<std::string, std::vector<std::string>>& getAttributes() const { return entity().getAttributes(); }
    void setAttribute(const std::string& name, std::vector<std::string> values) {
        handle_->modify([&](Entity& e) { e.setAttribute(name, std::move(values)); });
    }
    void setSingleAttribute(const std::string& name, const std::string& value) { setAttribute(name, {value}); }
    void removeAttribute(const std::string& name) {
        handle_->modify([&](Entity& e) { e.removeAttribute(name); });
    }

    const std::set<std::string>& getScopeMappings() const { return entity().getScopeMappings(); }
    bool hasScopeMapping(const std::string& role_id) const { return getScopeMappings().count(role_id) > 0; }
    void addScopeMapping(const std::string& role_id) {
        handle_->modify([&](Entity& e) { e.addScopeMapping(role_id); });
    }
    void deleteScopeMapping(const std::string& role_id) {
        handle_->modify([&](Entity& e) { e.deleteScopeMapping(role_id); });
    }

    // Ids of attached client scopes with the given default flag.
    std::vector<std::string> getClientScopeIds(bool default_scope) const {
        return entity().getClientScopes(default_scope);
    }

    void updateClient() {
        LOG_TRACE("[ClientAdapter] updateClient(", getRealmId(), ", ", getId(), ")");
        bus_.publish(ClientUpdatedEvent<K>{*this});
    }

    // --- Runtime node registrations (not transactional) ---
    std::map<std::string, int> getRegisteredNodes() const { return nodes_.getRegisteredNodes(getKey()); }
    void registerNode(const std::string& node_host, int registration_time) {
        nodes_.registerNode(getKey(), node_host, registration_time);
    }
    void unregisterNode(const std::string& node_host) { nodes_.unregisterNode(getKey(), node_host); }

private:
    HandlePtr handle_;
    const KeyConvertor<K>& convertor_;
    EventBus& bus_;
    NodeRegistry<K>& nodes_;
};

} // namespace mapstore
