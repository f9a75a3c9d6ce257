// include/client/client_entity.h
#pragma once

#include "../storage/criteria.h"

#include <nlohmann/json.hpp>

#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace mapstore {

// Searchable fields of ClientEntity.
namespace client_fields {
    inline const std::string REALM_ID = "realmId";
    inline const std::string CLIENT_ID = "clientId";
    inline const std::string ENABLED = "enabled";
    inline const std::string SCOPE_MAPPING_ROLE = "scopeMappingRole";
    inline const std::string ALWAYS_DISPLAY_IN_CONSOLE = "alwaysDisplayInConsole";
    inline const std::string PROTOCOL = "protocol";
    inline const std::string ATTRIBUTE = "attribute"; // EQUAL with (name, value)
} // namespace client_fields

/**
 * @brief Stored state of an OAuth/SAML client.
 *
 * The key is fixed at construction. Scope mappings hold role ids; client
 * scopes map a client scope id to its "default" flag, one entry per id.
 */
template<typename K>
class ClientEntity {
public:
    ClientEntity(K id, std::string realm_id) : id_(std::move(id)), realm_id_(std::move(realm_id)) {}

    const K& getId() const { return id_; }
    const std::string& getRealmId() const { return realm_id_; }

    const std::string& getClientId() const { return client_id_; }
    void setClientId(std::string client_id) { client_id_ = std::move(client_id); }

    const std::string& getName() const { return name_; }
    void setName(std::string name) { name_ = std::move(name); }

    const std::string& getDescription() const { return description_; }
    void setDescription(std::string description) { description_ = std::move(description); }

    const std::optional<std::string>& getProtocol() const { return protocol_; }
    void setProtocol(std::optional<std::string> protocol) { protocol_ = std::move(protocol); }

    bool isEnabled() const { return enabled_; }
    void setEnabled(bool enabled) { enabled_ = enabled; }

    bool isStandardFlowEnabled() const { return standard_flow_enabled_; }
    void setStandardFlowEnabled(bool enabled) { standard_flow_enabled_ = enabled; }

    bool isAlwaysDisplayInConsole() const { return always_display_in_console_; }
    void setAlwaysDisplayInConsole(bool display) { always_display_in_console_ = display; }

    const std::set<std::string>& getRedirectUris() const { return redirect_uris_; }
    void setRedirectUris(std::set<std::string> uris) { redirect_uris_ = std::move(uris); }
    void addRedirectUri(const std::string& uri) { redirect_uris_.insert(uri); }
    void removeRedirectUri(const std::string& uri) { redirect_uris_.erase(uri); }

    const std::set<std::string>& getWebOrigins() const { return web_origins_; }
    void setWebOrigins(std::set<std::string> origins) { web_origins_ = std::move(origins); }
    void addWebOrigin(const std::string& origin) { web_origins_.insert(origin); }
    void removeWebOrigin(const std::string& origin) { web_origins_.erase(origin); }

    const std::map<std::string, std::vector<std::string>>& getAttributes() const { return attributes_; }

    std::vector<std::string> getAttribute(const std::string& name) const {
        auto it = attributes_.find(name);
        return it == attributes_.end() ? std::vector<std::string>{} : it->second;
    }

    void setAttribute(const std::string& name, std::vector<std::string> values) {
        attributes_[name] = std::move(values);
    }

    void removeAttribute(const std::string& name) { attributes_.erase(name); }

    const std::set<std::string>& getScopeMappings() const { return scope_mappings_; }
    void addScopeMapping(const std::string& role_id) { scope_mappings_.insert(role_id); }
    void deleteScopeMapping(const std::string& role_id) { scope_mappings_.erase(role_id); }

    const std::map<std::string, bool>& getClientScopeFlags() const { return client_scopes_; }

    // Re-adding an attached scope only updates its default flag.
    void addClientScope(const std::string& scope_id, bool default_scope) {
        client_scopes_.insert_or_assign(scope_id, default_scope);
    }

    void removeClientScope(const std::string& scope_id) { client_scopes_.erase(scope_id); }

    std::vector<std::string> getClientScopes(bool default_scope) const {
        std::vector<std::string> ids;
        for (const auto& [scope_id, is_default] : client_scopes_) {
            if (is_default == default_scope) {
                ids.push_back(scope_id);
            }
        }
        return ids;
    }

    bool operator==(const ClientEntity& other) const {
        return id_ == other.id_ && realm_id_ == other.realm_id_ && client_id_ == other.client_id_ &&
               name_ == other.name_ && description_ == other.description_ && protocol_ == other.protocol_ &&
               enabled_ == other.enabled_ && standard_flow_enabled_ == other.standard_flow_enabled_ &&
               always_display_in_console_ == other.always_display_in_console_ &&
               redirect_uris_ == other.redirect_uris_ && web_origins_ == other.web_origins_ &&
               attributes_ == other.attributes_ && scope_mappings_ == other.scope_mappings_ &&
               client_scopes_ == other.client_scopes_;
    }
    bool operator!=(const ClientEntity& other) const { return !(*this == other); }

    nlohmann::json toJson() const {
        nlohmann::json j;
        j["realmId"] = realm_id_;
        j["clientId"] = client_id_;
        j["name"] = name_;
        j["description"] = description_;
        if (protocol_) {
            j["protocol"] = *protocol_;
        }
        j["enabled"] = enabled_;
        j["standardFlowEnabled"] = standard_flow_enabled_;
        j["alwaysDisplayInConsole"] = always_display_in_console_;
        j["redirectUris"] = redirect_uris_;
        j["webOrigins"] = web_origins_;
        j["attributes"] = attributes_;
        j["scopeMappings"] = scope_mappings_;
        j["clientScopes"] = client_scopes_;
        return j;
    }

    static ClientEntity fromJson(K id, const nlohmann::json& j) {
        ClientEntity entity(std::move(id), j.at("realmId").get<std::string>());
        entity.client_id_ = j.at("clientId").get<std::string>();
        entity.name_ = j.value("name", std::string());
        entity.description_ = j.value("description", std::string());
        if (j.contains("protocol")) {
            entity.protocol_ = j["protocol"].get<std::string>();
        }
        entity.enabled_ = j.value("enabled", true);
        entity.standard_flow_enabled_ = j.value("standardFlowEnabled", true);
        entity.always_display_in_console_ = j.value("alwaysDisplayInConsole", false);
        entity.redirect_uris_ = j.value("redirectUris", std::set<std::string>());
        entity.web_origins_ = j.value("webOrigins", std::set<std::string>());
        entity.attributes_ = j.value("attributes", std::map<std::string, std::vector<std::string>>());
        entity.scope_mappings_ = j.value("scopeMappings", std::set<std::string>());
        entity.client_scopes_ = j.value("clientScopes", std::map<std::string, bool>());
        return entity;
    }

    static std::shared_ptr<const FieldDescriptors<ClientEntity>> fieldDescriptors() {
        auto fields = std::make_shared<FieldDescriptors<ClientEntity>>();
        fields->field(client_fields::REALM_ID, [](const ClientEntity& c) { return toValues(c.realm_id_); })
            .field(client_fields::CLIENT_ID, [](const ClientEntity& c) { return toValues(c.client_id_); })
            .field(client_fields::ENABLED, [](const ClientEntity& c) { return toValues(c.enabled_); })
            .field(client_fields::SCOPE_MAPPING_ROLE, [](const ClientEntity& c) { return toValues(c.scope_mappings_); })
            .field(client_fields::ALWAYS_DISPLAY_IN_CONSOLE,
                   [](const ClientEntity& c) { return toValues(c.always_display_in_console_); })
            .field(client_fields::PROTOCOL, [](const ClientEntity& c) { return toValues(c.protocol_); })
            .customField(client_fields::ATTRIBUTE, &ClientEntity::matchAttribute, {FilterOperator::EQUAL}, 2);
        return fields;
    }

private:
    static bool matchAttribute(const ClientEntity& c, FilterOperator, const std::vector<ValueType>& operands) {
        const auto* name = std::get_if<std::string>(&operands[0]);
        if (name == nullptr) {
            return false;
        }
        auto it = c.attributes_.find(*name);
        if (it == c.attributes_.end()) {
            return false;
        }
        for (const std::string& value : it->second) {
            if (valuesEqual(ValueType(value), operands[1])) {
                return true;
            }
        }
        return false;
    }

    K id_;
    std::string realm_id_;
    std::string client_id_;
    std::string name_;
    std::string description_;
    std::optional<std::string> protocol_;
    bool enabled_ = false;
    bool standard_flow_enabled_ = false;
    bool always_display_in_console_ = false;
    std::set<std::string> redirect_uris_;
    std::set<std::string> web_origins_;
    std::map<std::string, std::vector<std::string>> attributes_;
    std::set<std::string> scope_mappings_;
    std::map<std::string, bool> client_scopes_;
};

} // namespace mapstore
