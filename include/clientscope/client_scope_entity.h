// include/clientscope/client_scope_entity.h
#pragma once

#include "../storage/criteria.h"

#include <nlohmann/json.hpp>

#include <memory>
#include <string>

namespace mapstore {

namespace client_scope_fields {
    inline const std::string REALM_ID = "realmId";
    inline const std::string NAME = "name";
    inline const std::string PROTOCOL = "protocol";
} // namespace client_scope_fields

template<typename K>
class ClientScopeEntity {
public:
    ClientScopeEntity(K id, std::string realm_id) : id_(std::move(id)), realm_id_(std::move(realm_id)) {}

    const K& getId() const { return id_; }
    const std::string& getRealmId() const { return realm_id_; }

    const std::string& getName() const { return name_; }
    void setName(std::string name) { name_ = std::move(name); }

    const std::string& getProtocol() const { return protocol_; }
    void setProtocol(std::string protocol) { protocol_ = std::move(protocol); }

    bool operator==(const ClientScopeEntity& other) const {
        return id_ == other.id_ && realm_id_ == other.realm_id_ && name_ == other.name_ &&
               protocol_ == other.protocol_;
    }

    nlohmann::json toJson() const { return {{"realmId", realm_id_}, {"name", name_}, {"protocol", protocol_}}; }

    static ClientScopeEntity fromJson(K id, const nlohmann::json& j) {
        ClientScopeEntity scope(std::move(id), j.at("realmId").get<std::string>());
        scope.name_ = j.at("name").get<std::string>();
        scope.protocol_ = j.at("protocol").get<std::string>();
        return scope;
    }

    static std::shared_ptr<const FieldDescriptors<ClientScopeEntity>> fieldDescriptors() {
        auto fields = std::make_shared<FieldDescriptors<ClientScopeEntity>>();
        fields->field(client_scope_fields::REALM_ID, [](const ClientScopeEntity& s) { return toValues(s.realm_id_); })
            .field(client_scope_fields::NAME, [](const ClientScopeEntity& s) { return toValues(s.name_); })
            .field(client_scope_fields::PROTOCOL, [](const ClientScopeEntity& s) { return toValues(s.protocol_); });
        return fields;
    }

private:
    K id_;
    std::string realm_id_;
    std::string name_;
    std::string protocol_;
};

} // namespace mapstore
