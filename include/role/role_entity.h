// include/role/role_entity.h
#pragma once

#include "../storage/criteria.h"

#include <nlohmann/json.hpp>

#include <memory>
#include <string>

namespace mapstore {

namespace role_fields {
    inline const std::string REALM_ID = "realmId";
    inline const std::string NAME = "name";
    inline const std::string CLIENT_ID = "clientId";
} // namespace role_fields

/**
 * @brief A realm role, or a client role when clientId names the owning
 * client (its storage id).
 */
template<typename K>
class RoleEntity {
public:
    RoleEntity(K id, std::string realm_id) : id_(std::move(id)), realm_id_(std::move(realm_id)) {}

    const K& getId() const { return id_; }
    const std::string& getRealmId() const { return realm_id_; }

    const std::string& getName() const { return name_; }
    void setName(std::string name) { name_ = std::move(name); }

    const std::string& getDescription() const { return description_; }
    void setDescription(std::string description) { description_ = std::move(description); }

    const std::string& getClientId() const { return client_id_; }
    void setClientId(std::string client_id) { client_id_ = std::move(client_id); }

    bool isClientRole() const { return !client_id_.empty(); }

    bool operator==(const RoleEntity& other) const {
        return id_ == other.id_ && realm_id_ == other.realm_id_ && name_ == other.name_ &&
               description_ == other.description_ && client_id_ == other.client_id_;
    }

    nlohmann::json toJson() const {
        return {{"realmId", realm_id_}, {"name", name_}, {"description", description_}, {"clientId", client_id_}};
    }

    static RoleEntity fromJson(K id, const nlohmann::json& j) {
        RoleEntity role(std::move(id), j.at("realmId").get<std::string>());
        role.name_ = j.at("name").get<std::string>();
        role.description_ = j.value("description", std::string());
        role.client_id_ = j.value("clientId", std::string());
        return role;
    }

    static std::shared_ptr<const FieldDescriptors<RoleEntity>> fieldDescriptors() {
        auto fields = std::make_shared<FieldDescriptors<RoleEntity>>();
        fields->field(role_fields::REALM_ID, [](const RoleEntity& r) { return toValues(r.realm_id_); })
            .field(role_fields::NAME, [](const RoleEntity& r) { return toValues(r.name_); })
            .field(role_fields::CLIENT_ID, [](const RoleEntity& r) { return toValues(r.client_id_); });
        return fields;
    }

private:
    K id_;
    std::string realm_id_;
    std::string name_;
    std::string description_;
    std::string client_id_;
};

} // namespace mapstore
