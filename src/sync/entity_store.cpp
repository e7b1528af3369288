#include "osync/sync/entity_store.hpp"

#include "osync/sync/codec.hpp"

namespace osync::sync {
namespace {

const std::string kEntityPrefix = "entity/";

} // namespace

void to_json(json& j, const LocalEntity& entity) {
    j = json{
        {"entity_type", entity.entity_type},
        {"entity_id", entity.entity_id},
        {"payload", entity.payload},
        {"revision", entity.revision},
        {"last_updated", entity.last_updated},
        {"deleted", entity.deleted},
    };
}

void from_json(const json& j, LocalEntity& entity) {
    j.at("entity_type").get_to(entity.entity_type);
    j.at("entity_id").get_to(entity.entity_id);
    entity.payload = j.value("payload", json());
    entity.revision = j.value("revision", "");
    entity.last_updated = j.value("last_updated", static_cast<Timestamp>(0));
    entity.deleted = j.value("deleted", false);
}

EntityStore::EntityStore(storage::LocalPersistence& persistence)
    : persistence_(persistence) {}

std::string EntityStore::key(const std::string& entity_type, const std::string& entity_id) {
    return kEntityPrefix + entity_type + "/" + entity_id;
}

Result<std::optional<LocalEntity>> EntityStore::get(const std::string& entity_type,
                                                    const std::string& entity_id) const {
    auto stored = persistence_.get(key(entity_type, entity_id));
    if (stored.is_error()) {
        return Err<std::optional<LocalEntity>>(stored.error());
    }
    if (!stored.value().has_value()) {
        return Ok(std::optional<LocalEntity>{});
    }

    auto decoded = decode<LocalEntity>(*stored.value());
    if (decoded.is_error()) {
        return Err<std::optional<LocalEntity>>(decoded.error());
    }
    return Ok(std::optional<LocalEntity>{std::move(decoded.value())});
}

Result<std::vector<LocalEntity>> EntityStore::list(const std::string& entity_type) const {
    auto rows = persistence_.scan(kEntityPrefix + entity_type + "/");
    if (rows.is_error()) {
        return Err<std::vector<LocalEntity>>(rows.error());
    }

    std::vector<LocalEntity> entities;
    entities.reserve(rows.value().size());
    for (const auto& [_, value] : rows.value()) {
        auto decoded = decode<LocalEntity>(value);
        if (decoded.is_error()) {
            return Err<std::vector<LocalEntity>>(decoded.error());
        }
        entities.push_back(std::move(decoded.value()));
    }
    return Ok(std::move(entities));
}

Result<void> EntityStore::apply_remote(const RemoteRecord& record) {
    storage::WriteBatch batch;
    stage_remote(batch, record);
    return persistence_.commit(batch);
}

void EntityStore::stage_remote(storage::WriteBatch& batch, const RemoteRecord& record) const {
    LocalEntity entity;
    entity.entity_type = record.entity_type;
    entity.entity_id = record.entity_id;
    entity.payload = record.deleted ? json() : record.payload;
    entity.revision = record.revision;
    entity.last_updated = record.last_updated;
    entity.deleted = record.deleted;
    batch.put(key(record.entity_type, record.entity_id), encode(entity));
}

void EntityStore::stage_local(storage::WriteBatch& batch,
                              const std::optional<LocalEntity>& current,
                              const std::string& entity_type,
                              const std::string& entity_id,
                              Operation operation,
                              const json& payload,
                              Timestamp now) const {
    LocalEntity entity;
    if (current.has_value()) {
        entity = *current;
    } else {
        entity.entity_type = entity_type;
        entity.entity_id = entity_id;
    }

    if (operation == Operation::Delete) {
        entity.payload = json();
        entity.deleted = true;
    } else {
        entity.payload = payload;
        entity.deleted = false;
    }
    entity.last_updated = now;
    batch.put(key(entity_type, entity_id), encode(entity));
}

void EntityStore::stage_revision(storage::WriteBatch& batch,
                                 LocalEntity entity,
                                 const std::string& revision,
                                 Timestamp last_updated) const {
    entity.revision = revision;
    entity.last_updated = last_updated;
    const auto entity_key = key(entity.entity_type, entity.entity_id);
    batch.put(entity_key, encode(entity));
}

} // namespace osync::sync
