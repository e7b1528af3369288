#include "osync/sync/codec.hpp"

namespace osync::version {

void to_json(nlohmann::json& j, const RemoteCapability& capability) {
    j = nlohmann::json{
        {"major", capability.major_version},
        {"minor", capability.minor_version},
        {"patch", capability.patch_version},
        {"probed_at", capability.probed_at},
        {"stale", capability.stale},
    };
}

void from_json(const nlohmann::json& j, RemoteCapability& capability) {
    j.at("major").get_to(capability.major_version);
    j.at("minor").get_to(capability.minor_version);
    capability.patch_version = j.value("patch", 0u);
    capability.probed_at = j.value("probed_at", static_cast<Timestamp>(0));
    capability.stale = j.value("stale", false);
}

} // namespace osync::version

namespace osync {

void to_json(nlohmann::json& j, const Error& error) {
    j = nlohmann::json{{"kind", error.kind}, {"message", error.message}};
}

void from_json(const nlohmann::json& j, Error& error) {
    j.at("kind").get_to(error.kind);
    error.message = j.value("message", "");
}

} // namespace osync

namespace osync::sync {
namespace {

template<typename T>
void put_optional(json& j, const char* key, const std::optional<T>& value) {
    if (value.has_value()) {
        j[key] = *value;
    }
}

template<typename T>
std::optional<T> get_optional(const json& j, const char* key) {
    const auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        return std::nullopt;
    }
    return it->template get<T>();
}

} // namespace

void to_json(json& j, const ChangeRecord& record) {
    j = json{
        {"sequence", record.sequence},
        {"client_id", record.client_id},
        {"entity_type", record.entity_type},
        {"entity_id", record.entity_id},
        {"operation", record.operation},
        {"payload", record.payload},
        {"created_at", record.created_at},
        {"status", record.status},
        {"base_revision", record.base_revision},
        {"attempts", record.attempts},
    };
    put_optional(j, "last_error", record.last_error);
    put_optional(j, "conflict_id", record.conflict_id);
}

void from_json(const json& j, ChangeRecord& record) {
    j.at("sequence").get_to(record.sequence);
    j.at("client_id").get_to(record.client_id);
    j.at("entity_type").get_to(record.entity_type);
    j.at("entity_id").get_to(record.entity_id);
    j.at("operation").get_to(record.operation);
    record.payload = j.value("payload", json());
    j.at("created_at").get_to(record.created_at);
    j.at("status").get_to(record.status);
    record.base_revision = j.value("base_revision", "");
    record.attempts = j.value("attempts", 0u);
    record.last_error = get_optional<std::string>(j, "last_error");
    record.conflict_id = get_optional<std::string>(j, "conflict_id");
}

void to_json(json& j, const SyncCursor& cursor) {
    j = json{
        {"collection", cursor.collection},
        {"token", cursor.token},
        {"updated_at", cursor.updated_at},
        {"generation", cursor.generation},
    };
}

void from_json(const json& j, SyncCursor& cursor) {
    j.at("collection").get_to(cursor.collection);
    j.at("token").get_to(cursor.token);
    j.at("updated_at").get_to(cursor.updated_at);
    cursor.generation = j.value("generation", static_cast<std::uint64_t>(0));
}

void to_json(json& j, const RemoteRecord& record) {
    j = json{
        {"entity_type", record.entity_type},
        {"entity_id", record.entity_id},
        {"revision", record.revision},
        {"last_updated", record.last_updated},
        {"payload", record.payload},
        {"deleted", record.deleted},
        {"origin_client_id", record.origin_client_id},
    };
}

void from_json(const json& j, RemoteRecord& record) {
    j.at("entity_type").get_to(record.entity_type);
    j.at("entity_id").get_to(record.entity_id);
    j.at("revision").get_to(record.revision);
    j.at("last_updated").get_to(record.last_updated);
    record.payload = j.value("payload", json());
    record.deleted = j.value("deleted", false);
    record.origin_client_id = j.value("origin_client_id", "");
}

void to_json(json& j, const ConflictRecord& record) {
    j = json{
        {"id", record.id},
        {"entity_type", record.entity_type},
        {"entity_id", record.entity_id},
        {"local_change", record.local_change},
        {"remote_snapshot", record.remote_snapshot},
        {"policy", record.policy},
        {"kind", record.kind},
        {"outcome", record.outcome},
        {"detected_at", record.detected_at},
        {"cursor_token", record.cursor_token},
    };
    put_optional(j, "resolved_at", record.resolved_at);
}

void from_json(const json& j, ConflictRecord& record) {
    j.at("id").get_to(record.id);
    j.at("entity_type").get_to(record.entity_type);
    j.at("entity_id").get_to(record.entity_id);
    j.at("local_change").get_to(record.local_change);
    j.at("remote_snapshot").get_to(record.remote_snapshot);
    j.at("policy").get_to(record.policy);
    j.at("kind").get_to(record.kind);
    j.at("outcome").get_to(record.outcome);
    j.at("detected_at").get_to(record.detected_at);
    record.cursor_token = j.value("cursor_token", "");
    record.resolved_at = get_optional<Timestamp>(j, "resolved_at");
}

void to_json(json& j, const SessionStats& stats) {
    j = json{
        {"pushed", stats.pushed},
        {"pulled", stats.pulled},
        {"conflicted", stats.conflicted},
        {"failed", stats.failed},
        {"skipped", stats.skipped},
    };
}

void from_json(const json& j, SessionStats& stats) {
    stats.pushed = j.value("pushed", std::size_t{0});
    stats.pulled = j.value("pulled", std::size_t{0});
    stats.conflicted = j.value("conflicted", std::size_t{0});
    stats.failed = j.value("failed", std::size_t{0});
    stats.skipped = j.value("skipped", std::size_t{0});
}

void to_json(json& j, const SyncIssue& issue) {
    j = json{
        {"entity_type", issue.entity_type},
        {"entity_id", issue.entity_id},
        {"kind", issue.kind},
        {"message", issue.message},
    };
    put_optional(j, "sequence", issue.sequence);
}

void from_json(const json& j, SyncIssue& issue) {
    issue.entity_type = j.value("entity_type", "");
    issue.entity_id = j.value("entity_id", "");
    j.at("kind").get_to(issue.kind);
    issue.message = j.value("message", "");
    issue.sequence = get_optional<std::uint64_t>(j, "sequence");
}

void to_json(json& j, const SessionResult& result) {
    j = json{
        {"session_id", result.session_id},
        {"started_at", result.started_at},
        {"finished_at", result.finished_at},
        {"outcome", result.outcome},
        {"stats", result.stats},
        {"issues", result.issues},
        {"unresolved_entities", result.unresolved_entities},
        {"failed_entities", result.failed_entities},
        {"capability", result.capability},
    };
    put_optional(j, "error", result.error);
}

void from_json(const json& j, SessionResult& result) {
    j.at("session_id").get_to(result.session_id);
    j.at("started_at").get_to(result.started_at);
    j.at("finished_at").get_to(result.finished_at);
    j.at("outcome").get_to(result.outcome);
    j.at("stats").get_to(result.stats);
    result.issues = j.value("issues", std::vector<SyncIssue>{});
    result.unresolved_entities = j.value("unresolved_entities", std::vector<std::string>{});
    result.failed_entities = j.value("failed_entities", std::vector<std::string>{});
    j.at("capability").get_to(result.capability);
    result.error = get_optional<Error>(j, "error");
}

} // namespace osync::sync
