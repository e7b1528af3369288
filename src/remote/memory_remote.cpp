#include "osync/remote/memory_remote.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <thread>

namespace osync::remote {

const char* to_string(PushOutcome::Kind kind) noexcept {
    switch (kind) {
        case PushOutcome::Kind::Acked: return "acked";
        case PushOutcome::Kind::ValidationError: return "validation_error";
        case PushOutcome::Kind::TransientError: return "transient_error";
        case PushOutcome::Kind::Conflict: return "conflict";
        case PushOutcome::Kind::Deferred: return "deferred";
    }
    return "unknown";
}

InMemoryRemoteService::InMemoryRemoteService(const Clock& clock, std::string version)
    : clock_(clock), version_(std::move(version)) {}

Result<std::string> InMemoryRemoteService::get_server_info(std::chrono::milliseconds timeout) {
    bool timed_out = false;
    simulate_latency(timeout, timed_out);
    if (timed_out) {
        return Err<std::string>(ErrorKind::Network, "server info request timed out");
    }

    std::lock_guard lock(mutex_);
    if (auto res = enter_locked(failing_probes_, probe_failure_, "server info"); res.is_error()) {
        return Err<std::string>(res.error());
    }
    return Ok(version_);
}

Result<DeltaBatch> InMemoryRemoteService::fetch_deltas(const std::string& collection,
                                                       const std::string& token,
                                                       std::chrono::milliseconds timeout) {
    bool timed_out = false;
    simulate_latency(timeout, timed_out);
    if (timed_out) {
        return Err<DeltaBatch>(ErrorKind::Network, "delta request timed out");
    }

    std::lock_guard lock(mutex_);
    ++fetch_calls_;
    requested_tokens_.push_back(token);
    if (auto res = enter_locked(failing_pulls_, pull_failure_, "delta pull"); res.is_error()) {
        return Err<DeltaBatch>(res.error());
    }

    std::uint64_t from = 0;
    if (!token.empty()) {
        try {
            from = std::stoull(token);
        } catch (const std::exception&) {
            return Err<DeltaBatch>(ErrorKind::InvalidArgument, "unknown delta token '" + token + "'");
        }
    }

    std::vector<const Stored*> changed;
    for (const auto& [key, stored] : entities_) {
        if (key.first == collection && stored.change_index > from) {
            changed.push_back(&stored);
        }
    }
    std::sort(changed.begin(), changed.end(), [](const Stored* a, const Stored* b) {
        return a->change_index < b->change_index;
    });

    DeltaBatch batch;
    const std::size_t count = std::min(changed.size(), page_size_);
    for (std::size_t i = 0; i < count; ++i) {
        batch.records.push_back(changed[i]->record);
    }
    batch.has_more = changed.size() > count;
    batch.next_token = count > 0 ? std::to_string(changed[count - 1]->change_index)
                                 : std::to_string(std::max(from, change_counter_));
    return Ok(std::move(batch));
}

Result<std::vector<PushOutcome>> InMemoryRemoteService::push_batch(const PushRequest& request,
                                                                   std::chrono::milliseconds timeout) {
    bool timed_out = false;
    simulate_latency(timeout, timed_out);
    if (timed_out) {
        return Err<std::vector<PushOutcome>>(ErrorKind::Network, "push request timed out");
    }

    std::lock_guard lock(mutex_);
    ++push_calls_;
    push_batch_sizes_.push_back(request.records.size());
    if (auto res = enter_locked(failing_pushes_, push_failure_, "push"); res.is_error()) {
        return Err<std::vector<PushOutcome>>(res.error());
    }

    BatchState state;
    std::vector<PushOutcome> outcomes;
    outcomes.reserve(request.records.size());
    for (const auto& record : request.records) {
        outcomes.push_back(apply_locked(record, request.conditional, state));
    }

    if (dropped_acks_ > 0) {
        --dropped_acks_;
        spdlog::debug("[MemoryRemote] applied {} record(s), dropping the response", outcomes.size());
        return Err<std::vector<PushOutcome>>(ErrorKind::Network, "connection reset before response");
    }
    return Ok(std::move(outcomes));
}

sync::RemoteRecord InMemoryRemoteService::put_remote(const std::string& entity_type,
                                                     const std::string& entity_id,
                                                     sync::json payload,
                                                     std::optional<Timestamp> last_updated) {
    std::lock_guard lock(mutex_);
    return write_locked(entity_type, entity_id, std::move(payload), false,
                        last_updated.value_or(clock_.now()), "");
}

sync::RemoteRecord InMemoryRemoteService::delete_remote(const std::string& entity_type,
                                                        const std::string& entity_id,
                                                        std::optional<Timestamp> last_updated) {
    std::lock_guard lock(mutex_);
    return write_locked(entity_type, entity_id, sync::json(), true, last_updated.value_or(clock_.now()), "");
}

std::optional<sync::RemoteRecord> InMemoryRemoteService::get(const std::string& entity_type,
                                                             const std::string& entity_id) const {
    std::lock_guard lock(mutex_);
    auto it = entities_.find({entity_type, entity_id});
    if (it == entities_.end()) {
        return std::nullopt;
    }
    return it->second.record;
}

std::vector<sync::RemoteRecord> InMemoryRemoteService::list(const std::string& entity_type) const {
    std::lock_guard lock(mutex_);
    std::vector<sync::RemoteRecord> out;
    for (const auto& [key, stored] : entities_) {
        if (key.first == entity_type && !stored.record.deleted) {
            out.push_back(stored.record);
        }
    }
    return out;
}

void InMemoryRemoteService::set_version(std::string version) {
    std::lock_guard lock(mutex_);
    version_ = std::move(version);
}

void InMemoryRemoteService::set_reachable(bool reachable) {
    std::lock_guard lock(mutex_);
    reachable_ = reachable;
}

void InMemoryRemoteService::set_auth_valid(bool valid) {
    std::lock_guard lock(mutex_);
    auth_valid_ = valid;
}

void InMemoryRemoteService::set_latency(std::chrono::milliseconds latency) {
    std::lock_guard lock(mutex_);
    latency_ = latency;
}

void InMemoryRemoteService::set_page_size(std::size_t page_size) {
    std::lock_guard lock(mutex_);
    page_size_ = std::max<std::size_t>(1, page_size);
}

void InMemoryRemoteService::set_validator(Validator validator) {
    std::lock_guard lock(mutex_);
    validator_ = std::move(validator);
}

void InMemoryRemoteService::fail_next_probes(std::size_t count, ErrorKind kind) {
    std::lock_guard lock(mutex_);
    failing_probes_ = count;
    probe_failure_ = kind;
}

void InMemoryRemoteService::fail_next_pulls(std::size_t count, ErrorKind kind) {
    std::lock_guard lock(mutex_);
    failing_pulls_ = count;
    pull_failure_ = kind;
}

void InMemoryRemoteService::fail_next_pushes(std::size_t count, ErrorKind kind) {
    std::lock_guard lock(mutex_);
    failing_pushes_ = count;
    push_failure_ = kind;
}

void InMemoryRemoteService::fail_next_records(std::size_t count) {
    std::lock_guard lock(mutex_);
    failing_records_ = count;
}

void InMemoryRemoteService::drop_next_acks(std::size_t count) {
    std::lock_guard lock(mutex_);
    dropped_acks_ = count;
}

std::size_t InMemoryRemoteService::apply_count() const {
    std::lock_guard lock(mutex_);
    return apply_count_;
}

std::size_t InMemoryRemoteService::push_calls() const {
    std::lock_guard lock(mutex_);
    return push_calls_;
}

std::size_t InMemoryRemoteService::fetch_calls() const {
    std::lock_guard lock(mutex_);
    return fetch_calls_;
}

std::vector<std::size_t> InMemoryRemoteService::push_batch_sizes() const {
    std::lock_guard lock(mutex_);
    return push_batch_sizes_;
}

std::vector<std::string> InMemoryRemoteService::requested_tokens() const {
    std::lock_guard lock(mutex_);
    return requested_tokens_;
}

Result<void> InMemoryRemoteService::enter_locked(std::size_t& injected, ErrorKind kind, const char* what) {
    if (!reachable_) {
        return Err<void>(ErrorKind::Network, std::string(what) + ": remote unreachable");
    }
    if (!auth_valid_) {
        return Err<void>(ErrorKind::Auth, std::string(what) + ": credentials rejected");
    }
    if (injected > 0) {
        --injected;
        return Err<void>(kind, std::string(what) + ": injected failure");
    }
    return Ok();
}

void InMemoryRemoteService::simulate_latency(std::chrono::milliseconds timeout, bool& timed_out) const {
    std::chrono::milliseconds latency;
    {
        std::lock_guard lock(mutex_);
        latency = latency_;
    }
    if (latency.count() <= 0) {
        return;
    }
    timed_out = latency > timeout;
    std::this_thread::sleep_for(std::min(latency, timeout));
}

sync::RemoteRecord InMemoryRemoteService::write_locked(const std::string& entity_type,
                                                       const std::string& entity_id,
                                                       sync::json payload,
                                                       bool deleted,
                                                       Timestamp last_updated,
                                                       const std::string& origin_client_id) {
    auto& stored = entities_[{entity_type, entity_id}];
    ++stored.revision;
    stored.change_index = ++change_counter_;

    auto& record = stored.record;
    record.entity_type = entity_type;
    record.entity_id = entity_id;
    record.revision = std::to_string(stored.revision);
    record.last_updated = last_updated;
    record.payload = deleted ? sync::json() : std::move(payload);
    record.deleted = deleted;
    record.origin_client_id = origin_client_id;
    return record;
}

PushOutcome InMemoryRemoteService::apply_locked(const sync::ChangeRecord& record,
                                                bool conditional,
                                                BatchState& state) {
    PushOutcome outcome;
    outcome.sequence = record.sequence;
    outcome.client_id = record.client_id;

    if (auto it = applied_.find(record.client_id); it != applied_.end()) {
        outcome = it->second;
        outcome.sequence = record.sequence;
        return outcome;
    }

    const EntityKey key{record.entity_type, record.entity_id};
    if (state.halted.count(key) > 0) {
        outcome.kind = PushOutcome::Kind::Deferred;
        outcome.message = "earlier change of the entity was not accepted";
        return outcome;
    }

    if (failing_records_ > 0) {
        --failing_records_;
        state.halted.insert(key);
        outcome.kind = PushOutcome::Kind::TransientError;
        outcome.message = "temporarily unavailable";
        return outcome;
    }

    if (validator_) {
        if (auto rejection = validator_(record); rejection.has_value()) {
            state.halted.insert(key);
            outcome.kind = PushOutcome::Kind::ValidationError;
            outcome.message = *rejection;
            return outcome;
        }
    }

    auto it = entities_.find(key);
    const std::string current = it != entities_.end() ? it->second.record.revision : std::string();
    if (conditional) {
        auto before = state.revision_before.find(key);
        const std::string& expected = before != state.revision_before.end() ? before->second : current;
        if (record.base_revision != expected) {
            state.halted.insert(key);
            outcome.kind = PushOutcome::Kind::Conflict;
            outcome.message = "base revision '" + record.base_revision + "' is stale, current is '" + current + "'";
            return outcome;
        }
    }
    state.revision_before.emplace(key, current);

    const auto written = write_locked(record.entity_type, record.entity_id, record.payload,
                                      record.operation == sync::Operation::Delete, clock_.now(),
                                      record.client_id);
    ++apply_count_;

    outcome.kind = PushOutcome::Kind::Acked;
    outcome.revision = written.revision;
    outcome.last_updated = written.last_updated;
    applied_[record.client_id] = outcome;
    return outcome;
}

} // namespace osync::remote
