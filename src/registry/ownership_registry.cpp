#include <spdlog/spdlog.h>
#include <algorithm>
#include <covenant/registry/ownership_registry.hpp>
#include <covenant/schema/key/keys.hpp>
#include <iterator>
#include <map>
#include <set>
#include <string>
#include <utility>

using namespace covenant::schema;

namespace {

constexpr auto kCodespace = std::string_view{"covenant.registry"};

template <typename T = std::monostate>
operation_result<T> reject(const error_code code, std::string log) {
  spdlog::debug("Registry rejected operation: {} ({})", log, to_string(code));
  return make_failure<T>(code, kCodespace, std::move(log));
}

std::string token_label(const token_id_t token_id) {
  return "token " + std::to_string(token_id);
}

status_t validate_metadata(const token_metadata_t& metadata) {
  if (metadata.duration_days == 0) {
    return reject(error_code::invalid_duration, "duration must be positive");
  }
  if (metadata.max_loss_percent > 100) {
    return reject(error_code::invalid_max_loss,
                  "max loss percent must not exceed 100");
  }
  if (!is_known(metadata.commitment_type)) {
    return reject(error_code::invalid_commitment_type,
                  "commitment type must be safe, balanced or aggressive");
  }
  if (metadata.initial_amount <= 0) {
    return reject(error_code::invalid_amount,
                  "initial amount must be positive");
  }
  return make_success();
}

}  // namespace

namespace covenant::registry {

// Per-call working copy of everything a transfer touches. Entries are loaded
// from storage on first use and written back once by `flush`.
struct ownership_registry::transfer_cache final {
  std::map<token_id_t, ownership_record_t> records;
  std::set<token_id_t> dirty_records;
  std::map<address_t, uint64_t> balances;
  std::map<address_t, std::vector<token_id_t>> owner_tokens;
  std::vector<transfer_request_t> applied;
};

ownership_registry::ownership_registry(
    covenant::schema::encoding::scale_encoder_t& encoder,
    covenant::storage::rocksdb_storage_t& storage,
    covenant::execution::host host,
    covenant::common::batch_limits limits)
    : encoder_{encoder},
      storage_{storage},
      host_{std::move(host)},
      limits_{limits} {}

status_t ownership_registry::initialize(const address_t& admin) {
  auto admin_key = key::make_prefix_key(encoder_, key::kRegistryAdminKey);
  if (storage_.contains(admin_key)) {
    return reject(error_code::already_initialized,
                  "registry already initialized");
  }
  auto writes = covenant::storage::write_set{};
  writes.put(encoder_, admin_key, admin);
  writes.put(encoder_,
             key::make_prefix_key(encoder_, key::kRegistryTokenCounterKey),
             token_id_t{0});
  storage_.commit(writes);
  spdlog::info("Ownership registry initialized with admin {}", to_hex(admin));
  return make_success();
}

operation_result<token_id_t> ownership_registry::mint(
    const address_t& owner,
    const token_metadata_t& metadata) {
  auto entered = guard_.try_enter();
  if (!entered) {
    return reject<token_id_t>(error_code::reentrancy_detected,
                              "mint re-entered while registry is busy");
  }
  if (auto admin_check = require_admin(); !admin_check) {
    return propagate_failure<token_id_t>(admin_check);
  }
  if (auto validation = validate_metadata(metadata); !validation) {
    return propagate_failure<token_id_t>(validation);
  }

  auto counter_key =
      key::make_prefix_key(encoder_, key::kRegistryTokenCounterKey);
  auto token_id =
      storage_.get<token_id_t>(encoder_, counter_key).value_or(0) + 1;

  auto record = ownership_record_t{};
  record.token_id = token_id;
  record.owner = owner;
  record.metadata = metadata;
  record.is_active = true;

  auto owner_tokens = tokens_of_owner(owner);
  owner_tokens.push_back(token_id);
  auto token_ids = all_token_ids();
  token_ids.push_back(token_id);

  auto writes = covenant::storage::write_set{};
  writes.put(encoder_, counter_key, token_id);
  writes.put(encoder_, key::make_token_key(encoder_, token_id), record);
  writes.put(encoder_, key::make_balance_key(encoder_, owner),
             balance_of(owner) + 1);
  writes.put(encoder_, key::make_owner_tokens_key(encoder_, owner),
             owner_tokens);
  writes.put(encoder_, key::make_prefix_key(encoder_, key::kRegistryTokenIdsKey),
             token_ids);
  storage_.commit(writes);

  spdlog::info("Minted {} for owner {}", token_label(token_id), to_hex(owner));
  host_.publish(covenant::execution::make_event(
      "mint", {{"token_id", std::to_string(token_id)},
               {"owner", to_hex(owner)},
               {"commitment_id", to_hex(metadata.commitment_id)}}));
  return make_success(token_id);
}

status_t ownership_registry::transfer(const address_t& from,
                                      const address_t& to,
                                      const token_id_t token_id) {
  auto entered = guard_.try_enter();
  if (!entered) {
    return reject(error_code::reentrancy_detected,
                  "transfer re-entered while registry is busy");
  }
  if (!admin()) {
    return reject(error_code::not_initialized, "registry not initialized");
  }

  auto cache = transfer_cache{};
  auto staged = stage_transfer(
      cache, transfer_request_t{.from = from, .to = to, .token_id = token_id});
  if (!staged) {
    return staged;
  }

  auto writes = covenant::storage::write_set{};
  flush(cache, writes);
  storage_.commit(writes);
  publish_transfers(cache);
  return make_success();
}

status_t ownership_registry::settle(const token_id_t token_id) {
  auto entered = guard_.try_enter();
  if (!entered) {
    return reject(error_code::reentrancy_detected,
                  "settle re-entered while registry is busy");
  }
  if (auto admin_check = require_admin(); !admin_check) {
    return admin_check;
  }

  auto record = load_token(token_id);
  if (!record) {
    return reject(error_code::token_not_found, token_label(token_id));
  }
  if (!record->is_active) {
    return reject(error_code::already_settled,
                  token_label(token_id) + " is already inactive");
  }
  if (host_.now() < record->metadata.expires_at) {
    return reject(error_code::not_expired,
                  token_label(token_id) + " has not expired");
  }

  record->is_active = false;
  storage_.put(encoder_, key::make_token_key(encoder_, token_id), *record);

  spdlog::info("Settled {}", token_label(token_id));
  host_.publish(covenant::execution::make_event(
      "settle", {{"token_id", std::to_string(token_id)}}));
  return make_success();
}

status_t ownership_registry::early_exit(const token_id_t token_id,
                                        const amount_t penalty) {
  auto entered = guard_.try_enter();
  if (!entered) {
    return reject(error_code::reentrancy_detected,
                  "early exit re-entered while registry is busy");
  }
  if (auto admin_check = require_admin(); !admin_check) {
    return admin_check;
  }

  auto record = load_token(token_id);
  if (!record) {
    return reject(error_code::token_not_found, token_label(token_id));
  }
  if (!record->is_active) {
    return reject(error_code::already_settled,
                  token_label(token_id) + " is already inactive");
  }

  record->is_active = false;
  record->early_exit_penalty = penalty;
  storage_.put(encoder_, key::make_token_key(encoder_, token_id), *record);

  spdlog::info("Deactivated {} after early exit (penalty {})",
               token_label(token_id), to_string(penalty));
  host_.publish(covenant::execution::make_event(
      "early_exit", {{"token_id", std::to_string(token_id)},
                     {"penalty", to_string(penalty)}}));
  return make_success();
}

operation_result<batch_result_t> ownership_registry::batch_transfer(
    const std::vector<transfer_request_t>& transfers,
    const batch_mode_t mode) {
  auto entered = guard_.try_enter();
  if (!entered) {
    return reject<batch_result_t>(
        error_code::reentrancy_detected,
        "batch transfer re-entered while registry is busy");
  }
  if (auto limit = covenant::common::enforce_batch_limits(
          limits_, transfers.size(), kCodespace);
      !limit) {
    return propagate_failure<batch_result_t>(limit);
  }
  if (!admin()) {
    return reject<batch_result_t>(error_code::not_initialized,
                                  "registry not initialized");
  }

  auto cache = transfer_cache{};
  auto result = covenant::common::run_batch(
      transfers, mode, [&](std::size_t, const transfer_request_t& request) {
        return stage_transfer(cache, request);
      });

  if (result.aborted) {
    const auto& failure = result.failures.front();
    auto aborted = reject<batch_result_t>(
        failure.code, "transfer #" + std::to_string(failure.index) + ": " +
                          failure.log);
    aborted.value = std::move(result);
    return aborted;
  }

  auto writes = covenant::storage::write_set{};
  flush(cache, writes);
  storage_.commit(writes);

  spdlog::info("Batch transfer ({}) applied {} of {} transfer(s) in {} write(s)",
               to_string(mode), result.succeeded, transfers.size(),
               writes.size());
  publish_transfers(cache);
  host_.publish(covenant::execution::make_event(
      "batch_transfer",
      {{"mode", std::string{to_string(mode)}},
       {"succeeded", std::to_string(result.succeeded)},
       {"failed", std::to_string(result.failures.size())}}));
  return make_success(std::move(result));
}

operation_result<address_t> ownership_registry::owner_of(
    const token_id_t token_id) const {
  auto record = load_token(token_id);
  if (!record) {
    return make_failure<address_t>(error_code::token_not_found, kCodespace,
                                   token_label(token_id));
  }
  return make_success(record->owner);
}

operation_result<token_metadata_t> ownership_registry::get_metadata(
    const token_id_t token_id) const {
  auto record = load_token(token_id);
  if (!record) {
    return make_failure<token_metadata_t>(error_code::token_not_found,
                                          kCodespace, token_label(token_id));
  }
  return make_success(record->metadata);
}

operation_result<ownership_record_t> ownership_registry::get_token(
    const token_id_t token_id) const {
  auto record = load_token(token_id);
  if (!record) {
    return make_failure<ownership_record_t>(error_code::token_not_found,
                                            kCodespace, token_label(token_id));
  }
  return make_success(std::move(*record));
}

bool ownership_registry::is_active(const token_id_t token_id) const {
  auto record = load_token(token_id);
  return record.has_value() && record->is_active;
}

uint64_t ownership_registry::balance_of(const address_t& owner) const {
  return storage_
      .get<uint64_t>(encoder_, key::make_balance_key(encoder_, owner))
      .value_or(0);
}

std::vector<token_id_t> ownership_registry::tokens_of_owner(
    const address_t& owner) const {
  return storage_
      .get<std::vector<token_id_t>>(
          encoder_, key::make_owner_tokens_key(encoder_, owner))
      .value_or(std::vector<token_id_t>{});
}

uint64_t ownership_registry::total_supply() const {
  return storage_
      .get<token_id_t>(encoder_, key::make_prefix_key(
                                     encoder_, key::kRegistryTokenCounterKey))
      .value_or(0);
}

std::vector<token_id_t> ownership_registry::all_token_ids() const {
  return storage_
      .get<std::vector<token_id_t>>(
          encoder_, key::make_prefix_key(encoder_, key::kRegistryTokenIdsKey))
      .value_or(std::vector<token_id_t>{});
}

std::optional<address_t> ownership_registry::admin() const {
  return storage_.get<address_t>(
      encoder_, key::make_prefix_key(encoder_, key::kRegistryAdminKey));
}

status_t ownership_registry::require_admin() const {
  auto stored_admin = admin();
  if (!stored_admin) {
    return reject(error_code::not_initialized, "registry not initialized");
  }
  if (!host_.require_auth(*stored_admin)) {
    return reject(error_code::authorization_denied,
                  "admin authorization required");
  }
  return make_success();
}

status_t ownership_registry::stage_transfer(
    transfer_cache& cache,
    const transfer_request_t& request) {
  if (!host_.require_auth(request.from)) {
    return reject(error_code::authorization_denied,
                  "sender authorization required for " +
                      token_label(request.token_id));
  }

  auto record = cache.records.find(request.token_id);
  if (record == std::end(cache.records)) {
    auto loaded = load_token(request.token_id);
    if (!loaded) {
      return reject(error_code::token_not_found,
                    token_label(request.token_id));
    }
    record = cache.records.emplace(request.token_id, std::move(*loaded)).first;
  }
  if (record->second.owner != request.from) {
    return reject(error_code::not_owner,
                  "sender does not own " + token_label(request.token_id));
  }

  auto cached_balance = [&](const address_t& owner) -> uint64_t& {
    auto found = cache.balances.find(owner);
    if (found == std::end(cache.balances)) {
      found = cache.balances.emplace(owner, balance_of(owner)).first;
    }
    return found->second;
  };
  auto cached_tokens = [&](const address_t& owner) -> std::vector<token_id_t>& {
    auto found = cache.owner_tokens.find(owner);
    if (found == std::end(cache.owner_tokens)) {
      found = cache.owner_tokens.emplace(owner, tokens_of_owner(owner)).first;
    }
    return found->second;
  };

  auto& from_balance = cached_balance(request.from);
  from_balance = from_balance > 0 ? from_balance - 1 : 0;
  ++cached_balance(request.to);

  auto& from_tokens = cached_tokens(request.from);
  from_tokens.erase(
      std::remove(std::begin(from_tokens), std::end(from_tokens),
                  request.token_id),
      std::end(from_tokens));
  cached_tokens(request.to).push_back(request.token_id);

  record->second.owner = request.to;
  cache.dirty_records.insert(request.token_id);
  cache.applied.push_back(request);
  return make_success();
}

void ownership_registry::flush(const transfer_cache& cache,
                               covenant::storage::write_set& writes) const {
  for (const auto token_id : cache.dirty_records) {
    writes.put(encoder_, key::make_token_key(encoder_, token_id),
               cache.records.at(token_id));
  }
  for (const auto& [owner, balance] : cache.balances) {
    writes.put(encoder_, key::make_balance_key(encoder_, owner), balance);
  }
  for (const auto& [owner, tokens] : cache.owner_tokens) {
    writes.put(encoder_, key::make_owner_tokens_key(encoder_, owner), tokens);
  }
}

void ownership_registry::publish_transfers(const transfer_cache& cache) const {
  for (const auto& request : cache.applied) {
    spdlog::info("Transferred {} from {} to {}", token_label(request.token_id),
                 to_hex(request.from), to_hex(request.to));
    host_.publish(covenant::execution::make_event(
        "transfer", {{"token_id", std::to_string(request.token_id)},
                     {"from", to_hex(request.from)},
                     {"to", to_hex(request.to)}}));
  }
}

std::optional<ownership_record_t> ownership_registry::load_token(
    const token_id_t token_id) const {
  return storage_.get<ownership_record_t>(
      encoder_, key::make_token_key(encoder_, token_id));
}

}  // namespace covenant::registry
