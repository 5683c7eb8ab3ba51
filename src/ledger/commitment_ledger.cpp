#include <spdlog/spdlog.h>
#include <boost/multiprecision/cpp_int.hpp>
#include <covenant/blake3/hash.hpp>
#include <covenant/ledger/commitment_ledger.hpp>
#include <covenant/schema/key/keys.hpp>
#include <covenant/schema/token_metadata.hpp>
#include <string>
#include <string_view>
#include <utility>

using namespace covenant::schema;

namespace {

constexpr auto kCodespace = std::string_view{"covenant.ledger"};
constexpr auto kCommitmentIdDomain = std::string_view{"covenant.commitment"};

template <typename T = std::monostate>
operation_result<T> reject(const error_code code, std::string log) {
  spdlog::debug("Ledger rejected operation: {} ({})", log, to_string(code));
  return make_failure<T>(code, kCodespace, std::move(log));
}

std::string commitment_label(const commitment_id_t& commitment_id) {
  return "commitment " + to_hex(commitment_id);
}

status_t validate_terms(const amount_t& amount, const commitment_rules_t& rules) {
  if (amount <= 0) {
    return reject(error_code::invalid_amount, "amount must be positive");
  }
  if (rules.duration_days == 0) {
    return reject(error_code::invalid_duration, "duration must be positive");
  }
  if (rules.max_loss_percent > 100) {
    return reject(error_code::invalid_max_loss,
                  "max loss percent must not exceed 100");
  }
  if (rules.early_exit_penalty_percent > 100) {
    return reject(error_code::invalid_penalty,
                  "early exit penalty percent must not exceed 100");
  }
  if (!is_known(rules.commitment_type)) {
    return reject(error_code::invalid_commitment_type,
                  "commitment type must be safe, balanced or aggressive");
  }
  return make_success();
}

// Settled and early-exited commitments never change status again.
status_t require_active(const commitment_t& commitment) {
  return std::visit(
      overloaded{[](const active_status&) { return make_success(); },
                 [&](const settled_status&) {
                   return reject(error_code::already_settled,
                                 commitment_label(commitment.commitment_id) +
                                     " is already settled");
                 },
                 [&](const early_exit_status&) {
                   return reject(error_code::invalid_status_transition,
                                 commitment_label(commitment.commitment_id) +
                                     " already exited early");
                 }},
      commitment.status);
}

amount_t percent_of(const amount_t& amount, const uint32_t percent) {
  auto wide = boost::multiprecision::int256_t{amount} * percent / 100;
  return wide.convert_to<amount_t>();
}

}  // namespace

namespace covenant::ledger {

commitment_ledger::commitment_ledger(
    covenant::schema::encoding::scale_encoder_t& encoder,
    covenant::storage::rocksdb_storage_t& storage,
    covenant::registry::ownership_registry& registry,
    covenant::execution::host host,
    address_t self)
    : encoder_{encoder},
      storage_{storage},
      registry_{registry},
      host_{std::move(host)},
      self_{self} {}

status_t commitment_ledger::initialize(const address_t& admin) {
  auto admin_key = key::make_prefix_key(encoder_, key::kLedgerAdminKey);
  if (storage_.contains(admin_key)) {
    return reject(error_code::already_initialized, "ledger already initialized");
  }
  auto writes = covenant::storage::write_set{};
  writes.put(encoder_, admin_key, admin);
  writes.put(encoder_, key::make_prefix_key(encoder_, key::kLedgerCounterKey),
             uint64_t{0});
  storage_.commit(writes);
  spdlog::info("Commitment ledger initialized with admin {}", to_hex(admin));
  return make_success();
}

operation_result<commitment_id_t> commitment_ledger::create_commitment(
    const address_t& owner,
    const amount_t amount,
    const asset_id_t& asset,
    const commitment_rules_t& rules) {
  if (!get_admin()) {
    return reject<commitment_id_t>(error_code::not_initialized,
                                   "ledger not initialized");
  }
  if (!host_.require_auth(owner)) {
    return reject<commitment_id_t>(error_code::authorization_denied,
                                   "owner authorization required");
  }
  if (auto validation = validate_terms(amount, rules); !validation) {
    return propagate_failure<commitment_id_t>(validation);
  }

  auto sequence = get_total_commitments() + 1;
  auto created_at = host_.now();
  auto expires_at =
      created_at + (static_cast<timestamp_seconds_t>(rules.duration_days) *
                    kSecondsPerDay);
  auto commitment_id = make_commitment_id(sequence, owner, created_at);

  auto metadata = token_metadata_t{};
  metadata.commitment_id = commitment_id;
  metadata.duration_days = rules.duration_days;
  metadata.max_loss_percent = rules.max_loss_percent;
  metadata.commitment_type = rules.commitment_type;
  metadata.created_at = created_at;
  metadata.expires_at = expires_at;
  metadata.initial_amount = amount;
  metadata.asset = asset;

  auto minted = registry_.mint(owner, metadata);
  if (!minted) {
    return propagate_failure<commitment_id_t>(minted);
  }

  auto commitment = commitment_t{};
  commitment.commitment_id = commitment_id;
  commitment.owner = owner;
  commitment.token_id = *minted;
  commitment.rules = rules;
  commitment.amount = amount;
  commitment.asset = asset;
  commitment.created_at = created_at;
  commitment.expires_at = expires_at;
  commitment.current_value = amount;
  commitment.status = active_status{};

  auto owner_commitments = get_owner_commitments(owner);
  owner_commitments.push_back(commitment_id);

  auto writes = covenant::storage::write_set{};
  writes.put(encoder_, key::make_prefix_key(encoder_, key::kLedgerCounterKey),
             sequence);
  writes.put(encoder_, key::make_commitment_key(encoder_, commitment_id),
             commitment);
  writes.put(encoder_, key::make_owner_commitments_key(encoder_, owner),
             owner_commitments);
  storage_.commit(writes);

  spdlog::info("Created {} for owner {} (token {}, {} {}, expires at {})",
               commitment_label(commitment_id), to_hex(owner), *minted,
               to_string(rules.commitment_type), to_string(amount), expires_at);
  host_.publish(covenant::execution::make_event(
      "commitment_created",
      {{"commitment_id", to_hex(commitment_id)},
       {"owner", to_hex(owner)},
       {"token_id", std::to_string(*minted)},
       {"amount", to_string(amount)},
       {"expires_at", std::to_string(expires_at)}}));
  return make_success(commitment_id);
}

status_t commitment_ledger::update_value(const commitment_id_t& commitment_id,
                                        const amount_t new_value) {
  auto admin = get_admin();
  if (!admin) {
    return reject(error_code::not_initialized, "ledger not initialized");
  }
  if (!host_.require_auth(*admin)) {
    return reject(error_code::authorization_denied,
                  "admin authorization required");
  }
  if (new_value < 0) {
    return reject(error_code::invalid_amount, "value must not be negative");
  }
  auto commitment = load(commitment_id);
  if (!commitment) {
    return reject(error_code::commitment_not_found,
                  commitment_label(commitment_id));
  }

  commitment->current_value = new_value;
  store(*commitment);

  spdlog::debug("Updated {} value to {}", commitment_label(commitment_id),
                to_string(new_value));
  host_.publish(covenant::execution::make_event(
      "value_updated", {{"commitment_id", to_hex(commitment_id)},
                        {"current_value", to_string(new_value)}}));
  return make_success();
}

status_t commitment_ledger::settle(const commitment_id_t& commitment_id) {
  if (!get_admin()) {
    return reject(error_code::not_initialized, "ledger not initialized");
  }
  auto commitment = load(commitment_id);
  if (!commitment) {
    return reject(error_code::commitment_not_found,
                  commitment_label(commitment_id));
  }
  if (!host_.require_auth(commitment->owner)) {
    return reject(error_code::authorization_denied,
                  "owner authorization required");
  }
  if (auto transition = require_active(*commitment); !transition) {
    return transition;
  }
  auto now = host_.now();
  if (now < commitment->expires_at) {
    return reject(error_code::not_expired,
                  commitment_label(commitment_id) + " expires at " +
                      std::to_string(commitment->expires_at));
  }

  if (auto settled = registry_.settle(commitment->token_id); !settled) {
    return settled;
  }

  commitment->status = settled_status{.settled_at = now};
  store(*commitment);

  spdlog::info("Settled {} at {}", commitment_label(commitment_id), now);
  host_.publish(covenant::execution::make_event(
      "commitment_settled", {{"commitment_id", to_hex(commitment_id)},
                             {"settled_at", std::to_string(now)},
                             {"final_value",
                              to_string(commitment->current_value)}}));
  return make_success();
}

operation_result<amount_t> commitment_ledger::early_exit(
    const commitment_id_t& commitment_id,
    const address_t& caller) {
  if (!get_admin()) {
    return reject<amount_t>(error_code::not_initialized,
                            "ledger not initialized");
  }
  auto commitment = load(commitment_id);
  if (!commitment) {
    return reject<amount_t>(error_code::commitment_not_found,
                            commitment_label(commitment_id));
  }
  if (commitment->owner != caller) {
    return reject<amount_t>(error_code::not_owner,
                            "caller does not own " +
                                commitment_label(commitment_id));
  }
  if (!host_.require_auth(caller)) {
    return reject<amount_t>(error_code::authorization_denied,
                            "owner authorization required");
  }
  if (auto transition = require_active(*commitment); !transition) {
    return propagate_failure<amount_t>(transition);
  }

  auto penalty = percent_of(commitment->amount,
                            commitment->rules.early_exit_penalty_percent);
  if (auto exited = registry_.early_exit(commitment->token_id, penalty);
      !exited) {
    return propagate_failure<amount_t>(exited);
  }

  auto now = host_.now();
  commitment->status = early_exit_status{.exited_at = now, .penalty = penalty};
  store(*commitment);

  spdlog::info("{} exited early at {} with penalty {}",
               commitment_label(commitment_id), now, to_string(penalty));
  host_.publish(covenant::execution::make_event(
      "commitment_early_exit", {{"commitment_id", to_hex(commitment_id)},
                                {"penalty", to_string(penalty)},
                                {"exited_at", std::to_string(now)}}));
  return make_success(penalty);
}

operation_result<commitment_t> commitment_ledger::get_commitment(
    const commitment_id_t& commitment_id) const {
  auto commitment = load(commitment_id);
  if (!commitment) {
    return make_failure<commitment_t>(error_code::commitment_not_found,
                                      kCodespace,
                                      commitment_label(commitment_id));
  }
  return make_success(std::move(*commitment));
}

std::vector<commitment_id_t> commitment_ledger::get_owner_commitments(
    const address_t& owner) const {
  return storage_
      .get<std::vector<commitment_id_t>>(
          encoder_, key::make_owner_commitments_key(encoder_, owner))
      .value_or(std::vector<commitment_id_t>{});
}

uint64_t commitment_ledger::get_total_commitments() const {
  return storage_
      .get<uint64_t>(encoder_,
                     key::make_prefix_key(encoder_, key::kLedgerCounterKey))
      .value_or(0);
}

std::optional<address_t> commitment_ledger::get_admin() const {
  return storage_.get<address_t>(
      encoder_, key::make_prefix_key(encoder_, key::kLedgerAdminKey));
}

commitment_id_t commitment_ledger::make_commitment_id(
    const uint64_t sequence,
    const address_t& owner,
    const timestamp_seconds_t created_at) const {
  auto preimage = encoder_.encode(kCommitmentIdDomain);
  encoder_.encode(sequence, preimage);
  encoder_.encode(owner, preimage);
  encoder_.encode(created_at, preimage);
  return covenant::blake3::hash(make_bytes_view(preimage));
}

std::optional<commitment_t> commitment_ledger::load(
    const commitment_id_t& commitment_id) const {
  return storage_.get<commitment_t>(
      encoder_, key::make_commitment_key(encoder_, commitment_id));
}

void commitment_ledger::store(const commitment_t& commitment) const {
  storage_.put(encoder_,
               key::make_commitment_key(encoder_, commitment.commitment_id),
               commitment);
}

}  // namespace covenant::ledger
