#include <spdlog/spdlog.h>
#include <covenant/compliance/compliance_engine.hpp>
#include <covenant/compliance/scoring.hpp>
#include <covenant/schema/key/keys.hpp>
#include <limits>
#include <string>
#include <string_view>
#include <utility>

using namespace covenant::schema;

namespace {

constexpr auto kCodespace = std::string_view{"covenant.compliance"};

template <typename T = std::monostate>
operation_result<T> reject(const error_code code, std::string log) {
  spdlog::debug("Compliance rejected operation: {} ({})", log,
                to_string(code));
  return make_failure<T>(code, kCodespace, std::move(log));
}

}  // namespace

namespace covenant::compliance {

compliance_engine::compliance_engine(
    covenant::schema::encoding::scale_encoder_t& encoder,
    covenant::storage::rocksdb_storage_t& storage,
    const covenant::ledger::commitment_ledger& ledger,
    covenant::execution::host host,
    covenant::execution::violation_oracle_t violation_oracle)
    : encoder_{encoder},
      storage_{storage},
      ledger_{ledger},
      host_{std::move(host)},
      violation_oracle_{std::move(violation_oracle)} {}

status_t compliance_engine::initialize(const address_t& admin) {
  auto admin_key = key::make_prefix_key(encoder_, key::kComplianceAdminKey);
  if (storage_.contains(admin_key)) {
    return reject(error_code::already_initialized,
                  "compliance engine already initialized");
  }
  storage_.put(encoder_, admin_key, admin);
  spdlog::info("Compliance engine initialized with admin {}", to_hex(admin));
  return make_success();
}

status_t compliance_engine::attest(const address_t& caller,
                                   const commitment_id_t& commitment_id,
                                   const attestation_type_t type,
                                   const attestation_payload_t& payload,
                                   const bool positive) {
  if (!get_admin()) {
    return reject(error_code::not_initialized,
                  "compliance engine not initialized");
  }
  if (!host_.require_auth(caller)) {
    return reject(error_code::authorization_denied,
                  "attester authorization required");
  }

  auto now = host_.now();
  auto state = load_state(commitment_id);
  auto previous_score = state.compliance_score;
  state.compliance_score = apply_delta(
      state.compliance_score, attestation_delta(type, payload, positive));
  state.last_attestation = now;

  auto record = attestation_t{};
  record.commitment_id = commitment_id;
  record.type = type;
  record.payload = payload;
  record.positive = positive;
  record.verifier = caller;
  record.timestamp = now;

  auto writes = covenant::storage::write_set{};
  writes.put(encoder_,
             key::make_attestation_key(encoder_, commitment_id,
                                       state.attestation_count),
             record);
  ++state.attestation_count;
  writes.put(encoder_, key::make_compliance_state_key(encoder_, commitment_id),
             state);
  storage_.commit(writes);

  spdlog::info("Recorded {} attestation for commitment {} (score {} -> {})",
               to_string(type), to_hex(commitment_id), previous_score,
               state.compliance_score);
  host_.publish(covenant::execution::make_event(
      "attestation", {{"commitment_id", to_hex(commitment_id)},
                      {"type", std::string{to_string(type)}},
                      {"verifier", to_hex(caller)},
                      {"positive", positive ? "true" : "false"},
                      {"compliance_score",
                       std::to_string(state.compliance_score)}}));
  return make_success();
}

std::vector<attestation_t> compliance_engine::get_attestations(
    const commitment_id_t& commitment_id) const {
  auto entries = storage_.list_by_prefix(
      key::make_attestation_prefix_key(encoder_, commitment_id));
  auto attestations = std::vector<attestation_t>{};
  attestations.reserve(entries.size());
  for (const auto& [key, value] : entries) {
    attestations.push_back(encoder_.decode<attestation_t>(value));
  }
  return attestations;
}

uint32_t compliance_engine::calculate_compliance_score(
    const commitment_id_t& commitment_id) const {
  return recompute_score(make_snapshot(snapshot(commitment_id)), host_.now());
}

bool compliance_engine::verify_compliance(
    const commitment_id_t& commitment_id) const {
  auto current = make_snapshot(snapshot(commitment_id));
  auto drawdown = drawdown_percent(current.amount, current.current_value);
  if (drawdown > static_cast<int64_t>(current.max_loss_percent)) {
    return false;
  }
  if (violation_oracle_ && violation_oracle_(commitment_id)) {
    return false;
  }
  return true;
}

health_metrics_t compliance_engine::get_health_metrics(
    const commitment_id_t& commitment_id) const {
  auto current = make_snapshot(snapshot(commitment_id));
  auto state = load_state(commitment_id);

  auto metrics = health_metrics_t{};
  metrics.commitment_id = commitment_id;
  metrics.initial_value = current.amount;
  metrics.current_value = current.current_value;
  metrics.drawdown_percent = state.drawdown_override.value_or(
      drawdown_percent(current.amount, current.current_value));
  metrics.fees_generated = state.fees_generated;
  metrics.last_attestation = state.last_attestation;
  metrics.compliance_score = state.compliance_score;
  return metrics;
}

status_t compliance_engine::record_fees(const commitment_id_t& commitment_id,
                                        const amount_t amount) {
  if (auto admin_check = require_admin(); !admin_check) {
    return admin_check;
  }
  if (amount <= 0) {
    return reject(error_code::invalid_amount, "fee amount must be positive");
  }
  auto state = load_state(commitment_id);
  if (state.fees_generated > std::numeric_limits<amount_t>::max() - amount) {
    return reject(error_code::invalid_amount,
                  "fee total would exceed the amount range");
  }
  state.fees_generated += amount;
  storage_.put(encoder_, key::make_compliance_state_key(encoder_, commitment_id),
               state);

  spdlog::debug("Recorded {} in fees for commitment {}", to_string(amount),
                to_hex(commitment_id));
  host_.publish(covenant::execution::make_event(
      "fees_recorded", {{"commitment_id", to_hex(commitment_id)},
                        {"amount", to_string(amount)},
                        {"fees_generated",
                         to_string(state.fees_generated)}}));
  return make_success();
}

status_t compliance_engine::record_drawdown(
    const commitment_id_t& commitment_id,
    const int64_t percent) {
  if (auto admin_check = require_admin(); !admin_check) {
    return admin_check;
  }
  auto state = load_state(commitment_id);
  state.drawdown_override = percent;
  storage_.put(encoder_, key::make_compliance_state_key(encoder_, commitment_id),
               state);

  spdlog::debug("Recorded drawdown override {}% for commitment {}", percent,
                to_hex(commitment_id));
  host_.publish(covenant::execution::make_event(
      "drawdown_recorded", {{"commitment_id", to_hex(commitment_id)},
                            {"drawdown_percent", std::to_string(percent)}}));
  return make_success();
}

uint32_t compliance_engine::get_stored_score(
    const commitment_id_t& commitment_id) const {
  return load_state(commitment_id).compliance_score;
}

std::optional<address_t> compliance_engine::get_admin() const {
  return storage_.get<address_t>(
      encoder_, key::make_prefix_key(encoder_, key::kComplianceAdminKey));
}

status_t compliance_engine::require_admin() const {
  auto admin = get_admin();
  if (!admin) {
    return reject(error_code::not_initialized,
                  "compliance engine not initialized");
  }
  if (!host_.require_auth(*admin)) {
    return reject(error_code::authorization_denied,
                  "admin authorization required");
  }
  return make_success();
}

compliance_state_t compliance_engine::load_state(
    const commitment_id_t& commitment_id) const {
  auto state = storage_.get<compliance_state_t>(
      encoder_, key::make_compliance_state_key(encoder_, commitment_id));
  if (state) {
    return *state;
  }
  auto fresh = compliance_state_t{};
  fresh.commitment_id = commitment_id;
  return fresh;
}

std::optional<commitment_t> compliance_engine::snapshot(
    const commitment_id_t& commitment_id) const {
  auto commitment = ledger_.get_commitment(commitment_id);
  if (!commitment) {
    return std::nullopt;
  }
  return commitment.value;
}

}  // namespace covenant::compliance
