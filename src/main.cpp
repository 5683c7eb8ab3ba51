#include <spdlog/async.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <boost/program_options.hpp>
#include <covenant/blake3/hash.hpp>
#include <covenant/common/batch.hpp>
#include <covenant/common/critical.hpp>
#include <covenant/compliance/compliance_engine.hpp>
#include <covenant/execution/host.hpp>
#include <covenant/ledger/commitment_ledger.hpp>
#include <covenant/registry/ownership_registry.hpp>
#include <covenant/schema/encoding/scale/encoder.hpp>
#include <covenant/storage/rocksdb/storage.hpp>

#include <cstdint>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace {

namespace po = boost::program_options;
using namespace covenant::schema;

constexpr auto kLedgerPrincipalLabel = std::string_view{"covenant.ledger"};

// Principals are given either as 32-byte hex or as a label, which is hashed
// into an address so the same label always names the same principal.
address_t parse_address(const std::string& value) {
  if (auto hash = try_make_hash32(value)) {
    return *hash;
  }
  return covenant::blake3::hash(std::string_view{value});
}

address_t get_address(const po::variables_map& vm, const std::string& name) {
  if (!vm.contains(name)) {
    covenant::common::critical("missing required --" + name);
  }
  return parse_address(vm[name].as<std::string>());
}

commitment_id_t get_commitment_id(const po::variables_map& vm) {
  if (!vm.contains("commitment-id")) {
    covenant::common::critical("missing required --commitment-id");
  }
  auto id = try_make_hash32(vm["commitment-id"].as<std::string>());
  if (!id) {
    covenant::common::critical("--commitment-id must be 32-byte hex");
  }
  return *id;
}

template <typename T>
T get_required(const po::variables_map& vm, const std::string& name) {
  if (!vm.contains(name)) {
    covenant::common::critical("missing required --" + name);
  }
  return vm[name].as<T>();
}

template <typename Enum>
Enum get_enum(const po::variables_map& vm, const std::string& name) {
  auto parsed = try_from_string<Enum>(get_required<std::string>(vm, name));
  if (!parsed) {
    covenant::common::critical("unrecognized value for --" + name);
  }
  return *parsed;
}

amount_t parse_amount(const std::string& value, const std::string& name) {
  auto amount = try_parse_amount(value);
  if (!amount) {
    covenant::common::critical("--" + name + " must be a decimal amount");
  }
  return *amount;
}

amount_t get_amount(const po::variables_map& vm, const std::string& name) {
  return parse_amount(get_required<std::string>(vm, name), name);
}

token_id_t parse_token_id(const std::string& value, const std::string& name) {
  auto token_id = try_parse_token_id(value);
  if (!token_id) {
    covenant::common::critical("--" + name + " must be a token id");
  }
  return *token_id;
}

token_id_t get_token_id(const po::variables_map& vm) {
  return parse_token_id(get_required<std::string>(vm, "token-id"), "token-id");
}

attestation_payload_t parse_payload(const po::variables_map& vm) {
  auto payload = attestation_payload_t{};
  if (!vm.contains("data")) {
    return payload;
  }
  for (const auto& entry : vm["data"].as<std::vector<std::string>>()) {
    auto separator = entry.find('=');
    if (separator == std::string::npos) {
      covenant::common::critical("--data entries must be key=value");
    }
    payload[entry.substr(0, separator)] = entry.substr(separator + 1);
  }
  return payload;
}

// from:to:token_id
transfer_request_t parse_transfer(const std::string& value) {
  auto first = value.find(':');
  auto second = value.find(':', first == std::string::npos ? first : first + 1);
  if (first == std::string::npos || second == std::string::npos) {
    covenant::common::critical("--transfer entries must be from:to:token_id");
  }
  auto request = transfer_request_t{};
  request.from = parse_address(value.substr(0, first));
  request.to = parse_address(value.substr(first + 1, second - first - 1));
  request.token_id = parse_token_id(value.substr(second + 1), "transfer");
  return request;
}

template <typename T>
int report(const operation_result<T>& result) {
  if (result) {
    return 0;
  }
  std::cerr << "error: " << to_string(result.code) << " (" << result.codespace
            << "): " << result.log << '\n';
  return 1;
}

void print_commitment(const commitment_t& commitment) {
  std::cout << "commitment_id: " << to_hex(commitment.commitment_id) << '\n'
            << "owner: " << to_hex(commitment.owner) << '\n'
            << "token_id: " << commitment.token_id << '\n'
            << "type: " << to_string(commitment.rules.commitment_type) << '\n'
            << "amount: " << commitment.amount << '\n'
            << "current_value: " << commitment.current_value << '\n'
            << "asset: " << to_hex(commitment.asset) << '\n'
            << "created_at: " << commitment.created_at << '\n'
            << "expires_at: " << commitment.expires_at << '\n'
            << "status: " << to_string(commitment.status) << '\n';
}

void print_metrics(const health_metrics_t& metrics) {
  std::cout << "commitment_id: " << to_hex(metrics.commitment_id) << '\n'
            << "initial_value: " << metrics.initial_value << '\n'
            << "current_value: " << metrics.current_value << '\n'
            << "drawdown_percent: " << metrics.drawdown_percent << '\n'
            << "fees_generated: " << metrics.fees_generated << '\n'
            << "volatility_exposure: " << metrics.volatility_exposure << '\n'
            << "last_attestation: " << metrics.last_attestation << '\n'
            << "compliance_score: " << metrics.compliance_score << '\n';
}

void print_batch(const batch_result_t& result) {
  std::cout << "mode: " << to_string(result.mode) << '\n'
            << "succeeded: " << result.succeeded << '\n';
  for (const auto& failure : result.failures) {
    std::cout << "failed #" << failure.index << ": " << to_string(failure.code)
              << " " << failure.log << '\n';
  }
}

void print_help(const po::options_description& options) {
  std::cout
      << "Usage:\n"
      << "  covenant <command> [options]\n\n"
      << "Commands:\n"
      << "  init, create, update-value, settle, early-exit, show, owner-list,\n"
      << "  attest, attestations, score, verify, metrics, fees, drawdown,\n"
      << "  transfer, batch-transfer, owner-of, balance, supply\n\n";
  std::cout << options << '\n';
}

void configure_logging(const std::string& level, const std::string& log_file) {
  spdlog::init_thread_pool(8192, 1);
  spdlog::set_pattern("%H:%M:%S.%e [%^%l%$] [%n] %v");

  auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
  auto sinks = std::vector<spdlog::sink_ptr>{console_sink};
  if (!log_file.empty()) {
    sinks.push_back(
        std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file, false));
  }

  auto logger = std::make_shared<spdlog::async_logger>(
      "covenant", std::begin(sinks), std::end(sinks), spdlog::thread_pool(),
      spdlog::async_overflow_policy::block);
  spdlog::set_default_logger(logger);
  spdlog::set_level(spdlog::level::from_str(level));
}

}  // namespace

int main(int argc, const char** argv) {
  auto command = std::string{};
  auto config_path = std::string{};
  auto db_path = std::string{};
  auto log_level = std::string{};
  auto log_file = std::string{};
  auto limits = covenant::common::batch_limits{};

  auto options = po::options_description{"covenant options"};
  options.add_options()("help,h", "show help")(
      "command", po::value<std::string>(&command), "command to run")(
      "config,c", po::value<std::string>(&config_path),
      "read options from a config file")(
      "db", po::value<std::string>(&db_path)->default_value("covenant.db"),
      "RocksDB directory")(
      "log-level", po::value<std::string>(&log_level)->default_value("info"),
      "trace|debug|info|warn|error|critical|off")(
      "log-file", po::value<std::string>(&log_file)->default_value(""),
      "also write logs to this file")(
      "max-batch-size",
      po::value<std::size_t>(&limits.max_batch_size)
          ->default_value(covenant::common::kDefaultMaxBatchSize),
      "largest accepted batch transfer")(
      "now", po::value<uint64_t>(), "override ledger time (seconds)")(
      "caller", po::value<std::string>(),
      "principal the command is authorized as (hex or label)")(
      "admin", po::value<std::string>(), "admin principal for init")(
      "owner", po::value<std::string>(), "owner principal")(
      "amount", po::value<std::string>(), "amount")(
      "asset", po::value<std::string>(), "asset reference (hex or label)")(
      "duration-days", po::value<uint32_t>(), "lock duration in days")(
      "max-loss", po::value<uint32_t>()->default_value(10),
      "max loss percent")("commitment-type",
                          po::value<std::string>()->default_value("balanced"),
                          "safe|balanced|aggressive")(
      "penalty", po::value<uint32_t>()->default_value(5),
      "early exit penalty percent")(
      "min-fee", po::value<std::string>()->default_value("0"),
      "minimum fee threshold")("grace-days",
                               po::value<uint32_t>()->default_value(0),
                               "settlement grace period in days")(
      "commitment-id", po::value<std::string>(), "commitment id hex")(
      "value", po::value<std::string>(), "new current value")(
      "type", po::value<std::string>(),
      "health_check|violation|fee_generation|drawdown|other")(
      "data", po::value<std::vector<std::string>>()->multitoken(),
      "attestation payload key=value entries")(
      "positive", po::value<bool>()->default_value(true),
      "attestation is positive")("percent", po::value<int64_t>(),
                                 "drawdown percent")(
      "from", po::value<std::string>(), "sender principal")(
      "to", po::value<std::string>(), "recipient principal")(
      "token-id", po::value<std::string>(), "token id")(
      "transfer", po::value<std::vector<std::string>>()->multitoken(),
      "batch entries as from:to:token_id")(
      "mode", po::value<std::string>()->default_value("atomic"),
      "atomic|best_effort");

  auto positional = po::positional_options_description{};
  positional.add("command", 1);
  auto vm = po::variables_map{};
  po::store(po::command_line_parser(argc, argv)
                .options(options)
                .positional(positional)
                .run(),
            vm);
  if (vm.contains("config")) {
    auto config = std::ifstream{vm["config"].as<std::string>()};
    if (!config) {
      std::cerr << "cannot open config file "
                << vm["config"].as<std::string>() << '\n';
      return 1;
    }
    po::store(po::parse_config_file(config, options), vm);
  }
  po::notify(vm);

  if (vm.contains("help") || command.empty()) {
    print_help(options);
    return 0;
  }

  configure_logging(log_level, log_file);

  auto storage = covenant::storage::make_storage<
      covenant::storage::rocksdb_storage_tag>(db_path);
  auto encoder = covenant::schema::encoding::scale_encoder_t{};

  auto caller = vm.contains("caller")
                    ? std::optional<address_t>{get_address(vm, "caller")}
                    : std::nullopt;
  auto ledger_principal = covenant::blake3::hash(kLedgerPrincipalLabel);
  auto clock = covenant::execution::ledger_clock_t{};
  if (vm.contains("now")) {
    clock = [now = vm["now"].as<uint64_t>()] { return now; };
  }
  auto event_sink = [](const event_t& event) {
    auto line = event.topic;
    for (const auto& attribute : event.attributes) {
      line += " " + attribute.key + "=" + attribute.value;
    }
    spdlog::info("event: {}", line);
  };

  auto caller_host = covenant::execution::host{
      .authorizer =
          [caller](const address_t& principal) {
            return caller.has_value() && *caller == principal;
          },
      .event_sink = event_sink,
      .clock = clock};
  // The registry also accepts the ledger acting as its admin.
  auto registry_host = caller_host;
  registry_host.authorizer = [caller, ledger_principal](
                                 const address_t& principal) {
    return principal == ledger_principal ||
           (caller.has_value() && *caller == principal);
  };

  auto registry = covenant::registry::ownership_registry{
      encoder, storage, registry_host, limits};
  auto ledger = covenant::ledger::commitment_ledger{
      encoder, storage, registry, caller_host, ledger_principal};
  auto compliance =
      covenant::compliance::compliance_engine{encoder, storage, ledger,
                                              caller_host};

  auto exit_code = 0;
  if (command == "init") {
    auto admin = vm.contains("admin") ? get_address(vm, "admin")
                                      : get_address(vm, "caller");
    exit_code = report(registry.initialize(ledger.address()));
    if (exit_code == 0) {
      exit_code = report(ledger.initialize(admin));
    }
    if (exit_code == 0) {
      exit_code = report(compliance.initialize(admin));
    }
    if (exit_code == 0) {
      std::cout << "admin: " << to_hex(admin) << '\n';
    }
  } else if (command == "create") {
    auto rules = commitment_rules_t{};
    rules.duration_days = get_required<uint32_t>(vm, "duration-days");
    rules.max_loss_percent = vm["max-loss"].as<uint32_t>();
    rules.commitment_type = get_enum<commitment_type_t>(vm, "commitment-type");
    rules.early_exit_penalty_percent = vm["penalty"].as<uint32_t>();
    rules.min_fee_threshold =
        parse_amount(vm["min-fee"].as<std::string>(), "min-fee");
    rules.grace_period_days = vm["grace-days"].as<uint32_t>();
    auto created = ledger.create_commitment(
        get_address(vm, "owner"), get_amount(vm, "amount"),
        get_address(vm, "asset"), rules);
    exit_code = report(created);
    if (created) {
      std::cout << to_hex(*created) << '\n';
    }
  } else if (command == "update-value") {
    exit_code = report(ledger.update_value(
        get_commitment_id(vm), get_amount(vm, "value")));
  } else if (command == "settle") {
    exit_code = report(ledger.settle(get_commitment_id(vm)));
  } else if (command == "early-exit") {
    auto exited = ledger.early_exit(get_commitment_id(vm),
                                    get_address(vm, "caller"));
    exit_code = report(exited);
    if (exited) {
      std::cout << "penalty: " << *exited << '\n';
    }
  } else if (command == "show") {
    auto commitment = ledger.get_commitment(get_commitment_id(vm));
    exit_code = report(commitment);
    if (commitment) {
      print_commitment(*commitment);
    }
  } else if (command == "owner-list") {
    for (const auto& id : ledger.get_owner_commitments(get_address(vm, "owner"))) {
      std::cout << to_hex(id) << '\n';
    }
  } else if (command == "attest") {
    exit_code = report(compliance.attest(
        get_address(vm, "caller"), get_commitment_id(vm),
        get_enum<attestation_type_t>(vm, "type"), parse_payload(vm),
        vm["positive"].as<bool>()));
  } else if (command == "attestations") {
    for (const auto& attestation :
         compliance.get_attestations(get_commitment_id(vm))) {
      std::cout << attestation.timestamp << " " << to_string(attestation.type)
                << " positive=" << (attestation.positive ? "true" : "false")
                << " verifier=" << to_hex(attestation.verifier) << '\n';
    }
  } else if (command == "score") {
    auto commitment_id = get_commitment_id(vm);
    std::cout << "calculated: "
              << compliance.calculate_compliance_score(commitment_id) << '\n'
              << "stored: " << compliance.get_stored_score(commitment_id)
              << '\n';
  } else if (command == "verify") {
    std::cout << (compliance.verify_compliance(get_commitment_id(vm))
                      ? "compliant"
                      : "non-compliant")
              << '\n';
  } else if (command == "metrics") {
    print_metrics(compliance.get_health_metrics(get_commitment_id(vm)));
  } else if (command == "fees") {
    exit_code = report(compliance.record_fees(
        get_commitment_id(vm), get_amount(vm, "amount")));
  } else if (command == "drawdown") {
    exit_code = report(compliance.record_drawdown(
        get_commitment_id(vm), get_required<int64_t>(vm, "percent")));
  } else if (command == "transfer") {
    exit_code = report(registry.transfer(get_address(vm, "from"),
                                         get_address(vm, "to"),
                                         get_token_id(vm)));
  } else if (command == "batch-transfer") {
    auto transfers = std::vector<transfer_request_t>{};
    for (const auto& entry :
         get_required<std::vector<std::string>>(vm, "transfer")) {
      transfers.push_back(parse_transfer(entry));
    }
    auto result = registry.batch_transfer(transfers,
                                          get_enum<batch_mode_t>(vm, "mode"));
    exit_code = report(result);
    if (result.value) {
      print_batch(*result.value);
    }
  } else if (command == "owner-of") {
    auto owner = registry.owner_of(get_token_id(vm));
    exit_code = report(owner);
    if (owner) {
      std::cout << to_hex(*owner) << '\n';
    }
  } else if (command == "balance") {
    auto owner = get_address(vm, "owner");
    std::cout << "balance: " << registry.balance_of(owner) << '\n';
    for (const auto token_id : registry.tokens_of_owner(owner)) {
      std::cout << "token: " << token_id << '\n';
    }
  } else if (command == "supply") {
    std::cout << "total_supply: " << registry.total_supply() << '\n'
              << "commitments: " << ledger.get_total_commitments() << '\n';
  } else {
    spdlog::error("Unknown command '{}'", command);
    print_help(options);
    exit_code = 1;
  }

  spdlog::shutdown();
  return exit_code;
}
