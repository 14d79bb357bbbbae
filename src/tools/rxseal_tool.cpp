#include <boost/program_options.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <rxseal/canonical/snapshot.hpp>
#include <rxseal/common/clock.hpp>
#include <rxseal/common/critical.hpp>
#include <rxseal/config/config.hpp>
#include <rxseal/crypto/signing_key.hpp>
#include <rxseal/ledger/grpc_client.hpp>
#include <rxseal/offchain/record_store.hpp>
#include <rxseal/schema/encoding/scale/encoder.hpp>
#include <rxseal/schema/prescription_id.hpp>
#include <rxseal/service/prescription_service.hpp>
#include <rxseal/storage/rocksdb/storage.hpp>

#include <cstdint>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace {

namespace po = boost::program_options;
using json = nlohmann::ordered_json;

std::string require(const po::variables_map& vm, const std::string& name) {
  if (!vm.contains(name)) {
    rxseal::common::critical("missing required --" + name);
  }
  return vm[name].as<std::string>();
}

rxseal::schema::hash32_t require_hash32(const po::variables_map& vm,
                                        const std::string& name) {
  auto hash = rxseal::schema::try_make_hash32(require(vm, name));
  if (!hash) {
    rxseal::common::critical("--" + name + " must be 32 bytes of hex");
  }
  return *hash;
}

rxseal::crypto::signing_key require_key(const po::variables_map& vm) {
  auto key = rxseal::crypto::signing_key::from_seed(require_hash32(vm, "key"));
  if (!key) {
    rxseal::common::critical("--key is not a usable ed25519 seed");
  }
  return *key;
}

/// `name|dosage|quantity|instructions`; trailing fields may be omitted.
rxseal::schema::medicine_entry_t parse_medicine(const std::string_view text) {
  auto fields = std::vector<std::string>{};
  auto start = std::size_t{0};
  while (true) {
    auto end = text.find('|', start);
    fields.emplace_back(text.substr(start, end - start));
    if (end == std::string_view::npos) {
      break;
    }
    start = end + 1;
  }
  if (fields.size() > 4) {
    rxseal::common::critical("--medicine takes at most 4 '|' separated fields");
  }
  fields.resize(4);
  return rxseal::schema::medicine_entry_t{.name = fields[0],
                                          .dosage = fields[1],
                                          .quantity = fields[2],
                                          .instructions = fields[3]};
}

std::vector<rxseal::schema::medicine_entry_t> parse_medicines(
    const po::variables_map& vm) {
  auto medicines = std::vector<rxseal::schema::medicine_entry_t>{};
  if (vm.contains("medicine")) {
    for (const auto& text : vm["medicine"].as<std::vector<std::string>>()) {
      medicines.push_back(parse_medicine(text));
    }
  }
  return medicines;
}

json to_json(const rxseal::schema::prescription_record_t& record,
             const rxseal::schema::timestamp_seconds_t now) {
  return json{
      {"id", rxseal::schema::describe_prescription_id(record.id)},
      {"issuer", rxseal::schema::to_prefixed_hex(record.issuer)},
      {"status", std::string{rxseal::schema::to_string(
                     rxseal::schema::effective_status(record, now))}},
      {"storedStatus", std::string{rxseal::schema::to_string(record.status)}},
      {"usageCount", record.usage_count},
      {"maxUsage", record.max_usage},
      {"quantity", record.quantity},
      {"expiryDate", record.expiry_date},
      {"issuedAt", record.issued_at},
      {"patientHash", rxseal::schema::to_prefixed_hex(record.patient_hash)},
      {"medicationHash",
       rxseal::schema::to_prefixed_hex(record.medication_hash)}};
}

json to_json(const rxseal::schema::offchain_record_t& record) {
  auto out = json{{"shortCode", record.short_code},
                  {"status",
                   std::string{rxseal::schema::to_string(record.status)}},
                  {"usageCount", record.usage_count},
                  {"maxUsage", record.max_usage},
                  {"expiryDate", record.expiry_date},
                  {"ledgerSynced", record.ledger_synced}};
  if (record.dispensed_at) {
    out["dispensedAt"] = *record.dispensed_at;
  }
  if (record.hash_verified) {
    out["hashVerified"] = *record.hash_verified;
  }
  return out;
}

json to_json(const rxseal::schema::ledger_receipt_t& receipt) {
  return json{{"code", receipt.code},
              {"codespace", receipt.codespace},
              {"log", receipt.log},
              {"height", receipt.height},
              {"callHash", rxseal::schema::to_prefixed_hex(receipt.call_hash)}};
}

int print_error(const rxseal::service::service_error& error) {
  auto out = json{{"error",
                   std::string{rxseal::service::to_string(error.code)}},
                  {"httpStatus", error.http_status},
                  {"message", error.message}};
  if (error.chain_error) {
    out["chainError"] =
        std::string{rxseal::schema::to_string(error.chain_error->code)};
    auto context = json::object();
    for (const auto& [key, value] : error.chain_error->context) {
      context[key] = value;
    }
    out["context"] = std::move(context);
  }
  if (error.receipt) {
    out["receipt"] = to_json(*error.receipt);
  }
  std::cout << out.dump() << '\n';
  return 1;
}

int print_receipt(const rxseal::schema::ledger_receipt_t& receipt) {
  std::cout << to_json(receipt).dump() << '\n';
  return receipt.code == 0 ? 0 : 1;
}

void print_help(const po::options_description& options) {
  std::cout << "Usage:\n"
            << "  rxseal-tool encode-id --code CODE\n"
            << "  rxseal-tool decode-id --id HEX\n"
            << "  rxseal-tool snapshot --patient-name N --patient-age A "
               "--medicine M...\n"
            << "  rxseal-tool keygen | account --key SEED\n"
            << "  rxseal-tool register-doctor|register-pharmacy --key SEED "
               "--account HEX\n"
            << "  rxseal-tool get --code CODE\n"
            << "  rxseal-tool issue|dispense|verify|resolve-pending|reconcile|"
               "sweep-expired|security-events --store-path DIR ...\n\n";
  std::cout << options << '\n';
}

}  // namespace

int main(int argc, const char** argv) {
  auto command = std::string{};
  auto options = po::options_description{"rxseal-tool options"};
  options.add_options()("help,h", "show help")(
      "command", po::value<std::string>(&command), "command to run")(
      "code", po::value<std::string>(), "prescription short code")(
      "id", po::value<std::string>(), "32 byte prescription id hex")(
      "key", po::value<std::string>(), "ed25519 seed hex of the caller")(
      "account", po::value<std::string>(), "account id hex")(
      "patient-name", po::value<std::string>(), "patient name")(
      "patient-age", po::value<std::string>(), "patient age")(
      "medicine", po::value<std::vector<std::string>>()->composing(),
      "name|dosage|quantity|instructions, repeatable")(
      "notes", po::value<std::string>()->default_value(""),
      "free-form notes")("max-usage",
                         po::value<uint32_t>()->default_value(1),
                         "number of dispenses allowed")(
      "expiry", po::value<uint64_t>(), "expiry as unix seconds")(
      "store-path", po::value<std::string>()->default_value("rxseal-offchain"),
      "RocksDB directory for off-chain records")("verbose,v",
                                                  "enable debug logging");
  options.add(rxseal::config::make_ledger_options());

  auto positional = po::positional_options_description{};
  positional.add("command", 1);
  auto vm = po::variables_map{};
  try {
    po::store(po::command_line_parser(argc, argv)
                  .options(options)
                  .positional(positional)
                  .run(),
              vm);
    rxseal::config::store_environment(options, vm);
    po::notify(vm);
  } catch (const po::error& e) {
    std::cerr << e.what() << '\n';
    return 2;
  }

  if (vm.contains("help") || command.empty()) {
    print_help(options);
    return 0;
  }
  spdlog::set_level(vm.contains("verbose") ? spdlog::level::debug
                                           : spdlog::level::warn);

  if (command == "encode-id") {
    auto id = rxseal::schema::try_encode_prescription_id(require(vm, "code"));
    if (!id) {
      std::cerr << "invalid short code\n";
      return 1;
    }
    std::cout << rxseal::schema::to_prefixed_hex(*id) << '\n';
    return 0;
  }

  if (command == "decode-id") {
    auto code = rxseal::schema::try_decode_prescription_id(
        require_hash32(vm, "id"));
    if (!code) {
      std::cerr << "id does not carry a short code\n";
      return 1;
    }
    std::cout << *code << '\n';
    return 0;
  }

  if (command == "snapshot") {
    auto error = std::string{};
    auto snapshot = rxseal::canonical::build_snapshot(
        require(vm, "patient-name"), require(vm, "patient-age"),
        parse_medicines(vm), error);
    if (!snapshot) {
      std::cerr << error << '\n';
      return 1;
    }
    std::cout << json{{"protocolVersion", snapshot->protocol_version},
                      {"serialized", snapshot->serialized},
                      {"patientHash",
                       rxseal::schema::to_prefixed_hex(snapshot->patient_hash)},
                      {"medicationHash", rxseal::schema::to_prefixed_hex(
                                             snapshot->medication_hash)}}
                     .dump()
              << '\n';
    return 0;
  }

  if (command == "keygen" || command == "account") {
    auto key = command == "keygen" ? rxseal::crypto::signing_key::generate()
                                   : std::optional{require_key(vm)};
    if (!key) {
      rxseal::common::critical("failed to generate ed25519 key");
    }
    std::cout << json{{"seed", rxseal::schema::to_hex(key->seed())},
                      {"publicKey",
                       rxseal::schema::to_prefixed_hex(key->public_key())},
                      {"account", rxseal::schema::to_prefixed_hex(
                                      rxseal::crypto::make_account_id(
                                          key->public_key()))}}
                     .dump()
              << '\n';
    return 0;
  }

  auto error = std::string{};
  auto ledger_config = rxseal::config::try_make_ledger_config(vm, error);
  if (!ledger_config) {
    std::cerr << error << '\n';
    return 2;
  }
  auto ledger = rxseal::ledger::grpc_client{ledger_config->endpoint};

  if (command == "register-doctor" || command == "register-pharmacy") {
    auto account = require_hash32(vm, "account");
    auto payload =
        command == "register-doctor"
            ? rxseal::schema::ledger_payload_t{rxseal::schema::register_doctor_t{
                  .account = account}}
            : rxseal::schema::ledger_payload_t{
                  rxseal::schema::register_pharmacy_t{.account = account}};
    return print_receipt(rxseal::ledger::sign_and_submit(
        ledger, require_key(vm), std::move(payload), ledger_config->timeout));
  }

  if (command == "get") {
    auto id = rxseal::schema::try_encode_prescription_id(require(vm, "code"));
    if (!id) {
      std::cerr << "invalid short code\n";
      return 1;
    }
    auto record = rxseal::ledger::fetch_prescription(
        ledger, *id, ledger_config->timeout, error);
    if (!record) {
      std::cerr << error << '\n';
      return 1;
    }
    if (!rxseal::schema::exists(*record)) {
      std::cerr << "prescription not found on ledger\n";
      return 1;
    }
    std::cout << to_json(*record, rxseal::common::system_unix_clock()()).dump()
              << '\n';
    return 0;
  }

  auto encoder = rxseal::schema::encoding::scale_encoder_t{};
  auto storage =
      rxseal::storage::make_storage<rxseal::storage::rocksdb_storage_tag>(
          vm["store-path"].as<std::string>());
  auto records = rxseal::offchain::record_store{encoder, storage};
  auto service = rxseal::service::prescription_service{
      ledger, records,
      rxseal::validation::gate_options{.endpoint = ledger_config->endpoint,
                                       .timeout = ledger_config->timeout},
      rxseal::common::system_unix_clock()};

  if (command == "issue") {
    if (!vm.contains("expiry")) {
      rxseal::common::critical("missing required --expiry");
    }
    auto request = rxseal::service::issue_request{
        .short_code = vm.contains("code") ? require(vm, "code") : std::string{},
        .patient_name = require(vm, "patient-name"),
        .patient_age = require(vm, "patient-age"),
        .medicines = parse_medicines(vm),
        .notes = vm["notes"].as<std::string>(),
        .max_usage = vm["max-usage"].as<uint32_t>(),
        .expiry_date = vm["expiry"].as<uint64_t>()};
    auto result = service.issue(request, require_key(vm));
    if (auto failure = std::get_if<rxseal::service::service_error>(&result)) {
      return print_error(*failure);
    }
    const auto& issued = std::get<rxseal::service::mutation_result>(result);
    std::cout << json{{"record", to_json(issued.record)},
                      {"receipt", to_json(issued.receipt)}}
                     .dump()
              << '\n';
    return 0;
  }

  if (command == "dispense") {
    auto result = service.dispense(require(vm, "code"), require_key(vm));
    if (auto failure = std::get_if<rxseal::service::service_error>(&result)) {
      return print_error(*failure);
    }
    const auto& dispensed = std::get<rxseal::service::mutation_result>(result);
    std::cout << json{{"record", to_json(dispensed.record)},
                      {"receipt", to_json(dispensed.receipt)}}
                     .dump()
              << '\n';
    return 0;
  }

  if (command == "verify") {
    auto result = service.verify(require(vm, "code"));
    if (auto failure = std::get_if<rxseal::service::service_error>(&result)) {
      return print_error(*failure);
    }
    const auto& success =
        std::get<rxseal::validation::validation_success>(result);
    std::cout << json{{"valid", true},
                      {"record", to_json(success.record,
                                         rxseal::common::system_unix_clock()())},
                      {"patientMatch", success.integrity.patient_match},
                      {"medMatch", success.integrity.medication_match}}
                     .dump()
              << '\n';
    return 0;
  }

  if (command == "reconcile") {
    auto report = service.reconcile();
    auto entries = json::array();
    for (const auto& entry : report.entries) {
      entries.push_back(json{{"shortCode", entry.short_code},
                             {"state", std::string{rxseal::service::to_string(
                                           entry.state)}},
                             {"detail", entry.detail}});
    }
    std::cout << json{{"matched", report.matched},
                      {"mismatched", report.mismatched},
                      {"notOnLedger", report.not_on_ledger},
                      {"unreachable", report.unreachable},
                      {"entries", std::move(entries)}}
                     .dump()
              << '\n';
    return report.mismatched + report.not_on_ledger + report.unreachable == 0
               ? 0
               : 1;
  }

  if (command == "resolve-pending") {
    auto result = service.resolve_pending(require(vm, "code"));
    if (auto failure = std::get_if<rxseal::service::service_error>(&result)) {
      return print_error(*failure);
    }
    std::cout << to_json(std::get<rxseal::schema::offchain_record_t>(result))
                     .dump()
              << '\n';
    return 0;
  }

  if (command == "sweep-expired") {
    auto moved = service.sweep_expired(rxseal::common::system_unix_clock()());
    std::cout << json{{"expired", moved}}.dump() << '\n';
    return 0;
  }

  if (command == "security-events") {
    auto events = json::array();
    for (const auto& event : records.security_events()) {
      events.push_back(
          json{{"id", event.event_id},
               {"type", std::string{rxseal::schema::to_string(event.type)}},
               {"severity",
                std::string{rxseal::schema::to_string(event.severity)}},
               {"code", event.code},
               {"shortCode", event.short_code},
               {"message", event.message},
               {"recordedAt", rxseal::common::to_iso8601(event.recorded_at)}});
    }
    std::cout << events.dump() << '\n';
    return 0;
  }

  rxseal::common::critical("unknown command '" + command + "'");
}
