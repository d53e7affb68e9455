#include <spdlog/async.h>
#include <spdlog/fmt/fmt.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <boost/program_options.hpp>
#include <invoicedb/crypto/sha256.hpp>
#include <invoicedb/schema/invoice.hpp>
#include <invoicedb/store/invoice_store.hpp>

#include <chrono>
#include <cstdint>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace {

namespace po = boost::program_options;

constexpr auto kExitOk = 0;
constexpr auto kExitOperationFailed = 1;
constexpr auto kExitUsage = 2;

void configure_logging(const std::string& level, const std::string& log_file) {
  spdlog::init_thread_pool(8192, 1);

  // stdout carries command output, so log lines go to stderr.
  auto sinks = std::vector<spdlog::sink_ptr>{
      std::make_shared<spdlog::sinks::stderr_color_sink_mt>()};
  if (!log_file.empty()) {
    sinks.push_back(
        std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file, false));
  }

  auto logger = std::make_shared<spdlog::async_logger>(
      "invoice_tool", std::begin(sinks), std::end(sinks),
      spdlog::thread_pool(), spdlog::async_overflow_policy::block);
  spdlog::set_default_logger(logger);
  spdlog::set_pattern("%H:%M:%S.%e [%^%l%$] [%n] %v");
  spdlog::set_level(spdlog::level::from_str(level));
}

std::string format_invoice(const invoicedb::schema::invoice_t& invoice) {
  auto hash = invoicedb::crypto::payment_hash(invoice.terms.payment_preimage);
  auto since_epoch = invoice.creation_time.time_since_epoch();
  return fmt::format(
      "hash={} value={} settled={} created={} memo={}",
      invoicedb::schema::to_hex(
          invoicedb::schema::bytes_view_t{hash.data(), hash.size()}),
      invoice.terms.value, invoice.terms.settled ? "true" : "false",
      since_epoch.count(), invoicedb::schema::make_string(invoice.memo));
}

template <typename T>
int report_failure(const invoicedb::schema::operation_result<T>& result) {
  std::cerr << "error: " << invoicedb::schema::to_string(result.code) << ": "
            << result.log << std::endl;
  return kExitOperationFailed;
}

std::optional<invoicedb::schema::hash32_t> require_hash32(
    const po::variables_map& vm,
    const std::string& name) {
  if (!vm.contains(name)) {
    std::cerr << "missing required option --" << name << std::endl;
    return std::nullopt;
  }
  auto hash =
      invoicedb::schema::try_make_hash32(std::string_view{vm[name].as<std::string>()});
  if (!hash) {
    std::cerr << "--" << name << " must be 64 hex characters" << std::endl;
  }
  return hash;
}

int run_command(const std::string& command,
                const po::variables_map& vm,
                invoicedb::store::invoice_store& store) {
  if (command == "add") {
    auto preimage = require_hash32(vm, "preimage");
    if (!preimage) {
      return kExitUsage;
    }
    auto invoice = invoicedb::schema::invoice_t{};
    invoice.terms.payment_preimage = *preimage;
    invoice.terms.value = vm["value"].as<int64_t>();
    invoice.creation_time =
        std::chrono::time_point_cast<std::chrono::nanoseconds>(
            std::chrono::system_clock::now());
    if (vm.contains("memo")) {
      invoice.memo = invoicedb::schema::make_bytes(
          std::string_view{vm["memo"].as<std::string>()});
    }
    if (vm.contains("receipt")) {
      auto receipt = invoicedb::schema::try_from_hex(
          std::string_view{vm["receipt"].as<std::string>()});
      if (!receipt) {
        std::cerr << "--receipt must be hex" << std::endl;
        return kExitUsage;
      }
      invoice.receipt = std::move(*receipt);
    }

    auto result = store.add_invoice(invoice);
    if (!result.ok()) {
      return report_failure(result);
    }
    auto hash = invoicedb::crypto::payment_hash(*preimage);
    std::cout << "id=" << *result.value << " hash="
              << invoicedb::schema::to_hex(invoicedb::schema::bytes_view_t{
                     hash.data(), hash.size()})
              << std::endl;
    return kExitOk;
  }

  if (command == "lookup") {
    auto hash = require_hash32(vm, "hash");
    if (!hash) {
      return kExitUsage;
    }
    auto result = store.lookup_invoice(*hash);
    if (!result.ok()) {
      return report_failure(result);
    }
    std::cout << format_invoice(*result.value) << std::endl;
    return kExitOk;
  }

  if (command == "list") {
    auto result = store.fetch_all_invoices(vm.contains("pending"));
    if (!result.ok()) {
      return report_failure(result);
    }
    for (const auto& invoice : *result.value) {
      std::cout << format_invoice(invoice) << std::endl;
    }
    return kExitOk;
  }

  if (command == "settle") {
    auto hash = require_hash32(vm, "hash");
    if (!hash) {
      return kExitUsage;
    }
    auto result = store.settle_invoice(*hash);
    if (!result.ok()) {
      return report_failure(result);
    }
    return kExitOk;
  }

  std::cerr << "unknown command '" << command << "'" << std::endl;
  return kExitUsage;
}

}  // namespace

int main(int argc, char* argv[]) {
  auto command = std::string{};
  auto db_path = std::string{};
  auto log_level = std::string{};
  auto log_file = std::string{};

  auto vm = po::variables_map{};
  auto description = po::options_description{"invoice_tool <command>"};
  description.add_options()("help,h", "Show the help message")(
      "command", po::value<std::string>(&command),
      "add | lookup | list | settle | hash")(
      "db,d",
      po::value<std::string>(&db_path)->default_value("invoices.db"),
      "RocksDB directory holding the invoices")(
      "sync", "Sync the write-ahead log on every commit")(
      "log-level",
      po::value<std::string>(&log_level)->default_value("info"),
      "trace | debug | info | warn | error | critical | off")(
      "log-file", po::value<std::string>(&log_file),
      "Also append log lines to this file")(
      "preimage", po::value<std::string>(),
      "32-byte payment preimage as hex (add, hash)")(
      "hash", po::value<std::string>(),
      "32-byte payment hash as hex (lookup, settle)")(
      "value", po::value<int64_t>()->default_value(0),
      "Amount in the smallest currency unit (add)")(
      "memo", po::value<std::string>(), "Free-form memo (add)")(
      "receipt", po::value<std::string>(), "Payment receipt as hex (add)")(
      "pending", "Only list unsettled invoices (list)");

  auto positional = po::positional_options_description{};
  positional.add("command", 1);

  try {
    po::store(po::command_line_parser(argc, argv)
                  .options(description)
                  .positional(positional)
                  .run(),
              vm);
    po::notify(vm);
  } catch (const po::error& ex) {
    std::cerr << ex.what() << "\n" << description << std::endl;
    return kExitUsage;
  }

  if (vm.contains("help") || command.empty()) {
    std::cout << description << std::endl;
    return command.empty() && !vm.contains("help") ? kExitUsage : kExitOk;
  }

  // Hashing needs no database.
  if (command == "hash") {
    auto preimage = require_hash32(vm, "preimage");
    if (!preimage) {
      return kExitUsage;
    }
    auto hash = invoicedb::crypto::payment_hash(*preimage);
    std::cout << invoicedb::schema::to_hex(invoicedb::schema::bytes_view_t{
                     hash.data(), hash.size()})
              << std::endl;
    return kExitOk;
  }

  // from_str maps unknown names to off.
  if (spdlog::level::from_str(log_level) == spdlog::level::off &&
      log_level != "off") {
    std::cerr << "unknown --log-level '" << log_level << "'" << std::endl;
    return kExitUsage;
  }
  configure_logging(log_level, log_file);

  auto options = invoicedb::storage::storage_options{};
  options.sync_writes = vm.contains("sync");

  auto exit_code = kExitOk;
  {
    auto encoder = invoicedb::store::encoder_t{};
    auto storage = invoicedb::storage::make_storage<
        invoicedb::storage::rocksdb_storage_tag>(db_path, options);
    auto store = invoicedb::store::invoice_store{encoder, storage};
    exit_code = run_command(command, vm, store);
  }

  spdlog::shutdown();
  return exit_code;
}
