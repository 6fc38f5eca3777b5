#include <boost/program_options.hpp>
#include <explorer/blake3/hash.hpp>
#include <explorer/common/critical.hpp>
#include <explorer/schema/bech32.hpp>
#include <explorer/schema/block.hpp>
#include <explorer/schema/connection.hpp>
#include <explorer/schema/encoding/scale/encoder.hpp>

#include <cstdint>
#include <iostream>
#include <iterator>
#include <optional>
#include <string>
#include <string_view>
#include <tuple>
#include <vector>

namespace {

using encoder_t = explorer::schema::encoding::encoder<
    explorer::schema::encoding::scale_encoder_tag>;
namespace po = boost::program_options;

explorer::schema::hash32_t get_hash32(const po::variables_map& vm,
                                      const std::string& name) {
  if (!vm.contains(name)) {
    explorer::common::critical("missing required hash argument --" + name);
  }
  return explorer::schema::make_hash32(vm[name].as<std::string>());
}

std::optional<explorer::schema::hash32_t> get_optional_hash32(
    const po::variables_map& vm,
    const std::string& name) {
  if (!vm.contains(name)) {
    return std::nullopt;
  }
  return explorer::schema::make_hash32(vm[name].as<std::string>());
}

std::vector<std::string> get_list(const po::variables_map& vm,
                                  const std::string& name) {
  if (!vm.contains(name)) {
    return {};
  }
  return vm[name].as<std::vector<std::string>>();
}

explorer::schema::block_date parse_block_date(const std::string& value) {
  auto dot = value.find('.');
  if (dot == std::string::npos) {
    explorer::common::critical("block date must be <epoch>.<slot>");
  }
  return explorer::schema::block_date{
      .epoch = static_cast<explorer::schema::epoch_t>(
          std::stoul(value.substr(0, dot))),
      .slot = static_cast<explorer::schema::slot_t>(
          std::stoul(value.substr(dot + 1)))};
}

/// "<bech32 address>:<value>"
std::pair<explorer::schema::address_t, explorer::schema::value_t>
parse_transfer(const std::string& value) {
  auto colon = value.rfind(':');
  if (colon == std::string::npos) {
    explorer::common::critical("transfer must be <address>:<value>");
  }
  auto address = value.substr(0, colon);
  if (!explorer::schema::is_valid_address(address)) {
    explorer::common::critical("invalid bech32 address " + address);
  }
  return {address, std::stoull(value.substr(colon + 1))};
}

/// Comma separated weights, one list per proposal.
std::vector<explorer::schema::weight_t> parse_weights(const std::string& value) {
  auto out = std::vector<explorer::schema::weight_t>{};
  auto start = std::size_t{0};
  while (start <= value.size()) {
    auto comma = value.find(',', start);
    auto token = value.substr(start, comma == std::string::npos
                                         ? std::string::npos
                                         : comma - start);
    if (!token.empty()) {
      out.push_back(std::stoull(token));
    }
    if (comma == std::string::npos) {
      break;
    }
    start = comma + 1;
  }
  return out;
}

explorer::schema::payload_type_t parse_payload_type(const std::string& value) {
  auto parsed =
      explorer::schema::try_from_string<explorer::schema::payload_type_t>(value);
  if (!parsed) {
    explorer::common::critical("payload-type must be public|private");
  }
  return *parsed;
}

explorer::schema::pool_registration build_registration(
    const po::variables_map& vm) {
  auto registration = explorer::schema::pool_registration{
      .pool_id = get_hash32(vm, "pool-id"),
      .start_validity = vm["start-validity"].as<uint64_t>(),
      .management_threshold = vm["management-threshold"].as<uint64_t>()};
  for (const auto& owner : get_list(vm, "owner")) {
    registration.owners.push_back(explorer::schema::make_hash32(owner));
  }
  for (const auto& op : get_list(vm, "operator")) {
    registration.operators.push_back(explorer::schema::make_hash32(op));
  }
  registration.rewards.fixed = vm["tax-fixed"].as<uint64_t>();
  registration.rewards.ratio.numerator = vm["tax-numerator"].as<uint64_t>();
  registration.rewards.ratio.denominator = vm["tax-denominator"].as<uint64_t>();
  if (vm.contains("tax-max")) {
    registration.rewards.max_limit = vm["tax-max"].as<uint64_t>();
  }
  if (vm.contains("reward-account")) {
    registration.reward_account = vm["reward-account"].as<std::string>();
  }
  if (registration.management_threshold == 0 ||
      registration.rewards.ratio.denominator == 0 ||
      registration.rewards.max_limit == uint64_t{0}) {
    explorer::common::critical(
        "management threshold, tax denominator and tax max must be non zero");
  }
  return registration;
}

explorer::schema::certificate_t build_certificate(const po::variables_map& vm) {
  auto kind = vm["certificate"].as<std::string>();
  if (kind == "stake_delegation") {
    return explorer::schema::stake_delegation{
        .account = vm["account"].as<std::string>(),
        .pool_id = get_hash32(vm, "pool-id")};
  }
  if (kind == "owner_stake_delegation") {
    return explorer::schema::owner_stake_delegation{
        .pool_id = get_hash32(vm, "pool-id")};
  }
  if (kind == "pool_registration") {
    return build_registration(vm);
  }
  if (kind == "pool_retirement") {
    return explorer::schema::pool_retirement{
        .pool_id = get_hash32(vm, "pool-id"),
        .retirement_time = vm["retirement-time"].as<uint64_t>()};
  }
  if (kind == "pool_update") {
    return explorer::schema::pool_update{.pool_id = get_hash32(vm, "pool-id"),
                                         .registration = build_registration(vm)};
  }
  if (kind == "vote_plan") {
    auto plan = explorer::schema::vote_plan_certificate{
        .vote_plan_id = get_hash32(vm, "vote-plan-id"),
        .vote_start = parse_block_date(vm["vote-start"].as<std::string>()),
        .vote_end = parse_block_date(vm["vote-end"].as<std::string>()),
        .committee_end = parse_block_date(vm["committee-end"].as<std::string>()),
        .payload_type = parse_payload_type(vm["payload-type"].as<std::string>())};
    auto index = 0u;
    for (const auto& options : get_list(vm, "proposal-options")) {
      auto count = std::stoul(options);
      if (count == 0 || count > 255) {
        explorer::common::critical("proposal options must be in [1, 255]");
      }
      plan.proposals.push_back(explorer::schema::proposal_definition{
          .external_id = explorer::blake3::hash(
              "proposal-" + explorer::schema::to_hex(plan.vote_plan_id) + "-" +
              std::to_string(index++)),
          .options = static_cast<uint8_t>(count)});
    }
    if (plan.proposals.size() > explorer::schema::kMaxProposalsPerPlan) {
      explorer::common::critical("vote plan has more than " +
                                 std::to_string(
                                     explorer::schema::kMaxProposalsPerPlan) +
                                 " proposals");
    }
    return plan;
  }
  if (kind == "vote_cast") {
    auto payload = explorer::schema::vote_payload_t{};
    if (vm.contains("encrypted-vote-hex")) {
      payload = explorer::schema::private_vote_payload{
          .encrypted_vote = explorer::schema::from_hex(
              vm["encrypted-vote-hex"].as<std::string>()),
          .proof = vm.contains("proof-hex")
                       ? explorer::schema::from_hex(
                             vm["proof-hex"].as<std::string>())
                       : explorer::schema::bytes_t{}};
    } else {
      payload = explorer::schema::public_vote_payload{
          .choice = static_cast<uint8_t>(vm["choice"].as<uint32_t>())};
    }
    return explorer::schema::vote_cast{
        .vote_plan_id = get_hash32(vm, "vote-plan-id"),
        .proposal_index = static_cast<uint8_t>(vm["proposal-index"].as<uint32_t>()),
        .payload = payload};
  }
  if (kind == "vote_tally") {
    auto tally = explorer::schema::vote_tally{
        .vote_plan_id = get_hash32(vm, "vote-plan-id")};
    for (const auto& weights : get_list(vm, "tally")) {
      tally.results.push_back(parse_weights(weights));
    }
    return tally;
  }
  if (kind == "encrypted_vote_tally") {
    return explorer::schema::encrypted_vote_tally{
        .vote_plan_id = get_hash32(vm, "vote-plan-id")};
  }
  explorer::common::critical("unsupported certificate kind " + kind);
}

std::optional<explorer::schema::transaction_t> build_transaction(
    const po::variables_map& vm) {
  if (!vm.contains("input") && !vm.contains("output") &&
      !vm.contains("certificate")) {
    return std::nullopt;
  }
  auto transaction = explorer::schema::transaction_t{};
  for (const auto& input : get_list(vm, "input")) {
    auto [address, value] = parse_transfer(input);
    transaction.inputs.push_back(
        explorer::schema::transaction_input{.value = value, .address = address});
  }
  for (const auto& output : get_list(vm, "output")) {
    auto [address, value] = parse_transfer(output);
    transaction.outputs.push_back(
        explorer::schema::transaction_output{.value = value, .address = address});
  }
  if (vm.contains("certificate")) {
    transaction.certificate = build_certificate(vm);
  }

  if (auto id = get_optional_hash32(vm, "tx-id")) {
    transaction.id = *id;
  } else {
    auto content = encoder_t{}.encode(std::tuple{
        transaction.inputs, transaction.outputs, transaction.certificate});
    transaction.id =
        explorer::blake3::hash(explorer::schema::make_bytes_view(content));
  }
  return transaction;
}

explorer::schema::applied_block_t build_block(const po::variables_map& vm) {
  auto block = explorer::schema::applied_block_t{
      .parent_id = get_optional_hash32(vm, "parent"),
      .date = parse_block_date(vm["date"].as<std::string>()),
      .score = vm["score"].as<uint64_t>()};
  if (vm.contains("leader-pool")) {
    block.leader = explorer::schema::pool_leader{
        .pool_id = get_hash32(vm, "leader-pool")};
  } else if (vm.contains("leader-bft")) {
    block.leader = explorer::schema::bft_leader{
        .public_key = get_hash32(vm, "leader-bft")};
  }
  if (vm.contains("treasury")) {
    block.treasury = vm["treasury"].as<uint64_t>();
  }
  if (auto transaction = build_transaction(vm)) {
    block.transactions.push_back(std::move(*transaction));
  }

  if (auto id = get_optional_hash32(vm, "id")) {
    block.id = *id;
  } else {
    auto ids = std::vector<explorer::schema::transaction_id_t>{};
    for (const auto& transaction : block.transactions) {
      ids.push_back(transaction.id);
    }
    auto content = encoder_t{}.encode(
        std::tuple{block.parent_id, block.date, block.score, ids});
    block.id = explorer::blake3::hash(explorer::schema::make_bytes_view(content));
  }
  return block;
}

explorer::schema::pagination_arguments build_arguments(
    const po::variables_map& vm) {
  auto arguments = explorer::schema::pagination_arguments{};
  if (vm.contains("first")) {
    arguments.first = vm["first"].as<uint64_t>();
  }
  if (vm.contains("last")) {
    arguments.last = vm["last"].as<uint64_t>();
  }
  if (vm.contains("before")) {
    arguments.before = vm["before"].as<std::string>();
  }
  if (vm.contains("after")) {
    arguments.after = vm["after"].as<std::string>();
  }
  return arguments;
}

std::optional<uint64_t> get_optional_branch(const po::variables_map& vm) {
  if (!vm.contains("branch")) {
    return std::nullopt;
  }
  return vm["branch"].as<uint64_t>();
}

explorer::schema::bytes_t build_query_data(const po::variables_map& vm) {
  auto encoder = encoder_t{};
  auto path = vm["path"].as<std::string>();
  if (path == "/branches" || path == "/tip" || path == "/settings") {
    return {};
  }
  if (path == "/block" || path == "/transaction" || path == "/stake_pool" ||
      path == "/vote_plan") {
    return encoder.encode(std::tuple{get_hash32(vm, "id")});
  }
  if (path == "/blocks/by_chain_length") {
    return encoder.encode(std::tuple{vm["chain-length"].as<uint32_t>()});
  }
  if (path == "/branch") {
    return encoder.encode(std::tuple{vm["branch"].as<uint64_t>()});
  }
  if (path == "/epoch") {
    return encoder.encode(
        std::tuple{vm["epoch"].as<uint32_t>(), get_optional_branch(vm)});
  }
  if (path == "/address") {
    return encoder.encode(std::tuple{vm["address"].as<std::string>()});
  }
  if (path == "/branch/blocks" || path == "/branch/stake_pools" ||
      path == "/branch/vote_plans") {
    return encoder.encode(
        std::tuple{vm["branch"].as<uint64_t>(), build_arguments(vm)});
  }
  if (path == "/epoch/blocks") {
    return encoder.encode(std::tuple{vm["epoch"].as<uint32_t>(),
                                     get_optional_branch(vm),
                                     build_arguments(vm)});
  }
  if (path == "/block/transactions" || path == "/stake_pool/blocks") {
    return encoder.encode(std::tuple{get_hash32(vm, "id"), build_arguments(vm)});
  }
  if (path == "/address/transactions") {
    return encoder.encode(
        std::tuple{vm["address"].as<std::string>(), build_arguments(vm)});
  }
  if (path == "/vote_plan/proposal/votes") {
    return encoder.encode(std::tuple{
        get_hash32(vm, "id"),
        static_cast<uint8_t>(vm["proposal-index"].as<uint32_t>()),
        build_arguments(vm)});
  }
  explorer::common::critical("unsupported query path");
}

std::string make_address(const po::variables_map& vm) {
  auto key = explorer::blake3::hash(vm["seed"].as<std::string>());
  auto words = explorer::schema::convert_bits(
      explorer::schema::bytes_view_t{key.data(), key.size()}, 8, 5, true);
  if (!words) {
    explorer::common::critical("failed to regroup address key");
  }
  return explorer::schema::encode_bech32(
      vm["hrp"].as<std::string>(), explorer::schema::make_bytes_view(*words));
}

void print_help(const po::options_description& options) {
  std::cout << "Usage:\n"
            << "  explorer-block-builder block [options]\n"
            << "  explorer-block-builder query-data [options]\n"
            << "  explorer-block-builder address --seed <text>\n"
            << "  explorer-block-builder id --seed <text>\n\n";
  std::cout << options << '\n';
}

}  // namespace

int main(int argc, const char** argv) {
  auto command = std::string{};
  auto options = po::options_description{"block builder options"};
  options.add_options()("help,h", "show help")(
      "command", po::value<std::string>(&command),
      "block|query-data|address|id")(
      "id", po::value<std::string>(), "block or record hash32 hex")(
      "parent", po::value<std::string>(), "parent block hash32 hex")(
      "date", po::value<std::string>()->default_value("0.0"),
      "block date <epoch>.<slot>")(
      "score", po::value<uint64_t>()->default_value(0), "ledger score")(
      "leader-pool", po::value<std::string>(), "stake pool leader id")(
      "leader-bft", po::value<std::string>(), "BFT leader public key")(
      "treasury", po::value<uint64_t>(), "treasury value")(
      "tx-id", po::value<std::string>(), "transaction hash32 hex")(
      "input", po::value<std::vector<std::string>>()->multitoken(),
      "<address>:<value> inputs")(
      "output", po::value<std::vector<std::string>>()->multitoken(),
      "<address>:<value> outputs")(
      "certificate", po::value<std::string>(),
      "stake_delegation|owner_stake_delegation|pool_registration|"
      "pool_retirement|pool_update|vote_plan|vote_cast|vote_tally|"
      "encrypted_vote_tally")(
      "account", po::value<std::string>(), "delegating address")(
      "pool-id", po::value<std::string>(), "stake pool hash32 hex")(
      "owner", po::value<std::vector<std::string>>()->multitoken(),
      "pool owner keys")(
      "operator", po::value<std::vector<std::string>>()->multitoken(),
      "pool operator keys")(
      "start-validity", po::value<uint64_t>()->default_value(0),
      "pool validity start, seconds")(
      "management-threshold", po::value<uint64_t>()->default_value(1),
      "pool management threshold")(
      "tax-fixed", po::value<uint64_t>()->default_value(0), "fixed tax")(
      "tax-numerator", po::value<uint64_t>()->default_value(0),
      "tax ratio numerator")(
      "tax-denominator", po::value<uint64_t>()->default_value(1),
      "tax ratio denominator")("tax-max", po::value<uint64_t>(), "tax cap")(
      "reward-account", po::value<std::string>(), "reward address")(
      "retirement-time", po::value<uint64_t>()->default_value(0),
      "pool retirement, seconds")(
      "vote-plan-id", po::value<std::string>(), "vote plan hash32 hex")(
      "vote-start", po::value<std::string>()->default_value("0.0"),
      "vote start <epoch>.<slot>")(
      "vote-end", po::value<std::string>()->default_value("0.0"),
      "vote end <epoch>.<slot>")(
      "committee-end", po::value<std::string>()->default_value("0.0"),
      "committee end <epoch>.<slot>")(
      "payload-type", po::value<std::string>()->default_value("public"),
      "public|private")(
      "proposal-options", po::value<std::vector<std::string>>()->multitoken(),
      "option count per proposal")(
      "proposal-index", po::value<uint32_t>()->default_value(0),
      "proposal index")(
      "choice", po::value<uint32_t>()->default_value(0), "public vote choice")(
      "encrypted-vote-hex", po::value<std::string>(), "private vote bytes")(
      "proof-hex", po::value<std::string>(), "private vote proof bytes")(
      "tally", po::value<std::vector<std::string>>()->multitoken(),
      "comma separated weights per proposal")(
      "path", po::value<std::string>(), "query path")(
      "chain-length", po::value<uint32_t>()->default_value(0),
      "chain length")("branch", po::value<uint64_t>(), "branch id")(
      "epoch", po::value<uint32_t>()->default_value(0), "epoch")(
      "address", po::value<std::string>(), "bech32 address")(
      "first", po::value<uint64_t>(), "page from the front")(
      "last", po::value<uint64_t>(), "page from the back")(
      "before", po::value<std::string>(), "cursor upper bound")(
      "after", po::value<std::string>(), "cursor lower bound")(
      "hrp", po::value<std::string>()->default_value("addr"),
      "address human readable part")(
      "seed", po::value<std::string>(), "text hashed into an id or key");

  auto positional = po::positional_options_description{};
  positional.add("command", 1);
  auto vm = po::variables_map{};
  po::store(po::command_line_parser(argc, argv)
                .options(options)
                .positional(positional)
                .run(),
            vm);
  po::notify(vm);

  if (vm.contains("help") || command.empty()) {
    print_help(options);
    return 0;
  }

  if (command == "block") {
    auto block = build_block(vm);
    std::cout << explorer::schema::to_base64(encoder_t{}.encode(block)) << '\n';
    return 0;
  }

  if (command == "query-data") {
    if (!vm.contains("path")) {
      explorer::common::critical("query-data mode requires --path");
    }
    std::cout << explorer::schema::to_base64(build_query_data(vm)) << '\n';
    return 0;
  }

  if (command == "address" || command == "id") {
    if (!vm.contains("seed")) {
      explorer::common::critical(command + " mode requires --seed");
    }
    if (command == "address") {
      std::cout << make_address(vm) << '\n';
    } else {
      std::cout << explorer::schema::to_hex(
                       explorer::blake3::hash(vm["seed"].as<std::string>()))
                << '\n';
    }
    return 0;
  }

  explorer::common::critical("command must be block|query-data|address|id");
}
