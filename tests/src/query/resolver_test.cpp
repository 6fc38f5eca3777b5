#include <gtest/gtest.h>
#include <explorer/query/resolver.hpp>
#include <explorer/schema/encoding/scale/encoder.hpp>
#include <explorer/testing/chain_builder.hpp>
#include <explorer/testing/indexer_fixture.hpp>

#include <cctype>
#include <optional>
#include <string>
#include <tuple>
#include <variant>
#include <vector>

namespace {

using encoder_t = explorer::schema::encoding::encoder<
    explorer::schema::encoding::scale_encoder_tag>;
using explorer::schema::applied_block_t;
using explorer::schema::block_id_t;
using explorer::schema::chain_length_t;
using explorer::schema::pagination_arguments;
using explorer::schema::query_error_code;
using explorer::schema::transaction_input;
using explorer::schema::transaction_output;
using explorer::testing::indexer_fixture;
using explorer::testing::make_address;
using explorer::testing::make_chain;
using explorer::testing::make_child;
using explorer::testing::make_genesis;
using explorer::testing::make_hash;
using explorer::testing::make_transaction;

/// Genesis plus `length` blocks; returns every block including genesis.
std::vector<applied_block_t> ingest_line(indexer_fixture& fixture,
                                         const std::size_t length) {
  auto genesis = make_genesis();
  auto blocks = std::vector<applied_block_t>{genesis};
  for (auto& block : make_chain(genesis, length)) {
    blocks.push_back(std::move(block));
  }
  fixture.ingest_all(blocks);
  return blocks;
}

std::string uppercase(std::string value) {
  for (auto& ch : value) {
    ch = static_cast<char>(std::toupper(static_cast<unsigned char>(ch)));
  }
  return value;
}

std::vector<chain_length_t> chain_lengths(
    const explorer::schema::connection<explorer::schema::block_view>& page) {
  auto out = std::vector<chain_length_t>{};
  for (const auto& edge : page.edges) {
    out.push_back(edge.node->block.chain_length);
  }
  return out;
}

explorer::schema::vote_plan_certificate make_plan(
    const explorer::schema::vote_plan_id_t& id,
    const explorer::schema::payload_type_t payload_type) {
  return explorer::schema::vote_plan_certificate{
      .vote_plan_id = id,
      .vote_start = {.epoch = 0, .slot = 0},
      .vote_end = {.epoch = 1, .slot = 0},
      .committee_end = {.epoch = 2, .slot = 0},
      .payload_type = payload_type,
      .proposals = {{.external_id = make_hash("proposal-0"), .options = 3},
                    {.external_id = make_hash("proposal-1"), .options = 2}}};
}

}  // namespace

TEST(resolver, block_lookup_reports_confirmation_and_branches) {
  auto fixture = indexer_fixture{
      "explorer_resolver_block",
      explorer::index::indexer_options{.epoch_stability_depth = 2}};
  auto blocks = ingest_line(fixture, 4);

  auto confirmed = fixture.resolver().block(blocks[1].id);
  ASSERT_TRUE(confirmed.ok());
  EXPECT_TRUE(confirmed.value->is_confirmed);
  EXPECT_EQ(confirmed.value->branches.size(), 1u);
  EXPECT_EQ(confirmed.value->block.chain_length, 1u);

  auto recent = fixture.resolver().block(blocks[4].id);
  ASSERT_TRUE(recent.ok());
  EXPECT_FALSE(recent.value->is_confirmed);

  auto missing = fixture.resolver().block(make_hash("missing"));
  EXPECT_EQ(missing.code, query_error_code::not_found);
}

TEST(resolver, confirmation_never_reverts) {
  auto fixture = indexer_fixture{
      "explorer_resolver_confirmation",
      explorer::index::indexer_options{.epoch_stability_depth = 2}};
  auto blocks = ingest_line(fixture, 3);
  ASSERT_TRUE(fixture.resolver().block(blocks[1].id).value->is_confirmed);

  // A heavier fork off the newest block keeps the confirmed prefix.
  auto fork = make_child(blocks[2], "fork", 10);
  fixture.ingest(fork);
  fixture.ingest(make_child(fork, "fork-next"));
  EXPECT_TRUE(fixture.resolver().block(blocks[1].id).value->is_confirmed);
  EXPECT_TRUE(fixture.resolver().block(blocks[0].id).value->is_confirmed);
}

TEST(resolver, excluded_block_resolves_without_branches) {
  auto fixture = indexer_fixture{
      "explorer_resolver_excluded",
      explorer::index::indexer_options{.epoch_stability_depth = 1}};
  auto blocks = ingest_line(fixture, 3);
  auto late = make_child(blocks[1], "late", 50);
  fixture.ingest(late);

  auto view = fixture.resolver().block(late.id);
  ASSERT_TRUE(view.ok());
  EXPECT_TRUE(view.value->branches.empty());
  EXPECT_FALSE(view.value->is_confirmed);

  auto at_length = fixture.resolver().blocks_by_chain_length(2);
  ASSERT_TRUE(at_length.ok());
  ASSERT_EQ(at_length.value->size(), 1u);
  EXPECT_EQ(at_length.value->front().block.id, blocks[2].id);
}

TEST(resolver, tip_branches_and_branch_lookup) {
  auto fixture = indexer_fixture{"explorer_resolver_branches"};
  EXPECT_EQ(fixture.resolver().tip().code, query_error_code::not_found);

  auto blocks = ingest_line(fixture, 2);
  auto fork = make_child(blocks[1], "fork", 1);
  fixture.ingest(fork);

  auto tip = fixture.resolver().tip();
  ASSERT_TRUE(tip.ok());
  EXPECT_EQ(tip.value->tip, fork.id);
  EXPECT_TRUE(tip.value->is_main);

  auto branches = fixture.resolver().branches();
  ASSERT_TRUE(branches.ok());
  EXPECT_EQ(branches.value->size(), 2u);

  auto by_id = fixture.resolver().branch(tip.value->id);
  ASSERT_TRUE(by_id.ok());
  EXPECT_EQ(by_id.value->chain_length, 2u);
  EXPECT_EQ(fixture.resolver().branch(99).code, query_error_code::not_found);

  auto siblings = fixture.resolver().blocks_by_chain_length(2);
  ASSERT_TRUE(siblings.ok());
  EXPECT_EQ(siblings.value->size(), 2u);
}

TEST(resolver, branch_blocks_page_by_chain_length) {
  auto fixture = indexer_fixture{"explorer_resolver_branch_blocks"};
  ingest_line(fixture, 4);
  auto branch = fixture.resolver().tip().value->id;

  auto head = fixture.resolver().branch_blocks(
      branch, pagination_arguments{.first = 2});
  ASSERT_TRUE(head.ok());
  EXPECT_EQ(chain_lengths(*head.value), (std::vector<chain_length_t>{0, 1}));
  EXPECT_EQ(head.value->total_count, 5u);

  auto next = fixture.resolver().branch_blocks(
      branch,
      pagination_arguments{.first = 2, .after = head.value->edges[0].cursor});
  ASSERT_TRUE(next.ok());
  EXPECT_EQ(chain_lengths(*next.value), (std::vector<chain_length_t>{1, 2}));
  EXPECT_TRUE(next.value->page.has_previous_page);
  EXPECT_TRUE(next.value->page.has_next_page);

  auto tail = fixture.resolver().branch_blocks(
      branch, pagination_arguments{.last = 1});
  ASSERT_TRUE(tail.ok());
  EXPECT_EQ(chain_lengths(*tail.value), (std::vector<chain_length_t>{4}));
  EXPECT_FALSE(tail.value->page.has_next_page);

  // A cursor from another sequence is refused.
  auto other = fixture.resolver().epoch_blocks(0, std::nullopt,
                                               pagination_arguments{.first = 1});
  ASSERT_TRUE(other.ok());
  auto foreign = fixture.resolver().branch_blocks(
      branch,
      pagination_arguments{.after = other.value->edges[0].cursor});
  EXPECT_EQ(foreign.code, query_error_code::invalid_cursor);

  EXPECT_EQ(fixture.resolver()
                .branch_blocks(77, pagination_arguments{})
                .code,
            query_error_code::not_found);
}

TEST(resolver, epochs_follow_block_dates) {
  auto fixture = indexer_fixture{"explorer_resolver_epochs"};
  // Four slots per epoch: lengths 4..6 fall in epoch 1.
  auto blocks = ingest_line(fixture, 6);

  auto epoch = fixture.resolver().epoch(1, std::nullopt);
  ASSERT_TRUE(epoch.ok());
  EXPECT_EQ(epoch.value->first_block, blocks[4].id);
  EXPECT_EQ(epoch.value->last_block, blocks[6].id);
  EXPECT_EQ(epoch.value->total_blocks, 3u);

  auto page = fixture.resolver().epoch_blocks(1, std::nullopt,
                                              pagination_arguments{});
  ASSERT_TRUE(page.ok());
  EXPECT_EQ(chain_lengths(*page.value), (std::vector<chain_length_t>{4, 5, 6}));
  EXPECT_EQ(page.value->total_count, 3u);

  EXPECT_EQ(fixture.resolver().epoch(5, std::nullopt).code,
            query_error_code::not_found);
  auto empty = fixture.resolver().epoch_blocks(5, std::nullopt,
                                               pagination_arguments{});
  ASSERT_TRUE(empty.ok());
  EXPECT_TRUE(empty.value->edges.empty());
  EXPECT_EQ(empty.value->total_count, 0u);
  EXPECT_EQ(fixture.resolver().epoch(0, 42).code, query_error_code::not_found);
}

TEST(resolver, transactions_and_addresses) {
  auto fixture = indexer_fixture{"explorer_resolver_transactions"};
  auto alice = make_address("alice");
  auto bob = make_address("bob");
  auto genesis = make_genesis();
  auto first = make_child(
      genesis, "first", 0,
      {make_transaction("fund", {},
                        {transaction_output{.value = 50, .address = alice}}),
       make_transaction("fund-bob", {},
                        {transaction_output{.value = 5, .address = bob}})});
  auto second = make_child(
      first, "second", 0,
      {make_transaction("pay", {transaction_input{.value = 20, .address = alice}},
                        {transaction_output{.value = 20, .address = bob}})});
  fixture.ingest_all({genesis, first, second});

  auto transaction = fixture.resolver().transaction(make_hash("pay"));
  ASSERT_TRUE(transaction.ok());
  EXPECT_EQ(transaction.value->blocks, (std::vector<block_id_t>{second.id}));
  EXPECT_EQ(fixture.resolver().transaction(make_hash("nope")).code,
            query_error_code::not_found);

  auto in_block = fixture.resolver().block_transactions(
      first.id, pagination_arguments{.last = 1});
  ASSERT_TRUE(in_block.ok());
  ASSERT_EQ(in_block.value->edges.size(), 1u);
  EXPECT_EQ(in_block.value->edges[0].node->transaction.id, make_hash("fund-bob"));
  EXPECT_EQ(in_block.value->total_count, 2u);

  auto account = fixture.resolver().address(alice);
  ASSERT_TRUE(account.ok());
  EXPECT_EQ(account.value->balance, 30u);
  EXPECT_EQ(account.value->total_transactions, 2u);

  auto history = fixture.resolver().address_transactions(
      bob, pagination_arguments{.first = 10});
  ASSERT_TRUE(history.ok());
  ASSERT_EQ(history.value->edges.size(), 2u);
  EXPECT_EQ(history.value->edges[0].node->transaction.id, make_hash("fund-bob"));
  EXPECT_EQ(history.value->edges[1].node->transaction.id, make_hash("pay"));

  EXPECT_EQ(fixture.resolver().address("not-an-address").code,
            query_error_code::invalid_argument);
  EXPECT_EQ(fixture.resolver().address(make_address("stranger")).code,
            query_error_code::not_found);
}

TEST(resolver, uppercase_address_names_the_same_account) {
  auto fixture = indexer_fixture{"explorer_resolver_address_case"};
  auto alice = make_address("alice");
  auto upper = uppercase(alice);
  auto genesis = make_genesis();
  // The feed spells the address in uppercase for one of the two outputs.
  auto funded = make_child(
      genesis, "funded", 0,
      {make_transaction("fund", {},
                        {transaction_output{.value = 10, .address = alice}}),
       make_transaction("fund-upper", {},
                        {transaction_output{.value = 4, .address = upper}})});
  fixture.ingest_all({genesis, funded});

  for (const auto& spelling : {alice, upper}) {
    auto account = fixture.resolver().address(spelling);
    ASSERT_TRUE(account.ok()) << spelling;
    EXPECT_EQ(account.value->id, alice);
    EXPECT_EQ(account.value->balance, 14u);
    EXPECT_EQ(account.value->total_transactions, 2u);

    auto history = fixture.resolver().address_transactions(
        spelling, pagination_arguments{.first = 10});
    ASSERT_TRUE(history.ok()) << spelling;
    EXPECT_EQ(history.value->edges.size(), 2u);
  }

  auto mixed = alice;
  mixed.front() = 'A';
  EXPECT_EQ(fixture.resolver().address(mixed).code,
            query_error_code::invalid_argument);
}

TEST(resolver, stake_pools_and_their_blocks) {
  auto fixture = indexer_fixture{"explorer_resolver_pools"};
  auto pool_id = make_hash("pool");
  auto genesis = make_genesis();
  auto registered = make_child(
      genesis, "registered", 0,
      {make_transaction("register", {}, {},
                        explorer::testing::make_pool_registration(pool_id))});
  auto produced = make_child(registered, "produced");
  produced.leader = explorer::schema::pool_leader{.pool_id = pool_id};
  fixture.ingest_all({genesis, registered, produced});

  auto pool = fixture.resolver().stake_pool(pool_id);
  ASSERT_TRUE(pool.ok());
  EXPECT_EQ(pool.value->total_blocks, 1u);
  EXPECT_EQ(pool.value->registration.rewards.fixed, 10u);
  EXPECT_FALSE(pool.value->retirement.has_value());

  auto blocks = fixture.resolver().stake_pool_blocks(pool_id,
                                                     pagination_arguments{});
  ASSERT_TRUE(blocks.ok());
  ASSERT_EQ(blocks.value->edges.size(), 1u);
  EXPECT_EQ(blocks.value->edges[0].node->block.id, produced.id);

  auto listed = fixture.resolver().branch_stake_pools(
      fixture.resolver().tip().value->id, pagination_arguments{});
  ASSERT_TRUE(listed.ok());
  ASSERT_EQ(listed.value->edges.size(), 1u);
  EXPECT_EQ(listed.value->edges[0].node->id, pool_id);

  EXPECT_EQ(fixture.resolver().stake_pool(make_hash("other")).code,
            query_error_code::not_found);
}

TEST(resolver, private_tally_is_pending_until_decrypted) {
  auto fixture = indexer_fixture{"explorer_resolver_private_tally"};
  auto plan_id = make_hash("private-plan");
  auto voter = make_address("voter");
  auto genesis = make_genesis();
  auto created = make_child(
      genesis, "created", 0,
      {make_transaction(
          "plan", {}, {},
          make_plan(plan_id, explorer::schema::payload_type_t::private_payload))});
  auto voted = make_child(
      created, "voted", 0,
      {make_transaction(
          "vote", {transaction_input{.value = 0, .address = voter}}, {},
          explorer::schema::vote_cast{
              .vote_plan_id = plan_id,
              .proposal_index = 1,
              .payload = explorer::schema::private_vote_payload{
                  .encrypted_vote = {1, 2, 3}, .proof = {4}}})});
  fixture.ingest_all({genesis, created, voted});

  auto plan = fixture.resolver().vote_plan(plan_id);
  ASSERT_TRUE(plan.ok());
  ASSERT_EQ(plan.value->proposals.size(), 2u);
  const auto& proposal = plan.value->proposals[0];
  EXPECT_EQ(proposal.options, (explorer::schema::option_range{.start = 0, .end = 3}));
  ASSERT_TRUE(proposal.tally.has_value());
  const auto* pending =
      std::get_if<explorer::schema::tally_private_status>(&*proposal.tally);
  ASSERT_NE(pending, nullptr);
  EXPECT_FALSE(pending->results.has_value());
  EXPECT_EQ(pending->options, (explorer::schema::option_range{.start = 0, .end = 3}));
  EXPECT_EQ(plan.value->proposals[1].votes_count, 1u);

  auto votes = fixture.resolver().proposal_votes(plan_id, 1,
                                                 pagination_arguments{});
  ASSERT_TRUE(votes.ok());
  ASSERT_EQ(votes.value->edges.size(), 1u);
  EXPECT_EQ(votes.value->edges[0].node->address, voter);
  EXPECT_EQ(fixture.resolver().proposal_votes(plan_id, 9, {}).code,
            query_error_code::not_found);

  fixture.ingest(make_child(
      voted, "tallied", 0,
      {make_transaction("tally", {}, {},
                        explorer::schema::vote_tally{
                            .vote_plan_id = plan_id,
                            .results = {{7, 8, 9}, {0, 1}}})}));
  auto tallied = fixture.resolver().vote_plan(plan_id);
  ASSERT_TRUE(tallied.ok());
  const auto& decrypted = std::get<explorer::schema::tally_private_status>(
      *tallied.value->proposals[0].tally);
  ASSERT_TRUE(decrypted.results.has_value());
  EXPECT_EQ(*decrypted.results, (std::vector<explorer::schema::weight_t>{7, 8, 9}));
}

TEST(resolver, public_tally_appears_with_results) {
  auto fixture = indexer_fixture{"explorer_resolver_public_tally"};
  auto plan_id = make_hash("public-plan");
  auto genesis = make_genesis();
  auto created = make_child(
      genesis, "created", 0,
      {make_transaction(
          "plan", {}, {},
          make_plan(plan_id, explorer::schema::payload_type_t::public_payload))});
  fixture.ingest_all({genesis, created});

  auto before = fixture.resolver().vote_plan(plan_id);
  ASSERT_TRUE(before.ok());
  EXPECT_FALSE(before.value->proposals[0].tally.has_value());

  fixture.ingest(make_child(
      created, "tallied", 0,
      {make_transaction("tally", {}, {},
                        explorer::schema::vote_tally{
                            .vote_plan_id = plan_id,
                            .results = {{1, 2, 3}, {4, 5}}})}));
  auto after = fixture.resolver().vote_plan(plan_id);
  ASSERT_TRUE(after.ok());
  const auto& status = std::get<explorer::schema::tally_public_status>(
      *after.value->proposals[1].tally);
  EXPECT_EQ(status.results, (std::vector<explorer::schema::weight_t>{4, 5}));
  EXPECT_EQ(status.options.end, 2u);

  auto listed = fixture.resolver().branch_vote_plans(
      fixture.resolver().tip().value->id, pagination_arguments{});
  ASSERT_TRUE(listed.ok());
  ASSERT_EQ(listed.value->edges.size(), 1u);
  EXPECT_EQ(listed.value->edges[0].node->id, plan_id);
}

TEST(resolver, settings_report_stability_depth) {
  auto fixture = indexer_fixture{
      "explorer_resolver_settings",
      explorer::index::indexer_options{.epoch_stability_depth = 7}};
  auto settings = fixture.resolver().settings();
  ASSERT_TRUE(settings.ok());
  EXPECT_EQ(settings.value->epoch_stability_depth, 7u);
}

TEST(resolver, query_routes_paths) {
  auto fixture = indexer_fixture{"explorer_resolver_query"};
  auto blocks = ingest_line(fixture, 2);
  auto encoder = encoder_t{};

  auto tip = fixture.resolver().query("/tip", {});
  EXPECT_TRUE(tip.ok());
  EXPECT_EQ(tip.height, 2u);
  EXPECT_EQ(tip.codespace, "explorer");
  EXPECT_EQ(tip.info, "/tip");
  auto decoded_tip = encoder.try_decode<explorer::schema::branch_view>(
      explorer::schema::make_bytes_view(tip.value));
  ASSERT_TRUE(decoded_tip.has_value());
  EXPECT_EQ(decoded_tip->tip, blocks[2].id);

  auto request = encoder.encode(std::tuple{blocks[1].id});
  auto block = fixture.resolver().query(
      "/block", explorer::schema::make_bytes_view(request));
  EXPECT_TRUE(block.ok());
  EXPECT_EQ(block.key, request);
  auto decoded_block = encoder.try_decode<explorer::schema::block_view>(
      explorer::schema::make_bytes_view(block.value));
  ASSERT_TRUE(decoded_block.has_value());
  EXPECT_EQ(decoded_block->block.id, blocks[1].id);

  auto page_request = encoder.encode(std::tuple{
      fixture.resolver().tip().value->id, pagination_arguments{.first = 1}});
  auto page = fixture.resolver().query(
      "/branch/blocks", explorer::schema::make_bytes_view(page_request));
  EXPECT_TRUE(page.ok());
  auto decoded_page = encoder.try_decode<
      explorer::schema::connection<explorer::schema::block_view>>(
      explorer::schema::make_bytes_view(page.value));
  ASSERT_TRUE(decoded_page.has_value());
  EXPECT_EQ(decoded_page->total_count, 3u);
  ASSERT_EQ(decoded_page->edges.size(), 1u);

  auto unknown = fixture.resolver().query("/nowhere", {});
  EXPECT_EQ(unknown.code, query_error_code::unsupported_path);
  EXPECT_EQ(unknown.height, 2u);

  auto junk = explorer::schema::bytes_t{1};
  auto malformed = fixture.resolver().query(
      "/block", explorer::schema::make_bytes_view(junk));
  EXPECT_EQ(malformed.code, query_error_code::invalid_argument);
}
