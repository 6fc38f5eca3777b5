#include <gtest/gtest.h>
#include <grpcpp/grpcpp.h>
#include <explorer/rpc/server.hpp>
#include <explorer/schema/encoding/scale/encoder.hpp>
#include <explorer/testing/chain_builder.hpp>
#include <explorer/testing/indexer_fixture.hpp>

#include <atomic>
#include <chrono>
#include <cstddef>
#include <memory>
#include <string>
#include <thread>
#include <vector>

namespace {

using encoder_t = explorer::schema::encoding::encoder<
    explorer::schema::encoding::scale_encoder_tag>;
using explorer::schema::ingest_status_t;
using explorer::testing::indexer_fixture;
using explorer::testing::make_child;
using explorer::testing::make_genesis;

std::string to_wire(const explorer::schema::hash32_t& id) {
  return std::string{std::begin(id), std::end(id)};
}

/// Explorer service on an ephemeral local port over a scratch index.
class service_harness final {
 public:
  explicit service_harness(const std::string_view db_prefix,
                           const std::size_t query_threads = 2)
      : fixture_{db_prefix},
        listener_{fixture_.indexer(), fixture_.resolver(), fixture_.tips(),
                  query_threads} {
    auto port = 0;
    auto builder = grpc::ServerBuilder{};
    builder.AddListeningPort("127.0.0.1:0", grpc::InsecureServerCredentials(),
                             &port);
    builder.RegisterService(&listener_);
    server_ = builder.BuildAndStart();
    EXPECT_NE(server_, nullptr);
    EXPECT_NE(port, 0);
    stub_ = explorer::rpc::v1::Explorer::NewStub(grpc::CreateChannel(
        "127.0.0.1:" + std::to_string(port),
        grpc::InsecureChannelCredentials()));
  }

  service_harness(const service_harness&) = delete;
  service_harness& operator=(const service_harness&) = delete;

  ~service_harness() {
    if (server_) {
      server_->Shutdown(std::chrono::system_clock::now() +
                        std::chrono::seconds(2));
    }
  }

  explorer::rpc::v1::ApplyBlockResponse apply(
      const explorer::schema::applied_block_t& block) {
    auto encoder = encoder_t{};
    auto request = explorer::rpc::v1::ApplyBlockRequest{};
    request.set_block(explorer::schema::make_string(encoder.encode(block)));
    return apply_raw(request);
  }

  explorer::rpc::v1::ApplyBlockResponse apply_raw(
      const explorer::rpc::v1::ApplyBlockRequest& request) {
    auto context = grpc::ClientContext{};
    context.set_deadline(std::chrono::system_clock::now() +
                         std::chrono::seconds(5));
    auto response = explorer::rpc::v1::ApplyBlockResponse{};
    auto status = stub_->ApplyBlock(&context, request, &response);
    EXPECT_TRUE(status.ok()) << status.error_message();
    return response;
  }

  explorer::rpc::v1::Explorer::Stub& stub() { return *stub_; }

 private:
  indexer_fixture fixture_;
  explorer::rpc::listener listener_;
  std::unique_ptr<grpc::Server> server_;
  std::unique_ptr<explorer::rpc::v1::Explorer::Stub> stub_;
};

}  // namespace

TEST(server, populate_tip_event_copies_every_field) {
  auto tip = explorer::schema::branch_view{
      .id = 4,
      .tip = explorer::testing::make_hash("tip"),
      .chain_length = 12,
      .date = {.epoch = 3, .slot = 1},
      .is_main = true,
      .is_live = true};
  auto event = explorer::rpc::v1::TipEvent{};
  explorer::rpc::populate_tip_event(tip, &event);
  EXPECT_EQ(event.branch_id(), 4u);
  EXPECT_EQ(event.block_id(), to_wire(tip.tip));
  EXPECT_EQ(event.chain_length(), 12u);
  EXPECT_EQ(event.epoch(), 3u);
  EXPECT_EQ(event.slot(), 1u);
}

TEST(server, apply_block_reports_ingest_status) {
  auto harness = service_harness{"explorer_server_apply"};
  auto genesis = make_genesis();
  auto child = make_child(genesis, "child");

  auto orphan = harness.apply(child);
  EXPECT_EQ(orphan.code, static_cast<uint32_t>(ingest_status_t::orphan));

  auto linked = harness.apply(genesis);
  EXPECT_EQ(linked.code, static_cast<uint32_t>(ingest_status_t::linked));
  ASSERT_EQ(linked.linked_size(), 2);
  EXPECT_EQ(linked.linked(0), to_wire(genesis.id));
  EXPECT_EQ(linked.linked(1), to_wire(child.id));

  auto garbage = explorer::rpc::v1::ApplyBlockRequest{};
  garbage.set_block("\x01\x02");
  auto rejected = harness.apply_raw(garbage);
  EXPECT_EQ(rejected.code, static_cast<uint32_t>(ingest_status_t::rejected));
  EXPECT_FALSE(rejected.log().empty());
}

TEST(server, query_returns_encoded_result) {
  auto harness = service_harness{"explorer_server_query"};
  auto genesis = make_genesis();
  harness.apply(genesis);
  harness.apply(make_child(genesis, "child"));

  auto context = grpc::ClientContext{};
  auto request = explorer::rpc::v1::QueryRequest{};
  request.set_path("/tip");
  auto response = explorer::rpc::v1::QueryResponse{};
  auto status = harness.stub().Query(&context, request, &response);
  ASSERT_TRUE(status.ok()) << status.error_message();
  EXPECT_EQ(response.code(), 0u);
  EXPECT_EQ(response.height(), 1);
  EXPECT_EQ(response.codespace(), "explorer");

  auto encoder = encoder_t{};
  auto tip = encoder.try_decode<explorer::schema::branch_view>(
      explorer::schema::make_bytes_view(response.value()));
  ASSERT_TRUE(tip.has_value());
  EXPECT_EQ(tip->chain_length, 1u);

  auto unknown_context = grpc::ClientContext{};
  auto unknown = explorer::rpc::v1::QueryRequest{};
  unknown.set_path("/missing");
  auto unknown_response = explorer::rpc::v1::QueryResponse{};
  ASSERT_TRUE(
      harness.stub().Query(&unknown_context, unknown, &unknown_response).ok());
  EXPECT_EQ(unknown_response.code(),
            static_cast<uint32_t>(
                explorer::schema::query_error_code::unsupported_path));
}

TEST(server, subscribe_tip_streams_current_then_new_tips) {
  auto harness = service_harness{"explorer_server_subscribe"};
  auto genesis = make_genesis();
  harness.apply(genesis);

  auto context = grpc::ClientContext{};
  context.set_deadline(std::chrono::system_clock::now() +
                       std::chrono::seconds(10));
  auto reader = harness.stub().SubscribeTip(
      &context, explorer::rpc::v1::SubscribeTipRequest{});

  auto event = explorer::rpc::v1::TipEvent{};
  ASSERT_TRUE(reader->Read(&event));
  EXPECT_EQ(event.chain_length(), 0u);
  EXPECT_EQ(event.block_id(), to_wire(genesis.id));

  auto child = make_child(genesis, "child");
  harness.apply(child);
  ASSERT_TRUE(reader->Read(&event));
  EXPECT_EQ(event.chain_length(), 1u);
  EXPECT_EQ(event.block_id(), to_wire(child.id));

  context.TryCancel();
  while (reader->Read(&event)) {
  }
  EXPECT_FALSE(reader->Finish().ok());
}

TEST(server, query_burst_is_served_by_a_single_worker) {
  auto harness = service_harness{"explorer_server_query_burst", 1};
  harness.apply(make_genesis());

  auto served = std::atomic<int>{};
  {
    auto clients = std::vector<std::jthread>{};
    for (auto i = 0; i < 16; ++i) {
      clients.emplace_back([&] {
        auto context = grpc::ClientContext{};
        context.set_deadline(std::chrono::system_clock::now() +
                             std::chrono::seconds(10));
        auto request = explorer::rpc::v1::QueryRequest{};
        request.set_path("/tip");
        auto response = explorer::rpc::v1::QueryResponse{};
        auto status = harness.stub().Query(&context, request, &response);
        if (status.ok() && response.code() == 0u) {
          ++served;
        }
      });
    }
  }
  EXPECT_EQ(served.load(), 16);
}

TEST(server, subscriptions_cancelled_during_ingestion_finish) {
  auto harness = service_harness{"explorer_server_subscribe_cancel"};
  auto parent = make_genesis();
  harness.apply(parent);

  for (auto round = 0; round < 10; ++round) {
    auto context = grpc::ClientContext{};
    context.set_deadline(std::chrono::system_clock::now() +
                         std::chrono::seconds(10));
    auto reader = harness.stub().SubscribeTip(
        &context, explorer::rpc::v1::SubscribeTipRequest{});
    auto event = explorer::rpc::v1::TipEvent{};
    ASSERT_TRUE(reader->Read(&event));

    auto blocks = std::vector<explorer::schema::applied_block_t>{};
    for (auto i = 0; i < 5; ++i) {
      auto child = make_child(parent, "round-" + std::to_string(round) + "-" +
                                          std::to_string(i));
      blocks.push_back(child);
      parent = std::move(child);
    }
    {
      auto feeder = std::jthread{[&] {
        for (const auto& block : blocks) {
          harness.apply(block);
        }
      }};
      context.TryCancel();
      while (reader->Read(&event)) {
      }
      EXPECT_FALSE(reader->Finish().ok());
    }
  }
  auto context = grpc::ClientContext{};
  auto request = explorer::rpc::v1::QueryRequest{};
  request.set_path("/tip");
  auto response = explorer::rpc::v1::QueryResponse{};
  ASSERT_TRUE(harness.stub().Query(&context, request, &response).ok());
  EXPECT_EQ(response.height(), 50);
}
