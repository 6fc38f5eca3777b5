#pragma once

#include <explorer/rpc/v1/explorer.grpc.pb.h>
#include <explorer/index/indexer.hpp>
#include <explorer/query/resolver.hpp>
#include <explorer/query/tip_channel.hpp>

#include <boost/asio/thread_pool.hpp>

#include <cstddef>

namespace explorer::rpc {

/// Copy a resolved tip into its wire form.
void populate_tip_event(const explorer::schema::branch_view& tip,
                        explorer::rpc::v1::TipEvent* destination);

/// Explorer callback listener.
///
/// - ApplyBlock: ledger feed ingress; decodes a SCALE applied block and hands
///   it to the indexer.
/// - Query: path routed read; runs on a fixed pool of `query_threads`
///   workers and stops between page edges when the client cancels.
/// - SubscribeTip: streams the main branch tip, latest value only.
struct listener final : public explorer::rpc::v1::Explorer::CallbackService {
  listener(explorer::index::indexer& indexer,
           const explorer::query::resolver& resolver,
           explorer::query::tip_channel& tips,
           std::size_t query_threads = 4);
  ~listener();

  listener(const listener&) = delete;
  listener& operator=(const listener&) = delete;

  virtual grpc::ServerUnaryReactor* ApplyBlock(
      grpc::CallbackServerContext* context,
      const explorer::rpc::v1::ApplyBlockRequest* request,
      explorer::rpc::v1::ApplyBlockResponse* response) override final;

  virtual grpc::ServerUnaryReactor* Query(
      grpc::CallbackServerContext* context,
      const explorer::rpc::v1::QueryRequest* request,
      explorer::rpc::v1::QueryResponse* response) override final;

  virtual grpc::ServerWriteReactor<explorer::rpc::v1::TipEvent>* SubscribeTip(
      grpc::CallbackServerContext* context,
      const explorer::rpc::v1::SubscribeTipRequest* request) override final;

  explorer::index::indexer& indexer_;
  const explorer::query::resolver& resolver_;
  explorer::query::tip_channel& tips_;
  boost::asio::thread_pool query_pool_;
};

}  // namespace explorer::rpc
