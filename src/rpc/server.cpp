#include <explorer/rpc/server.hpp>
#include <explorer/schema/encoding/scale/encoder.hpp>

#include <boost/asio/post.hpp>
#include <spdlog/spdlog.h>

#include <exception>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>

namespace explorer::rpc {

using namespace explorer::schema;

namespace {

using encoder_t = encoding::encoder<encoding::scale_encoder_tag>;

grpc::ServerUnaryReactor* finish_ok(grpc::CallbackServerContext* context) {
  auto* reactor = context->DefaultReactor();
  reactor->Finish(grpc::Status::OK);
  return reactor;
}

void populate_query_response(const query_result_t& source,
                             v1::QueryResponse* destination) {
  destination->set_code(static_cast<uint32_t>(source.code));
  destination->set_log(source.log);
  destination->set_info(source.info);
  destination->set_key(make_string(source.key));
  destination->set_value(make_string(source.value));
  destination->set_height(source.height);
  destination->set_codespace(source.codespace);
}

grpc::Status resolve_query(const explorer::query::resolver& resolver,
                           const v1::QueryRequest& request,
                           v1::QueryResponse* response,
                           const std::stop_token& stop) {
  try {
    auto result =
        resolver.query(request.path(), make_bytes_view(request.data()), stop);
    populate_query_response(result, response);
    if (result.code == query_error_code::cancelled) {
      return grpc::Status::CANCELLED;
    }
    return grpc::Status::OK;
  } catch (const std::exception& ex) {
    spdlog::error("Query {} failed: {}", request.path(), ex.what());
    return grpc::Status{grpc::StatusCode::INTERNAL, ex.what()};
  }
}

/// Resolves one query on the listener's worker pool so a cancelled call can
/// stop a long page between edges.
class query_reactor final : public grpc::ServerUnaryReactor {
 public:
  query_reactor(boost::asio::thread_pool& pool,
                const explorer::query::resolver& resolver,
                const v1::QueryRequest* request,
                v1::QueryResponse* response) {
    auto stop = stop_.get_token();
    boost::asio::post(pool, [this, &resolver, request, response, stop] {
      Finish(resolve_query(resolver, *request, response, stop));
    });
  }

  void OnCancel() override { stop_.request_stop(); }
  void OnDone() override { delete this; }

 private:
  std::stop_source stop_;
};

/// Streams main branch tips. At most one write is in flight; tips arriving
/// meanwhile collapse into the subscription's single pending slot. Finish is
/// never issued while a write is in flight: a finish requested meanwhile is
/// deferred to OnWriteDone.
class tip_reactor final
    : public grpc::ServerWriteReactor<v1::TipEvent> {
 public:
  explicit tip_reactor(explorer::query::tip_channel& tips)
      : subscription_{tips.subscribe()} {
    subscription_->set_notify([this] { pump(); });
    pump();
  }

  void OnWriteDone(bool ok) override {
    auto deferred = std::optional<grpc::Status>{};
    {
      auto lock = std::scoped_lock{mutex_};
      writing_ = false;
      if (finished_) {
        deferred = std::move(deferred_finish_);
        deferred_finish_.reset();
      } else if (!ok) {
        finished_ = true;
        deferred = grpc::Status::CANCELLED;
      }
    }
    if (deferred.has_value()) {
      Finish(std::move(*deferred));
      return;
    }
    pump();
  }

  void OnCancel() override { finish(grpc::Status::CANCELLED); }

  void OnDone() override {
    subscription_->set_notify({});
    delete this;
  }

 private:
  void pump() {
    {
      auto lock = std::scoped_lock{mutex_};
      if (writing_ || finished_) {
        return;
      }
      auto tip = subscription_->try_next();
      if (!tip.has_value()) {
        return;
      }
      populate_tip_event(*tip, &event_);
      writing_ = true;
    }
    StartWrite(&event_);
  }

  void finish(grpc::Status status) {
    {
      auto lock = std::scoped_lock{mutex_};
      if (finished_) {
        return;
      }
      finished_ = true;
      if (writing_) {
        deferred_finish_ = std::move(status);
        return;
      }
    }
    Finish(std::move(status));
  }

  std::mutex mutex_;
  bool writing_{};
  bool finished_{};
  std::optional<grpc::Status> deferred_finish_;
  v1::TipEvent event_;
  std::shared_ptr<explorer::query::tip_subscription> subscription_;
};

}  // namespace

void populate_tip_event(const branch_view& tip, v1::TipEvent* destination) {
  destination->set_branch_id(tip.id);
  destination->set_block_id(std::string{std::begin(tip.tip), std::end(tip.tip)});
  destination->set_chain_length(tip.chain_length);
  destination->set_epoch(tip.date.epoch);
  destination->set_slot(tip.date.slot);
}

listener::listener(explorer::index::indexer& indexer,
                   const explorer::query::resolver& resolver,
                   explorer::query::tip_channel& tips,
                   const std::size_t query_threads)
    : indexer_{indexer},
      resolver_{resolver},
      tips_{tips},
      query_pool_{query_threads == 0 ? 1 : query_threads} {}

listener::~listener() {
  query_pool_.join();
}

grpc::ServerUnaryReactor* listener::ApplyBlock(
    grpc::CallbackServerContext* context,
    const v1::ApplyBlockRequest* request,
    v1::ApplyBlockResponse* response) {
  auto encoder = encoder_t{};
  auto block =
      encoder.try_decode<applied_block_t>(make_bytes_view(request->block()));
  if (!block.has_value()) {
    spdlog::warn("Rejecting undecodable applied block ({} bytes)",
                 request->block().size());
    response->set_code(static_cast<uint32_t>(ingest_status_t::rejected));
    response->set_log("malformed applied block");
    return finish_ok(context);
  }

  auto result = indexer_.ingest(*block);
  response->set_code(static_cast<uint32_t>(result.status));
  response->set_log(result.log);
  for (const auto& id : result.linked) {
    response->add_linked(std::string{std::begin(id), std::end(id)});
  }
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::Query(grpc::CallbackServerContext*,
                                          const v1::QueryRequest* request,
                                          v1::QueryResponse* response) {
  return new query_reactor(query_pool_, resolver_, request, response);
}

grpc::ServerWriteReactor<v1::TipEvent>* listener::SubscribeTip(
    grpc::CallbackServerContext*,
    const v1::SubscribeTipRequest*) {
  return new tip_reactor(tips_);
}

}  // namespace explorer::rpc
