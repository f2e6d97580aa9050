#include <spdlog/spdlog.h>
#include <notary/rpc/server.hpp>
#include <string>
#include <vector>

using namespace notary::rpc;
using namespace notary::schema;

namespace {

grpc::ServerUnaryReactor* finish_ok(grpc::CallbackServerContext* context) {
  auto* reactor = context->DefaultReactor();
  reactor->Finish(grpc::Status::OK);
  return reactor;
}

void populate_exec_tx_result(const transaction_result_t& source,
                             notary::v1::ExecTxResult* destination) {
  destination->set_code(source.code);
  destination->set_data(make_string(source.data));
  destination->set_log(source.log);
  destination->set_info(source.info);
  destination->set_codespace(source.codespace);
  for (const auto& event : source.events) {
    auto* out = destination->add_events();
    out->set_type(event.type);
    for (const auto& attribute : event.attributes) {
      auto* out_attribute = out->add_attributes();
      out_attribute->set_key(attribute.key);
      out_attribute->set_value(attribute.value);
      out_attribute->set_index(attribute.index);
    }
  }
}

std::string to_raw_string(const bytes_view_t& bytes) {
  return std::string{make_string_view(bytes)};
}

}  // namespace

listener::listener(notary::execution::engine& engine)
    : execution_engine_{engine} {}

grpc::ServerUnaryReactor* listener::Echo(
    grpc::CallbackServerContext* context,
    const notary::v1::RequestEcho* request,
    notary::v1::ResponseEcho* response) {
  response->set_message(request->message());
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::Info(
    grpc::CallbackServerContext* context,
    const notary::v1::RequestInfo* /*request*/,
    notary::v1::ResponseInfo* response) {
  auto info = execution_engine_.info();
  response->set_data(info.data);
  response->set_version(info.version);
  response->set_app_version(info.app_version);
  response->set_last_block_height(info.last_block_height);
  response->set_last_block_time(info.last_block_time);
  response->set_last_block_state_root(
      to_raw_string(info.last_block_state_root));
  response->set_chain_id(to_raw_string(info.chain_id));
  response->set_registry_address(to_raw_string(info.registry_address));
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::CheckTx(
    grpc::CallbackServerContext* context,
    const notary::v1::RequestCheckTx* request,
    notary::v1::ResponseCheckTx* response) {
  auto tx = make_bytes(request->tx());
  auto check = execution_engine_.check_transaction(make_bytes_view(tx));
  response->set_code(check.code);
  response->set_data(make_string(check.data));
  response->set_log(check.log);
  response->set_info(check.info);
  response->set_codespace(check.codespace);
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::FinalizeBlock(
    grpc::CallbackServerContext* context,
    const notary::v1::RequestFinalizeBlock* request,
    notary::v1::ResponseFinalizeBlock* response) {
  if (request->height() <= 0) {
    auto* reactor = context->DefaultReactor();
    reactor->Finish(grpc::Status{grpc::StatusCode::INVALID_ARGUMENT,
                                 "block height must be positive"});
    return reactor;
  }
  auto txs = std::vector<bytes_t>{};
  txs.reserve(request->txs_size());
  for (const auto& tx : request->txs()) {
    txs.push_back(make_bytes(tx));
  }

  auto execution = execution_engine_.finalize_block(
      static_cast<uint64_t>(request->height()), request->time(), txs);
  for (const auto& tx_result : execution.tx_results) {
    populate_exec_tx_result(tx_result, response->add_tx_results());
  }
  response->set_state_root(to_raw_string(execution.state_root));
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::Commit(
    grpc::CallbackServerContext* context,
    const notary::v1::RequestCommit* /*request*/,
    notary::v1::ResponseCommit* response) {
  auto commit = execution_engine_.commit();
  response->set_committed_height(commit.committed_height);
  response->set_state_root(to_raw_string(commit.state_root));
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::Query(
    grpc::CallbackServerContext* context,
    const notary::v1::RequestQuery* request,
    notary::v1::ResponseQuery* response) {
  auto data = make_bytes(request->data());
  auto query = execution_engine_.query(request->path(), make_bytes_view(data));
  if (query.code != 0) {
    spdlog::debug("Query {} failed: {}", request->path(), query.log);
  }
  response->set_code(query.code);
  response->set_log(query.log);
  response->set_info(query.info);
  response->set_key(make_string(query.key));
  response->set_value(make_string(query.value));
  response->set_height(query.height);
  response->set_codespace(query.codespace);
  return finish_ok(context);
}
