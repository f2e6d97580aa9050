#pragma once

#include <notary/v1/ledger.grpc.pb.h>
#include <notary/execution/engine.hpp>

namespace notary::rpc {

/// Callback listener through which a consensus driver runs the registry.
///
/// - Echo: liveness.
/// - Info: committed height, time and state root for the handshake.
/// - CheckTx: mempool admission; no state mutation.
/// - FinalizeBlock: execute a block at its block time and return tx results
///   plus the candidate state root.
/// - Commit: persist the finalized block.
/// - Query: read committed state by route.
struct listener final : public notary::v1::Ledger::CallbackService {
  /// Bind listener to execution engine instance.
  explicit listener(notary::execution::engine& engine);

  virtual grpc::ServerUnaryReactor* Echo(
      grpc::CallbackServerContext* context,
      const notary::v1::RequestEcho* request,
      notary::v1::ResponseEcho* response) override final;

  virtual grpc::ServerUnaryReactor* Info(
      grpc::CallbackServerContext* context,
      const notary::v1::RequestInfo* request,
      notary::v1::ResponseInfo* response) override final;

  virtual grpc::ServerUnaryReactor* CheckTx(
      grpc::CallbackServerContext* context,
      const notary::v1::RequestCheckTx* request,
      notary::v1::ResponseCheckTx* response) override final;

  virtual grpc::ServerUnaryReactor* FinalizeBlock(
      grpc::CallbackServerContext* context,
      const notary::v1::RequestFinalizeBlock* request,
      notary::v1::ResponseFinalizeBlock* response) override final;

  virtual grpc::ServerUnaryReactor* Commit(
      grpc::CallbackServerContext* context,
      const notary::v1::RequestCommit* request,
      notary::v1::ResponseCommit* response) override final;

  virtual grpc::ServerUnaryReactor* Query(
      grpc::CallbackServerContext* context,
      const notary::v1::RequestQuery* request,
      notary::v1::ResponseQuery* response) override final;

  notary::execution::engine& execution_engine_;
};

}  // namespace notary::rpc
