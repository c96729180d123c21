// Repository: LumenSync
// Component: SyncControl gRPC Service
// Purpose: Read-only status and shutdown requests for a running engine.
// Copyright (c) 2026 LumenSync

#ifndef LUMENSYNC_CONTROL_SYNC_CONTROL_SERVICE_HPP_
#define LUMENSYNC_CONTROL_SYNC_CONTROL_SERVICE_HPP_

#include <memory>
#include <string>

#include <grpcpp/grpcpp.h>

#include "sync_control.grpc.pb.h"
#include "sync_control.pb.h"
#include "lumensync/core/StreamSessionManager.hpp"
#include "lumensync/core/SyncEngine.hpp"

namespace lumensync::control {

// Thin adapter over SyncEngine::GetStatus() and RequestStop(). Handlers run
// on gRPC threads and only touch the engine's mutex-protected snapshot.
class SyncControlImpl final : public v1::SyncControl::Service {
 public:
  SyncControlImpl(core::SyncEngine& engine, const core::StreamSessionManager& sessions);

  SyncControlImpl(const SyncControlImpl&) = delete;
  SyncControlImpl& operator=(const SyncControlImpl&) = delete;

  grpc::Status GetStatus(grpc::ServerContext* context,
                         const v1::GetStatusRequest* request,
                         v1::SyncStatus* response) override;

  grpc::Status RequestShutdown(grpc::ServerContext* context,
                               const v1::ShutdownRequest* request,
                               v1::ShutdownResponse* response) override;

  grpc::Status GetVersion(grpc::ServerContext* context,
                          const v1::ApiVersionRequest* request,
                          v1::ApiVersion* response) override;

  static v1::SyncPhase ToProto(core::SyncPhase phase);

 private:
  core::SyncEngine& engine_;
  const core::StreamSessionManager& sessions_;
};

// Owns the grpc::Server hosting SyncControlImpl.
class ControlServer {
 public:
  ControlServer(core::SyncEngine& engine, const core::StreamSessionManager& sessions);
  ~ControlServer();

  ControlServer(const ControlServer&) = delete;
  ControlServer& operator=(const ControlServer&) = delete;

  // Binds `address` ("host:port", insecure). False when the port cannot
  // be bound.
  bool Start(const std::string& address);

  // Idempotent. In-flight RPCs get a short grace period.
  void Stop();

  int bound_port() const { return bound_port_; }

 private:
  SyncControlImpl service_;
  std::unique_ptr<grpc::Server> server_;
  int bound_port_ = 0;
};

}  // namespace lumensync::control

#endif  // LUMENSYNC_CONTROL_SYNC_CONTROL_SERVICE_HPP_
