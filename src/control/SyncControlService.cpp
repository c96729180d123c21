// Repository: LumenSync
// Component: SyncControl gRPC Service
// Purpose: Read-only status and shutdown requests for a running engine.
// Copyright (c) 2026 LumenSync

#include "lumensync/control/SyncControlService.hpp"

#include <chrono>

#include "lumensync/Version.hpp"
#include "lumensync/util/Logger.hpp"

namespace lumensync::control {

using util::Logger;

SyncControlImpl::SyncControlImpl(core::SyncEngine& engine,
                                 const core::StreamSessionManager& sessions)
    : engine_(engine), sessions_(sessions) {}

v1::SyncPhase SyncControlImpl::ToProto(core::SyncPhase phase) {
  switch (phase) {
    case core::SyncPhase::kWaitingForDevice: return v1::SYNC_PHASE_WAITING_FOR_DEVICE;
    case core::SyncPhase::kStreaming: return v1::SYNC_PHASE_STREAMING;
    case core::SyncPhase::kIdle: return v1::SYNC_PHASE_IDLE;
    case core::SyncPhase::kDisconnected: return v1::SYNC_PHASE_DISCONNECTED;
    case core::SyncPhase::kTerminated: return v1::SYNC_PHASE_TERMINATED;
  }
  return v1::SYNC_PHASE_UNSPECIFIED;
}

grpc::Status SyncControlImpl::GetStatus(grpc::ServerContext* /*context*/,
                                        const v1::GetStatusRequest* /*request*/,
                                        v1::SyncStatus* response) {
  const core::SyncEngine::Status status = engine_.GetStatus();
  const core::StreamSessionManager::Snapshot session = sessions_.GetSnapshot();

  response->set_phase(ToProto(status.phase));
  response->set_phase_name(core::SyncPhaseToString(status.phase));
  response->set_session_state(core::SessionStateToString(session.state));
  response->set_consecutive_errors(status.consecutive_errors);
  response->set_ever_connected(status.ever_connected);
  response->set_frames_sent_total(status.frames_sent_total);
  response->set_last_rate_hz(status.last_rate_hz);
  response->set_last_transition(status.last_transition);
  response->set_session_opens_total(session.opens_total);
  response->set_session_open_failures_total(session.open_failures_total);
  response->set_send_errors_total(session.transient_errors_total);
  response->set_session_auto_closes_total(session.auto_close_total);
  return grpc::Status::OK;
}

grpc::Status SyncControlImpl::RequestShutdown(grpc::ServerContext* /*context*/,
                                              const v1::ShutdownRequest* request,
                                              v1::ShutdownResponse* response) {
  const bool already = engine_.StopRequested();
  Logger::Info("[SyncControl] Shutdown requested" +
               (request->reason().empty() ? std::string() : ": " + request->reason()));
  engine_.RequestStop();
  response->set_accepted(!already);
  return grpc::Status::OK;
}

grpc::Status SyncControlImpl::GetVersion(grpc::ServerContext* /*context*/,
                                         const v1::ApiVersionRequest* /*request*/,
                                         v1::ApiVersion* response) {
  response->set_version(kControlApiVersion);
  response->set_build(kVersion);
  return grpc::Status::OK;
}

ControlServer::ControlServer(core::SyncEngine& engine, const core::StreamSessionManager& sessions)
    : service_(engine, sessions) {}

ControlServer::~ControlServer() {
  Stop();
}

bool ControlServer::Start(const std::string& address) {
  grpc::ServerBuilder builder;
  builder.AddListeningPort(address, grpc::InsecureServerCredentials(), &bound_port_);
  builder.RegisterService(&service_);
  server_ = builder.BuildAndStart();
  if (!server_ || bound_port_ == 0) {
    Logger::Error("[SyncControl] Cannot listen on " + address);
    server_.reset();
    return false;
  }
  Logger::Info("[SyncControl] Listening on " + address);
  return true;
}

void ControlServer::Stop() {
  if (!server_) return;
  server_->Shutdown(std::chrono::system_clock::now() + std::chrono::milliseconds(500));
  server_.reset();
}

}  // namespace lumensync::control
