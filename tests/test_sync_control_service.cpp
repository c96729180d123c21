// Repository: LumenSync
// Component: SyncControl gRPC service tests
// Purpose: Handlers called directly against a running engine, plus one
//          round trip through a real loopback server.
// Copyright (c) 2026 LumenSync

#include <gtest/gtest.h>

#include <chrono>
#include <memory>
#include <string>

#include <grpcpp/grpcpp.h>

#include "fixtures/FakeColorSampleSource.hpp"
#include "fixtures/FakeLightBridge.hpp"
#include "lumensync/Version.hpp"
#include "lumensync/control/SyncControlService.hpp"
#include "lumensync/core/ExitCodes.hpp"
#include "support/DeterministicTimeSource.hpp"
#include "support/DeterministicWaitStrategy.hpp"

namespace lumensync::control {
namespace {

using tests::DeterministicTimeSource;
using tests::DeterministicWaitStrategy;
using tests::fixtures::FakeColorSampleSource;
using tests::fixtures::FakeLightBridge;

config::SyncConfig MakeConfig() {
  config::SyncConfig cfg;
  cfg.tv.host = "192.168.1.20";
  cfg.bridge.endpoint.host = "192.168.1.30";
  cfg.bridge.endpoint.entertainment_config_id = "1a8d99cc-967b-44f2-9202-43f976c0fa6b";
  cfg.bridge.credentials.application_key = "app-key";
  cfg.bridge.credentials.client_key_hex = "00112233445566778899aabbccddeeff";
  cfg.fixtures = {{"lamp", 0, {0, 1}}};
  cfg.sync.zone_count = 2;
  cfg.sync.refresh_rate_ms = 10;
  cfg.sync.status_interval_s = 0;
  return cfg;
}

class SyncControlServiceTest : public ::testing::Test {
 protected:
  SyncControlServiceTest()
      : config_(MakeConfig()),
        sessions_(bridge_, config_.fixtures, std::chrono::milliseconds(1000),
                  std::chrono::milliseconds(250)),
        engine_(config_, source_, sessions_, clock_, wait_),
        service_(engine_, sessions_) {
    source_.PushFrame(FakeColorSampleSource::UniformFrame(2, 200, 100, 50));
  }

  config::SyncConfig config_;
  DeterministicTimeSource clock_{0};
  DeterministicWaitStrategy wait_{clock_};
  FakeColorSampleSource source_;
  FakeLightBridge bridge_;
  core::StreamSessionManager sessions_;
  core::SyncEngine engine_;
  SyncControlImpl service_;
};

TEST_F(SyncControlServiceTest, PhaseMapping) {
  EXPECT_EQ(SyncControlImpl::ToProto(core::SyncPhase::kWaitingForDevice),
            v1::SYNC_PHASE_WAITING_FOR_DEVICE);
  EXPECT_EQ(SyncControlImpl::ToProto(core::SyncPhase::kStreaming), v1::SYNC_PHASE_STREAMING);
  EXPECT_EQ(SyncControlImpl::ToProto(core::SyncPhase::kIdle), v1::SYNC_PHASE_IDLE);
  EXPECT_EQ(SyncControlImpl::ToProto(core::SyncPhase::kDisconnected),
            v1::SYNC_PHASE_DISCONNECTED);
  EXPECT_EQ(SyncControlImpl::ToProto(core::SyncPhase::kTerminated), v1::SYNC_PHASE_TERMINATED);
}

TEST_F(SyncControlServiceTest, StatusBeforeRunIsWaiting) {
  grpc::ServerContext context;
  v1::GetStatusRequest request;
  v1::SyncStatus response;
  grpc::Status status = service_.GetStatus(&context, &request, &response);

  ASSERT_TRUE(status.ok());
  EXPECT_EQ(response.phase(), v1::SYNC_PHASE_WAITING_FOR_DEVICE);
  EXPECT_EQ(response.phase_name(), "WaitingForDevice");
  EXPECT_EQ(response.session_state(), "Closed");
  EXPECT_FALSE(response.ever_connected());
  EXPECT_EQ(response.frames_sent_total(), 0u);
}

TEST_F(SyncControlServiceTest, StatusWhileStreamingThenShutdown) {
  v1::SyncStatus observed;
  bool first_accepted = false;
  bool second_accepted = true;

  wait_.SetOnWait([&](size_t waits) {
    if (waits != 3) return;
    grpc::ServerContext status_context;
    v1::GetStatusRequest status_request;
    ASSERT_TRUE(service_.GetStatus(&status_context, &status_request, &observed).ok());

    grpc::ServerContext stop_context;
    v1::ShutdownRequest stop_request;
    stop_request.set_reason("test");
    v1::ShutdownResponse stop_response;
    ASSERT_TRUE(service_.RequestShutdown(&stop_context, &stop_request, &stop_response).ok());
    first_accepted = stop_response.accepted();

    grpc::ServerContext again_context;
    ASSERT_TRUE(service_.RequestShutdown(&again_context, &stop_request, &stop_response).ok());
    second_accepted = stop_response.accepted();
  });

  EXPECT_EQ(engine_.Run(), core::kExitOk);

  EXPECT_EQ(observed.phase(), v1::SYNC_PHASE_STREAMING);
  EXPECT_EQ(observed.session_state(), "Open");
  EXPECT_TRUE(observed.ever_connected());
  EXPECT_EQ(observed.frames_sent_total(), 3u);
  EXPECT_EQ(observed.session_opens_total(), 1u);
  EXPECT_EQ(observed.session_open_failures_total(), 0u);
  EXPECT_TRUE(first_accepted);
  EXPECT_FALSE(second_accepted);
  EXPECT_TRUE(engine_.StopRequested());
  EXPECT_FALSE(bridge_.is_open());
}

TEST_F(SyncControlServiceTest, VersionOverLoopbackServer) {
  ControlServer server(engine_, sessions_);
  ASSERT_TRUE(server.Start("127.0.0.1:0"));
  ASSERT_GT(server.bound_port(), 0);

  auto channel = grpc::CreateChannel("127.0.0.1:" + std::to_string(server.bound_port()),
                                     grpc::InsecureChannelCredentials());
  std::unique_ptr<v1::SyncControl::Stub> stub = v1::SyncControl::NewStub(channel);

  grpc::ClientContext context;
  context.set_deadline(std::chrono::system_clock::now() + std::chrono::seconds(5));
  v1::ApiVersionRequest request;
  v1::ApiVersion response;
  grpc::Status status = stub->GetVersion(&context, request, &response);

  ASSERT_TRUE(status.ok()) << status.error_message();
  EXPECT_EQ(response.version(), kControlApiVersion);
  EXPECT_EQ(response.build(), kVersion);

  server.Stop();
  server.Stop();
}

}  // namespace
}  // namespace lumensync::control
