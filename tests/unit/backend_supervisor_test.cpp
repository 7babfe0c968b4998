/**
 * @file backend_supervisor_test.cpp
 * @brief Unit tests for BackendSupervisor start/shutdown semantics.
 *
 * Tests:
 * - Reachable endpoint -> no spawn, externally owned backend left alone
 * - Unreachable endpoint -> spawn and keep exactly one handle
 * - Shutdown kills once no matter how often it is called
 * - Shutdown before start is a no-op and startup still works
 * - Spawn failure is reported, not swallowed
 * - Kill failure is reported and still clears the cell
 * - STOPPED is terminal
 * - Duplicate spawn never produces a second tracked child
 */

#include "supervisor/backend_supervisor.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <memory>
#include <string>

#include "mocks/mock_liveness_prober.hpp"
#include "mocks/mock_process.hpp"

using namespace tether;
using namespace tether::supervisor;
using namespace tether::tests;
using namespace testing;

class BackendSupervisorTest : public Test {
protected:
    void SetUp() override {
        prober = std::make_shared<NiceMock<MockLivenessProber>>();
        launcher = std::make_shared<StrictMock<MockProcessLauncher>>();
        ON_CALL(*prober, endpoint()).WillByDefault(Return("127.0.0.1:3000"));

        command.command = "elizaos";
        command.args = {"start"};
    }

    std::unique_ptr<BackendSupervisor> make_supervisor() {
        return std::make_unique<BackendSupervisor>(prober, launcher, command);
    }

    // Queues a mock handle for the next launch() call.
    // The pointer is only valid until the supervisor drops the handle.
    MockProcessHandle *expect_launch(int pid) {
        auto handle = std::make_unique<NiceMock<MockProcessHandle>>();
        ON_CALL(*handle, pid()).WillByDefault(Return(pid));
        ON_CALL(*handle, is_alive()).WillByDefault(Return(true));
        MockProcessHandle *raw = handle.get();

        std::unique_ptr<process::IProcessHandle> owned = std::move(handle);
        EXPECT_CALL(*launcher, launch(_, _))
            .InSequence(launch_seq_)
            .WillOnce(Return(ByMove(std::move(owned))))
            .RetiresOnSaturation();
        return raw;
    }

    void expect_launch_failure(const std::string &reason) {
        EXPECT_CALL(*launcher, launch(_, _))
            .InSequence(launch_seq_)
            .WillOnce([reason](const process::LaunchCommand &, std::string &error) {
                error = reason;
                return std::unique_ptr<process::IProcessHandle>();
            })
            .RetiresOnSaturation();
    }

    std::shared_ptr<NiceMock<MockLivenessProber>> prober;
    std::shared_ptr<StrictMock<MockProcessLauncher>> launcher;
    process::LaunchCommand command;

private:
    Sequence launch_seq_;
};

// ---------------------------------------------------------------------------
// ensure_started
// ---------------------------------------------------------------------------

TEST_F(BackendSupervisorTest, InitialStateIsUnstarted) {
    auto sup = make_supervisor();

    EXPECT_EQ(sup->state(), SupervisorState::UNSTARTED);
    EXPECT_FALSE(sup->has_handle());
    EXPECT_FALSE(sup->managed_pid().has_value());
}

TEST_F(BackendSupervisorTest, AlreadyRunningDoesNotSpawn) {
    EXPECT_CALL(*prober, is_running()).WillOnce(Return(true));
    auto sup = make_supervisor();
    std::string error;

    EXPECT_TRUE(sup->ensure_started(error)) << error;

    EXPECT_EQ(sup->state(), SupervisorState::RUNNING_UNMANAGED);
    EXPECT_FALSE(sup->has_handle());
}

TEST_F(BackendSupervisorTest, SpawnsWhenEndpointUnreachable) {
    EXPECT_CALL(*prober, is_running()).WillOnce(Return(false));
    MockProcessHandle *handle = expect_launch(4242);
    EXPECT_CALL(*handle, terminate(_)).WillOnce(Return(true));
    auto sup = make_supervisor();
    std::string error;

    EXPECT_TRUE(sup->ensure_started(error)) << error;

    EXPECT_EQ(sup->state(), SupervisorState::RUNNING);
    EXPECT_TRUE(sup->has_handle());
    EXPECT_EQ(sup->managed_pid(), 4242);
}

TEST_F(BackendSupervisorTest, LaunchCommandIsPassedThrough) {
    command.command = "/opt/agent/server";
    command.args = {"start", "--port", "3000"};
    command.env["SERVER_PORT"] = "3000";
    EXPECT_CALL(*prober, is_running()).WillOnce(Return(false));
    EXPECT_CALL(*launcher, launch(AllOf(Field(&process::LaunchCommand::command, "/opt/agent/server"),
                                        Field(&process::LaunchCommand::args, ElementsAre("start", "--port", "3000")),
                                        Field(&process::LaunchCommand::env, Contains(Pair("SERVER_PORT", "3000")))),
                                  _))
        .WillOnce([](const process::LaunchCommand &, std::string &error) {
            error = "stop here";
            return std::unique_ptr<process::IProcessHandle>();
        });
    auto sup = make_supervisor();
    std::string error;

    EXPECT_FALSE(sup->ensure_started(error));
}

TEST_F(BackendSupervisorTest, SpawnFailureIsReported) {
    EXPECT_CALL(*prober, is_running()).WillOnce(Return(false));
    expect_launch_failure("Executable not found: elizaos");
    auto sup = make_supervisor();
    std::string error;

    EXPECT_FALSE(sup->ensure_started(error));

    EXPECT_THAT(error, HasSubstr("Failed to start backend"));
    EXPECT_THAT(error, HasSubstr("Executable not found"));
    EXPECT_EQ(sup->state(), SupervisorState::UNSTARTED);
    EXPECT_FALSE(sup->has_handle());
}

TEST_F(BackendSupervisorTest, ProbeIsConsultedEvenWhenHandleHeld) {
    EXPECT_CALL(*prober, is_running()).WillOnce(Return(false)).WillOnce(Return(true));
    MockProcessHandle *handle = expect_launch(100);
    EXPECT_CALL(*handle, terminate(_)).WillOnce(Return(true));
    auto sup = make_supervisor();
    std::string error;

    ASSERT_TRUE(sup->ensure_started(error)) << error;
    EXPECT_TRUE(sup->ensure_started(error)) << error;

    // Still the child we spawned
    EXPECT_EQ(sup->state(), SupervisorState::RUNNING);
    EXPECT_EQ(sup->managed_pid(), 100);
}

TEST_F(BackendSupervisorTest, DuplicateSpawnIsKilledAndNotTracked) {
    EXPECT_CALL(*prober, is_running()).WillRepeatedly(Return(false));
    MockProcessHandle *first = expect_launch(100);
    MockProcessHandle *second = expect_launch(200);
    EXPECT_CALL(*second, terminate(_)).WillOnce(Return(true));
    EXPECT_CALL(*first, terminate(_)).WillOnce(Return(true));
    auto sup = make_supervisor();
    std::string error;

    ASSERT_TRUE(sup->ensure_started(error)) << error;
    EXPECT_TRUE(sup->ensure_started(error)) << error;

    EXPECT_EQ(sup->managed_pid(), 100);
}

// ---------------------------------------------------------------------------
// shutdown
// ---------------------------------------------------------------------------

TEST_F(BackendSupervisorTest, ShutdownWithoutStartIsNoop) {
    auto sup = make_supervisor();
    std::string error;

    EXPECT_TRUE(sup->shutdown(error)) << error;
    EXPECT_TRUE(error.empty());
    EXPECT_EQ(sup->state(), SupervisorState::UNSTARTED);
}

TEST_F(BackendSupervisorTest, ShutdownBeforeStartDoesNotBlockStartup) {
    EXPECT_CALL(*prober, is_running()).WillOnce(Return(false));
    MockProcessHandle *handle = expect_launch(4242);
    EXPECT_CALL(*handle, terminate(_)).WillOnce(Return(true));
    auto sup = make_supervisor();
    std::string error;
    ASSERT_TRUE(sup->shutdown(error)) << error;
    ASSERT_TRUE(sup->shutdown(error)) << error;

    EXPECT_TRUE(sup->ensure_started(error)) << error;

    EXPECT_EQ(sup->state(), SupervisorState::RUNNING);
    EXPECT_EQ(sup->managed_pid(), 4242);
}

TEST_F(BackendSupervisorTest, ShutdownKillsExactlyOnce) {
    EXPECT_CALL(*prober, is_running()).WillOnce(Return(false));
    MockProcessHandle *handle = expect_launch(4242);
    EXPECT_CALL(*handle, terminate(_)).Times(1).WillOnce(Return(true));
    auto sup = make_supervisor();
    std::string error;
    ASSERT_TRUE(sup->ensure_started(error)) << error;

    for (int i = 0; i < 5; ++i) {
        EXPECT_TRUE(sup->shutdown(error)) << error;
    }

    EXPECT_EQ(sup->state(), SupervisorState::STOPPED);
    EXPECT_FALSE(sup->has_handle());
}

TEST_F(BackendSupervisorTest, ShutdownLeavesUnmanagedBackendAlone) {
    EXPECT_CALL(*prober, is_running()).WillOnce(Return(true));
    auto sup = make_supervisor();
    std::string error;
    ASSERT_TRUE(sup->ensure_started(error)) << error;

    EXPECT_TRUE(sup->shutdown(error)) << error;
    EXPECT_EQ(sup->state(), SupervisorState::STOPPED);
}

TEST_F(BackendSupervisorTest, KillFailureIsReportedAndCellCleared) {
    EXPECT_CALL(*prober, is_running()).WillOnce(Return(false));
    MockProcessHandle *handle = expect_launch(4242);
    EXPECT_CALL(*handle, terminate(_))
        .WillOnce(DoAll(SetArgReferee<0>("Operation not permitted"), Return(false)));
    auto sup = make_supervisor();
    std::string error;
    ASSERT_TRUE(sup->ensure_started(error)) << error;

    EXPECT_FALSE(sup->shutdown(error));
    EXPECT_THAT(error, HasSubstr("4242"));
    EXPECT_THAT(error, HasSubstr("Operation not permitted"));
    EXPECT_FALSE(sup->has_handle());
    EXPECT_EQ(sup->state(), SupervisorState::STOPPED);

    // Nothing left to kill
    error.clear();
    EXPECT_TRUE(sup->shutdown(error)) << error;
}

TEST_F(BackendSupervisorTest, StoppedIsTerminal) {
    // One probe for the start; none after STOPPED
    EXPECT_CALL(*prober, is_running()).Times(1).WillOnce(Return(true));
    auto sup = make_supervisor();
    std::string error;
    ASSERT_TRUE(sup->ensure_started(error)) << error;
    ASSERT_TRUE(sup->shutdown(error)) << error;
    ASSERT_EQ(sup->state(), SupervisorState::STOPPED);

    EXPECT_FALSE(sup->ensure_started(error));
    EXPECT_THAT(error, HasSubstr("stopped"));
    EXPECT_EQ(sup->state(), SupervisorState::STOPPED);
}

TEST_F(BackendSupervisorTest, NoRestartAfterShutdown) {
    EXPECT_CALL(*prober, is_running()).WillOnce(Return(false));
    MockProcessHandle *handle = expect_launch(4242);
    EXPECT_CALL(*handle, terminate(_)).WillOnce(Return(true));
    auto sup = make_supervisor();
    std::string error;
    ASSERT_TRUE(sup->ensure_started(error)) << error;
    ASSERT_TRUE(sup->shutdown(error)) << error;

    EXPECT_FALSE(sup->ensure_started(error));
    EXPECT_FALSE(sup->has_handle());
}

TEST_F(BackendSupervisorTest, DestructorShutsDownManagedBackend) {
    EXPECT_CALL(*prober, is_running()).WillOnce(Return(false));
    MockProcessHandle *handle = expect_launch(4242);
    EXPECT_CALL(*handle, terminate(_)).Times(1).WillOnce(Return(true));

    {
        auto sup = make_supervisor();
        std::string error;
        ASSERT_TRUE(sup->ensure_started(error)) << error;
    }
    // terminate() expectation verified when the handle mock was destroyed
}

TEST(SupervisorStateTest, StateNames) {
    EXPECT_STREQ(state_to_string(SupervisorState::UNSTARTED), "UNSTARTED");
    EXPECT_STREQ(state_to_string(SupervisorState::RUNNING), "RUNNING");
    EXPECT_STREQ(state_to_string(SupervisorState::RUNNING_UNMANAGED), "RUNNING_UNMANAGED");
    EXPECT_STREQ(state_to_string(SupervisorState::STOPPED), "STOPPED");
}
