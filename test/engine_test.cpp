#include <gtest/gtest.h>
#include <evobox/utils.h>
#include "utils.h"

class EngineTest : public SandboxFixture {};

TEST_F(EngineTest, PrefersDocker) {
  auto& rt = SandboxRuntime::Get();
  EXPECT_EQ(rt.SelectEngine(), ContainerEngine::DOCKER);
  EXPECT_EQ(rt.Executable(), "docker");
}

TEST_F(EngineTest, FallsBackToPodman) {
  runner_->engines = {"podman"};
  auto& rt = SandboxRuntime::Get();
  EXPECT_FALSE(rt.HasEngine(ContainerEngine::DOCKER));
  EXPECT_TRUE(rt.HasEngine(ContainerEngine::PODMAN));
  EXPECT_EQ(rt.SelectEngine(), ContainerEngine::PODMAN);
  EXPECT_EQ(rt.Executable(), "podman");
}

TEST_F(EngineTest, NoEngine) {
  runner_->engines.clear();
  EXPECT_THROW(SandboxRuntime::Get().SelectEngine(), EnvironmentError);
  EXPECT_FALSE(SandboxRuntime::Get().Engine());
}

TEST_F(EngineTest, ProbedOnce) {
  auto& rt = SandboxRuntime::Get();
  ContainerEngine first = rt.SelectEngine();
  size_t probes = runner_->CountOf("--version");
  EXPECT_EQ(probes, 1);
  EXPECT_EQ(rt.SelectEngine(), first);
  EXPECT_EQ(runner_->CountOf("--version"), probes);
}

TEST_F(EngineTest, ProbeCommand) {
  SandboxRuntime::Get().HasEngine(ContainerEngine::PODMAN);
  auto calls = runner_->Calls();
  ASSERT_EQ(calls.size(), 1);
  EXPECT_EQ(calls[0].argv, (std::vector<std::string>{"podman", "--version"}));
}

TEST_F(EngineTest, ExplicitEngine) {
  auto& rt = SandboxRuntime::Get();
  rt.UseEngine(ContainerEngine::PODMAN);
  EXPECT_EQ(rt.SelectEngine(), ContainerEngine::PODMAN);
  EXPECT_EQ(runner_->CountOf("--version"), 0);
}

TEST_F(EngineTest, TeardownForgetsEngine) {
  auto& rt = SandboxRuntime::Get();
  rt.SelectEngine();
  rt.Teardown();
  EXPECT_FALSE(rt.Engine());
  runner_->engines = {"podman"};
  EXPECT_EQ(rt.SelectEngine(), ContainerEngine::PODMAN);
}

TEST(EngineName, Names) {
  EXPECT_STREQ(ContainerEngineName(ContainerEngine::DOCKER), "docker");
  EXPECT_STREQ(ContainerEngineName(ContainerEngine::PODMAN), "podman");
  EXPECT_EQ(GetContainerEngine("podman"), ContainerEngine::PODMAN);
  EXPECT_FALSE(GetContainerEngine("lxc"));
}
