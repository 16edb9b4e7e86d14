#include <unistd.h>
#include <cstdlib>
#include <algorithm>

#include <gtest/gtest.h>
#include <ibench/engine.h>

#include "artifact.h"
#include "container.h"
#include "jail.h"
#include "language.h"
#include "sandbox.h"
#include "utils.h"
#include "test_utils.h"

using nlohmann::json;

namespace {

RunLimits Limits(long timeout_ms) {
  RunLimits ret;
  ret.timeout_ms = timeout_ms;
  ret.memory_limit = 128L << 20;
  ret.max_output = 1L << 20;
  return ret;
}

bool Contains(const std::vector<std::string>& vec, const std::vector<std::string>& seq) {
  return std::search(vec.begin(), vec.end(), seq.begin(), seq.end()) != vec.end();
}

} // namespace

TEST(ContainerTest, Command) {
  ExecutionConfig config = TestConfig();
  config.docker_binary = "podman";
  config.container_images[Language::PYTHON] = "python:3.11";
  ContainerExecutor executor(config);
  ExecutionArtifact artifact(config.scratch_dir);
  ASSERT_TRUE(artifact.Ready());
  auto cmd = executor.Command(*ProfileFor(Language::PYTHON), artifact, Limits(2500));

  ASSERT_GE(cmd.size(), 3u);
  EXPECT_EQ(cmd[0], "podman");
  EXPECT_EQ(cmd[1], "run");
  EXPECT_TRUE(Contains(cmd, {"--name", "ibench-" + artifact.Id()}));
  EXPECT_TRUE(Contains(cmd, {"--network", "none"}));
  EXPECT_TRUE(Contains(cmd, {"--memory", std::to_string(128L << 20)}));
  EXPECT_TRUE(Contains(cmd, {"--memory-swap", std::to_string(128L << 20)}));
  EXPECT_TRUE(Contains(cmd, {"--pids-limit", "50"}));
  EXPECT_TRUE(Contains(cmd, {"--read-only"}));
  EXPECT_TRUE(Contains(cmd, {"--volume", artifact.Box().string() + ":/box:ro"}));
  EXPECT_TRUE(Contains(cmd, {"--workdir", "/box/workdir"}));
  EXPECT_TRUE(Contains(cmd, {"--user", "65534:65534"}));
  // the timeout is rounded up to whole seconds
  EXPECT_TRUE(Contains(cmd, {"python:3.11", "timeout", "3s", "python3", "/box/workdir/solution.py"}));
  EXPECT_EQ(cmd.back(), "/box/workdir/solution.py");
}

TEST(ContainerTest, CompiledProgramPath) {
  ExecutionConfig config = TestConfig();
  ContainerExecutor executor(config);
  ExecutionArtifact artifact(config.scratch_dir);
  auto cmd = executor.Command(*ProfileFor(Language::JAVA), artifact, Limits(1000));
  EXPECT_TRUE(Contains(cmd, {"openjdk:21-slim", "timeout", "1s", "java", "-cp", "/box/workdir/classes", "Solution"}));
}

TEST(ContainerTest, MissingDockerBinary) {
  ExecutionConfig config = TestConfig();
  config.scratch_dir = kTestScratch / "docker";
  config.use_sandbox = true;
  config.docker_binary = "ibench-no-such-docker";
  ExecutionEngine engine(config);
  auto res = engine.ExecuteTestCase("def main(x):\n    return x\n", Language::PYTHON,
                                    MakeTestCase("t", json(1), json(1)));
  EXPECT_EQ(res.verdict, Verdict::RUN_FAILED);
  ASSERT_TRUE(res.error);
  EXPECT_NE(res.error->find("ibench-no-such-docker"), std::string::npos);
  EXPECT_EQ(CountEntries(config.scratch_dir), 0u);
}

TEST(JailTest, Options) {
  ExecutionConfig config = TestConfig();
  JailExecutor executor;
  ExecutionArtifact artifact(config.scratch_dir);
  auto opt = executor.Options(*ProfileFor(Language::PYTHON), artifact, Limits(2000));
  EXPECT_EQ(opt.boxdir, artifact.Box().string());
  EXPECT_EQ(opt.command, (std::vector<std::string>{"/usr/bin/env", "python3", "/workdir/solution.py"}));
  EXPECT_EQ(opt.workdir, "/workdir");
  EXPECT_EQ(opt.output, "/workdir/stdout");
  EXPECT_EQ(opt.error, "/workdir/stderr");
  EXPECT_EQ(opt.uid, kJailUid);
  EXPECT_EQ(opt.wall_time, 2000L * 1000);
  EXPECT_EQ(opt.rss, 128L << 10);
  EXPECT_EQ(opt.fsize, 1L << 10);
  EXPECT_EQ(opt.proc_num, kJailProcLimit);

  auto cpp = executor.Options(*ProfileFor(Language::CPP), artifact, Limits(2000));
  EXPECT_EQ(cpp.command, (std::vector<std::string>{"/workdir/solution"}));
}

TEST(JailTest, SerializeRoundTrip) {
  SandboxOptions opt;
  opt.boxdir = "/tmp/box";
  opt.command = {"/usr/bin/env", "python3", "a b.py", ""};
  opt.envs = {"PATH=/usr/bin", "HOME=/tmp"};
  opt.workdir = "/workdir";
  opt.output = "/workdir/stdout";
  opt.error = "/workdir/stderr";
  opt.uid = 1000;
  opt.gid = 1001;
  opt.wall_time = 123456789;
  opt.rss = 65536;
  opt.proc_num = 7;
  opt.fsize = 2048;
  opt.dirs = {"/usr", "/lib"};

  SandboxOptions copy;
  ASSERT_TRUE(copy.Deserialize(opt.Serialize()));
  EXPECT_EQ(copy.boxdir, opt.boxdir);
  EXPECT_EQ(copy.command, opt.command);
  EXPECT_EQ(copy.envs, opt.envs);
  EXPECT_EQ(copy.workdir, opt.workdir);
  EXPECT_EQ(copy.output, opt.output);
  EXPECT_EQ(copy.error, opt.error);
  EXPECT_EQ(copy.uid, 1000);
  EXPECT_EQ(copy.gid, 1001);
  EXPECT_EQ(copy.wall_time, 123456789);
  EXPECT_EQ(copy.rss, 65536);
  EXPECT_EQ(copy.proc_num, 7);
  EXPECT_EQ(copy.fsize, 2048);
  EXPECT_EQ(copy.dirs, opt.dirs);
}

TEST(JailTest, DeserializeRejectsTruncated) {
  SandboxOptions opt;
  opt.boxdir = "/tmp/box";
  opt.command = {"/bin/true"};
  auto buf = opt.Serialize();
  SandboxOptions copy;
  for (size_t len : {size_t(0), size_t(3), buf.size() / 2, buf.size() - 1}) {
    EXPECT_FALSE(copy.Deserialize(std::vector<uint8_t>(buf.begin(), buf.begin() + len))) << len;
  }
}

TEST(JailTest, FilterDirs) {
  SandboxOptions opt;
  opt.dirs = {"/usr", "/ibench-no-such-dir", "/etc/hostname"};
  std::vector<std::string> links;
  opt.FilterDirs(links);
  EXPECT_EQ(opt.dirs, (std::vector<std::string>{"/usr"}));
  EXPECT_TRUE(links.empty());
}

// needs root, cgroups and the ibench-sandbox helper next to the test binary
TEST(JailTest, RunsPython) {
  if (geteuid() != 0 || !getenv("IBENCH_TEST_JAIL")) GTEST_SKIP() << "set IBENCH_TEST_JAIL and run as root";
  SKIP_WITHOUT_TOOLCHAIN(Language::PYTHON);
  ExecutionConfig config = TestConfig();
  config.use_sandbox = true;
  config.sandbox_backend = SandboxBackend::JAIL;
  ExecutionEngine engine(config);
  auto res = engine.ExecuteTestCase("def main(x):\n    return x * 2\n", Language::PYTHON,
                                    MakeTestCase("t", json(21), json(42)));
  EXPECT_EQ(res.verdict, Verdict::PASSED) << res.error.value_or("");

  config.timeout_ms = 1000;
  ExecutionEngine short_engine(config);
  res = short_engine.ExecuteTestCase("def main(x):\n    while True:\n        pass\n", Language::PYTHON,
                                     MakeTestCase("loop", json(1), json(1)));
  EXPECT_EQ(res.verdict, Verdict::TIMED_OUT);
}

TEST(JailTest, RequiresRoot) {
  if (geteuid() == 0) GTEST_SKIP() << "running as root";
  ExecutionConfig config = TestConfig();
  config.use_sandbox = true;
  config.sandbox_backend = SandboxBackend::JAIL;
  ExecutionEngine engine(config);
  auto res = engine.ExecuteTestCase("def main(x):\n    return x\n", Language::PYTHON,
                                    MakeTestCase("t", json(1), json(1)));
  EXPECT_EQ(res.verdict, Verdict::RUN_FAILED);
  ASSERT_TRUE(res.error);
  EXPECT_EQ(*res.error, "Jail sandbox requires root");
}
