/**
 * @file test_docker_cli.cpp
 * @brief Tests for the docker CLI adapter and the process runner beneath it.
 *
 * Parsing and argument building are tested directly. Command execution is tested
 * against small shell scripts standing in for the docker binary, so no engine is needed.
 */

#include <gtest/gtest.h>
#include <chrono>
#include <cstdio>
#include <fstream>
#include <string>
#include <vector>

#include <sys/stat.h>
#include <unistd.h>

#include "converge/os/process.hpp"
#include "converge/runtime/docker_cli_runtime.hpp"

using namespace std::chrono_literals;
using converge::runtime::CreateRequest;
using converge::runtime::DockerCliRuntime;
using converge::runtime::ObjectKind;
using converge::runtime::ObjectState;
using converge::runtime::RuntimeErrc;
using converge::runtime::RuntimeSettings;

namespace {

/// Executable shell script in /tmp, removed on scope exit.
struct FakeDocker {
  std::string path;

  explicit FakeDocker(const std::string& body) {
    char tmpl[] = "/tmp/converge-docker-XXXXXX";
    const int fd = ::mkstemp(tmpl);
    EXPECT_GE(fd, 0);
    ::close(fd);
    path = tmpl;
    std::ofstream(path) << "#!/bin/sh\n" << body << "\n";
    ::chmod(path.c_str(), 0700);
  }
  ~FakeDocker() { std::remove(path.c_str()); }

  RuntimeSettings settings() const {
    return RuntimeSettings{.kind = "docker", .docker_binary = path, .command_timeout = 5000ms};
  }
};

} // namespace

/**
 * @test ParseState_DockerWords
 */
TEST(DockerCliRuntime, ParseState_DockerWords) {
  EXPECT_EQ(DockerCliRuntime::parse_state("created"), ObjectState::Created);
  EXPECT_EQ(DockerCliRuntime::parse_state("running"), ObjectState::Running);
  EXPECT_EQ(DockerCliRuntime::parse_state(" paused "), ObjectState::Running);
  EXPECT_EQ(DockerCliRuntime::parse_state("restarting"), ObjectState::Running);
  EXPECT_EQ(DockerCliRuntime::parse_state("exited"), ObjectState::Stopped);
  EXPECT_EQ(DockerCliRuntime::parse_state("dead"), ObjectState::Stopped);
}

/**
 * @test ParseLabels_CommaSeparated
 */
TEST(DockerCliRuntime, ParseLabels_CommaSeparated) {
  const auto l = DockerCliRuntime::parse_labels("io.converge.project=demo, io.converge.service=api,flag");
  ASSERT_EQ(l.size(), 3u);
  EXPECT_EQ(l.at("io.converge.project"), "demo");
  EXPECT_EQ(l.at("io.converge.service"), "api");
  EXPECT_EQ(l.at("flag"), "");
  EXPECT_TRUE(DockerCliRuntime::parse_labels("").empty());
}

/**
 * @test ParseContainers_RowsAndMalformedLines
 */
TEST(DockerCliRuntime, ParseContainers_RowsAndMalformedLines) {
  const std::string out =
      "demo-api\tapi:1\trunning\tio.converge.project=demo\n"
      "demo-db\tpostgres:16\texited\t\r\n"
      "garbage-line\n"
      "\n"
      "other\tnginx\tcreated\n";
  const auto objs = DockerCliRuntime::parse_containers(out);
  ASSERT_EQ(objs.size(), 3u);
  EXPECT_EQ(objs[0].name, "demo-api");
  EXPECT_EQ(objs[0].image, "api:1");
  EXPECT_EQ(objs[0].state, ObjectState::Running);
  EXPECT_EQ(objs[0].labels.at("io.converge.project"), "demo");
  EXPECT_EQ(objs[1].state, ObjectState::Stopped);
  EXPECT_TRUE(objs[1].labels.empty());
  EXPECT_EQ(objs[2].state, ObjectState::Created);
  for (const auto& o : objs) EXPECT_EQ(o.kind, ObjectKind::Container);
}

/**
 * @test ParseNamed_NetworksAndVolumes
 */
TEST(DockerCliRuntime, ParseNamed_NetworksAndVolumes) {
  const auto nets = DockerCliRuntime::parse_named(ObjectKind::Network, "bridge\t\ndemo_default\tio.converge.project=demo\n");
  ASSERT_EQ(nets.size(), 2u);
  EXPECT_EQ(nets[1].name, "demo_default");
  EXPECT_EQ(nets[1].kind, ObjectKind::Network);
  EXPECT_EQ(nets[1].labels.at("io.converge.project"), "demo");

  const auto vols = DockerCliRuntime::parse_named(ObjectKind::Volume, "demo-db\n");
  ASSERT_EQ(vols.size(), 1u);
  EXPECT_EQ(vols[0].kind, ObjectKind::Volume);
  EXPECT_TRUE(vols[0].labels.empty());
}

/**
 * @test ClassifyFailure_MapsStderr
 */
TEST(DockerCliRuntime, ClassifyFailure_MapsStderr) {
  EXPECT_EQ(DockerCliRuntime::classify_failure(1,
      "Cannot connect to the Docker daemon at unix:///var/run/docker.sock. Is the docker daemon running?").code,
      RuntimeErrc::Unavailable);
  EXPECT_EQ(DockerCliRuntime::classify_failure(1, "Error: No such container: demo-x").code, RuntimeErrc::NotFound);
  EXPECT_EQ(DockerCliRuntime::classify_failure(1, "Error response from daemon: network demo_old not found").code,
            RuntimeErrc::NotFound);
  EXPECT_EQ(DockerCliRuntime::classify_failure(1,
      "Conflict. The container name \"/demo-api\" is already in use").code, RuntimeErrc::Conflict);

  const auto other = DockerCliRuntime::classify_failure(125, "");
  EXPECT_EQ(other.code, RuntimeErrc::Failed);
  EXPECT_EQ(other.message, "exit status 125");
}

/**
 * @test CreateArgs_Container
 */
TEST(DockerCliRuntime, CreateArgs_Container) {
  CreateRequest req;
  req.kind    = ObjectKind::Container;
  req.name    = "demo-db";
  req.image   = "postgres:16";
  req.network = "demo_default";
  req.labels  = {{"io.converge.project", "demo"}};
  req.ports   = {{5432, 5432}};
  req.volumes = {{"demo-db", "/var/lib/postgresql/data"}};
  req.env     = {{"POSTGRES_PASSWORD", "secret"}};

  const std::vector<std::string> expected{
      "create", "--name", "demo-db", "--network", "demo_default",
      "--label", "io.converge.project=demo", "-p", "5432:5432",
      "-v", "demo-db:/var/lib/postgresql/data", "-e", "POSTGRES_PASSWORD=secret", "postgres:16"};
  EXPECT_EQ(DockerCliRuntime::create_args(req), expected);
}

/**
 * @test CreateArgs_NetworkAndVolume
 */
TEST(DockerCliRuntime, CreateArgs_NetworkAndVolume) {
  CreateRequest net{.kind = ObjectKind::Network, .name = "demo_default",
                    .labels = {{"io.converge.project", "demo"}}};
  EXPECT_EQ(DockerCliRuntime::create_args(net),
            (std::vector<std::string>{"network", "create", "--label", "io.converge.project=demo", "demo_default"}));

  CreateRequest vol{.kind = ObjectKind::Volume, .name = "demo-db"};
  EXPECT_EQ(DockerCliRuntime::create_args(vol), (std::vector<std::string>{"volume", "create", "demo-db"}));
}

/**
 * @test List_CombinesThreeCommands
 * @brief The script answers `ps`, `network ls` and `volume ls` by its first argument.
 */
TEST(DockerCliRuntime, List_CombinesThreeCommands) {
  FakeDocker docker(
      "case \"$1\" in\n"
      "  ps) printf 'demo-api\\tapi:1\\trunning\\tio.converge.project=demo\\n' ;;\n"
      "  network) printf 'demo_default\\tio.converge.project=demo\\n' ;;\n"
      "  volume) printf 'demo-db\\t\\n' ;;\n"
      "esac");
  DockerCliRuntime rt(docker.settings());
  const auto objs = rt.list();
  ASSERT_TRUE(objs.has_value()) << objs.error().message;
  ASSERT_EQ(objs->size(), 3u);
  EXPECT_EQ((*objs)[0].kind, ObjectKind::Container);
  EXPECT_EQ((*objs)[1].kind, ObjectKind::Network);
  EXPECT_EQ((*objs)[2].kind, ObjectKind::Volume);

  const auto vol = rt.inspect(ObjectKind::Volume, "demo-db");
  ASSERT_TRUE(vol.has_value());
  EXPECT_EQ(vol->name, "demo-db");
  const auto missing = rt.inspect(ObjectKind::Container, "demo-web");
  ASSERT_FALSE(missing.has_value());
  EXPECT_EQ(missing.error().code, RuntimeErrc::NotFound);
}

/**
 * @test Commands_StderrMappedToErrc
 */
TEST(DockerCliRuntime, Commands_StderrMappedToErrc) {
  FakeDocker docker("echo \"Error response from daemon: No such container: $2\" >&2\nexit 1");
  DockerCliRuntime rt(docker.settings());
  const auto r = rt.stop("demo-gone");
  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error().code, RuntimeErrc::NotFound);
  EXPECT_NE(r.error().message.find("demo-gone"), std::string::npos);
}

/**
 * @test Commands_MissingBinary_Unavailable
 */
TEST(DockerCliRuntime, Commands_MissingBinary_Unavailable) {
  DockerCliRuntime rt(RuntimeSettings{.kind = "docker", .docker_binary = "/nonexistent/docker-cli"});
  const auto r = rt.list();
  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error().code, RuntimeErrc::Unavailable);
}

/**
 * @test RunProcess_CapturesStreamsAndExitCode
 */
TEST(Process, RunProcess_CapturesStreamsAndExitCode) {
  const std::vector<std::string> argv{"/bin/sh", "-c", "echo out; echo err >&2; exit 3"};
  const auto r = converge::os::run_process(argv, 5000ms);
  ASSERT_TRUE(r.has_value()) << r.error().message;
  EXPECT_EQ(r->exit_code, 3);
  EXPECT_EQ(r->out, "out\n");
  EXPECT_EQ(r->err, "err\n");
}

/**
 * @test RunProcess_Timeout_KillsChild
 */
TEST(Process, RunProcess_Timeout_KillsChild) {
  const std::vector<std::string> argv{"/bin/sh", "-c", "sleep 10"};
  const auto t0 = std::chrono::steady_clock::now();
  const auto r = converge::os::run_process(argv, 200ms);
  EXPECT_LT(std::chrono::steady_clock::now() - t0, 5s);
  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error().code, converge::os::ProcessErrc::Timeout);
}
