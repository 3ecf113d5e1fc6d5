#include <catch2/catch.hpp>
#include "agent_process.hpp"
#include "transport.hpp"
#include "mock_sink.hpp"
#include <csignal>

using namespace decaf;
using namespace std::chrono_literals;

TEST_CASE("AgentProcess: empty command fails to start", "[agent_process]") {
    AgentProcess agent(std::vector<std::string>{});
    std::string error;
    REQUIRE_FALSE(agent.start(error));
    REQUIRE_FALSE(error.empty());
    REQUIRE(agent.stop() == -1);
}

TEST_CASE("AgentProcess: messages round-trip through the child", "[agent_process]") {
    std::signal(SIGPIPE, SIG_IGN);
    AgentProcess agent(std::vector<std::string>{"cat"});
    std::string error;
    REQUIRE(agent.start(error));
    REQUIRE(agent.pid() > 0);

    FdSink to_agent(agent.stdin_fd(), "agent");
    to_agent.send(text_chunk("s1", "echo me"));

    LineReader reader(agent.stdout_fd());
    std::string line;
    REQUIRE(reader.read_line(line));
    auto msg = parse_message(line);
    REQUIRE(msg.has_value());
    REQUIRE(chunk_text(*msg) == "echo me");

    REQUIRE(agent.stop() == 0);
    REQUIRE(agent.stdin_fd() == -1);
    REQUIRE(agent.stdout_fd() == -1);
}

TEST_CASE("AgentProcess: closing stdin lets the child exit", "[agent_process]") {
    AgentProcess agent(std::vector<std::string>{"cat"});
    std::string error;
    REQUIRE(agent.start(error));

    agent.close_stdin();
    LineReader reader(agent.stdout_fd());
    std::string line;
    REQUIRE_FALSE(reader.read_line(line));
    REQUIRE(agent.stop() == 0);
}

TEST_CASE("AgentProcess: missing executable exits with 127", "[agent_process]") {
    AgentProcess agent(std::vector<std::string>{"decaf-test-no-such-agent-binary"});
    std::string error;
    REQUIRE(agent.start(error));
    REQUIRE(agent.stop() == 127);
}

TEST_CASE("AgentProcess: exit status is reported", "[agent_process]") {
    AgentProcess agent(std::vector<std::string>{"sh", "-c", "exit 3"});
    std::string error;
    REQUIRE(agent.start(error));
    REQUIRE(agent.stop() == 3);
}

TEST_CASE("AgentProcess: stuck child is killed after the grace period", "[agent_process]") {
    AgentProcess agent(std::vector<std::string>{"sleep", "30"});
    std::string error;
    REQUIRE(agent.start(error));

    auto begin = std::chrono::steady_clock::now();
    int status = agent.stop(50ms);
    auto elapsed = std::chrono::steady_clock::now() - begin;

    REQUIRE(status == 128 + SIGKILL);
    REQUIRE(elapsed < 5s);
}

TEST_CASE("AgentProcess: start twice is rejected", "[agent_process]") {
    AgentProcess agent(std::vector<std::string>{"cat"});
    std::string error;
    REQUIRE(agent.start(error));
    REQUIRE_FALSE(agent.start(error));
    REQUIRE(error == "Agent already started");
    agent.stop();
}

TEST_CASE("AgentProcess: pipes are not inherited by later children", "[agent_process]") {
    AgentProcess first(std::vector<std::string>{"cat"});
    std::string error;
    REQUIRE(first.start(error));

    // Would hold first's stdin open if descriptors leaked across exec.
    AgentProcess second(std::vector<std::string>{"sleep", "30"});
    REQUIRE(second.start(error));

    first.close_stdin();
    LineReader reader(first.stdout_fd());
    std::string line;
    REQUIRE_FALSE(reader.read_line(line));
    REQUIRE(first.stop() == 0);

    second.stop(0ms);
}
