#include <future>

#include "PipeTestUtils.hpp"
#include "SocketBridge.hpp"
#include "TestHeaders.hpp"

using namespace rv;

class SocketBridgeTestFixture {
 public:
  SocketBridgeTestFixture() {
    socketHandler.reset(new PipeSocketHandler());
    directory = createTempDirectory("rv_test_bridge");
    // agent.clientFd is the remote agent, agent.serverFd the listener's end
    agent = connectPipe(socketHandler, directory + "/agent");
    // bridge.clientFd is the listener's dial, bridge.serverFd the bridge's end
    bridge = connectPipe(socketHandler, directory + "/bridge");
    rendezvousPath = directory + "/alice.abcdefghij.sock";
    FILE* f = fopen(rendezvousPath.c_str(), "w");
    REQUIRE(f != NULL);
    fclose(f);
  }

  ~SocketBridgeTestFixture() { fs::remove_all(directory); }

  std::future<RelayStats> startRelay() {
    return std::async(std::launch::async, [this]() {
      return SocketBridge::relay(socketHandler, agent.serverFd, socketHandler,
                                 bridge.clientFd, rendezvousPath);
    });
  }

  void send(int fd, const string& s) {
    socketHandler->writeAllOrThrow(fd, s.data(), s.length(), true);
  }

  string receive(int fd, int count) {
    string s(count, '\0');
    socketHandler->readAll(fd, &s[0], count, true);
    return s;
  }

  shared_ptr<PipeSocketHandler> socketHandler;
  string directory;
  ConnectedPipe agent;
  ConnectedPipe bridge;
  string rendezvousPath;
};

TEST_CASE_METHOD(SocketBridgeTestFixture,
                 "Relays both directions and cleans up when one side closes",
                 "[SocketBridge]") {
  auto relay = startRelay();

  send(agent.clientFd, "uid=0(root)\n");
  REQUIRE(receive(bridge.serverFd, 12) == "uid=0(root)\n");
  send(bridge.serverFd, "id\n");
  REQUIRE(receive(agent.clientFd, 3) == "id\n");

  int survivorFd = -1;
  SECTION("agent closes first") {
    socketHandler->close(agent.clientFd);
    survivorFd = bridge.serverFd;
  }
  SECTION("bridge closes first") {
    socketHandler->close(bridge.serverFd);
    survivorFd = agent.clientFd;
  }

  REQUIRE(relay.wait_for(std::chrono::seconds(10)) ==
          std::future_status::ready);
  RelayStats stats = relay.get();
  REQUIRE(stats.aToB == 12);
  REQUIRE(stats.bToA == 3);
  REQUIRE(waitForEof(socketHandler, survivorFd));
  REQUIRE(!fs::exists(rendezvousPath));

  // Only the test's own ends are left open
  vector<int> active = socketHandler->getActiveSockets();
  REQUIRE(active == vector<int>({survivorFd}));
  socketHandler->close(survivorFd);
}

TEST_CASE_METHOD(SocketBridgeTestFixture, "Relays large transfers intact",
                 "[SocketBridge]") {
  auto relay = startRelay();

  string payload;
  for (int i = 0; i < 256 * 1024; i++) {
    payload.push_back(char('a' + (i % 26)));
  }
  std::thread writer([&]() { send(agent.clientFd, payload); });
  REQUIRE(receive(bridge.serverFd, int(payload.length())) == payload);
  writer.join();

  socketHandler->close(agent.clientFd);
  REQUIRE(relay.wait_for(std::chrono::seconds(10)) ==
          std::future_status::ready);
  REQUIRE(relay.get().aToB == int64_t(payload.length()));
  socketHandler->close(bridge.serverFd);
}
