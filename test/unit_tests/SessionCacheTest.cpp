#include "FakeMultiplexer.hpp"
#include "SessionCache.hpp"
#include "TestHeaders.hpp"

using namespace rv;

TEST_CASE("Creates a session once per host", "[SessionCache]") {
  shared_ptr<FakeMultiplexer> multiplexer(new FakeMultiplexer());
  SessionCache cache;

  auto first = cache.getOrCreate("web01", multiplexer);
  auto second = cache.getOrCreate("web01", multiplexer);
  auto other = cache.getOrCreate("db01", multiplexer);

  REQUIRE(first == second);
  REQUIRE(first != other);
  REQUIRE(first->getName() == "web01");
  REQUIRE(multiplexer->getNewSessionCalls() ==
          vector<string>({"web01", "db01"}));
  REQUIRE(cache.size() == 2);
  REQUIRE(cache.find("web01") == first);
  REQUIRE(cache.find("mail01") == nullptr);
}

TEST_CASE("Adopts a session left over from an earlier run",
          "[SessionCache]") {
  shared_ptr<FakeMultiplexer> multiplexer(new FakeMultiplexer());
  multiplexer->addExistingSession("web01");
  SessionCache cache;

  auto session = cache.getOrCreate("web01", multiplexer);

  REQUIRE(session->getName() == "web01");
  REQUIRE(session->getWindowCount() == 0);
  REQUIRE(multiplexer->getNewSessionCalls().empty());
  REQUIRE(cache.size() == 1);
}

TEST_CASE("Recreates a session that was killed behind our back",
          "[SessionCache]") {
  shared_ptr<FakeMultiplexer> multiplexer(new FakeMultiplexer());
  SessionCache cache;

  auto session = cache.getOrCreate("web01", multiplexer);
  REQUIRE(session->reserveWindowNumber() == 1);
  multiplexer->killSession("web01");

  auto again = cache.getOrCreate("web01", multiplexer);
  REQUIRE(again == session);
  REQUIRE(again->reserveWindowNumber() == 2);
  REQUIRE(multiplexer->getNewSessionCalls() ==
          vector<string>({"web01", "web01"}));
}

TEST_CASE("A failed new-session is tolerated", "[SessionCache]") {
  shared_ptr<FakeMultiplexer> multiplexer(new FakeMultiplexer());
  multiplexer->failNewSession = true;
  SessionCache cache;

  auto session = cache.getOrCreate("web01", multiplexer);
  REQUIRE(session->getName() == "web01");
  REQUIRE(cache.size() == 1);
}

TEST_CASE("Propagates a failed existence check", "[SessionCache]") {
  shared_ptr<FakeMultiplexer> multiplexer(new FakeMultiplexer());
  multiplexer->failHasSession = true;
  SessionCache cache;

  REQUIRE_THROWS_AS(cache.getOrCreate("web01", multiplexer), RoutingError);
  REQUIRE(cache.size() == 0);
  REQUIRE(multiplexer->getNewSessionCalls().empty());
}

TEST_CASE("Concurrent callbacks from one host create one session",
          "[SessionCache]") {
  shared_ptr<FakeMultiplexer> multiplexer(new FakeMultiplexer());
  multiplexer->callDelayMs = 5;
  SessionCache cache;

  const int numThreads = 16;
  vector<shared_ptr<Session>> results(numThreads);
  vector<thread> threads;
  for (int i = 0; i < numThreads; i++) {
    threads.push_back(thread([&, i]() {
      results[i] = cache.getOrCreate("web01", multiplexer);
    }));
  }
  for (auto& t : threads) {
    t.join();
  }

  REQUIRE(multiplexer->getNewSessionCalls().size() == 1);
  for (const auto& session : results) {
    REQUIRE(session == results[0]);
  }
}

TEST_CASE("Window numbers never repeat under contention", "[SessionCache]") {
  Session session("web01");
  const int numThreads = 8;
  const int perThread = 50;
  vector<vector<int>> reserved(numThreads);
  vector<thread> threads;
  for (int i = 0; i < numThreads; i++) {
    threads.push_back(thread([&, i]() {
      for (int j = 0; j < perThread; j++) {
        reserved[i].push_back(session.reserveWindowNumber());
      }
    }));
  }
  for (auto& t : threads) {
    t.join();
  }

  set<int> all;
  for (const auto& numbers : reserved) {
    // Each thread sees its own numbers strictly increase
    for (size_t j = 1; j < numbers.size(); j++) {
      REQUIRE(numbers[j] > numbers[j - 1]);
    }
    all.insert(numbers.begin(), numbers.end());
  }
  REQUIRE(all.size() == size_t(numThreads * perThread));
  REQUIRE(*all.begin() == 1);
  REQUIRE(*all.rbegin() == numThreads * perThread);
  REQUIRE(session.getWindowCount() == numThreads * perThread);
}
