#include "Event.hpp"

#include "TestHeaders.hpp"

using namespace oc;

TEST_CASE("Event emitAll runs handlers in registration order", "[Event]") {
  Event<int(int)> event;
  event.connect([](int x) { return x + 1; });
  event.connect([](int x) { return x * 2; });

  vector<int> results = event.emitAll(5);
  REQUIRE(results.size() == 2);
  REQUIRE(results[0] == 6);
  REQUIRE(results[1] == 10);
}

TEST_CASE("Event disconnect", "[Event]") {
  Event<void(int)> event;
  int calls = 0;
  auto disconnect = event.connect([&calls](int) { calls++; });
  REQUIRE(event.listenerCount() == 1);

  event.emit(1);
  REQUIRE(calls == 1);

  disconnect();
  REQUIRE(event.listenerCount() == 0);
  event.emit(1);
  REQUIRE(calls == 1);

  // A second disconnect is only logged
  disconnect();
  REQUIRE(event.listenerCount() == 0);
}

TEST_CASE("Event ignores a handler registered twice", "[Event]") {
  Event<void()> event;
  int calls = 0;
  auto handler = make_shared<Event<void()>::Handler>([&calls]() { calls++; });
  auto disconnect = event.connect(handler);
  auto duplicateDisconnect = event.connect(handler);
  REQUIRE(event.listenerCount() == 1);
  event.emit();
  REQUIRE(calls == 1);

  // Only the first registration owns the handler
  duplicateDisconnect();
  REQUIRE(event.listenerCount() == 1);
  event.emit();
  REQUIRE(calls == 2);

  disconnect();
  REQUIRE(event.listenerCount() == 0);
}

TEST_CASE("Event sequential emitAll collects failures", "[Event]") {
  Event<void()> event;
  vector<int> order;
  event.connect([&order]() {
    order.push_back(1);
    throw std::runtime_error("first");
  });
  event.connect([&order]() {
    order.push_back(2);
    throw std::runtime_error("second");
  });
  event.connect([&order]() { order.push_back(3); });

  REQUIRE_THROWS_WITH(event.emitAll(), "first");
  REQUIRE(order == vector<int>({1, 2, 3}));
}

TEST_CASE("Event skips handlers removed during the same emit", "[Event]") {
  Event<void()> event;
  int secondCalls = 0;
  std::function<void()> disconnectSecond;
  event.connect([&disconnectSecond]() { disconnectSecond(); });
  disconnectSecond = event.connect([&secondCalls]() { secondCalls++; });

  event.emitAll();
  REQUIRE(secondCalls == 0);
  REQUIRE(event.listenerCount() == 1);
}

TEST_CASE("Event emit routes failures to the error handler", "[Event]") {
  Event<void(const string&)> event;
  string seen;
  event.setErrorHandler([&seen](std::exception_ptr error) {
    try {
      std::rethrow_exception(error);
    } catch (const std::exception& e) {
      seen = e.what();
    }
  });
  event.connect([](const string& s) { throw std::runtime_error("bad " + s); });

  event.emit("input");
  REQUIRE(seen == "bad input");
}

TEST_CASE("Event with the ERROR policy needs a listener", "[Event]") {
  Event<int()> strict(EventPolicy::ERROR);
  REQUIRE_THROWS_AS(strict.emitAll(), std::runtime_error);
  REQUIRE_THROWS_AS(strict.emitRace(), std::runtime_error);

  Event<int()> lenient;
  REQUIRE(lenient.emitAll().empty());
}

TEST_CASE("Event sequential emitRace returns the first outcome", "[Event]") {
  SECTION("First handler succeeds") {
    Event<string()> event;
    int laterCalls = 0;
    event.connect([]() { return string("winner"); });
    event.connect([&laterCalls]() {
      laterCalls++;
      throw std::runtime_error("too late");
      return string("loser");
    });
    REQUIRE(event.emitRace() == "winner");
    REQUIRE(laterCalls == 1);
  }

  SECTION("First handler fails") {
    Event<string()> event;
    event.connect([]() -> string { throw std::runtime_error("failed"); });
    event.connect([]() { return string("ignored"); });
    REQUIRE_THROWS_WITH(event.emitRace(), "failed");
  }
}

TEST_CASE("Event parallel emitRace returns the fastest handler", "[Event]") {
  Event<int()> event(EventPolicy::DEFAULT, EventExecution::PARALLEL);
  event.connect([]() {
    std::this_thread::sleep_for(std::chrono::milliseconds(300));
    return 1;
  });
  event.connect([]() { return 2; });
  REQUIRE(event.emitRace() == 2);
}

TEST_CASE("Event parallel emitAll", "[Event]") {
  Event<int(int)> event(EventPolicy::DEFAULT, EventExecution::PARALLEL);

  SECTION("Results keep registration order") {
    event.connect([](int x) {
      std::this_thread::sleep_for(std::chrono::milliseconds(100));
      return x;
    });
    event.connect([](int x) { return -x; });
    vector<int> results = event.emitAll(7);
    REQUIRE(results == vector<int>({7, -7}));
  }

  SECTION("The earliest failure is reported") {
    event.connect([](int) -> int {
      std::this_thread::sleep_for(std::chrono::milliseconds(200));
      throw std::runtime_error("slow failure");
    });
    event.connect([](int) -> int { throw std::runtime_error("fast failure"); });
    REQUIRE_THROWS_WITH(event.emitAll(1), "fast failure");
  }
}

TEST_CASE("Event parallel emit does not block", "[Event]") {
  std::atomic<int> calls(0);
  {
    Event<void()> event(EventPolicy::DEFAULT, EventExecution::PARALLEL);
    event.connect([&calls]() {
      std::this_thread::sleep_for(std::chrono::milliseconds(50));
      calls++;
    });
    event.emit();
    // The destructor waits for the handler
  }
  REQUIRE(calls == 1);
}
