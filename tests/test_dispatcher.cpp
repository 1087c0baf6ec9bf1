#include <gtest/gtest.h>

#include <chrono>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "kernel/bridge.hpp"
#include "kernel/shared_state.hpp"
#include "kernel/stream_executor.hpp"
#include "kernel/symbol_cache.hpp"
#include "test_support.hpp"

using nb_test::count_end_events;
using nb_test::events_for;

namespace {

nb::Bridge::Options test_options(std::shared_ptr<const nb::SecurityGate> gate = nullptr) {
  nb::Bridge::Options opts;
  opts.module_dirs = {NB_NATIVES_DIR, NB_TEST_NATIVES_DIR};
  opts.stream_workers = 4;
  opts.gate = std::move(gate);
  return opts;
}

class DispatcherTest : public ::testing::Test {
 protected:
  DispatcherTest() : bridge_(test_options()) {}

  void SetUp() override {
    bridge_.events().set_buffering(true);
    bridge_.load_modules();
  }

  nb::Dispatcher& dispatcher() { return bridge_.dispatcher(); }

  // Waits for every stream and returns everything published so far.
  std::vector<nb::StreamEvent> finish_streams() {
    dispatcher().wait_idle();
    return bridge_.events().drain();
  }

  static uint64_t stream_id_of(const nb::ResponseEnvelope& r) {
    return r.result.at("stream_id").get<uint64_t>();
  }

  nb::Bridge bridge_;
};

}  // namespace

TEST_F(DispatcherTest, SyncCallReturnsModuleResult) {
  auto r = dispatcher().invoke_sync("sample", {{"a", 2}, {"b", 3}});
  ASSERT_TRUE(r.ok) << r.error;
  EXPECT_EQ(r.to_json(), nlohmann::json::parse(R"({"ok":true,"result":5})"));
}

TEST_F(DispatcherTest, ExternalCallGoesThroughSymbolCache) {
  auto r = dispatcher().invoke_external("sample", {{"a", 2}, {"b", 3}});
  ASSERT_TRUE(r.ok) << r.error;
  EXPECT_EQ(r.result, 5);
  EXPECT_TRUE(nb::SymbolCache::instance().is_loaded("external_utility"));
}

TEST_F(DispatcherTest, ModuleNamesAreCaseInsensitive) {
  auto r = dispatcher().invoke_sync("SAMPLE", {{"a", 20}, {"b", 22}});
  ASSERT_TRUE(r.ok) << r.error;
  EXPECT_EQ(r.result, 42);
}

TEST_F(DispatcherTest, UnknownModuleIsNotFoundInEveryMode) {
  for (auto r : {dispatcher().invoke_sync("missing", {}), dispatcher().invoke_external("missing", {}),
                 dispatcher().invoke_streaming("missing", {})}) {
    EXPECT_FALSE(r.ok);
    EXPECT_EQ(r.code, nb::BridgeErrc::NotFound);
    EXPECT_EQ(r.error, "Native module 'missing' not found.");
  }
  EXPECT_TRUE(finish_streams().empty());
}

TEST_F(DispatcherTest, UnimplementedModeIsUnsupported) {
  auto r = dispatcher().invoke_external("ticker", {});
  EXPECT_FALSE(r.ok);
  EXPECT_EQ(r.code, nb::BridgeErrc::Unsupported);
}

TEST_F(DispatcherTest, ModuleFailuresBecomeExecutionFailed) {
  auto missing_arg = dispatcher().invoke_sync("sample", {{"a", 2}});
  EXPECT_FALSE(missing_arg.ok);
  EXPECT_EQ(missing_arg.code, nb::BridgeErrc::ExecutionFailed);
  EXPECT_NE(missing_arg.error.find("'b'"), std::string::npos);

  auto thrown = dispatcher().invoke_sync("flaky", {});
  EXPECT_EQ(thrown.code, nb::BridgeErrc::ExecutionFailed);
  EXPECT_EQ(thrown.error, "flaky module failed");
  EXPECT_EQ(thrown.to_json()["kind"], "execution_failed");

  auto malformed = dispatcher().invoke_external("flaky", {});
  EXPECT_EQ(malformed.code, nb::BridgeErrc::ExecutionFailed);
}

TEST_F(DispatcherTest, OperandsOutsideThirtyTwoBitsAreRejected) {
  const char* const payloads[] = {
      R"({"a":3000000000,"b":0})",
      R"({"a":-3000000000,"b":0})",
      R"({"a":2147483647,"b":1})",
      R"({"a":-2147483648,"b":-1})",
  };
  for (const char* text : payloads) {
    auto sync = dispatcher().invoke_sync("sample", nlohmann::json::parse(text));
    EXPECT_FALSE(sync.ok) << text;
    EXPECT_EQ(sync.code, nb::BridgeErrc::ExecutionFailed) << text;
    auto ext = dispatcher().invoke_external("sample", nlohmann::json::parse(text));
    EXPECT_FALSE(ext.ok) << text;
    EXPECT_EQ(ext.code, nb::BridgeErrc::ExecutionFailed) << text;
  }

  auto edge = dispatcher().invoke_sync("sample", nlohmann::json::parse(R"({"a":2147483646,"b":1})"));
  ASSERT_TRUE(edge.ok) << edge.error;
  EXPECT_EQ(edge.result, 2147483647);
  auto low = dispatcher().invoke_external("sample", nlohmann::json::parse(R"({"a":-2147483647,"b":-1})"));
  ASSERT_TRUE(low.ok) << low.error;
  EXPECT_EQ(low.result, -2147483648LL);
}

TEST_F(DispatcherTest, UnserializablePayloadIsInvalidPayload) {
  nb::Payload payload = {{"a", std::string("\xff\xfe")}, {"b", 1}};
  auto r = dispatcher().invoke_sync("sample", payload);
  EXPECT_FALSE(r.ok);
  EXPECT_EQ(r.code, nb::BridgeErrc::InvalidPayload);
}

TEST_F(DispatcherTest, ForeignAllowListIsUnauthorizedAndSkipsModuleCode) {
  const int before = nb::SharedState::instance().access_count();
  for (auto r : {dispatcher().invoke_sync("restricted", {}), dispatcher().invoke_external("restricted", {}),
                 dispatcher().invoke_streaming("restricted", {})}) {
    EXPECT_FALSE(r.ok);
    EXPECT_EQ(r.code, nb::BridgeErrc::Unauthorized);
    EXPECT_NE(r.error.find("restricted"), std::string::npos);
  }
  auto events = finish_streams();
  EXPECT_EQ(nb::SharedState::instance().access_count(), before);
  ASSERT_EQ(events.size(), 2u);
  EXPECT_EQ(events[0].kind, nb::StreamEvent::Error);
  EXPECT_TRUE(events[1].is_end());
  EXPECT_EQ(events[0].stream_id, events[1].stream_id);
}

TEST(DispatcherGateTest, UnauthorizedHostIsRejectedInEveryMode) {
  nb::Bridge bridge(test_options(std::make_shared<nb_test::FixedGate>(std::string("intruder"))));
  bridge.events().set_buffering(true);
  bridge.load_modules();

  const int before = nb::SharedState::instance().access_count();
  auto sync = bridge.dispatcher().invoke_sync("sample", {{"a", 2}, {"b", 3}});
  auto ext = bridge.dispatcher().invoke_external("sample", {{"a", 2}, {"b", 3}});
  auto stream = bridge.dispatcher().invoke_streaming("sample", {{"steps", 2}});
  for (const auto& r : {sync, ext, stream}) {
    EXPECT_FALSE(r.ok);
    EXPECT_EQ(r.code, nb::BridgeErrc::Unauthorized);
    EXPECT_EQ(r.error, "Host process '" + nb::normalize_process_name("intruder") +
                           "' is not authorized to call module 'sample'.");
  }
  bridge.dispatcher().wait_idle();
  EXPECT_EQ(nb::SharedState::instance().access_count(), before);

  auto events = bridge.events().drain();
  ASSERT_EQ(events.size(), 2u);
  EXPECT_EQ(events[0].message, stream.error);
  EXPECT_EQ(count_end_events(events), 1);
}

TEST(DispatcherGateTest, UnknownIdentityIsUnauthorized) {
  nb::Bridge bridge(test_options(std::make_shared<nb_test::FixedGate>(std::nullopt)));
  bridge.load_modules();
  auto r = bridge.dispatcher().invoke_sync("sample", {{"a", 1}, {"b", 1}});
  EXPECT_EQ(r.code, nb::BridgeErrc::Unauthorized);
  EXPECT_NE(r.error.find(nb::kUnknownProcessIdentity), std::string::npos);
}

TEST_F(DispatcherTest, StreamDeliversProgressThenOneSentinel) {
  auto r = dispatcher().invoke_streaming("sample", {{"steps", 3}, {"delay_ms", 0}});
  ASSERT_TRUE(r.ok) << r.error;
  auto events = events_for(finish_streams(), stream_id_of(r));

  ASSERT_EQ(events.size(), 6u);
  EXPECT_EQ(events[0].message.rfind("Starting: ", 0), 0u);
  EXPECT_EQ(events[1].message, "Step 1/3");
  EXPECT_EQ(events[2].message, "Step 2/3");
  EXPECT_EQ(events[3].message, "Step 3/3");
  EXPECT_EQ(events[4].message, "Done.");
  EXPECT_TRUE(events[5].is_end());
  EXPECT_EQ(events[5].message, nb::kStreamEndSentinel);
  EXPECT_EQ(events[5].module, "sample");
}

TEST_F(DispatcherTest, FailingStreamStillEnds) {
  auto r = dispatcher().invoke_streaming("flaky", {});
  ASSERT_TRUE(r.ok) << r.error;
  auto events = events_for(finish_streams(), stream_id_of(r));

  ASSERT_EQ(events.size(), 4u);
  EXPECT_EQ(events[0].message, "progress 1");
  EXPECT_EQ(events[1].message, "progress 2");
  EXPECT_EQ(events[2].kind, nb::StreamEvent::Error);
  EXPECT_EQ(events[2].message, "flaky stream failed");
  EXPECT_TRUE(events[3].is_end());
  EXPECT_EQ(count_end_events(events), 1);
}

TEST_F(DispatcherTest, NonStandardExceptionsFromModulesAreContained) {
  auto sync = dispatcher().invoke_sync("rogue", {});
  EXPECT_FALSE(sync.ok);
  EXPECT_EQ(sync.code, nb::BridgeErrc::ExecutionFailed);
  EXPECT_EQ(sync.error, "Module 'rogue' raised an unknown exception.");

  auto ext = dispatcher().invoke_external("rogue", {});
  EXPECT_FALSE(ext.ok);
  EXPECT_EQ(ext.code, nb::BridgeErrc::ExecutionFailed);
}

TEST_F(DispatcherTest, StreamEndsOnceWhenModuleThrowsPastTheSdk) {
  auto r = dispatcher().invoke_streaming("rogue", {});
  ASSERT_TRUE(r.ok) << r.error;
  const uint64_t id = stream_id_of(r);
  auto events = events_for(finish_streams(), id);

  ASSERT_EQ(events.size(), 4u);
  EXPECT_EQ(events[0].kind, nb::StreamEvent::Progress);
  EXPECT_EQ(events[0].message, "p1");
  EXPECT_EQ(events[1].kind, nb::StreamEvent::Progress);
  EXPECT_EQ(events[1].message, "p2");
  EXPECT_EQ(events[2].kind, nb::StreamEvent::Error);
  EXPECT_EQ(events[2].message, "Module 'rogue' raised an unknown exception.");
  EXPECT_TRUE(events[3].is_end());
  EXPECT_EQ(count_end_events(events), 1);
  EXPECT_TRUE(dispatcher().active_streams().empty());
  EXPECT_FALSE(dispatcher().cancel_stream(id));
}

TEST_F(DispatcherTest, ConcurrentStreamsKeepTheirOwnOrder) {
  const int kStreams = 4;
  const int kTicks = 20;
  std::vector<uint64_t> ids;
  for (int i = 0; i < kStreams; ++i) {
    auto r = dispatcher().invoke_streaming("ticker", {{"count", kTicks}, {"delay_ms", 1}});
    ASSERT_TRUE(r.ok) << r.error;
    ids.push_back(stream_id_of(r));
  }
  for (size_t i = 1; i < ids.size(); ++i) EXPECT_GT(ids[i], ids[i - 1]);

  auto all = finish_streams();
  for (uint64_t id : ids) {
    auto events = events_for(all, id);
    // The module's own sentinel is dropped; the host appends exactly one.
    ASSERT_EQ(events.size(), static_cast<size_t>(kTicks + 1)) << "stream " << id;
    for (int t = 0; t < kTicks; ++t) EXPECT_EQ(events[t].message, "tick " + std::to_string(t + 1));
    EXPECT_TRUE(events.back().is_end());
    EXPECT_EQ(count_end_events(events), 1);
  }
  EXPECT_TRUE(dispatcher().active_streams().empty());
}

TEST_F(DispatcherTest, CancelledStreamStopsAndEndsOnce) {
  auto r = dispatcher().invoke_streaming("ticker", {{"count", 1000}, {"delay_ms", 5}});
  ASSERT_TRUE(r.ok) << r.error;
  const uint64_t id = stream_id_of(r);

  std::this_thread::sleep_for(std::chrono::milliseconds(20));
  EXPECT_TRUE(dispatcher().cancel_stream(id));
  auto events = events_for(finish_streams(), id);

  ASSERT_GE(events.size(), 2u);
  EXPECT_LT(events.size(), 1000u);
  EXPECT_EQ(events[events.size() - 2].message, "Stream cancelled.");
  EXPECT_TRUE(events.back().is_end());
  EXPECT_EQ(count_end_events(events), 1);
  EXPECT_FALSE(dispatcher().cancel_stream(id));
}

TEST_F(DispatcherTest, InvokeRoutesByMode) {
  nb::RequestEnvelope req;
  req.module_name = "sample";
  req.mode = nb::InvokeMode::External;
  req.payload = {{"a", 4}, {"b", 5}};
  auto r = dispatcher().invoke(req);
  ASSERT_TRUE(r.ok) << r.error;
  EXPECT_EQ(r.result, 9);

  req.mode = nb::InvokeMode::Stream;
  req.payload = {{"steps", 1}, {"delay_ms", 0}};
  auto s = dispatcher().invoke(req);
  ASSERT_TRUE(s.ok);
  EXPECT_TRUE(s.result.contains("stream_id"));
  finish_streams();
}

TEST_F(DispatcherTest, ConcurrentCallsCountEveryAccess) {
  const int before = nb::SharedState::instance().access_count();
  const int kThreads = 8;
  const int kCalls = 25;
  std::vector<std::thread> threads;
  for (int t = 0; t < kThreads; ++t) {
    threads.emplace_back([this] {
      for (int i = 0; i < kCalls; ++i) dispatcher().invoke_sync("sample", {{"a", i}, {"b", 1}});
    });
  }
  for (auto& th : threads) th.join();
  EXPECT_EQ(nb::SharedState::instance().access_count(), before + kThreads * kCalls);
}

TEST(SharedStateTest, ConcurrentIncrementsAreNotLost) {
  auto& state = nb::SharedState::instance();
  const int before = state.access_count();
  std::vector<std::thread> threads;
  for (int t = 0; t < 8; ++t) {
    threads.emplace_back([&state] {
      for (int i = 0; i < 1000; ++i) state.record_access();
    });
  }
  for (auto& th : threads) th.join();
  EXPECT_EQ(state.access_count(), before + 8000);

  const std::string message = state.global_message();
  EXPECT_EQ(message, "This is a shared message from the host bridge. Access count: " +
                         std::to_string(before + 8001));
}

TEST(StreamExecutorTest, WorkersSurviveNonStandardExceptions) {
  nb::StreamExecutor executor(2);
  auto failed = executor.post([]() -> int { throw 42; });
  auto next = executor.post([] { return 7; });
  executor.wait_idle();
  EXPECT_THROW(failed.get(), int);
  EXPECT_EQ(next.get(), 7);
  executor.stop();
}
