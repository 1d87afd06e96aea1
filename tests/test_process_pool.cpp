#include <gtest/gtest.h>

#include "process_pool.hpp"
#include "test_fakes.hpp"

#include <atomic>
#include <chrono>
#include <future>
#include <memory>
#include <set>
#include <string>

using namespace toolagent;
using namespace toolagent::testing;

class ProcessPoolTest : public ::testing::Test {
 protected:
  void SetUp() override {
    log_ = std::make_shared<LaunchLog>();
    pool_ = std::make_unique<ProcessPool>(std::make_unique<FakeLauncher>(log_));
    pool_->SetTerminateGrace(std::chrono::milliseconds(200));
  }

  void TearDown() override {
    pool_.reset();
  }

  static ProcessSpec Spec(const std::string& command = "mcp-server") {
    ProcessSpec spec;
    spec.command = command;
    spec.args = {"--stdio"};
    return spec;
  }

  ProcessHandle Acquire(const std::string& server, const ProcessSpec& spec) {
    std::string err;
    auto h = pool_->Acquire(server, spec, &err);
    EXPECT_TRUE(h.has_value()) << err;
    return h ? std::move(*h) : ProcessHandle();
  }

  std::shared_ptr<LaunchLog> log_;
  std::unique_ptr<ProcessPool> pool_;
};

TEST_F(ProcessPoolTest, ProcessKeyIgnoresEnvOrderButNotArgOrder) {
  ProcessSpec a = Spec();
  a.env = {{"B", "2"}, {"A", "1"}};
  ProcessSpec b = Spec();
  b.env = {{"A", "1"}, {"B", "2"}};
  EXPECT_EQ(ProcessPool::MakeProcessKey(a), ProcessPool::MakeProcessKey(b));

  ProcessSpec c = Spec();
  c.args = {"x", "y"};
  ProcessSpec d = Spec();
  d.args = {"y", "x"};
  EXPECT_NE(ProcessPool::MakeProcessKey(c), ProcessPool::MakeProcessKey(d));
}

TEST_F(ProcessPoolTest, IdenticalSpecsShareOneProcess) {
  auto first = Acquire("alpha", Spec());
  auto second = Acquire("beta", Spec());

  EXPECT_EQ(log_->Launches(), 1u);
  EXPECT_EQ(first.Pid(), second.Pid());
  auto stats = pool_->Stats();
  ASSERT_EQ(stats.size(), 1u);
  EXPECT_EQ(stats[0].reference_count, 2);
  EXPECT_EQ(stats[0].referencing_servers, (std::vector<std::string>{"alpha", "beta"}));

  first.Dispose();
  EXPECT_EQ(pool_->Size(), 1u);
  EXPECT_EQ(log_->Channel(0)->Terminates(), 0);
  EXPECT_TRUE(second.IsAlive());

  second.Dispose();
  EXPECT_EQ(pool_->Size(), 0u);
  EXPECT_EQ(log_->Channel(0)->Terminates(), 1);
}

TEST_F(ProcessPoolTest, DifferentEnvironmentsGetSeparateProcesses) {
  ProcessSpec a = Spec();
  a.env = {{"ROOT", "/a"}};
  ProcessSpec b = Spec();
  b.env = {{"ROOT", "/b"}};
  auto ha = Acquire("a", a);
  auto hb = Acquire("b", b);
  EXPECT_EQ(log_->Launches(), 2u);
  EXPECT_NE(ha.Pid(), hb.Pid());
  EXPECT_EQ(pool_->Size(), 2u);
}

TEST_F(ProcessPoolTest, SpawnFailureIsNotRegistered) {
  log_->failures_to_inject = 1;
  std::string err;
  auto h = pool_->Acquire("alpha", Spec("missing-binary"), &err);
  EXPECT_FALSE(h.has_value());
  EXPECT_NE(err.find("missing-binary"), std::string::npos);
  EXPECT_EQ(pool_->Size(), 0u);

  auto retry = Acquire("alpha", Spec("missing-binary"));
  EXPECT_TRUE(retry.Valid());
  EXPECT_EQ(log_->Launches(), 1u);
}

TEST_F(ProcessPoolTest, CrashRemovesEntryAndNotifiesListeners) {
  auto h = Acquire("alpha", Spec());
  std::promise<int> exit_code;
  ASSERT_TRUE(h.SetListeners([](const std::string&) { return false; }, [&](int code) { exit_code.set_value(code); }));

  log_->Channel(0)->Exit(3);
  auto fut = exit_code.get_future();
  ASSERT_EQ(fut.wait_for(std::chrono::seconds(3)), std::future_status::ready);
  EXPECT_EQ(fut.get(), 3);
  EXPECT_TRUE(WaitUntil([&]() { return pool_->Size() == 0; }));
  EXPECT_FALSE(h.IsAlive());

  std::string err;
  EXPECT_FALSE(h.WriteLine("{}", &err));

  // The dead process is never signalled and a fresh one replaces it.
  h.Dispose();
  EXPECT_EQ(log_->Channel(0)->Terminates(), 0);
  auto again = Acquire("alpha", Spec());
  EXPECT_EQ(log_->Launches(), 2u);
  EXPECT_TRUE(again.IsAlive());
}

TEST_F(ProcessPoolTest, DoubleDisposeReleasesOnce) {
  auto first = Acquire("alpha", Spec());
  auto second = Acquire("beta", Spec());

  first.Dispose();
  first.Dispose();
  pool_->Release(&first);

  auto stats = pool_->Stats();
  ASSERT_EQ(stats.size(), 1u);
  EXPECT_EQ(stats[0].reference_count, 1);
  EXPECT_TRUE(second.IsAlive());
}

TEST_F(ProcessPoolTest, RequestIdsAreUniqueAcrossSharers) {
  auto first = Acquire("alpha", Spec());
  auto second = Acquire("beta", Spec());
  std::set<std::string> ids;
  for (int i = 0; i < 50; i++) {
    ids.insert(*first.NextRequestId());
    ids.insert(*second.NextRequestId());
  }
  EXPECT_EQ(ids.size(), 100u);
}

TEST_F(ProcessPoolTest, LinesGoToTheClaimingListener) {
  auto first = Acquire("alpha", Spec());
  auto second = Acquire("beta", Spec());
  std::atomic<int> first_seen{0};
  std::atomic<int> second_seen{0};
  first.SetListeners(
      [&](const std::string& line) {
        first_seen++;
        return line == "for-first";
      },
      nullptr);
  second.SetListeners(
      [&](const std::string& line) {
        if (line != "for-second") return false;
        second_seen++;
        return true;
      },
      nullptr);

  auto channel = log_->Channel(0);
  channel->Emit("for-second");
  channel->Emit("   ");
  channel->Emit("for-first");
  EXPECT_TRUE(WaitUntil([&]() { return second_seen == 1 && first_seen == 2; }));
}

TEST_F(ProcessPoolTest, WriteLineAppendsNewline) {
  auto h = Acquire("alpha", Spec());
  std::string err;
  ASSERT_TRUE(h.WriteLine(R"({"jsonrpc":"2.0"})", &err)) << err;
  auto written = log_->Channel(0)->Written();
  ASSERT_EQ(written.size(), 1u);
  EXPECT_EQ(written[0], R"({"jsonrpc":"2.0"})");
}

TEST_F(ProcessPoolTest, StubbornProcessIsKilledAfterGrace) {
  pool_->SetTerminateGrace(std::chrono::milliseconds(50));
  auto h = Acquire("alpha", Spec());
  auto channel = log_->Channel(0);
  {
    std::lock_guard<std::mutex> lock(channel->mu);
    channel->ignore_terminate = true;
  }
  h.Dispose();
  std::lock_guard<std::mutex> lock(channel->mu);
  EXPECT_EQ(channel->terminate_calls, 1);
  EXPECT_EQ(channel->kill_calls, 1);
  EXPECT_TRUE(channel->exited);
}

TEST_F(ProcessPoolTest, ShutdownAllTerminatesEverything) {
  auto a = Acquire("a", Spec("one"));
  auto b = Acquire("b", Spec("two"));
  pool_->ShutdownAll();
  EXPECT_EQ(pool_->Size(), 0u);
  EXPECT_EQ(log_->Channel(0)->Terminates(), 1);
  EXPECT_EQ(log_->Channel(1)->Terminates(), 1);
  EXPECT_FALSE(a.IsAlive());
  a.Dispose();
  b.Dispose();
}

class PosixProcessPoolTest : public ::testing::Test {
 protected:
  ProcessPool pool_;
};

TEST_F(PosixProcessPoolTest, CatEchoesLines) {
  ProcessSpec spec;
  spec.command = "cat";
  std::string err;
  auto h = pool_.Acquire("echo", spec, &err);
  ASSERT_TRUE(h.has_value()) << err;
  EXPECT_GT(h->Pid(), 0);

  std::promise<std::string> received;
  std::atomic<bool> done{false};
  h->SetListeners(
      [&](const std::string& line) {
        if (!done.exchange(true)) received.set_value(line);
        return true;
      },
      nullptr);
  ASSERT_TRUE(h->WriteLine("hello pool", &err)) << err;
  auto fut = received.get_future();
  ASSERT_EQ(fut.wait_for(std::chrono::seconds(5)), std::future_status::ready);
  EXPECT_EQ(fut.get(), "hello pool");

  h->Dispose();
  EXPECT_EQ(pool_.Size(), 0u);
}

TEST_F(PosixProcessPoolTest, CrashIsSeenWhileGrandchildHoldsPipes) {
  ProcessSpec spec;
  spec.command = "sh";
  spec.args = {"-c", "sleep 5 & exit 1"};
  std::string err;
  auto h = pool_.Acquire("crashy", spec, &err);
  ASSERT_TRUE(h.has_value()) << err;
  const int dead_pid = h->Pid();
  std::promise<int> exit_code;
  h->SetListeners([](const std::string&) { return false; }, [&](int code) { exit_code.set_value(code); });

  auto fut = exit_code.get_future();
  ASSERT_EQ(fut.wait_for(std::chrono::seconds(3)), std::future_status::ready);
  EXPECT_EQ(fut.get(), 1);
  EXPECT_TRUE(WaitUntil([&]() { return pool_.Size() == 0; }));
  EXPECT_FALSE(h->IsAlive());
  EXPECT_FALSE(h->WriteLine("{}", &err));

  auto again = pool_.Acquire("crashy", spec, &err);
  ASSERT_TRUE(again.has_value()) << err;
  EXPECT_NE(again->Pid(), dead_pid);
  h->Dispose();
  again->Dispose();
}

TEST_F(PosixProcessPoolTest, ReleaseIsBoundedByGrace) {
  pool_.SetTerminateGrace(std::chrono::milliseconds(200));
  ProcessSpec spec;
  spec.command = "sh";
  spec.args = {"-c", "sleep 10 & cat"};
  std::string err;
  auto h = pool_.Acquire("forking", spec, &err);
  ASSERT_TRUE(h.has_value()) << err;

  const auto start = std::chrono::steady_clock::now();
  h->Dispose();
  EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(2));
  EXPECT_EQ(pool_.Size(), 0u);
}

TEST_F(PosixProcessPoolTest, MissingExecutableFailsToSpawn) {
  ProcessSpec spec;
  spec.command = "/nonexistent/toolagent-server";
  std::string err;
  auto h = pool_.Acquire("ghost", spec, &err);
  EXPECT_FALSE(h.has_value());
  EXPECT_NE(err.find("failed"), std::string::npos);
  EXPECT_EQ(pool_.Size(), 0u);
}

int main(int argc, char** argv) {
  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
