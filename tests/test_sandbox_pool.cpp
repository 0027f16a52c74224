#include "test_framework.hpp"

#include "sandrun/sandbox/pool.hpp"
#include "tests/helpers/test_helpers.hpp"

#include <algorithm>
#include <atomic>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>

namespace {

namespace sb = sandrun::sandbox;
using sandrun::testing::FakeHttpClient;
using sandrun::testing::FakeLauncher;
using sandrun::testing::wait_until;

struct PoolFixture {
  std::shared_ptr<FakeLauncher> launcher = std::make_shared<FakeLauncher>();
  std::shared_ptr<FakeHttpClient> http = std::make_shared<FakeHttpClient>();
  sb::SandboxPool pool;

  explicit PoolFixture(const std::uint32_t max_size, const bool eager_replace = true)
      : pool(sandrun::config::PoolConfig{.max_size = max_size,
                                         .min_ready = 0,
                                         .acquire_timeout_ms = 1000,
                                         .eager_replace = eager_replace},
             sandrun::testing::make_factory(sandrun::testing::fast_sandbox_config(), launcher,
                                            http)) {}
};

} // namespace

void register_sandbox_pool_tests(std::vector<sandrun::tests::TestCase> &tests) {
  using sandrun::tests::require;
  namespace common = sandrun::common;
  using std::chrono::milliseconds;

  tests.push_back({"pool_spawns_on_demand_and_reuses_healthy_sandbox", [] {
                     PoolFixture fx(2);
                     require(fx.pool.size() == 0, "pool starts empty");

                     auto first = fx.pool.acquire_sandbox(milliseconds(3000));
                     require(first.ok(), first.error());
                     const std::string id = first.value().sandbox_id();
                     require(first.value().sandbox().state() == sb::SandboxState::InUse,
                             "leased sandbox is in use");
                     first.value().release(true);
                     require(!first.value().held(), "released lease is empty");

                     auto second = fx.pool.acquire_sandbox(milliseconds(3000));
                     require(second.ok(), second.error());
                     require(second.value().sandbox_id() == id, "healthy sandbox is reused");
                     require(fx.launcher->launches() == 1, "only one launch");
                     second.value().release(true);
                   }});

  tests.push_back({"pool_never_hands_one_sandbox_to_two_owners", [] {
                     PoolFixture fx(2);
                     std::mutex mutex;
                     std::set<std::string> held;
                     std::atomic<bool> duplicate{false};
                     std::atomic<int> failures{0};

                     std::vector<std::thread> workers;
                     for (int w = 0; w < 4; ++w) {
                       workers.emplace_back([&]() {
                         for (int i = 0; i < 10; ++i) {
                           auto lease = fx.pool.acquire_sandbox(milliseconds(5000));
                           if (!lease.ok()) {
                             ++failures;
                             continue;
                           }
                           const std::string id = lease.value().sandbox_id();
                           {
                             std::lock_guard<std::mutex> lock(mutex);
                             if (!held.insert(id).second) {
                               duplicate = true;
                             }
                           }
                           std::this_thread::sleep_for(milliseconds(2));
                           {
                             std::lock_guard<std::mutex> lock(mutex);
                             held.erase(id);
                           }
                           lease.value().release(true);
                         }
                       });
                     }
                     for (auto &worker : workers) {
                       worker.join();
                     }
                     require(!duplicate.load(), "a sandbox was leased twice");
                     require(failures.load() == 0, "every acquisition should succeed");
                     require(fx.pool.size() <= 2, "capacity respected");
                   }});

  tests.push_back({"pool_exhausted_when_capacity_held", [] {
                     PoolFixture fx(1);
                     auto held = fx.pool.acquire_sandbox(milliseconds(3000));
                     require(held.ok(), held.error());

                     const auto started = std::chrono::steady_clock::now();
                     auto blocked = fx.pool.acquire_sandbox(milliseconds(100));
                     require(!blocked.ok(), "second acquisition should time out");
                     require(blocked.kind() == common::ErrorKind::PoolExhausted, "kind");
                     require(std::chrono::steady_clock::now() - started >= milliseconds(100),
                             "waited the full timeout");
                     require(fx.pool.snapshot().waiting == 0, "waiter removed");
                     require(fx.launcher->launches() == 1, "no launch beyond capacity");
                     held.value().release(true);
                   }});

  tests.push_back({"pool_blocked_acquire_gets_released_sandbox", [] {
                     PoolFixture fx(1);
                     auto held = fx.pool.acquire_sandbox(milliseconds(3000));
                     require(held.ok(), held.error());
                     const std::string id = held.value().sandbox_id();

                     std::string acquired_id;
                     bool acquired = false;
                     std::thread waiter([&]() {
                       auto lease = fx.pool.acquire_sandbox(milliseconds(3000));
                       acquired = lease.ok();
                       if (acquired) {
                         acquired_id = lease.value().sandbox_id();
                         lease.value().release(true);
                       }
                     });
                     require(wait_until([&]() { return fx.pool.snapshot().waiting == 1; }),
                             "waiter should queue");
                     held.value().release(true);
                     waiter.join();
                     require(acquired, "waiter should get the sandbox");
                     require(acquired_id == id, "same sandbox handed over");
                   }});

  tests.push_back({"pool_replaces_sandbox_released_unhealthy", [] {
                     PoolFixture fx(1);
                     auto lease = fx.pool.acquire_sandbox(milliseconds(3000));
                     require(lease.ok(), lease.error());
                     const std::string id = lease.value().sandbox_id();
                     lease.value().release(false);
                     require(fx.launcher->stops() == 1, "faulted sandbox terminated");

                     require(wait_until([&]() {
                               const auto snap = fx.pool.snapshot();
                               return snap.count(sb::SandboxState::Ready) == 1;
                             }),
                             "replacement should become ready");
                     const auto snap = fx.pool.snapshot();
                     require(snap.sandboxes.size() == 1, "one sandbox");
                     require(snap.sandboxes[0].id != id, "sandbox not reused after a fault");
                     require(fx.launcher->launches() == 2, "replacement launched");
                   }});

  tests.push_back({"pool_regenerates_colliding_sandbox_id", [] {
                     auto launcher = std::make_shared<FakeLauncher>();
                     auto http = std::make_shared<FakeHttpClient>();
                     auto issued = std::make_shared<std::vector<std::string>>(
                         std::vector<std::string>{"sbx-a", "sbx-a", "sbx-b"});
                     auto next = std::make_shared<std::size_t>(0);
                     sb::SandboxPool pool(
                         sandrun::config::PoolConfig{.max_size = 2,
                                                     .min_ready = 0,
                                                     .acquire_timeout_ms = 1000,
                                                     .eager_replace = true},
                         sandrun::testing::make_factory(sandrun::testing::fast_sandbox_config(),
                                                        launcher, http),
                         [issued, next]() {
                           const auto index = std::min(*next, issued->size() - 1);
                           ++*next;
                           return (*issued)[index];
                         });

                     auto first = pool.acquire_sandbox(milliseconds(3000));
                     require(first.ok(), first.error());
                     auto second = pool.acquire_sandbox(milliseconds(3000));
                     require(second.ok(), second.error());
                     require(first.value().sandbox_id() == "sbx-a", "first id issued");
                     require(second.value().sandbox_id() == "sbx-b",
                             "colliding id should be replaced");
                     require(pool.size() == 2, "both sandboxes tracked");
                     require(launcher->launches() == 2, "two launches");
                     first.value().release(true);
                     second.value().release(true);
                   }});

  tests.push_back({"pool_without_eager_replace_spawns_on_demand", [] {
                     PoolFixture fx(1, false);
                     auto lease = fx.pool.acquire_sandbox(milliseconds(3000));
                     require(lease.ok(), lease.error());
                     lease.value().release(false);
                     std::this_thread::sleep_for(milliseconds(100));
                     require(fx.pool.size() == 0, "no eager replacement");
                     auto next = fx.pool.acquire_sandbox(milliseconds(3000));
                     require(next.ok(), next.error());
                     require(fx.launcher->launches() == 2, "spawned on demand");
                     next.value().release(true);
                   }});

  tests.push_back({"pool_acquire_is_cancellable", [] {
                     PoolFixture fx(1);
                     auto held = fx.pool.acquire_sandbox(milliseconds(3000));
                     require(held.ok(), held.error());

                     auto token = std::make_shared<common::CancelToken>();
                     const common::CancelScope scope{token};
                     common::ErrorKind kind = common::ErrorKind::Generic;
                     std::thread waiter([&]() {
                       auto lease = fx.pool.acquire_sandbox(milliseconds(10000), &scope);
                       kind = lease.ok() ? common::ErrorKind::Generic : lease.kind();
                     });
                     require(wait_until([&]() { return fx.pool.snapshot().waiting == 1; }),
                             "waiter should queue");
                     const auto started = std::chrono::steady_clock::now();
                     token->cancel();
                     waiter.join();
                     require(kind == common::ErrorKind::Cancelled, "cancelled kind");
                     require(std::chrono::steady_clock::now() - started < milliseconds(1000),
                             "cancellation observed promptly");
                     held.value().release(true);
                   }});

  tests.push_back({"pool_retires_sandbox_lost_while_leased", [] {
                     PoolFixture fx(1);
                     auto lease = fx.pool.acquire_sandbox(milliseconds(3000));
                     require(lease.ok(), lease.error());
                     const auto lost = lease.value().lost_token();
                     fx.http->set_unhealthy(lease.value().sandbox().base_url(), true);

                     require(wait_until([&]() { return lost->cancelled(); }),
                             "lease holder should learn of the loss");
                     require(wait_until([&]() { return fx.pool.snapshot().retired == 1; }),
                             "lost sandbox retired");
                     require(wait_until([&]() {
                               return fx.pool.snapshot().count(sb::SandboxState::Ready) == 1;
                             }),
                             "replacement boots while the lease is outstanding");

                     lease.value().release(true);
                     require(fx.pool.snapshot().retired == 0, "retired sandbox released");
                     require(fx.launcher->stops() >= 1, "lost sandbox terminated");
                   }});

  tests.push_back({"pool_warm_prestarts_sandboxes", [] {
                     PoolFixture fx(3);
                     fx.pool.warm(2);
                     require(wait_until([&]() {
                               return fx.pool.snapshot().count(sb::SandboxState::Ready) == 2;
                             }),
                             "two warm sandboxes");
                     require(fx.launcher->launches() == 2, "two launches");
                     const auto json = fx.pool.snapshot_json();
                     require(json.find("\"max_size\":3") != std::string::npos, "max size in json");
                     require(json.find("\"state\":\"ready\"") != std::string::npos,
                             "state in json");
                     require(json.find("\"prewarmed\":true") != std::string::npos,
                             "prewarm flag in json");
                   }});

  tests.push_back({"pool_shutdown_waits_for_outstanding_leases", [] {
                     PoolFixture fx(2);
                     fx.pool.warm(1);
                     auto lease = fx.pool.acquire_sandbox(milliseconds(3000));
                     require(lease.ok(), lease.error());

                     std::atomic<bool> done{false};
                     std::thread stopper([&]() {
                       fx.pool.shutdown();
                       done = true;
                     });
                     std::this_thread::sleep_for(milliseconds(100));
                     require(!done.load(), "shutdown must wait for the lease");

                     auto late = fx.pool.acquire_sandbox(milliseconds(1000));
                     require(!late.ok() && late.kind() == common::ErrorKind::Cancelled,
                             "no acquisitions during shutdown");

                     lease.value().release(true);
                     stopper.join();
                     require(done.load(), "shutdown completes");
                     require(fx.pool.size() == 0, "every sandbox removed");
                     require(fx.launcher->stops() == fx.launcher->launches(),
                             "every launched runtime stopped");
                   }});

  tests.push_back({"pool_recovers_after_launch_failures", [] {
                     PoolFixture fx(1);
                     fx.launcher->set_launch_failure(true);
                     auto failed = fx.pool.acquire_sandbox(milliseconds(200));
                     require(!failed.ok(), "no sandbox while launches fail");
                     require(failed.kind() == common::ErrorKind::PoolExhausted, "kind");

                     fx.launcher->set_launch_failure(false);
                     auto recovered = fx.pool.acquire_sandbox(milliseconds(5000));
                     require(recovered.ok(), recovered.error());
                     recovered.value().release(true);
                   }});
}
