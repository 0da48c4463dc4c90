/*
===============================================================================
 session::Pool — Unit Tests
 lease / release / sweep_expired / close_all, Lease fallback
===============================================================================

Scope:
------
Validates the bounded session pool and the scoped Lease built on it.

-------------------------------------------------------------------------------
Covered Contracts
-------------------------------------------------------------------------------

P1. lease() opens a session, release() makes it reusable
    - Reuse does not reconnect

P2. Capacity bound
    - lease() beyond capacity returns nullptr and reports exhaustion
    - After one release, exactly one of two further leases succeeds

P3. Concurrent leases never exceed capacity nor share a session

P4. Idle TTL
    - sweep_expired() evicts and closes idle sessions past the TTL
    - In-use sessions are never swept
    - lease() evicts a stale idle session instead of reusing it

P5. release() edge cases
    - A dead session is evicted on release
    - An unknown session is ignored

P6. A failed open is not exhaustion

P7. Lease fallback
    - An exhausted pool yields a direct session, closed on destruction
    - A failed open does not fall back

P8. close_all() closes every managed session

===============================================================================
*/

#include <atomic>
#include <chrono>
#include <iostream>
#include <set>
#include <thread>
#include <vector>

#include "common/harness/session.hpp"

using namespace wiredive::core;
using namespace std::chrono_literals;


// -----------------------------------------------------------------------------
// P1. Lease and reuse
// -----------------------------------------------------------------------------
void test_lease_and_reuse() {
    std::cout << "[TEST] Group P1: lease() then reuse after release()\n";

    test::SessionHarness h;
    test::SessionHarness::Pool pool(h.endpoint, h.pool_config(2), h.log);

    auto* s1 = pool.lease();
    TEST_CHECK(s1 != nullptr);
    TEST_CHECK(s1->is_alive());
    TEST_CHECK(pool.size() == 1);
    TEST_CHECK(pool.in_use() == 1);

    pool.release(s1);
    TEST_CHECK(pool.in_use() == 0);
    TEST_CHECK(pool.size() == 1);

    auto* s2 = pool.lease();
    TEST_CHECK(s2 == s1);
    TEST_CHECK(WebSocketUnderTest::connect_count() == 1);

    pool.release(s2);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// P2. Capacity
// -----------------------------------------------------------------------------
void test_capacity() {
    std::cout << "[TEST] Group P2: capacity bound\n";

    test::SessionHarness h;
    test::SessionHarness::Pool pool(h.endpoint, h.pool_config(2), h.log);

    auto* a = pool.lease();
    auto* b = pool.lease();
    TEST_CHECK(a && b && a != b);

    bool exhausted = false;
    TEST_CHECK(pool.lease(exhausted) == nullptr);
    TEST_CHECK(exhausted);
    TEST_CHECK(pool.size() == 2);

    pool.release(a);

    auto* c = pool.lease();
    auto* d = pool.lease();
    TEST_CHECK(c == a);
    TEST_CHECK(d == nullptr);
    TEST_CHECK(WebSocketUnderTest::connect_count() == 2);

    pool.release(b);
    pool.release(c);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// P3. Concurrent leases
// -----------------------------------------------------------------------------
void test_concurrent_leases() {
    std::cout << "[TEST] Group P3: concurrent leases respect capacity\n";

    test::SessionHarness h;
    test::SessionHarness::Pool pool(h.endpoint, h.pool_config(3), h.log);

    constexpr int THREADS = 8;
    std::vector<test::SessionHarness::Session*> leased(THREADS, nullptr);
    std::atomic<bool> go{false};
    std::vector<std::thread> threads;

    for (int i = 0; i < THREADS; ++i) {
        threads.emplace_back([&, i] {
            while (!go.load()) {
                std::this_thread::yield();
            }
            leased[i] = pool.lease();
        });
    }
    go.store(true);
    for (auto& t : threads) {
        t.join();
    }

    std::set<test::SessionHarness::Session*> distinct;
    int granted = 0;
    for (auto* s : leased) {
        if (s) {
            ++granted;
            distinct.insert(s);
        }
    }
    TEST_CHECK(granted == 3);
    TEST_CHECK(distinct.size() == 3);
    TEST_CHECK(pool.in_use() == 3);

    for (auto* s : distinct) {
        pool.release(s);
    }
    TEST_CHECK(pool.in_use() == 0);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// P4. Idle TTL
// -----------------------------------------------------------------------------
void test_idle_ttl() {
    std::cout << "[TEST] Group P4: idle sessions expire after the TTL\n";

    test::SessionHarness h;
    test::SessionHarness::Pool pool(h.endpoint, h.pool_config(3, 20ms), h.log);

    auto* idle = pool.lease();
    auto* busy = pool.lease();
    TEST_CHECK(idle && busy);
    pool.release(idle);

    TEST_CHECK(pool.sweep_expired() == 0);

    std::this_thread::sleep_for(40ms);
    TEST_CHECK(pool.sweep_expired() == 1);
    TEST_CHECK(pool.size() == 1);
    TEST_CHECK(pool.in_use() == 1);
    TEST_CHECK(WebSocketUnderTest::close_count() == 1);

    // Stale idle session is replaced on lease()
    pool.release(busy);
    std::this_thread::sleep_for(40ms);
    auto* fresh = pool.lease();
    TEST_CHECK(fresh != nullptr);
    TEST_CHECK(pool.size() == 1);
    TEST_CHECK(WebSocketUnderTest::close_count() == 2);
    TEST_CHECK(WebSocketUnderTest::connect_count() == 3);

    pool.release(fresh);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// P5. release() edge cases
// -----------------------------------------------------------------------------
void test_release_edge_cases() {
    std::cout << "[TEST] Group P5: release() of dead and unknown sessions\n";

    test::SessionHarness h;
    test::SessionHarness::Pool pool(h.endpoint, h.pool_config(2), h.log);

    auto* s = pool.lease();
    TEST_CHECK(s != nullptr);
    s->close();
    pool.release(s);
    TEST_CHECK(pool.size() == 0);

    test::SessionHarness::Session stranger(h.endpoint, h.log);
    pool.release(&stranger);
    pool.release(nullptr);
    TEST_CHECK(pool.size() == 0);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// P6. Failed open
// -----------------------------------------------------------------------------
void test_failed_open() {
    std::cout << "[TEST] Group P6: failed open is not exhaustion\n";

    test::SessionHarness h;
    WebSocketUnderTest::load(Script{}
        .connect_fail(transport::Error::HandshakeFailed)
        .connect_fail(transport::Error::HandshakeFailed)
        .connect_fail(transport::Error::HandshakeFailed));

    test::SessionHarness::Pool pool(h.endpoint, h.pool_config(2), h.log);

    bool exhausted = true;
    TEST_CHECK(pool.lease(exhausted) == nullptr);
    TEST_CHECK(!exhausted);
    TEST_CHECK(pool.size() == 0);
    TEST_CHECK(WebSocketUnderTest::connect_count() == 3);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// P7. Lease fallback
// -----------------------------------------------------------------------------
void test_lease_fallback() {
    std::cout << "[TEST] Group P7: Lease falls back to a direct session\n";

    test::SessionHarness h;
    test::SessionHarness::Pool pool(h.endpoint, h.pool_config(1), h.log);

    {
        session::Lease<WebSocketUnderTest> first(pool);
        TEST_CHECK(first);
        TEST_CHECK(first.pooled());

        {
            session::Lease<WebSocketUnderTest> second(pool);
            TEST_CHECK(second);
            TEST_CHECK(!second.pooled());
            TEST_CHECK(second.get() != first.get());
            TEST_CHECK(second.get()->is_alive());
            TEST_CHECK(pool.size() == 1);
        }
        // Direct session closed, pooled one untouched
        TEST_CHECK(WebSocketUnderTest::close_count() == 1);
        TEST_CHECK(pool.in_use() == 1);
    }
    TEST_CHECK(pool.in_use() == 0);
    TEST_CHECK(pool.size() == 1);

    // Failed open with room left: no direct attempt on top
    pool.close_all();
    WebSocketUnderTest::reset();
    WebSocketUnderTest::load(Script{}
        .connect_fail(transport::Error::ConnectionFailed)
        .connect_fail(transport::Error::ConnectionFailed)
        .connect_fail(transport::Error::ConnectionFailed));
    {
        session::Lease<WebSocketUnderTest> lease(pool);
        TEST_CHECK(!lease);
        TEST_CHECK(lease.get() == nullptr);
    }
    TEST_CHECK(WebSocketUnderTest::connect_count() == 3);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// P8. close_all()
// -----------------------------------------------------------------------------
void test_close_all() {
    std::cout << "[TEST] Group P8: close_all() closes every session\n";

    test::SessionHarness h;
    test::SessionHarness::Pool pool(h.endpoint, h.pool_config(3), h.log);

    auto* a = pool.lease();
    auto* b = pool.lease();
    TEST_CHECK(a && b);
    pool.release(a);

    pool.close_all();
    TEST_CHECK(pool.size() == 0);
    TEST_CHECK(WebSocketUnderTest::close_count() == 2);

    // Idempotent
    pool.close_all();
    TEST_CHECK(WebSocketUnderTest::close_count() == 2);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Test runner
// -----------------------------------------------------------------------------
int main() {
    test_lease_and_reuse();
    test_capacity();
    test_concurrent_leases();
    test_idle_ttl();
    test_release_edge_cases();
    test_failed_open();
    test_lease_fallback();
    test_close_all();

    std::cout << "\n[POOL TESTS PASSED]\n";
    return 0;
}
