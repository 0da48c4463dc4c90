/*
===============================================================================
 transport::FrameQueue — Unit Tests
===============================================================================

Scope:
------
Validates the bounded hand-off between a transport I/O thread and the
session owner.

-------------------------------------------------------------------------------
Covered Contracts
-------------------------------------------------------------------------------

Q1. Frames are delivered in push order
Q2. wait_pop() times out on an empty open queue
Q3. close() still delivers queued frames, then reports Closed
Q4. A full queue rejects pushes (backpressure)
Q5. A blocked consumer is woken by a producer thread
Q6. reset() re-arms a closed queue

===============================================================================
*/

#include <chrono>
#include <iostream>
#include <thread>

#include "common/test_check.hpp"
#include "wiredive/core/transport/frame_queue.hpp"

using namespace wiredive::core::transport;
using namespace std::chrono_literals;

namespace {

Frame make_frame(std::string payload) {
    Frame f;
    f.payload = std::move(payload);
    return f;
}

} // namespace


void test_fifo() {
    std::cout << "[TEST] Group Q1: frames are delivered in order\n";

    FrameQueue q(8);
    TEST_CHECK(q.push(make_frame("a")));
    TEST_CHECK(q.push(make_frame("b")));
    TEST_CHECK(q.size() == 2);

    Frame out;
    TEST_CHECK(q.wait_pop(out, 0ms) == WaitStatus::Ready);
    TEST_CHECK(out.payload == "a");
    TEST_CHECK(q.wait_pop(out, 0ms) == WaitStatus::Ready);
    TEST_CHECK(out.payload == "b");

    std::cout << "[TEST] OK\n";
}

void test_timeout() {
    std::cout << "[TEST] Group Q2: empty queue times out\n";

    FrameQueue q(4);
    Frame out;
    const auto start = std::chrono::steady_clock::now();
    TEST_CHECK(q.wait_pop(out, 20ms) == WaitStatus::Timeout);
    TEST_CHECK(std::chrono::steady_clock::now() - start >= 20ms);

    std::cout << "[TEST] OK\n";
}

void test_close_drains() {
    std::cout << "[TEST] Group Q3: close delivers queued frames first\n";

    FrameQueue q(4);
    TEST_CHECK(q.push(make_frame("last words")));
    q.close(Error::RemoteClosed);
    q.close(Error::TransportFailure);   // first reason wins

    TEST_CHECK(q.closed());
    TEST_CHECK(q.close_reason() == Error::RemoteClosed);
    TEST_CHECK(!q.push(make_frame("too late")));

    Frame out;
    TEST_CHECK(q.wait_pop(out, 0ms) == WaitStatus::Ready);
    TEST_CHECK(out.payload == "last words");
    TEST_CHECK(q.wait_pop(out, 0ms) == WaitStatus::Closed);
    TEST_CHECK(q.wait_pop(out, std::nullopt) == WaitStatus::Closed);

    std::cout << "[TEST] OK\n";
}

void test_backpressure() {
    std::cout << "[TEST] Group Q4: full queue rejects pushes\n";

    FrameQueue q(2);
    TEST_CHECK(q.push(make_frame("1")));
    TEST_CHECK(q.push(make_frame("2")));
    TEST_CHECK(!q.push(make_frame("3")));
    TEST_CHECK(q.size() == 2);
    TEST_CHECK(q.capacity() == 2);

    std::cout << "[TEST] OK\n";
}

void test_cross_thread_wakeup() {
    std::cout << "[TEST] Group Q5: consumer woken by producer thread\n";

    FrameQueue q(4);
    std::thread producer([&q] {
        std::this_thread::sleep_for(10ms);
        (void)q.push(make_frame("hello"));
    });

    Frame out;
    TEST_CHECK(q.wait_pop(out, std::nullopt) == WaitStatus::Ready);
    TEST_CHECK(out.payload == "hello");
    producer.join();

    std::cout << "[TEST] OK\n";
}

void test_reset() {
    std::cout << "[TEST] Group Q6: reset re-arms the queue\n";

    FrameQueue q(4);
    TEST_CHECK(q.push(make_frame("stale")));
    q.close(Error::LocalShutdown);
    q.reset();

    TEST_CHECK(!q.closed());
    TEST_CHECK(q.close_reason() == Error::None);
    TEST_CHECK(q.size() == 0);
    TEST_CHECK(q.push(make_frame("fresh")));

    std::cout << "[TEST] OK\n";
}

int main() {
    test_fifo();
    test_timeout();
    test_close_drains();
    test_backpressure();
    test_cross_thread_wakeup();
    test_reset();

    std::cout << "\n[FRAME_QUEUE TESTS PASSED]\n";
    return 0;
}
