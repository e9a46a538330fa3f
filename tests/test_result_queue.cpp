#include <catch2/catch.hpp>

#include "result_queue.hpp"

#include <future>
#include <thread>

using namespace mdns_discovery;
using namespace std::chrono_literals;

namespace
{

ServiceInfo Info(const std::string& name)
{
    ServiceInfo info;
    info.name = name;
    info.address = "10.0.0.1";
    return info;
}

}

TEST_CASE("Queue hands out items in push order", "[queue]")
{
    ResultQueue queue;
    REQUIRE(queue.Push(Info("a")));
    REQUIRE(queue.Push(Info("b")));
    REQUIRE(queue.Push(Info("c")));
    CHECK(queue.Size() == 3);

    CHECK(queue.Pop()->name == "a");
    CHECK(queue.Pop()->name == "b");
    CHECK(queue.Pop()->name == "c");
    CHECK(queue.Size() == 0);
}

TEST_CASE("Pop gives up at the deadline", "[queue]")
{
    ResultQueue queue;
    const auto start = ResultQueue::Clock::now();
    CHECK_FALSE(queue.Pop(start + 50ms));
    CHECK(ResultQueue::Clock::now() - start >= 50ms);
    CHECK_FALSE(queue.Closed());
}

TEST_CASE("Pop returns items pushed while waiting", "[queue]")
{
    ResultQueue queue;
    std::thread producer([&queue]() {
        std::this_thread::sleep_for(20ms);
        queue.Push(Info("late"));
    });
    const auto info = queue.Pop(ResultQueue::Clock::now() + 2s);
    producer.join();
    REQUIRE(info);
    CHECK(info->name == "late");
}

TEST_CASE("Close wakes a waiting consumer and drops pending items", "[queue]")
{
    ResultQueue queue;
    auto waiter = std::async(std::launch::async, [&queue]() {
        return queue.Pop();
    });
    std::this_thread::sleep_for(20ms);
    queue.Close();
    REQUIRE(waiter.wait_for(2s) == std::future_status::ready);
    CHECK_FALSE(waiter.get());

    CHECK(queue.Closed());
    CHECK_FALSE(queue.Push(Info("after")));
    CHECK(queue.Size() == 0);
    CHECK_FALSE(queue.Pop());
}
