#include <catch2/catch.hpp>

#include "fake_browser.hpp"
#include "mdns_discovery/discovery.hpp"

#include <future>

using namespace mdns_discovery;
using namespace mdns_discovery::test;
using Clock = DiscoverySession::Clock;

namespace
{

DiscoveryFilter Filter(std::optional<std::string> id, std::optional<std::chrono::milliseconds> timeout)
{
    DiscoveryFilter filter;
    filter.identity = std::move(id);
    filter.timeout = timeout;
    return filter;
}

}

TEST_CASE("DiscoverOne without timeout returns the matching device", "[discover_one]")
{
    auto browser = std::make_shared<FakeBrowser>();
    browser->AddInstance(MakeInfo("other", "192.168.2.1"), 0ms);
    browser->AddInstance(MakeInfo("abc123", "192.168.2.2", 8080), 50ms);

    const auto record = DiscoverOne(browser, Filter("Abc123", std::nullopt));
    CHECK(record == ServiceRecord("192.168.2.2", 8080, "abc123"));
    CHECK(browser->ActiveSubscriptions() == 0);
    CHECK(browser->TotalSubscriptions() == 1);
}

TEST_CASE("DiscoverOne without filter takes the first device", "[discover_one]")
{
    auto browser = std::make_shared<FakeBrowser>();
    browser->AddInstance(MakeInfo("first", "192.168.2.3"), 0ms);
    browser->AddInstance(MakeInfo("second", "192.168.2.4"), 100ms);

    const auto record = DiscoverOne(browser, Filter(std::nullopt, 1s));
    CHECK(record.Identity() == "first");
    CHECK(browser->ActiveSubscriptions() == 0);
}

TEST_CASE("DiscoverOne times out when nothing matches", "[discover_one]")
{
    auto browser = std::make_shared<FakeBrowser>();
    browser->AddInstance(MakeInfo("other", "192.168.2.5"), 0ms);
    browser->AddInstance(MakeInfo("abc123", "0.0.0.0"), 10ms);
    browser->AddInstance(MakeInfo("abc123", "192.168.2.6"), 2s);

    const auto start = Clock::now();
    CHECK_THROWS_AS(DiscoverOne(browser, Filter("abc123", 200ms)), DiscoveryTimeout);
    const auto elapsed = Clock::now() - start;

    CHECK(elapsed >= 200ms);
    CHECK(elapsed < 1s);
    CHECK(browser->ActiveSubscriptions() == 0);
}

TEST_CASE("DiscoverOne timeout message names what was looked for", "[discover_one]")
{
    auto browser = std::make_shared<FakeBrowser>();
    try {
        DiscoverOne(browser, Filter("abc123", 20ms));
        FAIL("DiscoverOne returned");
    } catch (const DiscoveryTimeout& e) {
        const std::string what = e.what();
        CHECK(what.find("_brewblox._tcp.local.") != std::string::npos);
        CHECK(what.find("abc123") != std::string::npos);
    }
}

TEST_CASE("DiscoverOne with a timeout beyond the clock range still finds the device", "[discover_one]")
{
    auto browser = std::make_shared<FakeBrowser>();
    browser->AddInstance(MakeInfo("abc123", "192.168.2.7"), 50ms);

    // About 400 years
    const std::chrono::milliseconds huge{12614400000000LL};
    const auto record = DiscoverOne(browser, Filter("abc123", huge));
    CHECK(record.Identity() == "abc123");
    CHECK(browser->ActiveSubscriptions() == 0);
}

TEST_CASE("DiscoverAll with a timeout beyond the clock range is unbounded", "[discover_all]")
{
    auto browser = std::make_shared<FakeBrowser>();
    browser->AddInstance(MakeInfo("abc123", "192.168.2.8"), 50ms);

    auto stream = DiscoverAll(browser, Filter(std::nullopt, std::chrono::milliseconds::max()));
    CHECK_FALSE(stream.Deadline());
    const auto record = stream.Next();
    REQUIRE(record);
    CHECK(record->Identity() == "abc123");
    stream.Close();
    CHECK(browser->ActiveSubscriptions() == 0);
}

TEST_CASE("DiscoverAll yields what arrives before the bound", "[discover_all]")
{
    auto browser = std::make_shared<FakeBrowser>();
    browser->AddInstance(MakeInfo("t1", "192.168.3.1"), 0ms);
    browser->AddInstance(MakeInfo("t2", "192.168.3.2"), 50ms);
    browser->AddInstance(MakeInfo("t3", "192.168.3.3"), 100ms);
    browser->AddInstance(MakeInfo("late", "192.168.3.4"), 1500ms);

    const auto start = Clock::now();
    std::vector<std::string> ids;
    for (const auto& record : DiscoverAll(browser, Filter(std::nullopt, 400ms))) {
        ids.push_back(record.Identity());
    }
    const auto elapsed = Clock::now() - start;

    const std::vector<std::string> expected{"t1", "t2", "t3"};
    CHECK(ids == expected);
    CHECK(elapsed >= 400ms);
    CHECK(elapsed < 1200ms);
    CHECK(browser->ActiveSubscriptions() == 0);
}

TEST_CASE("DiscoverAll applies the identity filter", "[discover_all]")
{
    auto browser = std::make_shared<FakeBrowser>();
    browser->AddInstance(MakeInfo("abc123", "192.168.3.10"), 0ms);
    browser->AddInstance(MakeInfo("xyz789", "192.168.3.11"), 10ms);

    const auto records = CollectAll(browser, Filter("ABC123", 200ms));
    REQUIRE(records.size() == 1);
    CHECK(records[0].Identity() == "abc123");
}

TEST_CASE("CollectAll without devices is empty", "[discover_all]")
{
    auto browser = std::make_shared<FakeBrowser>();
    CHECK(CollectAll(browser, Filter(std::nullopt, 50ms)).empty());
    CHECK(browser->ActiveSubscriptions() == 0);
}

TEST_CASE("Leaving a stream early releases the subscription", "[discover_all]")
{
    auto browser = std::make_shared<FakeBrowser>();
    browser->AddInstance(MakeInfo("first", "192.168.3.20"), 0ms);
    browser->AddInstance(MakeInfo("second", "192.168.3.21"), 10ms);

    {
        auto stream = DiscoverAll(browser, Filter(std::nullopt, std::nullopt));
        CHECK_FALSE(stream.Deadline());
        for (const auto& record : stream) {
            CHECK(record.Identity() == "first");
            break;
        }
        CHECK(browser->ActiveSubscriptions() == 1);
    }
    CHECK(browser->ActiveSubscriptions() == 0);
}

TEST_CASE("An unbounded stream ends when cancelled", "[discover_all]")
{
    auto browser = std::make_shared<FakeBrowser>();
    auto stream = DiscoverAll(browser, Filter(std::nullopt, std::nullopt));

    auto consumer = std::async(std::launch::async, [&stream]() {
        std::size_t count = 0;
        for (const auto& record : stream) {
            (void)record;
            ++count;
        }
        return count;
    });
    CHECK(consumer.wait_for(50ms) == std::future_status::timeout);

    stream.Cancel();
    REQUIRE(consumer.wait_for(2s) == std::future_status::ready);
    CHECK(consumer.get() == 0);
    CHECK(stream.Closed());
    CHECK(browser->ActiveSubscriptions() == 0);
}

TEST_CASE("A closed stream yields nothing more", "[discover_all]")
{
    auto browser = std::make_shared<FakeBrowser>();
    browser->AddInstance(MakeInfo("first", "192.168.3.30"), 0ms);

    auto stream = DiscoverAll(browser, Filter(std::nullopt, 1s));
    stream.Close();
    CHECK(stream.Closed());
    CHECK_FALSE(stream.Next());
    CHECK(browser->ActiveSubscriptions() == 0);
}

TEST_CASE("Concurrent discoveries are independent", "[discover_all]")
{
    auto browser = std::make_shared<FakeBrowser>();
    browser->AddInstance(MakeInfo("d1", "192.168.4.1"), 0ms);
    browser->AddInstance(MakeInfo("d2", "192.168.4.2"), 100ms);

    auto short_stream = DiscoverAll(browser, Filter(std::nullopt, 1s));
    auto long_run = std::async(std::launch::async, [browser]() {
        return CollectAll(browser, Filter(std::nullopt, 300ms));
    });

    const auto first = short_stream.Next();
    REQUIRE(first);
    CHECK(first->Identity() == "d1");
    short_stream.Close();

    const auto records = long_run.get();
    REQUIRE(records.size() == 2);
    CHECK(records[0].Identity() == "d1");
    CHECK(records[1].Identity() == "d2");
    CHECK(browser->TotalSubscriptions() == 2);
    CHECK(browser->ActiveSubscriptions() == 0);
}

TEST_CASE("Only the browsed service type is reported", "[discover_all]")
{
    auto browser = std::make_shared<FakeBrowser>();
    browser->AddInstance(MakeInfo("spark", "192.168.5.1"), 0ms);
    auto printer = MakeInfo("printer", "192.168.5.2", 631);
    printer.name = "printer._ipp._tcp.local.";
    browser->AddInstance(printer, 0ms, 0ms, "_ipp._tcp.local.");

    DiscoveryFilter filter = Filter(std::nullopt, 150ms);
    filter.service_type = "_ipp._tcp.local.";
    const auto records = CollectAll(browser, filter);
    REQUIRE(records.size() == 1);
    CHECK(records[0] == ServiceRecord("192.168.5.2", 631, "printer"));
}
