#include <doctest/doctest.h>

#include "game/util/NotificationLog.h"

using namespace civ::game::util;

TEST_CASE("NotificationLog: bounded log drops oldest entries")
{
    NotificationLog log;
    log.setMaxLogEntries(3);

    log.push("A", Severity::Info, 1);
    log.push("B", Severity::Info, 2);
    log.push("C", Severity::Info, 3);
    log.push("D", Severity::Info, 4);
    log.push("E", Severity::Info, 5);

    REQUIRE(log.log().size() == 3);
    CHECK(log.log()[0].text == "C");
    CHECK(log.log()[1].text == "D");
    CHECK(log.log()[2].text == "E");
    CHECK(log.log()[2].tick == 5);
}

TEST_CASE("NotificationLog: recent returns the newest entries oldest first")
{
    NotificationLog log;
    log.push("one", Severity::Info, 1);
    log.push("two", Severity::Warning, 2);
    log.push("three", Severity::Error, 3);

    const auto last2 = log.recent(2);
    REQUIRE(last2.size() == 2);
    CHECK(last2[0].text == "two");
    CHECK(last2[0].severity == Severity::Warning);
    CHECK(last2[1].text == "three");

    CHECK(log.recent(10).size() == 3);
    CHECK(log.recent(0).empty());
}

TEST_CASE("NotificationLog: banners expire via tick")
{
    NotificationLog log;
    log.setMaxBanners(4);

    log.push("Bronze Age", Severity::Highlight, 10, /*bannerTtlSeconds=*/1.0f);
    REQUIRE(log.banners().size() == 1);

    log.tick(0.5f);
    CHECK(log.banners().size() == 1);
    CHECK(log.banners()[0].ttlSeconds == doctest::Approx(0.5f));

    log.tick(0.6f);
    CHECK(log.banners().empty());
    CHECK(log.log().size() == 1);
}

TEST_CASE("NotificationLog: zero TTL logs without raising a banner")
{
    NotificationLog log;
    log.push("Silent", Severity::Warning, 0);

    REQUIRE(log.log().size() == 1);
    CHECK(log.banners().empty());
}
