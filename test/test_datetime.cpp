#include <catch2/catch_all.hpp>
#include <ms/datetime.h>

#include <cstdlib>
#include <ctime>

using namespace ms;

TEST_CASE("ISO formatting") {
    SECTION("Naive") {
        Timestamp ts{2013, 11, 10, 14, 20, 58};
        REQUIRE(datetime::isoformat(ts) == "2013-11-10T14:20:58");
        ts.microsecond = 123456;
        REQUIRE(datetime::isoformat(ts) == "2013-11-10T14:20:58.123456");
    }
    SECTION("Aware") {
        Timestamp ts{2013, 11, 10, 20, 20, 58, 0, -360};
        REQUIRE(datetime::isoformat(ts) == "2013-11-10T20:20:58-06:00");
    }
    SECTION("Date and time parts") {
        Timestamp ts{2013, 1, 23, 1, 2, 3, 500000};
        REQUIRE(datetime::isodate(ts) == "2013-01-23");
        REQUIRE(datetime::isotime(ts) == "01:02:03.500");
        ts.microsecond = 250;
        REQUIRE(datetime::isotime(ts) == "01:02:03.000250");
        ts.microsecond = 0;
        REQUIRE(datetime::isotime(ts) == "01:02:03");
    }
}

TEST_CASE("ISO parsing") {
    auto ts = datetime::from_iso("2013-11-10T14:20:58Z");
    REQUIRE(ts);
    REQUIRE(ts->hour == 14);
    REQUIRE(ts->utc_offset == 0);

    auto spaced = datetime::from_iso("2013-11-10 14:20");
    REQUIRE(spaced);
    REQUIRE(spaced->minute == 20);
    REQUIRE_FALSE(spaced->aware());

    auto offset = datetime::from_iso("2013-11-10T14:20:58.5+05:30");
    REQUIRE(offset);
    REQUIRE(offset->microsecond == 500000);
    REQUIRE(offset->utc_offset == 330);

    auto date_only = datetime::from_iso("2013-01-23");
    REQUIRE(date_only);
    REQUIRE(date_only->day == 23);

    REQUIRE_FALSE(datetime::from_iso("2013-02-30"));
    REQUIRE_FALSE(datetime::from_iso("not a date"));
    REQUIRE_FALSE(datetime::from_iso_date("2013-11-10T14:20:58"));
    REQUIRE(datetime::from_iso_time("01:02:03")->second == 3);
    REQUIRE_FALSE(datetime::from_iso_time("25:00"));
}

TEST_CASE("RFC 822") {
    Timestamp ts{2013, 11, 10, 7, 23, 45};
    REQUIRE(datetime::rfcformat(ts) == "Sun, 10 Nov 2013 07:23:45 -0000");

    Timestamp aware{2013, 11, 10, 1, 23, 45, 0, -360};
    REQUIRE(datetime::rfcformat(aware) == "Sun, 10 Nov 2013 07:23:45 -0000");

    auto parsed = datetime::from_rfc("Sun, 10 Nov 2013 07:23:45 -0000");
    REQUIRE(parsed);
    REQUIRE(parsed->day == 10);
    REQUIRE(parsed->month == 11);
    REQUIRE(parsed->utc_offset == 0);
    REQUIRE_FALSE(datetime::from_rfc("10 Foo 2013 07:23:45 GMT"));
}

TEST_CASE("strftime style patterns") {
    Timestamp ts{2013, 11, 10, 14, 20, 58};
    REQUIRE(datetime::format(ts, "%Y-%m-%d") == "2013-11-10");
    REQUIRE(datetime::format(ts, "%H:%M") == "14:20");

    auto parsed = datetime::parse("2013-11-10", "%Y-%m-%d");
    REQUIRE(parsed);
    REQUIRE(*parsed == Timestamp{2013, 11, 10});
    REQUIRE_FALSE(datetime::parse("2013-11-10 trailing", "%Y-%m-%d"));
    REQUIRE_FALSE(datetime::parse("yesterday", "%Y-%m-%d"));
}

TEST_CASE("UTC conversion") {
    Timestamp central{2013, 11, 10, 20, 20, 58, 0, -360};
    Timestamp utc = datetime::to_utc(central);
    REQUIRE(utc == Timestamp{2013, 11, 11, 2, 20, 58, 0, 0});

    Timestamp naive{2013, 11, 10, 14, 20, 58};
    REQUIRE(datetime::to_utc(naive).utc_offset == 0);
    REQUIRE(datetime::to_utc(naive).hour == 14);
}

TEST_CASE("Local time uses the TZ environment") {
    setenv("TZ", "UTC", 1);
    tzset();
    Timestamp central{2013, 11, 10, 20, 20, 58, 0, -360};
    REQUIRE(datetime::isoformat(datetime::to_local(central)) == "2013-11-11T02:20:58+00:00");
}

TEST_CASE("Epoch seconds") {
    REQUIRE(datetime::isoformat(datetime::from_epoch_seconds(0)) == "1970-01-01T00:00:00+00:00");
    Timestamp ts{2000, 3, 1, 12, 0, 0, 0, 60};
    REQUIRE(datetime::to_epoch_seconds(ts) == 951908400);
    REQUIRE(datetime::from_epoch_seconds(-1).year == 1969);
}

TEST_CASE("Timestamp validity") {
    REQUIRE(datetime::is_valid(Timestamp{2012, 2, 29}));
    REQUIRE_FALSE(datetime::is_valid(Timestamp{2013, 2, 29}));
    REQUIRE_FALSE(datetime::is_valid(Timestamp{2013, 13, 1}));
    REQUIRE_FALSE(datetime::is_valid(Timestamp{2013, 1, 1, 24}));
}
