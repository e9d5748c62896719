#include <doctest/doctest.h>

#include "fake_engine.hpp"
#include "geofix/geofix.hpp"

namespace {
    geofix::GeometryPtr parsed(const geofix::test::FakeEngine &engine, const char *text) {
        return engine.parse(boost::json::parse(text).as_object());
    }
} // namespace

TEST_CASE("Repair - Valid geometry takes the fast path") {
    geofix::test::FakeEngine engine;
    auto result = geofix::RepairValidity(engine, parsed(engine, R"({"type": "Point", "coordinates": [1, 2]})"));

    CHECK(result.status == geofix::RepairStatus::AlreadyValid);
    REQUIRE(result.geometry);
    CHECK(engine.buffer_calls == 0);
    CHECK_FALSE(engine.to_geojson(*result.geometry).contains("buffered"));
}

TEST_CASE("Repair - Invalid geometry is buffered") {
    geofix::test::FakeEngine engine;
    auto result = geofix::RepairValidity(
        engine, parsed(engine, R"({"type": "Polygon", "invalid": true, "coordinates": [[[0, 0], [2, 2], [2, 0], [0, 2], [0, 0]]]})"));

    CHECK(result.status == geofix::RepairStatus::Buffered);
    REQUIRE(result.geometry);
    CHECK(engine.buffer_calls == 1);
    CHECK(engine.is_valid(*result.geometry));
}

TEST_CASE("Repair - Unrepairable geometry") {
    geofix::test::FakeEngine engine;

    SUBCASE("Buffer raises a topology error") {
        auto result = geofix::RepairValidity(
            engine, parsed(engine, R"({"type": "Polygon", "invalid": true, "buffer": "throws", "coordinates": [[[0, 0]]]})"));
        CHECK(result.status == geofix::RepairStatus::Unrepairable);
        CHECK_FALSE(result.geometry);
    }

    SUBCASE("Buffer result is still invalid") {
        auto result = geofix::RepairValidity(
            engine, parsed(engine, R"({"type": "Polygon", "invalid": true, "buffer": "invalid", "coordinates": [[[0, 0]]]})"));
        CHECK(result.status == geofix::RepairStatus::Unrepairable);
        CHECK_FALSE(result.geometry);
        CHECK(engine.buffer_calls == 1);
    }

    SUBCASE("Validity check raises") {
        auto result = geofix::RepairValidity(
            engine, parsed(engine, R"({"type": "Polygon", "validity": "throws", "coordinates": [[[0, 0]]]})"));
        CHECK(result.status == geofix::RepairStatus::Unrepairable);
        CHECK(engine.buffer_calls == 0);
    }

    SUBCASE("Null geometry") {
        auto result = geofix::RepairValidity(engine, nullptr);
        CHECK(result.status == geofix::RepairStatus::Unrepairable);
        CHECK(engine.valid_calls == 0);
    }
}

TEST_CASE("Repair - Empty geometry is not kept") {
    geofix::test::FakeEngine engine;

    SUBCASE("Valid but empty") {
        auto result = geofix::RepairValidity(engine, parsed(engine, R"({"type": "Point", "coordinates": []})"));
        CHECK(result.status == geofix::RepairStatus::Unrepairable);
        CHECK_FALSE(result.geometry);
        CHECK(engine.buffer_calls == 0);
    }

    SUBCASE("Buffer collapses to empty") {
        auto result = geofix::RepairValidity(
            engine, parsed(engine, R"({"type": "Polygon", "invalid": true, "buffer": "empty", "coordinates": [[[0, 0]]]})"));
        CHECK(result.status == geofix::RepairStatus::Unrepairable);
        CHECK_FALSE(result.geometry);
        CHECK(engine.buffer_calls == 1);
    }
}
