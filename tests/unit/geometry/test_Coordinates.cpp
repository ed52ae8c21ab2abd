#include <doctest/doctest.h>
#include "geometry/Coordinates.hpp"

#include <cstdlib>

using namespace GS;

TEST_SUITE("geometry.coordinates") {

TEST_CASE("toUnits and toPixel scale to 1000 units") {
    CHECK(*toUnits(0, 1920) == 0);
    CHECK(*toUnits(960, 1920) == 500);
    CHECK(*toUnits(1920, 1920) == 1000);
    CHECK(*toUnits(37, 1920) == 19); // 19.27 rounds down
    CHECK(*toPixel(500, 1080) == 540);
    CHECK(*toPixel(1000, 1080) == 1080);
}

TEST_CASE("non-positive surface dimension is rejected") {
    auto units = toUnits(10, 0);
    REQUIRE_FALSE(units.has_value());
    CHECK(units.error().code == Error::Code::InvalidArgument);
    CHECK_FALSE(toPixel(10, -4).has_value());
}

TEST_CASE("round trip stays within the rounding slack") {
    for (int dim : {27, 200, 502, 1080, 1920, 3840}) {
        auto slack = roundTripSlack(dim);
        CHECK(slack >= 1);
        for (int pixel = 0; pixel < dim; ++pixel) {
            auto units = toUnits(pixel, dim);
            REQUIRE(units.has_value());
            auto back = toPixel(*units, dim);
            REQUIRE(back.has_value());
            if (std::abs(*back - pixel) > slack) {
                FAIL("pixel " << pixel << " on " << dim << " came back as " << *back);
            }
        }
    }
}

TEST_CASE("roundTripSlack grows with the surface") {
    CHECK(roundTripSlack(200) == 1);
    CHECK(roundTripSlack(1920) == 1);
    CHECK(roundTripSlack(3840) == 2);
}

TEST_CASE("normalizePoint carries the surface identity") {
    SurfaceRef full{fullFrameSurfaceId(), 1920, 1080};
    auto       point = normalizePoint(PixelPoint{960, 540}, full);
    REQUIRE(point.has_value());
    CHECK(point->surface == fullFrameSurfaceId());
    CHECK(point->units == UnitPair{500, 500});

    SUBCASE("points outside the surface are a mismatch") {
        auto outside = normalizePoint(PixelPoint{1920, 10}, full);
        REQUIRE_FALSE(outside.has_value());
        CHECK(outside.error().code == Error::Code::SurfaceMismatch);
    }
    SUBCASE("a surface needs an id") {
        auto anonymous = normalizePoint(PixelPoint{1, 1}, SurfaceRef{SurfaceId{}, 10, 10});
        REQUIRE_FALSE(anonymous.has_value());
        CHECK(anonymous.error().code == Error::Code::InvalidArgument);
    }
}

TEST_CASE("denormalizePoint refuses a point from another surface") {
    SurfaceRef crop{SurfaceId{"desktop"}, 1920, 1032};
    SurfaceRef full{fullFrameSurfaceId(), 1920, 1080};
    auto       point = normalizePoint(PixelPoint{37, 37}, crop);
    REQUIRE(point.has_value());

    auto wrong = denormalizePoint(*point, full);
    REQUIRE_FALSE(wrong.has_value());
    CHECK(wrong.error().code == Error::Code::SurfaceMismatch);

    auto right = denormalizePoint(*point, crop);
    REQUIRE(right.has_value());
    CHECK(std::abs(right->x - 37) <= roundTripSlack(crop.width));
    CHECK(std::abs(right->y - 37) <= roundTripSlack(crop.height));
}

TEST_CASE("normalizeExtent scales half sizes per axis") {
    SurfaceRef full{fullFrameSurfaceId(), 1920, 1080};
    auto       extent = normalizeExtent(PixelSize{27, 27}, full);
    REQUIRE(extent.has_value());
    CHECK(extent->x == 14);
    CHECK(extent->y == 25);
    CHECK_FALSE(normalizeExtent(PixelSize{-1, 3}, full).has_value());
}

TEST_CASE("inUnitRange accepts the closed interval") {
    CHECK(inUnitRange(UnitPair{0, 1000}));
    CHECK_FALSE(inUnitRange(UnitPair{-1, 10}));
    CHECK_FALSE(inUnitRange(UnitPair{10, 1001}));
}

} // TEST_SUITE
