#include "doctest/doctest.h"
#include "claimtrax/area.hpp"

#include <algorithm>

using namespace claimtrax;

namespace {
    const Coordinate origin = utils::make_coordinate(52.0, 5.0);

    Coordinate at(double east_m, double north_m) {
        double lat = origin.latitude + utils::to_degrees(north_m / utils::EARTH_RADIUS_M);
        double lon = origin.longitude +
                     utils::to_degrees(east_m / (utils::EARTH_RADIUS_M * std::cos(utils::to_radians(origin.latitude))));
        return utils::make_coordinate(lat, lon);
    }
} // namespace

TEST_CASE("Spherical area of small polygons") {
    SUBCASE("100 m square") {
        Path square{at(0, 0), at(100, 0), at(100, 100), at(0, 100)};
        CHECK(spherical_area(square) == doctest::Approx(10000.0).epsilon(0.005));
    }

    SUBCASE("Right triangle") {
        Path triangle{at(0, 0), at(80, 0), at(0, 60)};
        CHECK(spherical_area(triangle) == doctest::Approx(2400.0).epsilon(0.005));
    }

    SUBCASE("Closing vertex repeated does not change the area") {
        Path open{at(0, 0), at(100, 0), at(100, 50), at(0, 50)};
        Path closed = open;
        closed.push_back(open.front());
        CHECK(spherical_area(closed) == doctest::Approx(spherical_area(open)));
    }
}

TEST_CASE("Spherical area is independent of winding and start vertex") {
    Path path{at(0, 0), at(70, -10), at(120, 40), at(60, 90), at(-10, 50)};
    double area = spherical_area(path);
    CHECK(area > 0.0);

    Path reversed(path.rbegin(), path.rend());
    CHECK(spherical_area(reversed) == doctest::Approx(area));

    Path rotated = path;
    std::rotate(rotated.begin(), rotated.begin() + 2, rotated.end());
    CHECK(spherical_area(rotated) == doctest::Approx(area));
}

TEST_CASE("Spherical area of degenerate input") {
    CHECK(spherical_area(Path{}) == 0.0);
    CHECK(spherical_area(Path{origin}) == 0.0);
    CHECK(spherical_area(Path{origin, at(10, 10)}) == 0.0);
    CHECK(spherical_area(Path{at(0, 0), at(50, 0), at(100, 0)}) == doctest::Approx(0.0));
}
