// sonance_math type tests

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <sonance/math/types.hpp>

#include <glm/gtc/constants.hpp>

#include <cmath>
#include <limits>

using namespace sonance_math;
using Catch::Matchers::WithinAbs;

TEST_CASE("Vec3 finiteness", "[math][vec3]") {
    REQUIRE(is_finite(Vec3(1.0f, -2.0f, 3.0f)));
    REQUIRE(is_finite(vec3::ZERO));
    REQUIRE_FALSE(is_finite(Vec3(std::nanf(""), 0.0f, 0.0f)));
    REQUIRE_FALSE(is_finite(Vec3(0.0f, std::numeric_limits<float>::infinity(), 0.0f)));
}

TEST_CASE("Rotation axes", "[math][quat]") {
    SECTION("identity") {
        Quat identity(1.0f, 0.0f, 0.0f, 0.0f);
        REQUIRE(forward_of(identity) == vec3::FORWARD);
        REQUIRE(up_of(identity) == vec3::UP);
    }

    SECTION("pitch up") {
        Quat pitch = glm::angleAxis(glm::half_pi<float>(), Vec3(1.0f, 0.0f, 0.0f));
        Vec3 forward = forward_of(pitch);
        Vec3 up = up_of(pitch);
        REQUIRE_THAT(forward.y, WithinAbs(1.0f, 1e-5f));
        REQUIRE_THAT(forward.z, WithinAbs(0.0f, 1e-5f));
        REQUIRE_THAT(up.z, WithinAbs(1.0f, 1e-5f));
    }
}
