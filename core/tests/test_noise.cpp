#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include "stochsim/v1/noise.hpp"

#include <cmath>
#include <stdexcept>

using namespace stochsim::v1;
using Catch::Approx;

namespace {

NoiseShape wiener(Index dimension) {
    NoiseShape shape;
    shape.process = NoiseProcess::Wiener;
    shape.dimension = dimension;
    return shape;
}

NoiseIncrement increment(Real t, Real dt, Real value, Index dimension = 1) {
    NoiseIncrement inc;
    inc.t = t;
    inc.dt = dt;
    inc.dW = Vector::Constant(dimension, value);
    return inc;
}

}  // namespace

TEST_CASE("Noise source is reproducible per seed", "[v1][noise]") {
    NoiseSource a(wiener(3), 42);
    NoiseSource b(wiener(3), 42);
    NoiseSource c(wiener(3), 43);

    const NoiseIncrement da = a.draw_wiener(0.0, 0.01, true);
    const NoiseIncrement db = b.draw_wiener(0.0, 0.01, true);
    const NoiseIncrement dc = c.draw_wiener(0.0, 0.01, true);

    CHECK(da.dW == db.dW);
    CHECK(da.dZ == db.dZ);
    CHECK(da.dW != dc.dW);
    CHECK(a.draws() == 1);

    a.reseed(42);
    CHECK(a.draw_wiener(0.0, 0.01, true).dW == da.dW);
}

TEST_CASE("Noise source seed zero selects the default seed", "[v1][noise]") {
    NoiseSource a(wiener(1), 0);
    NoiseSource b(wiener(1), NoiseSource::default_seed);
    CHECK(a.seed() == NoiseSource::default_seed);
    CHECK(a.draw_wiener(0.0, 1.0, false).dW == b.draw_wiener(0.0, 1.0, false).dW);
}

TEST_CASE("Wiener increments have variance dt", "[v1][noise]") {
    NoiseSource source(wiener(1), 7);
    const Real dt = 0.04;
    const int n = 20000;

    Real sum = 0.0;
    Real sum_sq = 0.0;
    Real sum_z_sq = 0.0;
    Real cross = 0.0;
    for (int i = 0; i < n; ++i) {
        const NoiseIncrement inc = source.draw_wiener(0.0, dt, true);
        REQUIRE(inc.has_auxiliary());
        sum += inc.dW[0];
        sum_sq += inc.dW[0] * inc.dW[0];
        sum_z_sq += inc.dZ[0] * inc.dZ[0];
        cross += inc.dW[0] * inc.dZ[0];
    }

    CHECK(std::abs(sum / n) < 5.0 * std::sqrt(dt / n));
    CHECK(sum_sq / n == Approx(dt).epsilon(0.05));
    CHECK(sum_z_sq / n == Approx(dt).epsilon(0.05));
    CHECK(std::abs(cross / n) < 0.05 * dt);
}

TEST_CASE("Wiener increment without auxiliary leaves dZ empty", "[v1][noise]") {
    NoiseSource source(wiener(2), 1);
    const NoiseIncrement inc = source.draw_wiener(0.5, 0.1, false);
    CHECK(inc.dW.size() == 2);
    CHECK_FALSE(inc.has_auxiliary());
    CHECK(inc.t == 0.5);
    CHECK(inc.dt == 0.1);
}

TEST_CASE("Jump counts follow the rates", "[v1][noise][jumps]") {
    NoiseShape shape;
    shape.process = NoiseProcess::Poisson;
    shape.dimension = 3;
    NoiseSource source(shape, 11);

    Vector rates(3);
    rates << 0.0, -2.0, 50.0;

    Real total = 0.0;
    const int n = 2000;
    for (int i = 0; i < n; ++i) {
        const NoiseIncrement inc = source.draw_jump_counts(0.0, 0.1, rates);
        CHECK(inc.dW[0] == 0.0);
        CHECK(inc.dW[1] == 0.0);
        CHECK(inc.dW[2] >= 0.0);
        CHECK(inc.dW[2] == std::floor(inc.dW[2]));
        total += inc.dW[2];
    }
    CHECK(total / n == Approx(5.0).epsilon(0.05));

    CHECK_THROWS_AS(source.draw_jump_counts(0.0, 0.1, Vector::Ones(2)), std::invalid_argument);
}

TEST_CASE("Noise buffer commits accepted increments", "[v1][noise][buffer]") {
    NoiseBuffer buffer(wiener(1));

    buffer.stage(increment(0.0, 0.1, 0.3));
    CHECK(buffer.has_speculative());
    CHECK(buffer.size() == 0);
    CHECK(buffer.W()[0] == 0.0);

    buffer.commit();
    buffer.stage(increment(0.1, 0.1, -0.1));
    buffer.commit();

    CHECK(buffer.size() == 2);
    CHECK(buffer.accepted_count() == 2);
    CHECK(buffer.W()[0] == Approx(0.2));
    CHECK(buffer.cumulative(1)[0] == Approx(0.3));
    CHECK(buffer.cumulative(2)[0] == Approx(buffer.W()[0]));
    CHECK(buffer[1].t == 0.1);
}

TEST_CASE("Noise buffer discards rejected increments", "[v1][noise][buffer]") {
    NoiseBuffer buffer(wiener(1));

    buffer.stage(increment(0.0, 0.1, 1.0));
    buffer.commit();

    // Rejected attempt leaves no trace in W or the records
    buffer.stage(increment(0.1, 0.2, 5.0));
    buffer.discard_speculative();
    CHECK_FALSE(buffer.has_speculative());
    CHECK(buffer.discarded_count() == 1);

    buffer.stage(increment(0.1, 0.05, -0.5));
    buffer.commit();

    CHECK(buffer.size() == 2);
    CHECK(buffer.W()[0] == Approx(0.5));
    CHECK(buffer[1].dt == 0.05);
    CHECK(buffer.max_size() == 2);
}

TEST_CASE("Noise buffer without retention keeps only W", "[v1][noise][buffer]") {
    NoiseBuffer buffer(wiener(2), false);
    CHECK_FALSE(buffer.retains_records());

    for (int i = 0; i < 100; ++i) {
        buffer.stage(increment(0.01 * i, 0.01, 0.1, 2));
        buffer.commit();
    }

    CHECK(buffer.size() == 0);
    CHECK(buffer.accepted_count() == 100);
    CHECK(buffer.max_size() == 1);
    CHECK(buffer.W()[0] == Approx(10.0));
    CHECK(buffer.W()[1] == Approx(10.0));

    buffer.clear();
    CHECK(buffer.W().isZero());
    CHECK(buffer.accepted_count() == 0);
}
