#include <gtest/gtest.h>
#include "gravbody/api.hpp"
#include "gravbody/diagnostics.hpp"
#include "gravbody/errors.hpp"
#include "gravbody/registry.hpp"
#include "gravbody/scenarios.hpp"

#include <cmath>
#include <limits>
#include <string>
#include <utility>
#include <vector>

using namespace gravbody;

class IntegratorTest : public ::testing::Test {
protected:
    static BodyDescriptor body(const std::string& name, double mass,
                               std::vector<double> r, std::vector<double> v) {
        BodyDescriptor b;
        b.name = name;
        b.mass = mass;
        b.position = std::move(r);
        b.velocity = std::move(v);
        return b;
    }

    // par em órbita circular: G = 1, massas 1, separação 1
    static BodyRegistry circularPair() {
        const double v = std::sqrt(2.0) / 2.0;
        return BodyRegistry({
            body("left", 1.0, {-0.5, 0.0}, {0.0, -v}),
            body("right", 1.0, {0.5, 0.0}, {0.0, v}),
        });
    }

    // dois corpos parados a distância 1, caem um no outro em t ~ 1.1107
    static BodyRegistry headOn() {
        return BodyRegistry({
            body("p", 0.5, {-0.5, 0.0}, {0.0, 0.0}),
            body("q", 0.5, {0.5, 0.0}, {0.0, 0.0}),
        });
    }

    static SimulationCfg sim(double G, double span, int n) {
        SimulationCfg s;
        s.G = G;
        s.time_span = span;
        s.n_samples = n;
        return s;
    }
};

TEST_F(IntegratorTest, PlanarPairInSiUnits) {
    BodyRegistry reg({
        body("A", 1e10, {-0.5, 0.0}, {0.02, 0.1}),
        body("B", 1e6, {0.5, 0.0}, {-0.08, -0.06}),
    });

    const Trajectory traj = integrate(reg, kGravitationalConstant, 36.0, 100);

    ASSERT_EQ(traj.status, SolveStatus::SUCCESS) << traj.message;
    ASSERT_EQ(traj.t.size(), 100u);
    ASSERT_EQ(traj.states.size(), 100u);
    EXPECT_EQ(traj.names, (std::vector<std::string>{"A", "B"}));
    EXPECT_EQ(traj.dim, 2);

    EXPECT_DOUBLE_EQ(traj.t.front(), 0.0);
    EXPECT_EQ(traj.t.back(), 36.0);
    for (std::size_t k = 1; k < traj.t.size(); ++k) EXPECT_GT(traj.t[k], traj.t[k - 1]);

    EXPECT_EQ(traj.states[0][0].position, (std::vector<double>{-0.5, 0.0}));
    EXPECT_EQ(traj.states[0][1].velocity, (std::vector<double>{-0.08, -0.06}));

    const Diagnostics d = compute_diagnostics(traj, reg.masses(), kGravitationalConstant);
    EXPECT_LT(max_relative_drift(d.energy), 1e-2);
}

TEST_F(IntegratorTest, CircularOrbitReturnsAfterOnePeriod) {
    const BodyRegistry reg = circularPair();
    const double period = 2.0 * std::acos(-1.0) / std::sqrt(2.0);

    const Trajectory traj = integrate(reg, sim(1.0, period, 101));
    ASSERT_EQ(traj.status, SolveStatus::SUCCESS) << traj.message;

    const Diagnostics d = compute_diagnostics(traj, reg.masses(), 1.0);
    EXPECT_LT(max_relative_drift(d.energy), 1e-2);
    EXPECT_NEAR(d.energy.front(), -0.5, 1e-12);

    // separação constante ao longo da órbita
    for (const auto& row : traj.states) {
        const double dx = row[1].position[0] - row[0].position[0];
        const double dy = row[1].position[1] - row[0].position[1];
        EXPECT_NEAR(std::sqrt(dx * dx + dy * dy), 1.0, 1e-5);
    }

    const auto& last = traj.states.back();
    EXPECT_NEAR(last[0].position[0], -0.5, 1e-5);
    EXPECT_NEAR(last[0].position[1], 0.0, 1e-5);
    EXPECT_NEAR(last[1].position[0], 0.5, 1e-5);
    EXPECT_NEAR(last[1].position[1], 0.0, 1e-5);
}

TEST_F(IntegratorTest, TwoBodyMomentumIsConserved) {
    const Scenario sc = make_scenario("two_body_xy");
    const BodyRegistry reg(sc.bodies);

    const Trajectory traj = integrate(reg, sc.sim);
    ASSERT_EQ(traj.status, SolveStatus::SUCCESS) << traj.message;

    const Diagnostics d = compute_diagnostics(traj, reg.masses(), sc.sim.G);
    const auto& p0 = d.momentum.front();
    const double scale = std::sqrt(p0[0] * p0[0] + p0[1] * p0[1]);
    EXPECT_LT(max_abs_drift(d.momentum), 1e-8 * scale);
}

TEST_F(IntegratorTest, ThreeBodyMomentumIsConserved) {
    Scenario sc = make_scenario("three_body_xyz");
    sc.sim.time_span = 20.0;
    sc.sim.n_samples = 50;
    const BodyRegistry reg(sc.bodies);

    const Trajectory traj = integrate(reg, sc.sim);
    ASSERT_EQ(traj.status, SolveStatus::SUCCESS) << traj.message;
    EXPECT_EQ(traj.dim, 3);

    const Diagnostics d = compute_diagnostics(traj, reg.masses(), sc.sim.G);
    const auto& p0 = d.momentum.front();
    const double scale = std::sqrt(p0[0] * p0[0] + p0[1] * p0[1] + p0[2] * p0[2]);
    EXPECT_LT(max_abs_drift(d.momentum), 1e-8 * scale);
}

TEST_F(IntegratorTest, SameInputGivesSameTrajectory) {
    const BodyRegistry reg = circularPair();
    const Trajectory a = integrate(reg, sim(1.0, 3.0, 31));
    const Trajectory b = integrate(reg, sim(1.0, 3.0, 31));

    ASSERT_EQ(a.t, b.t);
    ASSERT_EQ(a.states.size(), b.states.size());
    for (std::size_t k = 0; k < a.states.size(); ++k) {
        for (std::size_t i = 0; i < a.states[k].size(); ++i) {
            EXPECT_EQ(a.states[k][i].position, b.states[k][i].position);
            EXPECT_EQ(a.states[k][i].velocity, b.states[k][i].velocity);
        }
    }
    EXPECT_EQ(a.stats.n_rhs, b.stats.n_rhs);
}

TEST_F(IntegratorTest, RegistryIsNotModified) {
    const BodyRegistry reg = circularPair();
    const auto before = reg.encode_initial_state();
    const Trajectory traj = integrate(reg, sim(1.0, 2.0, 11));
    ASSERT_EQ(traj.status, SolveStatus::SUCCESS);
    EXPECT_EQ(reg.encode_initial_state(), before);
}

TEST_F(IntegratorTest, RejectsInvalidParameters) {
    const BodyRegistry reg = circularPair();
    EXPECT_THROW(integrate(reg, sim(0.0, 1.0, 10)), ValidationError);
    EXPECT_THROW(integrate(reg, sim(-1.0, 1.0, 10)), ValidationError);
    EXPECT_THROW(integrate(reg, sim(1.0, 0.0, 10)), ValidationError);
    EXPECT_THROW(integrate(reg, sim(1.0, -3.0, 10)), ValidationError);
    EXPECT_THROW(integrate(reg, sim(1.0, std::numeric_limits<double>::infinity(), 10)), ValidationError);
    EXPECT_THROW(integrate(reg, sim(1.0, 1.0, 1)), ValidationError);

    SimulationCfg soft = sim(1.0, 1.0, 10);
    soft.softening = -0.5;
    EXPECT_THROW(integrate(reg, soft), ValidationError);
}

TEST_F(IntegratorTest, CoincidentBodiesEndWithNonFinite) {
    BodyRegistry reg({
        body("a", 1.0, {0.0, 0.0, 0.0}, {0.0, 0.0, 0.0}),
        body("b", 1.0, {0.0, 0.0, 0.0}, {1.0, 0.0, 0.0}),
    });
    const Trajectory traj = integrate(reg, sim(1.0, 1.0, 5));

    EXPECT_EQ(traj.status, SolveStatus::NON_FINITE);
    EXPECT_EQ(traj.t.size(), 1u);
    EXPECT_EQ(traj.states.size(), 1u);
    EXPECT_THROW(require_complete(traj), IntegrationError);
}

TEST_F(IntegratorTest, HeadOnCollisionTruncates) {
    const Trajectory traj = integrate(headOn(), sim(1.0, 2.0, 21));

    EXPECT_NE(traj.status, SolveStatus::SUCCESS);
    EXPECT_FALSE(traj.message.empty());
    EXPECT_GE(traj.t.size(), 11u);
    EXPECT_LT(traj.t.size(), 21u);
    EXPECT_EQ(traj.states.size(), traj.t.size());
    EXPECT_THROW(require_complete(traj), IntegrationError);
}

TEST_F(IntegratorTest, SofteningLetsHeadOnCollisionPass) {
    SimulationCfg s = sim(1.0, 2.0, 21);
    s.softening = 0.1;
    const Trajectory traj = integrate(headOn(), s);

    ASSERT_EQ(traj.status, SolveStatus::SUCCESS) << traj.message;
    EXPECT_EQ(traj.t.size(), 21u);
    EXPECT_NO_THROW(require_complete(traj));
}

TEST_F(IntegratorTest, FindBodyByName) {
    const BodyRegistry reg = circularPair();
    const Trajectory traj = integrate(reg, sim(1.0, 1.0, 3));
    EXPECT_EQ(find_body(traj, "left"), 0u);
    EXPECT_EQ(find_body(traj, "right"), 1u);
    EXPECT_THROW(find_body(traj, "nobody"), ValidationError);
}

TEST(SampleTimesTest, EvenlySpacedAndEndsExactly) {
    const auto t = sample_times(36.0, 404);
    ASSERT_EQ(t.size(), 404u);
    EXPECT_EQ(t.front(), 0.0);
    EXPECT_EQ(t.back(), 36.0);
    EXPECT_NEAR(t[1] - t[0], 36.0 / 403.0, 1e-15);
    EXPECT_THROW(sample_times(1.0, 1), ValidationError);
}

TEST(SolveStatusTest, ToStringNamesEveryStatus) {
    EXPECT_STREQ(to_string(SolveStatus::SUCCESS), "SUCCESS");
    EXPECT_STREQ(to_string(SolveStatus::NON_FINITE), "NON_FINITE");
    EXPECT_STREQ(to_string(SolveStatus::STEP_TOO_SMALL), "STEP_TOO_SMALL");
    EXPECT_STREQ(to_string(SolveStatus::TOO_MANY_STEPS), "TOO_MANY_STEPS");
}
