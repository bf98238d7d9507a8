#include <gtest/gtest.h>
#include "gravbody/models/newton.hpp"
#include "gravbody/errors.hpp"

#include <algorithm>
#include <cmath>
#include <string>
#include <utility>
#include <vector>

using namespace gravbody;

namespace {

BodyDescriptor body(const std::string& name, double mass, std::vector<double> r, std::vector<double> v) {
    BodyDescriptor b;
    b.name = name;
    b.mass = mass;
    b.position = std::move(r);
    b.velocity = std::move(v);
    return b;
}

double relErr(double got, double want) {
    const double scale = std::max(std::abs(want), 1e-300);
    return std::abs(got - want) / scale;
}

} // namespace

TEST(NewtonGravityTest, TwoBodyReduction) {
    const double G = 6.67428e-11;
    const double m1 = 3.0e9, m2 = 7.0e8;
    BodyRegistry reg({
        body("one", m1, {0.0, 0.0, 0.0}, {0.0, 0.0, 0.0}),
        body("two", m2, {1.0, 0.0, 0.0}, {0.0, 0.0, 0.0}),
    });
    NewtonGravity model(reg, G);

    // estado não trivial, diferente do inicial
    const std::vector<double> r1 = {0.3, -1.2, 0.7};
    const std::vector<double> r2 = {-0.4, 0.9, 2.1};
    const std::vector<double> v1 = {0.01, 0.02, -0.03};
    const std::vector<double> v2 = {-0.05, 0.04, 0.06};
    std::vector<double> s;
    for (auto* part : {&r1, &r2, &v1, &v2}) s.insert(s.end(), part->begin(), part->end());

    const auto ds = model.derivative(s, 0.0);
    ASSERT_EQ(ds.size(), 12u);

    double d2 = 0.0;
    for (int k = 0; k < 3; ++k) d2 += (r2[k] - r1[k]) * (r2[k] - r1[k]);
    const double d3 = std::pow(std::sqrt(d2), 3);

    for (int k = 0; k < 3; ++k) {
        EXPECT_DOUBLE_EQ(ds[k], v1[k]);
        EXPECT_DOUBLE_EQ(ds[3 + k], v2[k]);

        const double a1 = G * m2 * (r2[k] - r1[k]) / d3;
        const double a2 = G * m1 * (r1[k] - r2[k]) / d3;
        EXPECT_LT(relErr(ds[6 + k], a1), 1e-12);
        EXPECT_LT(relErr(ds[9 + k], a2), 1e-12);
    }
}

TEST(NewtonGravityTest, ThreeBodySumsPairwiseTerms) {
    const double G = 1.0;
    const std::vector<double> m = {1.0, 2.0, 3.0};
    const std::vector<std::vector<double>> r = {{0.0, 0.0}, {1.0, 0.5}, {-0.7, 1.3}};
    BodyRegistry reg({
        body("a", m[0], r[0], {0.0, 0.0}),
        body("b", m[1], r[1], {0.0, 0.0}),
        body("c", m[2], r[2], {0.0, 0.0}),
    });
    NewtonGravity model(reg, G);
    const auto ds = model.derivative(reg.encode_initial_state(), 0.0);

    for (int i = 0; i < 3; ++i) {
        double ax = 0.0, ay = 0.0;
        for (int j = 0; j < 3; ++j) {
            if (i == j) continue;
            const double dx = r[j][0] - r[i][0];
            const double dy = r[j][1] - r[i][1];
            const double d = std::sqrt(dx * dx + dy * dy);
            ax += G * m[j] * dx / (d * d * d);
            ay += G * m[j] * dy / (d * d * d);
        }
        EXPECT_NEAR(ds[6 + 2 * i + 0], ax, 1e-12);
        EXPECT_NEAR(ds[6 + 2 * i + 1], ay, 1e-12);
    }
}

TEST(NewtonGravityTest, InternalForcesCancel) {
    BodyRegistry reg({
        body("a", 5.0, {0.1, 0.0, 0.4}, {0.0, 0.0, 0.0}),
        body("b", 1.5, {0.2, 0.1, 0.0}, {0.0, 0.0, 0.0}),
        body("c", 9.0, {-0.1, 0.0, -0.1}, {0.0, 0.0, 0.0}),
    });
    NewtonGravity model(reg, 1.0);
    const auto ds = model.derivative(reg.encode_initial_state(), 0.0);
    const auto masses = reg.masses();

    for (int k = 0; k < 3; ++k) {
        double f = 0.0;
        for (int i = 0; i < 3; ++i) f += masses[i] * ds[9 + 3 * i + k];
        EXPECT_NEAR(f, 0.0, 1e-10);
    }
}

TEST(NewtonGravityTest, SofteningLimitsAcceleration) {
    BodyRegistry reg({
        body("a", 1.0, {0.0, 0.0}, {0.0, 0.0}),
        body("b", 1.0, {0.1, 0.0}, {0.0, 0.0}),
    });
    const double eps = 0.2;
    NewtonGravity hard(reg, 1.0);
    NewtonGravity soft(reg, 1.0, eps);

    const auto s = reg.encode_initial_state();
    const double a_hard = hard.derivative(s, 0.0)[4];
    const double a_soft = soft.derivative(s, 0.0)[4];

    EXPECT_NEAR(a_hard, 1.0 / (0.1 * 0.1), 1e-9);
    EXPECT_NEAR(a_soft, 0.1 / std::pow(0.1 * 0.1 + eps * eps, 1.5), 1e-9);
    EXPECT_LT(a_soft, a_hard);
    EXPECT_DOUBLE_EQ(soft.softening(), eps);
}

TEST(NewtonGravityTest, CoincidentBodiesPropagateNonFinite) {
    BodyRegistry reg({
        body("a", 1.0, {0.0, 0.0}, {0.0, 0.0}),
        body("b", 1.0, {0.0, 0.0}, {0.0, 0.0}),
    });
    NewtonGravity model(reg, 1.0);
    const auto ds = model.derivative(reg.encode_initial_state(), 0.0);
    EXPECT_FALSE(std::isfinite(ds[4]));
}

TEST(NewtonGravityTest, RejectsBadParameters) {
    BodyRegistry reg({
        body("a", 1.0, {0.0, 0.0}, {0.0, 0.0}),
        body("b", 1.0, {1.0, 0.0}, {0.0, 0.0}),
    });
    EXPECT_THROW(NewtonGravity(reg, 0.0), ValidationError);
    EXPECT_THROW(NewtonGravity(reg, -1.0), ValidationError);
    EXPECT_THROW(NewtonGravity(reg, 1.0, -0.1), ValidationError);

    NewtonGravity model(reg, 1.0);
    EXPECT_THROW(model.derivative(std::vector<double>(6, 0.0), 0.0), ShapeError);
}

TEST(NewtonGravityTest, JacobianMatchesFiniteDifferences) {
    BodyRegistry reg({
        body("a", 1.0, {0.1, 0.0, 0.4}, {0.02, -0.02, 0.08}),
        body("b", 0.6, {0.2, 0.1, 0.0}, {0.1, 0.1, -0.02}),
        body("c", 1.0, {-0.1, 0.0, -0.1}, {-0.04, -0.175, -0.01}),
    });
    NewtonGravity model(reg, 1.0);
    const std::vector<double> y = reg.encode_initial_state();
    const std::size_t n = y.size();

    Eigen::MatrixXd J;
    model.jacobian(y.data(), J);
    ASSERT_EQ(J.rows(), static_cast<Eigen::Index>(n));
    ASSERT_EQ(J.cols(), static_cast<Eigen::Index>(n));

    const double h = 1e-6;
    for (std::size_t j = 0; j < n; ++j) {
        std::vector<double> yp = y, ym = y;
        yp[j] += h;
        ym[j] -= h;
        const auto fp = model.derivative(yp, 0.0);
        const auto fm = model.derivative(ym, 0.0);
        for (std::size_t i = 0; i < n; ++i) {
            const double fd = (fp[i] - fm[i]) / (2.0 * h);
            EXPECT_NEAR(J(static_cast<Eigen::Index>(i), static_cast<Eigen::Index>(j)), fd,
                        1e-4 * std::max(1.0, std::abs(fd)));
        }
    }
}
