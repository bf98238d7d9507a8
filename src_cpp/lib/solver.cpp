// src_cpp/lib/solver.cpp
#include "gravbody/solver.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <sstream>

#include "gravbody/errors.hpp"

namespace gravbody {

// ---------- Dormand-Prince 5(4): tableau + saída densa (Hairer, dopri5) ----------
namespace dp {
constexpr double c2 = 1.0 / 5.0, c3 = 3.0 / 10.0, c4 = 4.0 / 5.0, c5 = 8.0 / 9.0;

constexpr double a21 = 1.0 / 5.0;
constexpr double a31 = 3.0 / 40.0, a32 = 9.0 / 40.0;
constexpr double a41 = 44.0 / 45.0, a42 = -56.0 / 15.0, a43 = 32.0 / 9.0;
constexpr double a51 = 19372.0 / 6561.0, a52 = -25360.0 / 2187.0, a53 = 64448.0 / 6561.0,
                 a54 = -212.0 / 729.0;
constexpr double a61 = 9017.0 / 3168.0, a62 = -355.0 / 33.0, a63 = 46732.0 / 5247.0,
                 a64 = 49.0 / 176.0, a65 = -5103.0 / 18656.0;
constexpr double a71 = 35.0 / 384.0, a73 = 500.0 / 1113.0, a74 = 125.0 / 192.0,
                 a75 = -2187.0 / 6784.0, a76 = 11.0 / 84.0;

// erro = y5 - y4
constexpr double e1 = 71.0 / 57600.0, e3 = -71.0 / 16695.0, e4 = 71.0 / 1920.0,
                 e5 = -17253.0 / 339200.0, e6 = 22.0 / 525.0, e7 = -1.0 / 40.0;

constexpr double d1 = -12715105075.0 / 11282082432.0, d3 = 87487479700.0 / 32700410799.0,
                 d4 = -10690763975.0 / 1880347072.0, d5 = 701980252875.0 / 199316789632.0,
                 d6 = -1453857185.0 / 822651844.0, d7 = 69997945.0 / 29380423.0;
} // namespace dp

// ---------- Rosenbrock 2(3) modificado (Shampine & Reichelt) ----------
namespace ros {
const double d = 1.0 / (2.0 + std::sqrt(2.0));
const double e32 = 6.0 + std::sqrt(2.0);
} // namespace ros

// h*|lambda| acima disso por 15 passos => stiff (limite de estabilidade do DP5 no eixo real)
constexpr double kStiffBound = 3.25;
constexpr int kStiffHits = 15;
constexpr int kNonStiffHits = 6;

// Interpolante de um passo aceito
struct DenseStep {
    bool stiff = false;
    double t_old = 0.0;
    double h = 0.0;
    Eigen::VectorXd c0, c1, c2, c3, c4;

    Eigen::VectorXd eval(double tt) const {
        const double s = (tt - t_old) / h;
        if (stiff) {
            // y + h*( s(1-s)/(1-2d) k1 + s(s-2d)/(1-2d) k2 )
            const double den = 1.0 - 2.0 * ros::d;
            return c0 + h * ((s * (1.0 - s) / den) * c1 + (s * (s - 2.0 * ros::d) / den) * c2);
        }
        const double s1 = 1.0 - s;
        return c0 + s * (c1 + s1 * (c2 + s * (c3 + s1 * c4)));
    }
};

struct StepResult {
    bool finite = true;
    double err = 0.0;          // norma RMS ponderada; aceita se <= 1
    double hlamb = 0.0;        // estimativa h*|lambda| (detecção de stiffness)
    Eigen::VectorXd y_new;
    Eigen::VectorXd f_new;     // f(t+h, y_new), reaproveitado no passo seguinte
    Eigen::MatrixXd J;         // só no passo stiff
};

static inline bool all_finite(const Eigen::VectorXd& v) {
    return v.allFinite();
}

static inline double weighted_rms(const Eigen::VectorXd& e, const Eigen::VectorXd& y,
                                  const Eigen::VectorXd& y_new, const SolverCfg& cfg) {
    const Eigen::Index n = e.size();
    if (n == 0) return 0.0;
    double acc = 0.0;
    for (Eigen::Index i = 0; i < n; ++i) {
        const double sk = cfg.atol + cfg.rtol * std::max(std::abs(y[i]), std::abs(y_new[i]));
        const double q = e[i] / sk;
        acc += q * q;
    }
    return std::sqrt(acc / static_cast<double>(n));
}

static inline void eval_rhs(const OdeSystem& sys, double t, const Eigen::VectorXd& y,
                            Eigen::VectorXd& out, SolverStats& stats) {
    out.resize(y.size());
    sys.rhs(t, y, out);
    ++stats.n_rhs;
}

// Passo inicial (Hairer, hinit)
static double initial_step(const OdeSystem& sys, double t0, const Eigen::VectorXd& y0,
                           const Eigen::VectorXd& f0, double h_max, int order,
                           const SolverCfg& cfg, SolverStats& stats) {
    const Eigen::Index n = y0.size();
    Eigen::VectorXd sk(n);
    for (Eigen::Index i = 0; i < n; ++i) sk[i] = cfg.atol + cfg.rtol * std::abs(y0[i]);

    const double dnf = std::sqrt((f0.array() / sk.array()).square().mean());
    const double dny = std::sqrt((y0.array() / sk.array()).square().mean());

    double h = (dnf <= 1e-10 || dny <= 1e-10) ? 1.0e-6 : 0.01 * (dny / dnf);
    h = std::min(h, h_max);

    const Eigen::VectorXd y1 = y0 + h * f0;
    Eigen::VectorXd f1;
    eval_rhs(sys, t0 + h, y1, f1, stats);

    const double der2 = std::sqrt(((f1 - f0).array() / sk.array()).square().mean()) / h;
    const double der12 = std::max(std::abs(der2), dnf);

    double h1;
    if (!std::isfinite(der12) || der12 <= 1e-15) {
        h1 = std::max(1.0e-6, h * 1.0e-3);
    } else {
        h1 = std::pow(0.01 / der12, 1.0 / static_cast<double>(order));
    }
    return std::min({100.0 * h, h1, h_max});
}

static void dopri_step(const OdeSystem& sys, double t, const Eigen::VectorXd& y,
                       const Eigen::VectorXd& k1, double h, const SolverCfg& cfg,
                       SolverStats& stats, StepResult& res, DenseStep& dense) {
    using namespace dp;
    Eigen::VectorXd k2, k3, k4, k5, k6, k7;

    eval_rhs(sys, t + c2 * h, y + h * (a21 * k1), k2, stats);
    eval_rhs(sys, t + c3 * h, y + h * (a31 * k1 + a32 * k2), k3, stats);
    eval_rhs(sys, t + c4 * h, y + h * (a41 * k1 + a42 * k2 + a43 * k3), k4, stats);
    eval_rhs(sys, t + c5 * h, y + h * (a51 * k1 + a52 * k2 + a53 * k3 + a54 * k4), k5, stats);

    const Eigen::VectorXd ysti = y + h * (a61 * k1 + a62 * k2 + a63 * k3 + a64 * k4 + a65 * k5);
    eval_rhs(sys, t + h, ysti, k6, stats);

    res.y_new = y + h * (a71 * k1 + a73 * k3 + a74 * k4 + a75 * k5 + a76 * k6);
    eval_rhs(sys, t + h, res.y_new, k7, stats);
    res.f_new = k7;

    if (!all_finite(res.y_new) || !all_finite(k7)) {
        res.finite = false;
        return;
    }
    res.finite = true;

    const Eigen::VectorXd e = h * (e1 * k1 + e3 * k3 + e4 * k4 + e5 * k5 + e6 * k6 + e7 * k7);
    res.err = weighted_rms(e, y, res.y_new, cfg);
    if (!std::isfinite(res.err)) {
        res.finite = false;
        return;
    }

    // h*|f(y1)-f(ysti)|/|y1-ysti|: aproxima h*|lambda| dominante
    const double stnum = (k7 - k6).squaredNorm();
    const double stden = (res.y_new - ysti).squaredNorm();
    res.hlamb = (stden > 0.0) ? h * std::sqrt(stnum / stden) : 0.0;

    const Eigen::VectorXd ydiff = res.y_new - y;
    const Eigen::VectorXd bspl = h * k1 - ydiff;
    dense.stiff = false;
    dense.t_old = t;
    dense.h = h;
    dense.c0 = y;
    dense.c1 = ydiff;
    dense.c2 = bspl;
    dense.c3 = ydiff - h * k7 - bspl;
    dense.c4 = h * (d1 * k1 + d3 * k3 + d4 * k4 + d5 * k5 + d6 * k6 + d7 * k7);
}

static void numerical_jacobian(const OdeSystem& sys, double t, const Eigen::VectorXd& y,
                               const Eigen::VectorXd& f0, Eigen::MatrixXd& J, SolverStats& stats) {
    const Eigen::Index n = y.size();
    const double sqrt_eps = std::sqrt(std::numeric_limits<double>::epsilon());
    J.resize(n, n);
    Eigen::VectorXd yp = y;
    Eigen::VectorXd fp;
    for (Eigen::Index j = 0; j < n; ++j) {
        const double delta = sqrt_eps * std::max(1.0e-5, std::abs(y[j]));
        yp[j] = y[j] + delta;
        eval_rhs(sys, t, yp, fp, stats);
        J.col(j) = (fp - f0) / delta;
        yp[j] = y[j];
    }
}

static void rosenbrock_step(const OdeSystem& sys, double t, const Eigen::VectorXd& y,
                            const Eigen::VectorXd& F0, double h, const SolverCfg& cfg,
                            SolverStats& stats, StepResult& res, DenseStep& dense) {
    const Eigen::Index n = y.size();

    if (sys.jacobian) {
        res.J.resize(n, n);
        sys.jacobian(t, y, res.J);
    } else {
        numerical_jacobian(sys, t, y, F0, res.J, stats);
    }
    ++stats.n_jacobian;

    // df/dt por diferença finita (zero para sistemas autônomos)
    const double sqrt_eps = std::sqrt(std::numeric_limits<double>::epsilon());
    const double tdel = std::min(sqrt_eps * std::max(std::abs(t), std::abs(t + h)), std::abs(h));
    Eigen::VectorXd Ft;
    eval_rhs(sys, t + tdel, y, Ft, stats);
    const Eigen::VectorXd T = (Ft - F0) / tdel;

    if (!res.J.allFinite() || !all_finite(T)) {
        res.finite = false;
        return;
    }

    const Eigen::MatrixXd W = Eigen::MatrixXd::Identity(n, n) - (h * ros::d) * res.J;
    const Eigen::PartialPivLU<Eigen::MatrixXd> lu(W);

    const Eigen::VectorXd k1 = lu.solve(F0 + (h * ros::d) * T);

    Eigen::VectorXd F1;
    eval_rhs(sys, t + 0.5 * h, y + (0.5 * h) * k1, F1, stats);
    const Eigen::VectorXd k2 = lu.solve(F1 - k1) + k1;

    res.y_new = y + h * k2;
    eval_rhs(sys, t + h, res.y_new, res.f_new, stats);

    if (!all_finite(res.y_new) || !all_finite(res.f_new)) {
        res.finite = false;
        return;
    }
    res.finite = true;

    const Eigen::VectorXd k3 =
        lu.solve(res.f_new - ros::e32 * (k2 - F1) - 2.0 * (k1 - F0) + (h * ros::d) * T);

    const Eigen::VectorXd e = (h / 6.0) * (k1 - 2.0 * k2 + k3);
    res.err = weighted_rms(e, y, res.y_new, cfg);
    if (!std::isfinite(res.err)) {
        res.finite = false;
        return;
    }

    dense.stiff = true;
    dense.t_old = t;
    dense.h = h;
    dense.c0 = y;
    dense.c1 = k1;
    dense.c2 = k2;
}

// Raio espectral de J por iteração de potência (estimativa, vetor inicial fixo)
static double spectral_radius(const Eigen::MatrixXd& J) {
    const Eigen::Index n = J.rows();
    if (n == 0) return 0.0;
    Eigen::VectorXd v = Eigen::VectorXd::Ones(n) / std::sqrt(static_cast<double>(n));
    double rho = 0.0;
    for (int it = 0; it < 10; ++it) {
        const Eigen::VectorXd w = J * v;
        const double nrm = w.norm();
        if (!(nrm > 0.0) || !std::isfinite(nrm)) return std::isfinite(nrm) ? 0.0 : nrm;
        rho = nrm;
        v = w / nrm;
    }
    return rho;
}

static void validate(const Eigen::VectorXd& y0, const std::vector<double>& times, const SolverCfg& cfg) {
    if (times.empty()) throw ValidationError("times must not be empty");
    for (std::size_t k = 0; k < times.size(); ++k) {
        if (!std::isfinite(times[k])) throw ValidationError("times must be finite");
        if (k > 0 && !(times[k] > times[k - 1])) {
            throw ValidationError("times must be strictly increasing");
        }
    }
    if (!(cfg.rtol > 0.0) || !std::isfinite(cfg.rtol)) throw ValidationError("rtol must be > 0");
    if (!(cfg.atol > 0.0) || !std::isfinite(cfg.atol)) throw ValidationError("atol must be > 0");
    if (!(cfg.h0 >= 0.0) || !std::isfinite(cfg.h0)) throw ValidationError("h0 must be >= 0");
    if (!(cfg.h_max >= 0.0) || !std::isfinite(cfg.h_max)) throw ValidationError("h_max must be >= 0");
    if (cfg.max_steps <= 0) throw ValidationError("max_steps must be > 0");
    if (!y0.allFinite()) throw ValidationError("initial state must be finite");
}

OdeSolution solve_at_times(
    const OdeSystem& sys,
    const Eigen::VectorXd& y0,
    const std::vector<double>& times,
    const SolverCfg& cfg
) {
    if (!sys.rhs) throw ValidationError("OdeSystem.rhs is empty");
    validate(y0, times, cfg);

    OdeSolution out;
    out.t.reserve(times.size());
    out.y.reserve(times.size());
    out.status = SolveStatus::SUCCESS;

    out.t.push_back(times.front());
    out.y.push_back(y0);
    if (times.size() == 1) return out;

    SolverStats& stats = out.stats;

    const double t0 = times.front();
    const double tend = times.back();
    const double span = tend - t0;
    const double h_max = (cfg.h_max > 0.0) ? std::min(cfg.h_max, span) : span;
    const double h_min = 16.0 * std::numeric_limits<double>::epsilon() * std::max(std::abs(t0), std::abs(tend));

    double t = t0;
    Eigen::VectorXd y = y0;
    Eigen::VectorXd f;
    eval_rhs(sys, t, y, f, stats);

    auto fail = [&](SolveStatus st, const std::string& why) {
        out.status = st;
        std::ostringstream os;
        os << why << " at t=" << t << "; output truncated after " << out.t.size()
           << " of " << times.size() << " samples";
        out.message = os.str();
    };

    if (!all_finite(f)) {
        fail(SolveStatus::NON_FINITE, "non-finite derivative");
        return out;
    }

    bool stiff = (cfg.method == SolverMethod::STIFF);
    double h = (cfg.h0 > 0.0) ? std::min(cfg.h0, h_max)
                              : initial_step(sys, t, y, f, h_max, stiff ? 3 : 5, cfg, stats);

    int iasti = 0, nonsti = 0;
    int steps_in_interval = 0;
    bool reject_prev = false;
    bool nonfinite_prev = false;
    std::size_t next = 1;

    StepResult res;
    DenseStep dense;

    while (next < times.size()) {
        if (steps_in_interval >= cfg.max_steps) {
            fail(SolveStatus::TOO_MANY_STEPS, "excess work (max_steps=" + std::to_string(cfg.max_steps) + ")");
            break;
        }
        if (!(h >= h_min) || !std::isfinite(h)) {
            if (nonfinite_prev) fail(SolveStatus::NON_FINITE, "non-finite state encountered");
            else fail(SolveStatus::STEP_TOO_SMALL, "step size underflow");
            break;
        }

        bool last = false;
        if (t + 1.01 * h >= tend) {
            h = tend - t;
            last = true;
        }

        if (stiff) rosenbrock_step(sys, t, y, f, h, cfg, stats, res, dense);
        else dopri_step(sys, t, y, f, h, cfg, stats, res, dense);
        ++steps_in_interval;

        if (!res.finite) {
            ++stats.n_rejected;
            nonfinite_prev = true;
            reject_prev = true;
            h *= 0.25;
            continue;
        }
        nonfinite_prev = false;

        const double expo = stiff ? (1.0 / 3.0) : (1.0 / 5.0);
        const double err = std::max(res.err, 1.0e-10);
        const double fac = 0.9 * std::pow(err, -expo);

        if (res.err > 1.0) {
            ++stats.n_rejected;
            reject_prev = true;
            h *= std::max(0.2, fac);
            continue;
        }

        // ---------- passo aceito ----------
        ++stats.n_accepted;
        const double t_new = last ? tend : t + h;

        while (next < times.size() && times[next] <= t_new) {
            out.t.push_back(times[next]);
            if (times[next] == t_new) out.y.push_back(res.y_new);
            else out.y.push_back(dense.eval(times[next]));
            ++next;
            steps_in_interval = 0;
        }

        double h_new = h * std::min(reject_prev ? 1.0 : (stiff ? 5.0 : 10.0), std::max(0.2, fac));
        h_new = std::min(h_new, h_max);
        reject_prev = false;

        if (cfg.method == SolverMethod::AUTO) {
            if (!stiff) {
                if (res.hlamb > kStiffBound) {
                    nonsti = 0;
                    if (++iasti >= kStiffHits) {
                        stiff = true;
                        iasti = 0;
                        nonsti = 0;
                        ++stats.n_switches;
                    }
                } else if (++nonsti >= kNonStiffHits) {
                    iasti = 0;
                }
            } else {
                const double hrho = h_new * spectral_radius(res.J);
                if (std::isfinite(hrho) && hrho < 0.5 * kStiffBound) {
                    if (++nonsti >= kNonStiffHits) {
                        stiff = false;
                        nonsti = 0;
                        iasti = 0;
                        ++stats.n_switches;
                    }
                } else {
                    nonsti = 0;
                }
            }
        }

        t = t_new;
        y = res.y_new;
        f = res.f_new;
        h = h_new;
    }

    stats.ended_stiff = stiff;
    return out;
}

} // namespace gravbody
