#pragma once
#include <cstdint>
#include <string>
#include <vector>

namespace gravbody {

// Constante gravitacional usada pelos scripts originais | N m^2 kg^-2
constexpr double kGravitationalConstant = 6.67428e-11;

enum class SolveStatus : std::uint8_t {
    SUCCESS = 0,
    NON_FINITE = 1,      // RHS/estado virou NaN ou inf (encontro próximo)
    STEP_TOO_SMALL = 2,  // passo caiu abaixo do mínimo representável
    TOO_MANY_STEPS = 3   // excedeu max_steps num intervalo de saída
};

enum class SolverMethod : std::uint8_t {
    AUTO = 0,      // troca stiff/não-stiff sozinho
    NONSTIFF = 1,  // força Dormand-Prince
    STIFF = 2      // força Rosenbrock
};

// Metadados de apresentação: o núcleo só carrega, nunca lê
struct Presentation {
    double radius = 0.0;
    std::string color;
    std::string color_gradient;
};

// Entrada do usuário (um corpo)
struct BodyDescriptor {
    std::string name;
    double mass = 0.0;
    std::vector<double> position;  // [x,y] ou [x,y,z]
    std::vector<double> velocity;  // mesma dimensão de position
    Presentation presentation;
};

// Registro físico validado
struct Body {
    std::string name;
    double mass = 0.0;
    std::vector<double> position;
    std::vector<double> velocity;
};

struct BodyState {
    std::vector<double> position;
    std::vector<double> velocity;
};

struct SimulationCfg {
    double G = kGravitationalConstant;
    double time_span = 0.0;   // segundos
    int n_samples = 404;      // >= 2, inclui t=0 e t=time_span
    double softening = 0.0;   // 0 => Newton puro
};

struct SolverCfg {
    double rtol = 1.49012e-8;  // defaults do odeint
    double atol = 1.49012e-8;
    double h0 = 0.0;           // 0 => estimativa automática
    double h_max = 0.0;        // 0 => sem limite
    int max_steps = 5000;      // por intervalo entre amostras
    SolverMethod method = SolverMethod::AUTO;
};

struct SolverStats {
    long n_accepted = 0;
    long n_rejected = 0;
    long n_rhs = 0;
    long n_jacobian = 0;
    int n_switches = 0;        // trocas stiff <-> não-stiff
    bool ended_stiff = false;
};

struct Trajectory {
    std::vector<std::string> names;             // ordem do registry
    int dim = 0;
    std::vector<double> t;                      // tempos, crescentes
    std::vector<std::vector<BodyState>> states; // states[k][i]: corpo i em t[k]

    SolveStatus status = SolveStatus::SUCCESS;
    std::string message;
    SolverStats stats;
};

} // namespace gravbody
