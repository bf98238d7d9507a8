#include "gravbody/registry.hpp"

#include <cmath>
#include <sstream>
#include <unordered_set>

#include "gravbody/errors.hpp"

namespace gravbody {

static inline bool all_finite(const std::vector<double>& v) {
    for (double x : v) {
        if (!std::isfinite(x)) return false;
    }
    return true;
}

BodyRegistry::BodyRegistry(const std::vector<BodyDescriptor>& descriptors) {
    if (descriptors.size() < 2) {
        throw ValidationError("at least 2 bodies are required (got " + std::to_string(descriptors.size()) + ")");
    }

    const std::size_t d = descriptors.front().position.size();
    if (d != 2 && d != 3) {
        throw ValidationError("position must have 2 or 3 components (body '" + descriptors.front().name + "')");
    }

    std::unordered_set<std::string> seen;
    bodies_.reserve(descriptors.size());
    presentation_.reserve(descriptors.size());

    for (const auto& bd : descriptors) {
        if (bd.name.empty()) throw ValidationError("body name must not be empty");
        if (!seen.insert(bd.name).second) {
            throw ValidationError("duplicate body name '" + bd.name + "'");
        }
        if (!(bd.mass > 0.0) || !std::isfinite(bd.mass)) {
            std::ostringstream os;
            os << "mass must be > 0 and finite (body '" << bd.name << "', mass=" << bd.mass << ")";
            throw ValidationError(os.str());
        }
        if (bd.position.size() != d || bd.velocity.size() != d) {
            std::ostringstream os;
            os << "body '" << bd.name << "' has position/velocity of size "
               << bd.position.size() << "/" << bd.velocity.size() << ", expected " << d;
            throw ValidationError(os.str());
        }
        if (!all_finite(bd.position) || !all_finite(bd.velocity)) {
            throw ValidationError("body '" + bd.name + "' has non-finite position/velocity");
        }

        bodies_.push_back(Body{bd.name, bd.mass, bd.position, bd.velocity});
        presentation_.push_back(bd.presentation);
    }

    dim_ = static_cast<int>(d);
}

const Body& BodyRegistry::body(std::size_t i) const {
    return bodies_.at(i);
}

const Presentation& BodyRegistry::presentation(std::size_t i) const {
    return presentation_.at(i);
}

std::vector<std::string> BodyRegistry::names() const {
    std::vector<std::string> out;
    out.reserve(bodies_.size());
    for (const auto& b : bodies_) out.push_back(b.name);
    return out;
}

std::vector<double> BodyRegistry::masses() const {
    std::vector<double> out;
    out.reserve(bodies_.size());
    for (const auto& b : bodies_) out.push_back(b.mass);
    return out;
}

std::size_t BodyRegistry::index_of(const std::string& name) const {
    for (std::size_t i = 0; i < bodies_.size(); ++i) {
        if (bodies_[i].name == name) return i;
    }
    throw ValidationError("unknown body '" + name + "'");
}

std::vector<double> BodyRegistry::encode_initial_state() const {
    std::vector<double> s(state_size());
    for (std::size_t i = 0; i < bodies_.size(); ++i) {
        const std::size_t pr = position_offset(i);
        const std::size_t pv = velocity_offset(i);
        for (int k = 0; k < dim_; ++k) {
            s[pr + k] = bodies_[i].position[k];
            s[pv + k] = bodies_[i].velocity[k];
        }
    }
    return s;
}

std::vector<BodyState> BodyRegistry::decode_state(const std::vector<double>& state) const {
    return decode_state(state.data(), state.size());
}

std::vector<BodyState> BodyRegistry::decode_state(const double* state, std::size_t n) const {
    if (n != state_size()) {
        std::ostringstream os;
        os << "state vector has length " << n << ", expected " << state_size()
           << " (2 * " << bodies_.size() << " bodies * dim " << dim_ << ")";
        throw ShapeError(os.str());
    }

    std::vector<BodyState> out(bodies_.size());
    for (std::size_t i = 0; i < bodies_.size(); ++i) {
        const double* r = state + position_offset(i);
        const double* v = state + velocity_offset(i);
        out[i].position.assign(r, r + dim_);
        out[i].velocity.assign(v, v + dim_);
    }
    return out;
}

} // namespace gravbody
