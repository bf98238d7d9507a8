#pragma once
#include <cstddef>
#include <string>
#include <vector>

#include "gravbody/types.hpp"

namespace gravbody {

// Conjunto ordenado e imutável de corpos.
// Layout do vetor de estado: [r_0 .. r_{N-1}, v_0 .. v_{N-1}], cada bloco com dim componentes.
class BodyRegistry {
public:
    // Lança ValidationError: < 2 corpos, massa <= 0, dimensão != 2/3 ou mista, nomes repetidos
    explicit BodyRegistry(const std::vector<BodyDescriptor>& descriptors);

    std::size_t size() const { return bodies_.size(); }
    int dim() const { return dim_; }
    std::size_t state_size() const { return 2 * bodies_.size() * static_cast<std::size_t>(dim_); }

    const Body& body(std::size_t i) const;
    const std::vector<Body>& bodies() const { return bodies_; }
    const Presentation& presentation(std::size_t i) const;

    std::vector<std::string> names() const;
    std::vector<double> masses() const;

    // índice do corpo pelo nome; ValidationError se não existir
    std::size_t index_of(const std::string& name) const;

    std::size_t position_offset(std::size_t i) const { return i * static_cast<std::size_t>(dim_); }
    std::size_t velocity_offset(std::size_t i) const {
        return (bodies_.size() + i) * static_cast<std::size_t>(dim_);
    }

    std::vector<double> encode_initial_state() const;

    // Inverso de encode; ShapeError se state.size() != state_size()
    std::vector<BodyState> decode_state(const std::vector<double>& state) const;
    std::vector<BodyState> decode_state(const double* state, std::size_t n) const;

private:
    std::vector<Body> bodies_;
    std::vector<Presentation> presentation_;
    int dim_ = 0;
};

} // namespace gravbody
