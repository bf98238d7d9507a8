#pragma once
#include <stdexcept>
#include <string>

namespace gravbody {

// Entrada malformada (massa, dimensão, nomes, parâmetros da simulação)
class ValidationError : public std::runtime_error {
public:
    explicit ValidationError(const std::string& what) : std::runtime_error(what) {}
};

// Vetor de estado com tamanho/layout incompatível: defeito de programação
class ShapeError : public std::runtime_error {
public:
    explicit ShapeError(const std::string& what) : std::runtime_error(what) {}
};

// Integração não cobriu o intervalo pedido (ver require_complete)
class IntegrationError : public std::runtime_error {
public:
    explicit IntegrationError(const std::string& what) : std::runtime_error(what) {}
};

} // namespace gravbody
