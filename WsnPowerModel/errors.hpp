#ifndef ERRORS_HPP
#define ERRORS_HPP

#include <stdexcept>
#include <string>

// Índice de nó ou de matriz fora do intervalo válido
class IndexOutOfRange : public std::out_of_range {
public:
    explicit IndexOutOfRange(const std::string& what_)
        : std::out_of_range(what_) {
    }
};

// Parâmetros, nós ou matriz inconsistentes
class InvalidConfiguration : public std::invalid_argument {
public:
    explicit InvalidConfiguration(const std::string& what_)
        : std::invalid_argument(what_) {
    }
};

#endif
