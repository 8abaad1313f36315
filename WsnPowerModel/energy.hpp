#ifndef ENERGY_HPP
#define ENERGY_HPP

#include <cmath>

// Parâmetros de energia (valores padrão do modelo)
constexpr double DEFAULT_RHO = 50e-9;         // Energia para receber dados (J/bit)
constexpr double DEFAULT_BETA_1 = 50e-9;      // Custo fixo de transmissão (J/bit)
constexpr double DEFAULT_BETA_2 = 10e-12;     // Amplificador free space (J/bit/m^alpha)
constexpr double DEFAULT_ALPHA = 2.0;         // Expoente de perda de percurso
constexpr double DEFAULT_CHARGE_RATE = 5.0;   // Taxa de recarga do WCV (W)
constexpr double DEFAULT_MAX_CHARGE = 10800.0; // Bateria cheia (J)
constexpr double DEFAULT_MIN_CHARGE = 540.0;   // Nível mínimo para operação confiável (J)

// Coeficiente de potência de transmissão a uma distância d
inline double transmitCoefficient(double beta1, double beta2, double alpha, double d) {
    return beta1 + beta2 * std::pow(d, alpha);
}

#endif
