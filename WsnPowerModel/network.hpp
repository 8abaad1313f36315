#ifndef NETWORK_HPP
#define NETWORK_HPP

#include "node.hpp"
#include "energy.hpp"
#include "power_matrix.hpp"
#include <iostream>
#include <vector>
#include <utility>

struct Location {
    double x = 0.0;
    double y = 0.0;

    Location() = default;
    Location(double x_, double y_) : x(x_), y(y_) {}
    Location(const std::pair<double, double>& p) : x(p.first), y(p.second) {}
};

// minCharge > maxCharge é rejeitado na construção da Network
struct WSNParams {
    double rho = DEFAULT_RHO;          // consumo por unidade de dado recebido
    double alpha = DEFAULT_ALPHA;      // expoente da distância
    double beta1 = DEFAULT_BETA_1;     // custo fixo de transmissão
    double beta2 = DEFAULT_BETA_2;     // custo de transmissão escalado pela distância
    double chargeRate = DEFAULT_CHARGE_RATE;
    Location wcvStation{ 0.0, 0.0 };
    Location baseStation{ 500.0, 250.0 };
    double maxCharge = DEFAULT_MAX_CHARGE;
    double minCharge = DEFAULT_MIN_CHARGE;
};

// Rede de sensores + estação base, com a matriz de coeficientes de potência
// indexada por { BS, nodes[0], nodes[1], ... }.
// nodes e powerMat são alterados sempre juntos: powerMat.size() == nodes.size() + 1.
class Network {
public:
    static constexpr int BASE_STATION_INDEX = 0;

    static int nodeIndexToMatrixIndex(int i) { return i + 1; }

    Network(std::vector<Node> nodes_, const WSNParams& params_);

    Network(std::vector<Node> nodes_, double rho, double alpha, double beta1, double beta2,
        double chargeRate, const Location& wcvStation, const Location& baseStation,
        double maxCharge, double minCharge);

    // Usa uma matriz já calculada; dimensão, simetria, diagonal e valores
    // precisam bater com os nós e parâmetros
    Network(std::vector<Node> nodes_, const WSNParams& params_, PowerMatrix matrix);

    // Reconstrução completa O(n^2)
    void buildPowerMatrix();

    // Atualização incremental O(n); inclui o coeficiente nó novo <-> BS
    void addSensor(const Node& node);

    // idx é o índice em nodes(), não na matriz
    void removeSensor(int idx);

    const std::vector<Node>& nodes() const { return nodeList; }
    const PowerMatrix& powerMatrix() const { return powerMat; }
    const WSNParams& params() const { return prm; }

    int numSensors() const { return static_cast<int>(nodeList.size()); }

    double rho() const { return prm.rho; }
    double alpha() const { return prm.alpha; }
    double beta1() const { return prm.beta1; }
    double beta2() const { return prm.beta2; }
    double chargeRate() const { return prm.chargeRate; }
    double maxCharge() const { return prm.maxCharge; }
    double minCharge() const { return prm.minCharge; }
    const Location& wcvStation() const { return prm.wcvStation; }
    const Location& baseStation() const { return prm.baseStation; }

    // índices de matriz
    double coefficient(int i, int j) const { return powerMat.at(i, j); }

    // índices de nós
    double sensorCoefficient(int a, int b) const;
    double baseCoefficient(int a) const;

    // dimensão, simetria, diagonal zero e cada coeficiente igual ao modelo
    bool checkInvariants() const;

    void printSummary(std::ostream& os = std::cout) const;

private:
    std::vector<Node> nodeList;
    WSNParams prm;
    PowerMatrix powerMat;

    // tolerância relativa ao comparar com uma matriz fornecida de fora
    static constexpr double COEFF_TOLERANCE = 1e-9;

    // lança InvalidConfiguration se o coeficiente não for finito
    double coefficientBetween(double x1, double y1, double x2, double y2) const;
    double expectedCoefficient(int i, int j) const;
    static bool coefficientMatches(double actual, double expected);
    void checkNodeIndex(int idx, const char* where) const;

    void validateParams() const;
    static void validateNode(const Node& node, const char* where);
};

#endif
