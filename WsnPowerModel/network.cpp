#include "network.hpp"
#include "errors.hpp"
#include "utils.hpp"
#include <algorithm>
#include <cmath>
#include <string>
#include <utility>

constexpr int Network::BASE_STATION_INDEX;
constexpr double Network::COEFF_TOLERANCE;

Network::Network(std::vector<Node> nodes_, const WSNParams& params_)
    : nodeList(std::move(nodes_)), prm(params_) {
    validateParams();
    for (const auto& node : nodeList)
        validateNode(node, "Network");

    buildPowerMatrix();
}

Network::Network(std::vector<Node> nodes_, double rho, double alpha, double beta1, double beta2,
    double chargeRate, const Location& wcvStation, const Location& baseStation,
    double maxCharge, double minCharge)
    : Network(std::move(nodes_), WSNParams{ rho, alpha, beta1, beta2, chargeRate,
        wcvStation, baseStation, maxCharge, minCharge }) {
}

Network::Network(std::vector<Node> nodes_, const WSNParams& params_, PowerMatrix matrix)
    : nodeList(std::move(nodes_)), prm(params_), powerMat(std::move(matrix)) {
    validateParams();
    for (const auto& node : nodeList)
        validateNode(node, "Network");

    if (powerMat.size() != numSensors() + 1)
        throw InvalidConfiguration("Network: matriz " + std::to_string(powerMat.size())
            + "x" + std::to_string(powerMat.size()) + " para " + std::to_string(numSensors())
            + " sensores (esperado " + std::to_string(numSensors() + 1) + ")");
    if (!powerMat.isSymmetric())
        throw InvalidConfiguration("Network: matriz de potencia nao e simetrica");
    if (!powerMat.hasZeroDiagonal())
        throw InvalidConfiguration("Network: diagonal da matriz de potencia deve ser zero");

    for (int i = 0; i < powerMat.size(); ++i) {
        for (int j = i + 1; j < powerMat.size(); ++j) {
            if (!coefficientMatches(powerMat(i, j), expectedCoefficient(i, j)))
                throw InvalidConfiguration("Network: coeficiente [" + std::to_string(i) + "]["
                    + std::to_string(j) + "] = " + std::to_string(powerMat(i, j))
                    + " difere do modelo (" + std::to_string(expectedCoefficient(i, j)) + ")");
        }
    }
}

double Network::coefficientBetween(double x1, double y1, double x2, double y2) const {
    double c = transmitCoefficient(prm.beta1, prm.beta2, prm.alpha, distance(x1, y1, x2, y2));
    // ex.: alpha < 0 com pontos coincidentes dá pow(0, alpha) = inf
    if (!std::isfinite(c))
        throw InvalidConfiguration("Network: coeficiente de potencia nao finito entre ("
            + std::to_string(x1) + ", " + std::to_string(y1) + ") e ("
            + std::to_string(x2) + ", " + std::to_string(y2) + ")");
    return c;
}

// k = 0 é a BS, k >= 1 é nodes[k-1]
double Network::expectedCoefficient(int i, int j) const {
    const double xi = (i == BASE_STATION_INDEX) ? prm.baseStation.x : nodeList[i - 1].x;
    const double yi = (i == BASE_STATION_INDEX) ? prm.baseStation.y : nodeList[i - 1].y;
    const double xj = (j == BASE_STATION_INDEX) ? prm.baseStation.x : nodeList[j - 1].x;
    const double yj = (j == BASE_STATION_INDEX) ? prm.baseStation.y : nodeList[j - 1].y;
    return coefficientBetween(xi, yi, xj, yj);
}

bool Network::coefficientMatches(double actual, double expected) {
    return std::fabs(actual - expected) <= COEFF_TOLERANCE * std::max(1.0, std::fabs(expected));
}

void Network::buildPowerMatrix() {
    // pontos: BS seguida das posições dos sensores
    std::vector<double> xs, ys;
    xs.reserve(nodeList.size() + 1);
    ys.reserve(nodeList.size() + 1);
    xs.push_back(prm.baseStation.x);
    ys.push_back(prm.baseStation.y);
    for (const auto& node : nodeList) {
        xs.push_back(node.x);
        ys.push_back(node.y);
    }

    int N = static_cast<int>(xs.size());
    PowerMatrix fresh(N);
    for (int i = 0; i < N; ++i) {
        for (int j = i + 1; j < N; ++j) {
            fresh.setSymmetric(i, j, coefficientBetween(xs[i], ys[i], xs[j], ys[j]));
        }
    }

    powerMat = std::move(fresh);
}

void Network::addSensor(const Node& node) {
    validateNode(node, "Network::addSensor");

    // coeffs[0] = BS, coeffs[k+1] = nodes[k]
    std::vector<double> coeffs(nodeList.size() + 1);
    coeffs[BASE_STATION_INDEX] = coefficientBetween(prm.baseStation.x, prm.baseStation.y, node.x, node.y);
    for (int i = 0; i < numSensors(); ++i) {
        const Node& other = nodeList[i];
        coeffs[nodeIndexToMatrixIndex(i)] = coefficientBetween(other.x, other.y, node.x, node.y);
    }

    // reserva antes de mexer na matriz para que o push_back não falhe depois
    nodeList.reserve(nodeList.size() + 1);
    powerMat.appendRowColumn(coeffs);
    nodeList.push_back(node);
}

void Network::removeSensor(int idx) {
    checkNodeIndex(idx, "Network::removeSensor");

    powerMat.removeRowColumn(nodeIndexToMatrixIndex(idx));
    nodeList.erase(nodeList.begin() + idx);
}

void Network::checkNodeIndex(int idx, const char* where) const {
    if (idx < 0 || idx >= numSensors())
        throw IndexOutOfRange(std::string(where) + ": indice de sensor " + std::to_string(idx)
            + " fora de [0, " + std::to_string(numSensors()) + ")");
}

double Network::sensorCoefficient(int a, int b) const {
    checkNodeIndex(a, "Network::sensorCoefficient");
    checkNodeIndex(b, "Network::sensorCoefficient");
    return powerMat(nodeIndexToMatrixIndex(a), nodeIndexToMatrixIndex(b));
}

double Network::baseCoefficient(int a) const {
    checkNodeIndex(a, "Network::baseCoefficient");
    return powerMat(BASE_STATION_INDEX, nodeIndexToMatrixIndex(a));
}

bool Network::checkInvariants() const {
    if (powerMat.size() != numSensors() + 1
        || !powerMat.isSymmetric()
        || !powerMat.hasZeroDiagonal())
        return false;

    for (int i = 0; i < powerMat.size(); ++i) {
        for (int j = i + 1; j < powerMat.size(); ++j) {
            if (!coefficientMatches(powerMat(i, j), expectedCoefficient(i, j)))
                return false;
        }
    }
    return true;
}

void Network::validateParams() const {
    const double scalars[] = { prm.rho, prm.alpha, prm.beta1, prm.beta2,
        prm.chargeRate, prm.maxCharge, prm.minCharge };
    for (double v : scalars) {
        if (!std::isfinite(v))
            throw InvalidConfiguration("Network: parametro escalar nao finito");
    }

    if (!std::isfinite(prm.baseStation.x) || !std::isfinite(prm.baseStation.y))
        throw InvalidConfiguration("Network: posicao da estacao base nao finita");
    if (!std::isfinite(prm.wcvStation.x) || !std::isfinite(prm.wcvStation.y))
        throw InvalidConfiguration("Network: posicao da estacao do WCV nao finita");

    // limiares de carga fora de ordem não descrevem uma bateria válida
    if (prm.minCharge > prm.maxCharge)
        throw InvalidConfiguration("Network: minCharge (" + std::to_string(prm.minCharge)
            + ") maior que maxCharge (" + std::to_string(prm.maxCharge) + ")");
}

void Network::validateNode(const Node& node, const char* where) {
    if (!std::isfinite(node.x) || !std::isfinite(node.y))
        throw InvalidConfiguration(std::string(where) + ": coordenadas do sensor nao finitas");
    if (!std::isfinite(node.r) || node.r < 0.0)
        throw InvalidConfiguration(std::string(where) + ": taxa de dados invalida ("
            + std::to_string(node.r) + ")");
}

void Network::printSummary(std::ostream& os) const {
    os << "Total Nodes: " << nodeList.size() << "\n";
    os << "Base Station (" << prm.baseStation.x << ", " << prm.baseStation.y << ")\n";
    os << "WCV Station (" << prm.wcvStation.x << ", " << prm.wcvStation.y << ")\n";
    for (int i = 0; i < numSensors(); ++i) {
        const Node& node = nodeList[i];
        os << "Node " << i
            << " (" << node.x << ", " << node.y << ") rate=" << node.r
            << " -> BS coeff " << baseCoefficient(i) << "\n";
    }
    os << "Power matrix: " << powerMat.size() << "x" << powerMat.size() << "\n";
}
