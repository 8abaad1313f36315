#include <iostream>
#include <exception>
#include <vector>
#include <memory>

#include "network.hpp"
#include "errors.hpp"
#include "utils.hpp"

static const char* okFlag(bool ok) {
    return ok ? "OK" : "FALHOU";
}

// ======================================================
// === Função principal ================================
// ======================================================
int main() {
    // === PARÂMETROS DA REDE ===
    const int numSensors = 200;
    const double areaWidth = 500.0, areaHeight = 500.0;
    const double maxDataRate = 10.0;

    WSNParams params;
    params.baseStation = Location(areaWidth / 2.0, areaHeight / 2.0);
    params.wcvStation = Location(0.0, 0.0);

    try {
        std::vector<Node> nodes = generateRandomNodes(numSensors, areaWidth, areaHeight, maxDataRate);

        // === CONSTRÓI A MATRIZ ===
        std::cout << "\n========== CONSTRUÇÃO ==========\n";
        std::unique_ptr<Network> netPtr;
        double buildTime = measureTime([&]() {
            netPtr = std::make_unique<Network>(nodes, params);
            });
        Network& net = *netPtr;

        std::cout << "[BUILD] " << net.numSensors() << " sensores, matriz "
            << net.powerMatrix().size() << "x" << net.powerMatrix().size()
            << " em " << buildTime << "s | invariantes: " << okFlag(net.checkInvariants()) << "\n";

        // === INSERÇÃO INCREMENTAL ===
        std::cout << "\n========== INSERÇÃO ==========\n";
        PowerMatrix before = net.powerMatrix();
        Node extra(randDouble(0, areaWidth), randDouble(0, areaHeight), randDouble(0, maxDataRate));

        double addTime = measureTime([&]() { net.addSensor(extra); });
        std::cout << "[ADD] sensor (" << extra.x << ", " << extra.y << ") em " << addTime
            << "s | coef. BS = " << net.baseCoefficient(net.numSensors() - 1)
            << " | invariantes: " << okFlag(net.checkInvariants()) << "\n";

        // a matriz incremental deve coincidir com uma reconstrução completa
        PowerMatrix incremental = net.powerMatrix();
        net.buildPowerMatrix();
        std::cout << "[ADD] incremental == reconstrucao: " << okFlag(incremental == net.powerMatrix()) << "\n";

        // === REMOÇÃO ===
        std::cout << "\n========== REMOÇÃO ==========\n";
        double removeTime = measureTime([&]() { net.removeSensor(net.numSensors() - 1); });
        std::cout << "[REMOVE] ultimo sensor removido em " << removeTime
            << "s | matriz restaurada: " << okFlag(before == net.powerMatrix())
            << " | invariantes: " << okFlag(net.checkInvariants()) << "\n";

        try {
            net.removeSensor(net.numSensors());
        }
        catch (const IndexOutOfRange& e) {
            std::cout << "[REMOVE] indice invalido rejeitado: " << e.what() << "\n";
        }

        if (net.numSensors() <= 10)
            net.printSummary();
    }
    catch (const std::exception& e) {
        std::cerr << "Erro: " << e.what() << "\n";
        return 1;
    }

    std::cout << "\n[Fim]\n";
    return 0;
}
