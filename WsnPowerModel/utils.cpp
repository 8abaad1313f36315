#include "utils.hpp"
#include "errors.hpp"
#include <string>

std::vector<Node> generateRandomNodes(int count, double width, double height, double maxRate)
{
    if (count < 0)
        throw InvalidConfiguration("generateRandomNodes: count negativo (" + std::to_string(count) + ")");
    if (!(width > 0.0) || !(height > 0.0))
        throw InvalidConfiguration("generateRandomNodes: area deve ter largura e altura positivas");
    if (!(maxRate >= 0.0))
        throw InvalidConfiguration("generateRandomNodes: maxRate deve ser >= 0");

    std::vector<Node> nodes;
    nodes.reserve(count);
    for (int i = 0; i < count; ++i)
        nodes.emplace_back(randDouble(0, width), randDouble(0, height), randDouble(0, maxRate));

    return nodes;
}
