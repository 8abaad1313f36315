#ifndef NODE_HPP
#define NODE_HPP

#include <utility>

struct Node {
    double x, y;
    double r; // taxa de geração de dados

    Node(double x_, double y_, double r_)
        : x(x_), y(y_), r(r_) {
    }

    Node(const std::pair<double, double>& pos, double dataRate)
        : x(pos.first), y(pos.second), r(dataRate) {
    }
};

#endif
