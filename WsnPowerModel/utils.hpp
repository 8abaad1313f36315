#ifndef UTILS_HPP
#define UTILS_HPP
#pragma once

#include <vector>
#include <cmath>
#include <random>
#include <chrono>

#include "node.hpp"

// --- Funções utilitárias básicas ---
inline double distance(double x1, double y1, double x2, double y2) {
    return std::sqrt((x2 - x1) * (x2 - x1) + (y2 - y1) * (y2 - y1));
}

inline double randDouble(double min, double max) {
    static std::random_device rd;
    static std::mt19937 gen(rd());
    std::uniform_real_distribution<> dis(min, max);
    return dis(gen);
}

template<typename Func>
double measureTime(Func&& func) {
    auto start = std::chrono::high_resolution_clock::now();
    func();
    auto end = std::chrono::high_resolution_clock::now();
    return std::chrono::duration<double>(end - start).count();
}

// Gera sensores em posições aleatórias na área width x height
std::vector<Node> generateRandomNodes(int count, double width, double height, double maxRate);

#endif // UTILS_HPP
