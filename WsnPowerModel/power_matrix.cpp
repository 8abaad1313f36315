#include "power_matrix.hpp"
#include "errors.hpp"
#include <string>
#include <utility>

PowerMatrix::PowerMatrix(int n) {
    if (n < 0)
        throw InvalidConfiguration("PowerMatrix: dimensao negativa (" + std::to_string(n) + ")");
    rows.assign(n, std::vector<double>(n, 0.0));
}

PowerMatrix::PowerMatrix(std::vector<std::vector<double>> rows_)
    : rows(std::move(rows_)) {
    for (size_t i = 0; i < rows.size(); ++i) {
        if (rows[i].size() != rows.size())
            throw InvalidConfiguration("PowerMatrix: linha " + std::to_string(i) + " tem "
                + std::to_string(rows[i].size()) + " colunas, esperado "
                + std::to_string(rows.size()));
    }
}

void PowerMatrix::checkIndex(int i, const char* where) const {
    if (i < 0 || i >= size())
        throw IndexOutOfRange(std::string(where) + ": indice " + std::to_string(i)
            + " fora de [0, " + std::to_string(size()) + ")");
}

double PowerMatrix::at(int i, int j) const {
    checkIndex(i, "PowerMatrix::at");
    checkIndex(j, "PowerMatrix::at");
    return rows[i][j];
}

const std::vector<double>& PowerMatrix::row(int i) const {
    checkIndex(i, "PowerMatrix::row");
    return rows[i];
}

void PowerMatrix::setSymmetric(int i, int j, double value) {
    checkIndex(i, "PowerMatrix::setSymmetric");
    checkIndex(j, "PowerMatrix::setSymmetric");
    if (i == j)
        throw InvalidConfiguration("PowerMatrix::setSymmetric: diagonal deve permanecer zero");
    rows[i][j] = value;
    rows[j][i] = value;
}

void PowerMatrix::appendRowColumn(const std::vector<double>& coeffs) {
    int n = size();
    if (static_cast<int>(coeffs.size()) != n)
        throw InvalidConfiguration("PowerMatrix::appendRowColumn: esperado " + std::to_string(n)
            + " coeficientes, recebido " + std::to_string(coeffs.size()));

    // reserva tudo antes de alterar: os push_back abaixo não realocam
    std::vector<double> newRow;
    newRow.reserve(n + 1);
    newRow.assign(coeffs.begin(), coeffs.end());
    newRow.push_back(0.0);

    rows.reserve(n + 1);
    for (auto& r : rows) {
        if (r.capacity() < r.size() + 1)
            r.reserve(2 * (r.size() + 1));
    }

    for (int i = 0; i < n; ++i)
        rows[i].push_back(coeffs[i]);
    rows.push_back(std::move(newRow));
}

void PowerMatrix::removeRowColumn(int k) {
    checkIndex(k, "PowerMatrix::removeRowColumn");

    rows.erase(rows.begin() + k);
    for (auto& r : rows)
        r.erase(r.begin() + k);
}

bool PowerMatrix::isSymmetric() const {
    for (int i = 0; i < size(); ++i)
        for (int j = i + 1; j < size(); ++j)
            if (rows[i][j] != rows[j][i]) return false;
    return true;
}

bool PowerMatrix::hasZeroDiagonal() const {
    for (int i = 0; i < size(); ++i)
        if (rows[i][i] != 0.0) return false;
    return true;
}
