#ifndef POWER_MATRIX_HPP
#define POWER_MATRIX_HPP

#include <vector>
#include <cstddef>

// Matriz quadrada simétrica de coeficientes de potência.
// A dimensão é sempre rows.size(); cada linha tem o mesmo tamanho.
class PowerMatrix {
public:
    PowerMatrix() = default;
    explicit PowerMatrix(int n);
    explicit PowerMatrix(std::vector<std::vector<double>> rows_);

    int size() const { return static_cast<int>(rows.size()); }

    // acesso sem checagem de limites
    double operator()(int i, int j) const { return rows[i][j]; }

    double at(int i, int j) const;
    const std::vector<double>& row(int i) const;

    void setSymmetric(int i, int j, double value);

    // Acrescenta uma linha e uma coluna no fim.
    // coeffs[k] = coeficiente entre k e o novo índice; diagonal nova = 0.
    void appendRowColumn(const std::vector<double>& coeffs);

    void removeRowColumn(int k);

    bool isSymmetric() const;
    bool hasZeroDiagonal() const;

    bool operator==(const PowerMatrix& other) const { return rows == other.rows; }
    bool operator!=(const PowerMatrix& other) const { return !(*this == other); }

private:
    std::vector<std::vector<double>> rows;

    void checkIndex(int i, const char* where) const;
};

#endif
