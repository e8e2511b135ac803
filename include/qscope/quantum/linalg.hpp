/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#pragma once

#include "qscope/quantum/types.hpp"

#include <cstddef>
#include <vector>

namespace qscope::quantum {

/**
 * Dense square complex matrix, row-major.
 */
class Matrix {
public:
    Matrix() = default;
    explicit Matrix(std::size_t dim);

    static Matrix identity(std::size_t dim);
    static Matrix from_2x2(const Matrix2& m);

    std::size_t dim() const { return dim_; }
    bool empty() const { return dim_ == 0; }

    Complex& operator()(std::size_t row, std::size_t col) { return data_[row * dim_ + col]; }
    const Complex& operator()(std::size_t row, std::size_t col) const { return data_[row * dim_ + col]; }

    const std::vector<Complex>& data() const { return data_; }
    Complex trace() const;

private:
    std::size_t dim_{0};
    std::vector<Complex> data_;
};

// Kronecker (tensor) product: a is the more significant factor.
Matrix kron(const Matrix& a, const Matrix& b);

Matrix multiply(const Matrix& a, const Matrix& b);
Matrix adjoint(const Matrix& m);
StateVector mat_vec(const Matrix& m, const StateVector& v);

// <a|b>
Complex inner_product(const StateVector& a, const StateVector& b);
double norm_squared(const StateVector& v);

bool is_unitary(const Matrix& m, double tolerance = 1e-10);
bool is_hermitian(const Matrix& m, double tolerance = 1e-10);

/**
 * @brief Eigenvalues of a Hermitian matrix, ascending.
 *
 * 2x2 input uses the closed form; larger input runs cyclic complex Jacobi
 * rotations until the off-diagonal mass vanishes. Throws std::invalid_argument
 * on an empty matrix.
 */
std::vector<double> hermitian_eigenvalues(const Matrix& m);

} // namespace qscope::quantum
