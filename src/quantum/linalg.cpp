/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#include "qscope/quantum/linalg.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace qscope::quantum {

namespace {

constexpr int kMaxJacobiSweeps = 100;
constexpr double kJacobiTolerance = 1e-14;

double off_diagonal_norm(const Matrix& m) {
    double sum = 0.0;
    for (std::size_t r = 0; r < m.dim(); ++r) {
        for (std::size_t c = 0; c < m.dim(); ++c) {
            if (r != c) sum += std::norm(m(r, c));
        }
    }
    return std::sqrt(sum);
}

std::vector<double> eigenvalues_2x2(const Matrix& m) {
    const double a = m(0, 0).real();
    const double d = m(1, 1).real();
    const double mean = 0.5 * (a + d);
    const double half_gap = 0.5 * (a - d);
    const double r = std::sqrt(half_gap * half_gap + std::norm(m(0, 1)));
    return {mean - r, mean + r};
}

// Zeroes element (p,q) with G = D*R, where D rotates the phase of column q so
// that a_pq becomes real and R is a real Jacobi rotation.
void jacobi_rotate(Matrix& a, std::size_t p, std::size_t q) {
    const Complex apq = a(p, q);
    const double b = std::abs(apq);
    if (b < kJacobiTolerance) return;

    const double psi = -std::arg(apq);
    const Complex phase = std::polar(1.0, psi);
    const double app = a(p, p).real();
    const double aqq = a(q, q).real();
    const double theta = 0.5 * std::atan2(2.0 * b, aqq - app);
    const double c = std::cos(theta);
    const double s = std::sin(theta);

    Matrix g = Matrix::identity(a.dim());
    g(p, p) = c;
    g(p, q) = s;
    g(q, p) = -s * phase;
    g(q, q) = c * phase;

    a = multiply(adjoint(g), multiply(a, g));
}

} // namespace

Matrix::Matrix(std::size_t dim)
    : dim_(dim)
    , data_(dim * dim, Complex(0.0, 0.0)) {}

Matrix Matrix::identity(std::size_t dim) {
    Matrix m(dim);
    for (std::size_t i = 0; i < dim; ++i) m(i, i) = Complex(1.0, 0.0);
    return m;
}

Matrix Matrix::from_2x2(const Matrix2& u) {
    Matrix m(2);
    m(0, 0) = u[0];
    m(0, 1) = u[1];
    m(1, 0) = u[2];
    m(1, 1) = u[3];
    return m;
}

Complex Matrix::trace() const {
    Complex t(0.0, 0.0);
    for (std::size_t i = 0; i < dim_; ++i) t += (*this)(i, i);
    return t;
}

Matrix kron(const Matrix& a, const Matrix& b) {
    const std::size_t da = a.dim();
    const std::size_t db = b.dim();
    Matrix out(da * db);
    for (std::size_t ar = 0; ar < da; ++ar) {
        for (std::size_t ac = 0; ac < da; ++ac) {
            const Complex f = a(ar, ac);
            if (f == Complex(0.0, 0.0)) continue;
            for (std::size_t br = 0; br < db; ++br) {
                for (std::size_t bc = 0; bc < db; ++bc) {
                    out(ar * db + br, ac * db + bc) = f * b(br, bc);
                }
            }
        }
    }
    return out;
}

Matrix multiply(const Matrix& a, const Matrix& b) {
    if (a.dim() != b.dim()) {
        throw std::invalid_argument("Matrix dimensions do not match");
    }
    const std::size_t n = a.dim();
    Matrix out(n);
    for (std::size_t r = 0; r < n; ++r) {
        for (std::size_t k = 0; k < n; ++k) {
            const Complex f = a(r, k);
            if (f == Complex(0.0, 0.0)) continue;
            for (std::size_t c = 0; c < n; ++c) {
                out(r, c) += f * b(k, c);
            }
        }
    }
    return out;
}

Matrix adjoint(const Matrix& m) {
    Matrix out(m.dim());
    for (std::size_t r = 0; r < m.dim(); ++r) {
        for (std::size_t c = 0; c < m.dim(); ++c) {
            out(c, r) = std::conj(m(r, c));
        }
    }
    return out;
}

StateVector mat_vec(const Matrix& m, const StateVector& v) {
    if (m.dim() != v.size()) {
        throw std::invalid_argument("Operator and state dimensions do not match");
    }
    StateVector out(v.size(), Complex(0.0, 0.0));
    for (std::size_t r = 0; r < m.dim(); ++r) {
        Complex acc(0.0, 0.0);
        for (std::size_t c = 0; c < m.dim(); ++c) {
            acc += m(r, c) * v[c];
        }
        out[r] = acc;
    }
    return out;
}

Complex inner_product(const StateVector& a, const StateVector& b) {
    if (a.size() != b.size()) {
        throw std::invalid_argument("States must have the same dimension");
    }
    Complex acc(0.0, 0.0);
    for (std::size_t i = 0; i < a.size(); ++i) {
        acc += std::conj(a[i]) * b[i];
    }
    return acc;
}

double norm_squared(const StateVector& v) {
    double sum = 0.0;
    for (const auto& amp : v) sum += std::norm(amp);
    return sum;
}

bool is_unitary(const Matrix& m, double tolerance) {
    const Matrix product = multiply(adjoint(m), m);
    const Matrix id = Matrix::identity(m.dim());
    for (std::size_t i = 0; i < product.data().size(); ++i) {
        if (std::abs(product.data()[i] - id.data()[i]) > tolerance) return false;
    }
    return true;
}

bool is_hermitian(const Matrix& m, double tolerance) {
    for (std::size_t r = 0; r < m.dim(); ++r) {
        for (std::size_t c = r; c < m.dim(); ++c) {
            if (std::abs(m(r, c) - std::conj(m(c, r))) > tolerance) return false;
        }
    }
    return true;
}

std::vector<double> hermitian_eigenvalues(const Matrix& m) {
    if (m.empty()) {
        throw std::invalid_argument("Eigenvalues of an empty matrix");
    }
    if (m.dim() == 1) {
        return {m(0, 0).real()};
    }
    if (m.dim() == 2) {
        return eigenvalues_2x2(m);
    }

    Matrix a = m;
    for (int sweep = 0; sweep < kMaxJacobiSweeps; ++sweep) {
        if (off_diagonal_norm(a) < kJacobiTolerance) break;
        for (std::size_t p = 0; p + 1 < a.dim(); ++p) {
            for (std::size_t q = p + 1; q < a.dim(); ++q) {
                jacobi_rotate(a, p, q);
            }
        }
    }

    std::vector<double> values;
    values.reserve(a.dim());
    for (std::size_t i = 0; i < a.dim(); ++i) values.push_back(a(i, i).real());
    std::sort(values.begin(), values.end());
    return values;
}

} // namespace qscope::quantum
