#pragma once

#include <cmath>
#include <stdexcept>
#include <fmt/core.h>
#include <Eigen/Dense>
#include "xtensor/xarray.hpp"
#include "inverse.h"

// Inverts A with the decomposition selected by options.method.
Eigen::MatrixXd eigen_inverse(const Eigen::MatrixXd& A, const InverseOptions& options);

template<class Array>
Array invert(const Array& a, const InverseOptions& options) {
    if(std::isnan(options.tol) || options.tol < 0)
        throw std::invalid_argument(fmt::format("tol has to be non-negative, got {}.", options.tol));
    if(a.dimension() != 2)
        throw InvalidMatrixError(fmt::format("Matrix needs to be 2d, got an array with {} dimensions.", a.dimension()));
    int n = a.shape(0);
    if(n == 0 || a.shape(1) == 0)
        throw InvalidMatrixError("Matrix is empty.");
    if(a.shape(1) != a.shape(0))
        throw InvalidMatrixError(fmt::format("Matrix needs to be square, got shape ({}, {}).", a.shape(0), a.shape(1)));

    // copy entry by entry so that the storage order of a does not matter
    Eigen::MatrixXd A = Eigen::MatrixXd(n, n);
    for (int i = 0; i < n; ++i) {
        for (int j = 0; j < n; ++j) {
            if(!std::isfinite(a(i, j)))
                throw InvalidMatrixError(fmt::format("Matrix has a non-finite entry at ({}, {}).", i, j));
            A(i, j) = a(i, j);
        }
    }

    Eigen::MatrixXd Ainv = eigen_inverse(A, options);

    Array res = xt::zeros<double>({n, n});
    for (int i = 0; i < n; ++i) {
        for (int j = 0; j < n; ++j) {
            res(i, j) = Ainv(i, j);
        }
    }
    return res;
}
