#include "inverse_impl.h"

Eigen::MatrixXd eigen_inverse(const Eigen::MatrixXd& A, const InverseOptions& options) {
    int n = A.rows();
    switch(options.method) {
        case InverseMethod::PartialPivLU: {
            Eigen::PartialPivLU<Eigen::MatrixXd> lu(A);
            double rcond = lu.rcond();
            if(!(rcond >= options.tol))
                throw InvalidMatrixError(fmt::format("Matrix is computationally singular: reciprocal condition number = {:g}.", rcond));
            return lu.inverse();
        }
        case InverseMethod::FullPivLU: {
            Eigen::FullPivLU<Eigen::MatrixXd> lu(A);
            if(!lu.isInvertible())
                throw InvalidMatrixError(fmt::format("Matrix is singular: rank {} < {}.", lu.rank(), n));
            double rcond = lu.rcond();
            if(!(rcond >= options.tol))
                throw InvalidMatrixError(fmt::format("Matrix is computationally singular: reciprocal condition number = {:g}.", rcond));
            return lu.inverse();
        }
        case InverseMethod::ColPivHouseholderQR: {
            Eigen::ColPivHouseholderQR<Eigen::MatrixXd> qr(A);
            qr.setThreshold(options.tol);
            if(!qr.isInvertible())
                throw InvalidMatrixError(fmt::format("Matrix is singular: rank {} < {}.", qr.rank(), n));
            return qr.inverse();
        }
        case InverseMethod::FullPivHouseholderQR: {
            Eigen::FullPivHouseholderQR<Eigen::MatrixXd> qr(A);
            qr.setThreshold(options.tol);
            if(!qr.isInvertible())
                throw InvalidMatrixError(fmt::format("Matrix is singular: rank {} < {}.", qr.rank(), n));
            return qr.inverse();
        }
    }
    throw std::invalid_argument("Unknown inversion method.");
}

string method_name(InverseMethod method) {
    switch(method) {
        case InverseMethod::PartialPivLU:
            return "PartialPivLU";
        case InverseMethod::FullPivLU:
            return "FullPivLU";
        case InverseMethod::ColPivHouseholderQR:
            return "ColPivHouseholderQR";
        case InverseMethod::FullPivHouseholderQR:
            return "FullPivHouseholderQR";
    }
    throw std::invalid_argument("Unknown inversion method.");
}

typedef xt::xarray<double> Array;
template Array invert<Array>(const Array& a, const InverseOptions& options);
