#pragma once

#include <limits>
#include <stdexcept>
#include <string>
using std::string;

enum class InverseMethod {
    PartialPivLU,
    FullPivLU,
    ColPivHouseholderQR,
    FullPivHouseholderQR
};

struct InverseOptions {
    InverseMethod method = InverseMethod::PartialPivLU;
    /* For the LU methods a matrix counts as singular when its estimated
     * reciprocal condition number is below tol.  For the QR methods tol is
     * the relative pivot threshold of the rank revealing decomposition. */
    double tol = std::numeric_limits<double>::epsilon();
    bool verbose = true;
};

class InvalidMatrixError : public std::runtime_error {
    public:
        explicit InvalidMatrixError(const string& msg) : std::runtime_error(msg) {}
};

string method_name(InverseMethod method);

/* Returns the inverse of the square matrix a.  Throws InvalidMatrixError if a
 * is not a non-empty, square, finite and invertible 2d array, and
 * std::invalid_argument if the options are malformed. */
template<class Array>
Array invert(const Array& a, const InverseOptions& options);
