#include "xtensor/xarray.hpp"
#include "xtensor/xrandom.hpp"
#include "cachedmatrix.h"
#include "cachesolve.h"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <iostream>
#include <iomanip>
#include <stdexcept>
#include <string>

typedef xt::xarray<double> Array;

double max_residual(const Array& A, const Array& Ainv){
    int n = A.shape(0);
    double res = 0.;
    for (int i = 0; i < n; ++i) {
        for (int j = 0; j < n; ++j) {
            double s = 0.;
            for (int k = 0; k < n; ++k) {
                s += A(i, k) * Ainv(k, j);
            }
            res = std::max(res, std::abs(s - (i == j ? 1. : 0.)));
        }
    }
    return res;
}

int main(int argc, char** argv) {
    int n = 10;
    int seed = 0;
    try {
        if(argc > 1)
            n = std::stoi(argv[1]);
        if(argc > 2)
            seed = std::stoi(argv[2]);
    } catch (const std::logic_error&) {
        std::cerr << "usage: " << argv[0] << " [n] [seed]" << std::endl;
        return 1;
    }
    if(n <= 0) {
        std::cerr << "n has to be positive, got " << n << std::endl;
        return 1;
    }

    xt::random::seed(seed);
    Array A = xt::random::rand<double>({n, n}, 0., 1.);
    CachedMatrix<Array> cm(A);

    try {
        // the first call computes the inverse, the second one retrieves it
        auto t1 = std::chrono::high_resolution_clock::now();
        const Array& inv_first = cache_solve(cm);
        auto t2 = std::chrono::high_resolution_clock::now();
        const Array& inv_second = cache_solve(cm);
        auto t3 = std::chrono::high_resolution_clock::now();

        double computetime = std::chrono::duration_cast<std::chrono::microseconds>( t2 - t1 ).count();
        double retrievetime = std::chrono::duration_cast<std::chrono::microseconds>( t3 - t2 ).count();
        std::cout << "n = " << n << ", seed = " << seed << std::endl;
        std::cout << "Compute time:  " << computetime << " us." << std::endl;
        std::cout << "Retrieve time: " << retrievetime << " us." << std::endl;
        std::cout << "Same object:   " << (&inv_first == &inv_second ? "yes" : "no") << std::endl;
        std::cout << std::setprecision(5);
        std::cout << "max |A*inv(A) - I| = " << max_residual(cm.get(), inv_second) << std::endl;
    } catch (const InvalidMatrixError& e) {
        std::cerr << e.what() << std::endl;
        return 1;
    }
    return 0;
}
