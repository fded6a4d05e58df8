#include "xtensor/xarray.hpp"
#include "xtensor/xrandom.hpp"
#include "cachedmatrix.h"
#include "cachesolve.h"

#include <algorithm>
#include <chrono>
#include <iostream>
#include <fmt/core.h>

typedef xt::xarray<double> Array;

/* Times a fresh inversion against a cached lookup, both averaged over
 * nrepeat calls.  The fresh inversion is forced by invalidating the cache
 * before each call. */
void profile_cache_solve(InverseMethod method, int n){
    Array A = xt::random::rand<double>({n, n}, 0., 1.);
    for (int i = 0; i < n; ++i)
        A(i, i) += n;
    CachedMatrix<Array> cm(A);
    InverseOptions options;
    options.method = method;
    options.verbose = false;

    int nrepeat = std::max(1, int(1e7/(double(n)*n*n)));

    auto t1 = std::chrono::high_resolution_clock::now();
    for (int i = 0; i < nrepeat; ++i) {
        cm.invalidate_cache();
        cache_solve(cm, options);
    }
    auto t2 = std::chrono::high_resolution_clock::now();
    for (int i = 0; i < nrepeat; ++i) {
        cache_solve(cm, options);
    }
    auto t3 = std::chrono::high_resolution_clock::now();

    double computetime = std::chrono::duration_cast<std::chrono::nanoseconds>( t2 - t1 ).count();
    double retrievetime = std::chrono::duration_cast<std::chrono::nanoseconds>( t3 - t2 ).count();
    fmt::print("{:>21} {:>6d} {:>16.3f} {:>16.3f}\n", method_name(method), n, computetime/nrepeat/1000., retrievetime/nrepeat/1000.);
}

int main() {
    xt::random::seed(0);
    std::cout << "               Method      N  Compute (in us) Retrieve (in us)" << std::endl;
    for (auto method : {InverseMethod::PartialPivLU, InverseMethod::FullPivLU, InverseMethod::ColPivHouseholderQR, InverseMethod::FullPivHouseholderQR}) {
        for (int n = 4; n <= 256; n *= 4)
            profile_cache_solve(method, n);
        std::cout << std::endl;
    }
    return 0;
}
