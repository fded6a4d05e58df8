#pragma once

#include <functional>
#include <cstdio>
#include <fmt/core.h>
#include "cachedmatrix.h"
#include "inverse.h"

template<class Array>
using Inverter = std::function<Array(const Array&, const InverseOptions&)>;

/* Returns the inverse of x.get().  If x already holds an inverse it is
 * returned as is, otherwise impl is called, the result is stored in x and
 * then returned.  If impl throws, nothing is stored and the exception
 * propagates, so the next call tries again.
 *
 * The reference points into x and stays valid until x.set(),
 * x.set_inverse() or x.invalidate_cache() is called. */
template<class Array>
const Array& cache_solve(CachedMatrix<Array>& x, const InverseOptions& options = InverseOptions(), const Inverter<Array>& impl = invert<Array>) {
    if(x.has_inverse()) {
        if(options.verbose)
            fmt::print(stderr, "A previously stored inverse has been retrieved for this matrix.\n");
        return *x.get_inverse();
    }
    x.set_inverse(impl(x.get(), options));
    if(options.verbose)
        fmt::print(stderr, "The retrieved inverse is null so a new one has been calculated and stored.\n");
    return *x.get_inverse();
}
