#pragma once

#include <optional>
#include "xtensor/xarray.hpp"

using std::optional;
using std::nullopt;

/* Holds a matrix together with its inverse.  The inverse is only ever filled
 * in from outside (see cache_solve), the holder itself performs no
 * computation.  Replacing the matrix discards the inverse, so a stored
 * inverse always belongs to the matrix returned by get(). */
template<class Array>
class CachedMatrix {
    private:
        Array x;
        optional<Array> inv;

    public:
        CachedMatrix() : inv(nullopt) {
            x = xt::zeros<double>({0, 0});
        }

        CachedMatrix(const Array& _x) : x(_x), inv(nullopt) {}

        void set(const Array& _x) {
            x = _x;
            inv.reset();
        }

        const Array& get() const {
            return x;
        }

        // No check against x is done here, the caller has to pass the inverse of get().
        // The inverse is copied, the holder never shares storage with the caller.
        void set_inverse(const optional<Array>& _inv) {
            inv = _inv;
        }

        const optional<Array>& get_inverse() const {
            return inv;
        }

        inline bool has_inverse() const {
            return inv.has_value();
        }

        inline void invalidate_cache() {
            inv.reset();
        }
};
