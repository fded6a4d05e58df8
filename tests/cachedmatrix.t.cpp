#include "catch2/catch.hpp"

using namespace Catch;

#include "xtensor/xarray.hpp"
#include "cachedmatrix.h"

typedef xt::xarray<double> Array;

namespace {
TEST_CASE("default holder is empty and has no inverse", "[cachedmatrix]") {
  CachedMatrix<Array> cm;

  CHECK(cm.get().dimension() == 2);
  CHECK(cm.get().size() == 0);
  CHECK_FALSE(cm.has_inverse());
  CHECK_FALSE(cm.get_inverse().has_value());
}

TEST_CASE("constructing with a matrix stores it", "[cachedmatrix]") {
  Array x = {{1., 2.}, {3., 4.}};
  CachedMatrix<Array> cm(x);

  CHECK(cm.get() == x);
  CHECK_FALSE(cm.has_inverse());
}

TEST_CASE("set replaces the matrix and clears the inverse", "[cachedmatrix]") {
  Array m1 = {{2., 0.}, {0., 4.}};
  Array m1inv = {{0.5, 0.}, {0., 0.25}};
  Array m2 = {{1., 1.}, {0., 1.}};

  CachedMatrix<Array> cm;
  cm.set(m1);
  cm.set_inverse(m1inv);
  REQUIRE(cm.has_inverse());
  CHECK(*cm.get_inverse() == m1inv);

  cm.set(m2);
  CHECK(cm.get() == m2);
  CHECK_FALSE(cm.has_inverse());
}

TEST_CASE("set clears the inverse even for an equal matrix", "[cachedmatrix]") {
  Array m = {{2., 0.}, {0., 2.}};
  CachedMatrix<Array> cm(m);
  cm.set_inverse(Array({{0.5, 0.}, {0., 0.5}}));

  cm.set(m);
  CHECK_FALSE(cm.has_inverse());
}

TEST_CASE("set_inverse accepts an explicit absent value", "[cachedmatrix]") {
  Array m = {{2., 0.}, {0., 2.}};
  CachedMatrix<Array> cm(m);
  cm.set_inverse(Array({{0.5, 0.}, {0., 0.5}}));
  REQUIRE(cm.has_inverse());

  cm.set_inverse(nullopt);
  CHECK_FALSE(cm.has_inverse());
  CHECK(cm.get() == m);
}

TEST_CASE("an all zero inverse is still a stored inverse", "[cachedmatrix]") {
  CachedMatrix<Array> cm;
  cm.set_inverse(Array(xt::zeros<double>({2, 2})));

  CHECK(cm.has_inverse());
  CHECK(cm.get_inverse()->size() == 4);
}

TEST_CASE("invalidate_cache keeps the matrix", "[cachedmatrix]") {
  Array m = {{2., 0.}, {0., 2.}};
  CachedMatrix<Array> cm(m);
  cm.set_inverse(Array({{0.5, 0.}, {0., 0.5}}));

  cm.invalidate_cache();
  CHECK_FALSE(cm.has_inverse());
  CHECK(cm.get() == m);
}

TEST_CASE("the holder keeps its own copy of the matrix", "[cachedmatrix]") {
  Array m = {{2., 0.}, {0., 2.}};
  CachedMatrix<Array> cm(m);

  m(0, 0) = 5.;
  CHECK(cm.get()(0, 0) == 2.);
}
TEST_CASE("the holder keeps its own copy of the inverse", "[cachedmatrix]") {
  CachedMatrix<Array> cm(Array({{2., 0.}, {0., 2.}}));
  Array inv = {{0.5, 0.}, {0., 0.5}};
  optional<Array> maybe_inv = inv;

  cm.set_inverse(inv);
  inv(0, 0) = 99.;
  CHECK((*cm.get_inverse())(0, 0) == 0.5);

  cm.set_inverse(maybe_inv);
  (*maybe_inv)(0, 0) = 99.;
  CHECK((*cm.get_inverse())(0, 0) == 0.5);
  CHECK(&*cm.get_inverse() != &*maybe_inv);
}
} // namespace
