// lawful/algebra/algebra.h
//
// Convenience header: includes the complete algebra layer.
//
// Components:
//   operations.h  Typed operations: min, max, plus, tropical_plus, ...
//   concepts.h    semigroup, monoid, commutative_monoid, semiring
//   structures.h  Catalog: sum/min/max/any/all monoids, tropical,
//                   boolean, counting, max-plus, bottleneck semirings
//   instances.h   product_of, optional_monoid, map_monoid
//   gaussian.h    Gaussian sufficient statistics monoid
//
// Usage pattern (same algorithm, different algebra):
//
//   #include <lawful/algebra/algebra.h>
//   using namespace lawful::algebra;
//
//   static_assert(semiring<tropical_semiring<double>>);
//   static_assert(semiring<boolean_semiring>);
//
//   auto d = mul(tropical_semiring<double>{}, 2.0, 3.0);   // 5.0
//   auto r = mul(boolean_semiring{}, true, false);         // false
//
// Copyright (c) 2025 Andrew Drakeford. All rights reserved.

#ifndef LAWFUL_ALGEBRA_ALGEBRA_H
#define LAWFUL_ALGEBRA_ALGEBRA_H

#include "lawful/algebra/operations.h"
#include "lawful/algebra/concepts.h"
#include "lawful/algebra/structures.h"
#include "lawful/algebra/instances.h"
#include "lawful/algebra/gaussian.h"

#endif  // LAWFUL_ALGEBRA_ALGEBRA_H
