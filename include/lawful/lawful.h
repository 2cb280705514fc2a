// lawful/lawful.h
//
// Convenience header: the algebra layer, the reduction engine and the
// closure engine.
//
//   #include <lawful/lawful.h>
//   using namespace lawful;
//
//   std::vector<int> xs{1, 2, 3, 4, 5};
//   reduce::reduce(algebra::sum_monoid<int>{}, xs);                 // 15
//
//   matrix<double> g = ...;                                         // weights
//   closure::close(algebra::tropical_semiring<double>{}, g);        // distances
//
// Copyright (c) 2025 Andrew Drakeford. All rights reserved.

#ifndef LAWFUL_LAWFUL_H
#define LAWFUL_LAWFUL_H

#include "lawful/algebra/algebra.h"
#include "lawful/core/error.h"
#include "lawful/core/matrix.h"
#include "lawful/core/stats.h"
#include "lawful/core/workers.h"
#include "lawful/reduce/power.h"
#include "lawful/reduce/reduce.h"
#include "lawful/reduce/tuple_reduce.h"
#include "lawful/closure/relation_algebra.h"
#include "lawful/closure/closure.h"

#endif  // LAWFUL_LAWFUL_H
