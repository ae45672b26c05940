#ifndef EIGENDATATYPES_HPP
#define EIGENDATATYPES_HPP

#include <cstddef>
#include <functional>

#include "Eigen/Dense"
#include "sundials/sundials_types.h"

// dynamic-sized Vector
using Vector = Eigen::Vector<realtype, Eigen::Dynamic>;
// N_Vector storage is not guaranteed to be 16-byte aligned -> unaligned maps
using VectorMap = Eigen::Map<Vector>;
using ConstVectorMap = Eigen::Map<const Vector>;

// dynamic-sized 2D Array, row‐major (one row per sample, one column per state)
using Array = Eigen::Array<realtype, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;

// Column and row *array* types (elementwise semantics)
using ColVector = Eigen::Array<realtype, Eigen::Dynamic, 1>;
using RowVector = Eigen::Array<realtype, 1, Eigen::Dynamic>;

// Right-hand side of an ODE system y' = f(t, y)
using OdeRhs = std::function<void(realtype t, const ConstVectorMap& y, VectorMap& dy_dt)>;

#endif  // EIGENDATATYPES_HPP
