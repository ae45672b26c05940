#ifndef DIGESTER_MODEL_HPP
#define DIGESTER_MODEL_HPP

#include "EigenDataTypes.hpp"
#include "Kinetics/KineticsLaw.hpp"
#include "Reactor/MassBalance.hpp"

/**
 * \brief Batch digester RHS builder
 *
 * Binds a rate law and the split-yield mass balance into y' = f(t, y) on
 * y = [S, B, G]. The state reaches the rate law unmodified: a stage below
 * zero raises the law's own DomainError (moser with non-integer n).
 */
OdeRhs digesterModel_rhs(const KineticsLaw& kinetics, const YieldCoefficients& yields);

#endif  // DIGESTER_MODEL_HPP
