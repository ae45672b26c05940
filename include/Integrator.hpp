#ifndef INTEGRATOR_HPP
#define INTEGRATOR_HPP

#include "EigenDataTypes.hpp"
#include "Observers/TimeSeriesObserver.hpp"

/**
 * @brief Interface of a time integrator for y' = f(t, y)
 *
 * Integrates from observer.t_start() with initial state y0 and writes the
 * solution at every sample time of the observer. Sample times must not
 * influence the steps the integrator takes. Implementations throw
 * IntegrationError on failure and let exceptions raised by f propagate
 * unchanged.
 */
class IntegratorBase {
   public:
    virtual ~IntegratorBase() = default;

    virtual void integrate(const OdeRhs& rhs, const Vector& y0, TimeSeriesObserver& observer) const = 0;
};

#endif  // INTEGRATOR_HPP
