#ifndef ERRORS_HPP
#define ERRORS_HPP

#include <stdexcept>
#include <string>

/**
 * @brief Error taxonomy of the simulation core
 *
 * ConfigurationError: unknown kinetics variant, missing parameter or a parameter
 *                     outside its formula's domain. Raised before integration.
 * DomainError:        a rate formula hit an undefined operation at runtime.
 * IntegrationError:   the step size collapsed, the step budget ran out or SUNDIALS
 *                     reported another failure.
 */
class ConfigurationError : public std::invalid_argument {
   public:
    using std::invalid_argument::invalid_argument;
};

class DomainError : public std::domain_error {
   public:
    using std::domain_error::domain_error;
};

class IntegrationError : public std::runtime_error {
   public:
    using std::runtime_error::runtime_error;
};

#endif  // ERRORS_HPP
