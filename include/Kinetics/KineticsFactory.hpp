#ifndef KINETICS_FACTORY_HPP
#define KINETICS_FACTORY_HPP

#include <sundials/sundials_types.h>

#include <string>
#include <unordered_map>
#include <vector>

#include "Kinetics/KineticsLaw.hpp"

/// Named scalar parameters as a presentation layer holds them, e.g. {"mu_max", 0.4}
using ParameterMap = std::unordered_map<std::string, realtype>;

/** \brief Parse a variant tag ("monod", "Chen_Hashimoto", ...). Throws ConfigurationError if unknown. */
KineticsType parseKineticsType(const std::string& name);

/** \brief Parameter names the variant reads from a ParameterMap, in formula order. */
std::vector<std::string> requiredParameters(KineticsType type);

/**
 * @brief Build and validate a rate law from a variant tag and a parameter map
 *
 * Only the variant's own parameters are read, others are ignored. A missing or
 * out-of-domain parameter raises ConfigurationError naming the variant.
 */
KineticsLaw makeKineticsLaw(KineticsType type, const ParameterMap& parameters);
KineticsLaw makeKineticsLaw(const std::string& name, const ParameterMap& parameters);

/** \brief Default kinetic parameters of the interactive application for all variants. */
const ParameterMap& defaultKineticParameters();

#endif  // KINETICS_FACTORY_HPP
