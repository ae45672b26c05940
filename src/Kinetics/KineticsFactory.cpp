#include "Kinetics/KineticsFactory.hpp"

#include <algorithm>
#include <cctype>
#include <string>
#include <utility>

#include "Errors.hpp"
#include "Logger.hpp"

namespace {

const std::vector<std::pair<std::string, KineticsType>>& kineticsNames() {
    static const std::vector<std::pair<std::string, KineticsType>> names = {
        {"monod", KineticsType::Monod},
        {"linear", KineticsType::Linear},
        {"haldane", KineticsType::Haldane},
        {"contois", KineticsType::Contois},
        {"teissier", KineticsType::Teissier},
        {"moser", KineticsType::Moser},
        {"chen-hashimoto", KineticsType::ChenHashimoto},
        {"andrews", KineticsType::Andrews},
        {"ierusalimsky", KineticsType::Ierusalimsky},
    };
    return names;
}

realtype lookup(KineticsType type, const ParameterMap& parameters, const std::string& name) {
    auto it = parameters.find(name);
    if (it == parameters.end()) {
        throw ConfigurationError(kineticsName(type) + ": missing required parameter " + name);
    }
    return it->second;
}

}  // namespace

KineticsType parseKineticsType(const std::string& name) {
    std::string key = name;
    std::transform(key.begin(), key.end(), key.begin(), [](unsigned char c) {
        return c == '_' ? '-' : static_cast<char>(std::tolower(c));
    });
    for (const auto& [known, type] : kineticsNames()) {
        if (known == key) return type;
    }
    throw ConfigurationError("Unknown kinetics: " + name);
}

std::vector<std::string> requiredParameters(KineticsType type) {
    switch (type) {
        case KineticsType::Monod:
            return {"mu_max", "K_S"};
        case KineticsType::Linear:
            return {"k"};
        case KineticsType::Haldane:
        case KineticsType::Andrews:
            return {"mu_max", "K_S", "K_I"};
        case KineticsType::Contois:
            return {"mu_max", "K_C"};
        case KineticsType::Teissier:
            return {"mu_max", "K_T"};
        case KineticsType::Moser:
            return {"mu_max", "K_S", "n"};
        case KineticsType::ChenHashimoto:
            return {"mu_max", "S0", "k_CH"};
        case KineticsType::Ierusalimsky:
            return {"mu_max", "K_S", "K_P"};
    }
    throw ConfigurationError("Unknown kinetics type " + std::to_string(static_cast<int>(type)));
}

KineticsLaw makeKineticsLaw(KineticsType type, const ParameterMap& p) {
    auto get = [type, &p](const std::string& name) { return lookup(type, p, name); };

    KineticsLaw kinetics = [&]() -> KineticsLaw {
        switch (type) {
            case KineticsType::Monod:
                return MonodKinetics{get("mu_max"), get("K_S")};
            case KineticsType::Linear:
                return LinearKinetics{get("k")};
            case KineticsType::Haldane:
                return HaldaneKinetics{get("mu_max"), get("K_S"), get("K_I")};
            case KineticsType::Contois:
                return ContoisKinetics{get("mu_max"), get("K_C")};
            case KineticsType::Teissier:
                return TeissierKinetics{get("mu_max"), get("K_T")};
            case KineticsType::Moser:
                return MoserKinetics{get("mu_max"), get("K_S"), get("n")};
            case KineticsType::ChenHashimoto:
                return ChenHashimotoKinetics{get("mu_max"), get("S0"), get("k_CH")};
            case KineticsType::Andrews:
                return AndrewsKinetics{get("mu_max"), get("K_S"), get("K_I")};
            case KineticsType::Ierusalimsky:
                return IerusalimskyKinetics{get("mu_max"), get("K_S"), get("K_P")};
        }
        throw ConfigurationError("Unknown kinetics type " + std::to_string(static_cast<int>(type)));
    }();

    validate(kinetics);
    LOG("kinetics_factory.log", "Created " << describe(kinetics) << "\n");
    return kinetics;
}

KineticsLaw makeKineticsLaw(const std::string& name, const ParameterMap& parameters) {
    return makeKineticsLaw(parseKineticsType(name), parameters);
}

const ParameterMap& defaultKineticParameters() {
    // mu_max [1/d], K_S/K_T/K_P/S0 [g/L], K_I [g/L], K_C [-], k [1/d]
    static const ParameterMap defaults = {
        {"mu_max", 0.4}, {"K_S", 20.0}, {"K_I", 250.0}, {"K_C", 5.0},  {"K_T", 15.0},
        {"k", 0.05},     {"n", 1.0},    {"S0", 100.0},  {"k_CH", 0.5}, {"K_P", 250.0},
    };
    return defaults;
}
