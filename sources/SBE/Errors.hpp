#pragma once

#include "GlobalDefinitions.hpp"
#include <stdexcept>
#include <string>

namespace SBE {
    /// Invalid input detected while setting up a run
    struct ConfigurationError : public std::invalid_argument {
        explicit ConfigurationError(const std::string& what)
            : std::invalid_argument("ConfigurationError: " + what) {}
    };

    /// The stiff solver rejected a step irrecoverably
    struct IntegrationFailure : public std::runtime_error {
        const h_float t{};

        IntegrationFailure(const std::string& what, h_float _t)
            : std::runtime_error("IntegrationFailure at t=" + std::to_string(_t) + ": " + what), t{_t} {}
    };

    /// A non-finite value was produced by the band model or the equations of motion
    struct NumericalDomainError : public std::runtime_error {
        const h_float kx{};
        const h_float ky{};
        const h_float t{};

        NumericalDomainError(const std::string& what, h_float _kx, h_float _ky, h_float _t = std::numeric_limits<h_float>::quiet_NaN())
            : std::runtime_error("NumericalDomainError at k=(" + std::to_string(_kx) + ", " + std::to_string(_ky) 
                + "), t=" + std::to_string(_t) + ": " + what), 
            kx{_kx}, ky{_ky}, t{_t} {}
    };
}
