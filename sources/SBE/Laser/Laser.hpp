#pragma once

#include "../GlobalDefinitions.hpp"
#include <cmath>

namespace SBE::Laser {
    /**
     * Driving pulse, linearly polarized along the field direction of the mesh.
     * Times and field strengths are in atomic units.
     */
    struct Laser {
        const h_float field_amplitude{}; // E_0 in a.u.

        explicit Laser(h_float _field_amplitude);
        virtual ~Laser() = default;

        virtual h_float envelope(h_float t) const = 0;
        virtual h_float carrier(h_float t) const = 0;

        inline h_float electric_field(h_float t) const {
            return field_amplitude * envelope(t) * carrier(t);
        }
    };
}
