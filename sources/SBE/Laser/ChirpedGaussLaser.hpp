#pragma once

#include "Laser.hpp"

namespace SBE::Laser {
    /**
     * E(t) = E_0 exp(-t^2 / (2 alpha)^2) sin(2 pi w t (1 + chirp t) + phase)
     * The pulse is centered at t = 0.
     */
    struct ChirpedGaussLaser : public Laser {
        const h_float frequency{};  ///< w in a.u.
        const h_float chirp{};      ///< in a.u.
        const h_float width{};      ///< alpha in a.u.
        const h_float phase{};      ///< carrier-envelope phase

        ChirpedGaussLaser(h_float E_0, h_float _frequency, h_float _chirp, h_float _width, h_float _phase);

        h_float envelope(h_float t) const final;
        h_float carrier(h_float t) const final;
    };
}
