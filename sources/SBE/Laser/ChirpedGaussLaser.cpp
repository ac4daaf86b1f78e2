#include "ChirpedGaussLaser.hpp"

namespace SBE::Laser {
    ChirpedGaussLaser::ChirpedGaussLaser(h_float E_0, h_float _frequency, h_float _chirp, h_float _width, h_float _phase)
        : Laser(E_0), frequency{_frequency}, chirp{_chirp}, width{_width}, phase{_phase}
    { }

    h_float ChirpedGaussLaser::envelope(h_float t) const 
    {
        return std::exp(-(t * t) / (4.0 * width * width));
    }

    h_float ChirpedGaussLaser::carrier(h_float t) const
    {
        return std::sin(2.0 * pi * frequency * t * (1.0 + chirp * t) + phase);
    }
}
