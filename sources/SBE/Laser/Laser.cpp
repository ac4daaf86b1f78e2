#include "Laser.hpp"

namespace SBE::Laser {
    Laser::Laser(h_float _field_amplitude)
        : field_amplitude{_field_amplitude}
    { }
}
