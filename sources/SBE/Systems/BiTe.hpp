#pragma once

#include "TwoBandSystem.hpp"

namespace SBE::Systems {
    /**
     * Surface state of a topological insulator with hexagonal warping
     *   h_0 = C0 + C2 k^2,   d = (A k_y, -A k_x, 2 R (k_x^3 - 3 k_x k_y^2))
     * 
     * With k_sym > 0 (k_asym > 0) the powers of k are resummed into periodic-like functions
     *   k^2 -> 2 (1 - cos(k_sym k)) / k_sym^2
     *   k^3 -> 6 (k_asym k - sin(k_asym k)) / k_asym^3
     * which coincide with the polynomial close to Gamma.
     */
    class BiTe : public TwoBandSystem {
    public:
        BiTe() = delete;
        /// All parameters in atomic units
        BiTe(h_float _C0, h_float _C2, h_float _A, h_float _R, h_float _k_sym = h_float{}, h_float _k_asym = h_float{});

        Coefficients coefficients(h_float kx, h_float ky) const final;

        std::string info() const final;
        nlohmann::json to_json() const final;

        inline bool is_resummed() const noexcept {
            return k_sym > 0 || k_asym > 0;
        }
    private:
        const h_float C0{};
        const h_float C2{};
        const h_float A{};
        const h_float R{};
        const h_float k_sym{};
        const h_float k_asym{};
    };
}
