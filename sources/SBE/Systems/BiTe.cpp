#include "BiTe.hpp"

namespace SBE::Systems {
    namespace {
        constexpr h_float series_threshold = 1e-2;

        // 2 (1 - cos x) / x^2 = k^2 resummation factor, and its x-derivative divided by x
        inline h_float symmetric_factor(h_float x) {
            if (std::abs(x) < series_threshold) {
                return 1. - x * x / 12.;
            }
            return 2. * (1. - std::cos(x)) / (x * x);
        }
        inline h_float symmetric_factor_derivative(h_float x) {
            if (std::abs(x) < series_threshold) {
                return -1. / 6. + x * x / 90.;
            }
            return 2. * (x * std::sin(x) - 2. * (1. - std::cos(x))) / (x * x * x * x);
        }

        // 6 (x - sin x) / x^3 = k^3 resummation factor, and its x-derivative divided by x
        inline h_float asymmetric_factor(h_float x) {
            if (std::abs(x) < series_threshold) {
                return 1. - x * x / 20. + x * x * x * x / 840.;
            }
            return 6. * (x - std::sin(x)) / (x * x * x);
        }
        inline h_float asymmetric_factor_derivative(h_float x) {
            if (std::abs(x) < series_threshold) {
                return -1. / 10. + x * x / 210.;
            }
            return 6. * (x * (1. - std::cos(x)) - 3. * (x - std::sin(x))) / (x * x * x * x * x);
        }
    }

    BiTe::BiTe(h_float _C0, h_float _C2, h_float _A, h_float _R, h_float _k_sym, h_float _k_asym)
        : C0{_C0}, C2{_C2}, A{_A}, R{_R}, k_sym{_k_sym}, k_asym{_k_asym}
    { }

    TwoBandSystem::Coefficients BiTe::coefficients(h_float kx, h_float ky) const
    {
        Coefficients c;
        const h_float k = norm(kx, ky);
        const h_float k_squared = kx * kx + ky * ky;

        // g(k) multiplies the polynomial, grad g = kappa^2 g'(x)/x (k_x, k_y) with x = kappa k
        h_float g_sym{1}, dg_sym{};
        if (k_sym > 0) {
            g_sym = symmetric_factor(k_sym * k);
            dg_sym = k_sym * k_sym * symmetric_factor_derivative(k_sym * k);
        }
        h_float g_asym{1}, dg_asym{};
        if (k_asym > 0) {
            g_asym = asymmetric_factor(k_asym * k);
            dg_asym = k_asym * k_asym * asymmetric_factor_derivative(k_asym * k);
        }

        c.h0 = C0 + C2 * k_squared * g_sym;
        c.grad_h0(0) = C2 * (2. * kx * g_sym + k_squared * dg_sym * kx);
        c.grad_h0(1) = C2 * (2. * ky * g_sym + k_squared * dg_sym * ky);

        const h_float warping = kx * kx * kx - 3. * kx * ky * ky;
        c.d(0) = A * ky;
        c.d(1) = -A * kx;
        c.d(2) = 2. * R * warping * g_asym;

        c.grad_d(0, 0) = 0.;
        c.grad_d(0, 1) = A;
        c.grad_d(1, 0) = -A;
        c.grad_d(1, 1) = 0.;
        c.grad_d(2, 0) = 2. * R * ((3. * kx * kx - 3. * ky * ky) * g_asym + warping * dg_asym * kx);
        c.grad_d(2, 1) = 2. * R * (-6. * kx * ky * g_asym + warping * dg_asym * ky);

        return c;
    }

    std::string BiTe::info() const
    {
        return (is_resummed() ? "BiTeResummed\nC0=" : "BiTe\nC0=") + std::to_string(C0) + "\n" 
            + "C2=" + std::to_string(C2) + "\n" 
            + "A=" + std::to_string(A) + "\n" 
            + "R=" + std::to_string(R) + "\n"
            + "k_sym=" + std::to_string(k_sym) + "\n"
            + "k_asym=" + std::to_string(k_asym) + "\n";
    }

    nlohmann::json BiTe::to_json() const
    {
        return nlohmann::json {
            { "system_type",    is_resummed() ? "BiTeResummed" : "BiTe" },
            { "C0",             C0 },
            { "C2",             C2 },
            { "A",              A },
            { "R",              R },
            { "k_sym",          k_sym },
            { "k_asym",         k_asym }
        };
    }
}
