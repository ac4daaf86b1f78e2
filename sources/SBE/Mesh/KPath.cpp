#include "KPath.hpp"
#include "../Errors.hpp"

namespace SBE::Mesh {
    namespace {
        void check_point_count(int N, const std::string& name) 
        {
            if (N < 1) {
                throw ConfigurationError("A path needs at least one k-point, got " + name + "=" + std::to_string(N));
            }
        }

        // alpha_i = -1/2 + (i + 1/2) / N, symmetric around 0 with spacing 1 / N
        inline h_float centered_fraction(int i, int N) {
            return -0.5 + (i + 0.5) / N;
        }

        struct HexagonalZone {
            const h_float a;
            const real_vector<2> b1;
            const real_vector<2> b2;

            explicit HexagonalZone(h_float _a)
                : a{_a}, b1{ (2. * pi / (a * sqrt_3)) * real_vector<2>{ sqrt_3, -1. } },
                b2{ (4. * pi / (a * sqrt_3)) * real_vector<2>{ 0., 1. } }
            {}

            bool contains(const real_vector<2>& p) const {
                const h_float x = std::abs(p(0));
                const h_float y = std::abs(p(1));
                return (y <= 2. * pi / (sqrt_3 * a)) && (sqrt_3 * x + y <= 4. * pi / (sqrt_3 * a));
            }

            // Moves p by one reciprocal lattice vector towards the first zone
            real_vector<2> reflect(real_vector<2> p) const {
                const h_float x = p(0);
                const h_float y = p(1);
                const h_float edge = 4. * pi / (sqrt_3 * a);
                if (y > 2. * pi / (sqrt_3 * a))          p -= b2;      // top
                else if (y < -2. * pi / (sqrt_3 * a))    p += b2;      // bottom
                else if (sqrt_3 * x + y > edge)          p -= b1 + b2; // top right
                else if (-sqrt_3 * x + y < -edge)        p -= b1;      // bottom right
                else if (sqrt_3 * x + y < -edge)         p += b1 + b2; // bottom left
                else if (-sqrt_3 * x + y > edge)         p += b1;      // top left
                return p;
            }

            real_vector<2> fold(real_vector<2> p) const {
                constexpr int max_reflections = 16;
                for (int i = 0; i < max_reflections && !contains(p); ++i) {
                    p = reflect(p);
                }
                return p;
            }
        };
    }

    nd_vector Path::kx() const
    {
        nd_vector ret(points.size());
        for (int i = 0; i < size(); ++i) {
            ret(i) = points[i].x;
        }
        return ret;
    }

    nd_vector Path::ky() const
    {
        nd_vector ret(points.size());
        for (int i = 0; i < size(); ++i) {
            ret(i) = points[i].y;
        }
        return ret;
    }

    nd_vector Path::kx(h_float shift, const real_vector<2>& direction) const
    {
        return (kx().array() + shift * direction(0)).matrix();
    }

    nd_vector Path::ky(h_float shift, const real_vector<2>& direction) const
    {
        return (ky().array() + shift * direction(1)).matrix();
    }

    KMesh two_line_mesh(int Nk_in_path, h_float rel_dist_to_Gamma, h_float path_length, h_float lattice_constant, h_float angle)
    {
        check_point_count(Nk_in_path, "Nk_in_path");
        KMesh mesh;
        const h_float angle_rad = angle * pi / 180.;
        mesh.E_dir = real_vector<2>{ std::cos(angle_rad), std::sin(angle_rad) };

        const real_vector<2> k_path = path_length * mesh.E_dir;
        const real_vector<2> k_ortho = 2. * (pi / lattice_constant) * rel_dist_to_Gamma * mesh.E_ort();

        for (const h_float side : { -1., 1. }) {
            Path path;
            path.dk = path_length / Nk_in_path;
            path.points.reserve(Nk_in_path);
            for (int i = 0; i < Nk_in_path; ++i) {
                const real_vector<2> k = side * k_ortho + centered_fraction(i, Nk_in_path) * k_path;
                path.points.push_back(KPoint{ k(0), k(1) });
            }
            mesh.paths.push_back(std::move(path));
        }
        return mesh;
    }

    KMesh hexagonal_mesh(int Nk1, int Nk2, h_float lattice_constant, Alignment align)
    {
        check_point_count(Nk1, "Nk1");
        check_point_count(Nk2, "Nk2");
        const HexagonalZone zone(lattice_constant);
        KMesh mesh;
        mesh.paths.reserve(Nk2);

        if (align == Alignment::M) {
            mesh.E_dir = real_vector<2>{ std::cos(-pi / 6.), std::sin(-pi / 6.) };
            for (int j = 0; j < Nk2; ++j) {
                Path path;
                path.dk = zone.b1.norm() / Nk1;
                path.points.reserve(Nk1);
                for (int i = 0; i < Nk1; ++i) {
                    const real_vector<2> k = zone.fold(centered_fraction(i, Nk1) * zone.b1 + centered_fraction(j, Nk2) * zone.b2);
                    path.points.push_back(KPoint{ k(0), k(1) });
                }
                mesh.paths.push_back(std::move(path));
            }
        }
        else {
            mesh.E_dir = real_vector<2>::UnitX();
            const real_vector<2> b_a1 = (8. * pi / (3. * lattice_constant)) * real_vector<2>{ 1., 0. };
            const real_vector<2> b_a2 = (4. * pi / (3. * lattice_constant)) * real_vector<2>{ 1., sqrt_3 };
            // Points leaving the first zone on the right are moved to the second zone on the left
            const real_vector<2> back_shift = (2. * pi / lattice_constant) * real_vector<2>{ 1., 1. / sqrt_3 };
            // 1.5 spacings of b_a1 reach the equivalent point of the next zone
            constexpr h_float extent = 1.5;

            for (int j = 0; j < Nk2; ++j) {
                Path path;
                path.dk = extent * b_a1.norm() / Nk1;
                path.points.reserve(Nk1);
                const h_float alpha2 = 0.5 * j / Nk2;
                for (int i = 0; i < Nk1; ++i) {
                    const h_float alpha1 = -0.5 + extent * (i + 0.5) / Nk1;
                    real_vector<2> k = alpha1 * b_a1 + alpha2 * b_a2;
                    if (!zone.contains(k)) {
                        k -= back_shift;
                    }
                    path.points.push_back(KPoint{ k(0), k(1) });
                }
                mesh.paths.push_back(std::move(path));
            }
        }
        return mesh;
    }

    Alignment alignment_from_string(const std::string& align)
    {
        if (align == "K") return Alignment::K;
        if (align == "M") return Alignment::M;
        throw ConfigurationError("Alignment '" + align + "' is not recognized! Use 'K' or 'M'.");
    }
}
