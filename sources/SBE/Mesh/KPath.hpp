#pragma once

#include "../GlobalDefinitions.hpp"
#include <vector>
#include <string>

namespace SBE::Mesh {
    struct KPoint {
        h_float x{};
        h_float y{};
    };

    /**
     * Ordered k-points with periodic wraparound, i.e., the point after the last one is the first one.
     * dk is the spacing used by the finite-difference gradient along the path.
     */
    struct Path {
        std::vector<KPoint> points;
        h_float dk{};

        inline int size() const noexcept {
            return static_cast<int>(points.size());
        }

        nd_vector kx() const;
        nd_vector ky() const;
        /// Coordinates displaced by shift * direction
        nd_vector kx(h_float shift, const real_vector<2>& direction) const;
        nd_vector ky(h_float shift, const real_vector<2>& direction) const;
    };

    enum class Alignment { K, M };

    struct KMesh {
        std::vector<Path> paths;
        real_vector<2> E_dir{ real_vector<2>::UnitX() };

        /// (E_dir_y, -E_dir_x)
        inline real_vector<2> E_ort() const {
            return real_vector<2>{ E_dir(1), -E_dir(0) };
        }
        inline int n_paths() const noexcept {
            return static_cast<int>(paths.size());
        }
        inline int points_per_path() const noexcept {
            return paths.empty() ? 0 : paths.front().size();
        }
    };

    /**
     * Two paths of length path_length parallel to the field direction,
     * displaced by -+ 2 pi / a * rel_dist_to_Gamma perpendicular to it.
     * 
     * @param angle direction of the field in degrees, measured from the k_x axis
     */
    KMesh two_line_mesh(int Nk_in_path, h_float rel_dist_to_Gamma, h_float path_length, h_float lattice_constant, h_float angle);

    /**
     * Monkhorst-Pack lines through the hexagonal Brillouin zone.
     * Alignment::M: Nk2 lines along b1 (Gamma-M), field along b1
     * Alignment::K: Nk2 lines along Gamma-K covering 1.5 reciprocal spacings, field along k_x
     */
    KMesh hexagonal_mesh(int Nk1, int Nk2, h_float lattice_constant, Alignment align);

    Alignment alignment_from_string(const std::string& align);
}
