#pragma once

#include "GlobalDefinitions.hpp"
#include "Mesh/KPath.hpp"
#include "Dynamics/GaugeStrategy.hpp"

#include <mrock/utility/InputFileReader.hpp>
#include <iostream>
#include <string>
#include <nlohmann/json.hpp>

namespace SBE {
    /**
     * Parameters of one run, all quantities in atomic units.
     * The defaults are the reference parameter set.
     * Constructed once and passed by const reference, never modified during a run.
     */
    struct SimulationConfig {
        // Band model
        std::string system_type{"BiTe"};
        h_float lattice_constant{8.308};
        h_float e_fermi{0.2 * eV_to_au};
        h_float temperature{0.03 * eV_to_au};
        h_float C0{};
        h_float C2{};
        h_float A{0.1974};
        h_float R{11.06};
        h_float k_sym{};
        h_float k_asym{};

        // Brillouin zone
        std::string BZ_type{"2line"};
        int Nk_in_path{400};
        h_float rel_dist_to_Gamma{0.05};
        h_float path_length{5. * pi / 8.308};
        h_float angle_inc_E_field{}; ///< in degrees
        int Nk1{50};
        int Nk2{50};
        Mesh::Alignment align{Mesh::Alignment::K};

        // Pulse
        h_float E0{5. * MVpcm_to_au};
        h_float w{25. * THz_to_au};
        h_float chirp{0.01 * THz_to_au};
        h_float alpha{25. * fs_to_au};
        h_float phase{};

        // Time scales
        h_float T1{10. * fs_to_au};
        h_float T2{1. * fs_to_au};
        h_float t0{1200. * fs_to_au}; ///< half width of the simulated window
        h_float dt{0.02 * fs_to_au};
        int Nt{4000};

        Dynamics::Gauge gauge{Dynamics::Gauge::Length};
        bool dipole_off{false};
        bool save_full{false};
        bool user_out{true};
        std::string data_dir{"data"};

        /// Reads every key from the input file and converts it to atomic units
        static SimulationConfig from_file(mrock::utility::InputFileReader& input);
        static bool flag_from_string(const std::string& flag);

        /// Throws ConfigurationError on the first invalid parameter
        void validate() const;

        bool is_resummed() const noexcept;
        bool is_two_line() const noexcept;
        Dynamics::Relaxation relaxation() const noexcept;

        /// Nk1-{}_Nk2-{}_w{}_E{}_a{}_ph{}_T2-{} with w in THz, E in MV/cm, a and T2 in fs
        std::string file_tail() const;
        nlohmann::json to_json() const;
    };

    std::ostream& operator<<(std::ostream& os, SimulationConfig const& config);
}
