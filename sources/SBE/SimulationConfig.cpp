#include "SimulationConfig.hpp"
#include "Errors.hpp"

#include <iomanip>
#include <sstream>

namespace SBE {
    namespace {
        std::string fixed_width(h_float number, int width, int precision, char fill = ' ')
        {
            std::ostringstream out;
            out << std::fixed << std::setprecision(precision) << std::setfill(fill) << std::internal << std::setw(width) << number;
            return out.str();
        }

        h_float damping_rate(h_float relaxation_time) noexcept
        {
            return relaxation_time > 0 ? 1. / relaxation_time : h_float{};
        }
    }

    SimulationConfig SimulationConfig::from_file(mrock::utility::InputFileReader& input)
    {
        SimulationConfig config;
        config.system_type = input.getString("system_type");
        config.lattice_constant = input.getDouble("a");
        config.e_fermi = input.getDouble("e_fermi") * eV_to_au;
        config.temperature = input.getDouble("temperature") * eV_to_au;
        config.C0 = input.getDouble("C0");
        config.C2 = input.getDouble("C2");
        config.A = input.getDouble("A");
        config.R = input.getDouble("R");
        config.k_sym = input.getDouble("k_sym");
        config.k_asym = input.getDouble("k_asym");

        config.BZ_type = input.getString("BZ_type");
        config.Nk_in_path = input.getInt("Nk_in_path");
        config.rel_dist_to_Gamma = input.getDouble("rel_dist_to_Gamma");
        // given in units of pi / a
        config.path_length = input.getDouble("path_length") * pi / config.lattice_constant;
        config.angle_inc_E_field = input.getDouble("angle_inc_E_field");
        config.Nk1 = input.getInt("Nk1");
        config.Nk2 = input.getInt("Nk2");
        config.align = Mesh::alignment_from_string(input.getString("align"));

        config.E0 = input.getDouble("E0") * MVpcm_to_au;
        config.w = input.getDouble("w") * THz_to_au;
        config.chirp = input.getDouble("chirp") * THz_to_au;
        config.alpha = input.getDouble("alpha") * fs_to_au;
        config.phase = input.getDouble("phase");

        config.T1 = input.getDouble("T1") * fs_to_au;
        config.T2 = input.getDouble("T2") * fs_to_au;
        config.t0 = std::abs(input.getDouble("t0")) * fs_to_au;
        config.dt = input.getDouble("dt") * fs_to_au;
        config.Nt = input.getInt("Nt");

        config.gauge = Dynamics::gauge_from_string(input.getString("gauge"));
        config.dipole_off = flag_from_string(input.getString("dipole_off"));
        config.save_full = flag_from_string(input.getString("save_full"));
        config.user_out = flag_from_string(input.getString("user_out"));
        config.data_dir = input.getString("data_dir");

        config.validate();
        return config;
    }

    bool SimulationConfig::flag_from_string(const std::string& flag)
    {
        if (flag == "yes") return true;
        if (flag == "no") return false;
        throw ConfigurationError("Flag '" + flag + "' is not recognized! Use 'yes' or 'no'.");
    }

    void SimulationConfig::validate() const
    {
        if (system_type != "BiTe" && system_type != "BiTeResummed") {
            throw ConfigurationError("System type '" + system_type + "' is not recognized! Use 'BiTe' or 'BiTeResummed'.");
        }
        if (system_type == "BiTeResummed" && (k_sym <= 0 || k_asym <= 0)) {
            throw ConfigurationError("BiTeResummed requires k_sym > 0 and k_asym > 0");
        }
        if (BZ_type != "2line" && BZ_type != "full") {
            throw ConfigurationError("Brillouin zone type '" + BZ_type + "' is not recognized! Use '2line' or 'full'.");
        }
        if (lattice_constant <= 0) {
            throw ConfigurationError("The lattice constant must be positive");
        }
        if (is_two_line()) {
            if (Nk_in_path < 1) throw ConfigurationError("Nk_in_path must be at least 1");
            if (path_length <= 0) throw ConfigurationError("The path length must be positive");
        }
        else if (Nk1 < 1 || Nk2 < 1) {
            throw ConfigurationError("Nk1 and Nk2 must be at least 1");
        }
        if (alpha <= 0) {
            throw ConfigurationError("The pulse width alpha must be positive");
        }
        if (t0 <= 0) {
            throw ConfigurationError("The time window t0 must be nonzero");
        }
        if (dt <= 0) {
            throw ConfigurationError("The time step dt must be positive");
        }
        if (Nt < 2) {
            throw ConfigurationError("At least two output samples are required (Nt = " + std::to_string(Nt) + ")");
        }
        if (temperature < 0) {
            throw ConfigurationError("The temperature must not be negative");
        }
    }

    bool SimulationConfig::is_resummed() const noexcept
    {
        return system_type == "BiTeResummed";
    }

    bool SimulationConfig::is_two_line() const noexcept
    {
        return BZ_type == "2line";
    }

    Dynamics::Relaxation SimulationConfig::relaxation() const noexcept
    {
        return Dynamics::Relaxation{ damping_rate(T1), damping_rate(T2) };
    }

    std::string SimulationConfig::file_tail() const
    {
        const int n_k1 = is_two_line() ? Nk_in_path : Nk1;
        const int n_k2 = is_two_line() ? 2 : Nk2;
        return "Nk1-" + std::to_string(n_k1) + "_Nk2-" + std::to_string(n_k2)
            + "_w" + fixed_width(w / THz_to_au, 4, 2)
            + "_E" + fixed_width(E0 / MVpcm_to_au, 4, 2)
            + "_a" + fixed_width(alpha / fs_to_au, 4, 2)
            + "_ph" + fixed_width(phase, 3, 2)
            + "_T2-" + fixed_width(T2 / fs_to_au, 5, 2, '0');
    }

    nlohmann::json SimulationConfig::to_json() const
    {
        return {
            { "system_type",            system_type },
            { "a",                      lattice_constant },
            { "e_fermi",                e_fermi },
            { "temperature",            temperature },
            { "C0",                     C0 },
            { "C2",                     C2 },
            { "A",                      A },
            { "R",                      R },
            { "k_sym",                  k_sym },
            { "k_asym",                 k_asym },
            { "BZ_type",                BZ_type },
            { "Nk_in_path",             Nk_in_path },
            { "rel_dist_to_Gamma",      rel_dist_to_Gamma },
            { "path_length",            path_length },
            { "angle_inc_E_field",      angle_inc_E_field },
            { "Nk1",                    Nk1 },
            { "Nk2",                    Nk2 },
            { "align",                  align == Mesh::Alignment::K ? "K" : "M" },
            { "E0",                     E0 },
            { "w",                      w },
            { "chirp",                  chirp },
            { "alpha",                  alpha },
            { "phase",                  phase },
            { "T1",                     T1 },
            { "T2",                     T2 },
            { "t0",                     t0 },
            { "dt",                     dt },
            { "Nt",                     Nt },
            { "gauge",                  Dynamics::to_string(gauge) },
            { "dipole_off",             dipole_off },
            { "units",                  "atomic" }
        };
    }

    std::ostream& operator<<(std::ostream& os, SimulationConfig const& config)
    {
        auto both_units = [&os](const std::string& label, h_float value_au, h_float conversion) {
            os << label << "(" << value_au / conversion << ")[" << value_au << "]\n";
        };
        os << "Solving for...\n";
        os << "Brillouin zone: " << config.BZ_type << "\n";
        if (config.is_two_line()) {
            os << "Number of k-points              = " << 2 * config.Nk_in_path << "\n";
            os << "Driving field direction         = " << config.angle_inc_E_field << "\n";
        }
        else {
            os << "Number of k-points              = " << config.Nk1 * config.Nk2 << "\n";
            os << "Driving field alignment         = " << (config.align == Mesh::Alignment::K ? "K" : "M") << "\n";
        }
        os << "Gauge                           = " << Dynamics::to_string(config.gauge) << "\n";
        both_units("Driving amplitude (MV/cm)[a.u.] = ", config.E0, MVpcm_to_au);
        both_units("Pulse Frequency (THz)[a.u.]     = ", config.w, THz_to_au);
        both_units("Pulse Width (fs)[a.u.]          = ", config.alpha, fs_to_au);
        both_units("Chirp rate (THz)[a.u.]          = ", config.chirp, THz_to_au);
        both_units("Damping time (fs)[a.u.]         = ", config.T2, fs_to_au);
        both_units("Total time (fs)[a.u.]           = ", 2. * config.t0, fs_to_au);
        both_units("Time step (fs)[a.u.]            = ", config.dt, fs_to_au);
        return os;
    }
}
