#include <iostream>
#include <filesystem>
#include <string>
#include <vector>
#include <chrono>

#ifndef NO_MPI
#include <mpi.h>
#define EXIT MPI_Finalize()
#else
#define EXIT 0
#endif

#include <nlohmann/json.hpp>
#include <mrock/utility/OutputConvenience.hpp>
#include <mrock/utility/InputFileReader.hpp>

#include "SBE/SimulationConfig.hpp"
#include "SBE/Dispatch/Dispatcher.hpp"
#include "SBE/Observables/CurrentAndPolarization.hpp"
#include "SBE/Fourier/SpectrumPostProcessor.hpp"

namespace {
    using SBE::h_float;
    using SBE::Observables::DirectionalSeries;

    std::vector<h_float> scaled(std::vector<h_float> values, h_float factor)
    {
        for (auto& v : values) v *= factor;
        return values;
    }

    DirectionalSeries reduce_over_ranks(const DirectionalSeries& local)
    {
#ifndef NO_MPI
        DirectionalSeries total(local.E_dir.size());
        MPI_Reduce(local.E_dir.data(), total.E_dir.data(), local.E_dir.size(), MPI_DOUBLE, MPI_SUM, 0, MPI_COMM_WORLD);
        MPI_Reduce(local.ortho.data(), total.ortho.data(), local.ortho.size(), MPI_DOUBLE, MPI_SUM, 0, MPI_COMM_WORLD);
        return total;
#else
        return local;
#endif
    }

    nlohmann::json series_json(const std::string& name, const std::vector<h_float>& times, const DirectionalSeries& series,
        const SBE::Fourier::Spectrum& spectrum, h_float fundamental)
    {
        nlohmann::json data_json {
            { "time",                   mrock::utility::time_stamp() },
            { "t",                      scaled(times, 1. / SBE::fs_to_au) },
            { name + "_E_dir",          series.E_dir },
            { name + "_ortho",          series.ortho }
        };
        data_json.merge_patch(spectrum.to_json(fundamental));
        return data_json;
    }
}

int main(int argc, char** argv) {
    using namespace SBE;
    using std::chrono::high_resolution_clock;

    if (argc < 2) {
        std::cerr << "Invalid number of arguments: Use mpirun -n <threads> <path_to_executable> <configfile>" << std::endl;
        return -1;
    }

#ifndef NO_MPI
    MPI_Init(&argc, &argv);
    int rank, n_ranks;
    MPI_Comm_rank(MPI_COMM_WORLD, &rank);
    MPI_Comm_size(MPI_COMM_WORLD, &n_ranks);
#else
    int rank = 0;
    int n_ranks = 1;
#endif

    try {
        mrock::utility::InputFileReader input(argv[1]);
        const SimulationConfig config = SimulationConfig::from_file(input);
        if (config.user_out && rank == 0) {
            std::cout << config << std::flush;
        }

        const std::string output_dir = config.data_dir + "/";
        const std::string tail = config.file_tail();

        Dispatch::Dispatcher dispatcher(config);
        if (config.user_out && rank == 0) {
            std::cout << dispatcher.time_config << dispatcher.model->info() << std::endl;
        }
        dispatcher.compute(rank, n_ranks);

        if (config.save_full) {
            std::filesystem::create_directories(output_dir);
            nlohmann::json full_json {
                { "time",               mrock::utility::time_stamp() },
                { "t",                  dispatcher.time_samples() },
                { "solution",           dispatcher.solution.to_json() },
                { "vector_potential",   dispatcher.vector_potential },
                { "electric_field",     dispatcher.electric_field() },
                { "rank",               rank }
            };
            full_json.merge_patch(dispatcher.special_information());
            const std::string full_name = output_dir + "Sol_" + tail + (n_ranks > 1 ? "_rank" + std::to_string(rank) : "") + ".json.gz";
            std::cout << "Saving the full solution to " << full_name << std::endl;
            mrock::utility::saveString(full_json.dump(4), full_name);
        }

        const DirectionalSeries emission = reduce_over_ranks(dispatcher.emission);
        const DirectionalSeries polarization = reduce_over_ranks(dispatcher.polarization);
        const DirectionalSeries current = reduce_over_ranks(dispatcher.current);

        if (rank != 0) return EXIT;
        /////////////////////////////////////////////////////////////////////

        high_resolution_clock::time_point begin = high_resolution_clock::now();
        std::cout << "Computing the Fourier transforms..." << std::endl;

        const h_float output_step = dispatcher.time_config.measure_every();
        const DirectionalSeries approximate = Observables::approximate_emission(polarization, current, output_step);
        DirectionalSeries polarization_derivative;
        polarization_derivative.E_dir = Observables::time_derivative(polarization.E_dir, output_step);
        polarization_derivative.ortho = Observables::time_derivative(polarization.ortho, output_step);

        Fourier::SpectrumPostProcessor processor(dispatcher.time_config, *dispatcher.laser);
        const Fourier::Spectrum emission_spectrum = processor.compute(emission);
        const Fourier::Spectrum approximate_spectrum = processor.compute(approximate);
        const Fourier::Spectrum polarization_spectrum = processor.compute(polarization_derivative);
        const Fourier::Spectrum current_spectrum = processor.compute(current);
        const Fourier::PolarEmission polar = processor.polar_emission(emission, config.w);

        high_resolution_clock::time_point end = high_resolution_clock::now();
        std::cout << "Runtime = " << std::chrono::duration_cast<std::chrono::milliseconds>(end - begin).count() << "[ms]" << std::endl;

        /**
         * Saving data
         */
        std::filesystem::create_directories(output_dir);
        const std::vector<h_float> times = dispatcher.time_samples();

        nlohmann::json exact_json = series_json("I", times, emission, emission_spectrum, config.w);
        exact_json["polar_emission"] = polar.to_json();
        std::cout << "Saving data to " << output_dir << "Iexact_" << tail << ".json.gz" << std::endl;
        mrock::utility::saveString(exact_json.dump(4), output_dir + "Iexact_" + tail + ".json.gz");

        mrock::utility::saveString(series_json("I", times, approximate, approximate_spectrum, config.w).dump(4), 
            output_dir + "I_" + tail + ".json.gz");
        mrock::utility::saveString(series_json("J", times, current, current_spectrum, config.w).dump(4), 
            output_dir + "J_" + tail + ".json.gz");
        mrock::utility::saveString(series_json("P", times, polarization, polarization_spectrum, config.w).dump(4), 
            output_dir + "P_" + tail + ".json.gz");

        nlohmann::json params_json {
            { "time",               mrock::utility::time_stamp() },
            { "electric_field",     dispatcher.electric_field() }
        };
        params_json.merge_patch(config.to_json());
        params_json.merge_patch(dispatcher.special_information());
        params_json.erase("local_paths");
        mrock::utility::saveString(params_json.dump(4), output_dir + "params_" + tail + ".json.gz");
    }
    catch (const std::exception& e) {
        std::cerr << "Rank " << rank << ": " << e.what() << std::endl;
#ifndef NO_MPI
        MPI_Abort(MPI_COMM_WORLD, 1);
#endif
        return 1;
    }

    return EXIT;
}
