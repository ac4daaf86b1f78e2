#include "ComplexFFT.hpp"
#include "../Errors.hpp"
#include <algorithm>
#include <cmath>
#include <mrock/utility/ComplexNumberIterators.hpp>

namespace SBE::Fourier {
    ComplexFFT::ComplexFFT(int _N)
        : N{_N}
    {
        if (N <= 0) {
            throw ConfigurationError("A Fourier transform needs at least one sample");
        }
        in = (fftw_complex*) fftw_malloc(sizeof(fftw_complex) * N);
        out = (fftw_complex*) fftw_malloc(sizeof(fftw_complex) * N);
        // FFTW_MEASURE overwrites the buffers, the plan has to be created before they are filled.
        plan = fftw_plan_dft_1d(N, in, out, FFTW_FORWARD, FFTW_MEASURE);
    }

    ComplexFFT::~ComplexFFT()
    {
        fftw_destroy_plan(plan);
        fftw_free(in); 
        fftw_free(out);
    }

    void ComplexFFT::compute(const std::vector<h_complex>& input, std::vector<h_complex>& output)
    {
        if (static_cast<int>(input.size()) != N) {
            throw ConfigurationError("ComplexFFT of size " + std::to_string(N) + " got " + std::to_string(input.size()) + " samples");
        }
        std::copy(input.begin(), input.end(), reinterpret_cast<h_complex*>(in));
        fftw_execute(plan);

        const h_float normalization = 1. / std::sqrt(static_cast<h_float>(N));
        output.resize(N);
        std::transform(reinterpret_cast<h_complex*>(out), reinterpret_cast<h_complex*>(out) + N, output.begin(),
            [normalization](const h_complex& x) { return normalization * x; });
    }

    void ComplexFFT::compute(const std::vector<h_complex>& input, std::vector<h_float>& real_output, std::vector<h_float>& imag_output)
    {
        std::vector<h_complex> output;
        compute(input, output);

        real_output.resize(N);
        imag_output.resize(N);
        auto real_begin = mrock::utility::make_real_part_iterator(output.data());
        auto imag_begin = mrock::utility::make_imag_part_iterator(output.data());
        auto real_end = mrock::utility::make_real_part_iterator_end(output.data(), N);
        auto imag_end = mrock::utility::make_imag_part_iterator_end(output.data(), N);

        std::copy(real_begin, real_end, real_output.begin());
        std::copy(imag_begin, imag_end, imag_output.begin());
    }
}
