#pragma once

#include "../GlobalDefinitions.hpp"
#include <vector>
#include <fftw3.h>

namespace SBE::Fourier {
    /**
     * Forward DFT with orthonormal scaling, X_j = N^{-1/2} sum_n x_n exp(-2 pi i j n / N).
     * The plan is created once, the object can be reused for every input of length N.
     */
    struct ComplexFFT {
        fftw_plan plan;
        fftw_complex* in;
        // std::complex<double>* x can be cast to fftw_complex via reinterpret_cast<fftw_complex*>(x)
        fftw_complex* out;
        const int N;

        ComplexFFT() = delete;
        explicit ComplexFFT(int _N);
        ComplexFFT(const ComplexFFT&) = delete;
        ComplexFFT& operator=(const ComplexFFT&) = delete;
        ~ComplexFFT(); ///< Frees the fftw buffers and the plan

        void compute(const std::vector<h_complex>& input, std::vector<h_complex>& output);
        void compute(const std::vector<h_complex>& input, std::vector<h_float>& real_output, std::vector<h_float>& imag_output);

        /// Reorders a transform such that the zero frequency sits at index N / 2
        template<class T>
        static std::vector<T> shift_zero_to_center(const std::vector<T>& transform) {
            const int n = static_cast<int>(transform.size());
            std::vector<T> shifted(n);
            for (int i = 0; i < n; ++i) {
                shifted[i] = transform[((i - n / 2) % n + n) % n];
            }
            return shifted;
        }
    };
}
