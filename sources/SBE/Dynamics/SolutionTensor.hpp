#pragma once

#include "../GlobalDefinitions.hpp"
#include "DensityMatrix.hpp"
#include <vector>
#include <nlohmann/json.hpp>

namespace SBE::Dynamics {
    /**
     * Sampled density matrix, indexed [k, path, time, component].
     * Every path writes only to its own slice.
     */
    class SolutionTensor {
    public:
        SolutionTensor() = default;
        SolutionTensor(int _n_k, int _n_paths, int _n_times);

        inline h_complex& operator()(int k, int path, int time, Component c) {
            return data[index(k, path, time, c)];
        }
        inline const h_complex& operator()(int k, int path, int time, Component c) const {
            return data[index(k, path, time, c)];
        }

        /// Copies the density matrix part of a state into the slice of (path, time)
        void store(int path, int time, const state_type& state);

        inline int n_k() const noexcept { return _n_k; }
        inline int n_paths() const noexcept { return _n_paths; }
        inline int n_times() const noexcept { return _n_times; }

        nlohmann::json to_json() const;
    private:
        int _n_k{};
        int _n_paths{};
        int _n_times{};
        std::vector<h_complex> data;

        inline size_t index(int k, int path, int time, Component c) const noexcept {
            return ((static_cast<size_t>(k) * _n_paths + path) * _n_times + time) * n_components + c;
        }
    };
}
