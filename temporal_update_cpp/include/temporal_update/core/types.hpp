#pragma once

#include <Eigen/Dense>
#include <Eigen/Sparse>
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <string>
#include <vector>

namespace temporal_update {

namespace fs = std::filesystem;

// Matrix types (pixels x time, sources x time)
using Matrix2Dd = Eigen::Matrix<double, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;
using VectorXd = Eigen::VectorXd;
using VectorXi = Eigen::VectorXi;
using SparseMatrixd = Eigen::SparseMatrix<double>;

// Per-component update rule, selected once per call
enum class UpdateMethod {
    PROJECT,
    CONSTRAINED_FOOPSI,
    MCEM_FOOPSI,
    MCMC,
    NOISE_CONSTRAINED
};

inline std::string update_method_to_string(UpdateMethod method) {
    switch (method) {
        case UpdateMethod::PROJECT: return "project";
        case UpdateMethod::CONSTRAINED_FOOPSI: return "constrained_foopsi";
        case UpdateMethod::MCEM_FOOPSI: return "mcem_foopsi";
        case UpdateMethod::MCMC: return "mcmc";
        case UpdateMethod::NOISE_CONSTRAINED: return "noise_constrained";
        default: return "unknown";
    }
}

inline bool string_to_update_method(const std::string& s, UpdateMethod& out) {
    std::string norm = s;
    auto not_space = [](unsigned char c) { return !std::isspace(c); };
    norm.erase(norm.begin(),
               std::find_if(norm.begin(), norm.end(), not_space));
    norm.erase(std::find_if(norm.rbegin(), norm.rend(), not_space).base(),
               norm.end());
    std::transform(norm.begin(), norm.end(), norm.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (norm == "project") { out = UpdateMethod::PROJECT; return true; }
    if (norm == "constrained_foopsi") { out = UpdateMethod::CONSTRAINED_FOOPSI; return true; }
    if (norm == "mcem_foopsi") { out = UpdateMethod::MCEM_FOOPSI; return true; }
    if (norm == "mcmc") { out = UpdateMethod::MCMC; return true; }
    if (norm == "noise_constrained") { out = UpdateMethod::NOISE_CONSTRAINED; return true; }
    return false;
}

// Order in which components are visited within one sweep
enum class SweepOrder {
    RANDOM,
    SEQUENTIAL
};

inline std::string sweep_order_to_string(SweepOrder order) {
    switch (order) {
        case SweepOrder::RANDOM: return "random";
        case SweepOrder::SEQUENTIAL: return "sequential";
        default: return "unknown";
    }
}

// Block-coordinate driver state
enum class DriverState {
    INIT,
    ITERATING,
    CONVERGED,
    ITERATION_LIMIT_REACHED
};

inline std::string driver_state_to_string(DriverState state) {
    switch (state) {
        case DriverState::INIT: return "INIT";
        case DriverState::ITERATING: return "ITERATING";
        case DriverState::CONVERGED: return "CONVERGED";
        case DriverState::ITERATION_LIMIT_REACHED: return "ITERATION_LIMIT_REACHED";
        default: return "UNKNOWN";
    }
}

// Autoregressive kernel: c_t = g_1 c_{t-1} + ... + g_p c_{t-p} + s_t
struct ArKernel {
    std::vector<double> coefficients;

    int order() const { return static_cast<int>(coefficients.size()); }
    bool empty() const { return coefficients.empty(); }
};

// Per-source side-channel estimates written by the update rules
struct SourceEstimate {
    ArKernel kernel;
    double baseline = 0.0;
    double initial_amplitude = 0.0;
    double noise = 0.0;
    bool updated = false;
};

} // namespace temporal_update
