#pragma once

#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include <yaml-cpp/yaml.h>

namespace temporal_update {
struct TemporalParameters;
}

namespace temporal_update::config {

namespace fs = std::filesystem;

// Fixed constants of the original procedure, overridable through the config.
constexpr int kDefaultDualMaxPixels = 15;
constexpr double kDefaultDualInitialMultiplier = 10.0;
constexpr double kDefaultConvergenceThreshold = 1.0e-3;

struct TemporalConfig {
  std::string method = "constrained_foopsi"; // project | constrained_foopsi |
                                             // mcem_foopsi | mcmc | noise_constrained
  bool restimate_kernel = true;
  int outer_iterations = 2;
  double convergence_threshold = kDefaultConvergenceThreshold;
  std::string sweep_order = "random"; // random | sequential
  std::optional<std::uint64_t> random_seed;
  int progress_interval = 10;
};

struct KernelConfig {
  std::optional<int> order;
  std::vector<double> coefficients;                // shared by all sources
  std::map<int, std::vector<double>> per_source;   // source index -> coefficients
  std::optional<double> fudge_factor;
};

struct DeconvolutionConfig {
  int max_iterations = 300;
  int bisection_steps = 25;
  double tolerance = 1.0e-6;
  double noise_freq_low = 0.25;
  double noise_freq_high = 0.5;
  int autocovariance_lags = 5;
};

struct McemConfig {
  int iterations = 3;
  int mh_steps = 50;
  double proposal_scale = 0.02;
};

struct McmcConfig {
  int samples = 400;
  int burn_in = 300;
  double spike_prior_rate = 0.0;
  double noise_prior_shape = 1.0e-3;
  double noise_prior_rate = 1.0e-3;
  double proposal_scale = 0.01;
};

struct DualConfig {
  int max_pixels = kDefaultDualMaxPixels;
  double initial_multiplier = kDefaultDualInitialMultiplier;
  int iterations = 20;
  double step = 0.5;
};

// FISTA settings shared by the projector and the primal step of the dual solver
struct ProjectionConfig {
  int max_iterations = 500;
  double tolerance = 1.0e-8;
};

struct InputConfig {
  std::string observation;         // pixels x time FITS
  std::string footprints;          // pixels x sources FITS
  std::string background;          // pixels x 1 FITS
  std::string traces;              // sources x time FITS
  std::string background_trace;    // 1 x time FITS
  std::string per_pixel_noise;     // optional, pixels x 1 FITS
  std::string lagrange_multipliers;// optional, constraints x sources FITS
  std::string unsaturated_pixels;  // optional YAML list of pixel indices
  std::string interpolation;       // optional YAML list of [pixel, time, value]
};

struct OutputConfig {
  std::string directory = "temporal_update_out";
  bool write_residual = true;
};

struct Config {
  TemporalConfig temporal;
  KernelConfig kernel;
  DeconvolutionConfig deconvolution;
  McemConfig mcem;
  McmcConfig mcmc;
  DualConfig dual;
  ProjectionConfig projection;
  InputConfig input;
  OutputConfig output;

  static Config load(const fs::path &path);
  static Config from_yaml(const YAML::Node &node);

  void save(const fs::path &path) const;
  YAML::Node to_yaml() const;

  void validate() const;

  // Scalar options and kernel coefficients; matrix-valued inputs
  // (interpolation, unsaturated pixels, noise) are left for the caller.
  TemporalParameters to_parameters() const;
};

std::string get_schema_json();

} // namespace temporal_update::config
