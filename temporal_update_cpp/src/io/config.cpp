#include "temporal_update/config/configuration.hpp"
#include "temporal_update/core/errors.hpp"
#include "temporal_update/update/parameters.hpp"

#include <cmath>
#include <fstream>
#include <sstream>

namespace temporal_update::config {

static void read_double_list(const YAML::Node& n, std::vector<double>& out) {
    if (n && n.IsSequence()) {
        out.clear();
        for (const auto& v : n) {
            out.push_back(v.as<double>());
        }
    }
}

static bool is_known_method(const std::string& m) {
    UpdateMethod tmp;
    return string_to_update_method(m, tmp);
}

Config Config::load(const fs::path& path) {
    if (!fs::exists(path)) {
        throw ConfigError("Config file not found: " + path.string());
    }

    YAML::Node node = YAML::LoadFile(path.string());
    return from_yaml(node);
}

Config Config::from_yaml(const YAML::Node& node) {
    Config cfg;

    if (node["temporal"]) {
        auto t = node["temporal"];
        if (t["method"]) cfg.temporal.method = t["method"].as<std::string>();
        if (t["restimate_kernel"]) cfg.temporal.restimate_kernel = t["restimate_kernel"].as<bool>();
        if (t["outer_iterations"]) cfg.temporal.outer_iterations = t["outer_iterations"].as<int>();
        if (t["convergence_threshold"]) {
            cfg.temporal.convergence_threshold = t["convergence_threshold"].as<double>();
        }
        if (t["sweep_order"]) cfg.temporal.sweep_order = t["sweep_order"].as<std::string>();
        if (t["random_seed"]) cfg.temporal.random_seed = t["random_seed"].as<std::uint64_t>();
        if (t["progress_interval"]) cfg.temporal.progress_interval = t["progress_interval"].as<int>();
    }

    if (node["kernel"]) {
        auto k = node["kernel"];
        if (k["order"]) cfg.kernel.order = k["order"].as<int>();
        read_double_list(k["coefficients"], cfg.kernel.coefficients);
        if (k["per_source"] && k["per_source"].IsMap()) {
            for (auto it = k["per_source"].begin(); it != k["per_source"].end(); ++it) {
                std::vector<double> g;
                read_double_list(it->second, g);
                cfg.kernel.per_source[it->first.as<int>()] = g;
            }
        }
        if (k["fudge_factor"]) cfg.kernel.fudge_factor = k["fudge_factor"].as<double>();
    }

    if (node["deconvolution"]) {
        auto d = node["deconvolution"];
        if (d["max_iterations"]) cfg.deconvolution.max_iterations = d["max_iterations"].as<int>();
        if (d["bisection_steps"]) cfg.deconvolution.bisection_steps = d["bisection_steps"].as<int>();
        if (d["tolerance"]) cfg.deconvolution.tolerance = d["tolerance"].as<double>();
        if (d["noise_range"] && d["noise_range"].IsSequence() && d["noise_range"].size() == 2) {
            cfg.deconvolution.noise_freq_low = d["noise_range"][0].as<double>();
            cfg.deconvolution.noise_freq_high = d["noise_range"][1].as<double>();
        }
        if (d["autocovariance_lags"]) {
            cfg.deconvolution.autocovariance_lags = d["autocovariance_lags"].as<int>();
        }
    }

    if (node["mcem"]) {
        auto m = node["mcem"];
        if (m["iterations"]) cfg.mcem.iterations = m["iterations"].as<int>();
        if (m["mh_steps"]) cfg.mcem.mh_steps = m["mh_steps"].as<int>();
        if (m["proposal_scale"]) cfg.mcem.proposal_scale = m["proposal_scale"].as<double>();
    }

    if (node["mcmc"]) {
        auto m = node["mcmc"];
        if (m["samples"]) cfg.mcmc.samples = m["samples"].as<int>();
        if (m["burn_in"]) cfg.mcmc.burn_in = m["burn_in"].as<int>();
        if (m["spike_prior_rate"]) cfg.mcmc.spike_prior_rate = m["spike_prior_rate"].as<double>();
        if (m["noise_prior_shape"]) cfg.mcmc.noise_prior_shape = m["noise_prior_shape"].as<double>();
        if (m["noise_prior_rate"]) cfg.mcmc.noise_prior_rate = m["noise_prior_rate"].as<double>();
        if (m["proposal_scale"]) cfg.mcmc.proposal_scale = m["proposal_scale"].as<double>();
    }

    if (node["dual"]) {
        auto d = node["dual"];
        if (d["max_pixels"]) cfg.dual.max_pixels = d["max_pixels"].as<int>();
        if (d["initial_multiplier"]) cfg.dual.initial_multiplier = d["initial_multiplier"].as<double>();
        if (d["iterations"]) cfg.dual.iterations = d["iterations"].as<int>();
        if (d["step"]) cfg.dual.step = d["step"].as<double>();
    }

    if (node["projection"]) {
        auto p = node["projection"];
        if (p["max_iterations"]) cfg.projection.max_iterations = p["max_iterations"].as<int>();
        if (p["tolerance"]) cfg.projection.tolerance = p["tolerance"].as<double>();
    }

    if (node["input"]) {
        auto i = node["input"];
        if (i["observation"]) cfg.input.observation = i["observation"].as<std::string>();
        if (i["footprints"]) cfg.input.footprints = i["footprints"].as<std::string>();
        if (i["background"]) cfg.input.background = i["background"].as<std::string>();
        if (i["traces"]) cfg.input.traces = i["traces"].as<std::string>();
        if (i["background_trace"]) cfg.input.background_trace = i["background_trace"].as<std::string>();
        if (i["per_pixel_noise"]) cfg.input.per_pixel_noise = i["per_pixel_noise"].as<std::string>();
        if (i["lagrange_multipliers"]) {
            cfg.input.lagrange_multipliers = i["lagrange_multipliers"].as<std::string>();
        }
        if (i["unsaturated_pixels"]) cfg.input.unsaturated_pixels = i["unsaturated_pixels"].as<std::string>();
        if (i["interpolation"]) cfg.input.interpolation = i["interpolation"].as<std::string>();
    }

    if (node["output"]) {
        auto o = node["output"];
        if (o["directory"]) cfg.output.directory = o["directory"].as<std::string>();
        if (o["write_residual"]) cfg.output.write_residual = o["write_residual"].as<bool>();
    }

    return cfg;
}

void Config::save(const fs::path& path) const {
    std::ofstream out(path);
    if (!out) {
        throw IOError("Cannot create config file: " + path.string());
    }
    YAML::Emitter emitter;
    emitter << to_yaml();
    out << emitter.c_str() << "\n";
}

YAML::Node Config::to_yaml() const {
    YAML::Node node;

    node["temporal"]["method"] = temporal.method;
    node["temporal"]["restimate_kernel"] = temporal.restimate_kernel;
    node["temporal"]["outer_iterations"] = temporal.outer_iterations;
    node["temporal"]["convergence_threshold"] = temporal.convergence_threshold;
    node["temporal"]["sweep_order"] = temporal.sweep_order;
    if (temporal.random_seed) node["temporal"]["random_seed"] = *temporal.random_seed;
    node["temporal"]["progress_interval"] = temporal.progress_interval;

    if (kernel.order) node["kernel"]["order"] = *kernel.order;
    for (double g : kernel.coefficients) {
        node["kernel"]["coefficients"].push_back(g);
    }
    for (const auto& [idx, g] : kernel.per_source) {
        YAML::Node seq(YAML::NodeType::Sequence);
        for (double v : g) seq.push_back(v);
        node["kernel"]["per_source"][idx] = seq;
    }
    if (kernel.fudge_factor) node["kernel"]["fudge_factor"] = *kernel.fudge_factor;

    node["deconvolution"]["max_iterations"] = deconvolution.max_iterations;
    node["deconvolution"]["bisection_steps"] = deconvolution.bisection_steps;
    node["deconvolution"]["tolerance"] = deconvolution.tolerance;
    node["deconvolution"]["noise_range"].push_back(deconvolution.noise_freq_low);
    node["deconvolution"]["noise_range"].push_back(deconvolution.noise_freq_high);
    node["deconvolution"]["autocovariance_lags"] = deconvolution.autocovariance_lags;

    node["mcem"]["iterations"] = mcem.iterations;
    node["mcem"]["mh_steps"] = mcem.mh_steps;
    node["mcem"]["proposal_scale"] = mcem.proposal_scale;

    node["mcmc"]["samples"] = mcmc.samples;
    node["mcmc"]["burn_in"] = mcmc.burn_in;
    node["mcmc"]["spike_prior_rate"] = mcmc.spike_prior_rate;
    node["mcmc"]["noise_prior_shape"] = mcmc.noise_prior_shape;
    node["mcmc"]["noise_prior_rate"] = mcmc.noise_prior_rate;
    node["mcmc"]["proposal_scale"] = mcmc.proposal_scale;

    node["dual"]["max_pixels"] = dual.max_pixels;
    node["dual"]["initial_multiplier"] = dual.initial_multiplier;
    node["dual"]["iterations"] = dual.iterations;
    node["dual"]["step"] = dual.step;

    node["projection"]["max_iterations"] = projection.max_iterations;
    node["projection"]["tolerance"] = projection.tolerance;

    node["input"]["observation"] = input.observation;
    node["input"]["footprints"] = input.footprints;
    node["input"]["background"] = input.background;
    node["input"]["traces"] = input.traces;
    node["input"]["background_trace"] = input.background_trace;
    node["input"]["per_pixel_noise"] = input.per_pixel_noise;
    node["input"]["lagrange_multipliers"] = input.lagrange_multipliers;
    node["input"]["unsaturated_pixels"] = input.unsaturated_pixels;
    node["input"]["interpolation"] = input.interpolation;

    node["output"]["directory"] = output.directory;
    node["output"]["write_residual"] = output.write_residual;

    return node;
}

void Config::validate() const {
    if (!is_known_method(temporal.method)) {
        throw ValidationError("temporal.method must be one of project, constrained_foopsi, "
                              "mcem_foopsi, mcmc, noise_constrained");
    }
    if (temporal.outer_iterations < 1) {
        throw ValidationError("temporal.outer_iterations must be >= 1");
    }
    if (!(temporal.convergence_threshold >= 0.0)) {
        throw ValidationError("temporal.convergence_threshold must be >= 0");
    }
    if (temporal.sweep_order != "random" && temporal.sweep_order != "sequential") {
        throw ValidationError("temporal.sweep_order must be 'random' or 'sequential'");
    }
    if (temporal.progress_interval < 0) {
        throw ValidationError("temporal.progress_interval must be >= 0");
    }

    if (kernel.order && (*kernel.order < 1 || *kernel.order > 10)) {
        throw ValidationError("kernel.order must be in [1,10]");
    }
    for (const auto& [idx, g] : kernel.per_source) {
        if (idx < 0) {
            throw ValidationError("kernel.per_source keys must be >= 0");
        }
        if (g.empty()) {
            throw ValidationError("kernel.per_source." + std::to_string(idx) + " must not be empty");
        }
    }
    if (kernel.fudge_factor && (*kernel.fudge_factor <= 0.0 || *kernel.fudge_factor > 1.0)) {
        throw ValidationError("kernel.fudge_factor must be in (0,1]");
    }

    if (deconvolution.max_iterations < 1) {
        throw ValidationError("deconvolution.max_iterations must be >= 1");
    }
    if (deconvolution.bisection_steps < 0) {
        throw ValidationError("deconvolution.bisection_steps must be >= 0");
    }
    if (deconvolution.tolerance <= 0.0) {
        throw ValidationError("deconvolution.tolerance must be > 0");
    }
    if (deconvolution.noise_freq_low < 0.0 || deconvolution.noise_freq_high > 0.5 ||
        deconvolution.noise_freq_low >= deconvolution.noise_freq_high) {
        throw ValidationError("deconvolution.noise_range must be [low,high] with 0 <= low < high <= 0.5");
    }
    if (deconvolution.autocovariance_lags < 1) {
        throw ValidationError("deconvolution.autocovariance_lags must be >= 1");
    }

    if (mcem.iterations < 1) {
        throw ValidationError("mcem.iterations must be >= 1");
    }
    if (mcem.mh_steps < 0) {
        throw ValidationError("mcem.mh_steps must be >= 0");
    }
    if (mcem.proposal_scale <= 0.0) {
        throw ValidationError("mcem.proposal_scale must be > 0");
    }

    if (mcmc.samples < 1) {
        throw ValidationError("mcmc.samples must be >= 1");
    }
    if (mcmc.burn_in < 0) {
        throw ValidationError("mcmc.burn_in must be >= 0");
    }
    if (mcmc.spike_prior_rate < 0.0) {
        throw ValidationError("mcmc.spike_prior_rate must be >= 0");
    }
    if (mcmc.noise_prior_shape <= 0.0 || mcmc.noise_prior_rate <= 0.0) {
        throw ValidationError("mcmc.noise_prior_shape/rate must be > 0");
    }
    if (mcmc.proposal_scale <= 0.0) {
        throw ValidationError("mcmc.proposal_scale must be > 0");
    }

    if (dual.max_pixels < 1) {
        throw ValidationError("dual.max_pixels must be >= 1");
    }
    if (dual.initial_multiplier < 0.0) {
        throw ValidationError("dual.initial_multiplier must be >= 0");
    }
    if (dual.iterations < 1) {
        throw ValidationError("dual.iterations must be >= 1");
    }
    if (dual.step <= 0.0) {
        throw ValidationError("dual.step must be > 0");
    }

    if (projection.max_iterations < 1) {
        throw ValidationError("projection.max_iterations must be >= 1");
    }
    if (projection.tolerance <= 0.0) {
        throw ValidationError("projection.tolerance must be > 0");
    }
}

TemporalParameters Config::to_parameters() const {
    validate();

    TemporalParameters p;
    string_to_update_method(temporal.method, p.method);
    p.restimate_kernel = temporal.restimate_kernel;
    p.outer_iterations = temporal.outer_iterations;
    p.convergence_threshold = temporal.convergence_threshold;
    p.sweep_order = temporal.sweep_order == "sequential" ? SweepOrder::SEQUENTIAL : SweepOrder::RANDOM;
    p.random_seed = temporal.random_seed;
    p.progress_interval = temporal.progress_interval;

    if (!kernel.coefficients.empty()) {
        p.kernel.shared = ArKernel{kernel.coefficients};
    }
    for (const auto& [idx, g] : kernel.per_source) {
        p.kernel.per_source[idx] = ArKernel{g};
    }
    p.kernel_order = kernel.order;
    p.fudge_factor = kernel.fudge_factor;

    p.dual_max_pixels = dual.max_pixels;
    p.dual_initial_multiplier = dual.initial_multiplier;
    p.mcmc_samples = mcmc.samples;
    p.mcmc_burn_in = mcmc.burn_in;
    return p;
}

std::string get_schema_json() {
    return R"({
  "$schema": "http://json-schema.org/draft-07/schema#",
  "type": "object",
  "properties": {
    "temporal": {
      "type": "object",
      "properties": {
        "method": {"type": "string", "enum": ["project", "constrained_foopsi", "mcem_foopsi", "mcmc", "noise_constrained"]},
        "restimate_kernel": {"type": "boolean"},
        "outer_iterations": {"type": "integer", "minimum": 1},
        "convergence_threshold": {"type": "number", "minimum": 0},
        "sweep_order": {"type": "string", "enum": ["random", "sequential"]},
        "random_seed": {"type": "integer", "minimum": 0},
        "progress_interval": {"type": "integer", "minimum": 0}
      }
    },
    "kernel": {
      "type": "object",
      "properties": {
        "order": {"type": "integer", "minimum": 1, "maximum": 10},
        "coefficients": {"type": "array", "items": {"type": "number"}},
        "per_source": {"type": "object", "additionalProperties": {"type": "array", "items": {"type": "number"}}},
        "fudge_factor": {"type": "number", "exclusiveMinimum": 0, "maximum": 1}
      }
    },
    "deconvolution": {
      "type": "object",
      "properties": {
        "max_iterations": {"type": "integer", "minimum": 1},
        "bisection_steps": {"type": "integer", "minimum": 0},
        "tolerance": {"type": "number", "exclusiveMinimum": 0},
        "noise_range": {"type": "array", "items": {"type": "number"}, "minItems": 2, "maxItems": 2},
        "autocovariance_lags": {"type": "integer", "minimum": 1}
      }
    },
    "mcem": {
      "type": "object",
      "properties": {
        "iterations": {"type": "integer", "minimum": 1},
        "mh_steps": {"type": "integer", "minimum": 0},
        "proposal_scale": {"type": "number", "exclusiveMinimum": 0}
      }
    },
    "mcmc": {
      "type": "object",
      "properties": {
        "samples": {"type": "integer", "minimum": 1},
        "burn_in": {"type": "integer", "minimum": 0},
        "spike_prior_rate": {"type": "number", "minimum": 0},
        "noise_prior_shape": {"type": "number", "exclusiveMinimum": 0},
        "noise_prior_rate": {"type": "number", "exclusiveMinimum": 0},
        "proposal_scale": {"type": "number", "exclusiveMinimum": 0}
      }
    },
    "dual": {
      "type": "object",
      "properties": {
        "max_pixels": {"type": "integer", "minimum": 1},
        "initial_multiplier": {"type": "number", "minimum": 0},
        "iterations": {"type": "integer", "minimum": 1},
        "step": {"type": "number", "exclusiveMinimum": 0}
      }
    },
    "projection": {
      "type": "object",
      "properties": {
        "max_iterations": {"type": "integer", "minimum": 1},
        "tolerance": {"type": "number", "exclusiveMinimum": 0}
      }
    },
    "input": {
      "type": "object",
      "properties": {
        "observation": {"type": "string"},
        "footprints": {"type": "string"},
        "background": {"type": "string"},
        "traces": {"type": "string"},
        "background_trace": {"type": "string"},
        "per_pixel_noise": {"type": "string"},
        "lagrange_multipliers": {"type": "string"},
        "unsaturated_pixels": {"type": "string"},
        "interpolation": {"type": "string"}
      }
    },
    "output": {
      "type": "object",
      "properties": {
        "directory": {"type": "string"},
        "write_residual": {"type": "boolean"}
      }
    }
  }
})";
}

} // namespace temporal_update::config
