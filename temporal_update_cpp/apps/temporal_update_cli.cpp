#include "temporal_update/config/configuration.hpp"
#include "temporal_update/core/errors.hpp"
#include "temporal_update/core/events.hpp"
#include "temporal_update/core/types.hpp"
#include "temporal_update/core/utils.hpp"
#include "temporal_update/io/fits_io.hpp"
#include "temporal_update/solvers/default_solvers.hpp"
#include "temporal_update/update/temporal_update.hpp"

#include <nlohmann/json.hpp>
#include <yaml-cpp/yaml.h>

#include <cstring>
#include <filesystem>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using json = nlohmann::json;

using namespace temporal_update;

static void print_json(const json& j) {
    std::cout << j.dump(2) << std::endl;
}

static std::string read_stdin() {
    std::ostringstream ss;
    ss << std::cin.rdbuf();
    return ss.str();
}

// Relative input paths resolve against the config file's directory
static fs::path resolve_input(const fs::path& config_dir, const std::string& p) {
    fs::path path(p);
    if (path.is_relative()) {
        path = config_dir / path;
    }
    return path;
}

static std::vector<int> read_index_list(const fs::path& path) {
    YAML::Node node = YAML::LoadFile(path.string());
    if (!node.IsSequence()) {
        throw ConfigError("unsaturated pixel file must hold a YAML list: " + path.string());
    }
    std::vector<int> out;
    out.reserve(node.size());
    for (const auto& v : node) {
        out.push_back(v.as<int>());
    }
    return out;
}

static SparseMatrixd read_interpolation(const fs::path& path, int n_pixels, int n_time) {
    YAML::Node node = YAML::LoadFile(path.string());
    if (!node.IsSequence()) {
        throw ConfigError("interpolation file must hold a list of [pixel, time, value]: " +
                          path.string());
    }
    std::vector<Eigen::Triplet<double>> entries;
    for (const auto& e : node) {
        if (!e.IsSequence() || e.size() != 3) {
            throw ConfigError("interpolation entries must be [pixel, time, value]");
        }
        const int p = e[0].as<int>();
        const int t = e[1].as<int>();
        if (p < 0 || p >= n_pixels || t < 0 || t >= n_time) {
            throw ValidationError("interpolation entry (" + std::to_string(p) + ", " +
                                  std::to_string(t) + ") outside the observation");
        }
        entries.emplace_back(p, t, e[2].as<double>());
    }
    SparseMatrixd map(n_pixels, n_time);
    // Later entries win
    map.setFromTriplets(entries.begin(), entries.end(),
                        [](const double&, const double& b) { return b; });
    return map;
}

static json sources_to_json(const std::vector<SourceEstimate>& sources) {
    json arr = json::array();
    for (size_t i = 0; i < sources.size(); ++i) {
        const SourceEstimate& s = sources[i];
        arr.push_back({
            {"index", static_cast<int>(i)},
            {"updated", s.updated},
            {"kernel", s.kernel.coefficients},
            {"baseline", s.baseline},
            {"initial_amplitude", s.initial_amplitude},
            {"noise", s.noise}
        });
    }
    return arr;
}

int cmd_get_schema() {
    std::cout << config::get_schema_json() << std::endl;
    return 0;
}

int cmd_validate_config(const std::string& path, bool use_stdin) {
    json result;
    result["valid"] = false;
    result["errors"] = json::array();
    if (!path.empty()) result["path"] = path;

    try {
        YAML::Node node = use_stdin ? YAML::Load(read_stdin()) : YAML::LoadFile(path);
        config::Config cfg = config::Config::from_yaml(node);
        cfg.validate();
        result["valid"] = true;
    } catch (const std::exception& e) {
        result["errors"].push_back(e.what());
    }

    print_json(result);
    return result["valid"].get<bool>() ? 0 : 1;
}

int cmd_run(const std::string& config_path, const std::string& run_id_arg) {
    const std::string run_id = run_id_arg.empty() ? core::get_run_id() : run_id_arg;
    core::EventEmitter events;

    try {
        const fs::path cfg_path(config_path);
        config::Config cfg = config::Config::load(cfg_path);
        cfg.validate();

        const fs::path base = cfg_path.has_parent_path() ? cfg_path.parent_path() : fs::path(".");
        if (cfg.input.observation.empty() || cfg.input.footprints.empty() ||
            cfg.input.background.empty() || cfg.input.traces.empty() ||
            cfg.input.background_trace.empty()) {
            throw ConfigError("input.observation, footprints, background, traces and "
                              "background_trace are required");
        }

        events.run_start(run_id,
                         {{"config_path", fs::absolute(cfg_path).string()},
                          {"config_hash", core::sha256_file(cfg_path)},
                          {"method", cfg.temporal.method}},
                         std::cout);

        TemporalProblem problem;
        problem.observation = io::read_fits_matrix(resolve_input(base, cfg.input.observation)).first;
        problem.footprints = io::read_fits_matrix(resolve_input(base, cfg.input.footprints)).first;
        problem.background_shape = io::read_fits_vector(resolve_input(base, cfg.input.background));
        problem.traces = io::read_fits_matrix(resolve_input(base, cfg.input.traces)).first;
        problem.background_trace = io::read_fits_vector(resolve_input(base, cfg.input.background_trace));
        if (!cfg.input.lagrange_multipliers.empty()) {
            problem.lagrange_multipliers =
                io::read_fits_matrix(resolve_input(base, cfg.input.lagrange_multipliers)).first;
        }

        TemporalParameters params = cfg.to_parameters();
        const int n_pixels = static_cast<int>(problem.observation.rows());
        const int n_time = static_cast<int>(problem.observation.cols());
        if (!cfg.input.per_pixel_noise.empty()) {
            params.per_pixel_noise = io::read_fits_vector(resolve_input(base, cfg.input.per_pixel_noise));
        }
        if (!cfg.input.unsaturated_pixels.empty()) {
            params.unsaturated_pixels = read_index_list(resolve_input(base, cfg.input.unsaturated_pixels));
        }
        if (!cfg.input.interpolation.empty()) {
            params.interpolation = read_interpolation(resolve_input(base, cfg.input.interpolation),
                                                      n_pixels, n_time);
        }

        const solvers::SolverSet solvers = solvers::make_default_solvers(cfg);
        auto progress = [&](int visited, int total) {
            events.components_progress(run_id, visited, total, std::cout);
        };

        const TemporalUpdateResult result =
            update::update_temporal_components(problem, params, solvers, progress);

        for (size_t i = 0; i < result.sweep_changes.size(); ++i) {
            events.sweep_end(run_id, static_cast<int>(i) + 1, result.sweep_changes[i], std::cout);
        }
        for (const auto& w : result.warnings) {
            events.warning(run_id, w, std::cout);
        }

        const fs::path out_dir = resolve_input(base, cfg.output.directory);
        fs::create_directories(out_dir);

        io::FitsHeader header;
        header.set("METHOD", update_method_to_string(params.method));
        header.set("STATE", driver_state_to_string(result.state));
        header.set("SWEEPS", result.sweeps);
        header.set("RUNID", run_id);

        io::write_fits_matrix(out_dir / "traces.fits", result.traces, header);
        io::write_fits_vector(out_dir / "background_trace.fits", result.background_trace, header);
        if (cfg.output.write_residual) {
            io::write_fits_matrix(out_dir / "residual.fits", result.residual, header);
        }
        if (result.lagrange_multipliers) {
            io::write_fits_matrix(out_dir / "lagrange.fits", *result.lagrange_multipliers, header);
        }
        core::write_text(out_dir / "sources.json", sources_to_json(result.sources).dump(2) + "\n");

        events.run_end(run_id, true, result.state,
                       {{"sweeps", result.sweeps}, {"output_dir", out_dir.string()}}, std::cout);
        return 0;
    } catch (const std::exception& e) {
        events.error(run_id, e.what(), std::cout);
        events.run_end(run_id, false, DriverState::INIT, json::object(), std::cout);
        return 1;
    }
}

void print_usage() {
    std::cout << "Usage: temporal_update_cli <command> [options]\n"
              << "\nCommands:\n"
              << "  get-schema                      Print JSON schema for config\n"
              << "  validate-config (<path> | --stdin)  Validate config\n"
              << "  run <config.yaml> [--run-id ID] Update temporal components\n";
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage();
        return 1;
    }

    std::string command = argv[1];

    auto get_arg = [&](const char* name) -> std::string {
        for (int i = 2; i < argc - 1; ++i) {
            if (std::strcmp(argv[i], name) == 0) {
                return argv[i + 1];
            }
        }
        return "";
    };

    auto has_flag = [&](const char* name) -> bool {
        for (int i = 2; i < argc; ++i) {
            if (std::strcmp(argv[i], name) == 0) return true;
        }
        return false;
    };

    auto get_positional = [&](int pos) -> std::string {
        int count = 0;
        for (int i = 2; i < argc; ++i) {
            if (argv[i][0] != '-') {
                if (count == pos) return argv[i];
                ++count;
            } else if (i + 1 < argc && argv[i + 1][0] != '-') {
                ++i;
            }
        }
        return "";
    };

    if (command == "get-schema") {
        return cmd_get_schema();
    }

    if (command == "validate-config") {
        std::string path = get_positional(0);
        bool use_stdin = has_flag("--stdin");
        if (path.empty() && !use_stdin) {
            std::cerr << "validate-config requires a path or --stdin\n";
            return 1;
        }
        return cmd_validate_config(path, use_stdin);
    }

    if (command == "run") {
        std::string path = get_positional(0);
        if (path.empty()) {
            std::cerr << "run requires a config path argument\n";
            return 1;
        }
        return cmd_run(path, get_arg("--run-id"));
    }

    std::cerr << "Unknown command: " << command << "\n";
    print_usage();
    return 1;
}
