#include "temporal_update/config/configuration.hpp"
#include "temporal_update/core/errors.hpp"
#include "temporal_update/update/parameters.hpp"

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <nlohmann/json.hpp>
#include <yaml-cpp/yaml.h>

using namespace temporal_update;

namespace {

const char* kExampleConfig = R"(
temporal:
  method: mcem_foopsi
  restimate_kernel: false
  outer_iterations: 5
  convergence_threshold: 0.0005
  sweep_order: sequential
  random_seed: 1234
kernel:
  order: 2
  coefficients: [1.5, -0.56]
  per_source:
    3: [0.8]
  fudge_factor: 0.98
deconvolution:
  noise_range: [0.3, 0.45]
dual:
  max_pixels: 8
  initial_multiplier: 2.5
input:
  observation: data/y.fits
output:
  directory: out
  write_residual: false
)";

} // namespace

TEST_CASE("config_from_yaml_reads_sections") {
    auto cfg = config::Config::from_yaml(YAML::Load(kExampleConfig));

    REQUIRE(cfg.temporal.method == "mcem_foopsi");
    REQUIRE_FALSE(cfg.temporal.restimate_kernel);
    REQUIRE(cfg.temporal.outer_iterations == 5);
    REQUIRE(cfg.temporal.sweep_order == "sequential");
    REQUIRE(cfg.temporal.random_seed.value() == 1234u);
    REQUIRE(cfg.kernel.order.value() == 2);
    REQUIRE(cfg.kernel.coefficients.size() == 2);
    REQUIRE(cfg.kernel.per_source.at(3).at(0) == Catch::Approx(0.8));
    REQUIRE(cfg.deconvolution.noise_freq_low == Catch::Approx(0.3));
    REQUIRE(cfg.deconvolution.noise_freq_high == Catch::Approx(0.45));
    REQUIRE(cfg.dual.max_pixels == 8);
    REQUIRE(cfg.input.observation == "data/y.fits");
    REQUIRE_FALSE(cfg.output.write_residual);

    // Untouched sections keep their defaults
    REQUIRE(cfg.mcmc.samples == 400);
    REQUIRE(cfg.projection.max_iterations == 500);
}

TEST_CASE("config_defaults_match_documented_constants") {
    config::Config cfg;
    REQUIRE(cfg.temporal.method == "constrained_foopsi");
    REQUIRE(cfg.temporal.outer_iterations == 2);
    REQUIRE(cfg.temporal.convergence_threshold == Catch::Approx(1.0e-3));
    REQUIRE(cfg.dual.max_pixels == 15);
    REQUIRE(cfg.dual.initial_multiplier == Catch::Approx(10.0));
    REQUIRE_NOTHROW(cfg.validate());
}

TEST_CASE("config_validation_rejects_bad_values") {
    config::Config cfg;
    cfg.temporal.method = "lasso";
    REQUIRE_THROWS_AS(cfg.validate(), ValidationError);

    cfg = config::Config{};
    cfg.temporal.outer_iterations = 0;
    REQUIRE_THROWS_AS(cfg.validate(), ValidationError);

    cfg = config::Config{};
    cfg.temporal.sweep_order = "backwards";
    REQUIRE_THROWS_AS(cfg.validate(), ValidationError);

    cfg = config::Config{};
    cfg.kernel.per_source[0] = {};
    REQUIRE_THROWS_AS(cfg.validate(), ValidationError);

    cfg = config::Config{};
    cfg.deconvolution.noise_freq_low = 0.5;
    REQUIRE_THROWS_AS(cfg.validate(), ValidationError);

    cfg = config::Config{};
    cfg.dual.step = 0.0;
    REQUIRE_THROWS_AS(cfg.validate(), ValidationError);
}

TEST_CASE("config_maps_to_parameters") {
    auto cfg = config::Config::from_yaml(YAML::Load(kExampleConfig));
    TemporalParameters p = cfg.to_parameters();

    REQUIRE(p.method == UpdateMethod::MCEM_FOOPSI);
    REQUIRE(p.sweep_order == SweepOrder::SEQUENTIAL);
    REQUIRE(p.outer_iterations == 5);
    REQUIRE(p.random_seed.value() == 1234u);
    REQUIRE(p.kernel.shared.has_value());
    REQUIRE(p.kernel.kernel_for(0).coefficients[1] == Catch::Approx(-0.56));
    REQUIRE(p.kernel.kernel_for(3).coefficients[0] == Catch::Approx(0.8));
    REQUIRE(p.kernel_order.value() == 2);
    REQUIRE(p.fudge_factor.value() == Catch::Approx(0.98));
    REQUIRE(p.dual_max_pixels == 8);
    REQUIRE(p.dual_initial_multiplier == Catch::Approx(2.5));

    cfg.temporal.method = "nope";
    REQUIRE_THROWS_AS(cfg.to_parameters(), ValidationError);
}

TEST_CASE("config_survives_yaml_round_trip") {
    auto cfg = config::Config::from_yaml(YAML::Load(kExampleConfig));
    YAML::Emitter emitter;
    emitter << cfg.to_yaml();
    auto back = config::Config::from_yaml(YAML::Load(emitter.c_str()));

    REQUIRE(back.temporal.method == cfg.temporal.method);
    REQUIRE(back.temporal.random_seed == cfg.temporal.random_seed);
    REQUIRE(back.kernel.coefficients == cfg.kernel.coefficients);
    REQUIRE(back.kernel.per_source == cfg.kernel.per_source);
    REQUIRE(back.deconvolution.noise_freq_high == Catch::Approx(cfg.deconvolution.noise_freq_high));
    REQUIRE(back.output.directory == cfg.output.directory);
}

TEST_CASE("schema_is_valid_json_with_all_sections") {
    auto schema = nlohmann::json::parse(config::get_schema_json());
    const auto& props = schema.at("properties");
    for (const char* section : {"temporal", "kernel", "deconvolution", "mcem", "mcmc",
                                "dual", "projection", "input", "output"}) {
        REQUIRE(props.contains(section));
    }
    REQUIRE(props["temporal"]["properties"]["method"]["enum"].size() == 5);
}
