#include "temporal_update/core/errors.hpp"
#include "temporal_update/core/events.hpp"
#include "temporal_update/core/utils.hpp"

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <cmath>
#include <sstream>
#include <string>
#include <vector>

using namespace temporal_update;

TEST_CASE("relative_frobenius_change_edge_cases") {
    Matrix2Dd zero = Matrix2Dd::Zero(2, 3);
    REQUIRE(core::relative_frobenius_change(zero, zero) == 0.0);

    Matrix2Dd one = Matrix2Dd::Ones(2, 3);
    REQUIRE(std::isinf(core::relative_frobenius_change(one, zero)));

    Matrix2Dd two = Matrix2Dd::Constant(2, 3, 2.0);
    REQUIRE(core::relative_frobenius_change(one, two) == Catch::Approx(0.5));
    REQUIRE(core::relative_frobenius_change(two, two) == 0.0);
}

TEST_CASE("sha256_of_known_input") {
    const std::string text = "abc";
    std::vector<uint8_t> data(text.begin(), text.end());
    REQUIRE(core::sha256_bytes(data) ==
            "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST_CASE("to_lower_and_method_names") {
    REQUIRE(core::to_lower("MCEM_Foopsi") == "mcem_foopsi");

    UpdateMethod method = UpdateMethod::PROJECT;
    REQUIRE(string_to_update_method("  Noise_Constrained ", method));
    REQUIRE(method == UpdateMethod::NOISE_CONSTRAINED);
    REQUIRE_FALSE(string_to_update_method("lasso", method));
    REQUIRE(update_method_to_string(UpdateMethod::MCMC) == "mcmc");
    REQUIRE(driver_state_to_string(DriverState::ITERATION_LIMIT_REACHED) ==
            "ITERATION_LIMIT_REACHED");
}

TEST_CASE("event_emitter_writes_one_json_object_per_line") {
    core::EventEmitter emitter;
    std::ostringstream out;

    emitter.run_start("run1", {{"method", "project"}}, out);
    emitter.components_progress("run1", 4, 10, out);
    emitter.sweep_end("run1", 1, 0.25, out);
    emitter.run_end("run1", true, DriverState::CONVERGED, core::json::object(), out);

    std::istringstream lines(out.str());
    std::vector<core::json> events;
    std::string line;
    while (std::getline(lines, line)) {
        events.push_back(core::json::parse(line));
    }

    REQUIRE(events.size() == 4);
    REQUIRE(events[0]["type"] == "run_start");
    REQUIRE(events[0]["method"] == "project");
    REQUIRE(events[0]["run_id"] == "run1");
    REQUIRE(events[1]["current"] == 4);
    REQUIRE(events[1]["substep"] == "4 out of total 10 temporal components updated");
    REQUIRE(events[2]["relative_change"].get<double>() == Catch::Approx(0.25));
    REQUIRE(events[3]["state"] == "CONVERGED");
    REQUIRE(events[3]["success"] == true);
}

TEST_CASE("solver_error_carries_component_and_method") {
    SolverError err(3, "mcmc", "sampler diverged");
    REQUIRE(err.component() == 3);
    REQUIRE(err.method() == "mcmc");
    REQUIRE(std::string(err.what()).find("component 3") != std::string::npos);

    FitsError fits("bad header");
    const IOError& as_io = fits;
    REQUIRE(std::string(as_io.what()).find("FITS error") != std::string::npos);
}
