#pragma once

#include "temporal_update/core/types.hpp"
#include "temporal_update/mixture/bookkeeper.hpp"
#include "temporal_update/pixels/partition.hpp"
#include "temporal_update/solvers/solver_interfaces.hpp"
#include "temporal_update/update/parameters.hpp"

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace temporal_update::update {

/**
 * One arm of the method dispatcher. A rule owns the mixture bookkeeping of
 * one update call and rewrites one row of the augmented trace matrix at a
 * time (row K is the background). Solver failures surface as SolverError.
 */
class ComponentUpdateRule {
public:
    virtual ~ComponentUpdateRule() = default;

    virtual std::string name() const = 0;

    // The partition must outlive the rule.
    virtual void initialize(const pixels::PixelPartition& partition,
                            const Matrix2Dd& augmented_footprints,
                            const Matrix2Dd& augmented_traces) = 0;

    virtual double squared_norm(int k) const = 0;

    virtual void update_source(int k, Matrix2Dd& augmented_traces,
                               std::vector<SourceEstimate>& sources,
                               std::uint64_t seed) = 0;

    virtual void update_background(Matrix2Dd& augmented_traces) = 0;

    // Y - A C over the fit pixels.
    virtual Matrix2Dd fit_residual(const Matrix2Dd& augmented_traces) const = 0;

    virtual std::optional<Matrix2Dd> lagrange_multipliers() const { return std::nullopt; }
};

// Rules that work on the footprint-projected trace of a single component.
class IsolatedTraceRule : public ComponentUpdateRule {
public:
    IsolatedTraceRule(const TemporalParameters& params, const solvers::SolverSet& solvers);

    void initialize(const pixels::PixelPartition& partition,
                    const Matrix2Dd& augmented_footprints,
                    const Matrix2Dd& augmented_traces) override;

    double squared_norm(int k) const override;

    void update_source(int k, Matrix2Dd& augmented_traces,
                       std::vector<SourceEstimate>& sources,
                       std::uint64_t seed) override;

    void update_background(Matrix2Dd& augmented_traces) override;

    Matrix2Dd fit_residual(const Matrix2Dd& augmented_traces) const override;

protected:
    // Returns the new trace of source k given its isolated trace.
    virtual VectorXd fit_isolated(int k, const VectorXd& isolated,
                                  SourceEstimate& estimate, std::uint64_t seed) = 0;

    const TemporalParameters& params_;
    const solvers::SolverSet& solvers_;

private:
    std::unique_ptr<mixture::CorrelationBookkeeper> book_;
    const Matrix2Dd* observation_ = nullptr;
    Matrix2Dd footprints_;
};

class ProjectionRule : public IsolatedTraceRule {
public:
    using IsolatedTraceRule::IsolatedTraceRule;
    std::string name() const override { return "project"; }

protected:
    VectorXd fit_isolated(int k, const VectorXd& isolated,
                          SourceEstimate& estimate, std::uint64_t seed) override;

private:
    std::map<int, SparseMatrixd> kernel_cache_;
};

class ConstrainedDeconvolutionRule : public IsolatedTraceRule {
public:
    using IsolatedTraceRule::IsolatedTraceRule;
    std::string name() const override { return "constrained_foopsi"; }

protected:
    VectorXd fit_isolated(int k, const VectorXd& isolated,
                          SourceEstimate& estimate, std::uint64_t seed) override;
};

class MonteCarloRule : public IsolatedTraceRule {
public:
    using IsolatedTraceRule::IsolatedTraceRule;
    std::string name() const override { return "mcem_foopsi"; }

protected:
    VectorXd fit_isolated(int k, const VectorXd& isolated,
                          SourceEstimate& estimate, std::uint64_t seed) override;
};

class BayesianSamplingRule : public IsolatedTraceRule {
public:
    using IsolatedTraceRule::IsolatedTraceRule;
    std::string name() const override { return "mcmc"; }

protected:
    VectorXd fit_isolated(int k, const VectorXd& isolated,
                          SourceEstimate& estimate, std::uint64_t seed) override;
};

/**
 * Noise-constrained fit over the mc brightest fit pixels of each footprint.
 * Keeps the explicit residual and an mc x K multiplier matrix that is carried
 * between sweeps and returned to the caller.
 */
class NoiseConstrainedDualRule : public ComponentUpdateRule {
public:
    NoiseConstrainedDualRule(const TemporalParameters& params,
                             const solvers::SolverSet& solvers,
                             std::optional<Matrix2Dd> initial_multipliers);

    std::string name() const override { return "noise_constrained"; }

    void initialize(const pixels::PixelPartition& partition,
                    const Matrix2Dd& augmented_footprints,
                    const Matrix2Dd& augmented_traces) override;

    double squared_norm(int k) const override;

    void update_source(int k, Matrix2Dd& augmented_traces,
                       std::vector<SourceEstimate>& sources,
                       std::uint64_t seed) override;

    void update_background(Matrix2Dd& augmented_traces) override;

    Matrix2Dd fit_residual(const Matrix2Dd& augmented_traces) const override;

    std::optional<Matrix2Dd> lagrange_multipliers() const override { return multipliers_; }

private:
    const TemporalParameters& params_;
    const solvers::SolverSet& solvers_;
    std::optional<Matrix2Dd> initial_multipliers_;

    std::unique_ptr<mixture::ResidualBookkeeper> book_;
    Matrix2Dd multipliers_;                 // mc x K
    std::vector<std::vector<int>> pixels_;  // fit-partition rows per source
    std::vector<VectorXd> budgets_;
    std::map<int, SparseMatrixd> kernel_cache_;
};

// Rows of the mc largest footprint values, ties kept in pixel order.
std::vector<int> brightest_pixels(const VectorXd& footprint, int count);

// Throws ConfigError when the solver needed by the method is missing.
std::unique_ptr<ComponentUpdateRule> make_update_rule(const TemporalParameters& params,
                                                      const solvers::SolverSet& solvers,
                                                      const std::optional<Matrix2Dd>& multipliers);

} // namespace temporal_update::update
