#ifndef BATCH_RUNNER_HPP
#define BATCH_RUNNER_HPP

/**
 * @file BatchRunner.hpp
 * @brief Evaluation of many case files distributed over MPI ranks
 *
 * Cases are independent, so each rank builds the reports of its own
 * round-robin share and only the failure count is reduced.
 */

#include "ComparisonReport.hpp"
#include "EngineError.hpp"
#include "MACB.hpp"
#include <mpi.h>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace MACB {

/**
 * @brief Command-line values that replace a case file's [solver] entries
 */
struct SolverOverrides {
    std::optional<double> temperature_tolerance;
    std::optional<double> humidity_ratio_tolerance;
    std::optional<int> max_iterations;

    SolverSettings apply(SolverSettings settings) const;
};

/**
 * @brief Outcome of one case file
 *
 * Exactly one of report / error is set.
 */
struct CaseResult {
    std::size_t index;                  // Position in the input file list
    std::string file;
    std::string name;
    std::optional<ComparisonReport> report;
    std::optional<EngineError> error;

    bool ok() const { return report.has_value(); }
};

struct BatchSummary {
    std::vector<CaseResult> results;    // Cases evaluated on this rank
    int local_failures = 0;
    int global_failures = 0;
    std::size_t total_cases = 0;
};

class BatchRunner {
public:
    /**
     * @brief Indices of the cases rank @p rank evaluates (i % size == rank)
     */
    static std::vector<std::size_t> assignedCases(std::size_t n_cases, int rank, int size);

    /**
     * @brief Load, parse and evaluate a single case file
     *
     * Never throws for a bad case; the EngineError is stored in the result.
     */
    static CaseResult runCase(std::size_t index, const std::string& file,
                              const SolverOverrides& overrides);

    /**
     * @brief Evaluate this rank's share of @p files; collective over @p comm
     * @throws std::runtime_error if the MPI reduction fails
     */
    static BatchSummary run(MPI_Comm comm, const std::vector<std::string>& files,
                            const SolverOverrides& overrides);
};

} // namespace MACB

#endif // BATCH_RUNNER_HPP
