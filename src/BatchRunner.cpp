/**
 * @file BatchRunner.cpp
 * @brief Round-robin evaluation of case files over MPI ranks
 */

#include "BatchRunner.hpp"
#include "ConfigReader.hpp"
#include <filesystem>
#include <stdexcept>

namespace MACB {

SolverSettings SolverOverrides::apply(SolverSettings settings) const {
    if (temperature_tolerance) settings.temperature_tolerance = *temperature_tolerance;
    if (humidity_ratio_tolerance) settings.humidity_ratio_tolerance = *humidity_ratio_tolerance;
    if (max_iterations) settings.max_iterations = *max_iterations;
    return settings;
}

std::vector<std::size_t> BatchRunner::assignedCases(std::size_t n_cases, int rank, int size) {
    std::vector<std::size_t> indices;
    if (size <= 0 || rank < 0 || rank >= size) return indices;

    for (std::size_t i = static_cast<std::size_t>(rank); i < n_cases;
         i += static_cast<std::size_t>(size)) {
        indices.push_back(i);
    }
    return indices;
}

CaseResult BatchRunner::runCase(std::size_t index, const std::string& file,
                                const SolverOverrides& overrides) {
    CaseResult result;
    result.index = index;
    result.file = file;
    result.name = std::filesystem::path(file).stem().string();

    ConfigReader config;
    if (!config.loadFile(file)) {
        result.error = EngineError(ErrorKind::INVALID_INPUT, "file",
                                   "cannot open '" + file + "'");
        return result;
    }

    try {
        result.name = config.caseName(result.name);
        ConfigReader::CaseConfig c = config.parseCase(result.name);
        SolverSettings settings = overrides.apply(c.solver);
        result.report = buildReport(c.inlet, c.outlet, c.geometry, settings);
    } catch (const EngineError& e) {
        result.error = e;
    }
    return result;
}

BatchSummary BatchRunner::run(MPI_Comm comm, const std::vector<std::string>& files,
                              const SolverOverrides& overrides) {
    int rank = 0, size = 1;
    MPI_Comm_rank(comm, &rank);
    MPI_Comm_size(comm, &size);

    BatchSummary summary;
    summary.total_cases = files.size();

    for (std::size_t i : assignedCases(files.size(), rank, size)) {
        CaseResult result = runCase(i, files[i], overrides);
        if (!result.ok()) summary.local_failures++;
        summary.results.push_back(std::move(result));
    }

    int global = 0;
    if (MPI_Allreduce(&summary.local_failures, &global, 1, MPI_INT, MPI_SUM, comm) !=
        MPI_SUCCESS) {
        throw std::runtime_error("MPI_Allreduce of the case failure count failed");
    }
    summary.global_failures = global;

    return summary;
}

} // namespace MACB
