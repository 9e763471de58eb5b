#include "MACB.hpp"
#include "BatchRunner.hpp"
#include "ConfigReader.hpp"
#include "ReportWriter.hpp"
#include <petsc.h>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

static char help[] = "MACB - Moist Air & Carbon Balance\n"
                    "Usage: macb [options]\n\n"
                    "Options:\n"
                    "  -c <file>[,<file>...]     Case files (.config), distributed over ranks\n"
                    "  -o <prefix>               Write <prefix>_<case>.txt|csv instead of stdout\n"
                    "  -format <type>            Report format: text (default), csv\n"
                    "  -temperature_tol <degC>   Override [solver] temperature_tolerance\n"
                    "  -humidity_ratio_tol <W>   Override [solver] humidity_ratio_tolerance\n"
                    "  -max_iter <n>             Override [solver] max_iterations\n"
                    "  -generate_config <file>   Write a template case file and exit\n\n"
                    "Examples:\n"
                    "  macb -c examples/bed_a.config\n"
                    "  mpirun -np 4 macb -c a.config,b.config,c.config -format csv -o out/run\n"
                    "  macb -generate_config my_case.config\n\n";

static std::vector<std::string> splitList(const std::string& str) {
    std::vector<std::string> result;
    std::stringstream ss(str);
    std::string item;
    while (std::getline(ss, item, ',')) {
        size_t first = item.find_first_not_of(" \t");
        if (first == std::string::npos) continue;
        size_t last = item.find_last_not_of(" \t");
        result.push_back(item.substr(first, last - first + 1));
    }
    return result;
}

int main(int argc, char** argv) {
    PetscErrorCode ierr;

    ierr = PetscInitialize(&argc, &argv, nullptr, help); CHKERRQ(ierr);

    int exit_code = 0;
    {
        MPI_Comm comm = PETSC_COMM_WORLD;
        int rank;
        MPI_Comm_rank(comm, &rank);

        // Config file generation
        char generate_config[PETSC_MAX_PATH_LEN] = "";
        PetscBool gen_config;
        ierr = PetscOptionsGetString(nullptr, nullptr, "-generate_config", generate_config,
                                     sizeof(generate_config), &gen_config); CHKERRQ(ierr);

        if (gen_config) {
            int status = 0;
            if (rank == 0) {
                if (MACB::ConfigReader::generateTemplate(generate_config)) {
                    PetscPrintf(PETSC_COMM_SELF, "Configuration template written to: %s\n",
                                generate_config);
                } else {
                    status = 1;
                }
            }
            MPI_Bcast(&status, 1, MPI_INT, 0, comm);
            ierr = PetscFinalize();
            return status;
        }

        char config_files[4096] = "";
        char output_prefix[PETSC_MAX_PATH_LEN] = "";
        char output_format[256] = "text";
        PetscBool config_provided = PETSC_FALSE;
        PetscBool prefix_provided = PETSC_FALSE;

        ierr = PetscOptionsGetString(nullptr, nullptr, "-c", config_files,
                                     sizeof(config_files), &config_provided); CHKERRQ(ierr);
        ierr = PetscOptionsGetString(nullptr, nullptr, "-o", output_prefix,
                                     sizeof(output_prefix), &prefix_provided); CHKERRQ(ierr);
        ierr = PetscOptionsGetString(nullptr, nullptr, "-format", output_format,
                                     sizeof(output_format), nullptr); CHKERRQ(ierr);

        MACB::SolverOverrides overrides;
        PetscReal real_value;
        PetscInt int_value;
        PetscBool set;
        ierr = PetscOptionsGetReal(nullptr, nullptr, "-temperature_tol", &real_value, &set); CHKERRQ(ierr);
        if (set) overrides.temperature_tolerance = static_cast<double>(real_value);
        ierr = PetscOptionsGetReal(nullptr, nullptr, "-humidity_ratio_tol", &real_value, &set); CHKERRQ(ierr);
        if (set) overrides.humidity_ratio_tolerance = static_cast<double>(real_value);
        ierr = PetscOptionsGetInt(nullptr, nullptr, "-max_iter", &int_value, &set); CHKERRQ(ierr);
        if (set) overrides.max_iterations = static_cast<int>(int_value);

        std::vector<std::string> files = splitList(config_files);
        if (!config_provided || files.empty()) {
            PetscPrintf(comm, "Error: Case file (-c) required\n");
            PetscPrintf(comm, "Run with -help for usage information\n");
            PetscPrintf(comm, "Generate template: macb -generate_config template.config\n");
            ierr = PetscFinalize();
            return 1;
        }

        try {
            const MACB::ReportFormat format = MACB::parseReportFormat(output_format);

            int size;
            MPI_Comm_size(comm, &size);
            PetscPrintf(comm, "\n");
            PetscPrintf(comm, "============================================================\n");
            PetscPrintf(comm, "  MACB - Moist Air & Carbon Balance\n");
            PetscPrintf(comm, "  Version %s\n", MACB_VERSION_STRING);
            PetscPrintf(comm, "============================================================\n");
            PetscPrintf(comm, "Cases:         %d on %d rank(s)\n", (int)files.size(), size);
            PetscPrintf(comm, "Output format: %s\n", MACB::fileExtension(format).c_str());
            if (prefix_provided) {
                PetscPrintf(comm, "Output prefix: %s\n", output_prefix);
            }
            PetscPrintf(comm, "\n");

            double start_time = MPI_Wtime();
            MACB::BatchSummary summary = MACB::BatchRunner::run(comm, files, overrides);
            double end_time = MPI_Wtime();

            int local_write_failures = 0;
            for (const auto& result : summary.results) {
                if (!result.ok()) {
                    PetscFPrintf(PETSC_COMM_SELF, PETSC_STDERR,
                                 "[rank %d] Case '%s' (%s) failed: %s\n", rank,
                                 result.name.c_str(), result.file.c_str(),
                                 result.error->what());
                    continue;
                }

                if (prefix_provided) {
                    std::string path = std::string(output_prefix) + "_" + result.name + "." +
                                       MACB::fileExtension(format);
                    std::ofstream out(path);
                    if (!out.is_open()) {
                        PetscFPrintf(PETSC_COMM_SELF, PETSC_STDERR,
                                     "[rank %d] Cannot write report file: %s\n", rank,
                                     path.c_str());
                        local_write_failures++;
                        continue;
                    }
                    MACB::ReportWriter::write(*result.report, format, out);
                    ierr = PetscSynchronizedPrintf(comm, "[rank %d] %s -> %s\n", rank,
                                                   result.name.c_str(), path.c_str()); CHKERRQ(ierr);
                } else {
                    std::ostringstream oss;
                    oss << "--- " << result.name << " (" << result.file << ") ---\n";
                    MACB::ReportWriter::write(*result.report, format, oss);
                    oss << "\n";
                    ierr = PetscSynchronizedPrintf(comm, "%s", oss.str().c_str()); CHKERRQ(ierr);
                }
            }
            ierr = PetscSynchronizedFlush(comm, PETSC_STDOUT); CHKERRQ(ierr);

            int global_write_failures = 0;
            MPI_Allreduce(&local_write_failures, &global_write_failures, 1, MPI_INT, MPI_SUM, comm);

            PetscPrintf(comm, "------------------------------------------------------------\n");
            PetscPrintf(comm, "Cases succeeded: %d of %d\n",
                        (int)summary.total_cases - summary.global_failures,
                        (int)summary.total_cases);
            PetscPrintf(comm, "Total wall time: %.3f seconds\n", end_time - start_time);
            PetscPrintf(comm, "============================================================\n");

            if (summary.global_failures > 0 || global_write_failures > 0) {
                exit_code = 1;
            }
        } catch (const std::exception& e) {
            PetscFPrintf(PETSC_COMM_SELF, PETSC_STDERR, "[rank %d] Error: %s\n", rank, e.what());
            exit_code = 1;
        }
    }

    ierr = PetscFinalize();
    return exit_code;
}
