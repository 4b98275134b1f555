/*
 * output.h
 *
 * This contains all functions for writing the assembled
 * model and the results to the disk.
 *
 */

#ifndef __OUTPUT_H
#define __OUTPUT_H

#include <filesystem>
#include <string>
#include <vector>

#include "index_registry.h"
#include "milp_model_general.hpp"
#include "model_assembly.h"

namespace output {

    /**
     * Creates the output directory for the given scenario,
     * i.e. <output path>/S0001 for scenario ID 1.
     * An existing directory is reused, files in it get overwritten.
     *
     * @param output_path The base output path
     * @param scenario_id The current scenario ID
     * @param scenario_dir Returns the path of the created directory
     * @return false (with a message on stderr) if the directory cannot be created
     */
    bool initializeScenarioDirectory(const std::filesystem::path& output_path, unsigned long scenario_id, std::filesystem::path& scenario_dir);
    /**
     * Writes the model in the CPLEX LP file format.
     */
    bool outputLPFile(const BaseMILPModel& model, const std::filesystem::path& filepath);
    /**
     * Writes one line per household with the number of devices, variables and constraints
     * and the kinds of devices to 'households.csv'.
     */
    bool outputHouseholdSummary(const std::filesystem::path& output_dir, const IndexRegistry& registry, const std::vector<Household>& households);
    /**
     * Writes the solution (total load of the aggregator and the net load of every
     * household per time step) to 'schedule.csv'.
     * @param x Values of all variables, in the order of the model
     */
    bool outputSchedule(
        const std::filesystem::path& output_dir,
        const IndexRegistry& registry,
        const std::vector<Household>& households,
        unsigned long n_steps,
        const std::vector<double>& x
    );
    /**
     * Writes the run time information to 'runtime-information.txt'.
     * @param seconds_setup Seconds required for configuration and data loading
     * @param seconds_main_run Seconds required for instance generation, assembly and solving
     */
    void outputRuntimeInformation(const std::filesystem::path& output_dir, long seconds_setup, long seconds_main_run);

}

#endif
