#include <iostream>
#include <fstream>
#include <string>
#include <chrono>
#include <filesystem>
#include <memory>
#include <random>
#include <stdexcept>

#define BOOST_BIND_GLOBAL_PLACEHOLDERS
#include <boost/program_options.hpp>

#include "global.h"

#include "instance_generation.h"
#include "milp_model_general.hpp"
#include "milp_model_memory.h"
#include "model_assembly.h"
#include "model_errors.hpp"
#include "output.h"
#include "setup_and_dataloading.h"

#if defined(USE_OR_TOOLS)
#include "milp_model_or_tools.hpp"
#elif defined(USE_GUROBI)
#include "milp_model_gurobi.hpp"
#endif

using namespace std;
namespace bpopts = boost::program_options;



/**
 * @brief Entry point of the model generation.
 *
 * This function loads the configuration and the time series, generates the households,
 * assembles the demand response model and (optionally) exports and solves it.
 *
 * @param argc Number of command line arguments.
 * @param argv Array of command line argument strings.
 *
 * @return Return code indicating the execution result of the program:
 *   - **0**  Normal execution, no errors occurred
 *   - **1**  Wrong parameters
 *   - **2**  Required file not found / error during database connections
 *   - **3**  Errors during the model assembly or the solving
 *   - **4**  Erroneous input data
 *   - **5**  Nothing executed (e.g., help displayed)
 */
int main(int argc, char* argv[]) {

	//
	// parsing command line arguments
	//
	unsigned long scenario_id;
    string config_filepath;
    string lp_filepath;
    bool solve_model = false;
    //
    bpopts::options_description opts_desc("Options");
    opts_desc.add_options()
        ("help,h",                            "Show help")
        ("config",   bpopts::value<string>(), "Path to the JSON configuration file")
        ("scenario", bpopts::value<unsigned long>(), "ID of the scenario that should be used")
        ("seed,s",   bpopts::value<unsigned int>(),  "Sets the seed for the instance generation. Overwrites the value of the configuration file. If no seed is given at all, a random seed is drawn.")
        ("households,n", bpopts::value<unsigned long>(), "Number of households. Overwrites the value of the configuration file.")
        ("relax",                             "Relax all indicator variables to continuous variables in [0,1].")
        ("write-lp", bpopts::value<string>(), "Writes the assembled model in the CPLEX LP format to the given file.")
        ("output,o", bpopts::value<string>(), "Output directory for the CSV files. Overwrites the value of the configuration file.")
        ("solve",                             "Solves the assembled model. Only available if the program is compiled with a solver backend.")
        ("time-limit", bpopts::value<double>(), "Time limit for the solver in seconds. Overwrites the value of the configuration file.");
    bpopts::positional_options_description opts_desc_pos;
    opts_desc_pos.add("scenario", -1);
    bpopts::variables_map opts_vals;
    try {
        bpopts::command_line_parser parser{argc, argv};
        parser.options(opts_desc).positional(opts_desc_pos);
        bpopts::parsed_options parsed_options = parser.run();
        bpopts::store( parsed_options, opts_vals );
        bpopts::notify(opts_vals);
    } catch (const bpopts::error &err) {
        cerr << "Error when parsing command line arguments:" << "\n";
        cerr << err.what() << endl;
        return 1;
    }
    // now, command line arguments are parsed
    // we now set the internal variables accordingly
    if (opts_vals.count("help") > 0) {
        cerr << opts_desc << endl;
        cerr << "Usage: decentraldr [-h] [--config PATH] [--write-lp FILE] [--solve] [[--scenario] IDscenario]" << endl;
        return 5;
    }
    if (opts_vals.count("config") > 0) {
        config_filepath = opts_vals["config"].as<string>();
    } else {
        config_filepath = "../config/decentraldr_config.json";
    }
    if (opts_vals.count("scenario") > 0) {
		scenario_id = opts_vals["scenario"].as<unsigned long>();
    } else {
		scenario_id = 1;
    }
    if (opts_vals.count("write-lp") > 0) {
        lp_filepath = opts_vals["write-lp"].as<string>();
    }
    if (opts_vals.count("solve") > 0) {
#if !defined(USE_OR_TOOLS) && !defined(USE_GUROBI)
        cerr << "Error when parsing command line arguments: --solve given, but the program is compiled without a solver backend!" << endl;
        return 1;
#endif
        solve_model = true;
    }
    if (opts_vals.count("households") > 0 && opts_vals["households"].as<unsigned long>() == 0) {
        cerr << "Error when parsing command line arguments: --households / -n must be at least 1!" << endl;
        return 1;
    }

    // get time for time measurement
    auto t1 = std::chrono::system_clock::now();
    global::time_of_run_start = t1;

	cout << "Initializing the model generation for scenario ID " << scenario_id << endl;

	Global::InitializeStaticVariables();

	//
	// open and parse global settings file
	//
	if (!configld::load_config_file(scenario_id, config_filepath)) {
		return 2;
	}

    //
    // command line arguments overwrite the settings of the config file
    //
    Global::UnlockAllVariables();
    if (opts_vals.count("seed") > 0)
        Global::set_seed( opts_vals["seed"].as<unsigned int>() );
    if (!Global::is_seed_set()) {
        std::random_device rd;
        Global::set_seed( rd() );
    }
    if (opts_vals.count("households") > 0)
        Global::set_n_households( opts_vals["households"].as<unsigned long>() );
    if (opts_vals.count("relax") > 0)
        Global::set_binaries(false);
    if (opts_vals.count("output") > 0)
        Global::set_output_path( opts_vals["output"].as<string>() );
    if (opts_vals.count("time-limit") > 0)
        Global::set_solver_time_limit_s( opts_vals["time-limit"].as<double>() );
    Global::LockAllVariables();

	//
	// bevore loading the data:
	// check if all global variables are set -> if not, error!
	//
	if (!Global::AllVariablesInitialized()) {
		cout << "Some global variables are not initialized!" << endl;
        Global::PrintUninitializedVariables();
		return 3;
	}

    //
    // Output all variable values (first time to stdout / cout)
    //
    configld::output_variable_values(std::cout);

    //
    // Load and prepare the time series
    //
    configld::RawTimeSeries raw;
    instance::TimeSeriesData data;
    filesystem::path db_path = filesystem::path(Global::get_input_path()) / Global::get_database_name();
    if (!configld::load_time_series_from_database(db_path.string(), raw)) {
        return 2;
    }
    if (!configld::prepare_time_series(raw, Global::get_t_begin(), Global::get_t_horizon(), data)) {
        return 4;
    }

    // get time for time measurement
    auto t2 = std::chrono::system_clock::now();

    //
    // Generate the households
    //
    instance::Instance inst;
    try {
        inst = instance::generate_instance(
            Global::get_n_households(),
            Global::get_time_step_size_in_h(),
            data,
            Global::get_ownership_rates(),
            Global::get_device_parameters(),
            Global::get_aggregator_parameters(),
            Global::get_price_signal() == global::PriceSignal::TimeOfUse,
            Global::get_seed());
    } catch (const ParameterError& e) {
        cerr << "Error during the instance generation: " << e.what() << endl;
        return 4;
    } catch (const std::invalid_argument& e) {
        cerr << "Error during the instance generation: " << e.what() << endl;
        return 4;
    }
    cout << "Generated " << inst.households.size() << " households for " << inst.window.n_steps << " time steps." << endl;

    //
    // Create the model and assemble it
    //
    unique_ptr<BaseMILPModel> model;
    try {
        if (solve_model) {
#if defined(USE_OR_TOOLS)
            model = make_unique<ORToolsMILPModel>();
#elif defined(USE_GUROBI)
            GurobiMILPModel::InitializeGurobiEnvironment();
            model = make_unique<GurobiMILPModel>();
#endif
        } else {
            model = make_unique<LinearModel>();
        }
    } catch (const ModelAssemblyError& e) {
        cerr << "Error when creating the solver model: " << e.what() << endl;
        return 3;
    }
#if defined(USE_GUROBI)
    catch (GRBException& e) {
        cerr << "Error when initializing gurobi (code = " << e.getErrorCode() << "): " << e.getMessage() << endl;
        return 3;
    }
#endif

    unique_ptr<ModelAssembler> assembler;
    try {
        assembler = make_unique<ModelAssembler>(*model, inst.window, Global::get_binaries());
        assembler->assemble(inst.aggregator, inst.households);
    } catch (const ParameterError& e) {
        cerr << "Error: Invalid input for the model assembly: " << e.what() << endl;
        return 4;
    } catch (const ModelAssemblyError& e) {
        cerr << "Error during the model assembly: " << e.what() << endl;
        return 3;
    } catch (const std::exception& e) {
        cerr << "Error when adding the model to the solver: " << e.what() << endl;
        return 3;
    }
    cout << "Model assembled with " << model->get_n_variables() << " variables and " << model->get_n_constraints() << " constraints." << endl;

    //
    // Export and solve
    //
    if (!lp_filepath.empty()) {
        if (!output::outputLPFile(*model, lp_filepath)) {
            return 2;
        }
    }
    bool solved = false;
    if (solve_model) {
        try {
            solved = model->solve( Global::get_solver_time_limit_s() );
        } catch (const InfeasibleScheduleError& e) {
            cerr << "Error: " << e.what() << endl;
            return 3;
        } catch (const std::exception& e) {
            cerr << "Error during the solving of the model: " << e.what() << endl;
            return 3;
        }
        if (!solved) {
            cerr << "Error during the solving of the model!" << endl;
            return 3;
        }
        cout << "Optimal costs of the aggregator: " << model->get_objective_value() << endl;
    }

    // get time for time measurement
    auto t3 = std::chrono::system_clock::now();
    long s_setup = std::chrono::duration_cast<std::chrono::seconds>(t2-t1).count();
    long s_main  = std::chrono::duration_cast<std::chrono::seconds>(t3-t2).count();

    //
    // Write the outputs
    //
    if (!Global::get_output_path().empty()) {
        filesystem::path scenario_dir;
        if (!output::initializeScenarioDirectory(Global::get_output_path(), scenario_id, scenario_dir)) {
            return 2;
        }
        if (!output::outputHouseholdSummary(scenario_dir, assembler->get_registry(), inst.households)) {
            return 2;
        }
        if (solved) {
            if (!output::outputSchedule(scenario_dir, assembler->get_registry(), inst.households, inst.window.n_steps, model->get_variable_values())) {
                return 2;
            }
        }
        output::outputRuntimeInformation(scenario_dir, s_setup, s_main);
        //
        // Output all variable values (second time to a file)
        //
        std::ofstream log_file(scenario_dir / "parameter-settings.txt");
        configld::output_variable_values(log_file);
        log_file.close();
    }

	//
	// clean up
	//
    assembler.reset();
    model.reset();
#if defined(USE_GUROBI)
    GurobiMILPModel::VacuumAllStaticVariables();
#endif

    // get time for time measurement
    auto t4 = std::chrono::system_clock::now();
    cout << "Run-time information:\n";
    cout << "  Setup and data loading: " << s_setup << "s\n";
    cout << "  Main run:               " << s_main  << "s\n";
    cout << "  Output and clean up:    " << std::chrono::duration_cast<std::chrono::seconds>(t4-t3).count() << "s\n";
    cout << "  Complete run time:      " << std::chrono::duration_cast<std::chrono::seconds>(t4-t1).count() << "s" << std::endl;

	return 0;
}
