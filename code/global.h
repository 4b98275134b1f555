/*
 *
 * global.h
 *
 * Contains a namespace and a class where all global variables are stored
 *
 * */

#ifndef GLOBAL_H
#define GLOBAL_H

#include <chrono>
#include <string>

#include "instance_generation.h"

/*!
 * Namespace global
 *
 * It contains global enums and variables that might change during
 * program execution.
 *
 * Attention: There is no access protection for these variables!
 * For access protection use class Global.
 *
 * Attention: Do not confuse with class Global (mind the capital "G")!
 */
namespace global {

    inline std::chrono::time_point<std::chrono::system_clock> time_of_run_start; ///< The time of the program start

    /*!
     * This enum defines which price series is used in the objective of the aggregator.
     */
    enum struct PriceSignal : short {
        MarketPrice, ///< Hourly Ontario energy price (HOEP)
        TimeOfUse    ///< Time of use price
    };

}


/*!
 * class Global
 *
 * This class contains all global variables that cannot change
 * after they have been set once and the variables are locked.
 * They are filled by the config file and the command line.
 * The model assembly itself never reads them.
 *
 * Attention: Not to be confused with namespace global (mind the lower case "g").
 */
class Global {
    public:
        static void InitializeStaticVariables(); ///< Resets all variables to their default values and unlocks them
        //
        static bool AllVariablesInitialized();
        static void PrintUninitializedVariables(); ///< Prints all variable names to stdout, that are not initialized
        //
        static void LockAllVariables();   ///< No (set) variable can be overwritten after this call, unset variables can still be set once
        static void UnlockAllVariables(); ///< All variables can now be overwritten
        static bool is_locked()           { return locked; }
        //
        // getter methods
        static unsigned long get_scenario_id()      { return scenario_id;   }
        static const std::string& get_input_path()  { return input_path;    }
        static const std::string& get_database_name(){ return database_name; }
        static const std::string& get_output_path() { return output_path;   }
        static unsigned long get_n_households()     { return n_households;  }
        static unsigned long get_t_begin()          { return t_begin;       } ///< First time step (starting at 0) of the data that is used
        static unsigned long get_t_horizon()        { return t_horizon;     } ///< Number of time steps in the model
        static double get_time_step_size_in_h()     { return time_step_size_in_h; }
        static unsigned int  get_seed()             { return seed;          }
        static bool          is_seed_set()          { return seed_init;     }
        static bool get_binaries()                  { return binaries;      } ///< If false, all indicator variables are relaxed to [0,1]
        static global::PriceSignal get_price_signal(){ return price_signal; }
        static double get_solver_time_limit_s()     { return solver_time_limit_s; }
        static const instance::OwnershipRates&       get_ownership_rates()       { return ownership_rates;       }
        static const instance::DeviceParameters&     get_device_parameters()     { return device_parameters;     }
        static const instance::AggregatorParameters& get_aggregator_parameters() { return aggregator_parameters; }
        //
        // setter methods
        static void set_scenario_id(unsigned long value);
        static void set_input_path(const std::string& path);
        static void set_database_name(const std::string& fname);
        static void set_output_path(const std::string& path);
        static void set_n_households(unsigned long value);
        static void set_t_begin(unsigned long value);
        static void set_t_horizon(unsigned long value);
        static void set_time_step_size_in_h(double value);
        static void set_seed(unsigned int value);
        static void set_binaries(bool value);
        static void set_price_signal(global::PriceSignal value);
        static void set_solver_time_limit_s(double value);
        static void set_ownership_rates(const instance::OwnershipRates& value);
        static void set_device_parameters(const instance::DeviceParameters& value);
        static void set_aggregator_parameters(const instance::AggregatorParameters& value);
    private:
        Global(); ///< Global cannot be initialized, it is a static only class
        static bool locked;                ///< if set to true, values cannot be changed anymore
        // variables
        static unsigned long scenario_id;
        static std::string input_path;     ///< Directory of the input database
        static std::string database_name;  ///< File name of the input database inside the input path
        static std::string output_path;    ///< Directory where the CSV output is written (empty for no output)
        static unsigned long n_households;
        static unsigned long t_begin;
        static unsigned long t_horizon;
        static double time_step_size_in_h;
        static unsigned int  seed;         ///< The seed for all random number generators
        static bool binaries;
        static global::PriceSignal price_signal;
        static double solver_time_limit_s;
        static instance::OwnershipRates       ownership_rates;
        static instance::DeviceParameters     device_parameters;
        static instance::AggregatorParameters aggregator_parameters;
        // initialization flags
        static bool scenario_id_init;
        static bool input_path_init;
        static bool database_name_init;
        static bool output_path_init;
        static bool n_households_init;
        static bool t_begin_init;
        static bool t_horizon_init;
        static bool time_step_size_in_h_init;
        static bool seed_init;
        static bool binaries_init;
        static bool price_signal_init;
        static bool solver_time_limit_s_init;
        static bool ownership_rates_init;
        static bool device_parameters_init;
        static bool aggregator_parameters_init;
};

#endif
