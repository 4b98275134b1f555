#include "setup_and_dataloading.h"


#include <algorithm>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <list>
#include <sqlite3.h>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#define BOOST_BIND_GLOBAL_PLACEHOLDERS
#include <boost/property_tree/json_parser.hpp>
#include <boost/property_tree/ptree.hpp>

using namespace std;
namespace bpt = boost::property_tree;


#include "global.h"
#include "helper.h"


//
// loads the global config file
//
bool configld::load_config_file(unsigned long scenario_id, const string& filepath) {
    //
    // parse json
    bpt::ptree tree_root;
    try {
        bpt::read_json(filepath, tree_root);
    } catch (bpt::json_parser_error& j) {
        cerr << "Error when reading json file: " << j.what() << endl;
        return false;
    }
    try {
        // parameter structs, they are set as a whole at the end
        instance::OwnershipRates       own_rates  = Global::get_ownership_rates();
        instance::DeviceParameters     dev_params = Global::get_device_parameters();
        instance::AggregatorParameters agg_params = Global::get_aggregator_parameters();
        bool own_rates_set = false, dev_params_set = false, agg_params_set = false;
        // variables that need to be translated to another type
        string price_signal = ""; bool price_signal_set = false;

        //
        // define internal functions (here i.e. a lambda function with complete capture-by-reference)
        auto read_list = [](bpt::ptree& list_dict) -> vector<double> {
            vector<double> values;
            for (auto& e : list_dict)
                values.push_back( e.second.get_value<double>() );
            return values;
        };
        auto parse_element = [&](const string& element_name, bpt::ptree& scenario_dict) -> void {
            if      ( element_name.compare("id")                          == 0 ||
                      element_name.compare("inherits from")               == 0 ||
                      element_name.compare("name")                        == 0 )
            {
                // part of the scenario definition, not a parameter
            }
            else if ( element_name.compare("data input path")             == 0 )
                Global::set_input_path( scenario_dict.get_value<string>() );
            else if ( element_name.compare("data output path")            == 0 )
                Global::set_output_path( scenario_dict.get_value<string>() );
            else if ( element_name.compare("database name")               == 0 )
                Global::set_database_name( scenario_dict.get_value<string>() );
            else if ( element_name.compare("number of households")        == 0 )
                Global::set_n_households( scenario_dict.get_value<unsigned long>() );
            else if ( element_name.compare("time horizon begin")          == 0 )
                Global::set_t_begin( scenario_dict.get_value<unsigned long>() );
            else if ( element_name.compare("time horizon length")         == 0 )
                Global::set_t_horizon( scenario_dict.get_value<unsigned long>() );
            else if ( element_name.compare("time step size in h")         == 0 )
                Global::set_time_step_size_in_h( scenario_dict.get_value<double>() );
            else if ( element_name.compare("seed")                        == 0 )
                Global::set_seed( scenario_dict.get_value<unsigned int>() );
            else if ( element_name.compare("binaries")                    == 0 )
                Global::set_binaries( scenario_dict.get_value<bool>() );
            else if ( element_name.compare("solver time limit in s")      == 0 )
                Global::set_solver_time_limit_s( scenario_dict.get_value<double>() );
            else if ( element_name.compare("price signal")                == 0 )
            {
                price_signal     = scenario_dict.get_value<string>();
                price_signal_set = true;
            }
            // ownership rates
            else if ( element_name.compare("ownership rate PV")           == 0 ) { own_rates.pv             = scenario_dict.get_value<double>(); own_rates_set = true; }
            else if ( element_name.compare("ownership rate dishwasher")   == 0 ) { own_rates.dishwasher     = scenario_dict.get_value<double>(); own_rates_set = true; }
            else if ( element_name.compare("ownership rate clothes washer") == 0 ) { own_rates.clothes_washer = scenario_dict.get_value<double>(); own_rates_set = true; }
            else if ( element_name.compare("ownership rate clothes dryer")  == 0 ) { own_rates.clothes_dryer  = scenario_dict.get_value<double>(); own_rates_set = true; }
            else if ( element_name.compare("ownership rate heating")      == 0 ) { own_rates.heating        = scenario_dict.get_value<double>(); own_rates_set = true; }
            // device parameters
            else if ( element_name.compare("dishwasher cycle")            == 0 ) { dev_params.dw_cycle       = read_list(scenario_dict); dev_params_set = true; }
            else if ( element_name.compare("clothes washer cycle")        == 0 ) { dev_params.cw_cycle       = read_list(scenario_dict); dev_params_set = true; }
            else if ( element_name.compare("clothes dryer cycle")         == 0 ) { dev_params.cd_cycle       = read_list(scenario_dict); dev_params_set = true; }
            else if ( element_name.compare("EV power min")                == 0 ) { dev_params.ev_pwr_min     = scenario_dict.get_value<double>(); dev_params_set = true; }
            else if ( element_name.compare("EV power max")                == 0 ) { dev_params.ev_pwr_max     = scenario_dict.get_value<double>(); dev_params_set = true; }
            else if ( element_name.compare("EV energy min")               == 0 ) { dev_params.ev_energy_min  = scenario_dict.get_value<double>(); dev_params_set = true; }
            else if ( element_name.compare("EV energy max")               == 0 ) { dev_params.ev_energy_max  = scenario_dict.get_value<double>(); dev_params_set = true; }
            else if ( element_name.compare("EV first available hour")     == 0 ) { dev_params.ev_first_hour  = scenario_dict.get_value<unsigned int>(); dev_params_set = true; }
            else if ( element_name.compare("heating power min")           == 0 ) { dev_params.heat_pwr_min   = scenario_dict.get_value<double>(); dev_params_set = true; }
            else if ( element_name.compare("heating power max")           == 0 ) { dev_params.heat_pwr_max   = scenario_dict.get_value<double>(); dev_params_set = true; }
            else if ( element_name.compare("heating efficiency")          == 0 ) { dev_params.heat_eta       = scenario_dict.get_value<double>(); dev_params_set = true; }
            else if ( element_name.compare("heating heat capacity")       == 0 ) { dev_params.heat_c         = scenario_dict.get_value<double>(); dev_params_set = true; }
            else if ( element_name.compare("heating conductance")         == 0 ) { dev_params.heat_mu        = scenario_dict.get_value<double>(); dev_params_set = true; }
            else if ( element_name.compare("heating initial temperature") == 0 ) { dev_params.heat_temp_init = scenario_dict.get_value<double>(); dev_params_set = true; }
            else if ( element_name.compare("heating temperature min")     == 0 ) { dev_params.heat_temp_min  = scenario_dict.get_value<double>(); dev_params_set = true; }
            else if ( element_name.compare("heating temperature max")     == 0 ) { dev_params.heat_temp_max  = scenario_dict.get_value<double>(); dev_params_set = true; }
            else if ( element_name.compare("battery SOC min")             == 0 ) { dev_params.bat_soc_min    = scenario_dict.get_value<double>(); dev_params_set = true; }
            else if ( element_name.compare("battery SOC max")             == 0 ) { dev_params.bat_soc_max    = scenario_dict.get_value<double>(); dev_params_set = true; }
            else if ( element_name.compare("battery initial SOC")         == 0 ) { dev_params.bat_soc_init   = scenario_dict.get_value<double>(); dev_params_set = true; }
            else if ( element_name.compare("battery power min")           == 0 ) { dev_params.bat_pwr_min    = scenario_dict.get_value<double>(); dev_params_set = true; }
            else if ( element_name.compare("battery power max")           == 0 ) { dev_params.bat_pwr_max    = scenario_dict.get_value<double>(); dev_params_set = true; }
            else if ( element_name.compare("battery efficiency")          == 0 ) { dev_params.bat_effcy      = scenario_dict.get_value<double>(); dev_params_set = true; }
            else if ( element_name.compare("battery half life in h")      == 0 ) { dev_params.bat_half_life  = scenario_dict.get_value<double>(); dev_params_set = true; }
            // aggregator
            else if ( element_name.compare("total load min per household") == 0 ) { agg_params.total_load_min_per_hh = scenario_dict.get_value<double>(); agg_params_set = true; }
            else if ( element_name.compare("total load max per household") == 0 ) { agg_params.total_load_max_per_hh = scenario_dict.get_value<double>(); agg_params_set = true; }
            else if ( element_name.compare("household net load min")      == 0 ) { agg_params.hh_net_load_min = scenario_dict.get_value<double>(); agg_params_set = true; }
            else if ( element_name.compare("household net load max")      == 0 ) { agg_params.hh_net_load_max = scenario_dict.get_value<double>(); agg_params_set = true; }
            else
            {
                cerr << "Unknown config parameter '" << element_name << "' ignored." << endl;
            }
        };

        //
        // first, load the default values
        for (auto& scenario_dict_all : tree_root.get_child("Default Scenario Values")) {
            string element_name = scenario_dict_all.first;
            parse_element(element_name, scenario_dict_all.second);
        }

        //
        // search the correct scenario dictionary
        // and read all variables from there, overwrite defaults if it necessary
        auto find_scenario_id_and_parse = [&](unsigned long scenario_id_to_find) -> bool {
            for (auto& scenario_dict_all : tree_root.get_child("Scenarios")) {
                auto& scenario_dict = scenario_dict_all.second;
                // if we have found the correct entry ...
                if (scenario_dict.get<unsigned long>("id") == scenario_id_to_find) {
                    // ... we read all variables
                    for (auto& s : scenario_dict) {
                        string element_name = s.first;
                        parse_element(element_name, s.second);
                    }
                    return true;
                }
            }
            return false;
        };
        list<unsigned long> scenarios_to_load;
        scenarios_to_load.push_front(scenario_id);
        // get all scenario IDs from which the selected one inherits
        bool inheritance_ended = false;
        unsigned long current_search_scenario_id = scenario_id;
        while (!inheritance_ended) {
            inheritance_ended = true;
            for (auto& scenario_dict_all : tree_root.get_child("Scenarios")) {
                auto& scenario_dict = scenario_dict_all.second;
                if (scenario_dict.get<unsigned long>("id") == current_search_scenario_id) {
                    auto e = scenario_dict.get_optional<unsigned long>("inherits from");
                    // check if there is a scenario from which we inherited
                    if (e.is_initialized()) {
                        unsigned long upper_scenario = e.get();
                        if (find(scenarios_to_load.begin(), scenarios_to_load.end(), upper_scenario) != scenarios_to_load.end()) {
                            cerr << "Error in config file: Ring closure in the inheritance for scenario ID " << upper_scenario << "!" << endl;
                            return false;
                        }
                        cout << "Reading settings for inherited scenario with ID " << upper_scenario << endl;
                        scenarios_to_load.push_front(upper_scenario);
                        current_search_scenario_id = upper_scenario;
                        inheritance_ended = false;
                    }
                    break; // quit the inner loop
                }
            }
        }
        // load all required scenario definitions, the most general one first
        for (unsigned long s : scenarios_to_load) {
            if (! find_scenario_id_and_parse(s) ) {
                cerr << "Scenario ID " << s << " not found in the configuration JSON file!" << endl;
                return false;
            }
        }

        //
        // transform parameters if required
        if (price_signal_set) {
            if      (price_signal == "market")
                Global::set_price_signal(global::PriceSignal::MarketPrice);
            else if (price_signal == "time of use")
                Global::set_price_signal(global::PriceSignal::TimeOfUse);
            else {
                cerr << "Parameter 'price signal' is defined as '" << price_signal << "' in config-json, but this value is unknown." << endl;
                return false;
            }
        }
        if (own_rates_set) {
            if (!instance::check_ownership_rates(own_rates))
                return false;
            Global::set_ownership_rates(own_rates);
        }
        if (dev_params_set) Global::set_device_parameters(dev_params);
        if (agg_params_set) Global::set_aggregator_parameters(agg_params);
        Global::set_scenario_id(scenario_id);
        //
        Global::LockAllVariables();
        return true;

    } catch (bpt::ptree_bad_path& j) {
        cerr << "Error when parsing json file: " << j.what() << endl;
        return false;
    } catch (bpt::ptree_bad_data& j) {
        cerr << "Error when parsing json file, a value has a wrong type: " << j.what() << endl;
        return false;
    }
}


//
// Switch off unused parameter warning for the following block,
// as the parameter "colName" is ignored
//
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wunused-parameter"

/*
 * State of one table query, passed to the callback as void pointer
 */
struct TableReadState {
    const char* table;
    vector<vector<double>*> targets; ///< Target vectors, one per selected value column
    size_t callcounter;
};

int load_time_series_callback(void* data, int argc, char** argv, char** colName) {
    /*
     * This is the callback function for loading one row of a time series table.
     *
     * Columns:
     * 0           1 .. n
     * TimestepID  value columns, in the order of TableReadState::targets
     */
    TableReadState* state = (TableReadState*) data;
    if ((size_t) argc != state->targets.size() + 1) {
        cerr << "Number of arguments not equal to " << state->targets.size() + 1 << " for one row of table " << state->table << "!" << endl;
        return 1;
    }
    if (argv[0] == NULL) {
        cerr << "Table " << state->table << " contains a row without TimestepID!" << endl;
        return 1;
    }
    // check the ordering of the time steps
    unsigned long timestepID = stoul( argv[0] );
    if (timestepID != state->callcounter) {
        cerr << "Table " << state->table << ": TimestepID " << timestepID << " found, but " << state->callcounter
             << " expected. The time steps must start at 0 and must not contain gaps or duplicates." << endl;
        return 1;
    }
    for (size_t i = 0; i < state->targets.size(); i++) {
        if (argv[i + 1] == NULL) {
            cerr << "Table " << state->table << " contains a NULL value in time step " << timestepID << "!" << endl;
            return 1;
        }
        state->targets[i]->push_back( stod( argv[i + 1] ) );
    }
    state->callcounter++;
    return 0;
}

#pragma GCC diagnostic pop


bool configld::load_time_series_from_database(const string& filepath, RawTimeSeries& raw) {
    if (! filesystem::exists( filesystem::path(filepath) ) ) {
        cerr << "Database file " << filepath << " not found!" << endl;
        return false;
    }

    sqlite3* dbcon;
    int rc = sqlite3_open_v2(filepath.c_str(), &dbcon, SQLITE_OPEN_READONLY, NULL);
    if (rc != SQLITE_OK) {
        cerr << "Error when opening database " << filepath << ": " << sqlite3_errmsg(dbcon) << endl;
        sqlite3_close(dbcon);
        return false;
    }
    cout << "Loading time series from database " << filepath << " ..." << endl;

    // pair< SQL_QUERY, STATE_WITH_TARGET_VECTORS >
    list<pair<string, TableReadState>> query_list = {
        make_pair("SELECT TimestepID, HOEP, TOU FROM prices ORDER BY TimestepID;",
                  TableReadState{"prices",      {&raw.hoep, &raw.tou},    0}),
        make_pair("SELECT TimestepID, WIND, SOLAR FROM production ORDER BY TimestepID;",
                  TableReadState{"production",  {&raw.wind, &raw.solar},  0}),
        make_pair("SELECT TimestepID, OntDemand FROM demand ORDER BY TimestepID;",
                  TableReadState{"demand",      {&raw.demand},            0}),
        make_pair("SELECT TimestepID, Temperature FROM temperature ORDER BY TimestepID;",
                  TableReadState{"temperature", {&raw.temperature},       0})
    };
    for (auto& q : query_list) {
        char* sqlErrorMsg = NULL;
        int ret_val = sqlite3_exec(dbcon, q.first.c_str(), load_time_series_callback, (void*) &q.second, &sqlErrorMsg);
        if (ret_val != SQLITE_OK) {
            cerr << "Error when executing command '" << q.first << "': " << (sqlErrorMsg != NULL ? sqlErrorMsg : "unknown error") << endl;
            sqlite3_free(sqlErrorMsg);
            sqlite3_close(dbcon);
            return false;
        }
    }

    sqlite3_close(dbcon);
    return true;
}


bool configld::prepare_time_series(const RawTimeSeries& raw, unsigned long t_begin, unsigned long t_horizon, instance::TimeSeriesData& data) {
    //
    // check the lengths
    const size_t n_ts = raw.demand.size();
    if (raw.hoep.size() != n_ts || raw.tou.size() != n_ts || raw.wind.size() != n_ts ||
        raw.solar.size() != n_ts || raw.temperature.size() != n_ts)
    {
        cerr << "Error: The time series tables in the database have a different number of time steps." << endl;
        return false;
    }
    if (t_horizon == 0) {
        cerr << "Error: The time horizon must contain at least one time step." << endl;
        return false;
    }
    if (t_begin + t_horizon > n_ts) {
        cerr << "Error: The time horizon [" << t_begin << ", " << t_begin + t_horizon << ") exceeds the "
             << n_ts << " time steps available in the database." << endl;
        return false;
    }
    //
    // normalize by the mean over the complete data
    vector<double> load_norm, wind_norm, pv_norm;
    if (!normalize_by_mean(raw.demand, load_norm) ||
        !normalize_by_mean(raw.wind,   wind_norm) ||
        !normalize_by_mean(raw.solar,  pv_norm))
    {
        cerr << "Error: Demand, wind and solar production must have a positive mean." << endl;
        return false;
    }
    //
    // cut out the time window
    data.price_market = slice_series(raw.hoep,        t_begin, t_horizon);
    data.price_tou    = slice_series(raw.tou,         t_begin, t_horizon);
    data.load_norm    = slice_series(load_norm,       t_begin, t_horizon);
    data.wind_norm    = slice_series(wind_norm,       t_begin, t_horizon);
    data.pv_norm      = slice_series(pv_norm,         t_begin, t_horizon);
    data.temperature  = slice_series(raw.temperature, t_begin, t_horizon);
    return true;
}


//
// Implementation of configld::output_variable_values()
//
#define PRINT_VAR(varname) out << "    " << std::setw(44) << std::left << #varname << " = " << varname << "\n"

void configld::output_variable_values(ostream& out) {
    out << "Program information:\n";
    out << "    Program build at " << __DATE__ << " " << __TIME__ <<  "\n";
    #ifdef __GNUC__
    out << "    GCC was used as compiler.\n    GCC Version = " << __GNUC__ << "." << __GNUC_MINOR__ << "." << __GNUC_PATCHLEVEL__ << "\n";
    #endif
    #ifdef __OPTIMIZE__
    out << "    Optimization was enabled during compile time.\n";
    #endif
    #if defined(USE_OR_TOOLS)
    out << "    Solver backend = OR-Tools (SCIP)\n";
    #elif defined(USE_GUROBI)
    out << "    Solver backend = Gurobi\n";
    #else
    out << "    Solver backend = none\n";
    #endif
    out << "    C++ standard = " << __cplusplus << "\n\n";
    out << "List of parameter settings:\n";
    // Scenario selection
    out << "  Scenario selection:\n";
    PRINT_VAR(Global::get_scenario_id());
    PRINT_VAR(Global::is_seed_set());
    if (Global::is_seed_set()) { PRINT_VAR(Global::get_seed()); }
    // Data
    out << "  Data:\n";
    PRINT_VAR(Global::get_input_path());
    PRINT_VAR(Global::get_database_name());
    PRINT_VAR(Global::get_output_path());
    PRINT_VAR(Global::get_t_begin());
    PRINT_VAR(Global::get_t_horizon());
    PRINT_VAR(Global::get_time_step_size_in_h());
    // Model
    out << "  Model:\n";
    PRINT_VAR(Global::get_n_households());
    PRINT_VAR(Global::get_binaries());
    PRINT_VAR((Global::get_price_signal() == global::PriceSignal::MarketPrice ? "market" : "time of use"));
    PRINT_VAR(Global::get_solver_time_limit_s());
    const instance::AggregatorParameters& ap = Global::get_aggregator_parameters();
    PRINT_VAR(ap.total_load_min_per_hh);
    PRINT_VAR(ap.total_load_max_per_hh);
    PRINT_VAR(ap.hh_net_load_min);
    PRINT_VAR(ap.hh_net_load_max);
    // Ownership
    out << "  Ownership rates:\n";
    const instance::OwnershipRates& own = Global::get_ownership_rates();
    PRINT_VAR(own.pv);
    PRINT_VAR(own.dishwasher);
    PRINT_VAR(own.clothes_washer);
    PRINT_VAR(own.clothes_dryer);
    PRINT_VAR(own.heating);
    // Devices
    out << "  Device parameters:\n";
    const instance::DeviceParameters& dp = Global::get_device_parameters();
    PRINT_VAR(join_values(dp.dw_cycle));
    PRINT_VAR(join_values(dp.cw_cycle));
    PRINT_VAR(join_values(dp.cd_cycle));
    PRINT_VAR(dp.ev_pwr_min);
    PRINT_VAR(dp.ev_pwr_max);
    PRINT_VAR(dp.ev_energy_min);
    PRINT_VAR(dp.ev_energy_max);
    PRINT_VAR(dp.ev_first_hour);
    PRINT_VAR(dp.heat_pwr_min);
    PRINT_VAR(dp.heat_pwr_max);
    PRINT_VAR(dp.heat_eta);
    PRINT_VAR(dp.heat_c);
    PRINT_VAR(dp.heat_mu);
    PRINT_VAR(dp.heat_temp_init);
    PRINT_VAR(dp.heat_temp_min);
    PRINT_VAR(dp.heat_temp_max);
    PRINT_VAR(dp.bat_soc_min);
    PRINT_VAR(dp.bat_soc_max);
    PRINT_VAR(dp.bat_soc_init);
    PRINT_VAR(dp.bat_pwr_min);
    PRINT_VAR(dp.bat_pwr_max);
    PRINT_VAR(dp.bat_effcy);
    PRINT_VAR(dp.bat_half_life);
    out << std::flush;
}
