#include "global.h"

using namespace global;


#include <iostream>
#include <string>

using namespace std;



// ----------------------------- //
//      Implementation of        //
//           Global              //
// ----------------------------- //

bool Global::locked = false;
//
unsigned long Global::scenario_id        = 0;
string Global::input_path                = "";
string Global::database_name             = "";
string Global::output_path               = "";
unsigned long Global::n_households       = 0;
unsigned long Global::t_begin            = 0;
unsigned long Global::t_horizon          = 0;
double Global::time_step_size_in_h       = 1.0;
unsigned int  Global::seed               = 0;
bool Global::binaries                    = true;
PriceSignal Global::price_signal         = PriceSignal::MarketPrice;
double Global::solver_time_limit_s       = 60.0;
instance::OwnershipRates       Global::ownership_rates;
instance::DeviceParameters     Global::device_parameters;
instance::AggregatorParameters Global::aggregator_parameters;
//
bool Global::scenario_id_init            = false;
bool Global::input_path_init             = false;
bool Global::database_name_init          = false;
bool Global::output_path_init            = false;
bool Global::n_households_init           = false;
bool Global::t_begin_init                = false;
bool Global::t_horizon_init              = false;
bool Global::time_step_size_in_h_init    = false;
bool Global::seed_init                   = false;
bool Global::binaries_init               = false;
bool Global::price_signal_init           = false;
bool Global::solver_time_limit_s_init    = false;
bool Global::ownership_rates_init        = false;
bool Global::device_parameters_init      = false;
bool Global::aggregator_parameters_init  = false;

void Global::InitializeStaticVariables() {
    locked = false;
    scenario_id  = 0;              scenario_id_init  = false;
    input_path   = "";             input_path_init   = false;
    database_name= "";             database_name_init= false;
    output_path  = "";             output_path_init  = false;
    n_households = 0;              n_households_init = false;
    t_begin      = 0;              t_begin_init      = false;
    t_horizon    = 0;              t_horizon_init    = false;
    time_step_size_in_h = 1.0;     time_step_size_in_h_init = false;
    seed         = 0;              seed_init         = false;
    binaries     = true;           binaries_init     = false;
    price_signal = PriceSignal::MarketPrice; price_signal_init = false;
    solver_time_limit_s = 60.0;    solver_time_limit_s_init = false;
    ownership_rates       = instance::OwnershipRates();       ownership_rates_init       = false;
    device_parameters     = instance::DeviceParameters();     device_parameters_init     = false;
    aggregator_parameters = instance::AggregatorParameters(); aggregator_parameters_init = false;
}

bool Global::AllVariablesInitialized() {
    if (input_path_init &&
        database_name_init &&
        n_households_init &&
        t_horizon_init)
    {
        return true;
    } else {
        return false;
    }
}

void Global::PrintUninitializedVariables() {
    if (!input_path_init)    cout << "Variable input_path not initialized." << endl;
    if (!database_name_init) cout << "Variable database_name not initialized." << endl;
    if (!n_households_init)  cout << "Variable n_households not initialized." << endl;
    if (!t_horizon_init)     cout << "Variable t_horizon not initialized." << endl;
}

void Global::LockAllVariables() {
    locked = true;
}

void Global::UnlockAllVariables() {
    locked = false;
}

/*
 * Internal helper for all setters:
 * A variable can be set as long as it is not initialized or the variables are not locked.
 */
template <typename T>
static void set_if_not_locked(T& variable, bool& init_flag, const T& value, const char* name) {
    if (Global::is_locked() && init_flag) {
        cerr << "Global variable " << name << " is already initialized and locked!" << endl;
    } else {
        variable  = value;
        init_flag = true;
    }
}

void Global::set_scenario_id(unsigned long value) {
    set_if_not_locked(scenario_id, scenario_id_init, value, "scenario_id");
}
void Global::set_input_path(const string& path) {
    set_if_not_locked(input_path, input_path_init, path, "input_path");
}
void Global::set_database_name(const string& fname) {
    set_if_not_locked(database_name, database_name_init, fname, "database_name");
}
void Global::set_output_path(const string& path) {
    set_if_not_locked(output_path, output_path_init, path, "output_path");
}
void Global::set_n_households(unsigned long value) {
    set_if_not_locked(n_households, n_households_init, value, "n_households");
}
void Global::set_t_begin(unsigned long value) {
    set_if_not_locked(t_begin, t_begin_init, value, "t_begin");
}
void Global::set_t_horizon(unsigned long value) {
    set_if_not_locked(t_horizon, t_horizon_init, value, "t_horizon");
}
void Global::set_time_step_size_in_h(double value) {
    set_if_not_locked(time_step_size_in_h, time_step_size_in_h_init, value, "time_step_size_in_h");
}
void Global::set_seed(unsigned int value) {
    set_if_not_locked(seed, seed_init, value, "seed");
}
void Global::set_binaries(bool value) {
    set_if_not_locked(binaries, binaries_init, value, "binaries");
}
void Global::set_price_signal(PriceSignal value) {
    set_if_not_locked(price_signal, price_signal_init, value, "price_signal");
}
void Global::set_solver_time_limit_s(double value) {
    set_if_not_locked(solver_time_limit_s, solver_time_limit_s_init, value, "solver_time_limit_s");
}
void Global::set_ownership_rates(const instance::OwnershipRates& value) {
    set_if_not_locked(ownership_rates, ownership_rates_init, value, "ownership_rates");
}
void Global::set_device_parameters(const instance::DeviceParameters& value) {
    set_if_not_locked(device_parameters, device_parameters_init, value, "device_parameters");
}
void Global::set_aggregator_parameters(const instance::AggregatorParameters& value) {
    set_if_not_locked(aggregator_parameters, aggregator_parameters_init, value, "aggregator_parameters");
}
