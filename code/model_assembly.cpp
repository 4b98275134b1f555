
#include "model_assembly.h"

#include <cmath>
#include <set>
#include <string>
#include <vector>

#include "model_errors.hpp"

using namespace std;


ModelAssembler::ModelAssembler(BaseMILPModel& model, const TimeWindow& window, bool binaries)
    : builder(model, window, binaries), assembled(false)
{}

void ModelAssembler::validate(const TimeWindow& window, const AggregatorSpec& aggregator, const vector<Household>& households) {
    const unsigned long T = window.n_steps;
    //
    // 1. aggregator
    if (aggregator.price.size() != T || aggregator.total_load_min.size() != T || aggregator.total_load_max.size() != T)
        throw ParameterError("The price and total load bound series of the aggregator must have " + to_string(T) + " values.");
    for (unsigned long t = 0; t < T; t++) {
        if (!isfinite(aggregator.price[t]))
            throw ParameterError("The price in time step " + to_string(t) + " is not finite.");
        if (isnan(aggregator.total_load_min[t]) || isnan(aggregator.total_load_max[t]))
            throw ParameterError("The bounds of the total load in time step " + to_string(t) + " must not be NaN.");
        if (aggregator.total_load_min[t] > aggregator.total_load_max[t])
            throw ParameterError("The lower bound of the total load is larger than the upper bound in time step " + to_string(t) + ".");
    }
    //
    // 2. households and their devices
    set<string> household_labels;
    // name prefixes of all households and devices, they must differ,
    // otherwise e.g. "HH_0" + "bat" and "HH" + "0_bat" result in the same names
    set<string> name_prefixes;
    for (const Household& hh : households) {
        if (hh.label.empty())
            throw ParameterError("A household label must not be empty.");
        if (!household_labels.insert(hh.label).second)
            throw ParameterError("Household label " + hh.label + " is used twice.");
        if (!name_prefixes.insert(hh.label).second)
            throw ParameterError("Household label " + hh.label + " equals the name prefix of a device of another household.");
        if (isnan(hh.net_load_min) || isnan(hh.net_load_max))
            throw ParameterError("Household " + hh.label + ": the net load bounds must not be NaN.");
        if (hh.net_load_min > hh.net_load_max)
            throw ParameterError("Household " + hh.label + ": net_load_min is larger than net_load_max.");
        set<string> device_labels;
        for (const Device& dev : hh.devices) {
            const string& dev_label = get_device_label(dev);
            if (dev_label.empty())
                throw ParameterError("Household " + hh.label + " has a device without label.");
            if (!device_labels.insert(dev_label).second)
                throw ParameterError("Household " + hh.label + ": device label " + dev_label + " is used twice.");
            if (!name_prefixes.insert(hh.label + "_" + dev_label).second)
                throw ParameterError("Household " + hh.label + ": the names of device " + dev_label + " collide with the names of another household or device.");
            check_device_against_window(dev, window);
        }
    }
}

void ModelAssembler::assemble(const AggregatorSpec& aggregator, const vector<Household>& households) {
    if (assembled)
        throw ModelAssemblyError("The model has already been assembled.");
    validate(builder.get_time_window(), aggregator, households);
    assembled = true;
    add_aggregator(aggregator);
    for (const Household& hh : households)
        add_household(hh);
}

void ModelAssembler::add_aggregator(const AggregatorSpec& aggregator) {
    const unsigned long T = builder.get_n_steps();
    const double delta_t  = builder.get_delta_t();
    //
    // Total load per time step, with the energy costs as objective
    vector<IndexKey>     var_keys;
    vector<VariableSpec> var_specs;
    for (unsigned long t = 0; t < T; t++) {
        var_keys.push_back(IndexKey::Aggregator(Field::TotalLoad, (long) t));
        var_specs.push_back({aggregator.total_load_min[t], aggregator.total_load_max[t], VariableType::Continuous, delta_t * aggregator.price[t], {}});
    }
    builder.declare_variables(var_keys, var_specs);
    //
    // -totalLoad[t] + sum_h netLoad[h,t] = 0
    // The net loads are added as columns by the households.
    vector<IndexKey>       cstr_keys;
    vector<ConstraintSpec> cstr_specs;
    for (unsigned long t = 0; t < T; t++) {
        cstr_keys.push_back(IndexKey::Aggregator(Field::LinkTotalLoad, (long) t));
        cstr_specs.push_back({ConstraintSense::Equal, 0.0, {{IndexKey::Aggregator(Field::TotalLoad, (long) t), -1.0}}});
    }
    builder.declare_constraints(cstr_keys, cstr_specs);
}

void ModelAssembler::add_household(const Household& household) {
    const unsigned long T = builder.get_n_steps();
    const string& hh = household.label;
    //
    // Net load per time step, added to the total load
    vector<IndexKey>     var_keys;
    vector<VariableSpec> var_specs;
    for (unsigned long t = 0; t < T; t++) {
        var_keys.push_back(IndexKey::Household(hh, Field::NetLoad, (long) t));
        var_specs.push_back({household.net_load_min, household.net_load_max, VariableType::Continuous, 0.0,
                             {{IndexKey::Aggregator(Field::LinkTotalLoad, (long) t), 1.0}}});
    }
    builder.declare_variables(var_keys, var_specs);
    //
    // -netLoad[h,t] + sum_d pwr[d,t] = 0
    // The device powers are added as columns by the devices.
    vector<IndexKey>       cstr_keys;
    vector<ConstraintSpec> cstr_specs;
    for (unsigned long t = 0; t < T; t++) {
        cstr_keys.push_back(IndexKey::Household(hh, Field::LinkNetLoad, (long) t));
        cstr_specs.push_back({ConstraintSense::Equal, 0.0, {{IndexKey::Household(hh, Field::NetLoad, (long) t), -1.0}}});
    }
    builder.declare_constraints(cstr_keys, cstr_specs);
    //
    // Devices, in list order
    for (const Device& dev : household.devices)
        contribute_device(dev, builder, hh);
}
