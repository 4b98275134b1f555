
#include "index_registry.h"

#include <map>
#include <sstream>
#include <string>
#include <vector>

#include "model_errors.hpp"

using namespace std;


const char* get_field_tag(Field field) {
    switch (field) {
        case Field::TotalLoad:                return "totalLoad";
        case Field::LinkTotalLoad:            return "link_total";
        case Field::NetLoad:                  return "netLoad";
        case Field::LinkNetLoad:              return "link_netLoad";
        case Field::Power:                    return "pwr";
        case Field::PowerCharge:              return "pwr_chg";
        case Field::PowerDischarge:           return "pwr_dis";
        case Field::StateOfCharge:            return "soc";
        case Field::ChargeIndicator:          return "chg_ind";
        case Field::DischargeIndicator:       return "dis_ind";
        case Field::OnIndicator:              return "on_ind";
        case Field::Temperature:              return "temp";
        case Field::Control:                  return "u";
        case Field::StartIndicator:           return "u";
        case Field::EnergyConservation:       return "ener_cons";
        case Field::PowerChargeMin:           return "pwr_chg_min";
        case Field::PowerChargeMax:           return "pwr_chg_max";
        case Field::PowerDischargeMin:        return "pwr_dis_min";
        case Field::PowerDischargeMax:        return "pwr_dis_max";
        case Field::ChargeDischargeExclusion: return "cstr_bin";
        case Field::PowerThermalMin:          return "pwr_th_min";
        case Field::PowerThermalMax:          return "pwr_th_max";
        case Field::TemperatureExchange:      return "temp_exch";
        case Field::EnergyTotalMin:           return "E_tot_min";
        case Field::EnergyTotalMax:           return "E_tot_max";
        case Field::PowerMin:                 return "pwr_min";
        case Field::PowerMax:                 return "pwr_max";
        case Field::StartUp:                  return "start_up";
        case Field::NetPower:                 return "net_power";
        case Field::CycleStart:               return "cycle_start";
        case Field::Curtailment:              return "curtail";
    }
    return "unknown";
}


// ----------------------------- //
//      Implementation of        //
//          IndexKey             //
// ----------------------------- //

string IndexKey::to_name() const {
    stringstream ss;
    if (!household.empty())
        ss << household << "_";
    if (!device.empty())
        ss << device << "_";
    ss << get_field_tag(field);
    if (cycle >= 0)
        ss << "_" << cycle;
    if (time >= 0)
        ss << "_" << time;
    return ss.str();
}


// ----------------------------- //
//      Implementation of        //
//        IndexRegistry          //
// ----------------------------- //

int IndexRegistry::lookup_variable(const IndexKey& key) const {
    auto it = variable_index.find(key);
    if (it == variable_index.end())
        throw UnknownKeyError("Variable " + key.to_name() + " has not been declared.");
    return it->second;
}

int IndexRegistry::lookup_constraint(const IndexKey& key) const {
    auto it = constraint_index.find(key);
    if (it == constraint_index.end())
        throw UnknownKeyError("Constraint " + key.to_name() + " has not been declared.");
    return it->second;
}

/*
 * Internal helper, selects all keys of one (household, device) scope from a map
 */
static vector<IndexKey> keys_of_scope(const map<IndexKey, int>& index_map, const string& household, const string& device) {
    vector<IndexKey> result;
    for (const auto& [key, idx] : index_map) {
        if (key.household == household && key.device == device)
            result.push_back(key);
    }
    return result;
}

vector<IndexKey> IndexRegistry::get_variable_keys_of(const string& household, const string& device) const {
    return keys_of_scope(variable_index, household, device);
}

vector<IndexKey> IndexRegistry::get_constraint_keys_of(const string& household, const string& device) const {
    return keys_of_scope(constraint_index, household, device);
}

size_t IndexRegistry::count_variables_of_household(const string& household) const {
    size_t n = 0;
    for (const auto& [key, idx] : variable_index)
        if (key.household == household) n++;
    return n;
}

size_t IndexRegistry::count_constraints_of_household(const string& household) const {
    size_t n = 0;
    for (const auto& [key, idx] : constraint_index)
        if (key.household == household) n++;
    return n;
}

void IndexRegistry::register_variable(const IndexKey& key, int index) {
    const string name = key.to_name();
    if (variable_index.contains(key))
        throw DuplicateKeyError("Variable " + name + " is declared twice.");
    if (variable_names.contains(name))
        throw DuplicateKeyError("Variable name " + name + " is used by two different entries.");
    variable_index.emplace(key, index);
    variable_names.insert(name);
}

void IndexRegistry::register_constraint(const IndexKey& key, int index) {
    const string name = key.to_name();
    if (constraint_index.contains(key))
        throw DuplicateKeyError("Constraint " + name + " is declared twice.");
    if (constraint_names.contains(name))
        throw DuplicateKeyError("Constraint name " + name + " is used by two different entries.");
    constraint_index.emplace(key, index);
    constraint_names.insert(name);
}
