
#include "model_builder.h"

#include <cmath>
#include <limits>
#include <set>
#include <string>
#include <utility>
#include <vector>

#include "model_errors.hpp"

using namespace std;


ModelBuilder::ModelBuilder(BaseMILPModel& model, const TimeWindow& window, bool binaries)
    : model(model), window(window), binaries(binaries)
{
    if (window.n_steps < 1)
        throw ParameterError("The time window must contain at least one time step.");
    if (!(window.delta_t > 0.0) || isinf(window.delta_t))
        throw ParameterError("The time step length delta_t must be positive and finite, but it is " + to_string(window.delta_t) + ".");
}

VariableSpec ModelBuilder::indicator_spec(bool allow_binary) const {
    VariableSpec spec;
    spec.lower_bound = 0.0;
    spec.upper_bound = 1.0;
    spec.type        = (binaries && allow_binary) ? VariableType::Binary : VariableType::Continuous;
    spec.objective   = 0.0;
    return spec;
}

/*
 * Internal helper: Checks that no key and no name is registered and that none appears twice in the list
 */
static void check_new_keys(const vector<IndexKey>& keys, bool variables, const IndexRegistry& registry) {
    const char* kind = variables ? "Variable" : "Constraint";
    set<IndexKey> seen_keys;
    set<string>   seen_names;
    for (const IndexKey& key : keys) {
        const string name = key.to_name();
        const bool key_known  = variables ? registry.has_variable(key)       : registry.has_constraint(key);
        const bool name_known = variables ? registry.has_variable_name(name) : registry.has_constraint_name(name);
        if (key_known || !seen_keys.insert(key).second)
            throw DuplicateKeyError(string(kind) + " " + name + " is declared twice.");
        if (name_known || !seen_names.insert(name).second)
            throw DuplicateKeyError(string(kind) + " name " + name + " is used by two different entries.");
    }
}

vector<int> ModelBuilder::declare_variables(const vector<IndexKey>& keys, const vector<VariableSpec>& specs) {
    if (keys.size() != specs.size())
        throw ParameterError("Number of variable keys and variable definitions differ.");
    //
    // 1. resolve everything
    check_new_keys(keys, true, registry);
    const size_t n = keys.size();
    vector<string>       names(n);
    vector<double>       lbs(n);
    vector<double>       ubs(n);
    vector<VariableType> types(n);
    vector<double>       obj(n);
    vector<SparseVector> columns(n);
    for (size_t i = 0; i < n; i++) {
        const VariableSpec& spec = specs[i];
        if (spec.lower_bound > spec.upper_bound)
            throw ParameterError("Variable " + keys[i].to_name() + " has a lower bound above its upper bound.");
        names[i] = keys[i].to_name();
        lbs[i]   = spec.lower_bound;
        ubs[i]   = spec.upper_bound;
        types[i] = spec.type;
        obj[i]   = spec.objective;
        for (const ColumnTerm& term : spec.column) {
            columns[i].indices.push_back( registry.lookup_constraint(term.constraint) );
            columns[i].values.push_back( term.coefficient );
        }
    }
    //
    // 2. add to the model and register
    vector<int> indices = model.add_variables(names, lbs, ubs, types, obj, columns);
    for (size_t i = 0; i < n; i++)
        registry.register_variable(keys[i], indices[i]);
    return indices;
}

int ModelBuilder::declare_variable(const IndexKey& key, const VariableSpec& spec) {
    return declare_variables({key}, {spec})[0];
}

vector<int> ModelBuilder::declare_constraints(const vector<IndexKey>& keys, const vector<ConstraintSpec>& specs) {
    if (keys.size() != specs.size())
        throw ParameterError("Number of constraint keys and constraint definitions differ.");
    //
    // 1. resolve everything
    check_new_keys(keys, false, registry);
    const size_t n = keys.size();
    vector<string>          names(n);
    vector<ConstraintSense> senses(n);
    vector<double>          rhs(n);
    vector<SparseVector>    rows(n);
    for (size_t i = 0; i < n; i++) {
        const ConstraintSpec& spec = specs[i];
        names[i]  = keys[i].to_name();
        senses[i] = spec.sense;
        rhs[i]    = spec.rhs;
        for (const RowTerm& term : spec.terms) {
            rows[i].indices.push_back( registry.lookup_variable(term.variable) );
            rows[i].values.push_back( term.coefficient );
        }
    }
    //
    // 2. add to the model and register
    vector<int> indices = model.add_constraints(names, senses, rhs, rows);
    for (size_t i = 0; i < n; i++)
        registry.register_constraint(keys[i], indices[i]);
    return indices;
}

int ModelBuilder::declare_constraint(const IndexKey& key, const ConstraintSpec& spec) {
    return declare_constraints({key}, {spec})[0];
}

vector<int> ModelBuilder::declare_variable_series(const string& household, const string& device, Field field, const vector<VariableSpec>& specs) {
    vector<IndexKey> keys;
    keys.reserve(specs.size());
    for (size_t t = 0; t < specs.size(); t++)
        keys.push_back(IndexKey::Device(household, device, field, (long) t));
    return declare_variables(keys, specs);
}

vector<int> ModelBuilder::declare_constraint_series(const string& household, const string& device, Field field, const vector<ConstraintSpec>& specs) {
    vector<IndexKey> keys;
    keys.reserve(specs.size());
    for (size_t t = 0; t < specs.size(); t++)
        keys.push_back(IndexKey::Device(household, device, field, (long) t));
    return declare_constraints(keys, specs);
}

void ModelBuilder::subtract_from_rhs(const vector<IndexKey>& keys, const vector<double>& values) {
    if (keys.size() != values.size())
        throw ParameterError("Number of constraint keys and values differ.");
    vector<int> indices;
    indices.reserve(keys.size());
    for (const IndexKey& key : keys)
        indices.push_back( registry.lookup_constraint(key) );
    // read - modify - write
    vector<double> rhs = model.get_constraint_rhs(indices);
    vector<pair<int, double>> new_rhs;
    new_rhs.reserve(indices.size());
    for (size_t i = 0; i < indices.size(); i++)
        new_rhs.emplace_back(indices[i], rhs[i] - values[i]);
    model.set_constraint_rhs(new_rhs);
}
