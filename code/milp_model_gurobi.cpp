#include "milp_model_gurobi.hpp"

#include <cmath>
#include <iostream>
#include <limits>
#include <stdexcept>
#include <string>

#include "model_errors.hpp"

#include "gurobi_c++.h"

using namespace std;

GRBEnv* GurobiMILPModel::env = NULL;

static const double INF = numeric_limits<double>::infinity();


//
// Internal helpers (not defined in header file)
//
static double to_gurobi_value(double v) {
    if (std::isinf(v))
        return v > 0 ? GRB_INFINITY : -GRB_INFINITY;
    return v;
}

static char to_gurobi_sense(ConstraintSense sense) {
    switch (sense) {
        case ConstraintSense::LessEqual:    return GRB_LESS_EQUAL;
        case ConstraintSense::GreaterEqual: return GRB_GREATER_EQUAL;
        case ConstraintSense::Equal:        return GRB_EQUAL;
    }
    throw invalid_argument("Unknown constraint sense.");
}

static void check_sparse_vector(const SparseVector& sv, size_t n_max, const char* argument_name) {
    if (sv.indices.size() != sv.values.size())
        throw invalid_argument(string("Argument '") + argument_name + "' contains a sparse vector with different sizes.");
    for (int idx : sv.indices) {
        if (idx < 0 || (size_t) idx >= n_max)
            throw out_of_range(string("Argument '") + argument_name + "' references the unknown index " + to_string(idx) + ".");
    }
}


GurobiMILPModel::GurobiMILPModel() :
    objective_value(numeric_limits<double>::quiet_NaN())
{
    if (env == NULL)
        throw ModelAssemblyError("The gurobi environment is not initialized.");
    try {
        model = make_unique<GRBModel>(*env);
        model->set(GRB_IntAttr_ModelSense, GRB_MINIMIZE);
    } catch (GRBException& e) {
        throw ModelAssemblyError("Gurobi error (code = " + to_string(e.getErrorCode()) + "): " + e.getMessage());
    }
}

vector<int> GurobiMILPModel::add_variables(
    const vector<string>&       names,
    const vector<double>&       lower_bounds,
    const vector<double>&       upper_bounds,
    const vector<VariableType>& types,
    const vector<double>&       objective,
    const vector<SparseVector>& columns)
{
    const size_t n = names.size();
    for (size_t i = 0; i < n; i++) {
        value_or_default(lower_bounds, i, n, 0.0,      "lower_bounds");
        value_or_default(upper_bounds, i, n, INF,      "upper_bounds");
        value_or_default(types,        i, n, VariableType::Continuous, "types");
        value_or_default(objective,    i, n, 0.0,      "objective");
        check_sparse_vector(value_or_default(columns, i, n, SparseVector(), "columns"), constraints.size(), "columns");
    }
    vector<int> new_indices;
    new_indices.reserve(n);
    try {
        for (size_t i = 0; i < n; i++) {
            GRBColumn col;
            if (!columns.empty()) {
                const SparseVector& sv = columns[i];
                for (size_t j = 0; j < sv.indices.size(); j++)
                    col.addTerm(sv.values[j], constraints[ sv.indices[j] ]);
            }
            const char vtype = value_or_default(types, i, n, VariableType::Continuous, "types") == VariableType::Binary ? GRB_BINARY : GRB_CONTINUOUS;
            variables.push_back( model->addVar(
                to_gurobi_value(value_or_default(lower_bounds, i, n, 0.0,      "lower_bounds")),
                to_gurobi_value(value_or_default(upper_bounds, i, n, INF,      "upper_bounds")),
                value_or_default(objective, i, n, 0.0, "objective"),
                vtype, col, names[i]) );
            new_indices.push_back( (int) variables.size() - 1 );
        }
        model->update();
    } catch (GRBException& e) {
        throw ModelAssemblyError("Gurobi error (code = " + to_string(e.getErrorCode()) + "): " + e.getMessage());
    }
    return new_indices;
}

vector<int> GurobiMILPModel::add_constraints(
    const vector<string>&          names,
    const vector<ConstraintSense>& senses,
    const vector<double>&          rhs,
    const vector<SparseVector>&    rows)
{
    const size_t n = names.size();
    if (senses.size() != n)
        throw invalid_argument("Argument 'senses' has a wrong size.");
    for (size_t i = 0; i < n; i++) {
        value_or_default(rhs, i, n, 0.0, "rhs");
        check_sparse_vector(value_or_default(rows, i, n, SparseVector(), "rows"), variables.size(), "rows");
    }
    vector<int> new_indices;
    new_indices.reserve(n);
    try {
        for (size_t i = 0; i < n; i++) {
            GRBLinExpr expr = 0;
            if (!rows.empty()) {
                const SparseVector& sv = rows[i];
                for (size_t j = 0; j < sv.indices.size(); j++)
                    expr += sv.values[j] * variables[ sv.indices[j] ];
            }
            constraints.push_back( model->addConstr(expr, to_gurobi_sense(senses[i]), value_or_default(rhs, i, n, 0.0, "rhs"), names[i]) );
            new_indices.push_back( (int) constraints.size() - 1 );
        }
        model->update();
    } catch (GRBException& e) {
        throw ModelAssemblyError("Gurobi error (code = " + to_string(e.getErrorCode()) + "): " + e.getMessage());
    }
    return new_indices;
}

vector<double> GurobiMILPModel::get_constraint_rhs(const vector<int>& indices) const {
    vector<double> values;
    values.reserve(indices.size());
    try {
        for (int i : indices)
            values.push_back( constraints.at(i).get(GRB_DoubleAttr_RHS) );
    } catch (GRBException& e) {
        throw ModelAssemblyError("Gurobi error (code = " + to_string(e.getErrorCode()) + "): " + e.getMessage());
    }
    return values;
}

void GurobiMILPModel::set_constraint_rhs(const vector<pair<int, double>>& new_rhs) {
    for (auto& [i, b] : new_rhs) {
        if (i < 0 || (size_t) i >= constraints.size())
            throw out_of_range("Constraint index " + to_string(i) + " does not exist.");
    }
    try {
        for (auto& [i, b] : new_rhs)
            constraints[i].set(GRB_DoubleAttr_RHS, b);
        model->update();
    } catch (GRBException& e) {
        throw ModelAssemblyError("Gurobi error (code = " + to_string(e.getErrorCode()) + "): " + e.getMessage());
    }
}

bool GurobiMILPModel::write_lp(const filesystem::path& filepath) const {
    // gurobi selects the format by the file extension
    filesystem::path lp_path = filepath;
    if (lp_path.extension() != ".lp")
        lp_path += ".lp";
    try {
        model->write(lp_path.string());
    } catch (GRBException& e) {
        cerr << "Error when writing the model (code = " << e.getErrorCode() << ") with message:" << endl;
        cerr << e.getMessage() << endl;
        return false;
    }
    return true;
}

bool GurobiMILPModel::solve(double time_limit_s) {
    try {
        if (time_limit_s > 0.0 && std::isfinite(time_limit_s))
            model->set(GRB_DoubleParam_TimeLimit, time_limit_s);
        //
        // Execute the optimization and check results
        model->optimize();
        int model_status = model->get(GRB_IntAttr_Status);
        if (model_status == GRB_INFEASIBLE) {
            throw InfeasibleScheduleError("The solver proved that the schedule is infeasible.");
        }
        if (model->get(GRB_IntAttr_SolCount) == 0) {
            cerr << "Optimization not resulting in a feasible solution.\n";
            cerr << "Gurobi model status = " << model_status << endl;
            return false;
        }
        if (model_status != GRB_OPTIMAL) {
            cerr << "Warning: Gurobi model status = " << model_status << ", the solution is not proven to be optimal." << endl;
        }
        //
        // Get the results
        solution.resize(variables.size());
        for (size_t i = 0; i < variables.size(); i++)
            solution[i] = variables[i].get(GRB_DoubleAttr_X);
        objective_value = model->get(GRB_DoubleAttr_ObjVal);
    } catch (GRBException& e) {
        cerr << "Error during optimization (code = " << e.getErrorCode() << ") with message:" << endl;
        cerr << e.getMessage() << endl;
        return false;
    }
    return true;
}

void GurobiMILPModel::InitializeGurobiEnvironment() {
    env = new GRBEnv(true);
    env->set(GRB_IntParam_OutputFlag, 0); // disable output
    env->start();
}

void GurobiMILPModel::VacuumAllStaticVariables() {
    if (env != NULL)
        delete env;
    env = NULL;
}
