
#include "milp_model_memory.h"

#include <algorithm>
#include <cmath>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <limits>
#include <stdexcept>
#include <string>
#include <vector>

using namespace std;


// ----------------------------- //
//      Implementation of        //
//         LinearModel           //
// ----------------------------- //

vector<int> LinearModel::add_variables(
    const vector<string>&       names,
    const vector<double>&       lower_bounds,
    const vector<double>&       upper_bounds,
    const vector<VariableType>& types,
    const vector<double>&       objective,
    const vector<SparseVector>& columns)
{
    const size_t n = names.size();
    const double inf = numeric_limits<double>::infinity();
    // check all arguments first, so that nothing is added if one of them is invalid
    if ((!lower_bounds.empty() && lower_bounds.size() != n) ||
        (!upper_bounds.empty() && upper_bounds.size() != n) ||
        (!types.empty()        && types.size()        != n) ||
        (!objective.empty()    && objective.size()    != n) ||
        (!columns.empty()      && columns.size()      != n))
    {
        throw invalid_argument("Arguments of add_variables() have different sizes.");
    }
    for (size_t i = 0; i < columns.size(); i++) {
        const SparseVector& col = columns[i];
        if (col.indices.size() != col.values.size())
            throw invalid_argument("Column of variable " + names.at(i) + " has a different number of indices and values.");
        for (int cidx : col.indices) {
            if (cidx < 0 || (size_t) cidx >= cstr_names.size())
                throw out_of_range("Column of variable " + names.at(i) + " references unknown constraint index " + to_string(cidx) + ".");
        }
    }
    vector<int> new_indices;
    new_indices.reserve(n);
    for (size_t i = 0; i < n; i++) {
        const int new_idx = (int) var_names.size();
        var_names.push_back(names[i]);
        var_lb.push_back(   value_or_default(lower_bounds, i, n, 0.0, "lower_bounds"));
        var_ub.push_back(   value_or_default(upper_bounds, i, n, inf, "upper_bounds"));
        var_types.push_back(value_or_default(types,        i, n, VariableType::Continuous, "types"));
        var_obj.push_back(  value_or_default(objective,    i, n, 0.0, "objective"));
        if (!columns.empty()) {
            const SparseVector& col = columns.at(i);
            for (size_t j = 0; j < col.indices.size(); j++) {
                SparseVector& row = cstr_rows[col.indices[j]];
                row.indices.push_back(new_idx);
                row.values.push_back(col.values[j]);
            }
        }
        new_indices.push_back(new_idx);
    }
    return new_indices;
}

vector<int> LinearModel::add_constraints(
    const vector<string>&          names,
    const vector<ConstraintSense>& senses,
    const vector<double>&          rhs,
    const vector<SparseVector>&    rows)
{
    const size_t n = names.size();
    if ((!senses.empty() && senses.size() != n) ||
        (!rhs.empty()    && rhs.size()    != n) ||
        (!rows.empty()   && rows.size()   != n))
    {
        throw invalid_argument("Arguments of add_constraints() have different sizes.");
    }
    for (size_t i = 0; i < rows.size(); i++) {
        const SparseVector& row = rows[i];
        if (row.indices.size() != row.values.size())
            throw invalid_argument("Row of constraint " + names.at(i) + " has a different number of indices and values.");
        for (int vidx : row.indices) {
            if (vidx < 0 || (size_t) vidx >= var_names.size())
                throw out_of_range("Row of constraint " + names.at(i) + " references unknown variable index " + to_string(vidx) + ".");
        }
    }
    vector<int> new_indices;
    new_indices.reserve(n);
    for (size_t i = 0; i < n; i++) {
        const int new_idx = (int) cstr_names.size();
        cstr_names.push_back(names[i]);
        cstr_senses.push_back(value_or_default(senses, i, n, ConstraintSense::Equal, "senses"));
        cstr_rhs.push_back(   value_or_default(rhs,    i, n, 0.0, "rhs"));
        cstr_rows.push_back(  value_or_default(rows,   i, n, SparseVector(), "rows"));
        new_indices.push_back(new_idx);
    }
    return new_indices;
}

vector<double> LinearModel::get_constraint_rhs(const vector<int>& indices) const {
    vector<double> values;
    values.reserve(indices.size());
    for (int idx : indices)
        values.push_back(cstr_rhs.at(idx));
    return values;
}

void LinearModel::set_constraint_rhs(const vector<pair<int, double>>& new_rhs) {
    for (const auto& [idx, value] : new_rhs)
        cstr_rhs.at(idx) = value;
}

double LinearModel::get_coefficient(int cstr_idx, int var_idx) const {
    const SparseVector& row = cstr_rows.at(cstr_idx);
    double coeff = 0.0;
    for (size_t j = 0; j < row.indices.size(); j++) {
        if (row.indices[j] == var_idx)
            coeff += row.values[j];
    }
    return coeff;
}

int LinearModel::find_variable(const string& name) const {
    auto it = find(var_names.begin(), var_names.end(), name);
    if (it == var_names.end())
        return -1;
    return (int) (it - var_names.begin());
}

int LinearModel::find_constraint(const string& name) const {
    auto it = find(cstr_names.begin(), cstr_names.end(), name);
    if (it == cstr_names.end())
        return -1;
    return (int) (it - cstr_names.begin());
}

double LinearModel::evaluate_objective(const vector<double>& x) const {
    if (x.size() != var_names.size())
        throw invalid_argument("Point has " + to_string(x.size()) + " entries, but the model has " + to_string(var_names.size()) + " variables.");
    double value = 0.0;
    for (size_t i = 0; i < x.size(); i++)
        value += var_obj[i] * x[i];
    return value;
}

double LinearModel::get_max_violation(const vector<double>& x) const {
    if (x.size() != var_names.size())
        throw invalid_argument("Point has " + to_string(x.size()) + " entries, but the model has " + to_string(var_names.size()) + " variables.");
    double max_viol = 0.0;
    // 1. bounds and integrality
    for (size_t i = 0; i < x.size(); i++) {
        max_viol = max(max_viol, var_lb[i] - x[i]);
        max_viol = max(max_viol, x[i] - var_ub[i]);
        if (var_types[i] == VariableType::Binary)
            max_viol = max(max_viol, fabs(x[i] - round(x[i])));
    }
    // 2. rows
    for (size_t c = 0; c < cstr_names.size(); c++) {
        const SparseVector& row = cstr_rows[c];
        double activity = 0.0;
        for (size_t j = 0; j < row.indices.size(); j++)
            activity += row.values[j] * x[row.indices[j]];
        const double diff = activity - cstr_rhs[c];
        switch (cstr_senses[c]) {
            case ConstraintSense::Equal:        max_viol = max(max_viol, fabs(diff)); break;
            case ConstraintSense::LessEqual:    max_viol = max(max_viol, diff);       break;
            case ConstraintSense::GreaterEqual: max_viol = max(max_viol, -diff);      break;
        }
    }
    return max_viol;
}


//
// LP export
//

/*
 * Writes a bound value in the LP format
 */
static void write_lp_number(ostream& out, double value) {
    if (isinf(value))
        out << (value > 0 ? "+inf" : "-inf");
    else
        out << value;
}

/*
 * Writes the linear expression of a row or the objective.
 * Lines are wrapped after a few terms, as some LP readers limit the line length.
 */
static void write_lp_expression(ostream& out, const vector<int>& indices, const vector<double>& values, const vector<string>& var_names) {
    const size_t terms_per_line = 6;
    if (indices.empty()) {
        // an empty expression is not allowed in the LP format
        if (!var_names.empty())
            out << " 0 " << var_names[0];
        return;
    }
    for (size_t j = 0; j < indices.size(); j++) {
        if (j > 0 && j % terms_per_line == 0)
            out << "\n   ";
        const double v = values[j];
        out << (v < 0 ? " - " : " + ") << fabs(v) << " " << var_names[indices[j]];
    }
}

void LinearModel::write_lp(ostream& out) const {
    out << setprecision(15);
    out << "\\ Demand-response model with " << var_names.size() << " variables and " << cstr_names.size() << " constraints\n";
    //
    // objective
    out << "Minimize\n obj:";
    vector<int>    obj_idx;
    vector<double> obj_val;
    for (size_t i = 0; i < var_obj.size(); i++) {
        if (var_obj[i] != 0.0) {
            obj_idx.push_back((int) i);
            obj_val.push_back(var_obj[i]);
        }
    }
    write_lp_expression(out, obj_idx, obj_val, var_names);
    out << "\n";
    //
    // constraints
    out << "Subject To\n";
    for (size_t c = 0; c < cstr_names.size(); c++) {
        out << " " << cstr_names[c] << ":";
        write_lp_expression(out, cstr_rows[c].indices, cstr_rows[c].values, var_names);
        switch (cstr_senses[c]) {
            case ConstraintSense::Equal:        out << " = ";  break;
            case ConstraintSense::LessEqual:    out << " <= "; break;
            case ConstraintSense::GreaterEqual: out << " >= "; break;
        }
        out << cstr_rhs[c] << "\n";
    }
    //
    // bounds
    out << "Bounds\n";
    for (size_t i = 0; i < var_names.size(); i++) {
        if (var_types[i] == VariableType::Binary && var_lb[i] == 0.0 && var_ub[i] == 1.0)
            continue;
        if (isinf(var_lb[i]) && var_lb[i] < 0 && isinf(var_ub[i]) && var_ub[i] > 0) {
            out << " " << var_names[i] << " free\n";
            continue;
        }
        out << " ";
        write_lp_number(out, var_lb[i]);
        out << " <= " << var_names[i] << " <= ";
        write_lp_number(out, var_ub[i]);
        out << "\n";
    }
    //
    // integrality
    bool binary_section_started = false;
    for (size_t i = 0; i < var_names.size(); i++) {
        if (var_types[i] != VariableType::Binary)
            continue;
        if (!binary_section_started) {
            out << "Binaries\n";
            binary_section_started = true;
        }
        out << " " << var_names[i] << "\n";
    }
    out << "End\n";
}

bool LinearModel::write_lp(const filesystem::path& filepath) const {
    ofstream out(filepath, ofstream::out);
    if (!out.is_open()) {
        cerr << "Error: Cannot open file " << filepath.string() << " for writing." << endl;
        return false;
    }
    write_lp(out);
    out.close();
    return true;
}
