/**
 * milp_model_or_tools.hpp
 *
 * This file contains the model implementation that passes
 * the assembled MILP directly to OR-Tools (SCIP).
 */

#ifndef MILP_MODEL_OR_TOOLS_HPP
#define MILP_MODEL_OR_TOOLS_HPP

#include <cmath>
#include <fstream>
#include <limits>
#include <iostream>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "milp_model_general.hpp"
#include "model_errors.hpp"

#include "absl/time/time.h"
#include "ortools/linear_solver/linear_solver.h"

using namespace operations_research;

class ORToolsMILPModel : public BaseMILPModel {

    public:
    ORToolsMILPModel() :
        model(MPSolver::CreateSolver("SCIP"))
    {
        if (!model) {
            throw ModelAssemblyError("SCIP solver unavailable in this OR-Tools installation.");
        }
        infinity = model->infinity();
    }

    std::vector<int> add_variables(
        const std::vector<std::string>&     names,
        const std::vector<double>&          lower_bounds,
        const std::vector<double>&          upper_bounds,
        const std::vector<VariableType>&    types,
        const std::vector<double>&          objective,
        const std::vector<SparseVector>&    columns
    ) {
        const size_t n = names.size();
        // check the sizes before the first variable is created
        for (size_t i = 0; i < n; i++) {
            value_or_default(lower_bounds, i, n, 0.0,      "lower_bounds");
            value_or_default(upper_bounds, i, n, std::numeric_limits<double>::infinity(), "upper_bounds");
            value_or_default(types,        i, n, VariableType::Continuous, "types");
            value_or_default(objective,    i, n, 0.0,      "objective");
            const SparseVector col = value_or_default(columns, i, n, SparseVector(), "columns");
            check_sparse_vector(col, constraints.size(), "columns");
        }
        MPObjective* const obj = model->MutableObjective();
        std::vector<int> new_indices;
        new_indices.reserve(n);
        for (size_t i = 0; i < n; i++) {
            const bool is_binary = value_or_default(types, i, n, VariableType::Continuous, "types") == VariableType::Binary;
            MPVariable* const v = model->MakeVar(
                to_solver_value(value_or_default(lower_bounds, i, n, 0.0,      "lower_bounds")),
                to_solver_value(value_or_default(upper_bounds, i, n, std::numeric_limits<double>::infinity(), "upper_bounds")),
                is_binary,
                names[i]);
            obj->SetCoefficient(v, value_or_default(objective, i, n, 0.0, "objective"));
            if (!columns.empty()) {
                const SparseVector& col = columns[i];
                for (size_t j = 0; j < col.indices.size(); j++) {
                    MPConstraint* const c = constraints[ col.indices[j] ];
                    c->SetCoefficient(v, c->GetCoefficient(v) + col.values[j]);
                }
            }
            new_indices.push_back( (int) variables.size() );
            variables.push_back(v);
        }
        obj->SetMinimization();
        return new_indices;
    }

    std::vector<int> add_constraints(
        const std::vector<std::string>&     names,
        const std::vector<ConstraintSense>& senses,
        const std::vector<double>&          rhs,
        const std::vector<SparseVector>&    rows
    ) {
        const size_t n = names.size();
        if (senses.size() != n)
            throw std::invalid_argument("Argument 'senses' has a wrong size.");
        for (size_t i = 0; i < n; i++) {
            value_or_default(rhs, i, n, 0.0, "rhs");
            const SparseVector row = value_or_default(rows, i, n, SparseVector(), "rows");
            check_sparse_vector(row, variables.size(), "rows");
        }
        std::vector<int> new_indices;
        new_indices.reserve(n);
        for (size_t i = 0; i < n; i++) {
            const double b = value_or_default(rhs, i, n, 0.0, "rhs");
            MPConstraint* const c = model->MakeRowConstraint(-infinity, infinity, names[i]);
            set_bounds(c, senses[i], b);
            if (!rows.empty()) {
                const SparseVector& row = rows[i];
                for (size_t j = 0; j < row.indices.size(); j++) {
                    MPVariable* const v = variables[ row.indices[j] ];
                    c->SetCoefficient(v, c->GetCoefficient(v) + row.values[j]);
                }
            }
            new_indices.push_back( (int) constraints.size() );
            constraints.push_back(c);
            constraint_senses.push_back(senses[i]);
            constraint_rhs.push_back(b);
        }
        return new_indices;
    }

    std::vector<double> get_constraint_rhs(const std::vector<int>& indices) const {
        std::vector<double> values;
        values.reserve(indices.size());
        for (int i : indices)
            values.push_back( constraint_rhs.at(i) );
        return values;
    }

    void set_constraint_rhs(const std::vector<std::pair<int, double>>& new_rhs) {
        for (auto& [i, b] : new_rhs) {
            if (i < 0 || (size_t) i >= constraints.size())
                throw std::out_of_range("Constraint index " + std::to_string(i) + " does not exist.");
        }
        for (auto& [i, b] : new_rhs) {
            set_bounds(constraints[i], constraint_senses[i], b);
            constraint_rhs[i] = b;
        }
    }

    size_t get_n_variables()   const { return variables.size();   }
    size_t get_n_constraints() const { return constraints.size(); }

    bool write_lp(const std::filesystem::path& filepath) const {
        std::string model_str;
        if (!model->ExportModelAsLpFormat(false, &model_str)) {
            std::cerr << "Error: OR-Tools cannot export the model in the LP format." << std::endl;
            return false;
        }
        std::ofstream ofs(filepath, std::ofstream::out);
        if (!ofs.is_open()) {
            std::cerr << "Error: Output file " << filepath << " cannot be opened!" << std::endl;
            return false;
        }
        ofs << model_str;
        ofs.close();
        return true;
    }

    bool solve(double time_limit_s) {
        if (time_limit_s > 0.0 && std::isfinite(time_limit_s))
            model->SetTimeLimit(absl::Milliseconds( (int64_t) (time_limit_s * 1000.0) ));
        //
        // Execute the optimization and check results
        const MPSolver::ResultStatus result_status = model->Solve();
        if (result_status == MPSolver::INFEASIBLE) {
            throw InfeasibleScheduleError("The solver proved that the schedule is infeasible.");
        }
        if (result_status != MPSolver::OPTIMAL && result_status != MPSolver::FEASIBLE) {
            std::cerr << "Optimization not resulting in a feasible solution.\n";
            std::cerr << "Solver status = " << result_status << std::endl;
            return false;
        }
        if (result_status == MPSolver::FEASIBLE) {
            std::cerr << "Warning: The time limit was reached, the solution is not proven to be optimal." << std::endl;
        }
        //
        // Get the results
        solution.resize(variables.size());
        for (size_t i = 0; i < variables.size(); i++)
            solution[i] = variables[i]->solution_value();
        objective_value = model->Objective().Value();
        return true;
    }

    std::vector<double> get_variable_values() const { return solution; }
    double get_objective_value() const { return objective_value; }

    private:
        std::unique_ptr<MPSolver> model;
        double infinity;
        std::vector<MPVariable*>   variables;   ///< Owned by the solver
        std::vector<MPConstraint*> constraints; ///< Owned by the solver
        std::vector<ConstraintSense> constraint_senses;
        std::vector<double>          constraint_rhs;
        std::vector<double> solution;
        double objective_value = std::numeric_limits<double>::quiet_NaN();

        double to_solver_value(double v) const {
            if (std::isinf(v))
                return v > 0 ? infinity : -infinity;
            return v;
        }

        void set_bounds(MPConstraint* c, ConstraintSense sense, double b) const {
            switch (sense) {
                case ConstraintSense::Equal:        c->SetBounds(b, b);         break;
                case ConstraintSense::LessEqual:    c->SetBounds(-infinity, b); break;
                case ConstraintSense::GreaterEqual: c->SetBounds(b, infinity);  break;
            }
        }

        static void check_sparse_vector(const SparseVector& sv, size_t n_max, const char* argument_name) {
            if (sv.indices.size() != sv.values.size())
                throw std::invalid_argument(std::string("Argument '") + argument_name + "' contains a sparse vector with different sizes.");
            for (int idx : sv.indices) {
                if (idx < 0 || (size_t) idx >= n_max)
                    throw std::out_of_range(std::string("Argument '") + argument_name + "' references the unknown index " + std::to_string(idx) + ".");
            }
        }

};

#endif
