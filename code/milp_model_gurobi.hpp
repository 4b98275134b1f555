/**
 * milp_model_gurobi.hpp
 *
 * This file contains the model implementation that passes
 * the assembled MILP directly to gurobi.
 */

#ifndef MILP_MODEL_GUROBI_HPP
#define MILP_MODEL_GUROBI_HPP

#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "milp_model_general.hpp"

#include "gurobi_c++.h"

class GurobiMILPModel : public BaseMILPModel {

    private:
        static GRBEnv* env; ///< The global gurobi environment

    public:
        GurobiMILPModel(); ///< Throws ModelAssemblyError if InitializeGurobiEnvironment() has not been called

        std::vector<int> add_variables(
            const std::vector<std::string>&     names,
            const std::vector<double>&          lower_bounds,
            const std::vector<double>&          upper_bounds,
            const std::vector<VariableType>&    types,
            const std::vector<double>&          objective,
            const std::vector<SparseVector>&    columns
        );
        std::vector<int> add_constraints(
            const std::vector<std::string>&     names,
            const std::vector<ConstraintSense>& senses,
            const std::vector<double>&          rhs,
            const std::vector<SparseVector>&    rows
        );
        std::vector<double> get_constraint_rhs(const std::vector<int>& indices) const;
        void set_constraint_rhs(const std::vector<std::pair<int, double>>& new_rhs);
        size_t get_n_variables()   const { return variables.size();   }
        size_t get_n_constraints() const { return constraints.size(); }
        bool write_lp(const std::filesystem::path& filepath) const;
        bool solve(double time_limit_s);
        std::vector<double> get_variable_values() const { return solution; }
        double get_objective_value() const { return objective_value; }

        /**
         * Initializes the global environment.
         */
        static void InitializeGurobiEnvironment();

        /**
         * Deletes all global variables.
         */
        static void VacuumAllStaticVariables();

    private:
        std::unique_ptr<GRBModel> model;
        std::vector<GRBVar>    variables;
        std::vector<GRBConstr> constraints;
        std::vector<double> solution;
        double objective_value;

};

#endif
