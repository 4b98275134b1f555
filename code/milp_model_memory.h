/*
 * milp_model_memory.h
 *
 * Contains the in-memory MILP model. It keeps all variables and
 * constraints in plain vectors, which makes it the reference model
 * for the tests and for the LP export. It has no solver attached.
 *
 */

#ifndef MILP_MODEL_MEMORY_H
#define MILP_MODEL_MEMORY_H

#include <filesystem>
#include <ostream>
#include <string>
#include <utility>
#include <vector>

#include "milp_model_general.hpp"


class LinearModel : public BaseMILPModel {
    public:
        LinearModel() = default;
        LinearModel(const LinearModel&) = default;

        //
        // implementation of the base class
        std::vector<int> add_variables(
            const std::vector<std::string>&     names,
            const std::vector<double>&          lower_bounds,
            const std::vector<double>&          upper_bounds,
            const std::vector<VariableType>&    types,
            const std::vector<double>&          objective,
            const std::vector<SparseVector>&    columns
        ) override;
        std::vector<int> add_constraints(
            const std::vector<std::string>&     names,
            const std::vector<ConstraintSense>& senses,
            const std::vector<double>&          rhs,
            const std::vector<SparseVector>&    rows
        ) override;
        std::vector<double> get_constraint_rhs(const std::vector<int>& indices) const override;
        void set_constraint_rhs(const std::vector<std::pair<int, double>>& new_rhs) override;
        size_t get_n_variables()   const override { return var_names.size(); }
        size_t get_n_constraints() const override { return cstr_names.size(); }
        bool write_lp(const std::filesystem::path& filepath) const override;

        //
        // read access to the stored model
        const std::string& get_variable_name(int idx)   const { return var_names.at(idx);   }
        double get_lower_bound(int idx)                 const { return var_lb.at(idx);      }
        double get_upper_bound(int idx)                 const { return var_ub.at(idx);      }
        VariableType get_variable_type(int idx)         const { return var_types.at(idx);   }
        double get_objective_coefficient(int idx)       const { return var_obj.at(idx);     }
        const std::string& get_constraint_name(int idx) const { return cstr_names.at(idx);  }
        ConstraintSense get_constraint_sense(int idx)   const { return cstr_senses.at(idx); }
        const SparseVector& get_row(int idx)            const { return cstr_rows.at(idx);   }
        /**
         * Returns the coefficient of a variable in a constraint (0.0 if the variable does not appear).
         * Multiple entries of the same variable are summed up.
         */
        double get_coefficient(int cstr_idx, int var_idx) const;
        /**
         * Returns the index of the variable / constraint with the given name, or -1 if there is none
         */
        int find_variable(const std::string& name)   const;
        int find_constraint(const std::string& name) const;

        //
        // evaluation of points
        /**
         * Returns the objective value of a point x (size must equal the number of variables)
         */
        double evaluate_objective(const std::vector<double>& x) const;
        /**
         * Returns the maximum violation of a point x over all variable bounds,
         * integrality requirements and constraints. A value of 0.0 means that x is feasible.
         */
        double get_max_violation(const std::vector<double>& x) const;
        /**
         * Writes the model in the CPLEX LP format into the given stream
         */
        void write_lp(std::ostream& out) const;

    private:
        // variables
        std::vector<std::string>  var_names;
        std::vector<double>       var_lb;
        std::vector<double>       var_ub;
        std::vector<VariableType> var_types;
        std::vector<double>       var_obj;
        // constraints
        std::vector<std::string>     cstr_names;
        std::vector<ConstraintSense> cstr_senses;
        std::vector<double>          cstr_rhs;
        std::vector<SparseVector>    cstr_rows;
};

#endif
