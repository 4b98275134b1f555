/*
 * model_builder.h
 *
 * The model builder is the only way to add variables and constraints
 * to a model. It keeps the index registry in sync with the model
 * and carries the settings that are fixed for one assembly run,
 * i.e. the time window and the binaries flag.
 *
 */

#ifndef MODEL_BUILDER_H
#define MODEL_BUILDER_H

#include <limits>
#include <string>
#include <vector>

#include "index_registry.h"
#include "milp_model_general.hpp"


/**
 * Time window of the model: steps 0 .. n_steps-1 with delta_t hours each
 */
struct TimeWindow {
    unsigned long n_steps; ///< Number of time steps T
    double delta_t;        ///< Length of one time step in hours
};

/**
 * Coefficient of a new variable in an already declared constraint
 */
struct ColumnTerm {
    IndexKey constraint;
    double coefficient;
};

/**
 * Coefficient of an already declared variable in a new constraint
 */
struct RowTerm {
    IndexKey variable;
    double coefficient;
};

struct VariableSpec {
    double lower_bound;
    double upper_bound;
    VariableType type;
    double objective;
    std::vector<ColumnTerm> column;
};

struct ConstraintSpec {
    ConstraintSense sense;
    double rhs;
    std::vector<RowTerm> terms;
};


class ModelBuilder {
    public:
        /**
         * Creates a new builder for the given (empty) model.
         * Throws ParameterError if the time window is invalid.
         */
        ModelBuilder(BaseMILPModel& model, const TimeWindow& window, bool binaries);
        ModelBuilder(const ModelBuilder&) = delete;
        ModelBuilder& operator=(const ModelBuilder&) = delete;

        const TimeWindow& get_time_window() const { return window;         }
        unsigned long get_n_steps()         const { return window.n_steps; }
        double get_delta_t()                const { return window.delta_t; }
        bool get_binaries()                 const { return binaries;       }
        const IndexRegistry& get_registry() const { return registry;       }

        /**
         * Returns the definition of an indicator variable in [0,1] without objective and without column.
         * The variable is binary if the global binaries flag and the parameter allow_binary are both set,
         * otherwise it is continuous.
         */
        VariableSpec indicator_spec(bool allow_binary = true) const;

        /**
         * Declares a series of new variables with one call to the model.
         * All constraint keys used in the columns must already be declared, and no key in
         * keys (and no name of such a key) must be declared before. Otherwise UnknownKeyError or DuplicateKeyError is thrown
         * and neither the model nor the registry are changed.
         *
         * @return: Returns the new indices, in the order of the parameter keys
         */
        std::vector<int> declare_variables(const std::vector<IndexKey>& keys, const std::vector<VariableSpec>& specs);
        int declare_variable(const IndexKey& key, const VariableSpec& spec);

        /**
         * Declares a series of new constraints with one call to the model.
         * All variable keys used in the terms must already be declared, see declare_variables().
         *
         * @return: Returns the new indices, in the order of the parameter keys
         */
        std::vector<int> declare_constraints(const std::vector<IndexKey>& keys, const std::vector<ConstraintSpec>& specs);
        int declare_constraint(const IndexKey& key, const ConstraintSpec& spec);

        /**
         * Declares the variables (household, device, field, t) for t = 0 .. specs.size()-1
         */
        std::vector<int> declare_variable_series(const std::string& household, const std::string& device, Field field, const std::vector<VariableSpec>& specs);
        /**
         * Declares the constraints (household, device, field, t) for t = 0 .. specs.size()-1
         */
        std::vector<int> declare_constraint_series(const std::string& household, const std::string& device, Field field, const std::vector<ConstraintSpec>& specs);

        int lookup_variable(const IndexKey& key)   const { return registry.lookup_variable(key);   }
        int lookup_constraint(const IndexKey& key) const { return registry.lookup_constraint(key); }

        /**
         * Subtracts values[i] from the right-hand side of the constraint keys[i].
         * All keys are resolved before the model is changed.
         */
        void subtract_from_rhs(const std::vector<IndexKey>& keys, const std::vector<double>& values);

        /**
         * Returns the column term that links a device power to the net load of its household in time step t
         */
        static ColumnTerm net_load_link(const std::string& household, unsigned long t, double coefficient) {
            return ColumnTerm{IndexKey::Household(household, Field::LinkNetLoad, (long) t), coefficient};
        }

    private:
        BaseMILPModel& model;
        const TimeWindow window;
        const bool binaries;
        IndexRegistry registry;
};

#endif
