/*
 * model_assembly.h
 *
 * Contains the households and the aggregator, and the assembler
 * that links everything into one model:
 * device power -> household net load -> aggregator total load
 *
 */

#ifndef MODEL_ASSEMBLY_H
#define MODEL_ASSEMBLY_H

#include <limits>
#include <string>
#include <vector>

#include "devices.h"
#include "index_registry.h"
#include "milp_model_general.hpp"
#include "model_builder.h"


/*!
 * A household with an ordered list of devices.
 * The order of the devices only affects the numbering of the variables and constraints.
 */
struct Household {
    std::string label;
    std::vector<Device> devices;
    double net_load_min = -std::numeric_limits<double>::infinity(); ///< Lower bound of the net load in every time step
    double net_load_max =  std::numeric_limits<double>::infinity(); ///< Upper bound of the net load in every time step
};

/*!
 * Parameters of the aggregator, i.e. of the total load of all households
 */
struct AggregatorSpec {
    std::vector<double> price;          ///< Price per kWh and time step
    std::vector<double> total_load_min; ///< Lower bound of the total load per time step
    std::vector<double> total_load_max; ///< Upper bound of the total load per time step
};


/**
 * The model assembler owns the builder and thereby the index registry.
 * One assembler builds exactly one model.
 */
class ModelAssembler {
    public:
        ModelAssembler(BaseMILPModel& model, const TimeWindow& window, bool binaries);
        ModelAssembler(const ModelAssembler&) = delete;
        ModelAssembler& operator=(const ModelAssembler&) = delete;

        /**
         * Validates all inputs and adds the complete model.
         * Validation happens before anything is added to the model, i.e. a ParameterError leaves the model untouched.
         * It can only be called once per assembler.
         */
        void assemble(const AggregatorSpec& aggregator, const std::vector<Household>& households);

        /**
         * Checks the aggregator, all household and device labels and all devices against the time window.
         * Throws ParameterError on the first problem found.
         */
        static void validate(const TimeWindow& window, const AggregatorSpec& aggregator, const std::vector<Household>& households);

        const IndexRegistry& get_registry() const { return builder.get_registry(); }
        const TimeWindow& get_time_window() const { return builder.get_time_window(); }
        bool is_assembled() const { return assembled; }

    private:
        void add_aggregator(const AggregatorSpec& aggregator);
        void add_household(const Household& household);

        ModelBuilder builder;
        bool assembled;
};

#endif
