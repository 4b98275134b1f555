/*
 * index_registry.h
 *
 * Contains the structured keys for variables and constraints
 * and the registry mapping these keys to the indices assigned
 * by the solver model.
 *
 */

#ifndef INDEX_REGISTRY_H
#define INDEX_REGISTRY_H

#include <compare>
#include <map>
#include <set>
#include <string>
#include <vector>


/*!
 * This enum defines all field tags that can be part of an index key.
 * The first block is used on aggregator and household level, all
 * other blocks belong to the individual device kinds.
 */
enum struct Field : short {
    // aggregator and household level
    TotalLoad,                ///< Total load of all households (variable)
    LinkTotalLoad,            ///< Linking of total load and household net loads (constraint)
    NetLoad,                  ///< Net load of one household (variable)
    LinkNetLoad,              ///< Linking of household net load and device powers (constraint)
    // variables of the devices
    Power,                    ///< Power of a thermal, deferrable, shiftable or curtailable load
    PowerCharge,              ///< Battery charging power
    PowerDischarge,           ///< Battery discharging power
    StateOfCharge,            ///< Battery state of charge
    ChargeIndicator,          ///< Battery charging indicator
    DischargeIndicator,       ///< Battery discharging indicator
    OnIndicator,              ///< On/off indicator of a thermal load
    Temperature,              ///< Indoor temperature of a thermal load
    Control,                  ///< On/off indicator of a deferrable load or curtailment fraction of a curtailable load
    StartIndicator,           ///< Start indicator of a shiftable load per (cycle, start time)
    // battery constraints
    EnergyConservation,
    PowerChargeMin,
    PowerChargeMax,
    PowerDischargeMin,
    PowerDischargeMax,
    ChargeDischargeExclusion,
    // thermal load constraints
    PowerThermalMin,
    PowerThermalMax,
    TemperatureExchange,
    // deferrable load constraints
    EnergyTotalMin,
    EnergyTotalMax,
    PowerMin,
    PowerMax,
    // shiftable load constraints
    StartUp,
    NetPower,
    CycleStart,
    // curtailable load constraints
    Curtailment
};

/**
 * Returns the short tag of a field as used in the names handed over to the solver.
 */
const char* get_field_tag(Field field);


/**
 * Structured key of a variable or a constraint.
 *
 * - household is empty for keys of the aggregator
 * - device is empty for keys on household or aggregator level
 * - time is -1 for time-independent entries
 * - cycle is -1 if the entry does not belong to a cycle of a shiftable load
 */
struct IndexKey {
    std::string household;
    std::string device;
    Field field;
    long time  = -1;
    long cycle = -1;

    auto operator<=>(const IndexKey&) const = default;

    /**
     * Returns the name of the entry as handed over to the solver,
     * e.g. HH_0_bat_0_soc_3. The name is for reading only, it is
     * never parsed back into a key.
     */
    std::string to_name() const;

    // factory methods for the three scopes
    static IndexKey Aggregator(Field field, long time) {
        return IndexKey{"", "", field, time, -1};
    }
    static IndexKey Household(const std::string& household, Field field, long time) {
        return IndexKey{household, "", field, time, -1};
    }
    static IndexKey Device(const std::string& household, const std::string& device, Field field, long time = -1, long cycle = -1) {
        return IndexKey{household, device, field, time, cycle};
    }
};


/**
 * The registry stores the solver indices of all declared variables and constraints.
 * Entries can only be added, there is no way to remove them.
 * Write access is only granted by class ModelBuilder.
 */
class IndexRegistry {
    public:
        // read access
        bool has_variable(const IndexKey& key)   const { return variable_index.contains(key);   }
        bool has_constraint(const IndexKey& key) const { return constraint_index.contains(key); }
        bool has_variable_name(const std::string& name)   const { return variable_names.contains(name);   }
        bool has_constraint_name(const std::string& name) const { return constraint_names.contains(name); }
        int  lookup_variable(const IndexKey& key)   const; ///< Returns the index of a variable, throws UnknownKeyError if the key is not declared
        int  lookup_constraint(const IndexKey& key) const; ///< Returns the index of a constraint, throws UnknownKeyError if the key is not declared
        size_t get_n_variables()   const { return variable_index.size();   }
        size_t get_n_constraints() const { return constraint_index.size(); }
        const std::map<IndexKey, int>& get_variable_map()   const { return variable_index;   }
        const std::map<IndexKey, int>& get_constraint_map() const { return constraint_index; }
        /**
         * Returns all variable keys of a given scope.
         * If device is empty, only the household-level keys are returned.
         */
        std::vector<IndexKey> get_variable_keys_of(const std::string& household, const std::string& device) const;
        /**
         * Returns all constraint keys of a given scope, see get_variable_keys_of().
         */
        std::vector<IndexKey> get_constraint_keys_of(const std::string& household, const std::string& device) const;
        size_t count_variables_of_household(const std::string& household)   const; ///< Number of variables on household level and of all devices of this household
        size_t count_constraints_of_household(const std::string& household) const; ///< Number of constraints on household level and of all devices of this household
        // write access
        /**
         * Registers a new variable.
         * Throws DuplicateKeyError if the key or its name (see IndexKey::to_name()) is already registered,
         * e.g. for household "A_b" with device "c" and household "A" with device "b_c".
         */
        void register_variable(const IndexKey& key, int index);
        void register_constraint(const IndexKey& key, int index); ///< See register_variable()
    private:
        std::map<IndexKey, int> variable_index;
        std::map<IndexKey, int> constraint_index;
        std::set<std::string>   variable_names;
        std::set<std::string>   constraint_names;
};

#endif
