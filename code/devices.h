/*
 * devices.h
 *
 * It contains all household devices that can be part of
 * a demand-response model. Every device translates its
 * physical parameters into variables and constraints.
 *
 */

#ifndef DEVICES_H
#define DEVICES_H

#include <string>
#include <variant>
#include <vector>

// The following classes are defined in this header file:
class DeviceFixedLoad;
class DeviceBattery;
class DeviceThermalLoad;
class DeviceDeferrableLoad;
class DeviceShiftableLoad;
class DeviceCurtailableLoad;

#include "model_builder.h"


/*!
 * A fixed (native) load that cannot be controlled.
 * It has no variables, its demand is moved to the right-hand side
 * of the net load linking constraints of the household.
 */
class DeviceFixedLoad {
    public:
        struct Params {
            std::vector<double> load; ///< Demand in kW per time step
        };
        DeviceFixedLoad(const std::string& label, const Params& params);
        const std::string& get_label() const { return label;  }
        const Params& get_params()     const { return params; }
        static const char* get_kind_name()   { return "FixedLoad"; }
        void check_against_window(const TimeWindow& window) const; ///< Throws ParameterError if the device does not fit into the time window
        void contribute(ModelBuilder& builder, const std::string& household) const;
    private:
        std::string label;
        Params params;
};

/*!
 * A battery storage with separate charging and discharging power,
 * conversion efficiencies and self-discharge given as half life.
 */
class DeviceBattery {
    public:
        struct Params {
            double pwr_chg_min; ///< Minimum charging power in kW (if charging)
            double pwr_chg_max; ///< Maximum charging power in kW
            double pwr_dis_min; ///< Minimum discharging power in kW (if discharging)
            double pwr_dis_max; ///< Maximum discharging power in kW
            double soc_min;     ///< Minimum state of charge in kWh
            double soc_max;     ///< Maximum state of charge in kWh
            double soc_init;    ///< State of charge before the first time step in kWh
            double eff_chg;     ///< Charging efficiency
            double eff_dis;     ///< Discharging efficiency
            double half_life;   ///< Self-discharge half life in hours, +inf for no self-discharge
        };
        DeviceBattery(const std::string& label, const Params& params);
        const std::string& get_label() const { return label;  }
        const Params& get_params()     const { return params; }
        static const char* get_kind_name()   { return "Battery"; }
        /**
         * Returns the share of the state of charge that is left after one time step of length delta_t
         */
        double get_retention_factor(double delta_t) const;
        void check_against_window(const TimeWindow& window) const;
        void contribute(ModelBuilder& builder, const std::string& household) const;
    private:
        std::string label;
        Params params;
};

/*!
 * A heating device (e.g. a thermostat controlled heater) with a simple
 * first-order thermal model of the building.
 */
class DeviceThermalLoad {
    public:
        struct Params {
            std::vector<double> temp_min; ///< Minimum indoor temperature per time step
            std::vector<double> temp_max; ///< Maximum indoor temperature per time step
            std::vector<double> temp_ext; ///< Outside temperature per time step
            double temp_init;             ///< Indoor temperature before the first time step
            double pwr_th_min;            ///< Minimum power in kW (if on)
            double pwr_th_max;            ///< Maximum power in kW
            double heat_cpty;             ///< Heat capacity of the building in kWh / degree
            double th_eff;                ///< Thermal efficiency
            double cond_coeff;            ///< Heat conductance coefficient in kW / degree
        };
        DeviceThermalLoad(const std::string& label, const Params& params);
        const std::string& get_label() const { return label;  }
        const Params& get_params()     const { return params; }
        static const char* get_kind_name()   { return "ThermalLoad"; }
        void check_against_window(const TimeWindow& window) const;
        void contribute(ModelBuilder& builder, const std::string& household) const;
    private:
        std::string label;
        Params params;
};

/*!
 * A load that has to consume a given amount of energy over the time horizon,
 * e.g. an electric vehicle.
 */
class DeviceDeferrableLoad {
    public:
        struct Params {
            double energy_min;            ///< Minimum energy over the horizon in kWh
            double energy_max;            ///< Maximum energy over the horizon in kWh
            std::vector<double> pwr_min;  ///< Minimum power per time step in kW (if on)
            std::vector<double> pwr_max;  ///< Maximum power per time step in kW
        };
        DeviceDeferrableLoad(const std::string& label, const Params& params);
        const std::string& get_label() const { return label;  }
        const Params& get_params()     const { return params; }
        static const char* get_kind_name()   { return "DeferrableLoad"; }
        void check_against_window(const TimeWindow& window) const;
        void contribute(ModelBuilder& builder, const std::string& household) const;
    private:
        std::string label;
        Params params;
};

/*!
 * An uninterruptible load that runs a sequence of cycles (e.g. a dishwasher).
 * Every cycle has a fixed power profile and must start inside its own start window.
 * Cycle k starts only after cycle k-1 has finished.
 */
class DeviceShiftableLoad {
    public:
        struct Params {
            std::vector<long> t_start_min;            ///< Earliest start time step per cycle
            std::vector<long> t_start_max;            ///< Latest start time step per cycle
            std::vector<std::vector<double>> cycles;  ///< Power profile per cycle (index 0) and step inside the cycle (index 1)
        };
        DeviceShiftableLoad(const std::string& label, const Params& params);
        const std::string& get_label() const { return label;  }
        const Params& get_params()     const { return params; }
        static const char* get_kind_name()   { return "ShiftableLoad"; }
        size_t get_n_cycles() const { return params.cycles.size(); }
        long get_duration(size_t cycle) const { return (long) params.cycles.at(cycle).size(); }
        void check_against_window(const TimeWindow& window) const;
        void contribute(ModelBuilder& builder, const std::string& household) const;
    private:
        std::string label;
        Params params;
};

/*!
 * A load (or a negative load, i.e. a generation like PV) that can be curtailed
 * to a fraction between 0 and 1 of its given profile.
 */
class DeviceCurtailableLoad {
    public:
        struct Params {
            std::vector<double> load; ///< Uncurtailed power per time step in kW, negative for generation
            bool binary;              ///< If true, the curtailment is on/off only (if binaries are enabled)
        };
        DeviceCurtailableLoad(const std::string& label, const Params& params);
        const std::string& get_label() const { return label;  }
        const Params& get_params()     const { return params; }
        static const char* get_kind_name()   { return "CurtailableLoad"; }
        void check_against_window(const TimeWindow& window) const;
        void contribute(ModelBuilder& builder, const std::string& household) const;
    private:
        std::string label;
        Params params;
};


/*!
 * Closed set of all device kinds
 */
using Device = std::variant<
    DeviceFixedLoad,
    DeviceBattery,
    DeviceThermalLoad,
    DeviceDeferrableLoad,
    DeviceShiftableLoad,
    DeviceCurtailableLoad
>;

const std::string& get_device_label(const Device& device);
const char* get_device_kind_name(const Device& device);
void check_device_against_window(const Device& device, const TimeWindow& window);
/**
 * Adds all variables and constraints of a device to the model.
 * The net load structures of the household must exist already.
 */
void contribute_device(const Device& device, ModelBuilder& builder, const std::string& household);

#endif
