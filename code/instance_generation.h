/*
 * instance_generation.h
 *
 * This file contains the functions to generate random
 * instances, i.e. households with sampled device sets,
 * out of normalized time series.
 */

#ifndef INSTANCE_GENERATION_H
#define INSTANCE_GENERATION_H

#include <string>
#include <vector>

#include "devices.h"
#include "model_assembly.h"
#include "model_builder.h"


namespace instance {

    /**
     * Time series of one time window, as loaded from the database
     */
    struct TimeSeriesData {
        std::vector<double> price_market;    ///< Market price (HOEP)
        std::vector<double> price_tou;       ///< Time of use price
        std::vector<double> load_norm;       ///< Demand, normalized by its mean
        std::vector<double> pv_norm;         ///< Solar production, normalized by its mean
        std::vector<double> wind_norm;       ///< Wind production, normalized by its mean
        std::vector<double> temperature;     ///< Outside temperature
    };

    /**
     * Physical parameters of the generated devices
     */
    struct DeviceParameters {
        std::vector<double> dw_cycle = {1.0, 1.0};      ///< Power profile of one dishwasher cycle
        std::vector<double> cw_cycle = {1.0, 1.0};      ///< Power profile of one clothes washer cycle
        std::vector<double> cd_cycle = {1.0, 1.0, 1.0}; ///< Power profile of one clothes dryer cycle
        double ev_pwr_min     = 1.1;
        double ev_pwr_max     = 7.7;
        double ev_energy_min  = 10.0;
        double ev_energy_max  = 10.0;
        unsigned int ev_first_hour = 14; ///< First hour of each day the EV is available (until the end of the day)
        double heat_pwr_min   = 0.0;
        double heat_pwr_max   = 10.0;
        double heat_eta       = 1.0;
        double heat_c         = 3.0;
        double heat_mu        = 0.2;
        double heat_temp_init = 20.0;
        double heat_temp_min  = 18.0;
        double heat_temp_max  = 22.0;
        double bat_soc_min    = 0.0;
        double bat_soc_max    = 13.5;
        double bat_soc_init   = 0.0;
        double bat_pwr_min    = 0.0;
        double bat_pwr_max    = 5.0;
        double bat_effcy      = 0.95;
        double bat_half_life  = 693149.0;
    };

    /**
     * Share of households owning a device. The clothes dryer rate is
     * the share of all households, only clothes washer owners can own one.
     */
    struct OwnershipRates {
        double pv             = 0.0;
        double dishwasher     = 0.0;
        double clothes_washer = 0.0;
        double clothes_dryer  = 0.0;
        double heating        = 0.0;
    };

    /**
     * Settings of the aggregator and the household net loads
     */
    struct AggregatorParameters {
        double total_load_min_per_hh = 0.0;          ///< Lower bound of the total load per household
        double total_load_max_per_hh = 180.0 / 24.0; ///< Upper bound of the total load per household
        double hh_net_load_min       = 0.0;
        double hh_net_load_max       = 10.0;
    };

    /**
     * A complete model instance
     */
    struct Instance {
        TimeWindow window;
        AggregatorSpec aggregator;
        std::vector<Household> households;
    };

    /**
     * Validates the ownership rates. Returns false and prints a message if one of them is outside of [0,1].
     */
    bool check_ownership_rates(const OwnershipRates& rates);

    /**
     * Generates n_hh households with random device sets.
     * All series must have the same length T. The time steps are assumed to start at 0,
     * i.e. hour t % 24 of a day. Households are labeled HH_0, HH_1, ...
     * The result only depends on the arguments, not on any global state.
     */
    std::vector<Household> generate_households(
        unsigned long n_hh,
        const std::vector<double>& load_norm,
        const std::vector<double>& pv_norm,
        const std::vector<double>& temperature,
        const OwnershipRates& rates,
        const DeviceParameters& params,
        unsigned int seed
    );

    /**
     * Generates a complete instance with n_hh households for the given time series
     * (that must all have the same length T).
     * If use_tou_price is true, the time of use price is the objective, otherwise the market price.
     */
    Instance generate_instance(
        unsigned long n_hh,
        double delta_t,
        const TimeSeriesData& data,
        const OwnershipRates& rates,
        const DeviceParameters& params,
        const AggregatorParameters& agg_params,
        bool use_tou_price,
        unsigned int seed
    );

}

#endif
