
#include "instance_generation.h"

#include <algorithm>
#include <iostream>
#include <random>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

using namespace std;
using namespace instance;


bool instance::check_ownership_rates(const OwnershipRates& rates) {
    auto in_unit_interval = [](double v) { return v >= 0.0 && v <= 1.0; };
    if (!in_unit_interval(rates.pv) || !in_unit_interval(rates.dishwasher) || !in_unit_interval(rates.clothes_washer) ||
        !in_unit_interval(rates.clothes_dryer) || !in_unit_interval(rates.heating))
    {
        cerr << "Error: All ownership rates must be inside [0,1]." << endl;
        return false;
    }
    if (rates.clothes_dryer > rates.clothes_washer) {
        cerr << "Error: The ownership rate of clothes dryers cannot be larger than the one of clothes washers." << endl;
        return false;
    }
    return true;
}

/*
 * Internal helper: Adds one shiftable load per full day to a device list
 */
static void add_daily_shiftable_loads(vector<Device>& devices, const string& label_prefix, const vector<double>& cycle, unsigned long n_days) {
    const long cycle_length = (long) cycle.size();
    for (unsigned long day = 0; day < n_days; day++) {
        const long day_start = 24 * (long) day;
        DeviceShiftableLoad::Params p;
        p.t_start_min = {day_start};
        p.t_start_max = {day_start + 24 - 1 - cycle_length};
        p.cycles      = {cycle};
        devices.push_back(DeviceShiftableLoad(label_prefix + to_string(day), p));
    }
}

vector<Household> instance::generate_households(
    unsigned long n_hh,
    const vector<double>& load_norm,
    const vector<double>& pv_norm,
    const vector<double>& temperature,
    const OwnershipRates& rates,
    const DeviceParameters& params,
    unsigned int seed)
{
    const size_t T = load_norm.size();
    if (pv_norm.size() != T || temperature.size() != T)
        throw invalid_argument("The load, PV and temperature series must have the same length.");
    const unsigned long n_days = T / 24;
    //
    // I. Households parameters
    // every household gets its own seed, so that its devices do not depend on the number of households
    default_random_engine master_rng(seed);
    uniform_int_distribution<unsigned int> seed_distribution(0, (1u << 16) - 1);
    vector<unsigned int> hh_seeds(n_hh);
    for (unsigned long i = 0; i < n_hh; i++)
        hh_seeds[i] = seed_distribution(master_rng);
    // conditional probability of a clothes dryer for washer owners
    const double p_cd = rates.clothes_washer > 0.0 ? rates.clothes_dryer / rates.clothes_washer : 0.0;

    vector<Household> households;
    households.reserve(n_hh);
    for (unsigned long i = 0; i < n_hh; i++) {
        const string istr = to_string(i);
        default_random_engine rng(hh_seeds[i]);
        uniform_real_distribution<double> unif(0.0, 1.0);
        normal_distribution<double> randn(0.0, 1.0);
        const double hh_scale = uniform_real_distribution<double>(0.5, 1.5)(rng);

        Household hh;
        hh.label = "HH_" + istr;

        //
        // II. Generate devices
        const bool renew = unif(rng) < rates.pv;

        // II.1 Native load, all uncontrollable loads in one
        vector<double> native_load(T);
        for (size_t t = 0; t < T; t++)
            native_load[t] = max(0.0, hh_scale * (load_norm[t] + 0.05 * randn(rng)));
        hh.devices.push_back(DeviceFixedLoad("load_" + istr, {native_load}));

        // II.2 Curtailable PV generation
        if (renew) {
            vector<double> pv_load(T);
            for (size_t t = 0; t < T; t++)
                pv_load[t] = -(hh_scale * pv_norm[t] * unif(rng));
            hh.devices.push_back(DeviceCurtailableLoad("PV_" + istr, {pv_load, true}));
        }

        // II.3 Uninterruptible loads, one cycle per day
        if (unif(rng) < rates.dishwasher)
            add_daily_shiftable_loads(hh.devices, "shift_dw_" + istr + "_", params.dw_cycle, n_days);
        bool clothes_washer = false;
        if (unif(rng) < rates.clothes_washer) {
            clothes_washer = true;
            add_daily_shiftable_loads(hh.devices, "shift_cw_" + istr + "_", params.cw_cycle, n_days);
        }
        // only households with a clothes washer have a clothes dryer
        if (clothes_washer && unif(rng) < p_cd)
            add_daily_shiftable_loads(hh.devices, "shift_cd_" + istr + "_", params.cd_cycle, n_days);

        // II.4 Electric vehicle, only for households with PV
        if (renew) {
            DeviceDeferrableLoad::Params p;
            p.energy_min = params.ev_energy_min;
            p.energy_max = params.ev_energy_max;
            p.pwr_min.assign(T, 0.0);
            p.pwr_max.assign(T, 0.0);
            for (size_t t = 0; t < T; t++) {
                if (t % 24 >= params.ev_first_hour) {
                    p.pwr_min[t] = params.ev_pwr_min;
                    p.pwr_max[t] = params.ev_pwr_max;
                }
            }
            hh.devices.push_back(DeviceDeferrableLoad("EV_" + istr, p));
        }

        // II.5 Thermostat
        if (unif(rng) < rates.heating) {
            DeviceThermalLoad::Params p;
            p.temp_min.assign(T, params.heat_temp_min);
            p.temp_max.assign(T, params.heat_temp_max);
            p.temp_ext.resize(T);
            for (size_t t = 0; t < T; t++)
                p.temp_ext[t] = temperature[t] + 0.5 * randn(rng);
            p.temp_init  = params.heat_temp_init;
            p.pwr_th_min = params.heat_pwr_min;
            p.pwr_th_max = params.heat_pwr_max;
            p.heat_cpty  = params.heat_c;
            p.th_eff     = params.heat_eta;
            p.cond_coeff = params.heat_mu;
            hh.devices.push_back(DeviceThermalLoad("heat_" + istr, p));
        }

        // II.6 Home battery, only for households with PV
        if (renew) {
            DeviceBattery::Params p;
            p.pwr_chg_min = params.bat_pwr_min;
            p.pwr_chg_max = params.bat_pwr_max;
            p.pwr_dis_min = params.bat_pwr_min;
            p.pwr_dis_max = params.bat_pwr_max;
            p.soc_min     = params.bat_soc_min;
            p.soc_max     = params.bat_soc_max;
            p.soc_init    = params.bat_soc_init;
            p.eff_chg     = params.bat_effcy;
            p.eff_dis     = params.bat_effcy;
            p.half_life   = params.bat_half_life;
            hh.devices.push_back(DeviceBattery("bat_" + istr, p));
        }

        households.push_back(move(hh));
    }
    return households;
}

Instance instance::generate_instance(
    unsigned long n_hh,
    double delta_t,
    const TimeSeriesData& data,
    const OwnershipRates& rates,
    const DeviceParameters& params,
    const AggregatorParameters& agg_params,
    bool use_tou_price,
    unsigned int seed)
{
    const size_t T = data.load_norm.size();
    const vector<double>& price = use_tou_price ? data.price_tou : data.price_market;
    if (price.size() != T)
        throw invalid_argument("The price series has a different length than the load series.");

    Instance inst;
    inst.window = TimeWindow{T, delta_t};
    inst.aggregator.price = price;
    inst.aggregator.total_load_min.assign(T, agg_params.total_load_min_per_hh * (double) n_hh);
    inst.aggregator.total_load_max.assign(T, agg_params.total_load_max_per_hh * (double) n_hh);
    inst.households = generate_households(n_hh, data.load_norm, data.pv_norm, data.temperature, rates, params, seed);
    for (Household& hh : inst.households) {
        hh.net_load_min = agg_params.hh_net_load_min;
        hh.net_load_max = agg_params.hh_net_load_max;
    }
    return inst;
}
