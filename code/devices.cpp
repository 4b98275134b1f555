
#include "devices.h"

#include <algorithm>
#include <cmath>
#include <limits>
#include <string>
#include <variant>
#include <vector>

#include "model_errors.hpp"

using namespace std;

namespace {
    const double INF = numeric_limits<double>::infinity();

    void check_label(const string& label, const char* kind) {
        if (label.empty())
            throw ParameterError(string("The label of a device of kind ") + kind + " must not be empty.");
    }

    void check_finite(const vector<double>& series, const string& label, const char* series_name) {
        for (size_t t = 0; t < series.size(); t++) {
            if (!isfinite(series[t]))
                throw ParameterError("Device " + label + ": value " + to_string(t) + " of " + series_name + " is not finite.");
        }
    }

    void check_series_length(const vector<double>& series, const TimeWindow& window, const string& label, const char* series_name) {
        if (series.size() != window.n_steps)
            throw ParameterError("Device " + label + ": " + series_name + " has " + to_string(series.size()) +
                                 " values, but the time window has " + to_string(window.n_steps) + " steps.");
    }
}


// ----------------------------- //
//      Implementation of        //
//       DeviceFixedLoad         //
// ----------------------------- //

DeviceFixedLoad::DeviceFixedLoad(const string& label, const Params& params)
    : label(label), params(params)
{
    check_label(label, get_kind_name());
    check_finite(params.load, label, "load");
}

void DeviceFixedLoad::check_against_window(const TimeWindow& window) const {
    check_series_length(params.load, window, label, "load");
}

void DeviceFixedLoad::contribute(ModelBuilder& builder, const string& household) const {
    const unsigned long T = builder.get_n_steps();
    vector<IndexKey> keys;
    keys.reserve(T);
    for (unsigned long t = 0; t < T; t++)
        keys.push_back(IndexKey::Household(household, Field::LinkNetLoad, (long) t));
    // -netLoad[t] + sum pwr[t] + load[t] = 0  <=>  -netLoad[t] + sum pwr[t] = -load[t]
    builder.subtract_from_rhs(keys, params.load);
}



// ----------------------------- //
//      Implementation of        //
//        DeviceBattery          //
// ----------------------------- //

DeviceBattery::DeviceBattery(const string& label, const Params& params)
    : label(label), params(params)
{
    check_label(label, get_kind_name());
    if (params.pwr_chg_min < 0.0 || params.pwr_chg_min > params.pwr_chg_max)
        throw ParameterError("Battery " + label + ": charging power bounds must satisfy 0 <= min <= max.");
    if (params.pwr_dis_min < 0.0 || params.pwr_dis_min > params.pwr_dis_max)
        throw ParameterError("Battery " + label + ": discharging power bounds must satisfy 0 <= min <= max.");
    if (params.soc_min > params.soc_max)
        throw ParameterError("Battery " + label + ": soc_min is larger than soc_max.");
    if (!isfinite(params.soc_init))
        throw ParameterError("Battery " + label + ": soc_init is not finite.");
    if (!(params.eff_chg > 0.0) || !(params.eff_dis > 0.0))
        throw ParameterError("Battery " + label + ": efficiencies must be positive.");
    if (!(params.half_life > 0.0))
        throw ParameterError("Battery " + label + ": half life must be positive.");
}

double DeviceBattery::get_retention_factor(double delta_t) const {
    if (isinf(params.half_life))
        return 1.0;
    return exp(-log(2.0) * delta_t / params.half_life);
}

void DeviceBattery::check_against_window(const TimeWindow&) const {
    // all parameters are scalars
}

void DeviceBattery::contribute(ModelBuilder& builder, const string& household) const {
    const unsigned long T = builder.get_n_steps();
    const double delta_t  = builder.get_delta_t();
    const double eta      = get_retention_factor(delta_t);
    auto key = [&](Field field, unsigned long t) { return IndexKey::Device(household, label, field, (long) t); };
    //
    // Create the variables
    vector<VariableSpec> pwr_chg, pwr_dis, soc;
    for (unsigned long t = 0; t < T; t++) {
        pwr_chg.push_back({0.0, INF, VariableType::Continuous, 0.0, {ModelBuilder::net_load_link(household, t,  1.0)}});
        pwr_dis.push_back({0.0, INF, VariableType::Continuous, 0.0, {ModelBuilder::net_load_link(household, t, -1.0)}});
        soc.push_back({params.soc_min, params.soc_max, VariableType::Continuous, 0.0, {}});
    }
    builder.declare_variable_series(household, label, Field::PowerCharge,        pwr_chg);
    builder.declare_variable_series(household, label, Field::PowerDischarge,     pwr_dis);
    builder.declare_variable_series(household, label, Field::StateOfCharge,      soc);
    builder.declare_variable_series(household, label, Field::ChargeIndicator,    vector<VariableSpec>(T, builder.indicator_spec()));
    builder.declare_variable_series(household, label, Field::DischargeIndicator, vector<VariableSpec>(T, builder.indicator_spec()));
    //
    // Energy conservation
    // soc[t] - eta * soc[t-1] - dt * eff_chg * pwr_chg[t] + dt / eff_dis * pwr_dis[t] = 0,
    // where soc[-1] = soc_init moves to the right-hand side
    vector<ConstraintSpec> ener_cons;
    for (unsigned long t = 0; t < T; t++) {
        ConstraintSpec c{ConstraintSense::Equal, 0.0, {
            {key(Field::StateOfCharge,  t),  1.0},
            {key(Field::PowerCharge,    t), -delta_t * params.eff_chg},
            {key(Field::PowerDischarge, t),  delta_t / params.eff_dis}
        }};
        if (t == 0)
            c.rhs = eta * params.soc_init;
        else
            c.terms.push_back({key(Field::StateOfCharge, t - 1), -eta});
        ener_cons.push_back(c);
    }
    builder.declare_constraint_series(household, label, Field::EnergyConservation, ener_cons);
    //
    // Power bounds coupled to the indicators
    vector<ConstraintSpec> chg_min, chg_max, dis_min, dis_max, exclusion;
    for (unsigned long t = 0; t < T; t++) {
        chg_min.push_back({ConstraintSense::LessEqual, 0.0, {
            {key(Field::PowerCharge, t), -1.0}, {key(Field::ChargeIndicator, t), params.pwr_chg_min}}});
        chg_max.push_back({ConstraintSense::LessEqual, 0.0, {
            {key(Field::PowerCharge, t),  1.0}, {key(Field::ChargeIndicator, t), -params.pwr_chg_max}}});
        dis_min.push_back({ConstraintSense::LessEqual, 0.0, {
            {key(Field::PowerDischarge, t), -1.0}, {key(Field::DischargeIndicator, t), params.pwr_dis_min}}});
        dis_max.push_back({ConstraintSense::LessEqual, 0.0, {
            {key(Field::PowerDischarge, t),  1.0}, {key(Field::DischargeIndicator, t), -params.pwr_dis_max}}});
        // no charging and discharging at the same time
        exclusion.push_back({ConstraintSense::LessEqual, 1.0, {
            {key(Field::ChargeIndicator, t), 1.0}, {key(Field::DischargeIndicator, t), 1.0}}});
    }
    builder.declare_constraint_series(household, label, Field::PowerChargeMin,           chg_min);
    builder.declare_constraint_series(household, label, Field::PowerChargeMax,           chg_max);
    builder.declare_constraint_series(household, label, Field::PowerDischargeMin,        dis_min);
    builder.declare_constraint_series(household, label, Field::PowerDischargeMax,        dis_max);
    builder.declare_constraint_series(household, label, Field::ChargeDischargeExclusion, exclusion);
}



// ----------------------------- //
//      Implementation of        //
//      DeviceThermalLoad        //
// ----------------------------- //

DeviceThermalLoad::DeviceThermalLoad(const string& label, const Params& params)
    : label(label), params(params)
{
    check_label(label, get_kind_name());
    if (params.temp_min.size() != params.temp_max.size() || params.temp_min.size() != params.temp_ext.size())
        throw ParameterError("Thermal load " + label + ": temp_min, temp_max and temp_ext must have the same length.");
    check_finite(params.temp_ext, label, "temp_ext");
    for (size_t t = 0; t < params.temp_min.size(); t++) {
        if (params.temp_min[t] > params.temp_max[t])
            throw ParameterError("Thermal load " + label + ": temp_min is larger than temp_max in time step " + to_string(t) + ".");
    }
    if (!isfinite(params.temp_init))
        throw ParameterError("Thermal load " + label + ": temp_init is not finite.");
    if (!(params.heat_cpty > 0.0))
        throw ParameterError("Thermal load " + label + ": heat capacity must be positive.");
    if (params.pwr_th_min < 0.0 || params.pwr_th_min > params.pwr_th_max)
        throw ParameterError("Thermal load " + label + ": power bounds must satisfy 0 <= min <= max.");
}

void DeviceThermalLoad::check_against_window(const TimeWindow& window) const {
    check_series_length(params.temp_min, window, label, "temp_min");
    check_series_length(params.temp_max, window, label, "temp_max");
    check_series_length(params.temp_ext, window, label, "temp_ext");
}

void DeviceThermalLoad::contribute(ModelBuilder& builder, const string& household) const {
    const unsigned long T = builder.get_n_steps();
    const double delta_t  = builder.get_delta_t();
    const double a_cond   = delta_t * params.cond_coeff / params.heat_cpty; // exchange with the outside per step
    const double a_heat   = delta_t * params.th_eff / params.heat_cpty;     // temperature increase per kW and step
    auto key = [&](Field field, unsigned long t) { return IndexKey::Device(household, label, field, (long) t); };
    //
    // Create the variables
    vector<VariableSpec> pwr, temp;
    for (unsigned long t = 0; t < T; t++) {
        pwr.push_back({0.0, INF, VariableType::Continuous, 0.0, {ModelBuilder::net_load_link(household, t, 1.0)}});
        temp.push_back({params.temp_min[t], params.temp_max[t], VariableType::Continuous, 0.0, {}});
    }
    builder.declare_variable_series(household, label, Field::Power,       pwr);
    builder.declare_variable_series(household, label, Field::Temperature, temp);
    builder.declare_variable_series(household, label, Field::OnIndicator, vector<VariableSpec>(T, builder.indicator_spec()));
    //
    // Power bounds
    vector<ConstraintSpec> pwr_min, pwr_max;
    for (unsigned long t = 0; t < T; t++) {
        pwr_min.push_back({ConstraintSense::LessEqual, 0.0, {
            {key(Field::Power, t), -1.0}, {key(Field::OnIndicator, t), params.pwr_th_min}}});
        pwr_max.push_back({ConstraintSense::LessEqual, 0.0, {
            {key(Field::Power, t),  1.0}, {key(Field::OnIndicator, t), -params.pwr_th_max}}});
    }
    builder.declare_constraint_series(household, label, Field::PowerThermalMin, pwr_min);
    builder.declare_constraint_series(household, label, Field::PowerThermalMax, pwr_max);
    //
    // Temperature dynamics
    // temp[t] = (1 - a_cond) * temp[t-1] + a_cond * temp_ext[t] + a_heat * pwr[t]
    // The first step uses temp_init and the outside temperature temp_ext[0].
    vector<ConstraintSpec> exch;
    for (unsigned long t = 0; t < T; t++) {
        ConstraintSpec c{ConstraintSense::Equal, 0.0, {
            {key(Field::Temperature, t),  1.0},
            {key(Field::Power,       t), -a_heat}
        }};
        if (t == 0) {
            c.rhs = params.temp_init + a_cond * (params.temp_ext[0] - params.temp_init);
        } else {
            c.terms.push_back({key(Field::Temperature, t - 1), -(1.0 - a_cond)});
            c.rhs = a_cond * params.temp_ext[t];
        }
        exch.push_back(c);
    }
    builder.declare_constraint_series(household, label, Field::TemperatureExchange, exch);
}



// ----------------------------- //
//      Implementation of        //
//     DeviceDeferrableLoad      //
// ----------------------------- //

DeviceDeferrableLoad::DeviceDeferrableLoad(const string& label, const Params& params)
    : label(label), params(params)
{
    check_label(label, get_kind_name());
    if (params.pwr_min.size() != params.pwr_max.size())
        throw ParameterError("Deferrable load " + label + ": pwr_min and pwr_max must have the same length.");
    check_finite(params.pwr_min, label, "pwr_min");
    for (size_t t = 0; t < params.pwr_min.size(); t++) {
        if (params.pwr_min[t] > params.pwr_max[t])
            throw ParameterError("Deferrable load " + label + ": pwr_min is larger than pwr_max in time step " + to_string(t) + ".");
    }
    if (params.energy_min > params.energy_max)
        throw ParameterError("Deferrable load " + label + ": energy_min is larger than energy_max.");
}

void DeviceDeferrableLoad::check_against_window(const TimeWindow& window) const {
    check_series_length(params.pwr_min, window, label, "pwr_min");
    check_series_length(params.pwr_max, window, label, "pwr_max");
}

void DeviceDeferrableLoad::contribute(ModelBuilder& builder, const string& household) const {
    const unsigned long T = builder.get_n_steps();
    const double delta_t  = builder.get_delta_t();
    auto key = [&](Field field, unsigned long t) { return IndexKey::Device(household, label, field, (long) t); };
    //
    // Create the variables
    vector<VariableSpec> pwr;
    for (unsigned long t = 0; t < T; t++)
        pwr.push_back({0.0, INF, VariableType::Continuous, 0.0, {ModelBuilder::net_load_link(household, t, 1.0)}});
    builder.declare_variable_series(household, label, Field::Power,   pwr);
    builder.declare_variable_series(household, label, Field::Control, vector<VariableSpec>(T, builder.indicator_spec()));
    //
    // Total energy over the horizon
    ConstraintSpec e_min{ConstraintSense::GreaterEqual, params.energy_min, {}};
    ConstraintSpec e_max{ConstraintSense::LessEqual,    params.energy_max, {}};
    for (unsigned long t = 0; t < T; t++) {
        e_min.terms.push_back({key(Field::Power, t), delta_t});
        e_max.terms.push_back({key(Field::Power, t), delta_t});
    }
    builder.declare_constraints(
        {IndexKey::Device(household, label, Field::EnergyTotalMin), IndexKey::Device(household, label, Field::EnergyTotalMax)},
        {e_min, e_max}
    );
    //
    // Power bounds
    vector<ConstraintSpec> pwr_min, pwr_max;
    for (unsigned long t = 0; t < T; t++) {
        pwr_min.push_back({ConstraintSense::LessEqual, 0.0, {
            {key(Field::Power, t), -1.0}, {key(Field::Control, t), params.pwr_min[t]}}});
        pwr_max.push_back({ConstraintSense::LessEqual, 0.0, {
            {key(Field::Power, t),  1.0}, {key(Field::Control, t), -params.pwr_max[t]}}});
    }
    builder.declare_constraint_series(household, label, Field::PowerMin, pwr_min);
    builder.declare_constraint_series(household, label, Field::PowerMax, pwr_max);
}



// ----------------------------- //
//      Implementation of        //
//     DeviceShiftableLoad       //
// ----------------------------- //

DeviceShiftableLoad::DeviceShiftableLoad(const string& label, const Params& params)
    : label(label), params(params)
{
    check_label(label, get_kind_name());
    const size_t K = params.cycles.size();
    if (params.t_start_min.size() != K || params.t_start_max.size() != K)
        throw ParameterError("Shiftable load " + label + ": t_start_min, t_start_max and cycles must have the same length.");
    long earliest_start = 0;
    for (size_t k = 0; k < K; k++) {
        const string kstr = to_string(k);
        if (params.cycles[k].empty())
            throw ParameterError("Shiftable load " + label + ": cycle " + kstr + " is empty.");
        check_finite(params.cycles[k], label, "cycle profile");
        if (params.t_start_min[k] < 0 || params.t_start_min[k] > params.t_start_max[k])
            throw ParameterError("Shiftable load " + label + ": start window of cycle " + kstr + " must satisfy 0 <= t_start_min <= t_start_max.");
        // earliest possible start if all previous cycles start as early as possible
        if (k == 0)
            earliest_start = params.t_start_min[0];
        else
            earliest_start = max(params.t_start_min[k], earliest_start + get_duration(k - 1));
        if (earliest_start > params.t_start_max[k])
            throw ParameterError("Shiftable load " + label + ": cycle " + kstr + " cannot start after cycle " +
                                 to_string(k - 1) + " has finished inside its start window.");
    }
}

void DeviceShiftableLoad::check_against_window(const TimeWindow& window) const {
    for (size_t k = 0; k < get_n_cycles(); k++) {
        if (params.t_start_max[k] + get_duration(k) > (long) window.n_steps)
            throw ParameterError("Shiftable load " + label + ": cycle " + to_string(k) + " does not end inside the time window.");
    }
}

void DeviceShiftableLoad::contribute(ModelBuilder& builder, const string& household) const {
    const unsigned long T = builder.get_n_steps();
    const size_t K = get_n_cycles();
    auto u_key = [&](size_t k, long t) { return IndexKey::Device(household, label, Field::StartIndicator, t, (long) k); };
    //
    // Create the variables
    vector<VariableSpec> pwr;
    for (unsigned long t = 0; t < T; t++)
        pwr.push_back({0.0, INF, VariableType::Continuous, 0.0, {ModelBuilder::net_load_link(household, t, 1.0)}});
    builder.declare_variable_series(household, label, Field::Power, pwr);
    // start indicators, only inside the start window of each cycle
    vector<IndexKey> u_keys;
    for (size_t k = 0; k < K; k++) {
        for (long t = params.t_start_min[k]; t <= params.t_start_max[k]; t++)
            u_keys.push_back(u_key(k, t));
    }
    builder.declare_variables(u_keys, vector<VariableSpec>(u_keys.size(), builder.indicator_spec()));
    //
    // Every cycle starts exactly once
    vector<IndexKey>       start_keys;
    vector<ConstraintSpec> start_up;
    for (size_t k = 0; k < K; k++) {
        ConstraintSpec c{ConstraintSense::Equal, 1.0, {}};
        for (long t = params.t_start_min[k]; t <= params.t_start_max[k]; t++)
            c.terms.push_back({u_key(k, t), 1.0});
        start_keys.push_back(IndexKey::Device(household, label, Field::StartUp, -1, (long) k));
        start_up.push_back(c);
    }
    builder.declare_constraints(start_keys, start_up);
    //
    // Power in step t is the sum of all cycle profiles that started in t - d
    vector<ConstraintSpec> net_power;
    for (unsigned long t = 0; t < T; t++) {
        ConstraintSpec c{ConstraintSense::Equal, 0.0, {
            {IndexKey::Device(household, label, Field::Power, (long) t), 1.0}
        }};
        for (size_t k = 0; k < K; k++) {
            for (long d = 0; d < get_duration(k); d++) {
                const long s = (long) t - d;
                if (s >= params.t_start_min[k] && s <= params.t_start_max[k])
                    c.terms.push_back({u_key(k, s), -params.cycles[k][d]});
            }
        }
        net_power.push_back(c);
    }
    builder.declare_constraint_series(household, label, Field::NetPower, net_power);
    //
    // Cycle k starts after cycle k-1 has finished
    vector<IndexKey>       seq_keys;
    vector<ConstraintSpec> sequence;
    for (size_t k = 1; k < K; k++) {
        ConstraintSpec c{ConstraintSense::GreaterEqual, (double) get_duration(k - 1), {}};
        for (long t = params.t_start_min[k]; t <= params.t_start_max[k]; t++)
            c.terms.push_back({u_key(k, t), (double) t});
        for (long t = params.t_start_min[k - 1]; t <= params.t_start_max[k - 1]; t++)
            c.terms.push_back({u_key(k - 1, t), -(double) t});
        seq_keys.push_back(IndexKey::Device(household, label, Field::CycleStart, -1, (long) k));
        sequence.push_back(c);
    }
    if (!seq_keys.empty())
        builder.declare_constraints(seq_keys, sequence);
}



// ----------------------------- //
//      Implementation of        //
//    DeviceCurtailableLoad      //
// ----------------------------- //

DeviceCurtailableLoad::DeviceCurtailableLoad(const string& label, const Params& params)
    : label(label), params(params)
{
    check_label(label, get_kind_name());
    check_finite(params.load, label, "load");
}

void DeviceCurtailableLoad::check_against_window(const TimeWindow& window) const {
    check_series_length(params.load, window, label, "load");
}

void DeviceCurtailableLoad::contribute(ModelBuilder& builder, const string& household) const {
    const unsigned long T = builder.get_n_steps();
    auto key = [&](Field field, unsigned long t) { return IndexKey::Device(household, label, field, (long) t); };
    //
    // Create the variables
    // The power is free, a curtailable generation has a negative load.
    vector<VariableSpec> pwr;
    for (unsigned long t = 0; t < T; t++)
        pwr.push_back({-INF, INF, VariableType::Continuous, 0.0, {ModelBuilder::net_load_link(household, t, 1.0)}});
    builder.declare_variable_series(household, label, Field::Power,   pwr);
    builder.declare_variable_series(household, label, Field::Control, vector<VariableSpec>(T, builder.indicator_spec(params.binary)));
    //
    // pwr[t] = load[t] * u[t]
    vector<ConstraintSpec> curtail;
    for (unsigned long t = 0; t < T; t++) {
        curtail.push_back({ConstraintSense::Equal, 0.0, {
            {key(Field::Power, t), 1.0}, {key(Field::Control, t), -params.load[t]}}});
    }
    builder.declare_constraint_series(household, label, Field::Curtailment, curtail);
}



// ----------------------------- //
//   Functions on the variant    //
// ----------------------------- //

const string& get_device_label(const Device& device) {
    return visit([](const auto& d) -> const string& { return d.get_label(); }, device);
}

const char* get_device_kind_name(const Device& device) {
    return visit([](const auto& d) { return d.get_kind_name(); }, device);
}

void check_device_against_window(const Device& device, const TimeWindow& window) {
    visit([&](const auto& d) { d.check_against_window(window); }, device);
}

void contribute_device(const Device& device, ModelBuilder& builder, const string& household) {
    visit([&](const auto& d) { d.contribute(builder, household); }, device);
}
