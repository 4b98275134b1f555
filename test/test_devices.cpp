#include <gtest/gtest.h>

#include <cmath>
#include <limits>
#include <string>
#include <vector>

#include "devices.h"
#include "milp_model_memory.h"
#include "model_assembly.h"
#include "model_errors.hpp"
#include "test_helpers.h"

using testhelper::INF;
using testhelper::PointBuilder;

namespace {

    /**
     * A model with one household "H" that owns exactly one device
     */
    struct SingleDeviceModel {
        LinearModel model;
        ModelAssembler assembler;
        SingleDeviceModel(const Device& dev, const TimeWindow& window, bool binaries = true)
            : assembler(model, window, binaries)
        {
            assembler.assemble(testhelper::free_aggregator(window.n_steps), {Household{"H", {dev}}});
        }
        const IndexRegistry& registry() const { return assembler.get_registry(); }
        int var(const IndexKey& key)  const { return registry().lookup_variable(key);   }
        int cstr(const IndexKey& key) const { return registry().lookup_constraint(key); }
    };

    // sets the household net load and the total load to the given device net power
    void set_balance(PointBuilder& p, const std::vector<double>& net) {
        for (size_t t = 0; t < net.size(); t++) {
            p.set(IndexKey::Household("H", Field::NetLoad, (long) t), net[t]);
            p.set(IndexKey::Aggregator(Field::TotalLoad, (long) t), net[t]);
        }
    }

    IndexKey dkey(const std::string& dev, Field field, long t = -1, long cycle = -1) {
        return IndexKey::Device("H", dev, field, t, cycle);
    }

    DeviceBattery::Params battery_params() {
        DeviceBattery::Params p;
        p.pwr_chg_min = 0.0;
        p.pwr_chg_max = 6.0;
        p.pwr_dis_min = 0.0;
        p.pwr_dis_max = 6.0;
        p.soc_min     = 0.0;
        p.soc_max     = 10.0;
        p.soc_init    = 0.0;
        p.eff_chg     = 0.9;
        p.eff_dis     = 0.9;
        p.half_life   = 693149.0;
        return p;
    }

}


//
// Battery
//

TEST(DeviceBattery, RetentionFactor) {
    DeviceBattery::Params p = battery_params();
    p.half_life = 2.0;
    EXPECT_NEAR(DeviceBattery("bat", p).get_retention_factor(2.0), 0.5, 1e-12);
    EXPECT_NEAR(DeviceBattery("bat", p).get_retention_factor(4.0), 0.25, 1e-12);
    p.half_life = INF;
    EXPECT_EQ(DeviceBattery("bat", p).get_retention_factor(1.0), 1.0);
}

TEST(DeviceBattery, RejectsInvalidParameters) {
    DeviceBattery::Params p = battery_params();
    p.soc_min = 11.0;
    EXPECT_THROW(DeviceBattery("bat", p), ParameterError);
    p = battery_params();
    p.pwr_chg_min = 7.0;
    EXPECT_THROW(DeviceBattery("bat", p), ParameterError);
    p = battery_params();
    p.eff_dis = 0.0;
    EXPECT_THROW(DeviceBattery("bat", p), ParameterError);
    p = battery_params();
    p.half_life = 0.0;
    EXPECT_THROW(DeviceBattery("bat", p), ParameterError);
    EXPECT_THROW(DeviceBattery("", battery_params()), ParameterError);
}

TEST(DeviceBattery, ChargingToFullCapacityIsFeasible) {
    DeviceBattery bat("bat", battery_params());
    const double eta = bat.get_retention_factor(1.0);
    SingleDeviceModel sm(bat, TimeWindow{3, 1.0});
    EXPECT_EQ(sm.model.get_n_variables(), 3u + 3u + 5u * 3u);

    const double chg1 = (10.0 - eta * 5.4) / 0.9;
    PointBuilder p(sm.registry());
    p.set(dkey("bat", Field::PowerCharge, 0), 6.0)
     .set(dkey("bat", Field::ChargeIndicator, 0), 1.0)
     .set(dkey("bat", Field::StateOfCharge, 0), 5.4)
     .set(dkey("bat", Field::PowerCharge, 1), chg1)
     .set(dkey("bat", Field::ChargeIndicator, 1), 1.0)
     .set(dkey("bat", Field::StateOfCharge, 1), 10.0)
     .set(dkey("bat", Field::StateOfCharge, 2), eta * 10.0);
    set_balance(p, {6.0, chg1, 0.0});
    EXPECT_LT(sm.model.get_max_violation(p.get()), 1e-9);
}

TEST(DeviceBattery, OverchargingViolatesCapacity) {
    DeviceBattery bat("bat", battery_params());
    const double eta = bat.get_retention_factor(1.0);
    SingleDeviceModel sm(bat, TimeWindow{3, 1.0});

    // full power in two consecutive steps exceeds soc_max
    PointBuilder p(sm.registry());
    p.set(dkey("bat", Field::PowerCharge, 0), 6.0)
     .set(dkey("bat", Field::ChargeIndicator, 0), 1.0)
     .set(dkey("bat", Field::StateOfCharge, 0), 5.4)
     .set(dkey("bat", Field::PowerCharge, 1), 6.0)
     .set(dkey("bat", Field::ChargeIndicator, 1), 1.0)
     .set(dkey("bat", Field::StateOfCharge, 1), eta * 5.4 + 5.4)
     .set(dkey("bat", Field::StateOfCharge, 2), eta * (eta * 5.4 + 5.4));
    set_balance(p, {6.0, 6.0, 0.0});
    EXPECT_GT(sm.model.get_max_violation(p.get()), 0.5);
}

TEST(DeviceBattery, InitialStateOfChargeEntersFirstStep) {
    DeviceBattery::Params params = battery_params();
    params.soc_init = 6.0;
    DeviceBattery bat("bat", params);
    const double eta = bat.get_retention_factor(1.0);
    SingleDeviceModel sm(bat, TimeWindow{1, 1.0});
    EXPECT_NEAR(sm.model.get_constraint_rhs({sm.cstr(dkey("bat", Field::EnergyConservation, 0))})[0], eta * 6.0, 1e-12);

    PointBuilder p(sm.registry());
    p.set(dkey("bat", Field::PowerCharge, 0), 6.0)
     .set(dkey("bat", Field::ChargeIndicator, 0), 1.0)
     .set(dkey("bat", Field::StateOfCharge, 0), eta * 6.0 + 5.4);
    set_balance(p, {6.0});
    EXPECT_GT(sm.model.get_max_violation(p.get()), 1.0);
}

TEST(DeviceBattery, LosslessEnergyConservationCoefficients) {
    DeviceBattery::Params params = battery_params();
    params.eff_chg   = 1.0;
    params.eff_dis   = 1.0;
    params.half_life = INF;
    params.soc_init  = 4.0;
    SingleDeviceModel sm(DeviceBattery("bat", params), TimeWindow{2, 0.5});

    const int c0 = sm.cstr(dkey("bat", Field::EnergyConservation, 0));
    const int c1 = sm.cstr(dkey("bat", Field::EnergyConservation, 1));
    EXPECT_EQ(sm.model.get_constraint_rhs({c0})[0], 4.0);
    EXPECT_EQ(sm.model.get_constraint_rhs({c1})[0], 0.0);
    EXPECT_EQ(sm.model.get_coefficient(c1, sm.var(dkey("bat", Field::StateOfCharge, 1))),  1.0);
    EXPECT_EQ(sm.model.get_coefficient(c1, sm.var(dkey("bat", Field::StateOfCharge, 0))), -1.0);
    EXPECT_EQ(sm.model.get_coefficient(c1, sm.var(dkey("bat", Field::PowerCharge, 1))),   -0.5);
    EXPECT_EQ(sm.model.get_coefficient(c1, sm.var(dkey("bat", Field::PowerDischarge, 1))), 0.5);
    // charging and discharging enter the net load with opposite signs
    const int link = sm.cstr(IndexKey::Household("H", Field::LinkNetLoad, 1));
    EXPECT_EQ(sm.model.get_coefficient(link, sm.var(dkey("bat", Field::PowerCharge, 1))),     1.0);
    EXPECT_EQ(sm.model.get_coefficient(link, sm.var(dkey("bat", Field::PowerDischarge, 1))), -1.0);
}

TEST(DeviceBattery, NoChargingAndDischargingAtOnce) {
    SingleDeviceModel sm(DeviceBattery("bat", battery_params()), TimeWindow{2, 1.0});
    PointBuilder p(sm.registry());
    p.set(dkey("bat", Field::ChargeIndicator, 1), 1.0)
     .set(dkey("bat", Field::DischargeIndicator, 1), 1.0);
    EXPECT_DOUBLE_EQ(sm.model.get_max_violation(p.get()), 1.0);
    p.set(dkey("bat", Field::DischargeIndicator, 1), 0.0);
    EXPECT_DOUBLE_EQ(sm.model.get_max_violation(p.get()), 0.0);
}

TEST(DeviceBattery, IndicatorTypeFollowsBinariesFlag) {
    SingleDeviceModel with_binaries(DeviceBattery("bat", battery_params()), TimeWindow{2, 1.0}, true);
    SingleDeviceModel relaxed(DeviceBattery("bat", battery_params()), TimeWindow{2, 1.0}, false);
    const IndexKey k = dkey("bat", Field::ChargeIndicator, 1);
    EXPECT_EQ(with_binaries.model.get_variable_type(with_binaries.var(k)), VariableType::Binary);
    EXPECT_EQ(relaxed.model.get_variable_type(relaxed.var(k)), VariableType::Continuous);
    EXPECT_EQ(relaxed.model.get_upper_bound(relaxed.var(k)), 1.0);
    EXPECT_EQ(with_binaries.model.get_variable_type(with_binaries.var(dkey("bat", Field::StateOfCharge, 1))), VariableType::Continuous);
}


//
// Shiftable load
//

namespace {
    DeviceShiftableLoad::Params shiftable_params() {
        DeviceShiftableLoad::Params p;
        p.cycles      = {{2.0, 1.0}, {3.0}};
        p.t_start_min = {0, 2};
        p.t_start_max = {2, 4};
        return p;
    }
}

TEST(DeviceShiftableLoad, StartIndicatorsOnlyInsideWindows) {
    SingleDeviceModel sm(DeviceShiftableLoad("dw", shiftable_params()), TimeWindow{6, 1.0});
    size_t n_start = 0;
    for (const IndexKey& k : sm.registry().get_variable_keys_of("H", "dw"))
        if (k.field == Field::StartIndicator)
            n_start++;
    EXPECT_EQ(n_start, 6u);
    EXPECT_TRUE(sm.registry().has_variable(dkey("dw", Field::StartIndicator, 2, 0)));
    EXPECT_FALSE(sm.registry().has_variable(dkey("dw", Field::StartIndicator, 3, 0)));
    EXPECT_FALSE(sm.registry().has_variable(dkey("dw", Field::StartIndicator, 1, 1)));
    EXPECT_TRUE(sm.registry().has_constraint(dkey("dw", Field::CycleStart, -1, 1)));
    EXPECT_FALSE(sm.registry().has_constraint(dkey("dw", Field::CycleStart, -1, 0)));
}

TEST(DeviceShiftableLoad, SequentialCyclesAreFeasible) {
    SingleDeviceModel sm(DeviceShiftableLoad("dw", shiftable_params()), TimeWindow{6, 1.0});
    PointBuilder p(sm.registry());
    p.set(dkey("dw", Field::StartIndicator, 1, 0), 1.0)
     .set(dkey("dw", Field::StartIndicator, 3, 1), 1.0)
     .set(dkey("dw", Field::Power, 1), 2.0)
     .set(dkey("dw", Field::Power, 2), 1.0)
     .set(dkey("dw", Field::Power, 3), 3.0);
    set_balance(p, {0.0, 2.0, 1.0, 3.0, 0.0, 0.0});
    EXPECT_DOUBLE_EQ(sm.model.get_max_violation(p.get()), 0.0);
}

TEST(DeviceShiftableLoad, OverlappingCyclesViolateSequence) {
    SingleDeviceModel sm(DeviceShiftableLoad("dw", shiftable_params()), TimeWindow{6, 1.0});
    // cycle 1 starts before cycle 0 has finished
    PointBuilder p(sm.registry());
    p.set(dkey("dw", Field::StartIndicator, 2, 0), 1.0)
     .set(dkey("dw", Field::StartIndicator, 3, 1), 1.0)
     .set(dkey("dw", Field::Power, 2), 2.0)
     .set(dkey("dw", Field::Power, 3), 4.0);
    set_balance(p, {0.0, 0.0, 2.0, 4.0, 0.0, 0.0});
    EXPECT_DOUBLE_EQ(sm.model.get_max_violation(p.get()), 1.0);
}

TEST(DeviceShiftableLoad, EveryCycleStartsExactlyOnce) {
    SingleDeviceModel sm(DeviceShiftableLoad("dw", shiftable_params()), TimeWindow{6, 1.0});
    PointBuilder p(sm.registry());
    p.set(dkey("dw", Field::StartIndicator, 0, 0), 1.0)
     .set(dkey("dw", Field::StartIndicator, 1, 0), 1.0)
     .set(dkey("dw", Field::StartIndicator, 4, 1), 1.0);
    EXPECT_GE(sm.model.get_max_violation(p.get()), 1.0);
}

TEST(DeviceShiftableLoad, RejectsImpossibleSequence) {
    DeviceShiftableLoad::Params p;
    p.cycles      = {{1.0, 1.0, 1.0}, {1.0}};
    p.t_start_min = {0, 0};
    p.t_start_max = {0, 2};
    EXPECT_THROW(DeviceShiftableLoad("dw", p), ParameterError);

    p = shiftable_params();
    p.cycles[1].clear();
    EXPECT_THROW(DeviceShiftableLoad("dw", p), ParameterError);

    p = shiftable_params();
    p.t_start_max = {2};
    EXPECT_THROW(DeviceShiftableLoad("dw", p), ParameterError);
}

TEST(DeviceShiftableLoad, CycleMustEndInsideWindow) {
    DeviceShiftableLoad dev("dw", shiftable_params());
    EXPECT_NO_THROW(dev.check_against_window(TimeWindow{5, 1.0}));
    EXPECT_THROW(dev.check_against_window(TimeWindow{4, 1.0}), ParameterError);
}


//
// Thermal load
//

namespace {
    DeviceThermalLoad::Params thermal_params() {
        DeviceThermalLoad::Params p;
        p.temp_min   = {15.0, 15.0};
        p.temp_max   = {25.0, 25.0};
        p.temp_ext   = {10.0, 10.0};
        p.temp_init  = 20.0;
        p.pwr_th_min = 1.0;
        p.pwr_th_max = 4.0;
        p.heat_cpty  = 2.0;
        p.th_eff     = 1.0;
        p.cond_coeff = 0.5;
        return p;
    }
}

TEST(DeviceThermalLoad, TemperatureDynamicsCoefficients) {
    SingleDeviceModel sm(DeviceThermalLoad("heat", thermal_params()), TimeWindow{2, 1.0});
    const int c0 = sm.cstr(dkey("heat", Field::TemperatureExchange, 0));
    const int c1 = sm.cstr(dkey("heat", Field::TemperatureExchange, 1));
    EXPECT_DOUBLE_EQ(sm.model.get_constraint_rhs({c0})[0], 17.5);
    EXPECT_DOUBLE_EQ(sm.model.get_constraint_rhs({c1})[0], 2.5);
    EXPECT_DOUBLE_EQ(sm.model.get_coefficient(c1, sm.var(dkey("heat", Field::Temperature, 0))), -0.75);
    EXPECT_DOUBLE_EQ(sm.model.get_coefficient(c1, sm.var(dkey("heat", Field::Power, 1))), -0.5);
    EXPECT_EQ(sm.model.get_lower_bound(sm.var(dkey("heat", Field::Temperature, 1))), 15.0);
    EXPECT_EQ(sm.model.get_upper_bound(sm.var(dkey("heat", Field::Temperature, 1))), 25.0);
}

TEST(DeviceThermalLoad, PowerRequiresOnIndicator) {
    SingleDeviceModel sm(DeviceThermalLoad("heat", thermal_params()), TimeWindow{2, 1.0});
    PointBuilder p(sm.registry());
    p.set(dkey("heat", Field::Temperature, 0), 17.5)
     .set(dkey("heat", Field::OnIndicator, 1), 1.0)
     .set(dkey("heat", Field::Power, 1), 2.0)
     .set(dkey("heat", Field::Temperature, 1), 0.75 * 17.5 + 2.5 + 0.5 * 2.0);
    set_balance(p, {0.0, 2.0});
    EXPECT_LT(sm.model.get_max_violation(p.get()), 1e-9);
    // heating without being switched on
    p.set(dkey("heat", Field::OnIndicator, 1), 0.0);
    EXPECT_NEAR(sm.model.get_max_violation(p.get()), 2.0, 1e-9);
}

TEST(DeviceThermalLoad, RejectsInconsistentSeries) {
    DeviceThermalLoad::Params p = thermal_params();
    p.temp_min = {15.0};
    EXPECT_THROW(DeviceThermalLoad("heat", p), ParameterError);
    p = thermal_params();
    p.temp_min[1] = 30.0;
    EXPECT_THROW(DeviceThermalLoad("heat", p), ParameterError);
    p = thermal_params();
    p.heat_cpty = 0.0;
    EXPECT_THROW(DeviceThermalLoad("heat", p), ParameterError);
    EXPECT_THROW(DeviceThermalLoad("heat", thermal_params()).check_against_window(TimeWindow{3, 1.0}), ParameterError);
}


//
// Deferrable load
//

namespace {
    DeviceDeferrableLoad::Params deferrable_params() {
        DeviceDeferrableLoad::Params p;
        p.energy_min = 3.0;
        p.energy_max = 5.0;
        p.pwr_min    = {0.0, 1.0, 1.0, 0.0};
        p.pwr_max    = {0.0, 2.0, 2.0, 0.0};
        return p;
    }
}

TEST(DeviceDeferrableLoad, EnergyOverHorizon) {
    SingleDeviceModel sm(DeviceDeferrableLoad("EV", deferrable_params()), TimeWindow{4, 1.0});
    PointBuilder p(sm.registry());
    p.set(dkey("EV", Field::Control, 1), 1.0)
     .set(dkey("EV", Field::Control, 2), 1.0)
     .set(dkey("EV", Field::Power, 1), 1.5)
     .set(dkey("EV", Field::Power, 2), 1.5);
    set_balance(p, {0.0, 1.5, 1.5, 0.0});
    EXPECT_DOUBLE_EQ(sm.model.get_max_violation(p.get()), 0.0);
    // not enough energy
    p.set(dkey("EV", Field::Power, 1), 1.0).set(dkey("EV", Field::Power, 2), 1.0);
    set_balance(p, {0.0, 1.0, 1.0, 0.0});
    EXPECT_DOUBLE_EQ(sm.model.get_max_violation(p.get()), 1.0);
}

TEST(DeviceDeferrableLoad, NoPowerOutsideAvailability) {
    SingleDeviceModel sm(DeviceDeferrableLoad("EV", deferrable_params()), TimeWindow{4, 1.0});
    EXPECT_EQ(sm.model.get_lower_bound(sm.var(dkey("EV", Field::Power, 0))), 0.0);
    PointBuilder p(sm.registry());
    p.set(dkey("EV", Field::Control, 0), 1.0)
     .set(dkey("EV", Field::Power, 0), 1.0)
     .set(dkey("EV", Field::Control, 1), 1.0)
     .set(dkey("EV", Field::Power, 1), 2.0);
    set_balance(p, {1.0, 2.0, 0.0, 0.0});
    EXPECT_DOUBLE_EQ(sm.model.get_max_violation(p.get()), 1.0);
    EXPECT_TRUE(sm.registry().has_constraint(dkey("EV", Field::EnergyTotalMin)));
    EXPECT_TRUE(sm.registry().has_constraint(dkey("EV", Field::EnergyTotalMax)));
}

TEST(DeviceDeferrableLoad, RejectsInvalidParameters) {
    DeviceDeferrableLoad::Params p = deferrable_params();
    p.energy_min = 6.0;
    EXPECT_THROW(DeviceDeferrableLoad("EV", p), ParameterError);
    p = deferrable_params();
    p.pwr_min[1] = 3.0;
    EXPECT_THROW(DeviceDeferrableLoad("EV", p), ParameterError);
    p = deferrable_params();
    p.pwr_max.pop_back();
    EXPECT_THROW(DeviceDeferrableLoad("EV", p), ParameterError);
}


//
// Curtailable load
//

TEST(DeviceCurtailableLoad, GenerationCanBeCurtailed) {
    DeviceCurtailableLoad::Params params{{-3.0, -1.0}, false};
    SingleDeviceModel sm(DeviceCurtailableLoad("PV", params), TimeWindow{2, 1.0});
    const int pwr0 = sm.var(dkey("PV", Field::Power, 0));
    EXPECT_EQ(sm.model.get_lower_bound(pwr0), -INF);
    EXPECT_EQ(sm.model.get_variable_type(sm.var(dkey("PV", Field::Control, 0))), VariableType::Continuous);
    EXPECT_EQ(sm.model.get_coefficient(sm.cstr(dkey("PV", Field::Curtailment, 0)), sm.var(dkey("PV", Field::Control, 0))), 3.0);

    PointBuilder p(sm.registry());
    p.set(dkey("PV", Field::Control, 0), 0.5)
     .set(dkey("PV", Field::Power, 0), -1.5)
     .set(dkey("PV", Field::Control, 1), 1.0)
     .set(dkey("PV", Field::Power, 1), -1.0);
    set_balance(p, {-1.5, -1.0});
    EXPECT_DOUBLE_EQ(sm.model.get_max_violation(p.get()), 0.0);
}

TEST(DeviceCurtailableLoad, BinaryCurtailmentNeedsBinariesFlag) {
    DeviceCurtailableLoad::Params params{{-3.0, -1.0}, true};
    SingleDeviceModel with_binaries(DeviceCurtailableLoad("PV", params), TimeWindow{2, 1.0}, true);
    SingleDeviceModel relaxed(DeviceCurtailableLoad("PV", params), TimeWindow{2, 1.0}, false);
    const IndexKey k = dkey("PV", Field::Control, 1);
    EXPECT_EQ(with_binaries.model.get_variable_type(with_binaries.var(k)), VariableType::Binary);
    EXPECT_EQ(relaxed.model.get_variable_type(relaxed.var(k)), VariableType::Continuous);
}


//
// Functions on the variant
//

TEST(Device, VariantAccessors) {
    Device dev = DeviceFixedLoad("load", DeviceFixedLoad::Params{{1.0, 2.0}});
    EXPECT_EQ(get_device_label(dev), "load");
    EXPECT_STREQ(get_device_kind_name(dev), "FixedLoad");
    EXPECT_NO_THROW(check_device_against_window(dev, TimeWindow{2, 1.0}));
    EXPECT_THROW(check_device_against_window(dev, TimeWindow{3, 1.0}), ParameterError);
    dev = DeviceBattery("bat", battery_params());
    EXPECT_STREQ(get_device_kind_name(dev), "Battery");
    EXPECT_THROW(DeviceFixedLoad("load", DeviceFixedLoad::Params{{1.0, INF}}), ParameterError);
}
