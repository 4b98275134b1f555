#include <gtest/gtest.h>

#include <cmath>
#include <limits>
#include <set>
#include <sstream>
#include <string>
#include <vector>

#include "devices.h"
#include "milp_model_memory.h"
#include "model_assembly.h"
#include "model_errors.hpp"
#include "test_helpers.h"

using testhelper::INF;
using testhelper::PointBuilder;
using testhelper::free_aggregator;

namespace {

    DeviceFixedLoad fixed(const std::string& label, const std::vector<double>& load) {
        return DeviceFixedLoad(label, DeviceFixedLoad::Params{load});
    }

    /**
     * A household with one device of every kind, for a window of 4 steps
     */
    Household full_household(const std::string& label) {
        Household hh;
        hh.label = label;
        hh.devices.push_back(fixed("load", {1.0, 1.0, 1.0, 1.0}));

        DeviceBattery::Params bat{0.0, 3.0, 0.0, 3.0, 0.0, 5.0, 1.0, 0.95, 0.95, INF};
        hh.devices.push_back(DeviceBattery("bat", bat));

        DeviceThermalLoad::Params heat;
        heat.temp_min.assign(4, 18.0);
        heat.temp_max.assign(4, 22.0);
        heat.temp_ext.assign(4, 5.0);
        heat.temp_init  = 20.0;
        heat.pwr_th_min = 0.0;
        heat.pwr_th_max = 10.0;
        heat.heat_cpty  = 3.0;
        heat.th_eff     = 1.0;
        heat.cond_coeff = 0.2;
        hh.devices.push_back(DeviceThermalLoad("heat", heat));

        DeviceDeferrableLoad::Params ev;
        ev.energy_min = 2.0;
        ev.energy_max = 4.0;
        ev.pwr_min = {0.0, 1.0, 1.0, 1.0};
        ev.pwr_max = {0.0, 3.0, 3.0, 3.0};
        hh.devices.push_back(DeviceDeferrableLoad("EV", ev));

        DeviceShiftableLoad::Params dw;
        dw.cycles      = {{1.0, 1.0}};
        dw.t_start_min = {0};
        dw.t_start_max = {2};
        hh.devices.push_back(DeviceShiftableLoad("dw", dw));

        hh.devices.push_back(DeviceCurtailableLoad("PV", DeviceCurtailableLoad::Params{{0.0, -1.0, -2.0, 0.0}, true}));
        return hh;
    }

    std::string lp_text(const LinearModel& m) {
        std::stringstream ss;
        m.write_lp(ss);
        return ss.str();
    }

}


TEST(ModelAssembler, FixedLoadsMoveToRightHandSide) {
    LinearModel m;
    ModelAssembler a(m, TimeWindow{2, 1.0}, true);
    Household hh{"H", {fixed("load_a", {1.0, 2.0}), fixed("load_b", {0.5, 0.5})}};
    a.assemble(free_aggregator(2), {hh});

    // fixed loads add no variables
    EXPECT_EQ(m.get_n_variables(), 4u);
    std::vector<int> link = {
        a.get_registry().lookup_constraint(IndexKey::Household("H", Field::LinkNetLoad, 0)),
        a.get_registry().lookup_constraint(IndexKey::Household("H", Field::LinkNetLoad, 1))
    };
    EXPECT_EQ(m.get_constraint_rhs(link), (std::vector<double>{-1.5, -2.5}));

    // the net load equals the fixed load
    PointBuilder p(a.get_registry());
    p.set(IndexKey::Household("H", Field::NetLoad, 0), 1.5)
     .set(IndexKey::Household("H", Field::NetLoad, 1), 2.5)
     .set(IndexKey::Aggregator(Field::TotalLoad, 0), 1.5)
     .set(IndexKey::Aggregator(Field::TotalLoad, 1), 2.5);
    EXPECT_DOUBLE_EQ(m.get_max_violation(p.get()), 0.0);
}

TEST(ModelAssembler, TotalLoadRespectsAggregatorBounds) {
    LinearModel m;
    ModelAssembler a(m, TimeWindow{1, 1.0}, true);
    AggregatorSpec agg = free_aggregator(1);
    agg.total_load_max = {2.0};
    a.assemble(agg, {Household{"H", {fixed("load", {3.0})}}});

    PointBuilder p(a.get_registry());
    p.set(IndexKey::Household("H", Field::NetLoad, 0), 3.0)
     .set(IndexKey::Aggregator(Field::TotalLoad, 0), 3.0);
    EXPECT_DOUBLE_EQ(m.get_max_violation(p.get()), 1.0);
    // the total load cannot be decoupled from the households
    p.set(IndexKey::Aggregator(Field::TotalLoad, 0), 2.0);
    EXPECT_DOUBLE_EQ(m.get_max_violation(p.get()), 1.0);
}

TEST(ModelAssembler, TotalLoadBoundsTheSumOfAllHouseholds) {
    LinearModel m;
    ModelAssembler a(m, TimeWindow{2, 1.0}, true);
    AggregatorSpec agg = free_aggregator(2);
    agg.total_load_max = {3.0, 3.0};
    // every household alone stays below the bound of the aggregator
    std::vector<Household> hhs = {
        Household{"A", {DeviceCurtailableLoad("flex", DeviceCurtailableLoad::Params{{2.0, 2.0}, false})}, -INF, 3.0},
        Household{"B", {DeviceCurtailableLoad("flex", DeviceCurtailableLoad::Params{{2.0, 2.0}, false})}, -INF, 3.0}
    };
    a.assemble(agg, hhs);

    auto point = [&](double u) {
        PointBuilder p(a.get_registry());
        for (long t = 0; t < 2; t++) {
            for (const std::string hh : {"A", "B"}) {
                p.set(IndexKey::Device(hh, "flex", Field::Control, t), u)
                 .set(IndexKey::Device(hh, "flex", Field::Power,   t), 2.0 * u)
                 .set(IndexKey::Household(hh, Field::NetLoad, t),     2.0 * u);
            }
            p.set(IndexKey::Aggregator(Field::TotalLoad, t), 4.0 * u);
        }
        return p.get();
    };
    // 2 + 2 > 3
    EXPECT_DOUBLE_EQ(m.get_max_violation(point(1.0)), 1.0);
    // 1.5 + 1.5 <= 3
    EXPECT_DOUBLE_EQ(m.get_max_violation(point(0.75)), 0.0);
}

TEST(ModelAssembler, ObjectiveIsEnergyCost) {
    LinearModel m;
    ModelAssembler a(m, TimeWindow{2, 0.25}, true);
    AggregatorSpec agg = free_aggregator(2);
    agg.price = {4.0, 8.0};
    a.assemble(agg, {});
    const int tl0 = a.get_registry().lookup_variable(IndexKey::Aggregator(Field::TotalLoad, 0));
    const int tl1 = a.get_registry().lookup_variable(IndexKey::Aggregator(Field::TotalLoad, 1));
    EXPECT_EQ(m.get_objective_coefficient(tl0), 1.0);
    EXPECT_EQ(m.get_objective_coefficient(tl1), 2.0);
    EXPECT_DOUBLE_EQ(m.evaluate_objective({3.0, 1.0}), 5.0);
}

TEST(ModelAssembler, HouseholdNetLoadBounds) {
    LinearModel m;
    ModelAssembler a(m, TimeWindow{2, 1.0}, true);
    Household hh{"H", {}, -1.0, 4.0};
    a.assemble(free_aggregator(2), {hh});
    const int nl = a.get_registry().lookup_variable(IndexKey::Household("H", Field::NetLoad, 1));
    EXPECT_EQ(m.get_lower_bound(nl), -1.0);
    EXPECT_EQ(m.get_upper_bound(nl),  4.0);
    const int link = a.get_registry().lookup_constraint(IndexKey::Aggregator(Field::LinkTotalLoad, 1));
    EXPECT_EQ(m.get_coefficient(link, nl), 1.0);
}

TEST(ModelAssembler, NoHouseholdsGivesAggregatorOnly) {
    LinearModel m;
    ModelAssembler a(m, TimeWindow{3, 1.0}, true);
    a.assemble(free_aggregator(3), {});
    EXPECT_EQ(m.get_n_variables(), 3u);
    EXPECT_EQ(m.get_n_constraints(), 3u);
    EXPECT_TRUE(a.is_assembled());
    // without households the total load is zero
    EXPECT_DOUBLE_EQ(m.get_max_violation({0.0, 0.0, 1.0}), 1.0);
}

TEST(ModelAssembler, NamesAreUniqueForAllDeviceKinds) {
    LinearModel m;
    ModelAssembler a(m, TimeWindow{4, 1.0}, true);
    a.assemble(free_aggregator(4), {full_household("HH_0"), full_household("HH_1")});

    std::set<std::string> var_names, cstr_names;
    for (size_t i = 0; i < m.get_n_variables(); i++)
        var_names.insert(m.get_variable_name((int) i));
    for (size_t i = 0; i < m.get_n_constraints(); i++)
        cstr_names.insert(m.get_constraint_name((int) i));
    EXPECT_EQ(var_names.size(), m.get_n_variables());
    EXPECT_EQ(cstr_names.size(), m.get_n_constraints());
    EXPECT_EQ(a.get_registry().get_n_variables(), m.get_n_variables());
    EXPECT_EQ(a.get_registry().get_n_constraints(), m.get_n_constraints());
    EXPECT_EQ(a.get_registry().count_variables_of_household("HH_0"), a.get_registry().count_variables_of_household("HH_1"));
}

TEST(ModelAssembler, AssemblyIsDeterministic) {
    LinearModel m1, m2;
    ModelAssembler a1(m1, TimeWindow{4, 1.0}, true);
    ModelAssembler a2(m2, TimeWindow{4, 1.0}, true);
    a1.assemble(free_aggregator(4), {full_household("A"), full_household("B")});
    a2.assemble(free_aggregator(4), {full_household("A"), full_household("B")});
    EXPECT_EQ(lp_text(m1), lp_text(m2));
}

TEST(ModelAssembler, RelaxedModelHasNoBinaries) {
    LinearModel m;
    ModelAssembler a(m, TimeWindow{4, 1.0}, false);
    a.assemble(free_aggregator(4), {full_household("H")});
    for (size_t i = 0; i < m.get_n_variables(); i++)
        EXPECT_EQ(m.get_variable_type((int) i), VariableType::Continuous) << m.get_variable_name((int) i);
    EXPECT_EQ(lp_text(m).find("Binaries"), std::string::npos);
}

TEST(ModelAssembler, ValidationHappensBeforeAnyChange) {
    LinearModel m;
    ModelAssembler a(m, TimeWindow{4, 1.0}, true);
    // the second household has a load of the wrong length
    Household bad{"B", {fixed("load", {1.0, 1.0})}};
    EXPECT_THROW(a.assemble(free_aggregator(4), {full_household("A"), bad}), ParameterError);
    EXPECT_EQ(m.get_n_variables(), 0u);
    EXPECT_EQ(m.get_n_constraints(), 0u);
    EXPECT_FALSE(a.is_assembled());
    // a valid call afterwards still works
    EXPECT_NO_THROW(a.assemble(free_aggregator(4), {full_household("A")}));
}

TEST(ModelAssembler, RejectsDuplicateLabels) {
    LinearModel m;
    ModelAssembler a(m, TimeWindow{2, 1.0}, true);
    Household h1{"H", {fixed("load", {1.0, 1.0})}};
    EXPECT_THROW(a.assemble(free_aggregator(2), {h1, h1}), ParameterError);
    Household h2{"H2", {fixed("load", {1.0, 1.0}), fixed("load", {0.0, 0.0})}};
    EXPECT_THROW(a.assemble(free_aggregator(2), {h2}), ParameterError);
    Household unnamed{"", {}};
    EXPECT_THROW(a.assemble(free_aggregator(2), {unnamed}), ParameterError);
    // equal device labels in different households are fine
    Household h3{"H3", {fixed("load", {1.0, 1.0})}};
    EXPECT_NO_THROW(a.assemble(free_aggregator(2), {h1, h3}));
}

TEST(ModelAssembler, RejectsCollidingNames) {
    LinearModel m;
    ModelAssembler a(m, TimeWindow{2, 1.0}, true);
    DeviceBattery::Params bat{0.0, 2.0, 0.0, 2.0, 0.0, 4.0, 0.0, 1.0, 1.0, INF};
    // HH_0 + bat and HH + 0_bat would both be named HH_0_bat_...
    Household h1{"HH_0", {DeviceBattery("bat",   bat)}};
    Household h2{"HH",   {DeviceBattery("0_bat", bat)}};
    EXPECT_THROW(a.assemble(free_aggregator(2), {h1, h2}), ParameterError);
    EXPECT_THROW(a.assemble(free_aggregator(2), {h2, h1}), ParameterError);
    // household HH_0 and device 0 of household HH
    Household h3{"HH", {fixed("0", {1.0, 1.0})}};
    EXPECT_THROW(a.assemble(free_aggregator(2), {h1, h3}), ParameterError);
    EXPECT_EQ(m.get_n_variables(), 0u);
    EXPECT_EQ(m.get_n_constraints(), 0u);

    // labels with underscores are fine as long as the names stay unique
    Household h4{"HH_1", {DeviceBattery("bat_1", bat)}};
    a.assemble(free_aggregator(2), {h1, h4});
    std::set<std::string> var_names, cstr_names;
    for (size_t i = 0; i < m.get_n_variables(); i++)
        var_names.insert(m.get_variable_name((int) i));
    for (size_t i = 0; i < m.get_n_constraints(); i++)
        cstr_names.insert(m.get_constraint_name((int) i));
    EXPECT_EQ(var_names.size(), m.get_n_variables());
    EXPECT_EQ(cstr_names.size(), m.get_n_constraints());
}

TEST(ModelAssembler, RejectsInvalidAggregator) {
    const TimeWindow w{2, 1.0};
    AggregatorSpec agg = free_aggregator(2);
    agg.price = {1.0};
    EXPECT_THROW(ModelAssembler::validate(w, agg, {}), ParameterError);
    agg = free_aggregator(2);
    agg.total_load_min = {0.0, 5.0};
    agg.total_load_max = {1.0, 4.0};
    EXPECT_THROW(ModelAssembler::validate(w, agg, {}), ParameterError);
    agg = free_aggregator(2);
    agg.price[1] = std::numeric_limits<double>::quiet_NaN();
    EXPECT_THROW(ModelAssembler::validate(w, agg, {}), ParameterError);
    agg = free_aggregator(2);
    agg.total_load_min[0] = std::numeric_limits<double>::quiet_NaN();
    EXPECT_THROW(ModelAssembler::validate(w, agg, {}), ParameterError);
    agg = free_aggregator(2);
    agg.total_load_max[1] = std::numeric_limits<double>::quiet_NaN();
    EXPECT_THROW(ModelAssembler::validate(w, agg, {}), ParameterError);
    Household nan_bound{"H", {}, std::numeric_limits<double>::quiet_NaN(), 1.0};
    EXPECT_THROW(ModelAssembler::validate(w, free_aggregator(2), {nan_bound}), ParameterError);
    Household hh{"H", {}, 2.0, 1.0};
    EXPECT_THROW(ModelAssembler::validate(w, free_aggregator(2), {hh}), ParameterError);
}

TEST(ModelAssembler, AssembleOnlyOnce) {
    LinearModel m;
    ModelAssembler a(m, TimeWindow{2, 1.0}, true);
    a.assemble(free_aggregator(2), {});
    EXPECT_THROW(a.assemble(free_aggregator(2), {}), ModelAssemblyError);
    EXPECT_EQ(m.get_n_variables(), 2u);
}

TEST(ModelAssembler, InvalidWindowIsRejected) {
    LinearModel m;
    EXPECT_THROW(ModelAssembler(m, TimeWindow{0, 1.0}, true), ParameterError);
}
