/**
 * @file test_balance_calculator.cpp
 * @brief Unit tests for the mass, energy and CO2 balance
 */

#include <gtest/gtest.h>
#include "BalanceCalculator.hpp"
#include "EngineError.hpp"
#include "MoistAirProperties.hpp"
#include <cmath>

using namespace MACB;

class BalanceCalculatorTest : public ::testing::Test {
protected:
    void SetUp() override {
        geometry = {0.0, 25.0, 0.7, 2.5, 1100.0, 150.0};
        inlet = {25.0, 50.0, 800.0};
        outlet = {27.5, 38.0, 420.0};

        MoistAirCalculator calculator;
        inlet_state = calculator.fromRelativeHumidity(inlet.dry_bulb_c,
                                                      inlet.relative_humidity_pct, 101325.0);
        outlet_state = calculator.fromRelativeHumidity(outlet.dry_bulb_c,
                                                       outlet.relative_humidity_pct, 101325.0);
    }

    ProcessGeometry geometry;
    StationReading inlet;
    StationReading outlet;
    MoistAirState inlet_state;
    MoistAirState outlet_state;
};

TEST_F(BalanceCalculatorTest, MassFlowUsesOutletDensity) {
    BalanceResult b = computeBalance(inlet, outlet, inlet_state, outlet_state, geometry);
    EXPECT_NEAR(b.mass_flow_kgs, outlet_state.density_kgm3 * 0.025, 1e-12);
}

TEST_F(BalanceCalculatorTest, EnergyFluxes) {
    BalanceResult b = computeBalance(inlet, outlet, inlet_state, outlet_state, geometry);
    EXPECT_NEAR(b.energy_flux_inlet_w, inlet_state.enthalpy_jkg * b.mass_flow_kgs, 1e-9);
    EXPECT_NEAR(b.energy_flux_outlet_w, outlet_state.enthalpy_jkg * b.mass_flow_kgs, 1e-9);
    EXPECT_NEAR(b.energy_flux_change_w, b.energy_flux_outlet_w - b.energy_flux_inlet_w, 1e-9);
}

TEST_F(BalanceCalculatorTest, Co2FlowsAndCapture) {
    BalanceResult b = computeBalance(inlet, outlet, inlet_state, outlet_state, geometry);
    EXPECT_DOUBLE_EQ(b.co2_flow_inlet, 800.0 * 25.0);
    EXPECT_DOUBLE_EQ(b.co2_flow_outlet, 420.0 * 25.0);
    EXPECT_DOUBLE_EQ(b.co2_change, (420.0 - 800.0) * 25.0);
    EXPECT_EQ(b.co2_classification, Co2Change::CAPTURE);
}

TEST_F(BalanceCalculatorTest, ClassificationMatchesSign) {
    for (double outlet_ppm : {0.0, 400.0, 799.999, 800.0, 800.001, 2000.0}) {
        outlet.co2_ppm = outlet_ppm;
        BalanceResult b = computeBalance(inlet, outlet, inlet_state, outlet_state, geometry);
        if (b.co2_change > 0.0) {
            EXPECT_EQ(b.co2_classification, Co2Change::RELEASE);
        } else if (b.co2_change < 0.0) {
            EXPECT_EQ(b.co2_classification, Co2Change::CAPTURE);
        } else {
            EXPECT_EQ(b.co2_classification, Co2Change::NO_CHANGE);
        }
    }
}

TEST_F(BalanceCalculatorTest, Labels) {
    EXPECT_EQ(toString(Co2Change::RELEASE), "CO2 Release");
    EXPECT_EQ(toString(Co2Change::CAPTURE), "CO2 Capture");
    EXPECT_EQ(toString(Co2Change::NO_CHANGE), "No Change in CO2");
    EXPECT_EQ(classifyCo2Change(0.0), Co2Change::NO_CHANGE);
    EXPECT_EQ(classifyCo2Change(1e-300), Co2Change::RELEASE);
    EXPECT_EQ(classifyCo2Change(-1e-300), Co2Change::CAPTURE);
}

TEST_F(BalanceCalculatorTest, NegativeCo2IsInvalid) {
    inlet.co2_ppm = -1.0;
    EXPECT_THROW(computeBalance(inlet, outlet, inlet_state, outlet_state, geometry),
                 EngineError);
}

TEST_F(BalanceCalculatorTest, InvalidGeometry) {
    geometry.airflow_lps = 0.0;
    try {
        computeBalance(inlet, outlet, inlet_state, outlet_state, geometry);
        FAIL() << "Expected InvalidInput";
    } catch (const EngineError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::INVALID_INPUT);
        EXPECT_EQ(e.field(), "airflow_lps");
    }
}
