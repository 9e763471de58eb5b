/**
 * @file test_comparison_report.cpp
 * @brief End-to-end tests of the inlet/outlet comparison report
 */

#include <gtest/gtest.h>
#include "ComparisonReport.hpp"
#include "EngineError.hpp"
#include "StandardAtmosphere.hpp"
#include <cmath>
#include <thread>
#include <vector>

using namespace MACB;

class ComparisonReportTest : public ::testing::Test {
protected:
    void SetUp() override {
        geometry = {1500.0, 25.0, 0.7, 2.5, 1100.0, 150.0};
        inlet = {25.0, 50.0, 800.0};
        outlet = {27.5, 38.0, 420.0};
    }

    void expectFailure(ErrorKind kind, const std::string& field,
                       const SolverSettings& settings = SolverSettings()) {
        try {
            buildReport(inlet, outlet, geometry, settings);
            FAIL() << "Expected failure at " << field;
        } catch (const EngineError& e) {
            EXPECT_EQ(e.kind(), kind) << e.what();
            EXPECT_EQ(e.field(), field) << e.what();
        }
    }

    ProcessGeometry geometry;
    StationReading inlet;
    StationReading outlet;
};

TEST_F(ComparisonReportTest, BuildsFullReport) {
    ComparisonReport r = buildReport(inlet, outlet, geometry);

    EXPECT_NEAR(r.pressure_pa, pressureFromAltitude(1500.0), 1e-9);
    EXPECT_DOUBLE_EQ(r.inlet.pressure_pa, r.pressure_pa);
    EXPECT_DOUBLE_EQ(r.outlet.pressure_pa, r.pressure_pa);

    EXPECT_NEAR(r.inlet.wet_bulb_c, 17.459, 0.01);
    EXPECT_NEAR(r.outlet.wet_bulb_c, 17.165, 0.01);
    EXPECT_NEAR(r.inlet.humidity_ratio, 0.011878, 2e-6);
    EXPECT_NEAR(r.outlet.humidity_ratio, 0.010440, 2e-6);

    EXPECT_NEAR(r.balance.mass_flow_kgs, r.outlet.density_kgm3 * 0.025, 1e-12);
    EXPECT_EQ(r.balance.co2_classification, Co2Change::CAPTURE);
    EXPECT_NEAR(r.geometry.gas_velocity_ms, 0.025 / (M_PI * 0.075 * 0.075), 1e-9);
}

TEST_F(ComparisonReportTest, DeltasAreOutletMinusInlet) {
    ComparisonReport r = buildReport(inlet, outlet, geometry);
    const MoistAirDelta& d = r.delta;

    EXPECT_DOUBLE_EQ(d.dry_bulb_c, 2.5);
    EXPECT_DOUBLE_EQ(d.pressure_pa, r.outlet.pressure_pa - r.inlet.pressure_pa);
    EXPECT_DOUBLE_EQ(d.pressure_pa, 0.0);
    EXPECT_DOUBLE_EQ(d.input_relative_humidity_pct, -12.0);
    EXPECT_DOUBLE_EQ(d.co2_ppm, -380.0);
    EXPECT_DOUBLE_EQ(d.wet_bulb_c, r.outlet.wet_bulb_c - r.inlet.wet_bulb_c);
    EXPECT_DOUBLE_EQ(d.humidity_ratio, r.outlet.humidity_ratio - r.inlet.humidity_ratio);
    EXPECT_DOUBLE_EQ(d.dew_point_c, r.outlet.dew_point_c - r.inlet.dew_point_c);
    EXPECT_DOUBLE_EQ(d.enthalpy_jkg, r.outlet.enthalpy_jkg - r.inlet.enthalpy_jkg);
    EXPECT_DOUBLE_EQ(d.density_kgm3, r.outlet.density_kgm3 - r.inlet.density_kgm3);
    EXPECT_DOUBLE_EQ(d.degree_of_saturation,
                     r.outlet.degree_of_saturation - r.inlet.degree_of_saturation);
}

TEST_F(ComparisonReportTest, IdenticalStationsGiveNoChange) {
    outlet = inlet;
    ComparisonReport r = buildReport(inlet, outlet, geometry);
    EXPECT_EQ(r.balance.co2_classification, Co2Change::NO_CHANGE);
    EXPECT_DOUBLE_EQ(r.balance.co2_change, 0.0);
    EXPECT_DOUBLE_EQ(r.delta.enthalpy_jkg, 0.0);
    EXPECT_DOUBLE_EQ(r.balance.energy_flux_change_w, 0.0);
}

TEST_F(ComparisonReportTest, AltitudeOutOfRange) {
    geometry.altitude_m = 12000.0;
    expectFailure(ErrorKind::ALTITUDE_OUT_OF_RANGE, "geometry.altitude_m");
}

TEST_F(ComparisonReportTest, InvalidGeometry) {
    geometry.resin_density_kgm3 = 0.0;
    expectFailure(ErrorKind::INVALID_INPUT, "geometry.resin_density_kgm3");
}

TEST_F(ComparisonReportTest, InvalidInletHumidity) {
    inlet.relative_humidity_pct = 120.0;
    expectFailure(ErrorKind::INVALID_INPUT, "inlet.relative_humidity_pct");
}

TEST_F(ComparisonReportTest, OutletTemperatureOutOfRange) {
    outlet.dry_bulb_c = 250.0;
    expectFailure(ErrorKind::TEMPERATURE_OUT_OF_RANGE, "outlet.dry_bulb_c");
}

TEST_F(ComparisonReportTest, NegativeCo2) {
    inlet.co2_ppm = -5.0;
    expectFailure(ErrorKind::INVALID_INPUT, "inlet.co2_ppm");
}

TEST_F(ComparisonReportTest, FirstFailureWins) {
    inlet.relative_humidity_pct = -1.0;
    outlet.dry_bulb_c = 500.0;
    expectFailure(ErrorKind::INVALID_INPUT, "inlet.relative_humidity_pct");
}

TEST_F(ComparisonReportTest, SolverFailuresCarryStation) {
    SolverSettings settings;
    settings.max_iterations = 5;
    expectFailure(ErrorKind::CONVERGENCE_FAILURE, "inlet.wet_bulb_c", settings);

    settings.max_iterations = 0;
    expectFailure(ErrorKind::INVALID_INPUT, "solver.max_iterations", settings);
}

TEST_F(ComparisonReportTest, ConcurrentCallsMatchSerial) {
    const ComparisonReport serial = buildReport(inlet, outlet, geometry);

    const int n_threads = 4;
    std::vector<ComparisonReport> results(n_threads);
    std::vector<std::thread> threads;
    for (int i = 0; i < n_threads; ++i) {
        threads.emplace_back([&, i]() { results[i] = buildReport(inlet, outlet, geometry); });
    }
    for (auto& t : threads) t.join();

    for (const auto& r : results) {
        EXPECT_DOUBLE_EQ(r.inlet.wet_bulb_c, serial.inlet.wet_bulb_c);
        EXPECT_DOUBLE_EQ(r.outlet.enthalpy_jkg, serial.outlet.enthalpy_jkg);
        EXPECT_DOUBLE_EQ(r.balance.energy_flux_change_w, serial.balance.energy_flux_change_w);
    }
}
