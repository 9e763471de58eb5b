/**
 * @file test_moist_air_properties.cpp
 * @brief Unit tests for the moist-air state calculator
 */

#include <gtest/gtest.h>
#include "EngineError.hpp"
#include "MoistAirProperties.hpp"
#include "SaturationModel.hpp"
#include "StandardAtmosphere.hpp"
#include "WetBulbSolver.hpp"
#include <cmath>
#include <vector>

using namespace MACB;

class MoistAirPropertiesTest : public ::testing::Test {
protected:
    void SetUp() override {
        pressures = {101325.0, pressureFromAltitude(1500.0), pressureFromAltitude(3000.0)};
    }

    MoistAirCalculator calculator;
    WetBulbSolver wet_bulb_solver;
    std::vector<double> pressures;
};

TEST_F(MoistAirPropertiesTest, CanonicalState) {
    MoistAirState s = calculator.fromRelativeHumidity(25.0, 50.0, 101325.0);

    EXPECT_NEAR(s.humidity_ratio, 0.00988, 1e-5);
    EXPECT_NEAR(s.wet_bulb_c, 17.9, 0.2);
    EXPECT_NEAR(s.dew_point_c, 13.864, 0.01);
    EXPECT_NEAR(s.relative_humidity_pct, 50.0, 0.05);
    EXPECT_NEAR(s.enthalpy_jkg, 50322.0, 5.0);
    EXPECT_NEAR(s.specific_volume_m3kg, 0.85804, 1e-4);
    EXPECT_NEAR(s.density_kgm3, 1.17696, 1e-4);
    EXPECT_NEAR(s.degree_of_saturation, 0.49206, 1e-3);
    EXPECT_NEAR(s.dry_air_enthalpy_jkg, 25150.0, 1e-6);
    EXPECT_DOUBLE_EQ(s.pressure_pa, 101325.0);
}

TEST_F(MoistAirPropertiesTest, RelativeHumidityRoundTrip) {
    for (double P : pressures) {
        for (double t : {-99.9, -90.0, -80.0, -60.0, -40.0, -30.0, -5.0, 5.0, 20.0, 35.0, 50.0}) {
            for (double rh : {1.0, 10.0, 30.0, 50.0, 60.0, 90.0}) {
                double twb = wet_bulb_solver.solve(t, rh, P);
                MoistAirState s = calculator.properties(t, twb, P);
                EXPECT_NEAR(s.relative_humidity_pct, rh, 0.05)
                    << "t = " << t << ", rh = " << rh << ", P = " << P;
            }
        }
    }
}

TEST_F(MoistAirPropertiesTest, HumidityRatioIncreasesWithRelativeHumidity) {
    for (double P : pressures) {
        for (double t : {-99.9, -90.0, -80.0, -60.0, -40.0, -10.0, 25.0, 40.0}) {
            double previous = -1.0;
            for (double rh = 0.0; rh <= 100.0; rh += 5.0) {
                MoistAirState s = calculator.fromRelativeHumidity(t, rh, P);
                EXPECT_GT(s.humidity_ratio, previous) << "t = " << t << ", rh = " << rh;
                previous = s.humidity_ratio;
            }
        }
    }
}

TEST_F(MoistAirPropertiesTest, DerivedQuantitiesAreJointlyConsistent) {
    for (double P : pressures) {
        for (double t : {-15.0, 10.0, 30.0}) {
            for (double rh : {20.0, 75.0}) {
                MoistAirState s = calculator.fromRelativeHumidity(t, rh, P);
                const double W = s.humidity_ratio;

                EXPECT_NEAR(s.vapor_pressure_pa, P * W / (0.621945 + W), 1e-9 * P);
                EXPECT_NEAR(s.relative_humidity_pct,
                            100.0 * s.vapor_pressure_pa /
                                SaturationModel::saturationVaporPressure(t), 1e-9);
                EXPECT_NEAR(s.enthalpy_jkg, (1.006 * t + W * (2501.0 + 1.86 * t)) * 1000.0,
                            1e-6);
                EXPECT_NEAR(s.specific_volume_m3kg,
                            287.042 * (t + 273.15) * (1.0 + 1.607858 * W) / P, 1e-12);
                EXPECT_NEAR(s.density_kgm3, (1.0 + W) / s.specific_volume_m3kg, 1e-12);
                EXPECT_NEAR(s.degree_of_saturation,
                            W / SaturationModel::saturationHumidityRatio(t, P), 1e-12);
            }
        }
    }
}

TEST_F(MoistAirPropertiesTest, TemperatureOrdering) {
    for (double P : pressures) {
        for (double t : {-99.9, -90.0, -80.0, -60.0, -25.0, 0.5, 18.0, 42.0}) {
            for (double rh : {0.0, 15.0, 55.0, 95.0, 100.0}) {
                MoistAirState s = calculator.fromRelativeHumidity(t, rh, P);
                EXPECT_LE(s.dew_point_c, s.wet_bulb_c);
                EXPECT_LE(s.wet_bulb_c, s.dry_bulb_c);
                EXPECT_GE(s.humidity_ratio, 0.0);
                EXPECT_GE(s.relative_humidity_pct, -0.05);
                EXPECT_LE(s.relative_humidity_pct, 100.05);
            }
        }
    }
}

TEST_F(MoistAirPropertiesTest, SaturatedState) {
    MoistAirState s = calculator.properties(20.0, 20.0, 101325.0);
    EXPECT_NEAR(s.relative_humidity_pct, 100.0, 0.05);
    EXPECT_NEAR(s.dew_point_c, 20.0, 0.01);
    EXPECT_NEAR(s.degree_of_saturation, 1.0, 1e-9);
}

TEST_F(MoistAirPropertiesTest, HumidityRatioFloor) {
    // Wet-bulb far below the dry-air wet-bulb gives a negative raw W
    MoistAirState s = calculator.properties(40.0, 0.0, 101325.0);
    EXPECT_DOUBLE_EQ(s.humidity_ratio, PsychroConstants::MIN_HUMIDITY_RATIO);
}

TEST_F(MoistAirPropertiesTest, FloorNeverRaisesColdAirHumidity) {
    for (double P : pressures) {
        for (double t : {-99.9, -90.0, -80.0, -60.0}) {
            const double Ws = SaturationModel::saturationHumidityRatio(t, P);

            // Dry air: floored, but far below saturation
            MoistAirState dry = calculator.fromRelativeHumidity(t, 0.0, P);
            EXPECT_GT(dry.humidity_ratio, 0.0);
            EXPECT_LE(dry.humidity_ratio, 1e-4 * Ws * (1.0 + 1e-9));
            EXPECT_LT(dry.relative_humidity_pct, 0.05) << "t = " << t;
            EXPECT_GE(dry.dew_point_c, PsychroConstants::T_MIN);

            // Positive W from the wet-bulb balance is kept as is
            MoistAirState half = calculator.fromRelativeHumidity(t, 50.0, P);
            EXPECT_NEAR(half.humidity_ratio,
                        Psychrometrics::humidityRatioFromRelativeHumidity(t, 50.0, P),
                        5e-4 * Ws) << "t = " << t;
            EXPECT_LE(half.relative_humidity_pct, 100.0);
            EXPECT_LT(half.dew_point_c, half.wet_bulb_c) << "t = " << t;
        }
    }
}

TEST_F(MoistAirPropertiesTest, WetBulbAboveDryBulbIsInvalid) {
    try {
        calculator.properties(20.0, 21.0, 101325.0);
        FAIL() << "Expected InvalidInput";
    } catch (const EngineError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::INVALID_INPUT);
        EXPECT_EQ(e.field(), "wet_bulb_c");
    }
}

TEST_F(MoistAirPropertiesTest, PsychrometricHelpers) {
    EXPECT_NEAR(Psychrometrics::humidityRatioFromRelativeHumidity(25.0, 50.0, 101325.0),
                0.0098810, 1e-6);
    EXPECT_NEAR(Psychrometrics::vaporPressureFromHumidityRatio(0.0098810, 101325.0),
                1584.6, 0.1);
    EXPECT_DOUBLE_EQ(Psychrometrics::dryAirEnthalpy(10.0), 10060.0);
    EXPECT_THROW(Psychrometrics::humidityRatioFromVaporPressure(101325.0, 101325.0),
                 EngineError);
    EXPECT_THROW(Psychrometrics::vaporPressureFromHumidityRatio(-0.001, 101325.0),
                 EngineError);
}
