/**
 * @file test_saturation_model.cpp
 * @brief Unit tests for the saturation vapour pressure correlation
 */

#include <gtest/gtest.h>
#include "EngineError.hpp"
#include "SaturationModel.hpp"
#include <cmath>

using namespace MACB;

TEST(SaturationModelTest, TriplePointRegion) {
    EXPECT_NEAR(SaturationModel::saturationVaporPressure(0.0), 611.21, 0.1);

    // Ice and liquid branches meet within the correlation's own step
    double ice = SaturationModel::saturationVaporPressure(-1e-9);
    double liquid = SaturationModel::saturationVaporPressure(0.0);
    EXPECT_LT(std::abs(liquid - ice) / liquid, 1e-3);
}

TEST(SaturationModelTest, IncreasingWithTemperature) {
    double previous = SaturationModel::saturationVaporPressure(-100.0);
    for (double t = -95.0; t <= 200.0; t += 5.0) {
        double p = SaturationModel::saturationVaporPressure(t);
        EXPECT_GT(p, previous) << "at t = " << t;
        previous = p;
    }
}

TEST(SaturationModelTest, DerivativeMatchesFiniteDifference) {
    const double h = 1e-4;
    for (double t : {-60.0, -10.0, 10.0, 45.0, 150.0}) {
        double fd = (std::log(SaturationModel::saturationVaporPressure(t + h)) -
                     std::log(SaturationModel::saturationVaporPressure(t - h))) / (2.0 * h);
        EXPECT_NEAR(SaturationModel::dLnPwsdT(t), fd, 1e-6) << "at t = " << t;
    }
}

TEST(SaturationModelTest, TemperatureOutOfRange) {
    for (double t : {-100.1, 200.1, -273.15, 1000.0, std::nan("")}) {
        try {
            SaturationModel::saturationVaporPressure(t);
            ADD_FAILURE() << "Expected TemperatureOutOfRange for t = " << t;
        } catch (const EngineError& e) {
            EXPECT_EQ(e.kind(), ErrorKind::TEMPERATURE_OUT_OF_RANGE);
        }
    }
    EXPECT_NO_THROW(SaturationModel::saturationVaporPressure(-100.0));
    EXPECT_NO_THROW(SaturationModel::saturationVaporPressure(200.0));
}

TEST(SaturationModelTest, SaturationHumidityRatio) {
    EXPECT_NEAR(SaturationModel::saturationHumidityRatio(25.0, 101325.0), 0.0200811, 1e-6);
    EXPECT_NEAR(SaturationModel::saturationHumidityRatio(-20.0, 101325.0), 0.00063447, 1e-7);
}

TEST(SaturationModelTest, SaturationHumidityRatioNeedsPressureAboveSaturation) {
    // p_ws(100 degC) is slightly above one standard atmosphere
    try {
        SaturationModel::saturationHumidityRatio(100.0, 101325.0);
        FAIL() << "Expected InvalidInput";
    } catch (const EngineError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::INVALID_INPUT);
        EXPECT_EQ(e.field(), "pressure_pa");
    }
}
