#undef NDEBUG
#include "IrradianceCurve.hpp"
#include "SolarGeometry.hpp"
#include "SolarTrace.hpp"

#include <cassert>
#include <cmath>
#include <iostream>

static bool near(double a, double b, double tol)
{
    return std::fabs(a - b) <= tol;
}

void test_climate_zones() {
    assert(climateZone(70.0) == CLIMATE_POLAR);
    assert(climateZone(-60.0) == CLIMATE_POLAR);
    assert(climateZone(51.0) == CLIMATE_TEMPERATE);
    assert(climateZone(-33.9) == CLIMATE_SUBTROPICAL);
    assert(climateZone(10.0) == CLIMATE_TROPICAL);
    assert(climateZoneAnnualIrradiance(CLIMATE_POLAR) == 800.0);
    assert(climateZoneAnnualIrradiance(CLIMATE_TEMPERATE) == 1100.0);
    assert(climateZoneAnnualIrradiance(CLIMATE_SUBTROPICAL) == 1400.0);
    assert(climateZoneAnnualIrradiance(CLIMATE_TROPICAL) == 1600.0);
    std::cout << "[PASS] Climate zone table.\n";
}

void test_weather_factor() {
    assert(approximateMonth(1) == 1);
    assert(approximateMonth(172) == 6);
    assert(approximateMonth(355) == 12);

    /* northern June: 0.75 x 1.1 */
    assert(near(locationWeatherFactor(172, 35.0), 0.825, 1.0e-12));
    /* southern June is winter: 0.75 x 0.8 */
    assert(near(locationWeatherFactor(172, -35.0), 0.6, 1.0e-12));
    /* day 366 maps to month 13 and takes the autumn multiplier: 0.65 x 0.9 */
    assert(approximateMonth(366) == 13);
    assert(seasonalWeatherMultiplier(12) == 0.8);
    assert(seasonalWeatherMultiplier(13) == 0.9);
    assert(near(locationWeatherFactor(365, 51.0), 0.52, 1.0e-12));
    assert(near(locationWeatherFactor(366, 51.0), 0.585, 1.0e-12));
    /* polar winter is clamped at 0.2 */
    assert(near(locationWeatherFactor(10, 70.0), 0.28, 1.0e-12));

    RecordingTrace trace;
    for (int d = 1; d <= 365; d += 7) {
        const double w = locationWeatherFactor(d, -80.0 + d * 0.4, &trace);
        assert(w >= 0.2 && w <= 1.0);
    }
    assert(trace.count(TRACE_DEBUG) > 0);
    std::cout << "[PASS] Weather factor by zone, season and hemisphere.\n";
}

void test_daily_curve() {
    const IrradianceCurve c = buildDailyCurve(172, 51.0);
    for (int h = 0; h < kHoursPerDay; h++) {
        assert(c[(size_t)h] >= 0.0 && c[(size_t)h] <= 1.0);
        if (solarPosition(h, 172, 51.0).elevationDeg == 0.0) {
            assert(c[(size_t)h] == 0.0);
        }
    }
    assert(c[0] == 0.0);
    assert(c[12] > c[8]);
    assert(curveSum(c) > 0.0);

    const IrradianceCurve polar_night = buildDailyCurve(355, 80.0);
    assert(curveSum(polar_night) == 0.0);
    std::cout << "[PASS] Daily curve is zero at night and bounded.\n";
}

void test_scaling() {
    const IrradianceCurve c = buildDailyCurve(80, 40.0);
    const IrradianceCurve s = scaleCurveToPeakSunHours(c, 5.0);
    assert(near(curveSum(s), 5.0, 1.0e-9));
    for (size_t i = 0; i < s.size(); i++) {
        assert(s[i] >= 0.0);
        if (c[i] == 0.0) {
            assert(s[i] == 0.0);
        }
    }

    IrradianceCurve dark;
    dark.fill(0.0);
    assert(curveSum(scaleCurveToPeakSunHours(dark, 5.0)) == 0.0);
    std::cout << "[PASS] Curve rescaled to the peak sun hours.\n";
}

void test_seasonal_ratio() {
    const double summer = seasonalIrradianceRatio(172, 51.0);
    const double winter = seasonalIrradianceRatio(355, 51.0);
    assert(winter < summer);
    /* solstice geometry ratio is 1, so only the weather factor remains */
    assert(near(summer, locationWeatherFactor(172, 51.0), 1.0e-12));
    for (int d = 1; d <= 365; d += 5) {
        const double r = seasonalIrradianceRatio(d, -45.0);
        assert(r >= 0.1 && r <= 1.5);
    }
    /* polar night still yields the lower bound */
    assert(seasonalIrradianceRatio(355, 80.0) == 0.1);
    std::cout << "[PASS] Seasonal irradiance ratio.\n";
}

int main() {
    std::cout << "=== Irradiance curve tests ===\n";
    test_climate_zones();
    test_weather_factor();
    test_daily_curve();
    test_scaling();
    test_seasonal_ratio();
    std::cout << "All tests passed.\n";
    return 0;
}
