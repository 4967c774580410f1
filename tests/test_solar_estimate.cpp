#undef NDEBUG
#include "PanelArray.hpp"
#include "SolarEstimate.hpp"
#include "SolarTrace.hpp"
#include "SunshineProvider.hpp"

#include <cassert>
#include <cmath>
#include <iostream>

static bool near(double a, double b, double tol)
{
    return std::fabs(a - b) <= tol;
}

static EstimateInput makeInput(double lat, double lon, int panels, double azimuth, double tilt)
{
    EstimateInput in;
    in.location.latitude = lat;
    in.location.longitude = lon;
    in.array = makePanelArray(panels, 400.0, 2.0);
    in.orientation.panelAzimuthDeg = azimuth;
    in.orientation.panelTiltDeg = tilt;
    in.electricityPricePerKwh = 0.32;
    return in;
}

void test_berlin_climate_estimate() {
    const EstimateInput in = makeInput(52.52, 13.40, 4, 180.0, 90.0);
    RecordingTrace trace;
    AnnualOutput out;
    assert(estimateAnnualOutput(in, nullptr, &trace, out) == ERRSUCCESS);

    assert(!out.usedDefaultLocation);
    assert(out.regulation.appliesCap);
    assert(!out.usedMeasuredSunshine);
    assert(trace.count(TRACE_NOTICE) == 1);
    assert(near(out.peakSunHours, 1100.0 / 365.0, 1.0e-12));
    assert(near(out.efficiency, tiltEfficiency(90.0, 52.52), 1.0e-12));

    const DailyProductionResult d = simulateDay(in.array.totalWattageW, out.peakSunHours, out.efficiency,
                                                out.regulation.maxInverterOutputW, 180.0, 90.0,
                                                kSummerSolsticeDay, 52.52);
    assert(out.annualEnergyKwh == d.totalEnergyWh * 365 / 1000.0);
    assert(out.dailyEnergyWh == d.totalEnergyWh);
    assert(out.maxInstantaneousPowerW == d.maxInstantaneousPowerW);
    assert(out.annualEnergyKwh > 0.0);

    assert(out.isCompliant && !out.exceedsPanelLimit && !out.exceedsInverterCapacity);
    assert(!out.isClippingSignificant);

    assert(near(out.annualSavings, out.annualEnergyKwh * 0.32, 1.0e-9));
    assert(near(out.lifetimeSavings, out.annualSavings * 20.0, 1.0e-9));
    assert(near(out.co2SavedKg, out.annualEnergyKwh * 0.4, 1.0e-9));

    double mean_daily = 0.0;
    for (size_t i = 0; i < out.seasonalBreakdown.size(); i++) {
        mean_daily += out.seasonalBreakdown[i].dailyEnergyKwh;
    }
    mean_daily /= 4.0;
    assert(near(out.seasonalEstimateKwh, mean_daily * 365.0, 1.0e-9));
    assert(out.seasonalBreakdown[0].seasonName == "Winter Solstice");
    std::cout << "[PASS] Berlin estimate from the climate-zone table.\n";
}

void test_measured_sunshine_with_clipping() {
    const EstimateInput in = makeInput(51.0, 10.0, 4, 180.0, 90.0);
    const FixedSunshineProvider sunny(6570.0);
    AnnualOutput out;
    assert(estimateAnnualOutput(in, &sunny, nullptr, out) == ERRSUCCESS);

    assert(out.usedMeasuredSunshine);
    assert(near(out.peakSunHours, 18.0, 1.0e-12));
    assert(out.maxInstantaneousPowerW > 800.0);
    assert(out.energyLostToClippingKwh > 0.0);
    assert(out.hoursClippedPerDay > 0.0);
    assert(out.clippingLossPercent > 5.0);
    assert(out.isClippingSignificant);
    assert(out.exceedsInverterCapacity && !out.exceedsPanelLimit && !out.isCompliant);
    assert(near(out.unclippedEstimateKwh, out.annualEnergyKwh + out.energyLostToClippingKwh, 1.0e-9));
    std::cout << "[PASS] Measured sunshine, clipping above 800 W.\n";
}

void test_panel_limit() {
    const EstimateInput in = makeInput(48.1, 11.6, 6, 180.0, 35.0);
    AnnualOutput out;
    assert(estimateAnnualOutput(in, nullptr, nullptr, out) == ERRSUCCESS);
    assert(out.exceedsPanelLimit);
    assert(!out.isCompliant);
    std::cout << "[PASS] 2400 W of panels exceeds the panel limit.\n";
}

void test_southern_hemisphere() {
    const EstimateInput in = makeInput(-33.9, 151.2, 8, 0.0, 34.0);
    AnnualOutput out;
    assert(estimateAnnualOutput(in, nullptr, nullptr, out) == ERRSUCCESS);
    assert(!out.regulation.appliesCap);
    assert(isNA(out.regulation.maxInverterOutputW));
    assert(out.info.hemisphere == SOUTHERN);
    assert(out.info.optimalAzimuthDeg == 0.0);
    assert(out.isCompliant);
    assert(out.energyLostToClippingKwh == 0.0);
    assert(out.seasonalBreakdown[0].seasonName == "Summer Solstice");
    assert(out.seasonalBreakdown[2].seasonName == "Winter Solstice");
    std::cout << "[PASS] Sydney: no cap, swapped season labels.\n";
}

void test_zero_panels() {
    const EstimateInput in = makeInput(51.0, 9.0, 0, 180.0, 90.0);
    AnnualOutput out;
    assert(estimateAnnualOutput(in, nullptr, nullptr, out) == ERRSUCCESS);
    assert(out.annualEnergyKwh == 0.0);
    assert(out.unclippedEstimateKwh == 0.0);
    assert(out.maxInstantaneousPowerW == 0.0);
    assert(out.isCompliant);
    assert(out.annualSavings == 0.0);
    assert(out.seasonalEstimateKwh == 0.0);
    std::cout << "[PASS] Zero panels is a valid, empty estimate.\n";
}

void test_default_location() {
    const EstimateInput in = makeInput(NAN, NAN, 4, 180.0, 90.0);
    RecordingTrace trace;
    AnnualOutput out;
    assert(estimateAnnualOutput(in, nullptr, &trace, out) == ERRSUCCESS);
    assert(out.usedDefaultLocation);
    assert(out.location.latitude == kDefaultLatitude);
    assert(out.location.longitude == kDefaultLongitude);
    assert(out.regulation.appliesCap);
    assert(trace.count(TRACE_WARNING) == 1);
    assert(out.annualEnergyKwh > 0.0);
    std::cout << "[PASS] Unusable location falls back to the default.\n";
}

void test_validation() {
    std::string field;
    assert(validateEstimateInput(makeInput(51.0, 9.0, 4, 180.0, 90.0), field));

    EstimateInput tilt = makeInput(51.0, 9.0, 4, 180.0, 95.0);
    assert(!validateEstimateInput(tilt, field) && field == "panelTiltDeg");
    AnnualOutput out;
    out.annualEnergyKwh = 42.0;
    assert(estimateAnnualOutput(tilt, nullptr, nullptr, out) == ERRDATAIN);
    assert(out.annualEnergyKwh == 42.0);

    assert(!validateEstimateInput(makeInput(95.0, 9.0, 4, 180.0, 90.0), field) && field == "latitude");
    assert(!validateEstimateInput(makeInput(51.0, 200.0, 4, 180.0, 90.0), field) && field == "longitude");
    assert(!validateEstimateInput(makeInput(51.0, 9.0, 4, 360.0, 90.0), field) && field == "panelAzimuthDeg");
    assert(!validateEstimateInput(makeInput(51.0, 9.0, 4, -1.0, 90.0), field) && field == "panelAzimuthDeg");

    EstimateInput negative = makeInput(51.0, 9.0, 4, 180.0, 90.0);
    negative.array.totalWattageW = -400.0;
    assert(!validateEstimateInput(negative, field) && field == "totalWattageW");

    EstimateInput mismatch = makeInput(51.0, 9.0, 4, 180.0, 90.0);
    mismatch.array.totalWattageW = 1000.0;
    assert(!validateEstimateInput(mismatch, field) && field == "totalWattageW");

    EstimateInput count = makeInput(51.0, 9.0, 4, 180.0, 90.0);
    count.array.panelCount = -1;
    assert(!validateEstimateInput(count, field) && field == "panelCount");

    EstimateInput price = makeInput(51.0, 9.0, 4, 180.0, 90.0);
    price.electricityPricePerKwh = -0.1;
    assert(!validateEstimateInput(price, field) && field == "electricityPricePerKwh");
    std::cout << "[PASS] Invalid input rejected by field name.\n";
}

void test_detail_day() {
    EstimateInput in = makeInput(51.0, 10.0, 4, 180.0, 90.0);
    in.temperatureCorrection = true;
    AnnualOutput out;
    assert(estimateAnnualOutput(in, nullptr, nullptr, out) == ERRSUCCESS);
    assert(near(out.efficiency, 0.82 * 0.95, 1.0e-12));

    DailyProductionResult summer;
    DailyProductionResult winter;
    assert(estimateDay(in, out, 173, nullptr, summer) == ERRSUCCESS);
    assert(estimateDay(in, out, 356, nullptr, winter) == ERRSUCCESS);
    assert(summer.dayOfYear == 173);
    assert(summer.totalEnergyWh > winter.totalEnergyWh);
    assert(winter.totalEnergyWh > 0.0);

    DailyProductionResult bad;
    assert(estimateDay(in, out, 0, nullptr, bad) == ERRDATAIN);
    assert(estimateDay(in, out, 367, nullptr, bad) == ERRDATAIN);
    std::cout << "[PASS] Detail day production.\n";
}

int main() {
    std::cout << "=== Solar estimate tests ===\n";
    test_berlin_climate_estimate();
    test_measured_sunshine_with_clipping();
    test_panel_limit();
    test_southern_hemisphere();
    test_zero_panels();
    test_default_location();
    test_validation();
    test_detail_day();
    std::cout << "All tests passed.\n";
    return 0;
}
