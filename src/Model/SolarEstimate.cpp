#include "SolarEstimate.hpp"

#include "IrradianceCurve.hpp"
#include "SolarTrace.hpp"

#include <cmath>
#include <cstdio>

namespace {

bool isNonNegative(double x)
{
    return std::isfinite(x) && x >= 0.0;
}

} // namespace

bool validateEstimateInput(const EstimateInput &in, std::string &field)
{
    const PanelArrayConfig &a = in.array;
    if (a.panelCount < 0) {
        field = "panelCount";
        return false;
    }
    if (!isNonNegative(a.totalWattageW)) {
        field = "totalWattageW";
        return false;
    }
    if (!isNonNegative(a.totalAreaM2)) {
        field = "totalAreaM2";
        return false;
    }
    if (!isNonNegative(a.perPanelWattageW)) {
        field = "perPanelWattageW";
        return false;
    }
    if (a.perPanelWattageW > 0.0 &&
        std::fabs(a.totalWattageW - a.panelCount * a.perPanelWattageW) > 1.0e-6 * (1.0 + a.totalWattageW)) {
        field = "totalWattageW";
        return false;
    }

    const double az = in.orientation.panelAzimuthDeg;
    if (!std::isfinite(az) || az < 0.0 || az >= 360.0) {
        field = "panelAzimuthDeg";
        return false;
    }
    const double tilt = in.orientation.panelTiltDeg;
    if (!std::isfinite(tilt) || tilt < 0.0 || tilt > 90.0) {
        field = "panelTiltDeg";
        return false;
    }

    const double lat = in.location.latitude;
    const double lon = in.location.longitude;
    if (!isNA(lat) && (lat < -90.0 || lat > 90.0)) {
        field = "latitude";
        return false;
    }
    if (!isNA(lon) && (lon < -180.0 || lon > 180.0)) {
        field = "longitude";
        return false;
    }

    if (!isNonNegative(in.electricityPricePerKwh)) {
        field = "electricityPricePerKwh";
        return false;
    }
    return true;
}

int estimateAnnualOutput(const EstimateInput &in,
                         const SunshineProvider *provider,
                         SolarTrace *trace,
                         AnnualOutput &out)
{
    std::string field;
    if (!validateEstimateInput(in, field)) {
        fprintf(stderr, "ERROR: invalid %s in estimate input.\n", field.c_str());
        return ERRDATAIN;
    }

    AnnualOutput r;
    r.regulation = resolveRegulation(in.location, trace);
    r.location = in.location;
    if (!isLocationUsable(in.location)) {
        r.location.latitude = kDefaultLatitude;
        r.location.longitude = kDefaultLongitude;
        r.usedDefaultLocation = true;
    }
    const double lat = r.location.latitude;
    r.info = locationInfo(lat);

    const PeakSunHours psh = resolvePeakSunHours(provider, lat, r.location.longitude, trace);
    r.peakSunHours = psh.hoursPerDay;
    r.annualSunshineHours = psh.annualHours;
    r.usedMeasuredSunshine = psh.measured;

    const double az = in.orientation.panelAzimuthDeg;
    const double tilt = in.orientation.panelTiltDeg;
    r.efficiency = panelEfficiency(az, tilt, r.info.optimalAzimuthDeg, r.info.optimalTiltDeg, trace);
    if (in.temperatureCorrection) {
        r.efficiency *= temperatureEfficiency(kSummerSolsticeDay);
    }

    const double dc = in.array.totalWattageW;
    const double cap = r.regulation.appliesCap ? r.regulation.maxInverterOutputW : (double)NA_VALUE;

    const AnnualEnergyEstimate year = simulateYear(dc, r.peakSunHours, r.efficiency, cap, az, tilt, lat, trace);
    r.referenceDay = year.referenceDay;
    r.dailyEnergyWh = year.referenceDay.totalEnergyWh;
    r.annualEnergyKwh = year.annualEnergyKwh;
    r.energyLostToClippingKwh = year.energyLostToClippingKwh;
    r.unclippedEstimateKwh = year.unclippedEstimateKwh;
    r.clippingLossPercent = year.clippingLossPercent;
    r.maxInstantaneousPowerW = year.referenceDay.maxInstantaneousPowerW;
    r.hoursClippedPerDay = year.referenceDay.fractionalHoursClipped;
    r.isClippingSignificant = r.clippingLossPercent > kSignificantClippingPercent;

    const ComplianceFlags flags = checkCompliance(dc, r.maxInstantaneousPowerW, r.regulation);
    r.exceedsPanelLimit = flags.exceedsPanelLimit;
    r.exceedsInverterCapacity = flags.exceedsInverterCapacity;
    r.isCompliant = flags.isCompliant;

    r.seasonalBreakdown = seasonalBreakdown(dc, r.peakSunHours, panelEfficiency(az, tilt, r.info.optimalAzimuthDeg,
                                                                                 r.info.optimalTiltDeg),
                                            cap, az, tilt, lat, in.temperatureCorrection, trace);
    double seasonal_daily = 0.0;
    for (size_t i = 0; i < r.seasonalBreakdown.size(); i++) {
        seasonal_daily += r.seasonalBreakdown[i].dailyEnergyKwh;
    }
    r.seasonalEstimateKwh = seasonal_daily / r.seasonalBreakdown.size() * kDaysPerYear;

    r.annualSavings = r.annualEnergyKwh * in.electricityPricePerKwh;
    r.lifetimeSavings = r.annualSavings * kSystemLifetimeYears;
    r.co2SavedKg = r.annualEnergyKwh * kCo2KgPerKwh;

    tracef(trace, TRACE_DEBUG,
           "annual: %.1f kWh (unclipped %.1f kWh, clipping %.1f %%), seasonal estimate %.1f kWh",
           r.annualEnergyKwh, r.unclippedEstimateKwh, r.clippingLossPercent, r.seasonalEstimateKwh);

    out = r;
    return ERRSUCCESS;
}

int estimateDay(const EstimateInput &in,
                const AnnualOutput &annual,
                int dayOfYear,
                SolarTrace *trace,
                DailyProductionResult &out)
{
    if (dayOfYear < 1 || dayOfYear > 366) {
        fprintf(stderr, "ERROR: invalid dayOfYear %d; must be in [1, 366].\n", dayOfYear);
        return ERRDATAIN;
    }
    const double lat = annual.location.latitude;
    const double psh = annual.peakSunHours * seasonalIrradianceRatio(dayOfYear, lat, trace);
    double eff = panelEfficiency(in.orientation.panelAzimuthDeg, in.orientation.panelTiltDeg,
                                 annual.info.optimalAzimuthDeg, annual.info.optimalTiltDeg);
    if (in.temperatureCorrection) {
        eff *= temperatureEfficiency(dayOfYear);
    }
    const double cap = annual.regulation.appliesCap ? annual.regulation.maxInverterOutputW : (double)NA_VALUE;
    out = simulateDay(in.array.totalWattageW, psh, eff, cap,
                      in.orientation.panelAzimuthDeg, in.orientation.panelTiltDeg,
                      dayOfYear, lat, trace);
    return ERRSUCCESS;
}
