#include "EnergyIntegrator.hpp"

#include "CalendarDay.hpp"
#include "EfficiencyModel.hpp"
#include "PanelOrientation.hpp"
#include "RegulationResolver.hpp"
#include "SolarGeometry.hpp"
#include "SolarTrace.hpp"

#include <cmath>

namespace {

struct SeasonDay {
    const char *name;
    int day;
};

const SeasonDay kNorthernSeasons[4] = {
    {"Winter Solstice", 355},
    {"Spring Equinox", 80},
    {"Summer Solstice", 172},
    {"Fall Equinox", 266}
};

const SeasonDay kSouthernSeasons[4] = {
    {"Summer Solstice", 355},
    {"Fall Equinox", 80},
    {"Winter Solstice", 172},
    {"Spring Equinox", 266}
};

} // namespace

double clippingLossPercent(double deliveredWh, double lostWh)
{
    const double potential = deliveredWh + lostWh;
    if (!(potential > 0.0) || !(lostWh > 0.0)) {
        return 0.0;
    }
    return lostWh / potential * 100.0;
}

DailyProductionResult simulateDay(double dcCapacityW,
                                  double peakSunHours,
                                  double efficiency,
                                  double maxInverterOutputW,
                                  double panelAzimuth_deg,
                                  double panelTilt_deg,
                                  int dayOfYear,
                                  double lat_deg,
                                  SolarTrace *trace)
{
    DailyProductionResult r;
    r.dayOfYear = dayOfYear;
    r.totalEnergyWh = 0.0;
    r.energyLostToClippingWh = 0.0;
    r.maxInstantaneousPowerW = 0.0;
    r.fractionalHoursClipped = 0.0;

    const bool capped = !isNA(maxInverterOutputW);
    const IrradianceCurve curve = scaleCurveToPeakSunHours(buildDailyCurve(dayOfYear, lat_deg, trace),
                                                           peakSunHours);

    for (int h = 0; h < kHoursPerDay; h++) {
        HourlyProductionSample &s = r.hours[(size_t)h];
        s.hour = h;
        s.instantaneousPowerW = 0.0;
        s.clippedPowerW = 0.0;
        s.clippingLossW = 0.0;

        const double base = curve[(size_t)h];
        if (!(base > kMinSignificantIrradiance)) {
            continue;
        }

        const SunPosition sp = solarPosition(h, dayOfYear, lat_deg);
        const double factor = orientationFactor(sp.elevationDeg, sp.azimuthDeg, panelTilt_deg, panelAzimuth_deg);
        const double power = dcCapacityW * efficiency * base * factor;

        s.instantaneousPowerW = power;
        if (power > r.maxInstantaneousPowerW) {
            r.maxInstantaneousPowerW = power;
        }

        double delivered = power;
        if (capped && power > maxInverterOutputW && power > 0.0) {
            delivered = maxInverterOutputW;
            s.clippingLossW = power - maxInverterOutputW;
            r.energyLostToClippingWh += s.clippingLossW;
            r.fractionalHoursClipped += s.clippingLossW / power;
        }
        s.clippedPowerW = delivered;

        /* one sample = one hour, so W sums to Wh */
        r.totalEnergyWh += delivered;
    }

    tracef(trace, TRACE_DEBUG,
           "day %d: energy %.1f Wh, clipped %.1f Wh, peak %.1f W, hours clipped %.3f",
           dayOfYear, r.totalEnergyWh, r.energyLostToClippingWh, r.maxInstantaneousPowerW,
           r.fractionalHoursClipped);
    return r;
}

AnnualEnergyEstimate simulateYear(double dcCapacityW,
                                  double peakSunHours,
                                  double efficiency,
                                  double maxInverterOutputW,
                                  double panelAzimuth_deg,
                                  double panelTilt_deg,
                                  double lat_deg,
                                  SolarTrace *trace)
{
    AnnualEnergyEstimate y;
    y.referenceDay = simulateDay(dcCapacityW, peakSunHours, efficiency, maxInverterOutputW,
                                 panelAzimuth_deg, panelTilt_deg, kSummerSolsticeDay, lat_deg, trace);

    y.annualEnergyKwh = y.referenceDay.totalEnergyWh * kDaysPerYear / 1000.0;
    y.energyLostToClippingKwh = y.referenceDay.energyLostToClippingWh * kDaysPerYear / 1000.0;
    y.unclippedEstimateKwh = y.annualEnergyKwh + y.energyLostToClippingKwh;
    y.clippingLossPercent = clippingLossPercent(y.annualEnergyKwh, y.energyLostToClippingKwh);
    return y;
}

SeasonalBreakdown seasonalBreakdown(double dcCapacityW,
                                    double annualPeakSunHours,
                                    double efficiency,
                                    double maxInverterOutputW,
                                    double panelAzimuth_deg,
                                    double panelTilt_deg,
                                    double lat_deg,
                                    bool temperatureCorrection,
                                    SolarTrace *trace)
{
    const LocationInfo info = locationInfo(lat_deg);
    const SeasonDay *seasons = (info.hemisphere == NORTHERN) ? kNorthernSeasons : kSouthernSeasons;

    SeasonalBreakdown out;
    for (size_t i = 0; i < out.size(); i++) {
        const SeasonDay &sd = seasons[i];
        const double ratio = seasonalIrradianceRatio(sd.day, lat_deg, trace);
        const double psh = annualPeakSunHours * ratio;
        double eff = efficiency;
        if (temperatureCorrection) {
            eff *= temperatureEfficiency(sd.day);
        }

        const DailyProductionResult d = simulateDay(dcCapacityW, psh, eff, maxInverterOutputW,
                                                    panelAzimuth_deg, panelTilt_deg, sd.day, lat_deg, trace);

        SeasonalSample &s = out[i];
        s.seasonName = sd.name;
        s.monthName = CalendarDay::monthName(sd.day);
        s.referenceDayOfYear = sd.day;
        s.dailyEnergyKwh = d.totalEnergyWh / 1000.0;
        s.monthlyEnergyKwh = d.totalEnergyWh * 30.0 / 1000.0;
        s.clippingLossPercent = clippingLossPercent(d.totalEnergyWh, d.energyLostToClippingWh);
        s.peakSunHours = psh;
        s.hoursClipped = d.fractionalHoursClipped;
        s.seasonalFactor = ratio;
    }
    return out;
}
