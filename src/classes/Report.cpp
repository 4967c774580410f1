#include "Report.hpp"

namespace {

const char *yesNo(bool b)
{
    return b ? "yes" : "no";
}

void printCap(FILE *fp, const char *label, double w)
{
    if (isNA(w)) {
        fprintf(fp, "  %-28s none\n", label);
    } else {
        fprintf(fp, "  %-28s %.0f W\n", label, w);
    }
}

} // namespace

void printEstimateReport(FILE *fp, const EstimateInput &in, const AnnualOutput &out)
{
    fprintf(fp, "\n==================== Solar yield estimate ====================\n");

    fprintf(fp, "Location\n");
    fprintf(fp, "  %-28s %.4f, %.4f%s\n", "Latitude, longitude:",
            out.location.latitude, out.location.longitude,
            out.usedDefaultLocation ? " (default)" : "");
    fprintf(fp, "  %-28s %s\n", "Hemisphere:", HemisphereName(out.info.hemisphere));
    fprintf(fp, "  %-28s %s\n", "Region:", out.regulation.regionName.c_str());
    printCap(fp, "Inverter cap:", out.regulation.maxInverterOutputW);
    printCap(fp, "Panel capacity cap:", out.regulation.maxPanelCapacityW);

    fprintf(fp, "Array\n");
    fprintf(fp, "  %-28s %d x %.0f W = %.0f W\n", "Panels:",
            in.array.panelCount, in.array.perPanelWattageW, in.array.totalWattageW);
    fprintf(fp, "  %-28s %.2f m2\n", "Area:", in.array.totalAreaM2);
    if (in.array.constrainedByWattage) {
        fprintf(fp, "  %-28s system wattage ceiling\n", "Limited by:");
    } else if (in.array.constrainedByLength) {
        fprintf(fp, "  %-28s line length\n", "Limited by:");
    }
    fprintf(fp, "  %-28s %.1f deg (%s)\n", "Facing:",
            in.orientation.panelAzimuthDeg, azimuthDirectionName(in.orientation.panelAzimuthDeg));
    fprintf(fp, "  %-28s %.1f deg\n", "Tilt:", in.orientation.panelTiltDeg);
    fprintf(fp, "  %-28s %.1f deg / %.1f deg\n", "Optimal facing / tilt:",
            out.info.optimalAzimuthDeg, out.info.optimalTiltDeg);
    fprintf(fp, "  %-28s %.1f %%\n", "Orientation efficiency:", out.efficiency * 100.0);

    fprintf(fp, "Annual production\n");
    fprintf(fp, "  %-28s %.2f h/day (%s)\n", "Peak sun hours:", out.peakSunHours,
            out.usedMeasuredSunshine ? "measured" : "climate-zone estimate");
    fprintf(fp, "  %-28s %.1f Wh\n", "Reference day energy:", out.dailyEnergyWh);
    fprintf(fp, "  %-28s %.1f kWh\n", "Annual energy:", out.annualEnergyKwh);
    fprintf(fp, "  %-28s %.1f kWh\n", "Without inverter cap:", out.unclippedEstimateKwh);
    fprintf(fp, "  %-28s %.1f kWh (%.1f %%%s)\n", "Lost to clipping:",
            out.energyLostToClippingKwh, out.clippingLossPercent,
            out.isClippingSignificant ? ", significant" : "");
    fprintf(fp, "  %-28s %.0f W\n", "Peak DC power:", out.maxInstantaneousPowerW);
    fprintf(fp, "  %-28s %.2f\n", "Hours clipped per day:", out.hoursClippedPerDay);
    fprintf(fp, "  %-28s %.1f kWh\n", "Seasonal-day estimate:", out.seasonalEstimateKwh);

    fprintf(fp, "Compliance\n");
    fprintf(fp, "  %-28s %s\n", "Compliant:", yesNo(out.isCompliant));
    fprintf(fp, "  %-28s %s\n", "Exceeds panel limit:", yesNo(out.exceedsPanelLimit));
    fprintf(fp, "  %-28s %s\n", "Exceeds inverter capacity:", yesNo(out.exceedsInverterCapacity));

    fprintf(fp, "Seasons\n");
    fprintf(fp, "  %-16s %-10s %4s %8s %10s %8s %6s %7s\n",
            "Season", "Month", "Day", "kWh/day", "kWh/month", "Clip %", "PSH", "Factor");
    for (size_t i = 0; i < out.seasonalBreakdown.size(); i++) {
        const SeasonalSample &s = out.seasonalBreakdown[i];
        fprintf(fp, "  %-16s %-10s %4d %8.2f %10.1f %8.1f %6.2f %7.2f\n",
                s.seasonName.c_str(), s.monthName.c_str(), s.referenceDayOfYear,
                s.dailyEnergyKwh, s.monthlyEnergyKwh, s.clippingLossPercent,
                s.peakSunHours, s.seasonalFactor);
    }

    fprintf(fp, "Economics\n");
    fprintf(fp, "  %-28s %.2f per year\n", "Savings:", out.annualSavings);
    fprintf(fp, "  %-28s %.2f over %d years\n", "Lifetime savings:", out.lifetimeSavings, kSystemLifetimeYears);
    fprintf(fp, "  %-28s %.0f kg per year\n", "CO2 avoided:", out.co2SavedKg);
    fprintf(fp, "==============================================================\n");
}

void printDailyTable(FILE *fp, const DailyProductionResult &day, const char *label)
{
    fprintf(fp, "\nHourly production, %s (day %d)\n", label, day.dayOfYear);
    fprintf(fp, "  %4s %12s %12s %12s\n", "Hour", "DC [W]", "AC [W]", "Clipped [W]");
    for (size_t h = 0; h < day.hours.size(); h++) {
        const HourlyProductionSample &s = day.hours[h];
        fprintf(fp, "  %4d %12.1f %12.1f %12.1f\n",
                s.hour, s.instantaneousPowerW, s.clippedPowerW, s.clippingLossW);
    }
    fprintf(fp, "  %-4s %12s %12.1f %12.1f  Wh\n", "Sum", "", day.totalEnergyWh, day.energyLostToClippingWh);
}
