#include "IrradianceCurve.hpp"

#include "AtmosphericModel.hpp"
#include "SolarGeometry.hpp"
#include "SolarTrace.hpp"

#include <algorithm>
#include <cmath>

ClimateZone climateZone(double lat_deg)
{
    const double a = std::fabs(lat_deg);
    if (a >= 60.0) {
        return CLIMATE_POLAR;
    }
    if (a >= 45.0) {
        return CLIMATE_TEMPERATE;
    }
    if (a >= 23.5) {
        return CLIMATE_SUBTROPICAL;
    }
    return CLIMATE_TROPICAL;
}

double climateZoneAnnualIrradiance(ClimateZone zone)
{
    switch (zone) {
        case CLIMATE_POLAR:       return 800.0;
        case CLIMATE_TEMPERATE:   return 1100.0;
        case CLIMATE_SUBTROPICAL: return 1400.0;
        case CLIMATE_TROPICAL:    return 1600.0;
        default:                  return 1100.0;
    }
}

double climateZoneWeatherFactor(ClimateZone zone)
{
    switch (zone) {
        case CLIMATE_POLAR:       return 0.35;
        case CLIMATE_TEMPERATE:   return 0.65;
        case CLIMATE_SUBTROPICAL: return 0.75;
        case CLIMATE_TROPICAL:    return 0.60;   /* humid, frequent clouds */
        default:                  return 0.65;
    }
}

int approximateMonth(double dayOfYear)
{
    return (int)std::floor((dayOfYear - 1.0) / 30.4) + 1;
}

double seasonalWeatherMultiplier(int month)
{
    if (month <= 2 || month == 12) {
        return 0.8;     /* winter */
    }
    if (month <= 5) {
        return 0.95;    /* spring */
    }
    if (month <= 8) {
        return 1.1;     /* summer */
    }
    return 0.9;         /* autumn */
}

double locationWeatherFactor(int dayOfYear, double lat_deg, SolarTrace *trace)
{
    double adjusted_day = (double)dayOfYear;
    if (lat_deg < 0.0) {
        adjusted_day = std::fmod(adjusted_day + 182.5, 365.0);
    }
    const ClimateZone zone = climateZone(lat_deg);
    const int month = approximateMonth(adjusted_day);
    const double base = climateZoneWeatherFactor(zone);
    const double seasonal = seasonalWeatherMultiplier(month);
    const double factor = clampValue(base * seasonal, 0.2, 1.0);

    tracef(trace, TRACE_DEBUG, "weather factor: day %d lat %.3f zone %s month %d -> %.3f",
           dayOfYear, lat_deg, ClimateZoneName(zone), month, factor);
    return factor;
}

double intraDayVariation(int hour)
{
    return 0.9 + 0.2 * std::sin(((double)hour * kPi) / 12.0);
}

IrradianceCurve buildDailyCurve(int dayOfYear, double lat_deg, SolarTrace *trace)
{
    IrradianceCurve curve;
    curve.fill(0.0);
    const double weather = locationWeatherFactor(dayOfYear, lat_deg, trace);

    for (int h = 0; h < kHoursPerDay; h++) {
        const SunPosition sp = solarPosition(h, dayOfYear, lat_deg);
        if (!(sp.elevationDeg > 0.0)) {
            continue;
        }
        double v = atmosphericAttenuation(sp.elevationDeg);
        v *= weather;
        v *= intraDayVariation(h);
        curve[(size_t)h] = clampValue(v, 0.0, 1.0);
    }
    return curve;
}

double curveSum(const IrradianceCurve &curve)
{
    double s = 0.0;
    for (double v : curve) {
        s += v;
    }
    return s;
}

IrradianceCurve scaleCurveToPeakSunHours(const IrradianceCurve &curve, double peakSunHours)
{
    IrradianceCurve out;
    out.fill(0.0);
    const double total = curveSum(curve);
    if (!(total > 0.0) || !std::isfinite(peakSunHours)) {
        return out;
    }
    const double k = peakSunHours / total;
    for (size_t i = 0; i < curve.size(); i++) {
        out[i] = std::max(0.0, curve[i] * k);
    }
    return out;
}

double dailyClearSkyIrradiance(int dayOfYear, double lat_deg)
{
    double total = 0.0;
    for (int h = 0; h < kHoursPerDay; h++) {
        const SunPosition sp = solarPosition(h, dayOfYear, lat_deg);
        if (sp.elevationDeg > 0.0) {
            total += atmosphericAttenuation(sp.elevationDeg);
        }
    }
    return total;
}

double seasonalIrradianceRatio(int dayOfYear, double lat_deg, SolarTrace *trace)
{
    const double day_total = dailyClearSkyIrradiance(dayOfYear, lat_deg);
    const double ref_total = dailyClearSkyIrradiance(kSummerSolsticeDay, lat_deg);
    const double geometric = day_total / std::max(ref_total, 0.1);
    const double weather = locationWeatherFactor(dayOfYear, lat_deg, trace);
    return clampValue(geometric * weather, 0.1, 1.5);
}
