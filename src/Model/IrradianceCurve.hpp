//  IrradianceCurve.hpp
//  SolarYield
//
//  Hour-of-day irradiance profile combining sun geometry, the clear-sky
//  atmosphere proxy and a climate/season weather correction.
//
#ifndef IrradianceCurve_hpp
#define IrradianceCurve_hpp

#include "Macros.hpp"

#include <array>

class SolarTrace;

/* Index = local solar hour 0..23; values are fractions of clear-sky peak. */
typedef std::array<double, kHoursPerDay> IrradianceCurve;

enum ClimateZone {
    CLIMATE_POLAR = 0,        /* |lat| >= 60 */
    CLIMATE_TEMPERATE = 1,    /* |lat| >= 45 */
    CLIMATE_SUBTROPICAL = 2,  /* |lat| >= 23.5 */
    CLIMATE_TROPICAL = 3
};

static inline const char *ClimateZoneName(ClimateZone z)
{
    switch (z) {
        case CLIMATE_POLAR:       return "POLAR";
        case CLIMATE_TEMPERATE:   return "TEMPERATE";
        case CLIMATE_SUBTROPICAL: return "SUBTROPICAL";
        case CLIMATE_TROPICAL:    return "TROPICAL";
        default:                  return "UNKNOWN";
    }
}

/* Reference day of the year used for normalisation and the annual figure. */
constexpr int kSummerSolsticeDay = 172;

ClimateZone climateZone(double lat_deg);

/* Typical annual irradiance [kWh/m2/yr] per climate zone (fallback table). */
double climateZoneAnnualIrradiance(ClimateZone zone);

double climateZoneWeatherFactor(ClimateZone zone);

/* Approximate calendar month 1..12 of a (hemisphere-adjusted) day of year; 13 for day 366. */
int approximateMonth(double dayOfYear);

/* Winter is months 1, 2 and 12 only; month 13 falls through to autumn. */
double seasonalWeatherMultiplier(int month);

/*
 * Cloudiness correction in [0.2, 1.0]. Southern-hemisphere days are shifted
 * by half a year before the month lookup.
 */
double locationWeatherFactor(int dayOfYear, double lat_deg, SolarTrace *trace = nullptr);

/* Intra-day realism term 0.9 + 0.2 sin(h pi / 12). */
double intraDayVariation(int hour);

IrradianceCurve buildDailyCurve(int dayOfYear, double lat_deg, SolarTrace *trace = nullptr);

double curveSum(const IrradianceCurve &curve);

/*
 * Rescales the shape-only curve so its sum equals peakSunHours.
 * Returns all zeros when the curve is empty.
 */
IrradianceCurve scaleCurveToPeakSunHours(const IrradianceCurve &curve, double peakSunHours);

/* Sum of hourly clear-sky attenuation over the day (no weather, no variation). */
double dailyClearSkyIrradiance(int dayOfYear, double lat_deg);

/*
 * Day total relative to the summer-solstice reference, times the weather
 * factor of that day; clamped to [0.1, 1.5].
 */
double seasonalIrradianceRatio(int dayOfYear, double lat_deg, SolarTrace *trace = nullptr);

#endif /* IrradianceCurve_hpp */
