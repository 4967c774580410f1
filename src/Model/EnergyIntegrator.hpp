//  EnergyIntegrator.hpp
//  SolarYield
//
//  Hourly power of a fixed array, inverter clipping and integration to
//  daily, annual and seasonal energy.
//
#ifndef EnergyIntegrator_hpp
#define EnergyIntegrator_hpp

#include "IrradianceCurve.hpp"
#include "Macros.hpp"

#include <array>
#include <string>

class SolarTrace;

/* Scaled irradiance below this is treated as darkness. */
constexpr double kMinSignificantIrradiance = 0.001;

struct HourlyProductionSample {
    int hour;
    double instantaneousPowerW;   /* DC x efficiency, before the inverter */
    double clippedPowerW;         /* delivered after the inverter cap */
    double clippingLossW;
};

struct DailyProductionResult {
    int dayOfYear;
    double totalEnergyWh;
    double energyLostToClippingWh;
    double maxInstantaneousPowerW;    /* pre-clip peak */
    double fractionalHoursClipped;    /* sum of lost / instantaneous per clipped hour */
    std::array<HourlyProductionSample, kHoursPerDay> hours;
};

struct AnnualEnergyEstimate {
    DailyProductionResult referenceDay;
    double annualEnergyKwh;
    double energyLostToClippingKwh;
    double unclippedEstimateKwh;
    double clippingLossPercent;
};

struct SeasonalSample {
    std::string seasonName;
    std::string monthName;
    int referenceDayOfYear;
    double dailyEnergyKwh;
    double monthlyEnergyKwh;      /* daily x 30 */
    double clippingLossPercent;
    double peakSunHours;
    double hoursClipped;
    double seasonalFactor;
};

typedef std::array<SeasonalSample, 4> SeasonalBreakdown;

/*
 * One day at hourly resolution. maxInverterOutputW == NA_VALUE means no
 * inverter cap. The irradiance curve is rescaled so it sums to peakSunHours.
 */
DailyProductionResult simulateDay(double dcCapacityW,
                                  double peakSunHours,
                                  double efficiency,
                                  double maxInverterOutputW,
                                  double panelAzimuth_deg,
                                  double panelTilt_deg,
                                  int dayOfYear,
                                  double lat_deg,
                                  SolarTrace *trace = nullptr);

/*
 * Annual figures from the summer-solstice reference day times 365.
 * annualEnergyKwh == simulateDay(..., kSummerSolsticeDay, ...).totalEnergyWh * 365 / 1000.
 */
AnnualEnergyEstimate simulateYear(double dcCapacityW,
                                  double peakSunHours,
                                  double efficiency,
                                  double maxInverterOutputW,
                                  double panelAzimuth_deg,
                                  double panelTilt_deg,
                                  double lat_deg,
                                  SolarTrace *trace = nullptr);

/*
 * Solstice/equinox days with hemisphere-aware labels. Each day runs with
 * annualPeakSunHours x seasonalIrradianceRatio(day). With
 * temperatureCorrection the efficiency is derated per day.
 */
SeasonalBreakdown seasonalBreakdown(double dcCapacityW,
                                    double annualPeakSunHours,
                                    double efficiency,
                                    double maxInverterOutputW,
                                    double panelAzimuth_deg,
                                    double panelTilt_deg,
                                    double lat_deg,
                                    bool temperatureCorrection,
                                    SolarTrace *trace = nullptr);

double clippingLossPercent(double deliveredWh, double lostWh);

#endif /* EnergyIntegrator_hpp */
