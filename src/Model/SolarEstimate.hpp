//  SolarEstimate.hpp
//  SolarYield
//
//  Annual yield estimate of a balcony/railing array: input validation,
//  regulation, sunshine, efficiency, clipping, seasons and economics.
//
#ifndef SolarEstimate_hpp
#define SolarEstimate_hpp

#include "EfficiencyModel.hpp"
#include "EnergyIntegrator.hpp"
#include "PanelArray.hpp"
#include "RegulationResolver.hpp"
#include "SunshineProvider.hpp"

#include <string>

class SolarTrace;

/* Loss share above which clipping is reported as significant [%]. */
constexpr double kSignificantClippingPercent = 5.0;
constexpr int kSystemLifetimeYears = 20;
constexpr double kCo2KgPerKwh = 0.4;

struct EstimateInput {
    Location location;
    PanelArrayConfig array;
    OrientationParams orientation;
    double electricityPricePerKwh = 0.0;
    bool temperatureCorrection = false;
};

struct AnnualOutput {
    /* Location actually used; the default location when the input was unusable. */
    Location location;
    bool usedDefaultLocation = false;
    RegionalRegulation regulation;
    LocationInfo info;

    double peakSunHours = 0.0;          /* [h/day] */
    double annualSunshineHours = 0.0;
    bool usedMeasuredSunshine = false;
    double efficiency = 0.0;

    DailyProductionResult referenceDay;
    double dailyEnergyWh = 0.0;
    double annualEnergyKwh = 0.0;
    double unclippedEstimateKwh = 0.0;
    double energyLostToClippingKwh = 0.0;
    double clippingLossPercent = 0.0;
    double maxInstantaneousPowerW = 0.0;
    double hoursClippedPerDay = 0.0;
    bool isClippingSignificant = false;

    bool isCompliant = true;
    bool exceedsPanelLimit = false;
    bool exceedsInverterCapacity = false;

    SeasonalBreakdown seasonalBreakdown;
    /* Mean of the seasonal days x 365. Not used for annualEnergyKwh. */
    double seasonalEstimateKwh = 0.0;

    double annualSavings = 0.0;
    double lifetimeSavings = 0.0;
    double co2SavedKg = 0.0;
};

/*
 * Range checks of caller-supplied values. On failure field names the
 * offending input. A non-finite location is accepted (default-location
 * fallback); finite coordinates out of range are not.
 */
bool validateEstimateInput(const EstimateInput &in, std::string &field);

/*
 * ERRSUCCESS and a filled out, or ERRDATAIN for invalid input (reported on
 * stderr, out untouched). provider may be nullptr.
 */
int estimateAnnualOutput(const EstimateInput &in,
                         const SunshineProvider *provider,
                         SolarTrace *trace,
                         AnnualOutput &out);

/*
 * Hourly production of one calendar day, with the sunshine, efficiency and
 * cap of an existing estimate. ERRDATAIN when dayOfYear is outside [1, 366].
 */
int estimateDay(const EstimateInput &in,
                const AnnualOutput &annual,
                int dayOfYear,
                SolarTrace *trace,
                DailyProductionResult &out);

#endif /* SolarEstimate_hpp */
