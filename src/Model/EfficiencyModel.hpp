//  EfficiencyModel.hpp
//  SolarYield
//
//  Static orientation efficiency of the array and the regulatory
//  compliance flags derived from it.
//
#ifndef EfficiencyModel_hpp
#define EfficiencyModel_hpp

#include "RegulationResolver.hpp"

class SolarTrace;

/* Lower bound of panelEfficiency(). */
constexpr double kMinPanelEfficiency = 0.3;

/* Smallest angle between two azimuths [deg], in [0, 180]. */
double angularDifference(double a_deg, double b_deg);

double azimuthEfficiency(double panelAzimuth_deg, double optimalAzimuth_deg);

/*
 * Piecewise-linear tilt term: 0.85 at 0 deg rising to 1.0 at the optimum,
 * falling to 0.85 at optimum+30, then by 0.10 per further 30 deg.
 */
double tiltEfficiency(double panelTilt_deg, double optimalTilt_deg);

/* azimuthEfficiency x tiltEfficiency, floored at kMinPanelEfficiency. */
double panelEfficiency(double panelAzimuth_deg,
                       double panelTilt_deg,
                       double optimalAzimuth_deg,
                       double optimalTilt_deg,
                       SolarTrace *trace = nullptr);

/* Seasonal module temperature derating, [0.95, 1.02]; lowest near day 172. */
double temperatureEfficiency(int dayOfYear);

struct ComplianceFlags {
    bool exceedsPanelLimit;
    bool exceedsInverterCapacity;
    bool isCompliant;
};

/*
 * exceedsInverterCapacity compares the pre-clip peak; both flags are only
 * raised when the regulation applies a cap.
 */
ComplianceFlags checkCompliance(double totalWattageW,
                                double maxInstantaneousPowerW,
                                const RegionalRegulation &reg);

#endif /* EfficiencyModel_hpp */
