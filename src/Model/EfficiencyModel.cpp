#include "EfficiencyModel.hpp"

#include "SolarTrace.hpp"

#include <cmath>

double angularDifference(double a_deg, double b_deg)
{
    double d = std::fmod(std::fabs(a_deg - b_deg), 360.0);
    if (d > 180.0) {
        d = 360.0 - d;
    }
    return d;
}

double azimuthEfficiency(double panelAzimuth_deg, double optimalAzimuth_deg)
{
    const double diff = angularDifference(panelAzimuth_deg, optimalAzimuth_deg);
    return 0.7 + 0.3 * std::cos(diff * kDeg2Rad);
}

double tiltEfficiency(double panelTilt_deg, double optimalTilt_deg)
{
    if (!(optimalTilt_deg > 0.0)) {
        optimalTilt_deg = 10.0;
    }
    if (panelTilt_deg <= optimalTilt_deg) {
        return 0.85 + (panelTilt_deg / optimalTilt_deg) * 0.15;
    }
    if (panelTilt_deg <= optimalTilt_deg + 30.0) {
        return 1.0 - ((panelTilt_deg - optimalTilt_deg) / 30.0) * 0.15;
    }
    return 0.85 - ((panelTilt_deg - optimalTilt_deg - 30.0) / 30.0) * 0.10;
}

double panelEfficiency(double panelAzimuth_deg,
                       double panelTilt_deg,
                       double optimalAzimuth_deg,
                       double optimalTilt_deg,
                       SolarTrace *trace)
{
    const double az_eff = azimuthEfficiency(panelAzimuth_deg, optimalAzimuth_deg);
    const double tilt_eff = tiltEfficiency(panelTilt_deg, optimalTilt_deg);
    double total = az_eff * tilt_eff;
    if (!std::isfinite(total) || total < kMinPanelEfficiency) {
        total = kMinPanelEfficiency;
    }
    if (total > 1.0) {
        total = 1.0;
    }
    tracef(trace, TRACE_DEBUG,
           "efficiency: optimal az=%.1f tilt=%.1f, azimuth term=%.3f, tilt term=%.3f, total=%.3f",
           optimalAzimuth_deg, optimalTilt_deg, az_eff, tilt_eff, total);
    return total;
}

double temperatureEfficiency(int dayOfYear)
{
    const double day_offset = std::fabs((double)dayOfYear - 172.0);
    const double cycle = std::cos((day_offset / 182.5) * kPi);
    return clampValue(1.0 - cycle * 0.05, 0.95, 1.02);
}

ComplianceFlags checkCompliance(double totalWattageW,
                                double maxInstantaneousPowerW,
                                const RegionalRegulation &reg)
{
    ComplianceFlags f;
    f.exceedsPanelLimit = false;
    f.exceedsInverterCapacity = false;
    if (reg.appliesCap) {
        if (!isNA(reg.maxPanelCapacityW)) {
            f.exceedsPanelLimit = totalWattageW > reg.maxPanelCapacityW;
        }
        if (!isNA(reg.maxInverterOutputW)) {
            f.exceedsInverterCapacity = maxInstantaneousPowerW > reg.maxInverterOutputW;
        }
    }
    f.isCompliant = reg.appliesCap ? (!f.exceedsPanelLimit && !f.exceedsInverterCapacity) : true;
    return f;
}
