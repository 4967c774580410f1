#include "AtmosphericModel.hpp"

#include "Macros.hpp"

#include <cmath>

double airMass(double elevation_deg) {
    if (!(elevation_deg > 0.0)) {
        return NA_VALUE;
    }
    const double elev_rad = elevation_deg * kDeg2Rad;
    return 1.0 / (std::sin(elev_rad) + 0.50572 * std::pow(elevation_deg + 6.07995, -1.6364));
}

double atmosphericAttenuation(double elevation_deg) {
    if (!(elevation_deg > 0.0) || !std::isfinite(elevation_deg)) {
        return 0.0;
    }
    const double elev_rad = elevation_deg * kDeg2Rad;
    const double sin_elev = std::sin(elev_rad);
    const double am = airMass(elevation_deg);

    const double dni = 900.0 * std::exp(-0.357 * std::pow(am, 0.678));   /* W/m2, clear sky */
    const double diffuse = 100.0 * sin_elev;                             /* W/m2 */
    const double horizontal = dni * sin_elev + diffuse;

    return clampValue(horizontal / kClearSkyPeakWm2, 0.0, 1.0);
}
