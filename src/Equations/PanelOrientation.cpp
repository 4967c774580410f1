#include "PanelOrientation.hpp"

#include "Macros.hpp"

#include <cmath>

double orientationFactor(double sunElevation_deg,
                         double sunAzimuth_deg,
                         double panelTilt_deg,
                         double panelAzimuth_deg) {
    if (!std::isfinite(sunElevation_deg) || !std::isfinite(sunAzimuth_deg) ||
        !std::isfinite(panelTilt_deg) || !std::isfinite(panelAzimuth_deg)) {
        return 0.0;
    }
    if (!(sunElevation_deg > 0.0)) {
        return 0.0;
    }

    const double elev = sunElevation_deg * kDeg2Rad;
    const double az = sunAzimuth_deg * kDeg2Rad;
    const double tilt = panelTilt_deg * kDeg2Rad;
    const double paz = panelAzimuth_deg * kDeg2Rad;

    /* Sun vector (east, north, up) */
    const double sx = std::cos(elev) * std::sin(az);
    const double sy = std::cos(elev) * std::cos(az);
    const double sz = std::sin(elev);

    /* Panel normal */
    const double nx = std::sin(tilt) * std::sin(paz);
    const double ny = std::sin(tilt) * std::cos(paz);
    const double nz = std::cos(tilt);

    const double cosi = sx * nx + sy * ny + sz * nz;
    if (!(cosi > 0.0) || !std::isfinite(cosi)) {
        return 0.0;
    }
    return cosi > 1.0 ? 1.0 : cosi;
}
