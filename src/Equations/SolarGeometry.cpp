#include "SolarGeometry.hpp"

#include "Macros.hpp"

#include <cmath>

namespace {

inline double safeAcos(double x) {
    return std::acos(clampValue(x, -1.0, 1.0));
}

inline double safeAsin(double x) {
    return std::asin(clampValue(x, -1.0, 1.0));
}

} // namespace

double solarDeclination(int dayOfYear) {
    return 23.45 * std::sin(360.0 * (284.0 + (double)dayOfYear) / 365.0 * kDeg2Rad);
}

SunPosition solarPosition(int hour, int dayOfYear, double lat_deg) {
    SunPosition sp{};

    const double decl = solarDeclination(dayOfYear);
    const double ha = 15.0 * (double)(hour - 12);
    sp.declinationDeg = decl;
    sp.hourAngleDeg = ha;

    const double lat_rad = lat_deg * kDeg2Rad;
    const double decl_rad = decl * kDeg2Rad;
    const double ha_rad = ha * kDeg2Rad;

    const double sin_lat = std::sin(lat_rad);
    const double cos_lat = std::cos(lat_rad);
    const double sin_decl = std::sin(decl_rad);
    const double cos_decl = std::cos(decl_rad);
    const double cos_ha = std::cos(ha_rad);

    const double sin_elev = sin_lat * sin_decl + cos_lat * cos_decl * cos_ha;
    const double elev = safeAsin(sin_elev) * kRad2Deg;

    /* Azimuth from the unclamped elevation; acos argument clamped near the zenith. */
    const double cos_elev = std::cos(elev * kDeg2Rad);
    double cos_az = 1.0;
    if (std::fabs(cos_elev) > 1.0e-12) {
        cos_az = (sin_decl * cos_lat - cos_decl * sin_lat * cos_ha) / cos_elev;
    } else {
        cos_az = (sin_decl * cos_lat - cos_decl * sin_lat * cos_ha) >= 0.0 ? 1.0 : -1.0;
    }
    double az = safeAcos(cos_az) * kRad2Deg;
    if (ha > 0.0) {
        az = 360.0 - az;
    }
    if (az >= 360.0) {
        az -= 360.0;
    }

    sp.elevationDeg = elev > 0.0 ? elev : 0.0;
    sp.azimuthDeg = az;

    if (!std::isfinite(sp.elevationDeg) || !std::isfinite(sp.azimuthDeg)) {
        sp.elevationDeg = 0.0;
        sp.azimuthDeg = 0.0;
    }
    return sp;
}
