#include "PanelArray.hpp"

#include <cmath>

namespace {

inline double wrapDegrees360(double deg) {
    if (!std::isfinite(deg)) {
        return 0.0;
    }
    double x = std::fmod(deg, 360.0);
    if (x < 0.0) {
        x += 360.0;
    }
    if (x >= 360.0) {
        x -= 360.0;
    }
    return x;
}

inline bool isPositive(double x) {
    return std::isfinite(x) && x > 0.0;
}

inline bool isNonNegative(double x) {
    return std::isfinite(x) && x >= 0.0;
}

} // namespace

bool validatePanelLayout(double lineLengthM, const PanelLayout &layout, std::string &field)
{
    if (!isNA(lineLengthM) && lineLengthM < 0.0) {
        field = "lineLengthM";
        return false;
    }
    if (layout.countOverride != NA_VALUE && layout.countOverride < 0) {
        field = "panelCount";
        return false;
    }
    if (!isPositive(layout.panelLengthM)) {
        field = "panelLengthM";
        return false;
    }
    if (!isPositive(layout.panelWidthM)) {
        field = "panelWidthM";
        return false;
    }
    if (!isNonNegative(layout.perPanelWattageW)) {
        field = "perPanelWattageW";
        return false;
    }
    if (!isNonNegative(layout.maxSystemWattageW)) {
        field = "maxSystemWattageW";
        return false;
    }
    if (!isNonNegative(layout.wattageLeewayW)) {
        field = "wattageLeewayW";
        return false;
    }
    return true;
}

PanelArrayConfig makePanelArray(int panelCount, double perPanelWattageW, double panelAreaM2)
{
    PanelArrayConfig cfg;
    cfg.panelCount = panelCount;
    cfg.perPanelWattageW = perPanelWattageW;
    cfg.totalWattageW = (double)panelCount * perPanelWattageW;
    cfg.totalAreaM2 = (double)panelCount * panelAreaM2;
    return cfg;
}

PanelArrayConfig buildPanelArray(double lineLengthM, const PanelLayout &layout)
{
    const double panel_area = layout.panelLengthM * layout.panelWidthM;

    if (layout.countOverride != NA_VALUE) {
        PanelArrayConfig cfg = makePanelArray(layout.countOverride, layout.perPanelWattageW, panel_area);
        cfg.constrainedByCount = true;
        return cfg;
    }

    const double along = (layout.mount == MOUNT_LENGTH) ? layout.panelLengthM : layout.panelWidthM;
    int count = 0;
    if (along > 0.0 && std::isfinite(lineLengthM) && lineLengthM > 0.0) {
        count = (int)std::floor(lineLengthM / along);
    }

    bool by_wattage = false;
    if (layout.perPanelWattageW > 0.0) {
        const int max_by_wattage =
            (int)std::floor((layout.maxSystemWattageW + layout.wattageLeewayW) / layout.perPanelWattageW);
        if (count > max_by_wattage) {
            count = max_by_wattage;
            by_wattage = true;
        }
    }

    PanelArrayConfig cfg = makePanelArray(count, layout.perPanelWattageW, panel_area);
    cfg.constrainedByWattage = by_wattage;
    cfg.constrainedByLength = !by_wattage;
    return cfg;
}

double panelAzimuthFromLine(double lineAzimuth_deg, PanelSide side)
{
    if (side == SIDE_LEFT) {
        return wrapDegrees360(lineAzimuth_deg - 90.0);
    }
    return wrapDegrees360(lineAzimuth_deg + 90.0);
}

const char *azimuthDirectionName(double azimuth_deg)
{
    static const char *const names[8] = {
        "North", "Northeast", "East", "Southeast", "South", "Southwest", "West", "Northwest"
    };
    const double a = wrapDegrees360(azimuth_deg);
    /* sectors are 45 deg wide and centred on the compass points */
    const int sector = (int)std::floor((a + 22.5) / 45.0) % 8;
    return names[sector];
}
