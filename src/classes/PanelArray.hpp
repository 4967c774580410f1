//  PanelArray.hpp
//  SolarYield
//
//  Panel array value objects and their derivation from a mounting line.
//
#ifndef PanelArray_hpp
#define PanelArray_hpp

#include <string>

#include "Macros.hpp"

enum PanelSide {
    SIDE_LEFT = 0,
    SIDE_RIGHT = 1
};

static inline const char *PanelSideName(PanelSide side)
{
    switch (side) {
        case SIDE_LEFT:  return "LEFT";
        case SIDE_RIGHT: return "RIGHT";
        default:         return "UNKNOWN";
    }
}

enum PanelMount {
    MOUNT_LENGTH = 0,   /* panel length runs along the line */
    MOUNT_WIDTH = 1
};

static inline const char *PanelMountName(PanelMount mount)
{
    switch (mount) {
        case MOUNT_LENGTH: return "LENGTH";
        case MOUNT_WIDTH:  return "WIDTH";
        default:           return "UNKNOWN";
    }
}

/* totalWattageW == panelCount * perPanelWattageW */
struct PanelArrayConfig {
    int panelCount = 0;
    double perPanelWattageW = 0.0;
    double totalWattageW = 0.0;
    double totalAreaM2 = 0.0;
    bool constrainedByLength = false;
    bool constrainedByWattage = false;
    bool constrainedByCount = false;
};

struct OrientationParams {
    double panelAzimuthDeg = 180.0;   /* [0, 360) */
    double panelTiltDeg = 90.0;       /* [0, 90] */
};

struct PanelLayout {
    double panelLengthM = 2.0;
    double panelWidthM = 1.0;
    double perPanelWattageW = 400.0;
    PanelMount mount = MOUNT_LENGTH;
    double maxSystemWattageW = 2000.0;
    double wattageLeewayW = 200.0;
    int countOverride = NA_VALUE;      /* unless NA, replaces the line-derived count */
};

/*
 * Checks a mounting line and panel layout before buildPanelArray().
 * An NA line length or count override means unset. Returns false and sets
 * field to the offending name otherwise: lineLengthM, panelCount,
 * panelLengthM, panelWidthM, perPanelWattageW, maxSystemWattageW,
 * wattageLeewayW.
 */
bool validatePanelLayout(double lineLengthM, const PanelLayout &layout, std::string &field);

PanelArrayConfig makePanelArray(int panelCount, double perPanelWattageW, double panelAreaM2);

/*
 * Panels fitting on a mounting line, limited by the system wattage ceiling
 * (maxSystemWattage + leeway).
 */
PanelArrayConfig buildPanelArray(double lineLengthM, const PanelLayout &layout);

/* Direction the panels face: 90 deg left or right of the line bearing, [0, 360). */
double panelAzimuthFromLine(double lineAzimuth_deg, PanelSide side);

/* 8-point compass name, e.g. "South", "Northwest". */
const char *azimuthDirectionName(double azimuth_deg);

#endif /* PanelArray_hpp */
