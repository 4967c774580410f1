//  solaryield.cpp
//  SolarYield
//
//  Batch estimate of a balcony/railing solar array from a control file.
//
#include <stdio.h>
#include <stdlib.h>
#include <unistd.h>

#include <memory>
#include <string>

#include "CalendarDay.hpp"
#include "Estimate_Control.hpp"
#include "Macros.hpp"
#include "NetcdfSunshineProvider.hpp"
#include "PanelArray.hpp"
#include "Report.hpp"
#include "SolarEstimate.hpp"
#include "SolarTrace.hpp"

static void usage(const char *prog)
{
    fprintf(stderr, "Usage: %s [-v] [-h] <control_file>\n", prog);
    fprintf(stderr, "  -v  verbose: echo settings and per-day diagnostics\n");
    fprintf(stderr, "  -h  this help\n");
}

static std::unique_ptr<SunshineProvider> makeProvider(const Estimate_Control &ctrl, SolarTrace *trace)
{
    switch (ctrl.sunshine_mode) {
        case SUNSHINE_FIXED:
            return std::unique_ptr<SunshineProvider>(new FixedSunshineProvider(ctrl.annualSunshineHours));
        case SUNSHINE_NETCDF:
            if (ctrl.sunshine_file[0] == '\0') {
                return std::unique_ptr<SunshineProvider>();
            }
            return std::unique_ptr<SunshineProvider>(
                new NetcdfSunshineProvider(ctrl.sunshine_file, ctrl.sunshine_var, "lat", "lon", trace));
        case SUNSHINE_CLIMATE:
        default:
            return std::unique_ptr<SunshineProvider>();
    }
}

int main(int argc, char *argv[])
{
    int c;
    while ((c = getopt(argc, argv, "vh")) != -1) {
        switch (c) {
            case 'v':
                global_verbose_mode = 1;
                break;
            case 'h':
                usage(argv[0]);
                return ERRSUCCESS;
            default:
                usage(argv[0]);
                myexit(ERRFileIO);
        }
    }
    if (optind >= argc) {
        usage(argv[0]);
        myexit(ERRFileIO);
    }
    const char *ctrl_fn = argv[optind];

    Estimate_Control ctrl;
    if (ctrl.read(ctrl_fn) != ERRSUCCESS) {
        myexit(ERRFileIO);
    }
    const int verbose = (ctrl.Verbose || global_verbose_mode) ? 1 : 0;
    if (verbose) {
        ctrl.print(stdout);
    }
    StderrTrace trace(verbose);

    EstimateInput in;
    in.location.latitude = ctrl.latitude;
    in.location.longitude = ctrl.longitude;
    const PanelLayout layout = ctrl.layout();
    std::string field;
    if (!validatePanelLayout(ctrl.lineLength, layout, field)) {
        fprintf(stderr, "ERROR: invalid %s in %s.\n", field.c_str(), ctrl_fn);
        myexit(ERRDATAIN);
    }
    in.array = buildPanelArray(ctrl.lineLength, layout);
    in.orientation.panelTiltDeg = ctrl.panelTilt;
    in.orientation.panelAzimuthDeg = ctrl.effectivePanelAzimuth();
    if (isNA(in.orientation.panelAzimuthDeg)) {
        in.orientation.panelAzimuthDeg = locationInfo(isNA(ctrl.latitude) ? kDefaultLatitude : ctrl.latitude)
                                             .optimalAzimuthDeg;
        fprintf(stderr,
                "WARNING: neither PANEL_AZIMUTH nor LINE_AZIMUTH in %s; panels face %.0f deg.\n",
                ctrl_fn, in.orientation.panelAzimuthDeg);
    }
    in.electricityPricePerKwh = ctrl.electricityPrice;
    in.temperatureCorrection = ctrl.temperatureCorrection != 0;

    std::unique_ptr<SunshineProvider> provider = makeProvider(ctrl, &trace);

    AnnualOutput out;
    const int rc = estimateAnnualOutput(in, provider.get(), &trace, out);
    if (rc != ERRSUCCESS) {
        myexit(rc);
    }
    printEstimateReport(stdout, in, out);

    if (ctrl.detailDate > 0) {
        CalendarDay day;
        if (!day.setDate(ctrl.detailDate)) {
            fprintf(stderr, "ERROR: invalid DETAIL_DATE %ld in %s; expected YYYYMMDD.\n",
                    ctrl.detailDate, ctrl_fn);
            myexit(ERRDATAIN);
        }
        DailyProductionResult detail;
        const int rc_day = estimateDay(in, out, day.dayOfYear(), &trace, detail);
        if (rc_day != ERRSUCCESS) {
            myexit(rc_day);
        }
        printDailyTable(stdout, detail, day.formatDate().c_str());
    }

    return ERRSUCCESS;
}
