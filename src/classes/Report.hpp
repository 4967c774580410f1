//  Report.hpp
//  SolarYield
//
//  Plain-text rendering of an estimate.
//
#ifndef Report_hpp
#define Report_hpp

#include <stdio.h>
#include "SolarEstimate.hpp"

void printEstimateReport(FILE *fp, const EstimateInput &in, const AnnualOutput &out);

/* 24 hourly rows; label names the day, e.g. "2024-06-21". */
void printDailyTable(FILE *fp, const DailyProductionResult &day, const char *label);

#endif /* Report_hpp */
