#ifndef REPORT_HH
#define REPORT_HH

#include <ostream>
#include <vector>
#include <jsoncpp/json/json.h>

#include "pipeline.hh"

/* Tables are printed one row per line as space-separated key=value columns,
 * led by the table name; "#" lines carry table-level summaries. Absent
 * statistics print as NA. */

void print_normalization(const NormalizationReport & report, std::ostream & out);
void print_sessions(const session_table & sessions, std::ostream & out);
void print_session_depth(const SessionDepth & depth, std::ostream & out);
void print_arrivals(const ArrivalProcess & arrivals, std::ostream & out);
void print_windows(const std::vector<SessionWindow> & windows, const char * table, std::ostream & out);
void print_hour_of_day(const std::vector<HourOfDayRecord> & records, const char * table, std::ostream & out);
void print_variance(const VarianceDecomposition & variance, const char * metric, std::ostream & out);
void print_daily_curve_correlation(const std::vector<DailyCurve> & curves,
                                   const std::optional<CurveCorrelation> & correlation,
                                   std::ostream & out);
void print_concurrency(const std::vector<ConcurrencySummary> & summaries, std::ostream & out);
void print_sensitivity(const std::vector<SensitivityRow> & rows, std::ostream & out);

/* Every table above, in that order; per-session rows only if requested. */
void print_analysis(const AnalysisResult & result, const bool print_session_rows, std::ostream & out);

/* Summary statistics (no per-row tables); absent values are null. */
Json::Value summary_json(const AnalysisResult & result);
void write_json(const Json::Value & doc, std::ostream & out);

#endif
