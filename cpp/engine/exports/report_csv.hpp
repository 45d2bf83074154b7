#pragma once
/*
================================================================================
Fragment 5.1 — Engine: CSV Report Writers (Fleets, Analytics, Submission)
FILE: cpp/engine/exports/report_csv.hpp

Purpose:
  - Serialize selection and analytics results for downstream reporting:
      * fleet roster (with selection phase / rank)
      * selection log and feasibility checks
      * analytics tables (sweeps, Pareto, domination probes)
      * claim verdict, marginal cost, sensitivity summary
      * submission summary (Header Name, Data Type, Units, Submission)

Hardening:
  - Explicit CSV escaping for strings with commas/quotes/newlines
  - Non-finite and absent values export as empty cells (never "nan")
  - Fixed column order, fixed decimal precision: byte-stable output
  - File helpers throw IOError when the file cannot be written
================================================================================
*/

#include <functional>
#include <iosfwd>
#include <string>
#include <vector>

#include "engine/analysis/scenario_runner.hpp"
#include "engine/core/vessel.hpp"
#include "engine/selection/feasibility.hpp"
#include "engine/selection/fleet.hpp"

namespace fleetopt {

struct CsvExportOptions {
  bool include_header = true;
  char delimiter = ',';
  int precision = 2;
};

// Quote if the field contains the delimiter, a quote or a line break.
std::string csv_escape(const std::string& s, char delim = ',');

// Fixed-precision number, or "" for NaN/Inf.
std::string csv_double(double x, int precision = 2);

// Rows follow `log` order when given; otherwise id order with phase "solver".
void write_fleet_roster_csv(std::ostream& os,
                            const VesselTable& table,
                            const Fleet& fleet,
                            const std::vector<SelectionEntry>& log = {},
                            const CsvExportOptions& opt = CsvExportOptions());

void write_selection_log_csv(std::ostream& os,
                             const std::vector<SelectionEntry>& log,
                             const CsvExportOptions& opt = CsvExportOptions());

void write_feasibility_csv(std::ostream& os,
                           const FeasibilityReport& report,
                           const CsvExportOptions& opt = CsvExportOptions());

void write_analytics_csv(std::ostream& os,
                         const analysis::AnalyticsTable& table,
                         const CsvExportOptions& opt = CsvExportOptions());

void write_claim_csv(std::ostream& os,
                     const analysis::ClaimVerdict& verdict,
                     const CsvExportOptions& opt = CsvExportOptions());

void write_marginal_csv(std::ostream& os,
                        const std::vector<analysis::MarginalRow>& rows,
                        const CsvExportOptions& opt = CsvExportOptions());

void write_sensitivity_csv(std::ostream& os,
                           const std::vector<analysis::SensitivityRow>& rows,
                           const CsvExportOptions& opt = CsvExportOptions());

struct SubmissionInfo {
  std::string team_name = "fleetopt";
  std::string category = "technical";
  std::string report_file_name = "report.pdf";
  bool sensitivity_performed = true;
};

// Header Name, Data Type, Units, Submission (always with header).
void write_submission_csv(std::ostream& os, const FleetMetrics& metrics, const SubmissionInfo& info);

// Opens `path` (truncating), runs `writer`, and checks the stream.
// Throws IOError on open or write failure.
void write_csv_file(const std::string& path, const std::function<void(std::ostream&)>& writer);

}  // namespace fleetopt
