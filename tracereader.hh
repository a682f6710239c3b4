#ifndef TRACEREADER_HH
#define TRACEREADER_HH

#include <istream>
#include <vector>

#include "trace.hh"

/* Read records "timestamp [kind] [session_id]", one per line, fields
 * separated by whitespace or commas. Blank lines and lines starting with
 * '#' are skipped, as is a first record line whose first field is not a
 * number (a column header). A trailing integer field is the session id;
 * the fields between it and the timestamp, rejoined with single spaces,
 * are the kind. Kinds may be double-quoted.
 *
 * Wider tables (e.g. a BurstGPT row with model and token columns) must be
 * projected to these columns first, otherwise the extra columns end up in
 * the kind and every row becomes a marker. */
std::vector<RawRecord> read_trace(std::istream & in);

/* Parse one non-comment line; exposed for tests. */
RawRecord parse_trace_line(const std::string_view line);

#endif
