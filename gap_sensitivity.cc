#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <string>
#include <getopt.h>

#include "config.hh"
#include "normalize.hh"
#include "report.hh"
#include "sensitivity.hh"
#include "tracereader.hh"
#include "traceutil.hh"

using namespace std;

/* Sensitivity table plus, per gap, the windows that survive the sparse-bin filter. */
void sensitivity_main(const AnalysisConfig & config) {
    ios::sync_with_stdio(false);

    const NormalizedTrace trace = normalize_trace(read_trace(cin));
    if (trace.has_explicit_session_ids()) {
        cerr << "note: ignoring explicit session ids, sessions are inferred for every gap\n";
    }

    const vector<SensitivityRow> rows = run_gap_sensitivity(trace.events, config.sensitivity_params());

    cout << setprecision(15);
    print_normalization(trace.report, cout);
    print_sensitivity(rows, cout);
    for (const SensitivityRow & row : rows) {
        if (row.result.has_value()) {
            const string table = "retained_window_" + row.label;
            print_windows(row.result->retained_windows, table.c_str(), cout);
        }
    }
}

void print_usage(const string & program) {
    cerr << "Usage: " << program << " --gaps <sec,sec,...> [options] < trace\n"
            "trace: one record per line, \"timestamp [kind] [session_id]\", "
            "whitespace- or comma-separated\n"
            "       project wider tables to these columns first; extra columns are read as part of the kind\n"
            "Options:\n"
            "  --config <file>          JSON file of analysis options (applied before the flags below)\n"
            "  --bin-width <sec>        window width [3600]\n"
            "  --min-sessions <n>       sparse-bin filter threshold [100]\n"
            "  --thresholds <k,k,...>   turn-count thresholds [2,3]\n";
}

int main(int argc, char *argv[]) {
    try {
        if (argc < 1) {
            abort();
        }
        const option opts[] = {
            {"gaps", required_argument, nullptr, 'G'},
            {"config", required_argument, nullptr, 'c'},
            {"bin-width", required_argument, nullptr, 'b'},
            {"min-sessions", required_argument, nullptr, 'm'},
            {"thresholds", required_argument, nullptr, 't'},
            {nullptr, 0, nullptr, 0}
        };
        string config_filename, gaps, bin_width, min_sessions, thresholds;

        while (true) {
            const int opt = getopt_long(argc, argv, "G:c:b:m:t:", opts, nullptr);
            if (opt == -1) break;
            switch (opt) {
                case 'G':
                    gaps = optarg;
                    break;
                case 'c':
                    config_filename = optarg;
                    break;
                case 'b':
                    bin_width = optarg;
                    break;
                case 'm':
                    min_sessions = optarg;
                    break;
                case 't':
                    thresholds = optarg;
                    break;
                default:
                    print_usage(argv[0]);
                    return EXIT_FAILURE;
            }
        }

        if (optind != argc) {
            print_usage(argv[0]);
            return EXIT_FAILURE;
        }
        if (gaps.empty()) {
            cerr << "Error: --gaps is required\n\n";
            print_usage(argv[0]);
            return EXIT_FAILURE;
        }

        AnalysisConfig config;
        if (not config_filename.empty()) {
            load_config_file(config_filename, config);
        }
        config.sensitivity_gaps_sec = parse_number_list(gaps);
        if (not bin_width.empty()) {
            config.bin_width_sec = parse_single_number(bin_width);
        }
        if (not min_sessions.empty()) {
            config.min_session_count_per_bin = parse_single_unsigned(min_sessions);
        }
        if (not thresholds.empty()) {
            config.turn_count_thresholds = parse_unsigned_list(thresholds);
        }

        /* individual gaps are checked per row, so a bad one does not hide the others */
        throw_if_not_positive(config.bin_width_sec, "binWidthSec");

        sensitivity_main(config);
    } catch (const exception & e) {
        cerr << e.what() << "\n";
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
