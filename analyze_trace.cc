#include <cstdlib>
#include <fstream>
#include <iostream>
#include <set>
#include <string>
#include <utility>
#include <vector>
#include <getopt.h>

#include "config.hh"
#include "normalize.hh"
#include "pipeline.hh"
#include "report.hh"
#include "tracereader.hh"
#include "traceutil.hh"

using namespace std;

void analyze_main(const AnalysisConfig & config, const bool print_session_rows, const string & json_filename) {
    ios::sync_with_stdio(false);

    const NormalizedTrace trace = normalize_trace(read_trace(cin));
    const AnalysisResult result = run_analysis(trace, config);

    set<Day_index> days;
    for (const DailyCurve & curve : result.daily_curves) {
        days.insert(curve.day);
    }
    cerr << "days with sessions:\n";
    print_intervals(days);

    print_analysis(result, print_session_rows, cout);

    if (not json_filename.empty()) {
        const Json::Value doc = summary_json(result);
        if (json_filename == "-") {
            write_json(doc, cout);
        } else {
            ofstream json_file{json_filename};
            if (not json_file.is_open()) {
                throw runtime_error("can't open " + json_filename);
            }
            write_json(doc, json_file);
            json_file.close();
            if (json_file.fail()) {
                throw runtime_error("error writing " + json_filename);
            }
        }
    }
}

void print_usage(const string & program) {
    cerr << "Usage: " << program << " [options] < trace\n"
            "trace: one record per line, \"timestamp [kind] [session_id]\", "
            "whitespace- or comma-separated\n"
            "       project wider tables to these columns first; extra columns are read as part of the kind\n"
            "Options:\n"
            "  --config <file>             JSON file of analysis options (applied before the flags below)\n"
            "  --gap <sec>                 session gap threshold [1800]\n"
            "  --bin-width <sec>           window width [3600]\n"
            "  --min-sessions <n>          sparse-bin filter threshold [100]\n"
            "  --multipliers <k,k,...>     seconds per turn for concurrency [10,30]\n"
            "  --thresholds <k,k,...>      turn-count thresholds [2,3]\n"
            "  --gaps <sec,sec,...>        gap thresholds for the sensitivity table [900,1800,3600]\n"
            "  --quantiles <q,q,...>       window quantiles [0.9,0.95]\n"
            "  --min-overlap <n>           hours two daily curves must share [6]\n"
            "  --min-windows-per-day <n>   intra-day CV guard [6]\n"
            "  --no-sessions               omit the per-session rows\n"
            "  --json <file>               write a JSON summary (- for stdout)\n";
}

int main(int argc, char *argv[]) {
    try {
        if (argc < 1) {
            abort();
        }
        const option opts[] = {
            {"config", required_argument, nullptr, 'c'},
            {"gap", required_argument, nullptr, 'g'},
            {"bin-width", required_argument, nullptr, 'b'},
            {"min-sessions", required_argument, nullptr, 'm'},
            {"multipliers", required_argument, nullptr, 'k'},
            {"thresholds", required_argument, nullptr, 't'},
            {"gaps", required_argument, nullptr, 'G'},
            {"quantiles", required_argument, nullptr, 'q'},
            {"min-overlap", required_argument, nullptr, 'o'},
            {"min-windows-per-day", required_argument, nullptr, 'w'},
            {"no-sessions", no_argument, nullptr, 'n'},
            {"json", required_argument, nullptr, 'j'},
            {nullptr, 0, nullptr, 0}
        };

        /* the config file goes first so flags override it, whatever their order */
        string config_filename, json_filename;
        bool print_session_rows = true;
        vector<pair<int, string>> overrides;

        while (true) {
            const int opt = getopt_long(argc, argv, "c:g:b:m:k:t:G:q:o:w:nj:", opts, nullptr);
            if (opt == -1) break;
            switch (opt) {
                case 'c':
                    config_filename = optarg;
                    break;
                case 'n':
                    print_session_rows = false;
                    break;
                case 'j':
                    json_filename = optarg;
                    break;
                case 'g': case 'b': case 'm': case 'k': case 't':
                case 'G': case 'q': case 'o': case 'w':
                    overrides.emplace_back(opt, optarg);
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

        AnalysisConfig config;
        if (not config_filename.empty()) {
            load_config_file(config_filename, config);
        }
        for (const auto & [opt, value] : overrides) {
            switch (opt) {
                case 'g': config.gap_threshold_sec = parse_single_number(value); break;
                case 'b': config.bin_width_sec = parse_single_number(value); break;
                case 'm': config.min_session_count_per_bin = parse_single_unsigned(value); break;
                case 'k': config.duration_model_multipliers = parse_number_list(value); break;
                case 't': config.turn_count_thresholds = parse_unsigned_list(value); break;
                case 'G': config.sensitivity_gaps_sec = parse_number_list(value); break;
                case 'q': config.quantiles = parse_number_list(value); break;
                case 'o': config.min_days_overlap_for_correlation = parse_single_unsigned(value); break;
                case 'w': config.min_windows_per_day = parse_single_unsigned(value); break;
            }
        }
        config.validate();

        analyze_main(config, print_session_rows, json_filename);
    } catch (const exception & e) {
        cerr << e.what() << "\n";
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
