#include "tracereader.hh"

#include <iostream>
#include <string>

#include "traceutil.hh"

using namespace std;

namespace {

string_view strip_quotes(string_view field) {
    if (field.size() >= 2 and field.front() == '"' and field.back() == '"') {
        field.remove_prefix(1);
        field.remove_suffix(1);
    }
    return field;
}

}

RawRecord parse_trace_line(const string_view line) {
    vector<string_view> fields;
    split_on_separators(line, fields);

    RawRecord ret;
    if (fields.empty()) {
        return ret;
    }

    ret.timestamp = parse_double(fields.front());

    size_t kind_end = fields.size();
    if (fields.size() >= 2) {
        ret.explicit_session_id = parse_int64(fields.back());
        if (ret.explicit_session_id.has_value()) {
            kind_end--;
        }
    }

    string kind;
    for (size_t i = 1; i < kind_end; i++) {
        if (not kind.empty()) {
            kind += ' ';
        }
        kind += strip_quotes(fields[i]);
    }
    if (not kind.empty()) {
        ret.kind = kind;
    }

    return ret;
}

vector<RawRecord> read_trace(istream & in) {
    vector<RawRecord> ret;
    string line_storage;
    size_t line_no = 0;
    bool seen_record = false;

    while (getline(in, line_storage)) {
        if (line_no % 1000000 == 0) {
            const size_t rss = memcheck() / 1024;
            cerr << "line " << line_no / 1000000 << "M, RSS=" << rss << " MiB\n";
        }
        line_no++;

        const string_view line{line_storage};
        const size_t first = line.find_first_not_of(" \t\r");
        if (first == line.npos or line[first] == '#') {
            continue;
        }

        RawRecord record = parse_trace_line(line);
        if (not seen_record) {
            seen_record = true;
            if (not record.timestamp.has_value()) {
                /* column header */
                continue;
            }
        }
        ret.push_back(move(record));
    }

    if (in.bad()) {
        throw runtime_error("error reading trace after line " + to_string(line_no));
    }

    cerr << "read " << ret.size() << " records from " << line_no << " lines\n";
    return ret;
}
