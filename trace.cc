#include "trace.hh"

#include <cctype>
#include <stdexcept>

using namespace std;
using namespace std::literals;

EventKind::EventKind(const string_view sv)
    : type()
{
    if (sv.empty()) {
        throw runtime_error("empty event kind");
    }

    /* compare the first word only, case-insensitively */
    string first_word;
    for (const char ch : sv) {
        if (ch == ' ' or ch == '_' or ch == '-') { break; }
        first_word.push_back(tolower(static_cast<unsigned char>(ch)));
    }

    if (first_word == "conversation"sv or first_word == "conversational"sv) {
        type = Type::conversational;
    } else {
        type = Type::other;
    }
}

ostream & operator<<(ostream & out, const Event & e) {
    return out << "ts=" << e.timestamp
        << " kind=" << string_view(e.kind)
        << " arrival=" << e.arrival_index;
}

ostream & operator<<(ostream & out, const Session & s) {
    return out << "session=" << s.id
        << " start=" << s.start_time
        << " end=" << s.end_time
        << " turns=" << s.turn_count
        << " duration=" << s.duration_sec;
}
