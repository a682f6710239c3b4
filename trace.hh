#ifndef TRACE_HH
#define TRACE_HH

#include <array>
#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

/* Sentinel session id for records of an explicitly-keyed trace that lack one. */
static constexpr int64_t MISSING_SESSION_ID = -1;

struct EventKind {
    enum class Type : uint8_t { conversational, other };
    constexpr static std::array<std::string_view, 2> names = { "conversational", "other" };

    Type type;

    EventKind(const Type t = Type::conversational) : type(t) {}

    /* "conversation", "conversational" or "Conversation log" (any case)
     * are conversational; any other non-empty kind is a marker. */
    explicit EventKind(const std::string_view sv);

    operator std::string_view() const { return names[uint8_t(type)]; }

    bool segmentable() const { return type == Type::conversational; }

    bool operator==(const EventKind other) const { return type == other.type; }
    bool operator==(const EventKind::Type other) const { return type == other; }
    bool operator!=(const EventKind other) const { return not operator==(other); }
    bool operator!=(const EventKind::Type other) const { return not operator==(other); }
};

/* One record as handed over by the loading boundary; any field may be missing. */
struct RawRecord {
    std::optional<double> timestamp{};
    std::optional<std::string> kind{};
    std::optional<int64_t> explicit_session_id{};
};

/* A validated event; arrival_index is its position in the raw input. */
struct Event {
    double timestamp{};
    EventKind kind{};
    uint64_t arrival_index{};
};

/* Derived view over a contiguous run of events sharing a session id. */
struct Session {
    int64_t id{};
    double start_time{};
    double end_time{};
    uint32_t turn_count{};
    double duration_sec{};
};

using session_table = std::vector<Session>;

std::ostream & operator<<(std::ostream & out, const Event & e);
std::ostream & operator<<(std::ostream & out, const Session & s);

#endif
