#include "gatefile/http/http_date.hpp"

#include <array>
#include <cctype>
#include <ctime>
#include <iomanip>
#include <locale>
#include <sstream>

namespace gatefile::http_date {

namespace {

constexpr std::array<std::string_view, 7> kShortDays = {
    "Sun", "Mon", "Tue", "Wed", "Thu", "Fri", "Sat"};

constexpr std::array<std::string_view, 7> kLongDays = {
    "Sunday", "Monday", "Tuesday", "Wednesday", "Thursday", "Friday", "Saturday"};

constexpr std::array<std::string_view, 12> kMonths = {
    "Jan", "Feb", "Mar", "Apr", "May", "Jun",
    "Jul", "Aug", "Sep", "Oct", "Nov", "Dec"};

// Minimal cursor over the date text
class Scanner {
    std::string_view s_;

public:
    explicit Scanner(std::string_view s) : s_(s) {}

    bool done() const { return s_.empty(); }

    bool literal(std::string_view lit) {
        if (s_.substr(0, lit.size()) != lit) return false;
        s_.remove_prefix(lit.size());
        return true;
    }

    // Exactly `width` digits
    bool digits(int width, int& out) {
        if (s_.size() < static_cast<size_t>(width)) return false;
        int value = 0;
        for (int i = 0; i < width; ++i) {
            char c = s_[static_cast<size_t>(i)];
            if (!std::isdigit(static_cast<unsigned char>(c))) return false;
            value = value * 10 + (c - '0');
        }
        s_.remove_prefix(static_cast<size_t>(width));
        out = value;
        return true;
    }

    // Day of month padded with a space or a zero ("_2" layout)
    bool padded_day(int& out) {
        if (!s_.empty() && s_.front() == ' ') {
            s_.remove_prefix(1);
            return digits(1, out);
        }
        return digits(2, out);
    }

    template<size_t N>
    bool one_of(const std::array<std::string_view, N>& names, int& index) {
        for (size_t i = 0; i < N; ++i) {
            if (literal(names[i])) {
                index = static_cast<int>(i);
                return true;
            }
        }
        return false;
    }

    bool clock(std::tm& tm) {
        return digits(2, tm.tm_hour) && literal(":") &&
               digits(2, tm.tm_min) && literal(":") &&
               digits(2, tm.tm_sec);
    }
};

bool valid(const std::tm& tm) {
    return tm.tm_mday >= 1 && tm.tm_mday <= 31 &&
           tm.tm_hour <= 23 && tm.tm_min <= 59 && tm.tm_sec <= 60;
}

std::optional<TimePoint> to_time_point(std::tm& tm) {
    if (!valid(tm)) {
        return std::nullopt;
    }
    std::time_t t = timegm(&tm);
    return std::chrono::system_clock::from_time_t(t);
}

// Sun, 06 Nov 1994 08:49:37 GMT
std::optional<TimePoint> parse_imf_fixdate(std::string_view text) {
    Scanner in(text);
    std::tm tm{};
    int weekday = 0;
    int year = 0;
    if (in.one_of(kShortDays, weekday) && in.literal(", ") &&
        in.digits(2, tm.tm_mday) && in.literal(" ") &&
        in.one_of(kMonths, tm.tm_mon) && in.literal(" ") &&
        in.digits(4, year) && in.literal(" ") &&
        in.clock(tm) && in.literal(" GMT") && in.done()) {
        tm.tm_year = year - 1900;
        return to_time_point(tm);
    }
    return std::nullopt;
}

// Sunday, 06-Nov-94 08:49:37 GMT
std::optional<TimePoint> parse_rfc850(std::string_view text) {
    Scanner in(text);
    std::tm tm{};
    int weekday = 0;
    int year = 0;
    if (in.one_of(kLongDays, weekday) && in.literal(", ") &&
        in.digits(2, tm.tm_mday) && in.literal("-") &&
        in.one_of(kMonths, tm.tm_mon) && in.literal("-") &&
        in.digits(2, year) && in.literal(" ") &&
        in.clock(tm) && in.literal(" GMT") && in.done()) {
        tm.tm_year = year >= 69 ? year : year + 100;
        return to_time_point(tm);
    }
    return std::nullopt;
}

// Sun Nov  6 08:49:37 1994
std::optional<TimePoint> parse_asctime(std::string_view text) {
    Scanner in(text);
    std::tm tm{};
    int weekday = 0;
    int year = 0;
    if (in.one_of(kShortDays, weekday) && in.literal(" ") &&
        in.one_of(kMonths, tm.tm_mon) && in.literal(" ") &&
        in.padded_day(tm.tm_mday) && in.literal(" ") &&
        in.clock(tm) && in.literal(" ") &&
        in.digits(4, year) && in.done()) {
        tm.tm_year = year - 1900;
        return to_time_point(tm);
    }
    return std::nullopt;
}

} // anonymous namespace

std::string format(TimePoint tp) {
    auto time_t_val = std::chrono::system_clock::to_time_t(truncate_to_seconds(tp));
    std::tm tm{};
    gmtime_r(&time_t_val, &tm);

    std::ostringstream oss;
    oss.imbue(std::locale::classic());
    oss << std::put_time(&tm, "%a, %d %b %Y %H:%M:%S GMT");
    return oss.str();
}

std::optional<TimePoint> parse(std::string_view text) {
    if (auto tp = parse_imf_fixdate(text)) return tp;
    if (auto tp = parse_rfc850(text)) return tp;
    return parse_asctime(text);
}

TimePoint truncate_to_seconds(TimePoint tp) {
    auto since_epoch = tp.time_since_epoch();
    auto secs = std::chrono::duration_cast<std::chrono::seconds>(since_epoch);
    // Round toward negative infinity for times before the epoch
    if (secs > since_epoch) {
        secs -= std::chrono::seconds(1);
    }
    return TimePoint(std::chrono::duration_cast<TimePoint::duration>(secs));
}

bool is_unspecified(TimePoint tp) {
    return tp == TimePoint{} ||
           tp == std::chrono::system_clock::from_time_t(0);
}

} // namespace gatefile::http_date
