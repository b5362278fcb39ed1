#include "utils.hpp"
#include <iomanip>    // For std::put_time, std::get_time
#include <sstream>    // For string streams
#include <string>
#include <stdexcept>  // For std::runtime_error
#include <cctype>     // For std::isdigit
#include <chrono>
#include <ctime>

namespace core {
namespace utils {

    namespace {
        constexpr long long kSecondsPerDay = 86400;

        // Floor division so that instants before the epoch land on the right day
        long long utcDayNumber(const Timestamp& ts) {
            long long secs = std::chrono::duration_cast<std::chrono::seconds>(ts.time_since_epoch()).count();
            long long day = secs / kSecondsPerDay;
            if (secs % kSecondsPerDay < 0) {
                --day;
            }
            return day;
        }
    } // end anonymous namespace

    Timestamp stringToTimestamp(const std::string& iso_string) {
        std::tm tm = {};
        std::istringstream ss(iso_string);

        // 1. Date part is mandatory
        ss >> std::get_time(&tm, "%Y-%m-%d");
        if (ss.fail()) {
            throw std::runtime_error("Failed to parse timestamp (date part): " + iso_string);
        }

        std::chrono::nanoseconds fractional_seconds(0);
        std::chrono::seconds offset_duration = std::chrono::seconds(0);

        if (ss.peek() == 'T' || ss.peek() == ' ') {
            ss.ignore();
            // 2. Time part up to seconds
            ss >> std::get_time(&tm, "%H:%M:%S");
            if (ss.fail()) {
                throw std::runtime_error("Failed to parse timestamp (time part): " + iso_string);
            }

            // 3. Optional fractional seconds
            if (ss.peek() == '.') {
                ss.ignore(); // consume '.'
                std::string digits;
                while (std::isdigit(ss.peek()) && digits.size() < 9) {
                    digits += static_cast<char>(ss.get());
                }
                while (std::isdigit(ss.peek())) {
                    ss.ignore();
                }
                if (!digits.empty()) {
                    digits.resize(9, '0'); // nanoseconds, exact for any digit count
                    fractional_seconds = std::chrono::nanoseconds(std::stoll(digits));
                }
            }

            // 4. Optional timezone offset (+HH:MM, -HH:MM, or Z); absent means UTC
            char sign_or_z = 0;
            if (ss >> sign_or_z) {
                if (sign_or_z == 'Z') {
                    offset_duration = std::chrono::seconds(0);
                } else if (sign_or_z == '+' || sign_or_z == '-') {
                    int offset_h = 0;
                    int offset_m = 0;
                    char colon = ' ';
                    if (!(ss >> std::setw(2) >> offset_h >> colon >> std::setw(2) >> offset_m) || colon != ':') {
                        throw std::runtime_error("Failed to parse timestamp (timezone offset HH:MM): " + iso_string);
                    }
                    offset_duration = std::chrono::hours(offset_h) + std::chrono::minutes(offset_m);
                    if (sign_or_z == '-') {
                        offset_duration *= -1;
                    }
                } else {
                    throw std::runtime_error("Invalid timezone indicator '" + std::string(1, sign_or_z) + "' in timestamp: " + iso_string);
                }
            }
        }

        char trailing = 0;
        if (ss >> trailing) {
            throw std::runtime_error("Unexpected trailing characters in timestamp: " + iso_string);
        }

        // timegm interprets struct tm as UTC; _mkgmtime on Windows
        #ifdef _WIN32
            time_t tt = _mkgmtime(&tm);
        #else
            time_t tt = timegm(&tm);
        #endif
        if (tt == static_cast<time_t>(-1)) {
            throw std::runtime_error("Failed to convert parsed date/time to UTC epoch seconds: " + iso_string);
        }

        auto base_tp_utc = std::chrono::system_clock::from_time_t(tt);
        base_tp_utc += std::chrono::duration_cast<std::chrono::system_clock::duration>(fractional_seconds);

        // 2015-04-20T00:00:00+05:30 is 2015-04-19T18:30:00Z
        return base_tp_utc - offset_duration;
    }

    std::string timestampToString(const Timestamp& ts, bool with_millis) {
        // Floor so instants before the epoch keep a non-negative fraction
        auto whole_seconds = std::chrono::floor<std::chrono::seconds>(ts);
        auto tt = std::chrono::system_clock::to_time_t(whole_seconds);

        std::tm time_tm;
        #ifdef _WIN32
            gmtime_s(&time_tm, &tt);
        #else
            gmtime_r(&tt, &time_tm);
        #endif

        std::ostringstream oss;
        oss << std::put_time(&time_tm, "%Y-%m-%dT%H:%M:%S");
        if (with_millis) {
            auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(ts - whole_seconds).count();
            oss << '.' << std::setw(3) << std::setfill('0') << millis;
        }
        oss << "Z";
        return oss.str();
    }

    double daysBetween(const Timestamp& start, const Timestamp& end) {
        auto diff = std::chrono::duration_cast<std::chrono::seconds>(end - start).count();
        if (utcDayNumber(start) == utcDayNumber(end)) {
            return static_cast<double>(diff) / static_cast<double>(kSecondsPerDay);
        }
        return static_cast<double>(diff / kSecondsPerDay); // integer division truncates toward zero
    }

    std::optional<double> daysBetween(const std::optional<Timestamp>& start,
                                      const std::optional<Timestamp>& end) {
        if (!start || !end) {
            return std::nullopt;
        }
        return daysBetween(*start, *end);
    }

    std::string actionToString(Action action) {
        switch (action) {
            case Action::Buy:       return "buy";
            case Action::Sell:      return "sell";
            case Action::CloseBuy:  return "close_buy";
            case Action::CloseSell: return "close_sell";
        }
        return "unknown";
    }

    Action actionFromString(const std::string& action_str) {
        if (action_str == "buy") return Action::Buy;
        if (action_str == "sell") return Action::Sell;
        if (action_str == "close_buy") return Action::CloseBuy;
        if (action_str == "close_sell") return Action::CloseSell;
        throw std::invalid_argument("Unknown action string: " + action_str);
    }

    std::string positionToString(PositionState position) {
        switch (position) {
            case PositionState::None:  return "none";
            case PositionState::Long:  return "long";
            case PositionState::Short: return "short";
        }
        return "unknown";
    }

} // namespace utils
} // namespace core
