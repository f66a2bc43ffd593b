/**
 * @file market_data.cpp
 * @brief Timestamp parsing and formatting for MarketData bars.
 */

#include "data/market_data.hpp"

#include <algorithm>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace backtester
{

    namespace
    {

        // Days since 1970-01-01 for a proleptic Gregorian date. std::mktime
        // would apply the local time zone.
        long long days_from_civil(int y, int m, int d)
        {
            y -= m <= 2 ? 1 : 0;
            const long long era = (y >= 0 ? y : y - 399) / 400;
            const long long yoe = y - era * 400;
            const long long doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
            const long long doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
            return era * 146097 + doe - 719468;
        }

        void civil_from_days(long long z, int &y, int &m, int &d)
        {
            z += 719468;
            const long long era = (z >= 0 ? z : z - 146096) / 146097;
            const long long doe = z - era * 146097;
            const long long yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
            const long long doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
            const long long mp = (5 * doy + 2) / 153;
            d = static_cast<int>(doy - (153 * mp + 2) / 5 + 1);
            m = static_cast<int>(mp < 10 ? mp + 3 : mp - 9);
            y = static_cast<int>(yoe + era * 400 + (m <= 2 ? 1 : 0));
        }

        bool is_leap(int y)
        {
            return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0;
        }

        int days_in_month(int y, int m)
        {
            static const int table[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
            if (m == 2 && is_leap(y))
                return 29;
            return table[m - 1];
        }

        long long seconds_since_epoch(const Timestamp &ts)
        {
            auto secs = std::chrono::duration_cast<std::chrono::seconds>(ts.time_since_epoch()).count();
            // floor toward negative infinity for pre-epoch values
            if (std::chrono::system_clock::from_time_t(0) + std::chrono::seconds(secs) > ts)
                --secs;
            return secs;
        }

    } // anonymous namespace

    Timestamp make_timestamp(int year, int month, int day, int hour, int minute, int second)
    {
        if (month < 1 || month > 12)
            throw std::invalid_argument("month out of range: " + std::to_string(month));
        if (day < 1 || day > days_in_month(year, month))
            throw std::invalid_argument("day out of range: " + std::to_string(day));
        if (hour < 0 || hour > 23 || minute < 0 || minute > 59 || second < 0 || second > 59)
            throw std::invalid_argument("time of day out of range");

        long long secs = days_from_civil(year, month, day) * 86400LL + hour * 3600LL + minute * 60LL + second;
        return std::chrono::system_clock::time_point(
            std::chrono::duration_cast<std::chrono::system_clock::duration>(std::chrono::seconds(secs)));
    }

    Timestamp parse_timestamp(const std::string &text)
    {
        std::string normalized = text;
        std::replace(normalized.begin(), normalized.end(), 'T', ' ');
        if (!normalized.empty() && normalized.back() == 'Z')
            normalized.pop_back();

        // longest form first; a shorter one would leave trailing text
        static const char *const formats[] = {"%Y-%m-%d %H:%M:%S", "%Y-%m-%d %H:%M", "%Y-%m-%d"};
        for (const char *format : formats)
        {
            std::tm tm = {};
            std::istringstream ss(normalized);
            ss >> std::get_time(&tm, format);
            if (ss.fail())
                continue;
            ss >> std::ws;
            if (!ss.eof())
                continue;
            return make_timestamp(tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday,
                                  tm.tm_hour, tm.tm_min, tm.tm_sec);
        }
        throw std::invalid_argument("Invalid timestamp: '" + text + "'");
    }

    std::string format_timestamp(const Timestamp &ts)
    {
        long long secs = seconds_since_epoch(ts);
        long long days = secs / 86400;
        long long rem = secs % 86400;
        if (rem < 0)
        {
            rem += 86400;
            --days;
        }
        int y, m, d;
        civil_from_days(days, y, m, d);

        std::tm tm = {};
        tm.tm_year = y - 1900;
        tm.tm_mon = m - 1;
        tm.tm_mday = d;
        tm.tm_hour = static_cast<int>(rem / 3600);
        tm.tm_min = static_cast<int>((rem % 3600) / 60);
        tm.tm_sec = static_cast<int>(rem % 60);

        std::ostringstream out;
        out << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");
        return out.str();
    }

    int utc_hour(const Timestamp &ts)
    {
        long long rem = seconds_since_epoch(ts) % 86400;
        if (rem < 0)
            rem += 86400;
        return static_cast<int>(rem / 3600);
    }

    std::vector<std::string> unique_symbols(const std::vector<MarketData> &bars)
    {
        std::vector<std::string> out;
        for (const auto &bar : bars)
        {
            if (std::find(out.begin(), out.end(), bar.symbol) == out.end())
                out.push_back(bar.symbol);
        }
        return out;
    }

} // namespace backtester
