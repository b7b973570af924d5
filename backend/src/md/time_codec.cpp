#include "time_codec.hpp"

#include <cstdio>
#include <stdexcept>

using namespace std::chrono;

namespace {

bool read_fixed(std::string_view s, std::size_t pos, std::size_t len, int &out)
{
    if (pos + len > s.size()) return false;
    int v = 0;
    for (std::size_t i = pos; i < pos + len; ++i)
    {
        const char c = s[i];
        if (c < '0' || c > '9') return false;
        v = v * 10 + (c - '0');
    }
    out = v;
    return true;
}

} // namespace

bool TimeCodec::try_parse_iso8601(std::string_view s, Timestamp &out)
{
    int y = 0, mo = 0, d = 0;
    if (!read_fixed(s, 0, 4, y) || s.size() < 10 || s[4] != '-' ||
        !read_fixed(s, 5, 2, mo) || s[7] != '-' || !read_fixed(s, 8, 2, d))
        return false;

    const year_month_day ymd{year{y}, month{static_cast<unsigned>(mo)}, day{static_cast<unsigned>(d)}};
    if (!ymd.ok()) return false;
    Timestamp ts = time_point_cast<nanoseconds>(sys_days{ymd});

    if (s.size() == 10)
    {
        out = ts;
        return true;
    }
    if (s[10] != 'T' && s[10] != 't' && s[10] != ' ') return false;

    int hh = 0, mm = 0, ss = 0;
    if (!read_fixed(s, 11, 2, hh) || s.size() < 19 || s[13] != ':' ||
        !read_fixed(s, 14, 2, mm) || s[16] != ':' || !read_fixed(s, 17, 2, ss))
        return false;
    if (hh > 23 || mm > 59 || ss > 60) return false;
    ts += hours{hh} + minutes{mm} + seconds{ss};

    std::size_t i = 19;
    if (i < s.size() && s[i] == '.')
    {
        ++i;
        std::int64_t frac = 0;
        int digits = 0;
        while (i < s.size() && s[i] >= '0' && s[i] <= '9')
        {
            if (digits < 9)
            {
                frac = frac * 10 + (s[i] - '0');
                ++digits;
            }
            ++i;
        }
        if (digits == 0) return false;
        for (int k = digits; k < 9; ++k) frac *= 10;
        ts += nanoseconds{frac};
    }

    if (i >= s.size()) return false; // offset is mandatory for date-times
    if (s[i] == 'Z' || s[i] == 'z')
    {
        ++i;
    }
    else if (s[i] == '+' || s[i] == '-')
    {
        const bool ahead = (s[i] == '+');
        int oh = 0, om = 0;
        if (!read_fixed(s, i + 1, 2, oh) || i + 3 >= s.size() || s[i + 3] != ':' ||
            !read_fixed(s, i + 4, 2, om))
            return false;
        const auto offset = hours{oh} + minutes{om};
        ts = ahead ? ts - offset : ts + offset;
        i += 6;
    }
    else
    {
        return false;
    }
    if (i != s.size()) return false;

    out = ts;
    return true;
}

Timestamp TimeCodec::parse_iso8601(std::string_view text)
{
    Timestamp ts;
    if (!try_parse_iso8601(text, ts))
        throw std::invalid_argument("invalid ISO-8601 timestamp: '" + std::string(text) + "'");
    return ts;
}

std::string TimeCodec::to_iso8601(Timestamp ts)
{
    const auto day_point = floor<days>(ts);
    const year_month_day ymd{day_point};
    auto rem = ts - day_point;
    const auto h = duration_cast<hours>(rem);
    rem -= h;
    const auto m = duration_cast<minutes>(rem);
    rem -= m;
    const auto s = duration_cast<seconds>(rem);
    rem -= s;
    const auto ns = duration_cast<nanoseconds>(rem).count();

    char buf[48];
    int n = std::snprintf(buf, sizeof(buf), "%04d-%02u-%02uT%02d:%02d:%02d",
                          static_cast<int>(ymd.year()), static_cast<unsigned>(ymd.month()),
                          static_cast<unsigned>(ymd.day()), static_cast<int>(h.count()),
                          static_cast<int>(m.count()), static_cast<int>(s.count()));
    std::string out(buf, static_cast<std::size_t>(n));
    if (ns != 0)
    {
        char frac[16];
        std::snprintf(frac, sizeof(frac), ".%09lld", static_cast<long long>(ns));
        std::string f(frac);
        while (f.back() == '0') f.pop_back();
        out += f;
    }
    out += 'Z';
    return out;
}

std::string TimeCodec::to_date(Timestamp ts)
{
    const year_month_day ymd{floor<days>(ts)};
    char buf[16];
    int n = std::snprintf(buf, sizeof(buf), "%04d-%02u-%02u", static_cast<int>(ymd.year()),
                          static_cast<unsigned>(ymd.month()), static_cast<unsigned>(ymd.day()));
    return std::string(buf, static_cast<std::size_t>(n));
}

Timestamp TimeCodec::from_epoch_millis(std::int64_t ms)
{
    return Timestamp{duration_cast<nanoseconds>(milliseconds{ms})};
}

std::int64_t TimeCodec::to_epoch_millis(Timestamp ts)
{
    return duration_cast<milliseconds>(ts.time_since_epoch()).count();
}
