#include <fcomb/base/chrono.h>

namespace fcomb
{
    std::string format_time_userfriendly(const std::chrono::nanoseconds& nanos)
    {
        using std::chrono::duration_cast;
        using std::chrono::hours;
        using std::chrono::milliseconds;
        using std::chrono::minutes;
        using std::chrono::nanoseconds;
        using std::chrono::seconds;

        auto ns_total = nanos.count();
        if (ns_total < 0)
        {
            ns_total = 0;
        }

        std::string ret;

        const auto one_day_ns = duration_cast<nanoseconds>(hours(24)).count();
        if (ns_total >= one_day_ns)
        {
            const auto d = ns_total / one_day_ns;
            ns_total %= one_day_ns;
            fmt::format_to(std::back_inserter(ret), "{}d", d);
        }

        const auto one_hour_ns = duration_cast<nanoseconds>(hours(1)).count();
        if (ns_total >= one_hour_ns)
        {
            const auto h = ns_total / one_hour_ns;
            ns_total %= one_hour_ns;
            fmt::format_to(std::back_inserter(ret), "{}h", h);
        }

        const auto one_minute_ns = duration_cast<nanoseconds>(minutes(1)).count();
        if (ns_total >= one_minute_ns)
        {
            const auto m = ns_total / one_minute_ns;
            ns_total %= one_minute_ns;
            fmt::format_to(std::back_inserter(ret), "{}m", m);
        }

        const auto one_second_ns = duration_cast<nanoseconds>(seconds(1)).count();
        const auto one_millisecond_ns = duration_cast<nanoseconds>(milliseconds(1)).count();
        const auto s = ns_total / one_second_ns;
        ns_total %= one_second_ns;
        const auto ms = ns_total / one_millisecond_ns;
        fmt::format_to(std::back_inserter(ret), "{}.{:03}s", s, ms);
        return ret;
    }

    ElapsedTimer::ElapsedTimer() noexcept : m_start_tick(clock::now().time_since_epoch().count()) { }

    std::string ElapsedTime::to_string() const { return format_time_userfriendly(as<std::chrono::nanoseconds>()); }
    void ElapsedTime::to_string(std::string& into) const
    {
        into += format_time_userfriendly(as<std::chrono::nanoseconds>());
    }

    std::string ElapsedTimer::to_string() const { return elapsed().to_string(); }
    void ElapsedTimer::to_string(std::string& into) const { return elapsed().to_string(into); }
}
