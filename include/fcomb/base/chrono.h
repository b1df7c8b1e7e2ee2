#pragma once

#include <fcomb/base/fmt.h>

#include <atomic>
#include <chrono>
#include <string>

namespace fcomb
{
    struct ElapsedTime
    {
        using clock = std::chrono::steady_clock;
        using duration = clock::duration;

        constexpr ElapsedTime() noexcept : m_duration() { }
        constexpr ElapsedTime(duration d) noexcept : m_duration(d) { }

        template<class TimeUnit>
        TimeUnit as() const
        {
            return std::chrono::duration_cast<TimeUnit>(m_duration);
        }

        ElapsedTime& operator+=(const ElapsedTime& other)
        {
            m_duration += other.m_duration;
            return *this;
        }

        std::string to_string() const;
        void to_string(std::string& into) const;

    private:
        duration m_duration;
    };

    // This type is safe to access from multiple threads.
    struct ElapsedTimer
    {
        using clock = std::chrono::steady_clock;
        using duration = clock::duration;
        using time_point = clock::time_point;
        using rep = clock::rep;

        ElapsedTimer() noexcept;

        ElapsedTime elapsed() const
        {
            return ElapsedTime(clock::now() - time_point(duration(this->m_start_tick.load())));
        }

        std::string to_string() const;
        void to_string(std::string& into) const;

    private:
        // This atomic stores rep rather than time_point to support older compilers
        std::atomic<rep> m_start_tick;
    };

    // Formats like 1h2m3.004s; the seconds part is always present.
    std::string format_time_userfriendly(const std::chrono::nanoseconds& nanos);
}

FCOMB_FORMAT_WITH_TO_STRING(fcomb::ElapsedTime);
FCOMB_FORMAT_WITH_TO_STRING(fcomb::ElapsedTimer);
