#pragma once

#include <fcomb/base/fwd/optional.h>

#include <fcomb/base/checks.h>
#include <fcomb/base/lineinfo.h>

#include <new>
#include <type_traits>
#include <utility>

namespace fcomb
{
    struct NullOpt
    {
        explicit constexpr NullOpt(int) { }
    };

    const static constexpr NullOpt nullopt{0};

    template<class T>
    struct Optional
    {
        static_assert(!std::is_reference<T>::value, "Optional<T&> is not supported; use T* instead");

        constexpr Optional() noexcept : m_is_present(false), m_inactive() { }

        // Constructors are intentionally implicit
        constexpr Optional(NullOpt) noexcept : m_is_present(false), m_inactive() { }

        template<class U,
                 std::enable_if_t<!std::is_same<std::decay_t<U>, Optional>::value &&
                                      !std::is_same<std::decay_t<U>, NullOpt>::value &&
                                      std::is_constructible<T, U>::value,
                                  int> = 0>
        Optional(U&& t) noexcept(std::is_nothrow_constructible<T, U>::value)
            : m_is_present(true), m_t(std::forward<U>(t))
        {
        }

        Optional(const Optional& o) : m_is_present(false), m_inactive()
        {
            if (o.m_is_present)
            {
                new (&m_t) T(o.m_t);
                m_is_present = true;
            }
        }

        Optional(Optional&& o) noexcept(std::is_nothrow_move_constructible<T>::value)
            : m_is_present(false), m_inactive()
        {
            if (o.m_is_present)
            {
                new (&m_t) T(std::move(o.m_t));
                m_is_present = true;
            }
        }

        Optional& operator=(const Optional& o)
        {
            if (m_is_present && o.m_is_present)
            {
                m_t = o.m_t;
            }
            else if (!m_is_present && o.m_is_present)
            {
                new (&m_t) T(o.m_t);
                m_is_present = true;
            }
            else if (m_is_present && !o.m_is_present)
            {
                destroy();
            }

            return *this;
        }

        Optional& operator=(Optional&& o) noexcept // enforces termination
        {
            if (m_is_present && o.m_is_present)
            {
                m_t = std::move(o.m_t);
            }
            else if (!m_is_present && o.m_is_present)
            {
                new (&m_t) T(std::move(o.m_t));
                m_is_present = true;
            }
            else if (m_is_present && !o.m_is_present)
            {
                destroy();
            }

            return *this;
        }

        ~Optional()
        {
            if (m_is_present)
            {
                m_t.~T();
            }
        }

        constexpr bool has_value() const noexcept { return m_is_present; }
        constexpr explicit operator bool() const noexcept { return m_is_present; }

        const T* get() const& noexcept { return m_is_present ? &m_t : nullptr; }
        T* get() & noexcept { return m_is_present ? &m_t : nullptr; }
        const T* get() const&& = delete;
        T* get() && = delete;

        template<class... Args>
        T& emplace(Args&&... args)
        {
            if (m_is_present) destroy();
            new (&m_t) T(std::forward<Args>(args)...);
            m_is_present = true;
            return m_t;
        }

        void clear() noexcept
        {
            if (m_is_present)
            {
                destroy();
            }
        }

        T&& value_or_exit(const LineInfo& line_info) && noexcept
        {
            Checks::check_exit(line_info, m_is_present, "Value was null");
            return std::move(m_t);
        }

        T& value_or_exit(const LineInfo& line_info) & noexcept
        {
            Checks::check_exit(line_info, m_is_present, "Value was null");
            return m_t;
        }

        const T& value_or_exit(const LineInfo& line_info) const& noexcept
        {
            Checks::check_exit(line_info, m_is_present, "Value was null");
            return m_t;
        }

        template<class U>
        T value_or(U&& default_value) const&
        {
            return m_is_present ? m_t : static_cast<T>(std::forward<U>(default_value));
        }

        template<class U>
        T value_or(U&& default_value) &&
        {
            return m_is_present ? std::move(m_t) : static_cast<T>(std::forward<U>(default_value));
        }

        template<class F>
        using map_t = decltype(std::declval<F&>()(std::declval<const T&>()));

        template<class F>
        Optional<map_t<F>> map(F f) const&
        {
            if (m_is_present)
            {
                return f(m_t);
            }

            return nullopt;
        }

        template<class F>
        map_t<F> then(F f) const&
        {
            if (m_is_present)
            {
                return f(m_t);
            }

            return nullopt;
        }

        friend bool operator==(const Optional& lhs, const Optional& rhs)
        {
            if (lhs.m_is_present)
            {
                return rhs.m_is_present && lhs.m_t == rhs.m_t;
            }

            return !rhs.m_is_present;
        }
        friend bool operator!=(const Optional& lhs, const Optional& rhs) { return !(lhs == rhs); }

    private:
        void destroy() noexcept
        {
            m_is_present = false;
            m_t.~T();
            m_inactive = '\0';
        }

        bool m_is_present;
        union
        {
            char m_inactive;
            T m_t;
        };
    };

    template<class T, class U>
    auto operator==(const Optional<T>& lhs, const U& rhs) -> decltype(*lhs.get() == rhs)
    {
        return lhs.has_value() && *lhs.get() == rhs;
    }
    template<class T, class U>
    auto operator!=(const Optional<T>& lhs, const U& rhs) -> decltype(*lhs.get() != rhs)
    {
        return !lhs.has_value() || *lhs.get() != rhs;
    }
}
