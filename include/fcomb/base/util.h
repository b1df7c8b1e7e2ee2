#pragma once

#include <fcomb/base/optional.h>

#include <algorithm>
#include <type_traits>
#include <utility>
#include <vector>

namespace fcomb::Util
{
    namespace Vectors
    {
        template<class Container, class T>
        void append(std::vector<T>* augend, Container&& addend)
        {
            if constexpr (std::is_lvalue_reference_v<Container> || std::is_const_v<Container>)
            {
                augend->insert(augend->end(), addend.begin(), addend.end());
            }
            else
            {
                augend->insert(
                    augend->end(), std::make_move_iterator(addend.begin()), std::make_move_iterator(addend.end()));
            }
        }

        template<class Vec, class Key>
        bool contains(const Vec& container, const Key& item)
        {
            return std::find(container.begin(), container.end(), item) != container.end();
        }
    }

    template<class Container, class Pred>
    void erase_remove_if(Container& cont, Pred pred)
    {
        cont.erase(std::remove_if(cont.begin(), cont.end(), pred), cont.end());
    }

    template<class Container, class Pred>
    bool any_of(const Container& cont, Pred pred)
    {
        return std::any_of(cont.begin(), cont.end(), pred);
    }

    template<class Container, class Pred>
    bool all_of(const Container& cont, Pred pred)
    {
        return std::all_of(cont.begin(), cont.end(), pred);
    }

    template<class Container, class Pred>
    auto find_if(Container&& cont, Pred pred)
    {
        using std::begin;
        using std::end;
        return std::find_if(begin(cont), end(cont), pred);
    }

    template<class Range>
    void sort_unique_erase(Range& cont)
    {
        using std::begin;
        using std::end;
        std::sort(begin(cont), end(cont));
        cont.erase(std::unique(begin(cont), end(cont)), end(cont));
    }
}
