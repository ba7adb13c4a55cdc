#ifndef _LIB_IPNET_INPUT_ITERATOR_HPP_
#define _LIB_IPNET_INPUT_ITERATOR_HPP_

#include <cstddef>
#include <iterator>
#include <memory>
#include <optional>

namespace libipnet::detail {

/**
 * Adapts a cursor with a `std::optional<T> next()` function to the
 * standard input iterator interface, so that cursors work with range-for
 * and the standard algorithms.  A default constructed iterator is the end
 * sentinel.
 */
template <typename Cursor, typename T> class input_iterator
{
    Cursor* m_cursor = nullptr;
    std::optional<T> m_value;

public:
    using iterator_category = std::input_iterator_tag;
    using value_type = T;
    using difference_type = std::ptrdiff_t;
    using pointer = const T*;
    using reference = const T&;

    input_iterator() = default;

    explicit input_iterator(Cursor& cursor)
        : m_cursor(std::addressof(cursor))
        , m_value(cursor.next())
    {}

    reference operator*() const { return (*m_value); }

    pointer operator->() const { return (std::addressof(*m_value)); }

    input_iterator& operator++()
    {
        m_value = m_cursor->next();
        return (*this);
    }

    input_iterator operator++(int)
    {
        auto tmp = *this;
        operator++();
        return (tmp);
    }

    bool operator==(const input_iterator& other) const
    {
        if (!m_value || !other.m_value) {
            return (m_value.has_value() == other.m_value.has_value());
        }
        return (m_cursor == other.m_cursor && *m_value == *other.m_value);
    }

    bool operator!=(const input_iterator& other) const
    {
        return (!(*this == other));
    }
};

} // namespace libipnet::detail

#endif /* _LIB_IPNET_INPUT_ITERATOR_HPP_ */
