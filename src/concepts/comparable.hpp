// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#ifndef comparable_hpp
#define comparable_hpp

namespace varcanon {

/**
 Types deriving from Comparable implement operator== and operator< and get the
 remaining comparison operators.
 */
template <typename T>
class Comparable {};

template <typename T>
inline bool operator!=(const Comparable<T>& lhs, const Comparable<T>& rhs)
{
    return !operator==(static_cast<const T&>(lhs), static_cast<const T&>(rhs));
}

template <typename T>
inline bool operator>(const Comparable<T>& lhs, const Comparable<T>& rhs)
{
    return operator<(static_cast<const T&>(rhs), static_cast<const T&>(lhs));
}

template <typename T>
inline bool operator<=(const Comparable<T>& lhs, const Comparable<T>& rhs)
{
    return !operator<(static_cast<const T&>(rhs), static_cast<const T&>(lhs));
}

template <typename T>
inline bool operator>=(const Comparable<T>& lhs, const Comparable<T>& rhs)
{
    return !operator<(static_cast<const T&>(lhs), static_cast<const T&>(rhs));
}

} // namespace varcanon

#endif
