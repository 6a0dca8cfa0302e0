#ifndef LIBJSONSELECT_UTILS_H
#define LIBJSONSELECT_UTILS_H

#include <string>      // std::string
#include <string_view> // std::string_view

namespace libjsonselect {

// Return _name_ wrapped in single quotes, escaping backslashes, single quotes
// and control characters so the result can be parsed back into _name_.
std::string quote_name(std::string_view name);

// Return the length in bytes of the well-formed UTF-8 sequence starting at
// _index_ in _sv_, or 0 if the bytes at _index_ are not well-formed UTF-8.
// Overlong forms, encoded surrogates and code points above U+10FFFF are
// rejected.
std::string::size_type utf8_sequence_length(
    std::string_view sv, std::string::size_type index) noexcept;

} // namespace libjsonselect

#endif // LIBJSONSELECT_UTILS_H
