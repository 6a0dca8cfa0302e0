#include "libjsonselect/utils.hpp"

namespace libjsonselect {

std::string quote_name(std::string_view name) {
  static constexpr char hex_digits[]{"0123456789abcdef"};
  std::string rv{"'"};

  for (const auto c : name) {
    switch (c) {
    case '\\':
      rv.append("\\\\");
      break;
    case '\'':
      rv.append("\\'");
      break;
    case '\b':
      rv.append("\\b");
      break;
    case '\f':
      rv.append("\\f");
      break;
    case '\n':
      rv.append("\\n");
      break;
    case '\r':
      rv.append("\\r");
      break;
    case '\t':
      rv.append("\\t");
      break;
    default:
      if (static_cast<unsigned char>(c) <= 0x1F) {
        rv.append("\\u00");
        rv.push_back(hex_digits[(c >> 4) & 0x0F]);
        rv.push_back(hex_digits[c & 0x0F]);
      } else {
        rv.push_back(c);
      }
    }
  }

  rv.push_back('\'');
  return rv;
}

std::string::size_type utf8_sequence_length(
    std::string_view sv, std::string::size_type index) noexcept {
  if (index >= sv.length()) {
    return 0;
  }

  const auto lead{static_cast<unsigned char>(sv[index])};
  if (lead < 0x80) {
    return 1;
  }

  // Valid range of the second byte, narrower than 80..BF after some leads.
  unsigned char lower{0x80};
  unsigned char upper{0xBF};
  std::string::size_type length{};

  if (lead >= 0xC2 && lead <= 0xDF) {
    length = 2;
  } else if (lead >= 0xE0 && lead <= 0xEF) {
    length = 3;
    if (lead == 0xE0) {
      lower = 0xA0; // overlong
    } else if (lead == 0xED) {
      upper = 0x9F; // surrogates
    }
  } else if (lead >= 0xF0 && lead <= 0xF4) {
    length = 4;
    if (lead == 0xF0) {
      lower = 0x90; // overlong
    } else if (lead == 0xF4) {
      upper = 0x8F; // above U+10FFFF
    }
  } else {
    return 0;
  }

  if (index + length > sv.length()) {
    return 0;
  }

  const auto second{static_cast<unsigned char>(sv[index + 1])};
  if (second < lower || second > upper) {
    return 0;
  }

  for (auto i{index + 2}; i < index + length; i++) {
    if ((static_cast<unsigned char>(sv[i]) & 0xC0) != 0x80) {
      return 0;
    }
  }

  return length;
}

} // namespace libjsonselect
