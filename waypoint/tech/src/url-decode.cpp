#include "waypoint/url-decode.hpp"

#include <cstddef>
#include <string>
#include <string_view>

#include "waypoint/ascii.hpp"

namespace waypoint::url {

char* DecodeInPlace(char* first, const char* last, char plusAs, bool strictInvalid) {
  char* out = first;
  for (; first < last; ++first) {
    const char ch = *first;
    switch (ch) {
      case '+':
        *out++ = plusAs;
        break;
      case '%': {
        if (first + 2 >= last) {
          if (strictInvalid) {
            return nullptr;
          }
          *out++ = '%';
          break;
        }
        const char c1 = *++first;
        const char c2 = *++first;
        const int v1 = FromHexDigit(c1);
        const int v2 = FromHexDigit(c2);
        if (v1 < 0 || v2 < 0) {
          if (strictInvalid) {
            return nullptr;
          }
          *out++ = '%';
          *out++ = c1;
          *out++ = c2;
          break;
        }
        *out++ = static_cast<char>((v1 << 4) | v2);
        break;
      }
      default:
        *out++ = ch;
        break;
    }
  }
  return out;
}

std::string DecodeQueryComponent(std::string_view component) {
  std::string decoded(component);
  char* first = decoded.data();
  const char* newEnd = DecodeInPlace(first, first + decoded.size(), ' ', /*strictInvalid*/ false);
  decoded.resize(static_cast<std::size_t>(newEnd - first));
  return decoded;
}

}  // namespace waypoint::url
