#pragma once

#include <string>
#include <string_view>

namespace waypoint::url {

// Decodes within the provided buffer, compacting percent-encoded sequences and translating '+' into
// 'plusAs'. Returns a pointer to the new logical end of the decoded sequence.
// On invalid encoding (truncated % or non-hex digits):
//   - if 'strictInvalid' is true, returns nullptr, leaving the buffer in an unspecified partially modified state
//   - otherwise the invalid sequence is kept verbatim.
// plusAs should be ' ' only for query string components, not for paths.
char* DecodeInPlace(char* first, const char* last, char plusAs = '+', bool strictInvalid = true);

// Decodes a query string key or value in the application/x-www-form-urlencoded format ('+' is a space),
// as best effort: invalid percent sequences are kept verbatim.
std::string DecodeQueryComponent(std::string_view component);

}  // namespace waypoint::url
