#pragma once
#include <string>

namespace veto {

/*
Command glob matching
=====================

Pattern syntax:
- '*' matches any run of characters, including the empty run.
- Every other byte matches itself, case-sensitively.
- The whole command must be consumed (implicit anchoring at both ends).

No character classes, no '?', no escaping. The command text is never
normalized: whitespace and case are significant.
*/
bool glob_match(const std::string& pattern, const std::string& text);

/*
Reject patterns that cannot be a deliberate rule:
- empty
- containing NUL, CR or LF (a command line never contains them)

Returns true if the pattern is usable; otherwise sets *err.
*/
bool validate_pattern(const std::string& pattern, std::string* err);

// True if the pattern consists only of '*' (matches every input).
bool pattern_matches_everything(const std::string& pattern);

} // namespace veto
