// tests/glob/test_glob_match.cpp
//
// Glob semantics used by every rule: '*' only, case-sensitive, fully anchored.

#include <string>

#include "glob_match.h"
#include "test_support.h"

using namespace veto;
using veto_test::check;

static void expect(const std::string& pat, const std::string& text, bool want) {
    check(glob_match(pat, text) == want,
          "glob_match(\"" + pat + "\", \"" + text + "\") expected " + (want ? "true" : "false"));
}

int main() {
    // Literal patterns must equal the whole command.
    expect("pwd", "pwd", true);
    expect("pwd", "pwd ", false);
    expect("pwd", " pwd", false);
    expect("", "", true);
    expect("", "x", false);

    // Stars at either end.
    expect("git push*", "git push", true);
    expect("git push*", "git push origin main", true);
    expect("*AWS_SECRET*", "export AWS_SECRET_ACCESS_KEY=1", true);
    expect("*.pem", "/home/u/server.pem", true);
    expect("*.pem", "/home/u/server.pem.bak", false);

    // Multiple stars; the documented examples.
    expect("git push*-f*", "git push origin main -f", true);
    expect("git push*-f*", "git push -f origin main --force", true);
    expect("git push*-f*", "git pull -f", false);
    expect("rm * -rf", "rm build -rf", true);
    expect("a*b*c", "abc", true);
    expect("a*b*c", "aXbYc", true);
    expect("a*b*c", "acb", false);
    expect("*a*a*a*", "aaa", true);
    expect("*a*a*a*", "aa", false);

    // Needs backtracking past an early partial match.
    expect("*ab*cd", "abxabcxcd", true);
    expect("dd if=* of=/dev/*", "dd if=/dev/zero of=/dev/sda bs=1M", true);

    // Case and whitespace are significant.
    expect("DROP DATABASE*", "DROP DATABASE prod", true);
    expect("DROP DATABASE*", "drop database prod", false);
    expect("rm -rf *", "rm  -rf x", false);

    // Only '*' is special.
    expect("ls?", "ls?", true);
    expect("ls?", "lsx", false);
    expect("[ab]", "a", false);
    expect(":(){ :|:& };:", ":(){ :|:& };:", true);

    // Validation.
    std::string err;
    check(validate_pattern("git push*", &err), "plain pattern is valid");
    check(!validate_pattern("", &err), "empty pattern rejected");
    check(!validate_pattern("rm -rf\n/", &err), "LF rejected");
    check(!validate_pattern("rm\r", &err), "CR rejected");
    check(!validate_pattern(std::string("a\0b", 3), &err), "NUL rejected");
    check(!err.empty(), "rejection sets err");

    check(pattern_matches_everything("*"), "'*' matches everything");
    check(pattern_matches_everything("***"), "'***' matches everything");
    check(!pattern_matches_everything("*x*"), "'*x*' does not match everything");

    return veto_test::finish("test_glob_match");
}
