#pragma once

#include <memory>
#include <string>

#include "sl/result.h"

namespace re2 {
class RE2;
}

namespace sl {

// Compiled regular expression backed by RE2. Matching runs in time linear in
// the input and never recurses per character, so long items are safe.
// Patterns use RE2 syntax: (?i) flags, (?P<name>...) groups, \d, [[:upper:]].
// Items are treated as UTF-8.
//
// Construction goes through compile() so that a malformed pattern comes back
// as a Result instead of an exception. Move-only.
class Regex {
  public:
    // Matches nothing. Exists so Result<Regex> can hold an empty value.
    Regex();
    ~Regex();
    Regex(Regex &&other);
    Regex &operator=(Regex &&other);

    // Fails with ResultError::INVALID_PATTERN carrying RE2's message.
    static Result<Regex> compile(const std::string &pattern);

    // True if the pattern matches anywhere in text.
    bool search(const std::string &text) const;

    // Replaces every non-overlapping match in text with repl, expanded per
    // match: $1 or ${1} for a numbered group, $name or ${name} for a named
    // group, $0 for the whole match, $$ for a literal $. References to groups
    // that do not exist or did not participate expand to nothing. An empty
    // match directly after a previous match is not replaced.
    std::string replaceAll(const std::string &text,
                           const std::string &repl) const;

    const std::string &pattern() const { return mPattern; }

  private:
    Regex(const std::string &pattern, std::unique_ptr<re2::RE2> re);

    Regex(const Regex &) = delete;
    Regex &operator=(const Regex &) = delete;

    std::string mPattern;
    std::unique_ptr<re2::RE2> mRe;
};

} // namespace sl
