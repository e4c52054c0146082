#include "sl/regex.h"

#include <map>
#include <vector>

#include <re2/re2.h>

#include "sl/config.h"
#include "sl/log.h"

namespace sl {

namespace {

// Length of the UTF-8 sequence starting at text[pos]; 1 for a stray or
// truncated byte so that invalid input still advances.
size_t utf8Width(const std::string &text, size_t pos) {
    unsigned char lead = static_cast<unsigned char>(text[pos]);
    size_t width = 1;
    if (lead >= 0xC2 && lead <= 0xDF) {
        width = 2;
    } else if (lead >= 0xE0 && lead <= 0xEF) {
        width = 3;
    } else if (lead >= 0xF0 && lead <= 0xF4) {
        width = 4;
    }
    if (pos + width > text.size()) {
        return 1;
    }
    for (size_t i = 1; i < width; ++i) {
        unsigned char c = static_cast<unsigned char>(text[pos + i]);
        if ((c & 0xC0) != 0x80) {
            return 1;
        }
    }
    return width;
}

bool isNameChar(char c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
           (c >= '0' && c <= '9') || c == '_';
}

// Parses the reference following a '$' at repl[pos]: "name" or "{name}".
// On success stores the name, the group number (-1 if the name is not a plain
// number without leading zeros) and the position just past the reference.
bool parseReference(const std::string &repl, size_t pos, std::string *name,
                    int *num, size_t *next) {
    bool brace = false;
    if (pos < repl.size() && repl[pos] == '{') {
        brace = true;
        ++pos;
    }
    size_t end = pos;
    while (end < repl.size() && isNameChar(repl[end])) {
        ++end;
    }
    if (end == pos) {
        return false;
    }
    *name = repl.substr(pos, end - pos);
    if (brace) {
        if (end >= repl.size() || repl[end] != '}') {
            return false;
        }
        ++end;
    }

    *num = 0;
    for (size_t i = 0; i < name->size(); ++i) {
        char c = (*name)[i];
        if (c < '0' || c > '9' || *num >= 100000000) {
            *num = -1;
            break;
        }
        *num = *num * 10 + (c - '0');
    }
    if (name->size() > 1 && (*name)[0] == '0') {
        *num = -1;
    }
    *next = end;
    return true;
}

void expand(const re2::RE2 &re, const std::string &repl,
            const std::vector<re2::StringPiece> &groups, std::string *out) {
    size_t pos = 0;
    while (pos < repl.size()) {
        size_t dollar = repl.find('$', pos);
        if (dollar == std::string::npos) {
            break;
        }
        out->append(repl, pos, dollar - pos);
        pos = dollar + 1;

        if (pos < repl.size() && repl[pos] == '$') {
            out->push_back('$');
            ++pos;
            continue;
        }

        std::string name;
        int num = -1;
        size_t next = pos;
        if (!parseReference(repl, pos, &name, &num, &next)) {
            // Malformed; keep the $ as text.
            out->push_back('$');
            continue;
        }
        pos = next;

        int index = num;
        if (index < 0) {
            const std::map<std::string, int> &named = re.NamedCapturingGroups();
            std::map<std::string, int>::const_iterator it = named.find(name);
            if (it != named.end()) {
                index = it->second;
            }
        }
        if (index >= 0 && static_cast<size_t>(index) < groups.size() &&
            groups[index].data() != nullptr) {
            out->append(groups[index].data(), groups[index].size());
        }
    }
    if (pos < repl.size()) {
        out->append(repl, pos, std::string::npos);
    }
}

} // namespace

Regex::Regex() = default;
Regex::~Regex() = default;
Regex::Regex(Regex &&other) = default;
Regex &Regex::operator=(Regex &&other) = default;

Regex::Regex(const std::string &pattern, std::unique_ptr<re2::RE2> re)
    : mPattern(pattern), mRe(std::move(re)) {}

Result<Regex> Regex::compile(const std::string &pattern) {
    re2::RE2::Options options;
    options.set_log_errors(false);
    options.set_max_mem(STRINGLIST_REGEX_MAX_MEM);

    std::unique_ptr<re2::RE2> re(new re2::RE2(pattern, options));
    if (!re->ok()) {
        SL_WARN("invalid pattern \"" << pattern << "\": " << re->error());
        return Result<Regex>::failure(ResultError::INVALID_PATTERN,
                                      re->error());
    }
    SL_LOG_REGEX("compiled \"" << pattern << "\" with "
                               << re->NumberOfCapturingGroups()
                               << " capture groups");
    return Result<Regex>::success(Regex(pattern, std::move(re)));
}

bool Regex::search(const std::string &text) const {
    if (!mRe) {
        return false;
    }
    return re2::RE2::PartialMatch(text, *mRe);
}

std::string Regex::replaceAll(const std::string &text,
                              const std::string &repl) const {
    if (!mRe) {
        return text;
    }

    std::vector<re2::StringPiece> groups(1 + mRe->NumberOfCapturingGroups());
    re2::StringPiece input(text);
    std::string out;
    size_t lastMatchEnd = 0;
    size_t searchPos = 0;

    while (searchPos <= text.size()) {
        if (!mRe->Match(input, searchPos, text.size(), re2::RE2::UNANCHORED,
                        &groups[0], static_cast<int>(groups.size()))) {
            break;
        }
        size_t matchStart = static_cast<size_t>(groups[0].data() - input.data());
        size_t matchEnd = matchStart + groups[0].size();

        out.append(text, lastMatchEnd, matchStart - lastMatchEnd);
        // An empty match right after the previous match is skipped, otherwise
        // "a*" would replace both "aaa" and the empty string that follows it.
        if (matchEnd > lastMatchEnd || matchStart == 0) {
            expand(*mRe, repl, groups, &out);
        }
        lastMatchEnd = matchEnd;

        // Always advance by at least one character.
        size_t width = searchPos < text.size() ? utf8Width(text, searchPos) : 1;
        if (searchPos + width > matchEnd) {
            searchPos += width;
        } else {
            searchPos = matchEnd;
        }
    }
    out.append(text, lastMatchEnd, std::string::npos);
    return out;
}

} // namespace sl
