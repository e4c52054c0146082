#include "sl/string_list.h"

#include <algorithm>

#include "sl/log.h"
#include "sl/regex.h"

namespace sl {

const ptrdiff_t StringList::kNotFound;

StringList StringList::copy() const { return StringList(mItems); }

Result<std::string> StringList::at(ptrdiff_t index) const {
    if (index < 0 || static_cast<size_t>(index) >= mItems.size()) {
        return Result<std::string>::failure(
            ResultError::OUT_OF_RANGE,
            (StrStream() << "index " << index << " out of range for size "
                         << mItems.size())
                .str());
    }
    return Result<std::string>::success(mItems[index]);
}

void StringList::append(const std::string &str) { mItems.push_back(str); }

Result<void> StringList::insert(const std::string &str, ptrdiff_t index) {
    if (index < 0 || static_cast<size_t>(index) > mItems.size()) {
        StrStream msg;
        msg << "insert index " << index << " out of range for size "
            << mItems.size();
        SL_WARN(msg.str());
        return Result<void>::failure(ResultError::OUT_OF_RANGE, msg.str());
    }
    mItems.insert(mItems.begin() + index, str);
    SL_LOG_LIST("insert \"" << str << "\" at " << index);
    return Result<void>::success();
}

void StringList::remove(const std::string &str) {
    ptrdiff_t index = indexOf(str);
    if (index == kNotFound) {
        return;
    }
    mItems.erase(mItems.begin() + index);
    SL_LOG_LIST("remove \"" << str << "\" from " << index);
}

void StringList::removeUnordered(const std::string &str) {
    ptrdiff_t index = indexOf(str);
    if (index == kNotFound) {
        return;
    }
    // No self-move when the match is the last item.
    if (static_cast<size_t>(index) != mItems.size() - 1) {
        mItems[index] = std::move(mItems.back());
    }
    mItems.pop_back();
    SL_LOG_LIST("removeUnordered \"" << str << "\" from " << index);
}

void StringList::sort() { std::sort(mItems.begin(), mItems.end()); }

ptrdiff_t StringList::indexOf(const std::string &str) const {
    for (size_t i = 0; i < mItems.size(); ++i) {
        if (mItems[i] == str) {
            return static_cast<ptrdiff_t>(i);
        }
    }
    return kNotFound;
}

bool StringList::contains(const std::string &str) const {
    return indexOf(str) != kNotFound;
}

bool StringList::isEqual(const StringList &other) const {
    return mItems == other.mItems;
}

std::string StringList::join(const std::string &sep) const {
    std::string out;
    for (size_t i = 0; i < mItems.size(); ++i) {
        if (i > 0) {
            out.append(sep);
        }
        out.append(mItems[i]);
    }
    return out;
}

std::string StringList::toString() const {
    std::string out("[");
    for (size_t i = 0; i < mItems.size(); ++i) {
        if (i > 0) {
            out.push_back(',');
        }
        out.push_back('"');
        out.append(mItems[i]);
        out.push_back('"');
    }
    out.push_back(']');
    return out;
}

StringList StringList::filter(const FilterFn &op) const {
    StringList out;
    out.mItems.reserve(mItems.size());
    for (size_t i = 0; i < mItems.size(); ++i) {
        FilterResult r = op(i, mItems);
        if (r.first) {
            out.mItems.push_back(std::move(r.second));
        }
    }
    return out;
}

Result<StringList> StringList::matchFilter(const std::string &pattern) const {
    Result<Regex> re = Regex::compile(pattern);
    if (!re.ok()) {
        return Result<StringList>::failure(re.error(), re.message());
    }

    StringList out;
    for (size_t i = 0; i < mItems.size(); ++i) {
        if (re.value().search(mItems[i])) {
            out.mItems.push_back(mItems[i]);
        }
    }
    return Result<StringList>::success(std::move(out));
}

Result<StringList>
StringList::replaceAllFilter(const std::string &pattern,
                             const std::string &repl) const {
    Result<Regex> re = Regex::compile(pattern);
    if (!re.ok()) {
        return Result<StringList>::failure(re.error(), re.message());
    }

    StringList out;
    out.mItems.reserve(mItems.size());
    for (size_t i = 0; i < mItems.size(); ++i) {
        out.mItems.push_back(re.value().replaceAll(mItems[i], repl));
    }
    return Result<StringList>::success(std::move(out));
}

} // namespace sl
