#pragma once

#include <stddef.h>

#include <functional>
#include <initializer_list>
#include <string>
#include <utility>
#include <vector>

#include "sl/result.h"
#include "sl/strstream.h"

namespace sl {

/// @brief An ordered, mutable list of strings with convenience operations.
///
/// Items are stored in a std::vector, so the usual vector costs apply:
/// insert() and remove() shift every later item, removeUnordered() does not.
/// The list owns its items; copies never share storage.
///
/// Not thread safe. Wrap it in a mutex if several threads touch it.
class StringList {
  public:
    /// (keep, value): when keep is true, value is appended to the result of
    /// filter(). value may differ from the source item.
    typedef std::pair<bool, std::string> FilterResult;

    /// Called once per index, in ascending order, with the source items.
    typedef std::function<FilterResult(size_t index,
                                       const std::vector<std::string> &items)>
        FilterFn;

    /// Returned by indexOf() when the value is absent.
    static const ptrdiff_t kNotFound = -1;

    StringList() = default;
    StringList(std::initializer_list<std::string> items) : mItems(items) {}
    explicit StringList(std::vector<std::string> items)
        : mItems(std::move(items)) {}

    /// Deep copy. The result owns its own storage.
    StringList copy() const;

    // Element access
    size_t size() const { return mItems.size(); }
    bool isEmpty() const { return mItems.empty(); }
    const std::vector<std::string> &items() const { return mItems; }

    /// Unchecked, like std::vector::operator[].
    const std::string &operator[](size_t index) const { return mItems[index]; }

    /// Fails with ResultError::OUT_OF_RANGE unless 0 <= index < size().
    /// Indices are ptrdiff_t: wide enough for any vector size, and signed so
    /// that negative values can be rejected.
    Result<std::string> at(ptrdiff_t index) const;

    std::vector<std::string>::const_iterator begin() const {
        return mItems.begin();
    }
    std::vector<std::string>::const_iterator end() const {
        return mItems.end();
    }

    // Management
    void append(const std::string &str);

    /// Inserts str so it ends up at index, shifting later items back by one.
    /// index may equal size(), which appends. Any other index outside
    /// [0, size()] fails with ResultError::OUT_OF_RANGE and leaves the list
    /// untouched. O(n).
    Result<void> insert(const std::string &str, ptrdiff_t index);

    /// Removes the first exact match, keeping the order of the remaining
    /// items. O(n). Does nothing if str is absent.
    void remove(const std::string &str);

    /// Removes the first exact match by moving the last item into its slot.
    /// The order of the remaining items is not preserved, but the removal
    /// itself is O(1). Prefer this over remove() when order does not matter.
    void removeUnordered(const std::string &str);

    /// Ascending byte-wise order.
    void sort();

    void clear() { mItems.clear(); }

    // Queries
    ptrdiff_t indexOf(const std::string &str) const;
    bool contains(const std::string &str) const;
    bool isEqual(const StringList &other) const;
    std::string join(const std::string &sep) const;

    /// Renders the list as ["a","b"]. Items are not escaped.
    std::string toString() const;

    // Filters. All of them return a new list and leave this one alone.

    /// Comprehension-style filter and map in one pass.
    StringList filter(const FilterFn &op) const;

    /// Items in which pattern matches somewhere. Fails with
    /// ResultError::INVALID_PATTERN (and an empty list) if pattern does not
    /// compile.
    Result<StringList> matchFilter(const std::string &pattern) const;

    /// Every item with all matches of pattern replaced by repl. The result
    /// has the same length as this list.
    Result<StringList> replaceAllFilter(const std::string &pattern,
                                        const std::string &repl) const;

  private:
    std::vector<std::string> mItems;
};

inline bool operator==(const StringList &a, const StringList &b) {
    return a.isEqual(b);
}

inline bool operator!=(const StringList &a, const StringList &b) {
    return !a.isEqual(b);
}

inline StrStream &operator<<(StrStream &ss, const StringList &list) {
    return ss << list.toString();
}

} // namespace sl
