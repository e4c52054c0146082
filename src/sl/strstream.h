#pragma once

#include <string>
#include <type_traits>

namespace sl {

// Small string builder used by the log macros. Everything streamed in is
// appended to an internal std::string.
class StrStream {
  public:
    StrStream() = default;
    StrStream(const std::string &str) : mStr(str) {}

    const std::string &str() const { return mStr; }
    const char *c_str() const { return mStr.c_str(); }

    StrStream &operator<<(const StrStream &strStream) {
        mStr.append(strStream.str());
        return *this;
    }

    StrStream &operator<<(const std::string &str) {
        mStr.append(str);
        return *this;
    }

    StrStream &operator<<(const char *str) {
        mStr.append(str ? str : "(null)");
        return *this;
    }

    StrStream &operator<<(char c) {
        mStr.push_back(c);
        return *this;
    }

    // bool support - output as "true"/"false" for readability
    StrStream &operator<<(bool b) {
        mStr.append(b ? "true" : "false");
        return *this;
    }

    StrStream &operator<<(double f) {
        mStr.append(std::to_string(f));
        return *this;
    }

    // Enums (plain and scoped) print as their underlying integer.
    template <typename T>
    typename std::enable_if<std::is_enum<T>::value, StrStream &>::type
    operator<<(T e) {
        typedef typename std::underlying_type<T>::type underlying_t;
        return (*this) << static_cast<long long>(static_cast<underlying_t>(e));
    }

    // All integer types other than char and bool.
    template <typename T>
    typename std::enable_if<std::is_integral<T>::value &&
                                !std::is_same<T, char>::value &&
                                !std::is_same<T, bool>::value,
                            StrStream &>::type
    operator<<(T val) {
        if (std::is_signed<T>::value) {
            mStr.append(std::to_string(static_cast<long long>(val)));
        } else {
            mStr.append(std::to_string(static_cast<unsigned long long>(val)));
        }
        return *this;
    }

    // assignment operator completely replaces the current string
    StrStream &operator=(const std::string &str) {
        mStr = str;
        return *this;
    }

    void clear() { mStr.clear(); }

  private:
    std::string mStr;
};

} // namespace sl
