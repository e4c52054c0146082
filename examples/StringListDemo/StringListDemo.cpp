#include <cctype>
#include <iostream>

#include "StringList.h"

//
// Walks through the StringList API on a small list of fruit.
//
// Build with the rest of the project (STRINGLIST_BUILD_EXAMPLES=ON), or by hand:
//   g++ -std=gnu++11 -Isrc examples/StringListDemo/StringListDemo.cpp \
//       src/sl/*.cpp -lre2 -o StringListDemo
//
// To run: ./StringListDemo
//

static sl::StringList::FilterResult shortUpper(size_t index,
                                               const std::vector<std::string> &items) {
    std::string out = items[index];
    for (size_t i = 0; i < out.size(); ++i) {
        out[i] = static_cast<char>(std::toupper(static_cast<unsigned char>(out[i])));
    }
    return sl::StringList::FilterResult(out.size() <= 5, out);
}

int main() {
    sl::StringList fruit;
    fruit.append("apple");
    fruit.append("Banana");
    fruit.append("orange");
    fruit.append("Pear");
    std::cout << "fruit:       " << fruit.toString() << std::endl;

    sl::Result<void> inserted = fruit.insert("kiwi", 2);
    if (!inserted.ok()) {
        SL_ERROR("insert failed: " << inserted.message());
        return 1;
    }
    std::cout << "insert kiwi: " << fruit.toString() << std::endl;

    // Out of range on purpose; the list stays as it was.
    sl::Result<void> rejected = fruit.insert("fig", 42);
    std::cout << "insert at 42: " << sl::to_string(rejected.error()) << " ("
              << rejected.message() << ")" << std::endl;

    sl::StringList sorted = fruit.copy();
    sorted.sort();
    std::cout << "sorted:      " << sorted.toString() << std::endl;
    std::cout << "kiwi at:     " << sorted.indexOf("kiwi") << std::endl;

    sl::Result<sl::StringList> capitalized =
        fruit.matchFilter("[[:upper:]][[:lower:]]*");
    if (capitalized.ok()) {
        std::cout << "capitalized: " << capitalized.value().toString() << std::endl;
    }

    sl::Result<sl::StringList> shouted = fruit.replaceAllFilter("([aeiou])", "<$1>");
    if (shouted.ok()) {
        std::cout << "vowels:      " << shouted.value().join(" ") << std::endl;
    }

    std::cout << "short upper: " << fruit.filter(shortUpper).toString() << std::endl;

    sl::Result<sl::StringList> broken = fruit.matchFilter("[unclosed");
    if (!broken.ok()) {
        std::cout << "bad pattern: " << broken.message() << std::endl;
    }

    fruit.removeUnordered("apple");
    std::cout << "unordered:   " << fruit.toString() << std::endl;
    fruit.remove("kiwi");
    std::cout << "ordered:     " << fruit.toString() << std::endl;
    return 0;
}
