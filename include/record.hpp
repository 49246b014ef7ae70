#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

enum class Action : uint8_t {
    Put,
    Get,    // never logged; reads do not mutate
    Delete
};

char action_tag(Action a);

// One logged mutation. Encoded as
//   <length in ASCII decimal><tag><key>|<value>
// where length = key.size() + value.size() + 2. The key is read up to the
// separator, the value by count, so only the key must be free of '|'.
struct Record {
    static constexpr char kSeparator = '|';

    size_t length{0};
    std::string key;
    std::string value;
    Action action{Action::Put};

    static Record make(Action action, std::string key, std::string value = {});

    bool operator==(const Record& o) const {
        return length == o.length && action == o.action && key == o.key && value == o.value;
    }
    bool operator!=(const Record& o) const { return !(*this == o); }
};

bool key_is_encodable(std::string_view key);

// Throws std::invalid_argument when the key holds the separator or the
// length field disagrees with key/value sizes.
std::string encode(const Record& r);
void encode_to(const Record& r, std::string& out);

// Parses a concatenation of encoded records. Throws DecodeError on the first
// malformed record; nothing is returned in that case.
std::vector<Record> decode(std::string_view data);
