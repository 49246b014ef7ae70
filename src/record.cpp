#include "record.hpp"
#include "errors.hpp"

#include <limits>
#include <stdexcept>

char action_tag(Action a) {
    switch (a) {
        case Action::Put:    return 'p';
        case Action::Get:    return 'g';
        case Action::Delete: return 'd';
    }
    return 'u';
}

namespace {
bool tag_to_action(char c, Action& out) {
    switch (c) {
        case 'p': out = Action::Put;    return true;
        case 'g': out = Action::Get;    return true;
        case 'd': out = Action::Delete; return true;
        default:  return false;
    }
}

bool is_digit(char c) { return c >= '0' && c <= '9'; }

// Walks one record at a time through {length, action, key, value}. pos_ only
// ever advances after a bounds check.
class Decoder {
public:
    explicit Decoder(std::string_view data) : data_(data) {}

    std::vector<Record> run() {
        std::vector<Record> out;
        while (pos_ < data_.size()) {
            start_ = pos_;
            Record r;
            r.length = read_length_();
            r.action = read_action_();
            r.key = read_key_();
            r.value = read_value_(r.length, r.key.size());
            out.push_back(std::move(r));
        }
        return out;
    }

private:
    std::string_view data_;
    size_t pos_{0};
    size_t start_{0};

    [[noreturn]] void fail_(DecodeFault fault, const std::string& detail = {}) const {
        throw DecodeError(fault, start_, detail);
    }

    size_t read_length_() {
        constexpr size_t kMax = std::numeric_limits<size_t>::max();
        size_t n = 0;
        size_t digits = 0;
        while (pos_ < data_.size() && is_digit(data_[pos_])) {
            const size_t d = static_cast<size_t>(data_[pos_] - '0');
            if (n > (kMax - d) / 10) fail_(DecodeFault::BadLength, "length overflows");
            n = n * 10 + d;
            ++pos_;
            ++digits;
        }
        if (digits == 0) {
            if (pos_ >= data_.size()) fail_(DecodeFault::Truncated, "expected length");
            fail_(DecodeFault::BadLength, "expected digit");
        }
        return n;
    }

    Action read_action_() {
        if (pos_ >= data_.size()) fail_(DecodeFault::Truncated, "expected action tag");
        Action a = Action::Put;
        if (!tag_to_action(data_[pos_], a)) {
            fail_(DecodeFault::BadAction, std::string("tag '") + data_[pos_] + "'");
        }
        ++pos_;
        return a;
    }

    std::string read_key_() {
        const size_t sep = data_.find(Record::kSeparator, pos_);
        if (sep == std::string_view::npos) fail_(DecodeFault::MissingSeparator);
        std::string key(data_.substr(pos_, sep - pos_));
        pos_ = sep + 1;
        return key;
    }

    std::string read_value_(size_t length, size_t key_size) {
        if (length < key_size + 2) {
            fail_(DecodeFault::BadLength, "length " + std::to_string(length)
                                              + " shorter than key " + std::to_string(key_size));
        }
        const size_t vsize = length - key_size - 2;
        if (vsize > data_.size() - pos_) {
            fail_(DecodeFault::Truncated, "value needs " + std::to_string(vsize) + " bytes");
        }
        std::string value(data_.substr(pos_, vsize));
        pos_ += vsize;
        return value;
    }
};
} // namespace

Record Record::make(Action action, std::string key, std::string value) {
    Record r;
    r.length = key.size() + value.size() + 2;
    r.key = std::move(key);
    r.value = std::move(value);
    r.action = action;
    return r;
}

bool key_is_encodable(std::string_view key) {
    return key.find(Record::kSeparator) == std::string_view::npos;
}

void encode_to(const Record& r, std::string& out) {
    if (!key_is_encodable(r.key)) {
        throw std::invalid_argument("record key contains separator '|'");
    }
    if (r.length != r.key.size() + r.value.size() + 2) {
        throw std::invalid_argument("record length " + std::to_string(r.length)
                                    + " does not match key/value sizes");
    }
    out += std::to_string(r.length);
    out.push_back(action_tag(r.action));
    out += r.key;
    out.push_back(Record::kSeparator);
    out += r.value;
}

std::string encode(const Record& r) {
    std::string out;
    out.reserve(r.key.size() + r.value.size() + 22);
    encode_to(r, out);
    return out;
}

std::vector<Record> decode(std::string_view data) {
    return Decoder(data).run();
}
