#include "errors.hpp"

#include <cstring>

const char* to_string(DecodeFault fault) {
    switch (fault) {
        case DecodeFault::BadLength:        return "bad length";
        case DecodeFault::BadAction:        return "bad action";
        case DecodeFault::MissingSeparator: return "missing separator";
        case DecodeFault::Truncated:        return "truncated record";
        case DecodeFault::BadDocument:      return "bad document";
    }
    return "unknown";
}

DecodeError::DecodeError(DecodeFault fault, size_t offset, const std::string& detail)
    : std::runtime_error(std::string("decode error (") + to_string(fault) + ") at offset "
                         + std::to_string(offset) + (detail.empty() ? "" : ": " + detail)),
      kind_(fault),
      offset_(offset) {}

IOError io_error(const std::string& what, const std::string& path, int err) {
    return IOError(what + " " + path + ": " + std::strerror(err));
}
