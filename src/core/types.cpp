#include <sidecar/core/types.h>

#include <fmt/format.h>

namespace sidecar {

std::string Error::describe() const {
    std::string out;
    if (httpStatus != 0 || !errorCode.empty()) {
        out = fmt::format("Status Code: {}; Error Code: {}; Message: {}", httpStatus, errorCode,
                          message);
    } else {
        out = fmt::format("{}: {}", errorToString(code), message);
    }
    if (cause && !cause->empty()) {
        out += fmt::format("; Cause: {}", *cause);
    }
    return out;
}

} // namespace sidecar
