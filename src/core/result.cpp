#include <toolhost/core/result.hpp>

#include <system_error>

namespace toolhost {

Error Error::FromErrno(const std::string& operation,
                       const std::string& target,
                       int errno_value) {
    return Error{operation, target, std::nullopt,
                 std::error_code(errno_value, std::generic_category()).message(),
                 ErrorCategory::Io};
}

} // namespace toolhost
