#pragma once

#include <cerrno>

#include "display.hpp"

namespace ashface {

inline InitResult init_result_from_errno(int err) {
    switch (err) {
    case ENOENT:
    case ENODEV:
    case ENXIO:
        return InitResult::DeviceNotFound;
    case EACCES:
    case EPERM:
        return InitResult::PermissionDenied;
    case EINVAL:
        return InitResult::BadConfig;
    default:
        return InitResult::IoError;
    }
}

} // namespace ashface
