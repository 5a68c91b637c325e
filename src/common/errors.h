#pragma once
#ifndef COSTCONFORM_ERRORS_H
#define COSTCONFORM_ERRORS_H

#include <stdexcept>
#include <string>

namespace costconform {

// Raised when the harness itself cannot run: the channel could not be
// established, an implementation is already bound, or the configuration is
// unusable. Contract violations are never reported this way.
class HarnessError : public std::runtime_error {
public:
    explicit HarnessError(const std::string& what) : std::runtime_error(what) {}
};

class ConfigurationError : public HarnessError {
public:
    explicit ConfigurationError(const std::string& what) : HarnessError(what) {}
};

}  // namespace costconform

#endif  // COSTCONFORM_ERRORS_H
