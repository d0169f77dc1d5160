/**
 * @file RunConfig.cpp
 * @brief CopyMethod conversions.
 */

#include "domain/RunConfig.hpp"

namespace chatstamp::domain {

std::optional<CopyMethod> CopyMethodFromString(const std::string& value) {
    if (value == "disabled") return CopyMethod::Disabled;
    if (value == "clone") return CopyMethod::Clone;
    if (value == "basic") return CopyMethod::Basic;
    if (value == "full") return CopyMethod::Full;
    return std::nullopt;
}

const char* ToString(CopyMethod method) {
    switch (method) {
        case CopyMethod::Clone: return "clone";
        case CopyMethod::Basic: return "basic";
        case CopyMethod::Full: return "full";
        case CopyMethod::Disabled: break;
    }
    return "disabled";
}

} // namespace chatstamp::domain
