#pragma once

#include "../core/abi_error.hpp"

#include <cmath>
#include <cstdint>
#include <initializer_list>
#include <limits>
#include <string>
#include <utility>
#include <vector>

namespace scriptscene::abi {

// Numeric arguments of one ABI call, as the guest passed them.
//
// Guests only pass numbers; each accessor checks that the value fits the
// integer or float type the handler expects and throws AbiError(DecodeError)
// otherwise.
class AbiArgs {
public:
    AbiArgs() = default;
    explicit AbiArgs(std::vector<double> values) : values_(std::move(values)) {}
    AbiArgs(std::initializer_list<double> values) : values_(values) {}

    std::size_t size() const { return values_.size(); }

    std::uint32_t u32(std::size_t index) const {
        const double v = at(index);
        if (!std::isfinite(v) || v < 0.0 || v > static_cast<double>(std::numeric_limits<std::uint32_t>::max()) ||
            std::trunc(v) != v) {
            throw AbiError(AbiErrorKind::DecodeError, describe(index, "u32"));
        }
        return static_cast<std::uint32_t>(v);
    }

    std::int32_t i32(std::size_t index) const {
        const double v = at(index);
        if (!std::isfinite(v) || v < static_cast<double>(std::numeric_limits<std::int32_t>::min()) ||
            v > static_cast<double>(std::numeric_limits<std::int32_t>::max()) || std::trunc(v) != v) {
            throw AbiError(AbiErrorKind::DecodeError, describe(index, "i32"));
        }
        return static_cast<std::int32_t>(v);
    }

    // Non-numeric guest values arrive as NaN and are rejected here.
    float f32(std::size_t index) const {
        const double v = at(index);
        if (std::isnan(v)) {
            throw AbiError(AbiErrorKind::DecodeError, describe(index, "f32"));
        }
        return static_cast<float>(v);
    }

    bool flag(std::size_t index) const { return u32(index) != 0; }

private:
    double at(std::size_t index) const {
        if (index >= values_.size()) {
            throw AbiError(AbiErrorKind::DecodeError,
                           "missing argument " + std::to_string(index + 1) + " of " +
                           std::to_string(values_.size()));
        }
        return values_[index];
    }

    std::string describe(std::size_t index, const char* type) const {
        return "argument " + std::to_string(index + 1) + " (" + std::to_string(values_[index]) +
               ") is not a valid " + type;
    }

    std::vector<double> values_;
};

} // namespace scriptscene::abi
