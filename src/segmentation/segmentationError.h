#pragma once

#include <stdexcept>
#include <string>

namespace meshSegmentation
{
    // invalid k, delta/eta out of range, empty or inconsistent mesh
    class InputError : public std::invalid_argument
    {
    public:
        explicit InputError(const std::string &msg)
            : std::invalid_argument("meshSegmentation input error: " + msg) {}
    };

    // degenerate numbers that would otherwise turn into NaN/Inf downstream
    class NumericDomainError : public std::domain_error
    {
    public:
        NumericDomainError(const std::string &stage, size_t dimension, const std::string &msg)
            : std::domain_error("meshSegmentation numeric error in stage '" + stage +
                                "' (dimension " + std::to_string(dimension) + "): " + msg),
              stage_(stage), dimension_(dimension) {}

        const std::string &stage() const { return stage_; }
        size_t dimension() const { return dimension_; }

    private:
        std::string stage_;
        size_t dimension_;
    };
}
