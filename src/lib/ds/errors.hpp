#pragma once
#include <stdexcept>
#include <string>

namespace rscache {

class OutOfRange : public std::out_of_range {
   public:
    explicit OutOfRange(const std::string& what) : std::out_of_range{what} {}
};

class CapacityInvalid : public std::invalid_argument {
   public:
    explicit CapacityInvalid(const std::string& what) : std::invalid_argument{what} {}
};

class SumOverflow : public std::overflow_error {
   public:
    explicit SumOverflow(const std::string& what) : std::overflow_error{what} {}
};

}  // namespace rscache
