#pragma once

#include <chrono>
#include <iostream>
#include <string>

namespace rscache {

// Prints the lifetime of the scope on destruction; if elapsed_out is given it
// also receives the duration in seconds.
struct Stopwatch {
    std::chrono::steady_clock::time_point start =
        std::chrono::steady_clock::now();
    Stopwatch(std::string description = "", double* elapsed_out = nullptr)
        : description_(description), elapsed_out_(elapsed_out) {}
    ~Stopwatch() {
        std::chrono::duration<double> dur = Elapsed();
        if (elapsed_out_) *elapsed_out_ = dur.count();
        std::cout << "\"" << description_ << "\""
                  << " took "
                  << std::chrono::duration_cast<std::chrono::milliseconds>(dur)
                         .count()
                  << " ms" << std::endl;
    }

    std::chrono::duration<double> Elapsed() const {
        return std::chrono::steady_clock::now() - start;
    }

   private:
    std::string description_;
    double* elapsed_out_;
};

}  // namespace rscache
