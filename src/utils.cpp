#include "utils.hpp"

#include <cmath>

double rms(const std::vector<double>& x) {
    return rms(x.data(), x.size());
}

double rms(const double* x, std::size_t count) {
    if (count == 0) return 0.0;
    double acc = 0.0;
    for (std::size_t i = 0; i < count; ++i) {
        acc += x[i] * x[i];
    }
    return std::sqrt(acc / static_cast<double>(count));
}

float dbfs(double rms_level) {
    return 20.0f * std::log10(static_cast<float>(rms_level) + 1e-9f);
}
