#pragma once

#include <cstddef>
#include <vector>

double rms(const std::vector<double>& x);
double rms(const double* x, std::size_t count);

// Level of a normalized RMS value relative to full scale.
float dbfs(double rms_level);
