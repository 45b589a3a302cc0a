#include "frequency_step.h"

#include <cmath>

double roundFrequency(double frequency) {
    return std::round(frequency * kFrequencyScale) / kFrequencyScale;
}

std::vector<double> generateRangeFrequencies(double start, double end, double step) {
    std::vector<double> out;
    if (!(step > 0.0) || end + kFrequencyEpsilon < start) {
        return out;
    }
    for (size_t i = 0;; i++) {
        const double value = start + static_cast<double>(i) * step;
        if (value > end + kFrequencyEpsilon) {
            break;
        }
        out.push_back(value);
    }
    return out;
}
