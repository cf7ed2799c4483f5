#pragma once

/**
 * Arbor Test Datasets
 */

#include "arbor/types.hpp"
#include <set>
#include <string>
#include <vector>

namespace arbor {
namespace test_data {

// Play Tennis, all columns categorical
// Outlook: Rain 0, Overcast 1, Sunny 2; Temp: Cold 0, Mild 1, Hot 2
// Humidity: Normal 0, High 1; Wind: Weak 0, Strong 1; Play: No 0, Yes 1
inline Matrix tennis_x() {
    Matrix x(14, 4);
    x << 2, 2, 1, 0,
         2, 2, 1, 1,
         1, 2, 1, 0,
         0, 1, 1, 0,
         0, 0, 0, 0,
         0, 0, 0, 1,
         1, 0, 0, 1,
         2, 1, 1, 0,
         2, 0, 0, 0,
         0, 1, 0, 0,
         2, 1, 0, 1,
         1, 1, 1, 1,
         1, 2, 0, 0,
         0, 1, 1, 1;
    return x;
}

inline Labels tennis_y() {
    Labels y(14);
    y << 0, 0, 1, 1, 1, 0, 1, 0, 1, 1, 1, 1, 1, 0;
    return y;
}

inline std::vector<std::string> tennis_names() {
    return {"Outlook", "Temp", "Humidity", "Wind"};
}

// Play Tennis with Temp and Humidity in degrees / percent
inline Matrix tennis_cont_x() {
    Matrix x(14, 4);
    x << 2, 85, 85, 0,
         2, 80, 90, 1,
         1, 83, 78, 0,
         0, 70, 96, 0,
         0, 68, 80, 0,
         0, 65, 70, 1,
         1, 64, 65, 1,
         2, 72, 95, 0,
         2, 69, 70, 0,
         0, 75, 80, 0,
         2, 75, 70, 1,
         1, 72, 90, 1,
         1, 81, 75, 0,
         0, 71, 80, 1;
    return x;
}

inline std::set<FeatureIndex> tennis_conts() {
    return {1, 2};
}

// Two well separated clusters on one continuous column
inline Matrix clusters_x() {
    Matrix x(6, 1);
    x << 1, 2, 3, 10, 11, 12;
    return x;
}

inline Labels clusters_y() {
    Labels y(6);
    y << 0, 0, 0, 1, 1, 1;
    return y;
}

// Slice of winequality-white, all columns continuous
inline Matrix wine_x() {
    Matrix x(11, 11);
    x << 8.1, 0.27, 0.41,  1.45, 0.033, 11,  63.0, 0.9908, 2.99, 0.56, 12.0,
         8.6, 0.23, 0.40,  4.20, 0.035, 17, 109.0, 0.9947, 3.14, 0.53,  9.7,
         7.9, 0.18, 0.37,  1.20, 0.040, 16,  75.0, 0.9920, 3.18, 0.63, 10.8,
         6.6, 0.16, 0.40,  1.50, 0.044, 48, 143.0, 0.9912, 3.54, 0.52, 12.4,
         8.3, 0.42, 0.62, 19.25, 0.040, 41, 172.0, 1.0002, 2.98, 0.67,  9.7,
         6.6, 0.17, 0.38,  1.50, 0.032, 28, 112.0, 0.9914, 3.25, 0.55, 11.4,
         6.3, 0.48, 0.04,  1.10, 0.046, 30,  99.0, 0.9928, 3.24, 0.36,  9.6,
         6.2, 0.66, 0.48,  1.20, 0.029, 29,  75.0, 0.9892, 3.33, 0.39, 12.8,
         7.4, 0.34, 0.42,  1.10, 0.033, 17, 171.0, 0.9917, 3.12, 0.53, 11.3,
         6.5, 0.31, 0.14,  7.50, 0.044, 34, 133.0, 0.9955, 3.22, 0.50,  9.5,
         6.2, 0.66, 0.48,  1.20, 0.029, 29,  75.0, 0.9892, 3.33, 0.39, 12.8;
    return x;
}

// Quality scores 3..9, not yet shifted
inline Labels wine_y_raw() {
    Labels y(11);
    y << 5, 5, 5, 7, 5, 7, 6, 8, 6, 5, 8;
    return y;
}

inline std::set<FeatureIndex> wine_conts() {
    std::set<FeatureIndex> conts;
    for (FeatureIndex j = 0; j < 11; ++j) conts.insert(j);
    return conts;
}

inline std::vector<std::string> wine_class_names() {
    return {"Lev3", "Lev4", "Lev5", "Lev6", "Lev7", "Lev8", "Lev9"};
}

} // namespace test_data
} // namespace arbor
