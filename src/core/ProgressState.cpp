#include "ProgressState.hpp"

#include <cmath>

void ProgressState::set_current(double n){
    const double upper = ratio_mode() ? 1.0 : static_cast<double>(total);

    if( std::isnan(n) || n < 0 ){
        n = 0;
    }
    saturated = n > upper;
    current = saturated ? upper : n;
}
