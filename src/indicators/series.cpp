#include "indicators/series.hpp"

namespace ind {

std::vector<double> with_sentinel(const Series& s){
    std::vector<double> out; out.reserve(s.size());
    for (const auto& v : s) out.push_back(v.value_or(0.0));
    return out;
}

Series as_series(const std::vector<double>& v){
    return Series(v.begin(), v.end());
}

} // namespace ind
