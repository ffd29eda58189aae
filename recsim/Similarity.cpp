#include <recsim/Similarity.hpp>
#include <cmath>
#include <stdexcept>

namespace recsim { namespace similarity {

double Agreement::operator()(const std::vector<double> &a, const std::vector<double> &b) const {
    if (a.size() != b.size()) throw std::invalid_argument("Agreement: score vectors differ in length");
    double agree = 0;
    for (std::size_t i = 0; i < a.size(); i++) {
        if ((a[i] > neutral_ and b[i] > neutral_) or (a[i] < neutral_ and b[i] < neutral_))
            agree += 1;
    }
    return agree;
}

double Distance::operator()(const std::vector<double> &a, const std::vector<double> &b) const {
    if (a.size() != b.size()) throw std::invalid_argument("Distance: score vectors differ in length");
    if (a.empty()) throw std::invalid_argument("Distance: no shared reviews");
    double total = 0;
    for (std::size_t i = 0; i < a.size(); i++) total += std::fabs(a[i] - b[i]);
    return -total / a.size();
}

}}
