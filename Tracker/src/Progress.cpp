#include "Progress.hpp"

Progress Progress::from(bool ready) {
    Progress p;
    p.done  = ready ? 1u : 0u;
    p.total = 1u;
    return p;
}

float Progress::toFloat() const {
    return static_cast<float>(done) / static_cast<float>(total);
}

double Progress::toDouble() const {
    return static_cast<double>(done) / static_cast<double>(total);
}

Progress& Progress::operator+=(const Progress& rhs) {
    done  += rhs.done;
    total += rhs.total;
    return *this;
}

Progress operator+(Progress lhs, const Progress& rhs) {
    lhs += rhs;
    return lhs;
}

bool operator==(const Progress& a, const Progress& b) {
    return a.done == b.done && a.total == b.total;
}

bool operator!=(const Progress& a, const Progress& b) {
    return !(a == b);
}

HiddenProgress HiddenProgress::from(bool ready) {
    return HiddenProgress{ Progress::from(ready) };
}

HiddenProgress& HiddenProgress::operator+=(const HiddenProgress& rhs) {
    value += rhs.value;
    return *this;
}

HiddenProgress operator+(HiddenProgress lhs, const HiddenProgress& rhs) {
    lhs += rhs;
    return lhs;
}
