#include "integrator/factory.hpp"
#include "common/errors.hpp"

#include <algorithm>
#include <cctype>
#include <vector>

namespace integrator {

namespace {
auto make_tableau(int stages, const std::vector<std::vector<double>>& a, const std::vector<double>& b) -> ButcherTableau
{
    return ButcherTableau(stages, a, b);
}
} // namespace

auto parse_method(const std::string& name) -> Method
{
    std::string s = name;
    std::transform(s.begin(), s.end(), s.begin(),
        [](unsigned char ch) { return static_cast<char>(std::toupper(ch)); });

    if (s == "EULER") {
        return Method::EULER;
    } else if (s == "MIDPOINT") {
        return Method::MIDPOINT;
    } else if (s == "HEUN") {
        return Method::HEUN;
    } else if (s == "RALSTON") {
        return Method::RALSTON;
    } else if (s == "KUTTA3") {
        return Method::KUTTA3;
    } else if (s == "RK4") {
        return Method::RK4;
    } else if (s == "RK38") {
        return Method::RK38;
    }
    throw common::ConfigurationError("Invalid method: " + name);
}

std::istream& operator>>(std::istream& is, Method& method) {
    std::string s;
    is >> s;
    method = parse_method(s);
    return is;
}

std::ostream& operator<<(std::ostream& os, const Method& method) {
    switch (method) {
        case Method::EULER: os << "EULER"; break;
        case Method::MIDPOINT: os << "MIDPOINT"; break;
        case Method::HEUN: os << "HEUN"; break;
        case Method::RALSTON: os << "RALSTON"; break;
        case Method::KUTTA3: os << "KUTTA3"; break;
        case Method::RK4: os << "RK4"; break;
        case Method::RK38: os << "RK38"; break;
    }
    return os;
}

auto TableauFactory::create(Method method) -> ButcherTableau
{
    switch (method) {
        case Method::EULER:
            return make_tableau(1, {{0.0}}, {1.0});
        case Method::MIDPOINT:
            return make_tableau(2,
                {{0.0, 0.0},
                 {0.5, 0.0}},
                {0.0, 1.0});
        case Method::HEUN:
            return make_tableau(2,
                {{0.0, 0.0},
                 {1.0, 0.0}},
                {0.5, 0.5});
        case Method::RALSTON:
            return make_tableau(2,
                {{0.0, 0.0},
                 {2.0 / 3.0, 0.0}},
                {0.25, 0.75});
        case Method::KUTTA3:
            return make_tableau(3,
                {{0.0, 0.0, 0.0},
                 {0.5, 0.0, 0.0},
                 {-1.0, 2.0, 0.0}},
                {1.0 / 6.0, 2.0 / 3.0, 1.0 / 6.0});
        case Method::RK4:
            return make_tableau(4,
                {{0.0, 0.0, 0.0, 0.0},
                 {0.5, 0.0, 0.0, 0.0},
                 {0.0, 0.5, 0.0, 0.0},
                 {0.0, 0.0, 1.0, 0.0}},
                {1.0 / 6.0, 1.0 / 3.0, 1.0 / 3.0, 1.0 / 6.0});
        case Method::RK38:
            return make_tableau(4,
                {{0.0, 0.0, 0.0, 0.0},
                 {1.0 / 3.0, 0.0, 0.0, 0.0},
                 {-1.0 / 3.0, 1.0, 0.0, 0.0},
                 {1.0, -1.0, 1.0, 0.0}},
                {0.125, 0.375, 0.375, 0.125});
        default:
            throw common::ConfigurationError("Unknown method");
    }
}

} // namespace integrator
