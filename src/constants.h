#pragma once

namespace mlqg {
namespace constants {
double constexpr pi = 3.14159265358979323846;
double constexpr two_pi = 2. * pi;
}  // namespace constants
}  // namespace mlqg
