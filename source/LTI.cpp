#include "LTI.hpp"

#include <optional>

#include "ss.hpp"
#include "types.hpp"

namespace ltikit {

/* LTI Member Function Definitions - Default to StateSpace dispatch */
DampingInfo LTI::damp() const {
    return ltikit::damp(poles(), Ts);
}
double LTI::dcgain() const {
    return toStateSpace().dcgain();
}
bool LTI::is_stable() const {
    return ltikit::is_stable(poles(), Ts);
}
std::vector<Pole> LTI::poles() const {
    return toStateSpace().poles();
}
std::vector<Zero> LTI::zeros() const {
    return toStateSpace().zeros();
}
StateSpace LTI::discretize(double Ts, DiscretizationMethod method, std::optional<double> prewarp) const {
    return toStateSpace().discretize(Ts, method, prewarp);
}

}  // namespace ltikit
