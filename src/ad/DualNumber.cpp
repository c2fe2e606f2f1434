#include "fwdiff/ad/DualNumber.hpp"

namespace fwdiff::ad {

// Explicit instantiation of common dual number types
template class DualNumber<Real, Dynamic>;
template class DualNumber<Real, 3>;

} // namespace fwdiff::ad
