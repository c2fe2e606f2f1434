#pragma once

#include "fwdiff/core/Types.hpp"
#include "fwdiff/core/Error.hpp"
#include "fwdiff/ad/DualNumber.hpp"
#include "fwdiff/ad/JacobianSparsity.hpp"
#include "fwdiff/ad/JacobianWorkMemory.hpp"
#include "fwdiff/ad/JacobianDecompression.hpp"
#include "fwdiff/ad/JacobianStorage.hpp"
#include "fwdiff/ad/AutoDiff.hpp"
#include "fwdiff/io/Logger.hpp"
#include "fwdiff/io/ConfigReader.hpp"

namespace fwdiff {

// Library version
inline constexpr int VERSION_MAJOR = 0;
inline constexpr int VERSION_MINOR = 3;
inline constexpr int VERSION_PATCH = 0;

} // namespace fwdiff
