#pragma once

/// \file
/// \brief Umbrella header for the public cl3 API.

#include <cl3/core/cliffor.hpp>
#include <cl3/core/config.hpp>
#include <cl3/core/grades.hpp>
#include <cl3/core/kernels.hpp>
#include <cl3/core/norm.hpp>
#include <cl3/core/parallel.hpp>
#include <cl3/core/vec3.hpp>

#include <cl3/io/format.hpp>
#include <cl3/io/storage.hpp>

#include <cl3/ops/bulk.hpp>
#include <cl3/ops/elementary.hpp>
#include <cl3/ops/matrix.hpp>
#include <cl3/ops/spectral.hpp>
#include <cl3/ops/subalgebra.hpp>

#include <cl3/random.hpp>

namespace cl3 {

using core::Cliffor;
using core::Variant;

} // namespace cl3
