#ifndef NUMLENS_HPP
#define NUMLENS_HPP

#include "numlens/core/abi.hpp"
#include "numlens/core/big_int.hpp"
#include "numlens/core/decimal.hpp"
#include "numlens/core/enums.hpp"
#include "numlens/core/error_metrics.hpp"
#include "numlens/core/explain.hpp"
#include "numlens/core/fixed_width.hpp"
#include "numlens/core/float_types.hpp"
#include "numlens/core/format.hpp"
#include "numlens/core/ieee754.hpp"
#include "numlens/core/integer_text.hpp"
#include "numlens/core/integer_types.hpp"
#include "numlens/core/mpfr_float.hpp"
#include "numlens/core/report.hpp"
#include "numlens/core/status.hpp"
#include "numlens/core/text.hpp"
#include "numlens/service/latest_request_worker.hpp"

#endif // NUMLENS_HPP
