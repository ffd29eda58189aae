#pragma once
#include <cstddef>
#include <cstdint>

/** \file recsim/types.hpp basic types
 *
 * This header includes the basic index typedefs used throughout recsim.
 */

namespace recsim {
/** Integer type that stores a user index: the row of the user in the review and utility matrices
 * of the MatrixStore that owns it.  Established users are numbered `0` through `n-1`; newcomers in
 * a cold-start pass are numbered from 0 within their own store.
 */
using user_t = std::uint32_t;

/** Integer type that stores a good index: the column of the good in every review and utility
 * matrix.  Goods are numbered `0` through `n-1` and have no attributes beyond their index.
 */
using good_t = std::uint32_t;

/** Signed integer type that stores a tick number.  Ticks start at 0. */
using tick_t = std::int32_t;

/** std::size_t alias primarily for internal recsim use. */
using size_t = std::size_t;

}
