#include "uplimit/payload-too-large.hpp"

#include <cstddef>

#include "uplimit/exception.hpp"

namespace uplimit {

PayloadTooLarge::PayloadTooLarge(std::size_t size, std::size_t limit)
    : exception("payload size exceeds configured maximum ({} > {})", size, limit), _size(size), _limit(limit) {}

}  // namespace uplimit
