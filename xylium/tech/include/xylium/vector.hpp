#pragma once

#include <amc/vector.hpp>  // IWYU pragma: export
#include <memory>

namespace xylium {

template <class T, class Alloc = std::allocator<T>>
using vector = amc::vector<T, Alloc>;

}  // namespace xylium
