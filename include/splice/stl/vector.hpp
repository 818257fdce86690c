#pragma once

#include "splice/memory.hpp"

#include <vector>


namespace spl::stl {

template <typename T>
using vector = std::vector<T, gc_allocator<T>>;

} // namespace spl::stl
