#pragma once

#include "splice/memory.hpp"

#include <deque>


namespace spl::stl {

template <typename T>
using deque = std::deque<T, gc_allocator<T>>;

} // namespace spl::stl
