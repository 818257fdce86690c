/*
 * Splice - lexical token splicing and macro expansion toolkit
 * Copyright (C) 2025  Ivan Pidhurskyi
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with this program.  If not, see <https://www.gnu.org/licenses/>.
 */


#pragma once

#include <gc.h>

#include <concepts>
#include <cstddef>
#include <type_traits>
#include <utility>

/**
 * \file memory.hpp
 * Memory management for token trees
 *
 * Token sequences are stored in containers backed by the Boehm GC. Groups own
 * their children by value, so collection never has to trace cross-links; the
 * collector only relieves the expander from tracking the scratch sequences it
 * builds and throws away while rewriting.
 *
 * \ingroup memory
 */

/**
 * \namespace spl
 * The main namespace of the Splice library
 */
namespace spl {

/**
 * Allocate garbage-collected memory
 *
 * \param size Size in bytes to allocate
 * \return void* Pointer to the allocated memory
 *
 * \ingroup memory
 */
inline void*
allocate(size_t size)
{ return GC_malloc(size); }

/**
 * Allocate atomic garbage-collected memory
 *
 * Allocates memory that is known not to contain pointers to
 * garbage-collected objects.
 *
 * \param size Size in bytes to allocate
 * \return void* Pointer to the allocated memory
 *
 * \ingroup memory
 */
inline void*
allocate_atomic(size_t size)
{ return GC_malloc_atomic(size); }


/**
 * Concept for raw memory allocators
 *
 * A raw allocator must be callable with a size_t argument and return
 * a pointer that is convertible to void*.
 *
 * \ingroup memory
 */
template <typename T>
concept raw_allocator = requires(T a)
{
  { a(size_t{}) } -> std::convertible_to<void*>;
};

/**
 * Standard allocator interface on top of the garbage collector
 *
 * \tparam T The value type to allocate
 * \tparam RawAllocator The underlying raw allocator to use
 *
 * \ingroup memory
 */
template <typename T, raw_allocator RawAllocator>
struct gc_allocator_base {
  using pointer = T*;
  using const_pointer = const T*;
  using void_pointer = void*;
  using value_type = T;
  using size_type = size_t;
  using difference_type = ptrdiff_t;

  template <typename U>
  struct rebind {
    using other = gc_allocator_base<U, RawAllocator>;
  };

  using propagate_on_container_move_assignment = std::true_type;
  using is_always_equal = std::true_type;

  gc_allocator_base(const RawAllocator &rawalloc = RawAllocator { })
  : m_rawalloc {rawalloc}
  { }

  gc_allocator_base(const gc_allocator_base &other) = default;

  gc_allocator_base &
  operator = (const gc_allocator_base &other) = default;

  template <typename U>
  gc_allocator_base(const gc_allocator_base<U, RawAllocator> &other)
  : m_rawalloc {other.raw_allocator()}
  { }

  const RawAllocator&
  raw_allocator() const noexcept
  { return m_rawalloc; }

  pointer
  allocate(size_type n)
  { return static_cast<T*>(m_rawalloc(n * sizeof(T))); }

  void
  deallocate(pointer p, [[maybe_unused]] size_type n)
  { GC_free(p); }

  bool
  operator == (const gc_allocator_base &) const noexcept
  { return true; }

  bool
  operator != (const gc_allocator_base &) const noexcept
  { return false; }

  private:
  RawAllocator m_rawalloc;
}; // struct spl::gc_allocator_base

namespace detail {
struct allocate_wrapper {
  void* operator () (size_t nb) const noexcept { return spl::allocate(nb); }
}; // struct spl::detail::allocate_wrapper

struct allocate_atomic_wrapper {
  void* operator () (size_t nb) const noexcept { return spl::allocate_atomic(nb); }
}; // struct spl::detail::allocate_atomic_wrapper
} // namespace spl::detail

template <typename T>
using gc_allocator = gc_allocator_base<T, detail::allocate_wrapper>;

template <typename T>
using atomic_gc_allocator = gc_allocator_base<T, detail::allocate_atomic_wrapper>;

} // namespace spl
