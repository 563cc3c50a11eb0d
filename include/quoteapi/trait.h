/**
 * @file trait.h
 * @brief CRTP traits that pin down copy and move semantics
 * @author Haoming Bai <haomingbai@hotmail.com>
 * @date   2025-10-21
 *
 * Copyright © 2025 Haoming Bai
 * SPDX-License-Identifier: MIT
 *
 * @details
 * Server objects in quoteapi own sockets, thread pools and raw pointers
 * into each other, so most of them must never be copied or moved. Deriving
 * from one of these traits states that intention in the type.
 */

#pragma once

#ifndef QUOTEAPI_TRAIT_H_
#define QUOTEAPI_TRAIT_H_

namespace quoteapi {

/**
 * @brief Enables both copy and move semantics
 *
 * Used by stateless objects (such as fallback handlers) that may be freely
 * duplicated.
 *
 * @tparam Derived The class inheriting from this trait (CRTP)
 */
template <typename Derived>
struct CopyableMovable {
  CopyableMovable() = default;

  CopyableMovable(const CopyableMovable&) = default;
  CopyableMovable& operator=(const CopyableMovable&) = default;

  CopyableMovable(CopyableMovable&&) noexcept = default;
  CopyableMovable& operator=(CopyableMovable&&) noexcept = default;

  ~CopyableMovable() = default;

 protected:
  /// @brief CRTP helper to access derived class instance
  Derived& derived() noexcept { return static_cast<Derived&>(*this); }

  /// @brief CRTP helper to access const derived class instance
  const Derived& derived() const noexcept {
    return static_cast<const Derived&>(*this);
  }
};

/**
 * @brief Disables both copy and move semantics
 *
 * Connections, tasks and the server hand out raw pointers and strands bound
 * to their address; the catalog is shared read-only between threads. None of
 * them may change identity after construction.
 *
 * @tparam Derived The class inheriting from this trait (CRTP)
 *
 * @code
 * class QuoteCatalog : public NonCopyableNonMovable<QuoteCatalog> {
 *   // Shared as std::shared_ptr<const QuoteCatalog>, never copied.
 * };
 * @endcode
 */
template <typename Derived>
struct NonCopyableNonMovable {
  NonCopyableNonMovable() = default;

  NonCopyableNonMovable(const NonCopyableNonMovable&) = delete;
  NonCopyableNonMovable& operator=(const NonCopyableNonMovable&) = delete;

  NonCopyableNonMovable(NonCopyableNonMovable&&) = delete;
  NonCopyableNonMovable& operator=(NonCopyableNonMovable&&) = delete;

  ~NonCopyableNonMovable() = default;

 protected:
  /// @brief CRTP helper to access derived class instance
  Derived& derived() noexcept { return static_cast<Derived&>(*this); }

  /// @brief CRTP helper to access const derived class instance
  const Derived& derived() const noexcept {
    return static_cast<const Derived&>(*this);
  }
};

}  // namespace quoteapi

#endif
