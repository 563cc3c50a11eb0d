/**
 * @file process_memory.h
 * @brief Working-set measurement of the running process
 * @author Haoming Bai <haomingbai@hotmail.com>
 * @date   2025-10-21
 *
 * Copyright © 2025 Haoming Bai
 * SPDX-License-Identifier: MIT
 */

#pragma once

#ifndef QUOTEAPI_PROCESS_MEMORY_H_
#define QUOTEAPI_PROCESS_MEMORY_H_

#include <cstddef>
#include <string>

namespace quoteapi {

/**
 * @brief Source of the process working-set size
 *
 * @code
 * class FixedMemoryProbe : public MemoryProbe {
 *  public:
 *   std::size_t WorkingSetBytes() const override { return 42u << 20; }
 * };
 * @endcode
 */
class MemoryProbe {
 public:
  /**
   * @brief Resident memory of the current process
   * @return Size in bytes
   * @throws std::runtime_error if the size cannot be read
   */
  virtual std::size_t WorkingSetBytes() const = 0;

  virtual ~MemoryProbe() = default;
};

/**
 * @brief Linux probe reading the resident page count from /proc
 *
 * The second field of statm is multiplied by the system page size. Every
 * call reads the file again.
 */
class ProcStatmMemoryProbe : public MemoryProbe {
 public:
  std::size_t WorkingSetBytes() const override;

  /**
   * @param statm_path File in /proc/<pid>/statm format
   */
  explicit ProcStatmMemoryProbe(std::string statm_path = "/proc/self/statm");

 private:
  std::string statm_path_;
};

/**
 * @brief Render a byte count as whole megabytes
 * @param bytes Byte count
 * @return "<bytes / 1024 / 1024> MB", rounded down
 */
std::string FormatWorkingSet(std::size_t bytes);

}  // namespace quoteapi

#endif
