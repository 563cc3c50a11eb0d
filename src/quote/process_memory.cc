/**
 * @file process_memory.cc
 * @brief Working-set measurement from /proc
 * @author Haoming Bai <haomingbai@hotmail.com>
 * @date   2025-10-21
 *
 * Copyright © 2025 Haoming Bai
 * SPDX-License-Identifier: MIT
 */

#include "quoteapi/process_memory.h"

#include <unistd.h>

#include <cstddef>
#include <fstream>
#include <stdexcept>
#include <string>
#include <utility>

using quoteapi::ProcStatmMemoryProbe;

ProcStatmMemoryProbe::ProcStatmMemoryProbe(std::string statm_path)
    : statm_path_(std::move(statm_path)) {}

std::size_t ProcStatmMemoryProbe::WorkingSetBytes() const {
  std::ifstream in(statm_path_);
  if (!in) {
    throw std::runtime_error("Cannot open " + statm_path_);
  }

  // statm: size resident shared text lib data dt, all in pages.
  std::size_t size_pages = 0;
  std::size_t resident_pages = 0;
  if (!(in >> size_pages >> resident_pages)) {
    throw std::runtime_error("Malformed " + statm_path_);
  }

  long page_size = ::sysconf(_SC_PAGESIZE);
  if (page_size <= 0) {
    throw std::runtime_error("sysconf(_SC_PAGESIZE) failed");
  }

  return resident_pages * static_cast<std::size_t>(page_size);
}

std::string quoteapi::FormatWorkingSet(std::size_t bytes) {
  return std::to_string(bytes / 1024 / 1024) + " MB";
}
