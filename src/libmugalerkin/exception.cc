/**
 * @file   exception.cc
 *
 * @date   19 Oct 2026
 *
 * @brief  stack trace collection for libmuGalerkin exceptions
 *
 * Copyright © 2026 µElastic developers
 *
 * µElastic is free software; you can redistribute it and/or
 * modify it under the terms of the GNU Lesser General Public License as
 * published by the Free Software Foundation, either version 3, or (at
 * your option) any later version.
 *
 * µElastic is distributed in the hope that it will be useful, but
 * WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the GNU
 * Lesser General Public License for more details.
 *
 * You should have received a copy of the GNU Lesser General Public License
 * along with µElastic; see the file COPYING. If not, write to the
 * Free Software Foundation, Inc., 59 Temple Place - Suite 330,
 * Boston, MA 02111-1307, USA.
 *
 */

#include <cxxabi.h>
#include <dlfcn.h>
#include <execinfo.h>

#include <cstdlib>

#include "exception.hh"

namespace muGalerkin {

  constexpr int MaxTracebackDepth{256};

  /* ---------------------------------------------------------------------- */
  TracebackEntry::TracebackEntry(void * address, const std::string & symbol)
      : address{address}, symbol{symbol} {
    this->resolve();
  }

  /* ---------------------------------------------------------------------- */
  void TracebackEntry::resolve() {
    Dl_info info;
    if (!dladdr(this->address, &info)) {
      return;
    }

    if (info.dli_sname) {
      this->name = info.dli_sname;
      int status{};
      char * demangled{
          abi::__cxa_demangle(this->name.c_str(), nullptr, nullptr, &status)};
      if (status == 0 && demangled) {
        this->name = demangled;
      }
      std::free(demangled);
      this->resolved = true;
    }

    if (info.dli_fname) {
      this->file = info.dli_fname;
    }
  }

  /* ---------------------------------------------------------------------- */
  std::ostream & operator<<(std::ostream & os, const TracebackEntry & self) {
    if (self.resolved) {
      os << "  File \"" << self.file << "\"" << std::endl
         << "    " << self.name;
    } else {
      os << "  Stack frame [" << self.address << "] could not be resolved to "
         << "a function/method name.";
    }
    return os;
  }

  /* ---------------------------------------------------------------------- */
  Traceback::Traceback(int discard_entries) {
    void * buffer[MaxTracebackDepth];
    int size{backtrace(buffer, MaxTracebackDepth)};
    char ** symbols{backtrace_symbols(buffer, size)};
    if (symbols == nullptr) {
      return;
    }
    for (int i{discard_entries}; i < size; ++i) {
      this->stack.emplace_back(buffer[i], std::string{symbols[i]});
    }
    std::free(symbols);
  }

  /* ---------------------------------------------------------------------- */
  std::ostream & operator<<(std::ostream & os, const Traceback & self) {
    // frames beyond the first unresolvable one belong to the host program
    // (test runner, interpreter) and are not printed
    long nb_resolved{0};
    const long size{static_cast<long>(self.stack.size())};
    while (nb_resolved < size && self.stack[nb_resolved].is_resolved()) {
      ++nb_resolved;
    }
    for (long j{nb_resolved - 1}; j >= 0; --j) {
      os << self.stack[j];
      if (j != 0) {
        os << std::endl;
      }
    }
    return os;
  }

}  // namespace muGalerkin
