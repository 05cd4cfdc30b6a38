/**
 * @file   exception.hh
 *
 * @date   19 Oct 2026
 *
 * @brief  exceptions of libmuGalerkin, carrying a resolved stack trace
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

#ifndef SRC_LIBMUGALERKIN_EXCEPTION_HH_
#define SRC_LIBMUGALERKIN_EXCEPTION_HH_

#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace muGalerkin {

  //! One resolved (or unresolvable) frame of a call stack
  class TracebackEntry {
   public:
    TracebackEntry(void * address, const std::string & symbol);

    const std::string & get_symbol() const { return this->symbol; }
    const std::string & get_name() const { return this->name; }
    const std::string & get_file() const { return this->file; }

    bool is_resolved() const { return this->resolved; }

    friend std::ostream & operator<<(std::ostream & os,
                                     const TracebackEntry & self);

   protected:
    void resolve();

    void * address;
    std::string symbol;
    std::string name{};
    std::string file{};
    bool resolved{false};
  };

  /**
   * Stack trace at the point of construction. The innermost
   * `discard_entries` frames (the exception machinery itself) are dropped.
   */
  class Traceback {
   public:
    explicit Traceback(int discard_entries);

    const std::vector<TracebackEntry> & get_stack() const {
      return this->stack;
    }

    friend std::ostream & operator<<(std::ostream & os,
                                     const Traceback & self);

   protected:
    std::vector<TracebackEntry> stack{};
  };

  /**
   * Decorates a standard exception type with the C++ stack trace of the
   * throw site, appended to `what()`.
   */
  template <class T>
  class ExceptionWithTraceback : public T {
   public:
    explicit ExceptionWithTraceback(const std::string & message)
        : T{message}, traceback{3}, buffer{} {
      std::stringstream os;
      os << T::what() << std::endl
         << "Traceback from C++ library (most recent call last):"
         << std::endl
         << this->traceback;
      this->buffer = os.str();
    }
    virtual ~ExceptionWithTraceback() noexcept {}

    const char * what() const noexcept override {
      return this->buffer.c_str();
    }

    //! the message without traceback
    const char * message() const noexcept { return T::what(); }

   protected:
    Traceback traceback;
    std::string buffer;
  };

  using RuntimeError = ExceptionWithTraceback<std::runtime_error>;

  /* ---------------------------------------------------------------------- */
  //! a basis cannot be constructed for the requested boundary data
  class BasisError : public RuntimeError {
    using RuntimeError::RuntimeError;
  };

  /* ---------------------------------------------------------------------- */
  //! spaces, functions or operators that do not fit together
  class SpaceError : public RuntimeError {
    using RuntimeError::RuntimeError;
  };

  /* ---------------------------------------------------------------------- */
  //! singular or otherwise unsolvable block system
  class SolverError : public RuntimeError {
    using RuntimeError::RuntimeError;
  };

}  // namespace muGalerkin

#endif  // SRC_LIBMUGALERKIN_EXCEPTION_HH_
