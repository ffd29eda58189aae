#pragma once
#include <ctime>
#include <iostream>
#include <sstream>
#include <string>

/** \file recsim/debug.hpp debug logging macros
 *
 * The RECSIM_DBG family of macros writes a single line to stderr, prefixed with the file, line
 * number and function name of the call site.  They compile to nothing unless `RECSIM_DEBUG` is
 * defined (the `RECSIM_DEBUG` CMake option adds `-DRECSIM_DEBUG`).
 */

#ifdef RECSIM_DEBUG
#define RECSIM_DEBUG_BOOL true
#else
#define RECSIM_DEBUG_BOOL false
#endif

namespace recsim {
/** Chops everything up to the last `recsim/` off of a `__FILE__` value.  Returns by value: the
 * result is only used within the full expression of the debugging macro.
 */
inline std::string debug_file(const char *f) {
    std::string file(f);
    auto e = file.rfind("/recsim/");
    return e == std::string::npos ? file : file.substr(e+1);
}
}

#define _recsim__FILE__ recsim::debug_file(__FILE__).c_str()

#define _recsim_dbg(prefix, stuff) std::ostringstream s; s << prefix << _recsim__FILE__ << ":" << __LINE__ << ":" << __func__ << "(): " << stuff << "\n"; std::cerr << s.str() << std::flush

/** Debugging macro.  RECSIM_DBG(a << b << c); sends a << b << c into std::cerr when debugging is
 * enabled, and does nothing otherwise.  The debugging output has the file/line/function prepended,
 * and a newline appended.
 *
 * Does nothing unless compiled with `-DRECSIM_DEBUG`.
 */
#define RECSIM_DBG(stuff) do { if (RECSIM_DEBUG_BOOL) { _recsim_dbg("", stuff); } } while (0)

/** Debugging macro for a single variable.  RECSIM_DBGVAR(x) is an alias for RECSIM_DBG("x = " << (x)) */
#define RECSIM_DBGVAR(x) RECSIM_DBG(#x " = " << (x))

#define _recsim_tstr std::time_t t = std::time(nullptr); char tstr[100]; std::strftime(tstr, sizeof(tstr), "[%c] ", std::localtime(&t))

/** Debugging macro just like `RECSIM_DBG`, but also prefixes output with the current date and time. */
#define RECSIM_TDBG(stuff) do { if (RECSIM_DEBUG_BOOL) { _recsim_tstr; _recsim_dbg(tstr, stuff); } } while (0)
