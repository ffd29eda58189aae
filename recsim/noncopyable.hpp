#pragma once

namespace recsim {

/** Utility class intended to be inherited (privately) by a class that must not be copied, such as
 * a random number generator or an object owning simulation state.  Constructors and destructor are
 * protected, so the class is only usable as a base.
 *
 * Typical use:
 *
 *     class MatrixStore : private recsim::noncopyable { ... }
 */
class noncopyable {
    protected:
        /// Default empty constructor
        noncopyable() = default;
        /// Default protected destructor
        ~noncopyable() = default;
        /// Deleted copy constructor
        noncopyable(const noncopyable&) = delete;
        /// Deleted copy assignment operator
        noncopyable& operator=(const noncopyable&) = delete;
};

}
