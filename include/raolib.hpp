#ifndef RAOLIB_HPP
#define RAOLIB_HPP

#include "raolib/log.hpp"
#include "raolib/base_types.hpp"
#include "raolib/exceptions.hpp"
#include "raolib/interp.hpp"
#include "raolib/phase.hpp"
#include "raolib/rao.hpp"
#include "raolib/adapters.hpp"

// Python only bindings
#ifdef Py_PYTHON_H
#include "raolib/py_bind.hpp"
#endif

#endif // RAOLIB_HPP
