#ifndef RAOLIB_PY_BIND_HPP
#define RAOLIB_PY_BIND_HPP

#define PY_SSIZE_T_CLEAN
#include <Python.h>
#include "raolib/base_types.hpp"

/*
Conversion helpers follow the CPython convention: on failure a Python
exception is set and an empty value (or nullptr) is returned. Callers check
PyErr_Occurred() before using the result.
*/

namespace raolib
{
    /**
     * @brief Converts a Python configuration object to a native RAOLIB_Config.
     *
     * Reads the attributes `cHeadingPeriodDeg` and `cWrapPhase`; a missing
     * attribute keeps its default. None gives the default configuration.
     *
     * @param config Pointer to a Python object exposing the configuration attributes.
     * @return RAOLIB_Config populated from the Python object.
     */
    RAOLIB_Config RAOLIB_Config_fromPyObject(PyObject *config);

    /**
     * @brief Converts None, an int or a mode name ("Heave", "ROLL", ...) to a RAOLIB_MotionMode.
     *
     * Integers are passed through unchecked, so unknown modes stay detectable
     * where the mode is used.
     */
    RAOLIB_MotionMode RAOLIB_MotionMode_fromPyObject(PyObject *mode);

    /**
     * @brief Converts any sequence of numbers (list, tuple, numpy array) to a RAOLIB_Axis.
     */
    RAOLIB_Axis RAOLIB_Axis_fromPySequence(PyObject *seq);

    /**
     * @brief Converts a sequence of sequences of numbers to a RAOLIB_Table.
     *
     * Rows may differ in length here; the shape is checked against the axes by the RAO.
     */
    RAOLIB_Table RAOLIB_Table_fromPySequence(PyObject *seq);

    /**
     * @brief Converts a sequence of sequences of complex numbers to a RAOLIB_ComplexTable.
     */
    RAOLIB_ComplexTable RAOLIB_ComplexTable_fromPySequence(PyObject *seq);

    /// @return New reference to a list of floats, or nullptr with an exception set.
    PyObject *RAOLIB_Axis_toPyList(const RAOLIB_Axis &axis);
    /// @return New reference to a list of lists of floats, or nullptr with an exception set.
    PyObject *RAOLIB_Table_toPyList(const RAOLIB_Table &table);
    /// @return New reference to a list of lists of complex, or nullptr with an exception set.
    PyObject *RAOLIB_ComplexTable_toPyList(const RAOLIB_ComplexTable &table);

    /**
     * @brief Translates the C++ exception being handled into a Python exception.
     *
     * Must be called from inside a catch block.
     */
    void RAOLIB_setPyErrorFromCurrentException();

}; // namespace raolib

#endif // RAOLIB_PY_BIND_HPP
