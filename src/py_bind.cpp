#include <climits>
#include <cmath>
#include <complex>
#include <new>
#include <stdexcept>
#include <string>
#include "raolib/py_bind.hpp"
#include "raolib/exceptions.hpp"
#include "raolib/log.hpp"

namespace raolib
{
    /**
     * @brief Reads a float attribute, keeping `fallback` when the attribute does not exist.
     */
    static double RAOLIB_getFloatAttr(PyObject *obj, const char *name, double fallback)
    {
        if (!PyObject_HasAttrString(obj, name))
        {
            return fallback;
        }
        // PyObject_GetAttrString returns a new reference (must be DECREF'd)
        PyObject *value = PyObject_GetAttrString(obj, name);
        if (value == nullptr)
        {
            return fallback;
        }
        double result = PyFloat_AsDouble(value);
        Py_DECREF(value);
        return result;
    }

    static bool RAOLIB_getBoolAttr(PyObject *obj, const char *name, bool fallback)
    {
        if (!PyObject_HasAttrString(obj, name))
        {
            return fallback;
        }
        PyObject *value = PyObject_GetAttrString(obj, name);
        if (value == nullptr)
        {
            return fallback;
        }
        int truth = PyObject_IsTrue(value);
        Py_DECREF(value);
        if (truth < 0)
        {
            return fallback;
        }
        return truth != 0;
    }

    RAOLIB_Config RAOLIB_Config_fromPyObject(PyObject *config)
    {
        RAOLIB_Config defaults;
        if (config == nullptr || config == Py_None)
        {
            return defaults;
        }

        double period = RAOLIB_getFloatAttr(config, "cHeadingPeriodDeg", defaults.cHeadingPeriodDeg);
        if (PyErr_Occurred())
        {
            return defaults;
        }
        bool wrap = RAOLIB_getBoolAttr(config, "cWrapPhase", defaults.cWrapPhase);
        if (PyErr_Occurred())
        {
            return defaults;
        }

        try
        {
            return RAOLIB_Config(period, wrap);
        }
        catch (const std::exception &)
        {
            RAOLIB_setPyErrorFromCurrentException();
            return defaults;
        }
    };

    RAOLIB_MotionMode RAOLIB_MotionMode_fromPyObject(PyObject *mode)
    {
        if (mode == nullptr || mode == Py_None)
        {
            return RAOLIB_MotionMode::NONE;
        }

        if (PyUnicode_Check(mode))
        {
            const char *name = PyUnicode_AsUTF8(mode);
            if (name == nullptr)
            {
                return RAOLIB_MotionMode::NONE;
            }
            try
            {
                return RAOLIB_MotionMode_fromString(name);
            }
            catch (const std::exception &)
            {
                RAOLIB_setPyErrorFromCurrentException();
                return RAOLIB_MotionMode::NONE;
            }
        }

        if (PyLong_Check(mode))
        {
            long value = PyLong_AsLong(mode);
            if (value == -1 && PyErr_Occurred())
            {
                return RAOLIB_MotionMode::NONE;
            }
            if (value < INT_MIN || value > INT_MAX)
            {
                PyErr_Format(PyExc_OverflowError, "Mode value %ld does not fit in an int", value);
                return RAOLIB_MotionMode::NONE;
            }
            return static_cast<RAOLIB_MotionMode>(static_cast<int>(value));
        }

        PyErr_Format(PyExc_TypeError, "Mode must be None, int or str, not %.200s", Py_TYPE(mode)->tp_name);
        return RAOLIB_MotionMode::NONE;
    }

    RAOLIB_Axis RAOLIB_Axis_fromPySequence(PyObject *seq)
    {
        RAOLIB_Axis axis;

        // PySequence_Fast returns a new reference; items are borrowed
        PyObject *fast = PySequence_Fast(seq, "Expected a sequence of numbers");
        if (fast == nullptr)
        {
            return axis;
        }

        Py_ssize_t len = PySequence_Fast_GET_SIZE(fast);
        axis.reserve((size_t)len);

        for (Py_ssize_t i = 0; i < len; i++)
        {
            PyObject *item = PySequence_Fast_GET_ITEM(fast, i);
            double value = PyFloat_AsDouble(item);
            if (value == -1.0 && PyErr_Occurred())
            {
                Py_DECREF(fast);
                return RAOLIB_Axis();
            }
            axis.push_back(value);
        }

        Py_DECREF(fast);
        return axis;
    }

    RAOLIB_Table RAOLIB_Table_fromPySequence(PyObject *seq)
    {
        RAOLIB_Table table;

        PyObject *fast = PySequence_Fast(seq, "Expected a sequence of rows");
        if (fast == nullptr)
        {
            return table;
        }

        Py_ssize_t len = PySequence_Fast_GET_SIZE(fast);
        table.reserve((size_t)len);

        for (Py_ssize_t i = 0; i < len; i++)
        {
            RAOLIB_Axis row = RAOLIB_Axis_fromPySequence(PySequence_Fast_GET_ITEM(fast, i));
            if (PyErr_Occurred())
            {
                Py_DECREF(fast);
                return RAOLIB_Table();
            }
            table.push_back(row);
        }

        Py_DECREF(fast);
        return table;
    }

    RAOLIB_ComplexTable RAOLIB_ComplexTable_fromPySequence(PyObject *seq)
    {
        RAOLIB_ComplexTable table;

        PyObject *fast = PySequence_Fast(seq, "Expected a sequence of rows");
        if (fast == nullptr)
        {
            return table;
        }

        Py_ssize_t n_rows = PySequence_Fast_GET_SIZE(fast);
        table.resize((size_t)n_rows);

        for (Py_ssize_t i = 0; i < n_rows; i++)
        {
            PyObject *row = PySequence_Fast(PySequence_Fast_GET_ITEM(fast, i), "Expected a sequence of complex numbers");
            if (row == nullptr)
            {
                Py_DECREF(fast);
                return RAOLIB_ComplexTable();
            }

            Py_ssize_t n_cols = PySequence_Fast_GET_SIZE(row);
            table[i].reserve((size_t)n_cols);
            for (Py_ssize_t j = 0; j < n_cols; j++)
            {
                // Accepts complex, float and int
                Py_complex z = PyComplex_AsCComplex(PySequence_Fast_GET_ITEM(row, j));
                if (z.real == -1.0 && PyErr_Occurred())
                {
                    Py_DECREF(row);
                    Py_DECREF(fast);
                    return RAOLIB_ComplexTable();
                }
                table[i].push_back(std::complex<double>(z.real, z.imag));
            }
            Py_DECREF(row);
        }

        Py_DECREF(fast);
        return table;
    }

    PyObject *RAOLIB_Axis_toPyList(const RAOLIB_Axis &axis)
    {
        PyObject *list = PyList_New((Py_ssize_t)axis.size());
        if (list == nullptr)
        {
            return nullptr;
        }
        for (std::size_t i = 0; i < axis.size(); ++i)
        {
            PyObject *item = PyFloat_FromDouble(axis[i]);
            if (item == nullptr)
            {
                Py_DECREF(list);
                return nullptr;
            }
            // PyList_SET_ITEM steals the reference
            PyList_SET_ITEM(list, (Py_ssize_t)i, item);
        }
        return list;
    }

    PyObject *RAOLIB_Table_toPyList(const RAOLIB_Table &table)
    {
        PyObject *list = PyList_New((Py_ssize_t)table.size());
        if (list == nullptr)
        {
            return nullptr;
        }
        for (std::size_t i = 0; i < table.size(); ++i)
        {
            PyObject *row = RAOLIB_Axis_toPyList(table[i]);
            if (row == nullptr)
            {
                Py_DECREF(list);
                return nullptr;
            }
            PyList_SET_ITEM(list, (Py_ssize_t)i, row);
        }
        return list;
    }

    PyObject *RAOLIB_ComplexTable_toPyList(const RAOLIB_ComplexTable &table)
    {
        PyObject *list = PyList_New((Py_ssize_t)table.size());
        if (list == nullptr)
        {
            return nullptr;
        }
        for (std::size_t i = 0; i < table.size(); ++i)
        {
            PyObject *row = PyList_New((Py_ssize_t)table[i].size());
            if (row == nullptr)
            {
                Py_DECREF(list);
                return nullptr;
            }
            for (std::size_t j = 0; j < table[i].size(); ++j)
            {
                PyObject *item = PyComplex_FromDoubles(table[i][j].real(), table[i][j].imag());
                if (item == nullptr)
                {
                    Py_DECREF(row);
                    Py_DECREF(list);
                    return nullptr;
                }
                PyList_SET_ITEM(row, (Py_ssize_t)j, item);
            }
            PyList_SET_ITEM(list, (Py_ssize_t)i, row);
        }
        return list;
    }

    void RAOLIB_setPyErrorFromCurrentException()
    {
        try
        {
            throw;
        }
        catch (const RAOLIB_InvalidConfigurationError &e)
        {
            PyErr_SetString(PyExc_ValueError, e.what());
        }
        catch (const RAOLIB_ShapeMismatchError &e)
        {
            PyErr_SetString(PyExc_ValueError, e.what());
        }
        catch (const std::invalid_argument &e)
        {
            PyErr_SetString(PyExc_ValueError, e.what());
        }
        catch (const std::domain_error &e)
        {
            PyErr_SetString(PyExc_ValueError, e.what());
        }
        catch (const std::out_of_range &e)
        {
            PyErr_SetString(PyExc_IndexError, e.what());
        }
        catch (const std::bad_alloc &)
        {
            PyErr_NoMemory();
        }
        catch (const std::exception &e)
        {
            RAOLIB_ERROR("Unexpected exception: %s", e.what());
            PyErr_SetString(PyExc_RuntimeError, e.what());
        }
    }

}; // namespace raolib
