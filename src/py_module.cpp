#define PY_SSIZE_T_CLEAN
#include <Python.h>
#include <complex>
#include <new>
#include <stdexcept>
#include <string>
#include "raolib.hpp"

using namespace raolib;

/*
Extension module `_raolib`: exposes RAOLIB_Rao to Python as `Rao`.
C++ exceptions never cross into the interpreter; every entry point
catches std::exception and translates it with RAOLIB_setPyErrorFromCurrentException.
*/

typedef struct
{
    PyObject_HEAD
        RAOLIB_Rao *rao;
} RaoObject;

static PyTypeObject RaoType = {
    PyVarObject_HEAD_INIT(nullptr, 0)};

static PyObject *Rao_new(PyTypeObject *type, PyObject *args, PyObject *kwds)
{
    RaoObject *self = (RaoObject *)type->tp_alloc(type, 0);
    if (self != nullptr)
    {
        self->rao = nullptr;
    }
    return (PyObject *)self;
}

static int Rao_init(RaoObject *self, PyObject *args, PyObject *kwds)
{
    static const char *kwlist[] = {"config", nullptr};
    PyObject *config_obj = Py_None;
    if (!PyArg_ParseTupleAndKeywords(args, kwds, "|O", const_cast<char **>(kwlist), &config_obj))
    {
        return -1;
    }

    RAOLIB_Config config = RAOLIB_Config_fromPyObject(config_obj);
    if (PyErr_Occurred())
    {
        return -1;
    }

    try
    {
        RAOLIB_Rao *rao = new RAOLIB_Rao(config);
        delete self->rao;
        self->rao = rao;
    }
    catch (const std::exception &)
    {
        RAOLIB_setPyErrorFromCurrentException();
        return -1;
    }
    return 0;
}

static void Rao_dealloc(RaoObject *self)
{
    delete self->rao;
    self->rao = nullptr;
    Py_TYPE(self)->tp_free((PyObject *)self);
}

static bool Rao_check_ready(RaoObject *self)
{
    if (self->rao == nullptr)
    {
        PyErr_SetString(PyExc_RuntimeError, "Rao.__init__ was not called");
        return false;
    }
    return true;
}

static PyObject *Rao_set_data(RaoObject *self, PyObject *args, PyObject *kwds)
{
    static const char *kwlist[] = {"wave_directions", "omegas", "amplitude", "phase", "mode", nullptr};
    PyObject *dirs_obj, *omegas_obj, *amp_obj, *phase_obj;
    PyObject *mode_obj = Py_None;
    if (!PyArg_ParseTupleAndKeywords(args, kwds, "OOOO|O", const_cast<char **>(kwlist),
                                     &dirs_obj, &omegas_obj, &amp_obj, &phase_obj, &mode_obj))
    {
        return nullptr;
    }
    if (!Rao_check_ready(self))
    {
        return nullptr;
    }

    RAOLIB_Axis dirs = RAOLIB_Axis_fromPySequence(dirs_obj);
    if (PyErr_Occurred())
        return nullptr;
    RAOLIB_Axis omegas = RAOLIB_Axis_fromPySequence(omegas_obj);
    if (PyErr_Occurred())
        return nullptr;
    RAOLIB_Table amplitude = RAOLIB_Table_fromPySequence(amp_obj);
    if (PyErr_Occurred())
        return nullptr;
    RAOLIB_Table phase = RAOLIB_Table_fromPySequence(phase_obj);
    if (PyErr_Occurred())
        return nullptr;
    RAOLIB_MotionMode mode = RAOLIB_MotionMode_fromPyObject(mode_obj);
    if (PyErr_Occurred())
        return nullptr;

    try
    {
        self->rao->set_data(dirs, omegas, amplitude, phase, mode);
    }
    catch (const std::exception &)
    {
        RAOLIB_setPyErrorFromCurrentException();
        return nullptr;
    }
    Py_RETURN_NONE;
}

static PyObject *Rao_from_complex(RaoObject *self, PyObject *args, PyObject *kwds)
{
    static const char *kwlist[] = {"wave_directions", "omegas", "values", "mode", nullptr};
    PyObject *dirs_obj, *omegas_obj, *values_obj;
    PyObject *mode_obj = Py_None;
    if (!PyArg_ParseTupleAndKeywords(args, kwds, "OOO|O", const_cast<char **>(kwlist),
                                     &dirs_obj, &omegas_obj, &values_obj, &mode_obj))
    {
        return nullptr;
    }
    if (!Rao_check_ready(self))
    {
        return nullptr;
    }

    RAOLIB_Axis dirs = RAOLIB_Axis_fromPySequence(dirs_obj);
    if (PyErr_Occurred())
        return nullptr;
    RAOLIB_Axis omegas = RAOLIB_Axis_fromPySequence(omegas_obj);
    if (PyErr_Occurred())
        return nullptr;
    RAOLIB_ComplexTable values = RAOLIB_ComplexTable_fromPySequence(values_obj);
    if (PyErr_Occurred())
        return nullptr;
    RAOLIB_MotionMode mode = RAOLIB_MotionMode_fromPyObject(mode_obj);
    if (PyErr_Occurred())
        return nullptr;

    try
    {
        *self->rao = RAOLIB_from_complex(dirs, omegas, values, mode, self->rao->config());
    }
    catch (const std::exception &)
    {
        RAOLIB_setPyErrorFromCurrentException();
        return nullptr;
    }
    Py_RETURN_NONE;
}

static PyObject *Rao_regrid_omega(RaoObject *self, PyObject *arg)
{
    if (!Rao_check_ready(self))
        return nullptr;
    RAOLIB_Axis targets = RAOLIB_Axis_fromPySequence(arg);
    if (PyErr_Occurred())
        return nullptr;
    try
    {
        self->rao->regrid_omega(targets);
    }
    catch (const std::exception &)
    {
        RAOLIB_setPyErrorFromCurrentException();
        return nullptr;
    }
    Py_RETURN_NONE;
}

static PyObject *Rao_regrid_direction(RaoObject *self, PyObject *arg)
{
    if (!Rao_check_ready(self))
        return nullptr;
    RAOLIB_Axis targets = RAOLIB_Axis_fromPySequence(arg);
    if (PyErr_Occurred())
        return nullptr;
    try
    {
        self->rao->regrid_direction(targets);
    }
    catch (const std::exception &)
    {
        RAOLIB_setPyErrorFromCurrentException();
        return nullptr;
    }
    Py_RETURN_NONE;
}

static PyObject *Rao_add_direction(RaoObject *self, PyObject *arg)
{
    if (!Rao_check_ready(self))
        return nullptr;
    double value = PyFloat_AsDouble(arg);
    if (PyErr_Occurred())
        return nullptr;
    try
    {
        self->rao->add_direction(value);
    }
    catch (const std::exception &)
    {
        RAOLIB_setPyErrorFromCurrentException();
        return nullptr;
    }
    Py_RETURN_NONE;
}

static PyObject *Rao_add_frequency(RaoObject *self, PyObject *arg)
{
    if (!Rao_check_ready(self))
        return nullptr;
    double value = PyFloat_AsDouble(arg);
    if (PyErr_Occurred())
        return nullptr;
    try
    {
        self->rao->add_frequency(value);
    }
    catch (const std::exception &)
    {
        RAOLIB_setPyErrorFromCurrentException();
        return nullptr;
    }
    Py_RETURN_NONE;
}

static PyObject *Rao_ensure_point(RaoObject *self, PyObject *args)
{
    double wave_direction, omega;
    if (!PyArg_ParseTuple(args, "dd", &wave_direction, &omega))
        return nullptr;
    if (!Rao_check_ready(self))
        return nullptr;
    try
    {
        self->rao->ensure_point(wave_direction, omega);
    }
    catch (const std::exception &)
    {
        RAOLIB_setPyErrorFromCurrentException();
        return nullptr;
    }
    Py_RETURN_NONE;
}

static PyObject *Rao_get_value(RaoObject *self, PyObject *args, PyObject *kwds)
{
    static const char *kwlist[] = {"wave_direction", "omega", nullptr};
    double wave_direction, omega;
    if (!PyArg_ParseTupleAndKeywords(args, kwds, "dd", const_cast<char **>(kwlist), &wave_direction, &omega))
        return nullptr;
    if (!Rao_check_ready(self))
        return nullptr;
    try
    {
        std::complex<double> z = self->rao->get_value(wave_direction, omega);
        return PyComplex_FromDoubles(z.real(), z.imag());
    }
    catch (const std::exception &)
    {
        RAOLIB_setPyErrorFromCurrentException();
        return nullptr;
    }
}

static PyObject *Rao_scale(RaoObject *self, PyObject *arg)
{
    if (!Rao_check_ready(self))
        return nullptr;
    double factor = PyFloat_AsDouble(arg);
    if (PyErr_Occurred())
        return nullptr;
    try
    {
        self->rao->scale(factor);
    }
    catch (const std::exception &)
    {
        RAOLIB_setPyErrorFromCurrentException();
        return nullptr;
    }
    Py_RETURN_NONE;
}

static PyObject *Rao_add_symmetry_xz(RaoObject *self, PyObject *Py_UNUSED(ignored))
{
    if (!Rao_check_ready(self))
        return nullptr;
    try
    {
        self->rao->add_symmetry_xz();
    }
    catch (const std::exception &)
    {
        RAOLIB_setPyErrorFromCurrentException();
        return nullptr;
    }
    Py_RETURN_NONE;
}

/**
 * @brief Returns a dict with keys wave_direction, omega, real, imag, mode.
 */
static PyObject *Rao_to_real_imag(RaoObject *self, PyObject *Py_UNUSED(ignored))
{
    if (!Rao_check_ready(self))
        return nullptr;

    RAOLIB_RealImag data;
    try
    {
        data = RAOLIB_to_real_imag(*self->rao);
    }
    catch (const std::exception &)
    {
        RAOLIB_setPyErrorFromCurrentException();
        return nullptr;
    }

    PyObject *dirs = RAOLIB_Axis_toPyList(data.wave_directions);
    PyObject *omegas = RAOLIB_Axis_toPyList(data.omegas);
    PyObject *real = RAOLIB_Table_toPyList(data.real);
    PyObject *imag = RAOLIB_Table_toPyList(data.imag);
    if (dirs == nullptr || omegas == nullptr || real == nullptr || imag == nullptr)
    {
        Py_XDECREF(dirs);
        Py_XDECREF(omegas);
        Py_XDECREF(real);
        Py_XDECREF(imag);
        return nullptr;
    }

    // "N" steals the references
    return Py_BuildValue("{s:N,s:N,s:N,s:N,s:i}",
                         "wave_direction", dirs,
                         "omega", omegas,
                         "real", real,
                         "imag", imag,
                         "mode", static_cast<int>(data.mode));
}

static PyObject *Rao_from_real_imag(RaoObject *self, PyObject *args, PyObject *kwds)
{
    static const char *kwlist[] = {"wave_directions", "omegas", "real", "imag", "mode", nullptr};
    PyObject *dirs_obj, *omegas_obj, *real_obj, *imag_obj, *mode_obj;
    if (!PyArg_ParseTupleAndKeywords(args, kwds, "OOOOO", const_cast<char **>(kwlist),
                                     &dirs_obj, &omegas_obj, &real_obj, &imag_obj, &mode_obj))
    {
        return nullptr;
    }
    if (!Rao_check_ready(self))
        return nullptr;

    RAOLIB_RealImag data;
    data.wave_directions = RAOLIB_Axis_fromPySequence(dirs_obj);
    if (PyErr_Occurred())
        return nullptr;
    data.omegas = RAOLIB_Axis_fromPySequence(omegas_obj);
    if (PyErr_Occurred())
        return nullptr;
    data.real = RAOLIB_Table_fromPySequence(real_obj);
    if (PyErr_Occurred())
        return nullptr;
    data.imag = RAOLIB_Table_fromPySequence(imag_obj);
    if (PyErr_Occurred())
        return nullptr;
    data.mode = RAOLIB_MotionMode_fromPyObject(mode_obj);
    if (PyErr_Occurred())
        return nullptr;

    try
    {
        *self->rao = RAOLIB_from_real_imag(data, self->rao->config());
    }
    catch (const std::exception &)
    {
        RAOLIB_setPyErrorFromCurrentException();
        return nullptr;
    }
    Py_RETURN_NONE;
}

static PyObject *Rao_str(RaoObject *self)
{
    if (!Rao_check_ready(self))
        return nullptr;
    try
    {
        std::string text = self->rao->to_string();
        return PyUnicode_FromStringAndSize(text.data(), (Py_ssize_t)text.size());
    }
    catch (const std::exception &)
    {
        RAOLIB_setPyErrorFromCurrentException();
        return nullptr;
    }
}

// rao["amplitude"], rao["phase"], rao["complex_unit"]
static PyObject *Rao_getitem(RaoObject *self, PyObject *key)
{
    if (!Rao_check_ready(self))
        return nullptr;
    if (!PyUnicode_Check(key))
    {
        PyErr_SetString(PyExc_KeyError, "Rao channels are indexed by name");
        return nullptr;
    }
    const char *name = PyUnicode_AsUTF8(key);
    if (name == nullptr)
        return nullptr;

    try
    {
        RAOLIB_RaoChannel channel = RAOLIB_RaoChannel_fromString(name);
        if (channel == RAOLIB_RaoChannel::PHASE_VECTOR)
        {
            return RAOLIB_ComplexTable_toPyList(self->rao->phase_vector());
        }
        return RAOLIB_Table_toPyList(self->rao->values(channel));
    }
    catch (const std::invalid_argument &e)
    {
        PyErr_SetString(PyExc_KeyError, e.what());
        return nullptr;
    }
    catch (const std::exception &)
    {
        RAOLIB_setPyErrorFromCurrentException();
        return nullptr;
    }
}

static PyObject *Rao_get_n_frequencies(RaoObject *self, void *Py_UNUSED(closure))
{
    if (!Rao_check_ready(self))
        return nullptr;
    return PyLong_FromSize_t(self->rao->n_frequencies());
}

static PyObject *Rao_get_n_wave_directions(RaoObject *self, void *Py_UNUSED(closure))
{
    if (!Rao_check_ready(self))
        return nullptr;
    return PyLong_FromSize_t(self->rao->n_wave_directions());
}

static PyObject *Rao_get_wave_directions(RaoObject *self, void *Py_UNUSED(closure))
{
    if (!Rao_check_ready(self))
        return nullptr;
    return RAOLIB_Axis_toPyList(self->rao->wave_directions());
}

static PyObject *Rao_get_omegas(RaoObject *self, void *Py_UNUSED(closure))
{
    if (!Rao_check_ready(self))
        return nullptr;
    return RAOLIB_Axis_toPyList(self->rao->omegas());
}

static PyObject *Rao_get_mode(RaoObject *self, void *Py_UNUSED(closure))
{
    if (!Rao_check_ready(self))
        return nullptr;
    return PyLong_FromLong(static_cast<long>(self->rao->mode()));
}

static int Rao_set_mode(RaoObject *self, PyObject *value, void *Py_UNUSED(closure))
{
    if (value == nullptr)
    {
        PyErr_SetString(PyExc_AttributeError, "Cannot delete the mode attribute");
        return -1;
    }
    if (!Rao_check_ready(self))
        return -1;
    RAOLIB_MotionMode mode = RAOLIB_MotionMode_fromPyObject(value);
    if (PyErr_Occurred())
        return -1;
    self->rao->set_mode(mode);
    return 0;
}

static PyMethodDef Rao_methods[] = {
    {"set_data", (PyCFunction)(void (*)(void))Rao_set_data, METH_VARARGS | METH_KEYWORDS,
     "set_data(wave_directions, omegas, amplitude, phase, mode=None)\n\nReplaces the grid."},
    {"from_complex", (PyCFunction)(void (*)(void))Rao_from_complex, METH_VARARGS | METH_KEYWORDS,
     "from_complex(wave_directions, omegas, values, mode=None)\n\nReplaces the grid with |z| and arg(z)."},
    {"regrid_omega", (PyCFunction)Rao_regrid_omega, METH_O,
     "Regrids to new omegas [rad/s], constant extrapolation."},
    {"regrid_direction", (PyCFunction)Rao_regrid_direction, METH_O,
     "Regrids to new headings [deg], periodic."},
    {"add_direction", (PyCFunction)Rao_add_direction, METH_O,
     "Adds a heading [deg] by interpolation unless present."},
    {"add_frequency", (PyCFunction)Rao_add_frequency, METH_O,
     "Adds an omega [rad/s] by interpolation unless present."},
    {"ensure_point", (PyCFunction)Rao_ensure_point, METH_VARARGS,
     "ensure_point(wave_direction, omega)"},
    {"get_value", (PyCFunction)(void (*)(void))Rao_get_value, METH_VARARGS | METH_KEYWORDS,
     "get_value(wave_direction, omega) -> complex"},
    {"scale", (PyCFunction)Rao_scale, METH_O,
     "Scales the amplitude by a non-negative factor."},
    {"add_symmetry_xz", (PyCFunction)Rao_add_symmetry_xz, METH_NOARGS,
     "Appends the headings mirrored about the xz-plane."},
    {"to_real_imag", (PyCFunction)Rao_to_real_imag, METH_NOARGS,
     "Returns a dict with wave_direction, omega, real, imag and mode."},
    {"from_real_imag", (PyCFunction)(void (*)(void))Rao_from_real_imag, METH_VARARGS | METH_KEYWORDS,
     "from_real_imag(wave_directions, omegas, real, imag, mode)"},
    {nullptr, nullptr, 0, nullptr}};

static PyGetSetDef Rao_getset[] = {
    {"n_frequencies", (getter)Rao_get_n_frequencies, nullptr, "Number of omegas", nullptr},
    {"n_wave_directions", (getter)Rao_get_n_wave_directions, nullptr, "Number of headings", nullptr},
    {"wave_directions", (getter)Rao_get_wave_directions, nullptr, "Headings [deg]", nullptr},
    {"omegas", (getter)Rao_get_omegas, nullptr, "Omegas [rad/s]", nullptr},
    {"mode", (getter)Rao_get_mode, (setter)Rao_set_mode, "Motion mode as int", nullptr},
    {nullptr, nullptr, nullptr, nullptr, nullptr}};

static PyMappingMethods Rao_as_mapping = {
    nullptr,
    (binaryfunc)Rao_getitem,
    nullptr,
};

static PyObject *raolib_dof_name(PyObject *Py_UNUSED(module), PyObject *arg)
{
    RAOLIB_MotionMode mode = RAOLIB_MotionMode_fromPyObject(arg);
    if (PyErr_Occurred())
        return nullptr;
    try
    {
        std::string name = RAOLIB_MotionMode_toDofName(mode);
        return PyUnicode_FromString(name.c_str());
    }
    catch (const std::exception &)
    {
        RAOLIB_setPyErrorFromCurrentException();
        return nullptr;
    }
}

static PyMethodDef raolib_methods[] = {
    {"dof_name", (PyCFunction)raolib_dof_name, METH_O,
     "Degree-of-freedom label of a mode (\"Surge\" ... \"Yaw\")."},
    {nullptr, nullptr, 0, nullptr}};

static struct PyModuleDef raolib_module = {
    PyModuleDef_HEAD_INIT,
    "_raolib",
    "Response Amplitude Operators on a wave heading x frequency grid.",
    -1,
    raolib_methods,
    nullptr,
    nullptr,
    nullptr,
    nullptr};

PyMODINIT_FUNC PyInit__raolib(void)
{
    RaoType.tp_name = "_raolib.Rao";
    RaoType.tp_basicsize = sizeof(RaoObject);
    RaoType.tp_flags = Py_TPFLAGS_DEFAULT;
    RaoType.tp_doc = "Response Amplitude Operator: amplitude and phase on a heading x omega grid.";
    RaoType.tp_new = Rao_new;
    RaoType.tp_init = (initproc)Rao_init;
    RaoType.tp_dealloc = (destructor)Rao_dealloc;
    RaoType.tp_methods = Rao_methods;
    RaoType.tp_getset = Rao_getset;
    RaoType.tp_as_mapping = &Rao_as_mapping;
    RaoType.tp_str = (reprfunc)Rao_str;

    if (PyType_Ready(&RaoType) < 0)
    {
        return nullptr;
    }

    PyObject *m = PyModule_Create(&raolib_module);
    if (m == nullptr)
    {
        return nullptr;
    }

    Py_INCREF(&RaoType);
    if (PyModule_AddObject(m, "Rao", (PyObject *)&RaoType) < 0)
    {
        Py_DECREF(&RaoType);
        Py_DECREF(m);
        return nullptr;
    }

    if (PyModule_AddIntConstant(m, "NONE", static_cast<long>(RAOLIB_MotionMode::NONE)) < 0 ||
        PyModule_AddIntConstant(m, "SURGE", static_cast<long>(RAOLIB_MotionMode::SURGE)) < 0 ||
        PyModule_AddIntConstant(m, "SWAY", static_cast<long>(RAOLIB_MotionMode::SWAY)) < 0 ||
        PyModule_AddIntConstant(m, "HEAVE", static_cast<long>(RAOLIB_MotionMode::HEAVE)) < 0 ||
        PyModule_AddIntConstant(m, "ROLL", static_cast<long>(RAOLIB_MotionMode::ROLL)) < 0 ||
        PyModule_AddIntConstant(m, "PITCH", static_cast<long>(RAOLIB_MotionMode::PITCH)) < 0 ||
        PyModule_AddIntConstant(m, "YAW", static_cast<long>(RAOLIB_MotionMode::YAW)) < 0)
    {
        Py_DECREF(m);
        return nullptr;
    }

    RAOLIB_DEBUG("_raolib module initialized");
    return m;
}
