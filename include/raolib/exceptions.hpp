#ifndef RAOLIB_EXCEPTIONS_HPP
#define RAOLIB_EXCEPTIONS_HPP

#include <cstddef>
#include <stdexcept>
#include <string>

namespace raolib
{
    class RAOLIB_RaoError : public std::runtime_error
    {
    public:
        RAOLIB_RaoError(const std::string &message)
            : std::runtime_error(message) {};
    };

    /**
     * @brief The motion mode is missing or unknown where it is required.
     */
    class RAOLIB_InvalidConfigurationError : public RAOLIB_RaoError
    {
    public:
        int mode_value;

        RAOLIB_InvalidConfigurationError(
            const std::string &message,
            int mode_value)
            : RAOLIB_RaoError(message),
              mode_value(mode_value) {};
    };

    /**
     * @brief A table does not match the declared heading x frequency axes.
     */
    class RAOLIB_ShapeMismatchError : public RAOLIB_RaoError
    {
    public:
        std::size_t expected_rows;
        std::size_t expected_cols;
        std::size_t actual_rows;
        std::size_t actual_cols;

        RAOLIB_ShapeMismatchError(
            const std::string &message,
            std::size_t expected_rows,
            std::size_t expected_cols,
            std::size_t actual_rows,
            std::size_t actual_cols)
            : RAOLIB_RaoError(message),
              expected_rows(expected_rows),
              expected_cols(expected_cols),
              actual_rows(actual_rows),
              actual_cols(actual_cols) {};
    };
}; // raolib

#endif // RAOLIB_EXCEPTIONS_HPP
