#pragma once

/// @file error.hpp
/// @brief Exception type of the eonsim I/O library.
/// @ingroup io

#include <stdexcept>
#include <string>

namespace eonsim::io {

/// @brief Exception for malformed or invalid input files.
///
/// Thrown by the loaders when a file cannot be opened, its JSON does not
/// parse, a required field is missing or has the wrong type, or a value
/// fails semantic validation (e.g. a demand whose origin equals its
/// destination).
///
/// @ingroup io
/// @see load_topology, load_demands, load_config
class LoaderError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;

    /// @brief Construct a LoaderError with a contextual prefix.
    ///
    /// The resulting message is formatted as `"context: message"`.
    ///
    /// @param message  Human-readable description of the error.
    /// @param context  File path or field name the error relates to.
    LoaderError(const std::string& message, const std::string& context)
        : std::runtime_error(context + ": " + message) {}
};

} // namespace eonsim::io
