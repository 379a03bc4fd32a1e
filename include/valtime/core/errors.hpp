#pragma once

/**
 * @file errors.hpp
 * @brief Error taxonomy for the overlay core
 *
 * None of these terminate the process. Each one aborts at most the
 * action that raised it; the menu stays operable afterwards.
 */

#include <stdexcept>
#include <string>

namespace valtime {

/// Persisted config could not be parsed. Recovered inside AnimationStore
/// (defaults are used); never escapes the store.
class ConfigLoadError : public std::runtime_error {
public:
    explicit ConfigLoadError(const std::string& what) : std::runtime_error(what) {}
};

/// Writing a config snapshot or animation file failed.
class PersistenceError : public std::runtime_error {
public:
    explicit PersistenceError(const std::string& what) : std::runtime_error(what) {}
};

/// Unknown animation or menu name.
class NotFoundError : public std::runtime_error {
public:
    explicit NotFoundError(const std::string& what) : std::runtime_error(what) {}
};

/// The OS refused a synthesized key event or clipboard write.
class InjectionError : public std::runtime_error {
public:
    explicit InjectionError(const std::string& what) : std::runtime_error(what) {}
};

}  // namespace valtime
