#ifndef PASTEBIN_KEYGEN_ERROR_HPP
#define PASTEBIN_KEYGEN_ERROR_HPP

#include <stdexcept>
#include <string>

namespace pastebin::keygen {

class KeygenError : public std::runtime_error {
public:
    explicit KeygenError(const std::string& message)
        : std::runtime_error(message) {}
};

class RandomSourceError : public KeygenError {
public:
    explicit RandomSourceError(const std::string& message)
        : KeygenError("Random source error: " + message) {}
};

class NamespaceExhaustedError : public KeygenError {
public:
    explicit NamespaceExhaustedError(const std::string& message)
        : KeygenError("Namespace exhausted: " + message) {}
};

} // namespace pastebin::keygen

#endif // PASTEBIN_KEYGEN_ERROR_HPP
