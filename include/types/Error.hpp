#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

namespace sm {

enum class ErrorKind { Config, Integrity, Cipher, Link, IO };

std::string_view to_string(ErrorKind kind);

class Error : public std::runtime_error {
public:
    Error(const ErrorKind kind, const std::string& what) : std::runtime_error(what), kind_(kind) {}

    [[nodiscard]] ErrorKind kind() const { return kind_; }

private:
    ErrorKind kind_;
};

// Malformed or missing rule data. Fatal to the run.
struct ConfigError : Error {
    explicit ConfigError(const std::string& what) : Error(ErrorKind::Config, what) {}
};

// Checksum mismatch at a pre/post check, or an unreadable manifest.
struct IntegrityError : Error {
    explicit IntegrityError(const std::string& what) : Error(ErrorKind::Integrity, what) {}
};

struct CipherError : Error {
    explicit CipherError(const std::string& what) : Error(ErrorKind::Cipher, what) {}
};

// Symlink conflict. Never fatal to the run.
struct LinkError : Error {
    explicit LinkError(const std::string& what) : Error(ErrorKind::Link, what) {}
};

struct IOError : Error {
    explicit IOError(const std::string& what) : Error(ErrorKind::IO, what) {}
};

}
