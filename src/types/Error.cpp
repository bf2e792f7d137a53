#include "types/Error.hpp"

namespace sm {

std::string_view to_string(const ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Config: return "ConfigError";
        case ErrorKind::Integrity: return "IntegrityError";
        case ErrorKind::Cipher: return "CipherError";
        case ErrorKind::Link: return "LinkError";
        case ErrorKind::IO: return "IOError";
    }
    return "UnknownError";
}

}
