#include "crypto/Passphrase.hpp"
#include "crypto/util/encrypt.hpp"
#include "types/Error.hpp"
#include "log/Registry.hpp"

#include <sodium.h>
#include <termios.h>
#include <unistd.h>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <new>

namespace sm::crypto {

namespace {

std::string readHidden(const char* label) {
    std::fputs(label, stderr);
    std::fflush(stderr);

    termios old{};
    const bool tty = ::isatty(STDIN_FILENO) && ::tcgetattr(STDIN_FILENO, &old) == 0;
    if (tty) {
        termios silent = old;
        silent.c_lflag &= ~static_cast<tcflag_t>(ECHO);
        ::tcsetattr(STDIN_FILENO, TCSAFLUSH, &silent);
    }

    std::string line;
    const bool got = static_cast<bool>(std::getline(std::cin, line));

    if (tty) ::tcsetattr(STDIN_FILENO, TCSAFLUSH, &old);
    std::fputc('\n', stderr);

    if (!got) throw ConfigError("no passphrase provided");
    return line;
}

}

Passphrase::Passphrase(const std::string_view secret) {
    util::ensure_sodium_init();
    size_ = secret.size();
    data_ = static_cast<char*>(sodium_malloc(size_ == 0 ? 1 : size_));
    if (!data_) throw std::bad_alloc();
    if (size_) std::memcpy(data_, secret.data(), size_);
    if (sodium_mlock(data_, size_ == 0 ? 1 : size_) != 0)
        log::Registry::crypto()->debug("[Passphrase] mlock refused, passphrase memory may be swapped");
}

Passphrase::~Passphrase() { release(); }

Passphrase::Passphrase(Passphrase&& other) noexcept : data_(other.data_), size_(other.size_) {
    other.data_ = nullptr;
    other.size_ = 0;
}

Passphrase& Passphrase::operator=(Passphrase&& other) noexcept {
    if (this != &other) {
        release();
        data_ = other.data_;
        size_ = other.size_;
        other.data_ = nullptr;
        other.size_ = 0;
    }
    return *this;
}

void Passphrase::release() noexcept {
    if (!data_) return;
    sodium_munlock(data_, size_ == 0 ? 1 : size_);
    sodium_free(data_);
    data_ = nullptr;
    size_ = 0;
}

Passphrase Passphrase::prompt(const bool confirm) {
    std::string first = readHidden("Enter passphrase: ");
    if (first.empty()) throw ConfigError("passphrase cannot be empty");

    if (confirm) {
        std::string second = readHidden("Enter passphrase again: ");
        const bool match = first == second;
        sodium_memzero(second.data(), second.size());
        if (!match) {
            sodium_memzero(first.data(), first.size());
            throw ConfigError("passphrases do not match");
        }
    }

    Passphrase p(first);
    sodium_memzero(first.data(), first.size());
    return p;
}

std::optional<Passphrase> Passphrase::fromEnv() {
    const char* v = std::getenv(ENV_VAR);
    if (!v || !*v) return std::nullopt;
    return Passphrase(v);
}

}
