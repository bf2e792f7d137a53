#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace sm::crypto {

// Secret held in guarded sodium memory for the duration of one run.
class Passphrase {
public:
    explicit Passphrase(std::string_view secret);
    ~Passphrase();

    Passphrase(const Passphrase&) = delete;
    Passphrase& operator=(const Passphrase&) = delete;
    Passphrase(Passphrase&& other) noexcept;
    Passphrase& operator=(Passphrase&& other) noexcept;

    [[nodiscard]] std::string_view view() const { return {data_, size_}; }
    [[nodiscard]] bool empty() const { return size_ == 0; }

    // Reads from the controlling terminal with echo disabled. When confirm is
    // set, asks twice and throws ConfigError if the entries differ.
    static Passphrase prompt(bool confirm);

    // SECRETS_MANAGER_PASSPHRASE, for non-interactive runs.
    static std::optional<Passphrase> fromEnv();

    static constexpr auto ENV_VAR = "SECRETS_MANAGER_PASSPHRASE";

private:
    char* data_ = nullptr;
    size_t size_ = 0;

    void release() noexcept;
};

}
