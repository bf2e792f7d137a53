#include "manifest/Manifest.hpp"
#include "fs/files.hpp"
#include "types/Error.hpp"

#include <fmt/core.h>
#include <sstream>

namespace sm::manifest {

Manifest Manifest::parse(const std::string& text, const std::string& origin) {
    Manifest m;
    std::istringstream in(text);
    std::string line;
    size_t lineNo = 0;

    while (std::getline(in, line)) {
        ++lineNo;
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.empty()) continue;

        // "<64 hex>  <name>"; sha256sum writes '*' instead of the second space for binary mode
        if (line.size() < crypto::DIGEST_SIZE * 2 + 3 || line[crypto::DIGEST_SIZE * 2] != ' ' ||
            (line[crypto::DIGEST_SIZE * 2 + 1] != ' ' && line[crypto::DIGEST_SIZE * 2 + 1] != '*'))
            throw IntegrityError(fmt::format("ill-formatted checksum file at path '{}' (line {})", origin, lineNo));

        const auto digest = crypto::hash::fromHex(std::string_view(line).substr(0, crypto::DIGEST_SIZE * 2));
        if (!digest)
            throw IntegrityError(fmt::format("ill-formatted checksum file at path '{}' (line {})", origin, lineNo));

        m.entries_[line.substr(crypto::DIGEST_SIZE * 2 + 2)] = *digest;
    }

    return m;
}

Manifest Manifest::load(const std::filesystem::path& dir) {
    const auto path = dir / MANIFEST_FILE_NAME;
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) return {};
    return parse(fs::readFileToString(path), path.string());
}

bool Manifest::existsIn(const std::filesystem::path& dir) {
    std::error_code ec;
    return std::filesystem::is_regular_file(dir / MANIFEST_FILE_NAME, ec);
}

std::string Manifest::serialize() const {
    std::string out;
    for (const auto& [name, digest] : entries_) {
        out += digest.hex();
        out += "  ";
        out += name;
        out += '\n';
    }
    return out;
}

void Manifest::save(const std::filesystem::path& dir) const {
    const auto text = serialize();
    fs::writeFileAtomic(dir / MANIFEST_FILE_NAME, std::vector<uint8_t>(text.begin(), text.end()), 0644);
}

std::optional<crypto::DigestValue> Manifest::find(const std::string& name) const {
    if (const auto it = entries_.find(name); it != entries_.end()) return it->second;
    return std::nullopt;
}

}
