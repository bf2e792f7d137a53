#include "manifest/Store.hpp"

namespace sm::manifest {

std::shared_ptr<Store::Slot> Store::slotFor(const std::filesystem::path& dir) {
    std::scoped_lock lock(mapMutex_);
    auto& slot = slots_[dir];
    if (!slot) slot = std::make_shared<Slot>();
    return slot;
}

void Store::ensureLoaded(Slot& slot, const std::filesystem::path& dir) {
    if (slot.loaded) return;
    slot.manifest = Manifest::load(dir);
    slot.loaded = true;
}

void Store::record(const std::filesystem::path& dir, const std::string& name, const crypto::DigestValue& digest) {
    const auto slot = slotFor(dir);
    {
        std::scoped_lock lock(slot->mutex);
        ensureLoaded(*slot, dir);
        slot->manifest.upsert(name, digest);
        slot->manifest.save(dir);
    }
    std::scoped_lock lock(mapMutex_);
    written_.insert(dir);
}

void Store::forget(const std::filesystem::path& dir, const std::string& name) {
    const auto slot = slotFor(dir);
    std::scoped_lock lock(slot->mutex);
    ensureLoaded(*slot, dir);
    if (slot->manifest.erase(name)) slot->manifest.save(dir);
}

Manifest Store::snapshot(const std::filesystem::path& dir) {
    const auto slot = slotFor(dir);
    std::scoped_lock lock(slot->mutex);
    ensureLoaded(*slot, dir);
    return slot->manifest;
}

std::vector<std::filesystem::path> Store::writtenDirectories() const {
    std::scoped_lock lock(mapMutex_);
    return {written_.begin(), written_.end()};
}

}
