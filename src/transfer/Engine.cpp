#include "transfer/Engine.hpp"
#include "transfer/Payload.hpp"
#include "concurrency/ThreadPool.hpp"
#include "crypto/Cipher.hpp"
#include "crypto/Digest.hpp"
#include "fs/files.hpp"
#include "log/Registry.hpp"
#include "manifest/Manifest.hpp"
#include "verify/Verifier.hpp"

#include <algorithm>
#include <optional>
#include <fmt/core.h>
#include <stdexcept>
#include <set>

using namespace sm::transfer;
using namespace sm::types;

namespace stdfs = std::filesystem;

namespace {

constexpr mode_t EXPORT_DIR_MODE = 0755;
constexpr mode_t IMPORT_DIR_MODE = 0755;
constexpr mode_t LINK_DIR_MODE = 0755;
constexpr mode_t BUNDLE_CONFIG_MODE = 0600;
constexpr mode_t BUNDLE_EXE_MODE = 0755;

OperationResult succeeded(const Operation& op) {
    return {op, OperationStatus::Success, std::nullopt, {}};
}

OperationResult failed(const Operation& op, const sm::ErrorKind kind, std::string message) {
    return {op, OperationStatus::Failed, kind, std::move(message)};
}

// A file about to be replaced in the export tree.
struct Replaced {
    std::vector<uint8_t> data;
    sm::fs::FileMetadata meta;
};

std::optional<Replaced> rememberExisting(const stdfs::path& target) {
    if (!stdfs::is_regular_file(target)) return std::nullopt;
    return Replaced{sm::fs::readFileToVector(target), sm::fs::readMetadata(target)};
}

// Puts the previous file back, or removes the new one when there was none.
void withdraw(const stdfs::path& target, const std::optional<Replaced>& previous) {
    if (!previous) {
        if (!sm::fs::removeQuietly(target))
            sm::log::Registry::transfer()->error("[Engine] could not remove unrecorded '{}'", target.string());
        return;
    }

    try {
        sm::fs::TempFile tmp(target);
        tmp.write(previous->data);
        tmp.applyMetadata(previous->meta);
        tmp.commit();
    } catch (const sm::Error& e) {
        sm::log::Registry::transfer()->error("[Engine] could not restore previous '{}': {}", target.string(), e.what());
    }
}

// A committed file without its manifest entry is withdrawn before the failure propagates.
template <typename Record>
void recordOrWithdraw(const stdfs::path& target, const std::optional<Replaced>& previous, Record&& record) {
    try {
        record();
    } catch (const std::exception&) {
        withdraw(target, previous);
        throw;
    }
}

}

EngineOptions EngineOptions::from(const config::SettingsConfig& s) {
    return {
        .jobs = std::max(1u, s.jobs),
        .fail_fast = s.fail_fast,
        .remove_siblings_on_failure = s.remove_siblings_on_failure,
        .protect_existing = s.protect_existing,
        .verify_source_manifest = s.verify_source_manifest,
    };
}

Engine::Engine(EngineOptions options,
               std::shared_ptr<const crypto::Digest> digest,
               std::shared_ptr<const crypto::Cipher> cipher,
               std::shared_ptr<std::atomic<bool>> interruptFlag)
    : options_(options),
      digest_(std::move(digest)),
      cipher_(std::move(cipher)),
      interruptFlag_(std::move(interruptFlag)),
      store_(std::make_unique<manifest::Store>()) {
    if (!digest_ || !cipher_) throw std::invalid_argument("Engine requires a digest and a cipher");
}

void Engine::reset() {
    stop_.store(false);
    std::scoped_lock lock(abortMutex_);
    abortReason_.reset();
    store_ = std::make_unique<manifest::Store>();
}

void Engine::abort(const std::string& reason) {
    {
        std::scoped_lock lock(abortMutex_);
        if (!abortReason_) abortReason_ = reason;
    }
    stop_.store(true);
    log::Registry::transfer()->error("[Engine] Aborting run: {}", reason);
}

bool Engine::cancelled() const {
    return stop_.load() || (interruptFlag_ && interruptFlag_->load());
}

// ---------- scheduling

OperationResult Engine::guarded(const Operation& op, const Step& step) {
    if (cancelled()) return {op, OperationStatus::Cancelled, std::nullopt, "run stopped before this operation"};

    auto result = step(op);
    if (result.status == OperationStatus::Failed && options_.fail_fast) stop_.store(true);
    return result;
}

std::vector<OperationResult> Engine::execute(const std::vector<Operation>& ops, const Step& step) {
    std::vector<OperationResult> results;
    results.reserve(ops.size());

    if (options_.jobs <= 1 || ops.size() <= 1) {
        for (const auto& op : ops) results.push_back(guarded(op, step));
        return results;
    }

    struct OperationTask final : concurrency::PromisedTask<OperationResult> {
        Engine* engine;
        const Operation* op;
        const Step* step;

        OperationTask(Engine* e, const Operation* o, const Step* s) : engine(e), op(o), step(s) {}

        void operator()() override {
            try {
                promise.set_value(engine->guarded(*op, *step));
            } catch (const std::exception& e) {
                promise.set_value(failed(*op, ErrorKind::IO, e.what()));
            }
        }
    };

    const auto workers = std::min<size_t>(options_.jobs, ops.size());
    log::Registry::transfer()->debug("[Engine] Running {} operation(s) on {} worker(s)", ops.size(), workers);

    std::vector<std::future<OperationResult>> futures;
    futures.reserve(ops.size());
    {
        concurrency::ThreadPool pool(interruptFlag_, static_cast<unsigned int>(workers));
        for (const auto& op : ops) {
            auto task = std::make_shared<OperationTask>(this, &op, &step);
            futures.push_back(task->getFuture());
            pool.submit(task);
        }
        for (auto& f : futures) f.wait();
    }

    for (auto& f : futures) results.push_back(f.get());
    return results;
}

// ---------- export

RunReport Engine::runExport(const std::vector<Operation>& ops, const stdfs::path& destination,
                            const std::optional<Bundle>& bundle) {
    reset();

    RunReport report;
    report.direction = Direction::Export;

    log::Registry::transfer()->info("[Engine] Exporting {} file(s) to '{}'", ops.size(), destination.string());
    fs::ensureDirectories(destination, EXPORT_DIR_MODE);

    report.results = execute(ops, [&](const Operation& op) { return exportOne(op, destination); });

    if (options_.remove_siblings_on_failure) rollBackSiblings(report.results, destination);

    if (bundle && !cancelled()) writeBundle(*bundle, destination, report);

    {
        std::scoped_lock lock(abortMutex_);
        report.aborted = abortReason_.has_value();
        report.abortReason = abortReason_.value_or("");
    }
    report.interrupted = interruptFlag_ && interruptFlag_->load();

    const verify::Verifier verifier(digest_);
    report.closing = verifier.verifyDirectories(destination, store_->writtenDirectories());

    return report;
}

OperationResult Engine::exportOne(const Operation& op, const stdfs::path& destination) {
    const auto target = destination / op.endpoint_path;
    const auto dir = target.parent_path();
    const auto name = target.filename().string();

    log::Registry::transfer()->info("[Engine] exporting '{}'", op.source_path.string());

    try {
        // PreCheck
        const auto meta = fs::readMetadata(op.source_path);
        const auto plaintext = fs::readFileToVector(op.source_path);
        const auto plainDigest = digest_->digest(plaintext);
        if (options_.verify_source_manifest) checkSourceManifest(op.source_path, plainDigest);

        // Encrypt
        const auto ciphertext = cipher_->encrypt(Payload::seal(plaintext, plainDigest));

        fs::ensureDirectories(dir, EXPORT_DIR_MODE);
        fs::TempFile tmp(target);
        tmp.write(ciphertext);

        const auto cipherDigest = digest_->digest(tmp.readBack());
        if (!crypto::Digest::equal(cipherDigest, digest_->digest(ciphertext)))
            throw IntegrityError(fmt::format("ciphertext written to '{}' does not match what was encrypted", target.string()));

        // Metadata copy, re-read right before applying
        const auto current = fs::readMetadata(op.source_path);
        if (current != meta)
            log::Registry::transfer()->warn("[Engine] '{}' changed ownership or mode during export, using the current values",
                                            op.source_path.string());
        tmp.applyMetadata(current);

        const auto previous = rememberExisting(target);
        tmp.commit();

        // Manifest update
        recordOrWithdraw(target, previous, [&] { recordManifest(dir, name, cipherDigest); });
    } catch (const Error& e) {
        log::Registry::transfer()->error("[Engine] exporting '{}' failed ({}): {}",
                                         op.source_path.string(), to_string(e.kind()), e.what());
        return failed(op, e.kind(), e.what());
    } catch (const std::exception& e) {
        log::Registry::transfer()->error("[Engine] exporting '{}' failed: {}", op.source_path.string(), e.what());
        return failed(op, ErrorKind::IO, e.what());
    }

    log::Registry::transfer()->info("[Engine] exported '{}' -> '{}'", op.source_path.string(), op.endpoint_path.string());
    return succeeded(op);
}

void Engine::checkSourceManifest(const stdfs::path& source, const crypto::DigestValue& digest) const {
    const auto dir = source.parent_path();
    if (!manifest::Manifest::existsIn(dir)) return;

    const auto recorded = manifest::Manifest::load(dir).find(source.filename().string());
    if (!recorded) return;

    if (!crypto::Digest::equal(*recorded, digest))
        throw IntegrityError(fmt::format("source file '{}' doesn't match its hash in '{}'. Possible integrity issue",
                                         source.string(), (dir / manifest::MANIFEST_FILE_NAME).string()));
}

void Engine::recordManifest(const stdfs::path& dir, const std::string& name, const crypto::DigestValue& digest) {
    try {
        store_->record(dir, name, digest);
    } catch (const Error& e) {
        const auto reason = fmt::format("manifest of '{}' cannot be updated: {}", dir.string(), e.what());
        abort(reason);
        throw IOError(reason);
    }
}

void Engine::rollBackSiblings(std::vector<OperationResult>& results, const stdfs::path& destination) {
    std::set<stdfs::path> tainted;
    for (const auto& r : results)
        if (r.status == OperationStatus::Failed)
            tainted.insert((destination / r.operation.endpoint_path).parent_path());

    for (auto& r : results) {
        if (r.status != OperationStatus::Success) continue;

        const auto target = destination / r.operation.endpoint_path;
        if (!tainted.contains(target.parent_path())) continue;

        if (!fs::removeQuietly(target))
            log::Registry::transfer()->warn("[Engine] could not remove '{}' during rollback", target.string());

        try {
            store_->forget(target.parent_path(), target.filename().string());
        } catch (const Error& e) {
            abort(fmt::format("manifest of '{}' cannot be updated: {}", target.parent_path().string(), e.what()));
        }

        r.status = OperationStatus::RolledBack;
        r.message = "removed because another file in the same directory failed";
        log::Registry::transfer()->warn("[Engine] rolled back '{}'", target.string());
    }
}

void Engine::writeBundle(const Bundle& bundle, const stdfs::path& destination, RunReport& report) {
    log::Registry::transfer()->info("[Engine] exporting additional files");
    try {
        if (!bundle.config_text.empty()) {
            const auto path = destination / bundle.config_name;
            const auto previous = rememberExisting(path);
            fs::writeFileAtomic(path, {bundle.config_text.begin(), bundle.config_text.end()}, BUNDLE_CONFIG_MODE);
            recordOrWithdraw(path, previous, [&] {
                recordManifest(destination, bundle.config_name, digest_->digestFile(path));
            });
        }

        if (bundle.executable) {
            const auto name = bundle.executable->filename().string();
            const auto path = destination / name;
            const auto previous = rememberExisting(path);
            fs::writeFileAtomic(path, fs::readFileToVector(*bundle.executable), BUNDLE_EXE_MODE);
            recordOrWithdraw(path, previous, [&] { recordManifest(destination, name, digest_->digestFile(path)); });
        }
    } catch (const std::exception& e) {
        log::Registry::transfer()->error("[Engine] exporting additional files failed: {}", e.what());
        report.bundleError = e.what();
    }
}

// ---------- import

RunReport Engine::runImport(const std::vector<Operation>& ops, const stdfs::path& sourceRoot) {
    reset();

    std::error_code ec;
    if (!stdfs::is_directory(sourceRoot, ec))
        throw IOError(fmt::format("source path '{}' does not exist or is not a directory", sourceRoot.string()));

    RunReport report;
    report.direction = Direction::Import;

    log::Registry::transfer()->info("[Engine] Importing {} file(s) from '{}'", ops.size(), sourceRoot.string());

    report.results = execute(ops, [&](const Operation& op) { return importOne(op, sourceRoot); });

    {
        std::scoped_lock lock(abortMutex_);
        report.aborted = abortReason_.has_value();
        report.abortReason = abortReason_.value_or("");
    }
    report.interrupted = interruptFlag_ && interruptFlag_->load();
    return report;
}

OperationResult Engine::importOne(const Operation& op, const stdfs::path& sourceRoot) {
    const auto cipherPath = sourceRoot / op.source_path;
    const auto dir = cipherPath.parent_path();
    const auto name = cipherPath.filename().string();
    const auto& target = op.endpoint_path;

    log::Registry::transfer()->info("[Engine] importing '{}'", op.source_path.string());

    try {
        // PreCheck
        const auto recorded = store_->snapshot(dir).find(name);
        if (!recorded)
            throw IntegrityError(fmt::format("'{}' has no entry in '{}'", cipherPath.string(),
                                             (dir / manifest::MANIFEST_FILE_NAME).string()));

        const auto cipherMeta = fs::readMetadata(cipherPath);
        const auto ciphertext = fs::readFileToVector(cipherPath);
        if (!crypto::Digest::equal(digest_->digest(ciphertext), *recorded))
            throw IntegrityError(fmt::format("file at path '{}' doesn't match its hash in '{}'. Possible integrity issue",
                                             cipherPath.string(), (dir / manifest::MANIFEST_FILE_NAME).string()));

        // Decrypt
        const auto payload = Payload::open(cipher_->decrypt(ciphertext));

        fs::ensureDirectories(target.parent_path(), IMPORT_DIR_MODE, &cipherMeta);
        fs::TempFile tmp(target);
        tmp.write(payload.plaintext);

        // PostCheck, over the bytes that reached the disk; tmp is unlinked on throw
        if (!crypto::Digest::equal(digest_->digest(tmp.readBack()), payload.digest))
            throw IntegrityError(fmt::format("decrypted content of '{}' does not match its embedded checksum",
                                             cipherPath.string()));

        // Metadata copy
        tmp.applyMetadata(cipherMeta);

        if (std::error_code ec; options_.protect_existing && stdfs::exists(stdfs::symlink_status(target, ec))) {
            if (!stdfs::is_regular_file(stdfs::symlink_status(target, ec)) ||
                fs::readFileToVector(target) != payload.plaintext)
                throw IOError(fmt::format("file at '{}' already exists and its content does not match the content "
                                          "meant to be written to it. Refusing to override it", target.string()));
        }

        tmp.commit();
    } catch (const Error& e) {
        log::Registry::transfer()->error("[Engine] importing '{}' failed ({}): {}",
                                         op.source_path.string(), to_string(e.kind()), e.what());
        return failed(op, e.kind(), e.what());
    } catch (const std::exception& e) {
        log::Registry::transfer()->error("[Engine] importing '{}' failed: {}", op.source_path.string(), e.what());
        return failed(op, ErrorKind::IO, e.what());
    }

    // Symlink, only once the plaintext is in place and verified
    if (op.symlink_target) {
        try {
            placeSymlink(target, *op.symlink_target);
        } catch (const Error& e) {
            log::Registry::transfer()->warn("[Engine] '{}' imported but linking failed: {}", target.string(), e.what());
            return failed(op, ErrorKind::Link, e.what());
        }
    }

    log::Registry::transfer()->info("[Engine] imported '{}' -> '{}'", op.source_path.string(), target.string());
    return succeeded(op);
}

void Engine::placeSymlink(const stdfs::path& target, const stdfs::path& link) const {
    const auto absTarget = stdfs::absolute(target);

    std::error_code ec;
    const auto st = stdfs::symlink_status(link, ec);
    if (stdfs::exists(st)) {
        if (stdfs::is_symlink(st)) {
            const auto current = stdfs::read_symlink(link, ec);
            if (!ec && current == absTarget) return;
        }
        throw LinkError(fmt::format("'{}' already exists and is not a link to '{}'; leaving it untouched",
                                    link.string(), absTarget.string()));
    }

    try {
        fs::ensureDirectories(link.parent_path(), LINK_DIR_MODE);
    } catch (const Error& e) {
        throw LinkError(e.what());
    }

    stdfs::create_symlink(absTarget, link, ec);
    if (ec) throw LinkError(fmt::format("failed to link '{}' -> '{}': {}", link.string(), absTarget.string(), ec.message()));
}
