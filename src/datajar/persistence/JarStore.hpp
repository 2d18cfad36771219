#pragma once

#include "core/Error.hpp"
#include "core/Node.hpp"

#include <filesystem>
#include <string>

namespace DJ {

struct JarStoreOptions {
    std::filesystem::path directory = ".datajar";
    std::string           key       = "data-jar-storage";
    bool                  fsync     = false;

    // Defaults, with the directory taken from DATAJAR_STORE_DIR when set.
    [[nodiscard]] static auto fromEnvironment() -> JarStoreOptions;
};

/**
 * Persistence slot holding the whole jar as one JSON document at
 * <directory>/<key>.json, rewritten after every change.
 *
 * Loading never fails: a missing slot yields the built-in default jar, and so
 * does a document that cannot be decoded (logged as a PersistFormatError).
 */
class JarStore {
public:
    explicit JarStore(JarStoreOptions options = {});

    [[nodiscard]] auto path() const -> std::filesystem::path;
    [[nodiscard]] auto options() const -> JarStoreOptions const& { return this->options_; }

    [[nodiscard]] auto load() const -> Nodes;
    [[nodiscard]] auto tryLoad() const -> Expected<Nodes>;
    [[nodiscard]] auto save(Nodes const& root) const -> Expected<void>;
    void               clear() const;

private:
    JarStoreOptions options_;
};

// The jar a first-time user starts with.
[[nodiscard]] auto defaultJar() -> Nodes;

} // namespace DJ
