#include "persistence/JarStore.hpp"
#include "log/TaggedLogger.hpp"
#include "persistence/FileUtils.hpp"
#include "serialization/JsonCodec.hpp"

#include <cstdlib>
#include <utility>

namespace DJ {

auto JarStoreOptions::fromEnvironment() -> JarStoreOptions {
    JarStoreOptions options;
    if (char const* directory = std::getenv("DATAJAR_STORE_DIR"); directory != nullptr && *directory != '\0')
        options.directory = directory;
    return options;
}

JarStore::JarStore(JarStoreOptions options)
    : options_(std::move(options)) {}

auto JarStore::path() const -> std::filesystem::path {
    return this->options_.directory / (this->options_.key + ".json");
}

auto JarStore::tryLoad() const -> Expected<Nodes> {
    auto text = FileUtils::readTextFile(this->path());
    if (!text)
        return std::unexpected(text.error());
    return decodePersistedText(*text);
}

auto JarStore::load() const -> Nodes {
    auto loaded = this->tryLoad();
    if (loaded) {
        dj_log("Loaded jar from " + this->path().string(), "JarStore", "INFO");
        return std::move(*loaded);
    }
    if (loaded.error().code == Error::Code::NotFound) {
        dj_log("No stored jar, starting from defaults", "JarStore", "INFO");
    } else {
        dj_log("Failed to load stored jar, starting from defaults: " + describeError(loaded.error()), "JarStore", "WARN");
    }
    return defaultJar();
}

auto JarStore::save(Nodes const& root) const -> Expected<void> {
    auto const text = dumpJson(encodePersisted(root));
    if (auto written = FileUtils::writeTextFileAtomic(this->path(), text, this->options_.fsync); !written) {
        dj_log("Failed to save jar: " + describeError(written.error()), "JarStore", "ERROR");
        return written;
    }
    return {};
}

void JarStore::clear() const {
    FileUtils::removePathIfExists(this->path());
}

auto defaultJar() -> Nodes {
    return Nodes{
            Node{"greeting", Text{"Hello World"}},
            Node{"config", Dictionary{Nodes{
                                   Node{"theme", Text{"dark"}},
                                   Node{"fontSize", Number{14}},
                           }}},
            Node{"price", Number{100}},
            Node{"tax_rate", Number{0.2}},
            Node{"total_cost", Expression{"{{price}} * (1 + {{tax_rate}})"}},
    };
}

} // namespace DJ
