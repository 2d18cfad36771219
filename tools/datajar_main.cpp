#include "DataJar.hpp"
#include "log/TaggedLogger.hpp"
#include "persistence/JarStore.hpp"
#include "tools/cli/Commands.hpp"

#include <iostream>

int main(int argc, char** argv) {
#ifdef DJ_LOG_DEBUG
    DJ::set_thread_name("Main");
#endif
    using namespace DJ::Tools::CLI;

    auto options = parseCommandLine(argc, argv, std::cerr);
    if (!options) {
        printUsage(std::cerr);
        return ExitUsage;
    }

    auto storeOptions = DJ::JarStoreOptions::fromEnvironment();
    if (options->storeDirectory)
        storeOptions.directory = *options->storeDirectory;
    DJ::JarStore store{storeOptions};

    DJ::DataJar jar{store.load()};
    bool        saveFailed = false;
    jar.setChangeListener([&](DJ::Nodes const& root) {
        if (auto saved = store.save(root); !saved) {
            std::cerr << "datajar: could not save jar: " << DJ::describeError(saved.error()) << std::endl;
            saveFailed = true;
        }
    });

    auto const status = runCommand(*options, jar, std::cout, std::cerr);
    if (status == ExitSuccess && saveFailed)
        return ExitFailure;
    return status;
}
