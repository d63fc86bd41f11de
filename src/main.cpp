#include "../include/cleanup_history/HistoryCleaner.h" // Includes all necessary definitions for the cleaner
#include "../include/cleanup_history/Utils.h"          // For errorExit
#include <iostream>                                   // For cerr
#include <exception>                                  // For std::exception
#include <stdexcept>                                  // For std::invalid_argument

int main(int argc, char* argv[]) {
    const std::string progName = argc > 0 ? argv[0] : "cleanup_history";

    CleanupOptions options;
    try {
        options = parseArguments(argc, argv);
    } catch (const std::invalid_argument& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        usage(std::cerr, progName);
        return 1;
    }

    if (options.showHelp) {
        usage(std::cout, progName);
        return 0;
    }

    try {
        // The constructor validates the file before anything is read;
        // RAII removes a leftover temp file if run() throws.
        HistoryCleaner cleaner(options);
        cleaner.run();
        return 0;
    } catch (const std::exception& e) {
        errorExit(e.what());
    }
}
