#include <iostream>
#include <fstream>
#include <vector>
#include <string>
#include <filesystem>
#include <memory>
#include <stdexcept>
#include <libdarija/darija_core.h>

namespace fs = std::filesystem;

// Forward declarations
void printHelp();
long normalizeFile(const Normalizer& normalizer, const std::string& filePath, std::ostream& out);

int main(int argc, char* argv[]) {
    std::vector<std::string> args(argv + 1, argv + argc);
    bool testMode = false;
    std::string mappingFile;

    // --- Argument Parsing ---
    auto it = args.begin();
    while (it != args.end()) {
        if (*it == "-test") {
            testMode = true;
            it = args.erase(it);
        } else if (*it == "--mapping") {
            it = args.erase(it);
            if (it != args.end()) {
                mappingFile = *it;
                it = args.erase(it);
            } else {
                std::cerr << "Error: --mapping requires a file path." << std::endl;
                return 1;
            }
        } else {
            ++it;
        }
    }

    if (testMode && mappingFile.empty()) {
        #ifdef DARIJA_SRC_DIR
            const char* srcDir = DARIJA_SRC_DIR;
            mappingFile = (fs::path(srcDir) / "core" / "data" / "mapping.toml").string();
            std::cerr << "[Test Mode]: Using local mapping file: " << mappingFile << std::endl;
        #else
            std::cerr << "Error: Test mode requires DARIJA_SRC_DIR to be set at compile time." << std::endl;
            return 1;
        #endif
    }


    if (args.empty()) {
        printHelp();
        return 0;
    }

    std::string command = args[0];

    //  Command Handling
    if (command == "help") {
        printHelp();
        return 0;
    }
    if (command == "--version" || command == "version") {
        std::cout << "libdarija version " << DARIJA_VERSION << std::endl;
        return 0;
    }

    std::unique_ptr<Normalizer> normalizer;
    try {
        normalizer = std::make_unique<Normalizer>(mappingFile);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    if (command == "normalize") {
        if (args.size() < 2) {
            std::cerr << "Usage: darija-cli normalize <text_to_normalize>" << std::endl;
            return 1;
        }
        // Unquoted words arrive as separate arguments
        std::string text = args[1];
        for (size_t i = 2; i < args.size(); ++i) {
            text += " " + args[i];
        }
        std::cout << normalizer->normalize(text) << std::endl;
    }
    else if (command == "normalize-file") {
        if (args.size() < 2) {
            std::cerr << "Usage: darija-cli normalize-file <path_to_file>" << std::endl;
            return 1;
        }
        try {
            long count = normalizeFile(*normalizer, args[1], std::cout);
            std::cerr << "Normalized " << count << " lines from " << args[1] << std::endl;
        } catch (const std::exception& e) {
            std::cerr << "Error: " << e.what() << std::endl;
            return 1;
        }
    }
    else if (command == "list-tokens") {
        const MappingTable& table = normalizer->table();
        std::cout << "Multi-character pass:" << std::endl;
        for (const auto& entry : table.multiCharEntries()) {
            std::cout << "  " << entry.token << " -> " << entry.replacement << std::endl;
        }
        std::cout << "Single-character pass:" << std::endl;
        for (const auto& entry : table.singleCharEntries()) {
            std::cout << "  " << entry.token << " -> " << entry.replacement << std::endl;
        }
    }
    else if (command == "demo") {
        const std::vector<std::string> examples = {
            "3andi 7ob l dar, 9albi dima fi bladi.",
            "shkun ghadi ydir 2chghal d9i9a?",
            "ana 8adi nshuf lmadina dyal 's5if'",
        };
        for (size_t i = 0; i < examples.size(); ++i) {
            std::cout << "Original " << i + 1 << ": " << examples[i] << std::endl;
            std::cout << "Normalized " << i + 1 << ": " << normalizer->normalize(examples[i]) << std::endl;
        }
    }
    else {
        std::cerr << "Unknown command: " << command << std::endl;
        printHelp();
        return 1;
    }

    return 0;
}

long normalizeFile(const Normalizer& normalizer, const std::string& filePath, std::ostream& out) {
    std::ifstream file(filePath);
    if (!file.is_open()) {
        throw std::runtime_error("Could not open file: " + filePath);
    }

    std::vector<long> malformedLines;
    long count = normalizer.normalizeLines(file, out, &malformedLines);
    for (long lineNumber : malformedLines) {
        std::cerr << "Warning: " << filePath << ":" << lineNumber
                  << ": not valid UTF-8, written as an empty line." << std::endl;
    }
    return count;
}

void printHelp() {
    std::cout << "Darija Command-Line Tool\n";
    std::cout << "Version: " << getDarijaVersion() << "\n\n";
    std::cout << "Usage: darija-cli [-test] <command> [arguments] [options]\n\n";
    std::cout << "Commands:\n";
    std::cout << "  normalize <text...>       Converts Arabizi (Darija chat alphabet) to Arabic script.\n";
    std::cout << "  normalize-file <path>     Normalizes every line of a UTF-8 text file.\n";
    std::cout << "  list-tokens               Lists the mapping table in the order it is applied.\n";
    std::cout << "  demo                      Normalizes a few example sentences.\n";
    std::cout << "  version, --version        Display the library version.\n";
    std::cout << "  help                      Show this help message.\n";
    std::cout << "\nOptions:\n";
    std::cout << "  -test                       Use the mapping file from the source tree (for development).\n";
    std::cout << "  --mapping <file>            Use a custom mapping.toml instead of the built-in table.\n";
}
