#include "parser/Parser.hpp"
#include "engine/DiscoveryStore.hpp"
#include "engine/IngestionPipeline.hpp"
#include "actions/ActionDispatcher.hpp"
#include "actions/ConsoleActions.hpp"
#include <iostream>
#include <atomic>
#include <tbb/parallel_for.h>
#include <tbb/blocked_range.h>

namespace {

struct Options {
    std::string harFile;
    bool greedy = true;          // --conservative выключает
    std::string searchFilter;    // --filter TEXT
    std::string sendTo;          // --send repeater|organizer
};

void usage(const char *argv0) {
    std::cerr << "Usage: " << argv0 << " <file.har> [--conservative] [--filter TEXT] [--send repeater|organizer]\n";
}

bool parseArgs(int argc, char *argv[], Options &options) {
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--conservative") {
            options.greedy = false;
        } else if (arg == "--greedy") {
            options.greedy = true;
        } else if (arg == "--filter" && i + 1 < argc) {
            options.searchFilter = argv[++i];
        } else if (arg == "--send" && i + 1 < argc) {
            options.sendTo = argv[++i];
            if (options.sendTo != "repeater" && options.sendTo != "organizer") return false;
        } else if (!arg.empty() && arg[0] != '-' && options.harFile.empty()) {
            options.harFile = arg;
        } else {
            return false;
        }
    }
    return !options.harFile.empty();
}

} // namespace

int main(int argc, char* argv[]) {
    Options options;
    if (!parseArgs(argc, argv, options)) {
        usage(argv[0]);
        return 1;
    }

    Parser parser;
    if (!parser.loadHarFile(options.harFile)) {
        std::cerr << "Failed to load HAR file: " << options.harFile << "\n";
        return 1;
    }

    DiscoveryStore store;
    IngestionPipeline pipeline(store);
    const auto &entries = parser.getEntries();

    // Ответы обрабатываются параллельно, как их отдавал бы перехватчик трафика
    std::atomic<size_t> added{0};
    tbb::parallel_for(tbb::blocked_range<size_t>(0, entries.size()),
                      [&](const tbb::blocked_range<size_t> &range) {
                          for (size_t i = range.begin(); i != range.end(); ++i) {
                              if (const auto response = Parser::toResponse(entries[i])) {
                                  added += pipeline.ingest(*response, options.greedy);
                              }
                          }
                      });

    const auto rows = store.snapshot(options.searchFilter);

    if (options.sendTo.empty()) {
        for (const auto &row : rows) {
            std::cout << row.host << "\t" << row.path << "\t" << row.sourceFile << "\n";
        }
    } else {
        ConsoleActions console(std::cout);
        ActionDispatcher dispatcher(console);
        for (const auto &row : rows) {
            if (options.sendTo == "repeater") {
                dispatcher.sendToRepeater(row);
            } else {
                dispatcher.sendToOrganizer(row);
            }
        }
    }

    std::cerr << "Parsed " << entries.size() << " HAR entries, "
              << added.load() << " URLs from " << store.origins().size() << " origins, "
              << rows.size() << " shown\n";
    return 0;
}
