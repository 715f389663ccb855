#include "cli.hpp"
#include "config.hpp"
#include "errors.hpp"
#include "generator.hpp"
#include "rom.hpp"
#include "sink.hpp"
#include <argparse/argparse.hpp>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <string>

using namespace fenrom;

namespace {

void buildRom(const Config& config, const RecordSink& sink, std::optional<uint32_t> headerPages)
{
    std::cout << "Generating rom file...\n";
    RomAssembler assembler(config.geometry);
    RomImage image = assembler.assemble(sink, headerPages);
    printRomStats(image.stats, std::cout);
    writeRom(config.romPath, image.bytes);
    std::cout << "ROM written to " << config.romPath.string() << "\n";
}

} // namespace

int main(int argc, char* argv[]) {
    argparse::ArgumentParser program("fenrom", "0.1.0", argparse::default_arguments::all);
    addArguments(program);

    Config config;
    try {
        program.parse_args(argc, argv);
        config = buildConfig(program);
    }
    catch (const std::exception& err) {
        std::cerr << err.what() << std::endl;
        std::cerr << program;
        return 1;
    }

    try {
        if (config.verbose) {
            printConfig(config, std::cout);
        }

        if (config.romOnly) {
            DirectorySink sink(config.outputDir);
            std::cout << "Reading records from " << sink.path().string() << "\n";
            buildRom(config, sink, std::nullopt);
            return 0;
        }

        std::unique_ptr<DirectorySink> sink;
        if (config.dryRun) {
            std::cout << "Dry run, no puzzles will be generated...\n";
        } else {
            sink = std::make_unique<DirectorySink>(config.outputDir);
            sink->prepare(config.clean);
        }

        const std::string input = program.get<std::string>("input");
        std::ifstream file;
        if (input != "-") {
            file.open(input);
            if (!file.is_open()) {
                throw IoError("Could not open file: " + input);
            }
        }
        std::istream& source = input == "-" ? std::cin : file;

        PuzzleGenerator generator(config, sink.get(), std::cout, std::cerr);
        GeneratorStats stats = generator.run(source);
        printSummary(stats, std::cout);
        if (sink) {
            std::cout << "Records written to " << sink->path().string() << "\n";
        }

        if (config.generateRom && sink) {
            std::optional<uint32_t> headerPages;
            if (config.headerCounts == HeaderCounts::Emitted) {
                headerPages = static_cast<uint32_t>(stats.pages);
            }
            buildRom(config, *sink, headerPages);
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
