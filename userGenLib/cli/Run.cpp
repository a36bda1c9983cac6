#include <usergen/cli/Options.hpp>
#include <usergen/cli/Run.hpp>
#include <usergen/io/AccountFileWriter.hpp>
#include <usergen/login/LoginRegistry.hpp>
#include <usergen/parser/RecordParser.hpp>

#include <cstdlib>
#include <filesystem>

namespace UserGen::cli {

int run(const std::vector<std::string>& args, std::ostream& out, std::ostream& err) {
    std::string prog = "ugen";
    if (!args.empty()) {
        std::string base = std::filesystem::path(args[0]).filename().string();
        if (!base.empty())
            prog = base;
    }

    Options opts;
    std::string message;
    switch (parseArguments(args, opts, message)) {
    case ParseStatus::Help:
        printHelp(prog, out);
        return EXIT_SUCCESS;
    case ParseStatus::Error:
        printUsage(prog, err);
        err << prog << ": error: " << message << "\n";
        return kExitUsage;
    case ParseStatus::Run:
        break;
    }

    LoginRegistry registry;
    auto records = readInputFiles(opts.inputPaths, registry, err);

    std::error_code ec;
    if (!writeOutputFile(opts.outputPath, records, ec)) {
        err << "[Error] Cannot write output file " << opts.outputPath << ": " << ec.message()
            << "\n";
        return EXIT_FAILURE;
    }
    return EXIT_SUCCESS;
}

} // namespace UserGen::cli
