#include <usergen/cli/Options.hpp>

#include <getopt.h>

namespace UserGen::cli {

namespace {

const struct option kLongOptions[] = {
    {"output", required_argument, nullptr, 'o'},
    {"help", no_argument, nullptr, 'h'},
    {nullptr, 0, nullptr, 0},
};

} // namespace

ParseStatus parseArguments(const std::vector<std::string>& args, Options& opts,
                           std::string& message) {
    opts = Options();
    message.clear();

    // getopt_long permutes argv, so it gets private copies
    std::vector<std::string> storage(args);
    if (storage.empty())
        storage.push_back("ugen");
    std::vector<char*> argv;
    argv.reserve(storage.size() + 1);
    for (auto& s : storage)
        argv.push_back(&s[0]);
    argv.push_back(nullptr);
    const int argc = static_cast<int>(storage.size());

    // 0 requests a full rescan in glibc, needed when called more than once
    optind = 0;
    opterr = 0;

    bool help = false;
    int opt;
    while ((opt = getopt_long(argc, argv.data(), ":o:h", kLongOptions, nullptr)) != -1) {
        switch (opt) {
        case 'o':
            opts.outputPath = optarg;
            break;
        case 'h':
            help = true;
            break;
        case ':':
            message = "argument -o/--output: expected one argument";
            return ParseStatus::Error;
        case '?':
        default:
            if (optopt != 0)
                message = std::string("unrecognized arguments: -") + static_cast<char>(optopt);
            else
                message = std::string("unrecognized arguments: ") + argv[optind - 1];
            return ParseStatus::Error;
        }
    }

    if (help)
        return ParseStatus::Help;

    for (int i = optind; i < argc; ++i)
        opts.inputPaths.emplace_back(argv[i]);

    if (opts.outputPath.empty() && opts.inputPaths.empty()) {
        message = "the following arguments are required: -o/--output, input_files";
        return ParseStatus::Error;
    }
    if (opts.outputPath.empty()) {
        message = "the following arguments are required: -o/--output";
        return ParseStatus::Error;
    }
    if (opts.inputPaths.empty()) {
        message = "the following arguments are required: input_files";
        return ParseStatus::Error;
    }
    return ParseStatus::Run;
}

void printUsage(const std::string& prog, std::ostream& os) {
    os << "usage: " << prog << " [-h] -o OUTPUT input_files [input_files ...]\n";
}

void printHelp(const std::string& prog, std::ostream& os) {
    printUsage(prog, os);
    os << "\n"
       << "Generate user login names from one or more input files.\n"
       << "\n"
       << "positional arguments:\n"
       << "  input_files           One or more input files containing user records.\n"
       << "\n"
       << "options:\n"
       << "  -h, --help            show this help message and exit\n"
       << "  -o OUTPUT, --output OUTPUT\n"
       << "                        Path to the output file where generated data will be saved.\n";
}

} // namespace UserGen::cli
