#include "config.hpp"
#include "diag.hpp"
#include "engine.hpp"
#include "registry.hpp"
#include "shell.hpp"

#include <cstdlib>
#include <exception>
#include <iostream>
#include <unistd.h>

static void usage(const char* argv0) {
    std::cerr << "usage: " << argv0 << " [-d DIR] [-q]\n"
              << "  -d DIR  keep commands.json and history in DIR\n"
              << "  -q      start with output capture off\n"
              << "env: CMDRUNNER_HOME, CMDRUNNER_LOG=info|warn|error|off\n";
}

int main(int argc, char** argv) {
    if (const char* lvl = std::getenv("CMDRUNNER_LOG")) {
        if (!diag::set_level_from_string(lvl)) {
            std::cerr << "ignoring CMDRUNNER_LOG=" << lvl << "\n";
        }
    } else {
        diag::set_level(diag::Level::Warn);
    }

    std::filesystem::path dir;
    bool capture = true;
    int opt;
    while ((opt = ::getopt(argc, argv, "d:qh")) != -1) {
        switch (opt) {
        case 'd': dir = optarg; break;
        case 'q': capture = false; break;
        case 'h': usage(argv[0]); return 0;
        default:  usage(argv[0]); return 2;
        }
    }
    if (dir.empty()) dir = config::default_storage_dir();

    try {
        CommandRegistry registry(dir);
        if (!registry.load_status()) {
            std::cerr << "warning: " << registry.file().string()
                      << " could not be read, starting with no commands ("
                      << registry.load_status().message << ")\n";
        }

        ExecutionEngine engine(registry);
        Shell shell(engine, config::history_file(dir), capture);
        return shell.run();
    } catch (const std::exception& e) {
        std::cerr << "error: " << e.what() << "\n";
        return 1;
    }
}
