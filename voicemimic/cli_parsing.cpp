#include "cli_parsing.hpp"

#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>


void usage(const char* argv0, std::ostream& os) {
    os
        << "Usage: " << argv0 << " --reference <name> [options]\n"
        << "       " << argv0 << " --list-references | --list-devices [--base-dir <dir>]\n"
        << "Options:\n"
        << "  --reference <name>     compare against references/<name>.wav\n"
        << "  --attempt <file.wav>   compare an existing recording instead of recording\n"
        << "  --list-references      list available reference recordings\n"
        << "  --list-devices         list audio devices\n"
        << "  --base-dir <dir>       holds references/, temp/ and user_recordings/ (default .)\n"
        << "  --input-device <idx>   recording device index\n"
        << "  --output-device <idx>  playback device index\n"
        << "  --sample-rate <hz>     recording sample rate (default 44100)\n"
        << "  --frame-size <n>       envelope/energy frame size (default 2048)\n"
        << "  --no-listen            do not play the reference first\n"
        << "  --playback             play the attempt back after recording\n"
        << "  --trim                 trim leading/trailing silence before comparing\n"
        << "  --verbose              debug logging\n";
}

Options parse_args(int argc, char** argv) {
    if (argc < 2) {
        usage(argv[0], std::cerr);
        throw std::runtime_error("Missing arguments.");
    }

    Options opt;

    for (int i = 1; i < argc; i++) {
        std::string a = argv[i];

        auto need = [&](const char* name) -> std::string {
            if (i + 1 >= argc) throw std::runtime_error(std::string("Missing value for ") + name);
            return argv[++i];
        };
        auto need_int = [&](const char* name) -> int {
            std::string v = need(name);
            try {
                size_t used = 0;
                int n = std::stoi(v, &used);
                if (used != v.size()) throw std::invalid_argument(v);
                return n;
            } catch (const std::exception&) {
                throw std::runtime_error(std::string("Invalid number for ") + name + ": " + v);
            }
        };

        if (a == "--reference") {
            opt.reference = need("--reference");
        } else if (a == "--attempt") {
            opt.attempt = fs::path(need("--attempt"));
        } else if (a == "--list-references") {
            opt.listReferences = true;
        } else if (a == "--list-devices") {
            opt.listDevices = true;
        } else if (a == "--base-dir") {
            opt.baseDir = need("--base-dir");
        } else if (a == "--input-device") {
            opt.inputDevice = need_int("--input-device");
        } else if (a == "--output-device") {
            opt.outputDevice = need_int("--output-device");
        } else if (a == "--sample-rate") {
            opt.sampleRate = need_int("--sample-rate");
            if (*opt.sampleRate <= 0) throw std::runtime_error("sample rate must be positive");
        } else if (a == "--frame-size") {
            int n = need_int("--frame-size");
            if (n <= 0) throw std::runtime_error("frame size must be positive");
            opt.frameSize = static_cast<size_t>(n);
        } else if (a == "--no-listen") {
            opt.listen = false;
        } else if (a == "--playback") {
            opt.playback = true;
        } else if (a == "--trim") {
            opt.trim = true;
        } else if (a == "--verbose") {
            opt.verbose = true;
        } else {
            throw std::runtime_error("Unknown arg: " + a);
        }
    }

    if (!opt.reference && !opt.listReferences && !opt.listDevices) {
        throw std::runtime_error("Missing --reference <name>.");
    }
    if (opt.reference && opt.reference->empty()) throw std::runtime_error("Reference name is empty.");

    return opt;
}

Config to_config(const Options& opt) {
    Config cfg;
    cfg.baseDir = opt.baseDir;
    if (opt.inputDevice) cfg.inputDevice = *opt.inputDevice;
    if (opt.outputDevice) cfg.outputDevice = *opt.outputDevice;
    if (opt.sampleRate) cfg.audio.sampleRate = *opt.sampleRate;
    if (opt.frameSize) cfg.analysis.frameSize = *opt.frameSize;
    cfg.analysis.trimBeforeCompare = opt.trim;
    return cfg;
}
