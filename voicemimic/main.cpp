#include "cli_parsing.hpp"
#include "config.hpp"
#include "devices.hpp"
#include "logger.hpp"
#include "port_audio.hpp"
#include "session.hpp"

#include <chrono>
#include <exception>
#include <iostream>
#include <string>
#include <vector>

namespace {

void wait_for_enter(const char* prompt) {
    std::cout << prompt << std::flush;
    std::string line;
    std::getline(std::cin, line);
}

void wait_playback(Session& session) {
    while (!session.playback().wait(std::chrono::milliseconds(200))) {
    }
}

} // namespace

int main(int argc, char** argv) {
    try {
        Options opt = parse_args(argc, argv);

        Logger log(std::cerr, opt.verbose ? LogLevel::Debug : LogLevel::Warning);
        Config cfg = to_config(opt);
        validate(cfg);

        if (opt.listReferences) {
            std::vector<std::string> refs = list_references(cfg.references_dir());
            if (refs.empty()) {
                std::cout << "No reference recordings found in " << cfg.references_dir().string() << "\n";
            } else {
                std::cout << "Available reference recordings:\n";
                for (const std::string& r : refs) std::cout << "- " << r << "\n";
            }
        }

        // comparing two existing files needs no audio device
        if (opt.reference && opt.attempt && !opt.playback && !opt.listDevices) {
            ensure_directories(cfg);
            RenderedFigure fig = compare_recordings(cfg.references_dir() / (*opt.reference + ".wav"),
                                                    *opt.attempt, cfg, log);
            fs::path out = cfg.temp_dir() / (*opt.reference + "_comparison.svg");
            write_svg(fig, out, cfg.plot);
            std::cout << "Comparison written to: " << out.string() << "\n";
            return 0;
        }
        if (!opt.reference && !opt.listDevices) return 0;

        PortAudioHost host;

        if (opt.listDevices) {
            for (const DeviceInfo& d : host.devices()) std::cout << describe_device(d) << "\n";
            if (!opt.reference) return 0;
        }

        Session session(host, cfg, log);
        const std::string& ref = *opt.reference;
        std::cout << "Reference: " << session.reference_path(ref).string() << "\n";
        std::cout << "Input: " << session.input_device().name << "\n";

        if (opt.listen) {
            std::cout << "Playing reference recording...\n";
            session.listen(ref);
            wait_playback(session);
        }

        if (opt.attempt) {
            session.set_attempt(*opt.attempt);
        } else {
            wait_for_enter("Press ENTER to start recording.");
            session.start_recording();
            wait_for_enter("Recording... press ENTER to stop.");
            fs::path saved = session.stop_recording();
            std::cout << "Recording saved to: " << saved.string() << "\n";
        }

        if (opt.playback) {
            std::cout << "Playing your attempt...\n";
            session.play_attempt();
            wait_playback(session);
        }

        fs::path figure = session.visualize(ref);
        std::cout << "Comparison written to: " << figure.string() << "\n";
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
