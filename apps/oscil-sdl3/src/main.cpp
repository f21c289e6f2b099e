#include <app/app.hpp>
#include <app/cmdline_opts.hpp>

#include <oscil/version.hpp>

#include <cxxopts.hpp>
#include <fmt/format.h>

#include <filesystem>
#include <string>

int main(int argc, char **argv) {
    app::CommandLineOptions progOpts{};

    cxxopts::Options options("Oscil", "Oscil - real-time oscilloscope trace viewer");
    options.add_options()("r,renderer", "Renderer to use: canvas or opengl", cxxopts::value<std::string>());
    options.add_options()("p,profile", "Path to the profile directory holding oscil.toml",
                          cxxopts::value<std::string>());
    options.add_options()("s,sample-rate", "Generator sample rate in Hz", cxxopts::value<double>());
    options.add_options()("w,waveform", "Generated waveform: sine, square or noise", cxxopts::value<std::string>());
    options.add_options()("v,version", "Display version");
    options.add_options()("h,help", "Display this help text");

    try {
        auto result = options.parse(argc, argv);
        if (result.count("help")) {
            fmt::print("{}\n", options.help());
            return 0;
        }
        if (result.count("version")) {
            fmt::print("Oscil {}\n", oscil::version::fullstring);
            return 0;
        }
        if (result.count("profile")) {
            progOpts.profilePath = result["profile"].as<std::string>();
        }
        if (result.count("renderer")) {
            progOpts.renderer = result["renderer"].as<std::string>();
        }
        if (result.count("sample-rate")) {
            progOpts.sampleRate = result["sample-rate"].as<double>();
        }
        if (result.count("waveform")) {
            progOpts.waveform = result["waveform"].as<std::string>();
        }
    } catch (const cxxopts::exceptions::exception &e) {
        fmt::print(stderr, "{}\n\n{}\n", e.what(), options.help());
        return 1;
    }

    if (progOpts.profilePath.empty()) {
        progOpts.profilePath = std::filesystem::current_path();
    }

    app::App app{};
    return app.Run(progOpts);
}
