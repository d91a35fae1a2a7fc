#include "modes.hpp"
#include "args.hpp"
#include "utils.hpp"

#include "polacam/core/Backend.hpp"
#include "polacam/core/Errors.hpp"
#include "polacam/core/Pipeline.hpp"
#include "polacam/io/FolderSource.hpp"

#include <chrono>
#include <filesystem>
#include <iostream>
#include <string>

int run_process(int argc, char** argv)
{
    const std::string in     = argValue(argc, argv, "in", "");
    const std::string out    = argValue(argc, argv, "out", "");
    const std::string outdir = argValue(argc, argv, "outdir", "");

    if (in.empty()) {
        std::cerr
            << "[process] usage:\n"
            << "  polacam-cli process --in=FILE [--out=FILE | --outdir=DIR] [effect options]\n";
        return 1;
    }

    try {
        const auto opt = pipelineOptionsFromArgs(argc, argv);
        const auto cfg = configFromArgs(argc, argv);

        auto bytes = polacam::readFileBytes(in);
        if (!bytes) {
            std::cerr << "[process] failed to read '" << in << "'\n";
            return 1;
        }

        std::cout << "[process] " << in << " (" << bytes->size() << " bytes) ";
        printEffect(std::cout, opt.effect);
        std::cout << "\n";

        auto backend = polacam::makeBackend(cfg.backend, cfg.workerThreads);
        polacam::Pipeline pipeline(*backend, opt);

        const auto t0 = std::chrono::steady_clock::now();
        polacam::ProcessResult res = pipeline.process(*bytes, in);
        const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                            std::chrono::steady_clock::now() - t0).count();

        if (!res.processed()) {
            std::cerr << "[process] not an image (" << res.message << "), passing through unchanged\n";
        } else {
            std::cout << "[process] " << res.inputSize.width << "x" << res.inputSize.height
                      << " -> " << res.outputSize.width << "x" << res.outputSize.height
                      << " in " << ms << " ms\n";
        }

        std::filesystem::path target;
        if (!out.empty())         target = out;
        else if (!outdir.empty()) target = std::filesystem::path(outdir) / std::filesystem::path(res.outputId).filename();
        else                      target = res.outputId;

        if (target == std::filesystem::path(in)) {
            if (!res.processed()) return 0; // passthrough onto itself: nothing to write
            std::cerr << "[process] refusing to overwrite the input '" << in << "'\n";
            return 1;
        }

        return write_output_file(target, res.bytes) ? 0 : 1;

    } catch (const polacam::EncodeFailure& e) {
        std::cerr << "[process] encode failed: " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "[process] error: " << e.what() << '\n';
        return 1;
    }
}
