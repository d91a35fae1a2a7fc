#include "modes.hpp"
#include "args.hpp"
#include "utils.hpp"

#include "polacam/core/Backend.hpp"
#include "polacam/core/CaptureSession.hpp"
#include "polacam/core/Pipeline.hpp"
#include "polacam/io/DirectorySink.hpp"
#include "polacam/io/SyntheticSource.hpp"

#include <algorithm>
#include <iostream>
#include <string>

int run_simulate(int argc, char** argv) {
    const std::string outdir = argValue(argc, argv, "outdir", "");
    if (outdir.empty()) {
        std::cerr
            << "[simulate] usage:\n"
            << "  polacam-cli simulate --outdir=DIR [--count=1] [--size=1000x1500] [--color=100,100,220]\n"
            << "                       [--pattern=solid|gradient|checker] [effect options]\n";
        return 1;
    }

    try {
        const auto opt = pipelineOptionsFromArgs(argc, argv);
        const auto cfg = configFromArgs(argc, argv);

        polacam::SyntheticSource::Options so{};
        so.count   = std::max(0, argInt(argc, argv, "count").value_or(1));
        so.pattern = argValue(argc, argv, "pattern", so.pattern);
        if (argGiven(argc, argv, "size")) {
            // size=WxH
            auto [w, h] = splitPair("size", argValue(argc, argv, "size"));
            so.width  = parseInt("size", w);
            so.height = parseInt("size", h);
        }
        if (argGiven(argc, argv, "color")) so.color = parseColor("color", argValue(argc, argv, "color"));

        std::cout << "[simulate] starting…\n";
        std::cout << "[simulate] captures=" << so.count << ", size=" << so.width << "x" << so.height
                  << ", pattern=" << so.pattern << ", outdir=" << outdir << "\n";
        std::cout << "[simulate] ";
        printEffect(std::cout, opt.effect);
        std::cout << "\n";

        polacam::SyntheticSource source(so);
        auto backend = polacam::makeBackend(cfg.backend, cfg.workerThreads);
        polacam::Pipeline pipeline(*backend, opt);
        polacam::DirectorySink sink(outdir);
        polacam::CaptureSession session(source, pipeline, sink);

        while (auto ev = session.step()) {
            std::cout << "[simulate] saved " << ev->receipt.path << " (" << ev->receipt.bytes
                      << " bytes, crc32=" << std::hex << ev->receipt.crc32 << std::dec << ")\n";
            if (!ev->error.empty()) std::cerr << "[simulate]   " << ev->error << "\n";
        }

        const auto st = session.stats();
        std::cout << "[simulate] finished. total: " << st.total()
                  << "  framed: " << st.processed << "  fallbacks: " << st.fallbacks << "\n";
        return st.fallbacks == 0 ? 0 : 1;

    } catch (const std::exception& e) {
        std::cerr << "[simulate] error: " << e.what() << '\n';
        return 1;
    }
}
