#include "modes.hpp"
#include "args.hpp"
#include "utils.hpp"

#include "polacam/core/Backend.hpp"
#include "polacam/core/CaptureSession.hpp"
#include "polacam/core/Pipeline.hpp"
#include "polacam/io/DirectorySink.hpp"
#include "polacam/io/FolderSource.hpp"

#include <cctype>
#include <iostream>
#include <string>
#include <vector>

static std::vector<std::string> split_list(const std::string& s) {
    std::vector<std::string> out;
    std::string cur;
    for (char c: s) {
        if (c==',' || c==';' || std::isspace(static_cast<unsigned char>(c))) {
            if (!cur.empty()) { out.push_back(cur); cur.clear(); }
        } else cur.push_back(c);
    }
    if (!cur.empty()) out.push_back(cur);
    return out;
}

static const char* kind_name(polacam::SessionEvent::Kind k) {
    switch (k) {
        case polacam::SessionEvent::Kind::Processed:     return "framed";
        case polacam::SessionEvent::Kind::PassedThrough: return "passed through";
        case polacam::SessionEvent::Kind::Fallback:      return "raw fallback";
    }
    return "?";
}

int run_batch(int argc, char** argv)
{
    const std::string folder = argValue(argc, argv, "folder", "");
    const std::string outdir = argValue(argc, argv, "outdir", "");
    const std::string extstr = argValue(argc, argv, "ext", "jpg,jpeg,png,bmp,tif,tiff");

    if (folder.empty() || outdir.empty()) {
        std::cerr
            << "[batch] usage:\n"
            << "  polacam-cli batch --folder=DIR --outdir=DIR [--ext=jpg,jpeg,png] [effect options]\n";
        return 1;
    }

    try {
        const auto opt = pipelineOptionsFromArgs(argc, argv);
        const auto cfg = configFromArgs(argc, argv);

        polacam::FolderSource source(folder, split_list(extstr));
        if (source.size() == 0) {
            std::cerr << "[batch] no images found in '" << folder << "' with ext: " << extstr << "\n";
            return 1;
        }
        std::cout << "[batch] found " << source.size() << " images in " << folder
                  << " (ext=" << extstr << ")\n";

        auto backend = polacam::makeBackend(cfg.backend, cfg.workerThreads);
        polacam::Pipeline pipeline(*backend, opt);
        polacam::DirectorySink sink(outdir);
        polacam::CaptureSession session(source, pipeline, sink);

        while (auto ev = session.step()) {
            std::cout << "[batch] " << ev->captureId << " -> " << ev->receipt.path
                      << " (" << kind_name(ev->kind) << ")\n";
            if (!ev->error.empty()) std::cerr << "[batch]   " << ev->error << "\n";
        }

        const auto st = session.stats();
        std::cout << "[batch] done. framed: " << st.processed
                  << "  passed through: " << st.passedThrough
                  << "  fallbacks: " << st.fallbacks << "\n";
        return st.fallbacks == 0 ? 0 : 1;

    } catch (const std::exception& e) {
        std::cerr << "[batch] error: " << e.what() << '\n';
        return 1;
    }
}
