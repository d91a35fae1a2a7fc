#include "modes.hpp"

#include <iostream>
#include <string>

/*
  CLI entry point.

  Modes:
    - process  : frame a single image file.
    - batch    : frame every image of a folder.
    - simulate : synthetic captures through a full capture session.
    - presets  : list the built-in effect presets.
*/
static void print_usage() {
    std::cout
        << "Usage:\n"
        << "  polacam-cli process  --in=FILE [--out=FILE | --outdir=DIR] [effect options]\n"
        << "  polacam-cli batch    --folder=DIR --outdir=DIR [--ext=jpg,jpeg,png] [effect options]\n"
        << "  polacam-cli simulate --outdir=DIR [--count=1] [--size=1000x1500] [--color=100,100,220]\n"
        << "                       [--pattern=solid|gradient|checker] [effect options]\n"
        << "  polacam-cli presets\n"
        << "\n"
        << "Effect options:\n"
        << "  --preset=modern|compact|portrait  --intensity=0.7  --scale=0.85x0.65\n"
        << "  --top=70 --side=70 --bottom=200 --radius=35 --margin=50 --shadow=3 --outline=2\n"
        << "  --step=6 (1 = smooth corners)  --shadow-over-photo  --quality=95  --suffix=_polarized\n"
        << "  --backend=cpu  --threads=0\n";
}

int main(int argc, char** argv)
{
    if (argc < 2) { print_usage(); return 1; }
    const std::string mode = argv[1];

    if      (mode == "process")  return run_process (argc, argv);
    else if (mode == "batch")    return run_batch   (argc, argv);
    else if (mode == "simulate") return run_simulate(argc, argv);
    else if (mode == "presets")  return run_presets (argc, argv);
    else if (mode == "--help" || mode == "help") { print_usage(); return 0; }

    std::cout << "Unknown mode: " << mode << "\n";
    print_usage();
    return 1;
}
