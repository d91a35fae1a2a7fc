#pragma once

/* Entry points for CLI modes.
   Each function parses argv options and runs the selected mode.
   Return value: 0 on success, non-zero on error. */

/* Process one image file.
   Example:
     polacam-cli process --in=shot.jpg --outdir=gallery --intensity=0.7 */
int run_process (int argc, char** argv);

/* Process every image of a folder into an output folder.
   Example:
     polacam-cli batch --folder=./raw --outdir=./gallery --preset=compact */
int run_batch   (int argc, char** argv);

/* Generate synthetic captures and push them through a capture session.
   Example:
     polacam-cli simulate --outdir=./gallery --count=3 --color=100,100,220 */
int run_simulate(int argc, char** argv);

/* List the built-in presets. */
int run_presets (int argc, char** argv);
