#pragma once

// Entry point of the command line tool, separate from main() so tests can drive it in process.
// Returns the process exit code: 0 when everything was copied, 2 when some files failed, 1 otherwise.
int supercopyMain(int argc, char** argv);
