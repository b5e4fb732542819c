#ifndef DISCPACK_CLI_RUNNER_HPP
#define DISCPACK_CLI_RUNNER_HPP

/**
 * @brief Parses the command line and runs the whole split.
 *
 * Missing or non-existent directories print the error and the usage and
 * return 0, the same as running without arguments.
 *
 * @return 0 on success or early return, 2 if a part (or the CSV report)
 *         failed, CLI11's exit code on a parse error.
 */
int run_cli(int argc, char* argv[]);

#endif // DISCPACK_CLI_RUNNER_HPP
