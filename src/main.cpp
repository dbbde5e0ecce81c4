/**
 * eccflow - eccDNA detection pipeline driver
 *
 * Commands:
 *   extract  Candidate split/discordant read extraction (one engine call)
 *   realign  Checkpointed pipeline:
 *              1. intervals    candidate intervals        -> peaks.bed
 *              2. insert_size  insert size mean/std        (in memory)
 *              3. realign      split/discordant realignment -> ecctemp.txt
 *              4. coverage     per-base coverage          -> coverage.txt
 *              5. merge        final eccDNA report
 */

#include <filesystem>
#include <string>
#include <vector>

#include "cli.h"

int main(int argc, char* argv[]) {
    const std::string program = std::filesystem::path(argv[0]).filename().string();
    const std::vector<std::string> args(argv + 1, argv + argc);
    return eccflow::run_command_line(program, args);
}
