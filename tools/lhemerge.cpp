/**
 * @file lhemerge.cpp
 * @brief Merges LHE files with identical initialization sections.
 */

#include "ToolCommon.hpp"
#include "lheutils/LHEFile.hpp"
#include "lheutils/MergeCoordinator.hpp"
#include "lheutils/SafeWriter.hpp"
#include <filesystem>
#include <memory>
#include <set>
#include <vector>

using namespace lheutils;

int main(int argc, char** argv)
{
    const char* kTool = "lhemerge";
    return tool::run(kTool, [&]() -> int
    {
        namespace po = tool::po;

        std::vector<std::string> inputs;
        std::string output;
        std::string format;

        po::options_description desc("Options");
        tool::addCommonOptions(desc);
        desc.add_options()
            ("inputs", po::value<std::vector<std::string>>(&inputs), "Input LHE files (at least 2)")
            ("output,o", po::value<std::string>(&output)->default_value("-"),
             "Output LHE file, '-' for stdout (.gz suffix compresses)")
            ("weight-format,w", po::value<std::string>(&format)->default_value("rwgt"),
             "Weight format of the output: rwgt, weights or none");

        po::positional_options_description positional;
        positional.add("inputs", -1);

        po::variables_map vm;
        if (!tool::parseCommandLine(argc, argv, kTool, desc, positional, vm, "inputs... [-o output] [options]"))
        {
            return 0;
        }

        WriteOptions options;
        options.weightFormat = tool::weightFormatFromString(format);

        if (inputs.size() < 2)
        {
            throw tool::UsageError("At least 2 input files are required for merging");
        }
        for (const auto& input : inputs)
        {
            if (!std::filesystem::exists(input)) throw SourceNotFound(input);
            if (!std::filesystem::is_regular_file(input))
            {
                throw tool::UsageError("'" + input + "' is not a file");
            }
        }
        if (std::set<std::string>(inputs.begin(), inputs.end()).size() != inputs.size())
        {
            throw tool::UsageError("Duplicate input files detected");
        }

        // All headers are read and compared before any output is produced
        std::vector<std::unique_ptr<EventStream>> sources;
        for (const auto& input : inputs)
        {
            sources.push_back(std::make_unique<LHEFile>(input));
        }
        ConcatenatedStream merged(std::move(sources));

        const Destination destination = Destination::fromPath(output);
        SafeWriter(options).write(merged, destination);

        log::success(kTool, "Merged " + std::to_string(inputs.size()) + " files " +
                            (destination.isFile() ? "into '" + output + "'" : std::string("to stdout")) +
                            " with " + std::to_string(merged.totalEvents()) + " total events.");
        return 0;
    });
}
