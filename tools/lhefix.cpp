/**
 * @file lhefix.cpp
 * @brief Repairs truncated or broken LHE files by keeping every event
 * read before the failure and closing the document.
 */

#include "ToolCommon.hpp"
#include "lheutils/LHEFile.hpp"
#include "lheutils/SafeWriter.hpp"
#include <filesystem>
#include <vector>

using namespace lheutils;

namespace
{
    const char* kTool = "lhefix";

    /// a/b.lhe + ".fix.lhe.gz" -> a/b.fix.lhe.gz; an empty suffix keeps the path.
    std::string outputPath(const std::string& input, const std::string& suffix)
    {
        if (suffix.empty()) return input;
        std::filesystem::path path(input);
        return (path.parent_path() / (path.stem().string() + suffix)).string();
    }

    bool fixFile(const std::string& input, const std::string& suffix, WriteOptions options)
    {
        const std::string output = outputPath(input, suffix);
        options.permissionsFrom = input;
        try
        {
            LHEFile file(input);
            WriteReport report = SafeWriter(options).write(file, Destination::file(output));
            if (report.truncated)
            {
                log::warning(kTool, input + " terminating LHE file at event " +
                                    std::to_string(report.eventsWritten) + " due to: " + report.reason);
            }
            log::success(kTool, input + " fixed: processed " + std::to_string(report.eventsWritten) +
                                " events -> " + output);
            return true;
        }
        catch (const std::exception& e)
        {
            log::error(kTool, "Error fixing " + input + ": " + e.what());
            return false;
        }
    }
}

int main(int argc, char** argv)
{
    return tool::run(kTool, [&]() -> int
    {
        namespace po = tool::po;

        std::vector<std::string> files;
        std::string suffix;
        std::string format;

        po::options_description desc("Options");
        tool::addCommonOptions(desc);
        desc.add_options()
            ("files", po::value<std::vector<std::string>>(&files), "LHE files to fix; stdin to stdout if none")
            ("suffix", po::value<std::string>(&suffix)->default_value(".fix.lhe.gz"),
             "Suffix replacing the last extension of each input ('' fixes in place)")
            ("compress,c", "Compress the output files (implied by a .gz/.gzip suffix)")
            ("weight-format,w", po::value<std::string>(&format)->default_value("rwgt"),
             "Weight format of the output: rwgt, weights or none");

        po::positional_options_description positional;
        positional.add("files", -1);

        po::variables_map vm;
        if (!tool::parseCommandLine(argc, argv, kTool, desc, positional, vm, "[files...] [options]"))
        {
            return 0;
        }

        WriteOptions options;
        options.weightFormat = tool::weightFormatFromString(format);
        options.repair = true;

        if (files.empty())
        {
            // Stream mode: silent, so that it can sit in a pipe
            LHEFile file("-");
            SafeWriter(options).write(file, Destination::standardOutput());
            return 0;
        }

        options.compress = vm.count("compress") > 0;
        bool allFixed = true;
        for (const auto& input : files)
        {
            if (!std::filesystem::exists(input))
            {
                log::error(kTool, "File not found: " + input);
                allFixed = false;
                continue;
            }
            allFixed = fixFile(input, suffix, options) && allFixed;
        }
        return allFixed ? 0 : 1;
    });
}
