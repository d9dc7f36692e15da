/**
 * @file lheshow.cpp
 * @brief Prints one event or the init block of LHE files.
 */

#include "ToolCommon.hpp"
#include "lheutils/LHEFile.hpp"
#include "lheutils/LHEWriter.hpp"
#include <cstdio>
#include <filesystem>
#include <iostream>
#include <vector>

#include <unistd.h>

using namespace lheutils;

int main(int argc, char** argv)
{
    const char* kTool = "lheshow";
    return tool::run(kTool, [&]() -> int
    {
        namespace po = tool::po;

        std::vector<std::string> files;
        long long eventNumber = 0;

        po::options_description desc("Options");
        tool::addCommonOptions(desc);
        desc.add_options()
            ("files", po::value<std::vector<std::string>>(&files), "LHE files to read; stdin if none")
            ("event", po::value<long long>(&eventNumber), "Show the Nth event (1-indexed)")
            ("init", "Show the init block");

        po::positional_options_description positional;
        positional.add("files", -1);

        po::variables_map vm;
        if (!tool::parseCommandLine(argc, argv, kTool, desc, positional, vm, "[files...] (--event N | --init)"))
        {
            return 0;
        }

        const bool showInit = vm.count("init") > 0;
        if (showInit == (vm.count("event") > 0))
        {
            throw tool::UsageError("Exactly one of --event and --init is required");
        }
        if (!showInit && eventNumber <= 0)
        {
            throw tool::UsageError("Event number must be positive (got " + std::to_string(eventNumber) + ")");
        }

        std::vector<std::string> inputs;
        if (files.empty())
        {
            if (!::isatty(::fileno(stdin))) inputs.push_back("-");
        }
        else
        {
            for (const auto& path : files)
            {
                if (std::filesystem::is_regular_file(path)) inputs.push_back(path);
                else log::warning(kTool, path + " is not a file");
            }
        }
        if (inputs.empty())
        {
            throw tool::UsageError("No valid files found and no stdin data");
        }

        for (const auto& input : inputs)
        {
            LHEFile file(input);
            LHEWriter writer(file.init());
            std::string text;

            if (inputs.size() > 1) std::cout << "=== " << file.sourceName() << " ===\n";

            if (showInit)
            {
                writer.writeInit(text);
                std::cout << text;
                continue;
            }

            Event event;
            long long count = 0;
            while (count < eventNumber && file.next(event)) ++count;
            if (count < eventNumber)
            {
                throw std::runtime_error("Event " + std::to_string(eventNumber) + " not found in " +
                                         file.sourceName() + ". File has " + std::to_string(count) + " events.");
            }
            writer.writeEvent(text, event);
            std::cout << text;
        }
        return 0;
    });
}
