/**
 * @file lheinfo.cpp
 * @brief Prints beams, weight groups, cross-sections and channel
 * breakdowns of LHE files, followed by a summary over all of them.
 */

#include "ToolCommon.hpp"
#include "lheutils/LHEFile.hpp"
#include "lheutils/Summary.hpp"
#include <cstdio>
#include <exception>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <vector>

#include <unistd.h>

using namespace lheutils;

namespace
{
    const char* kTool = "lheinfo";

    std::string percent(double ratio, int precision)
    {
        std::ostringstream out;
        out << std::fixed << std::setprecision(precision) << 100.0 * ratio << '%';
        return out.str();
    }

    void printChannels(std::ostream& out, const Summary& channels, size_t fileEvents, const std::string& indent)
    {
        for (const auto& [key, counts] : channels.channelsByCount())
        {
            const double share = fileEvents ? static_cast<double>(counts.events) / fileEvents : 0.0;
            const double negative = counts.events ? static_cast<double>(counts.negative) / counts.events : 0.0;
            out << indent << key.toString() << ": " << counts.events << " events ("
                << percent(share, 1) << ", negative: " << percent(negative, 2) << ")\n";
        }
    }

    void printFile(std::ostream& out, const FileInfo& info)
    {
        const InitInfo& beams = info.beams;
        out << std::string(60, '-') << '\n';
        out << "File: " << info.source << '\n';
        out << "Beam A: " << beams.beamA << " (PDF: " << beams.pdfSetA << ") @ " << beams.energyA << " GeV\n";
        out << "Beam B: " << beams.beamB << " (PDF: " << beams.pdfSetB << ") @ " << beams.energyB << " GeV\n";
        if (!info.weightGroups.empty())
        {
            out << "  Weight Groups:\n";
            for (const auto& [name, count] : info.weightGroups)
            {
                out << "    " << name << ": " << count << " weights\n";
            }
        }
        out << "Number of events: " << info.total.totalEvents()
            << " (negative: " << percent(info.total.negativeRatio(), 2) << ")\n";

        for (const auto& proc : info.processes)
        {
            out << "Process " << proc.process.procId << " cross-section: ("
                << std::scientific << std::setprecision(3) << proc.process.xSection << " +- "
                << proc.process.error << ") pb\n" << std::defaultfloat;
            printChannels(out, proc.summary, info.total.totalEvents(), "  ");
        }
    }

    void printSummary(std::ostream& out, const Summary& summary)
    {
        out << std::string(60, '=') << '\n';
        out << "Total number of events: " << summary.totalEvents()
            << " (negative: " << percent(summary.negativeRatio(), 2) << ")\n";
        printChannels(out, summary, summary.totalEvents(), "");
        out << std::string(60, '=') << '\n';
    }
}

int main(int argc, char** argv)
{
    return tool::run(kTool, [&]() -> int
    {
        namespace po = tool::po;

        std::vector<std::string> files;

        po::options_description desc("Options");
        tool::addCommonOptions(desc);
        desc.add_options()
            ("files", po::value<std::vector<std::string>>(&files), "LHE files to analyze; stdin if none");

        po::positional_options_description positional;
        positional.add("files", -1);

        po::variables_map vm;
        if (!tool::parseCommandLine(argc, argv, kTool, desc, positional, vm, "[files...]"))
        {
            return 0;
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
                if (!std::filesystem::exists(path)) log::warning(kTool, path + " does not exist");
                else if (!std::filesystem::is_regular_file(path)) log::warning(kTool, path + " is not a file");
                else inputs.push_back(path);
            }
        }
        if (inputs.empty())
        {
            throw tool::UsageError("No valid files found and no stdin data");
        }

        Summary accumulated;
        bool allRead = true;
        for (const auto& input : inputs)
        {
            try
            {
                LHEFile file(input);
                FileInfo info = FileInfo::collect(file.sourceName(), file);
                printFile(std::cout, info);
                accumulated += info.total;
            }
            catch (const std::exception& e)
            {
                log::error(kTool, e.what());
                allRead = false;
            }
        }
        printSummary(std::cout, accumulated);
        return allRead ? 0 : 1;
    });
}
