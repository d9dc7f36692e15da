/**
 * @file lhesplit.cpp
 * @brief Splits an LHE file into files of at most N events.
 */

#include "ToolCommon.hpp"
#include "lheutils/LHEFile.hpp"
#include "lheutils/SafeWriter.hpp"
#include "lheutils/SplitCoordinator.hpp"
#include <filesystem>
#include <memory>

using namespace lheutils;

namespace
{
    /// out/split.lhe.gz, 3 -> out/split_3.lhe.gz
    std::string chunkPath(const std::string& base, size_t index)
    {
        std::filesystem::path path(base);
        std::string name = path.filename().string();
        const std::string tag = "_" + std::to_string(index);
        size_t dot = name.find('.');
        if (dot == std::string::npos) name += tag;
        else name.insert(dot, tag);
        return (path.parent_path() / name).string();
    }
}

int main(int argc, char** argv)
{
    const char* kTool = "lhesplit";
    return tool::run(kTool, [&]() -> int
    {
        namespace po = tool::po;

        std::string input;
        std::string output;
        long long numEvents = 0;

        po::options_description desc("Options");
        tool::addCommonOptions(desc);
        desc.add_options()
            ("input,i", po::value<std::string>(&input)->default_value("-"), "Input LHE file, '-' for stdin")
            ("output,o", po::value<std::string>(&output)->required(),
             "Base name of the output files including the .lhe or .lhe.gz extension")
            ("num-events", po::value<long long>(&numEvents)->required(), "Number of events per output file")
            ("no-weights", "Do not write alternate event weights")
            ("rwgt", "Write weights as <rwgt> blocks instead of <weights>");

        po::positional_options_description positional;
        positional.add("num-events", 1);

        po::variables_map vm;
        if (!tool::parseCommandLine(argc, argv, kTool, desc, positional, vm, "-o BASE N [-i input] [options]"))
        {
            return 0;
        }

        WriteOptions options;
        if (vm.count("no-weights")) options.weightFormat = WeightFormat::None;
        else if (vm.count("rwgt")) options.weightFormat = WeightFormat::Rwgt;
        else options.weightFormat = WeightFormat::Weights;

        if (input != "-" && std::filesystem::exists(input) && !std::filesystem::is_regular_file(input))
        {
            throw tool::UsageError("'" + input + "' is not a file");
        }

        EventSplitter splitter(std::make_unique<LHEFile>(input), numEvents);
        SafeWriter writer(options);
        size_t events = 0;
        while (auto chunk = splitter.nextChunk())
        {
            const std::string path = chunkPath(output, chunk->index());
            WriteReport report = writer.write(*chunk, Destination::file(path));
            events += report.eventsWritten;
        }

        log::success(kTool, "Split " + log::formatCount(static_cast<long long>(events)) + " events into " +
                            std::to_string(splitter.chunksProduced()) + " files with base name '" + output + "'.");
        return 0;
    });
}
