/**
 * @file lhe2lhe.cpp
 * @brief Converts an LHE file, optionally changing compression and
 * weight format or adding/selecting weights.
 */

#include "ToolCommon.hpp"
#include "lheutils/LHEFile.hpp"
#include "lheutils/SafeWriter.hpp"
#include "lheutils/StreamTransform.hpp"
#include <filesystem>
#include <memory>
#include <vector>

using namespace lheutils;

int main(int argc, char** argv)
{
    const char* kTool = "lhe2lhe";
    return tool::run(kTool, [&]() -> int
    {
        namespace po = tool::po;

        std::string input;
        std::string output;
        std::string format;
        std::vector<std::string> append;
        std::string onlyWeight;

        po::options_description desc("Options");
        tool::addCommonOptions(desc);
        desc.add_options()
            ("input", po::value<std::string>(&input)->default_value("-"), "Input LHE file, '-' for stdin")
            ("output", po::value<std::string>(&output)->default_value("-"), "Output LHE file, '-' for stdout")
            ("compress,c", "Compress the output file (implied by a .gz/.gzip suffix)")
            ("weight-format,w", po::value<std::string>(&format)->default_value("rwgt"),
             "Weight format of the output: rwgt, weights or none")
            ("append-lhe-weight", po::value<std::vector<std::string>>(&append)->multitoken(),
             "GROUP ID TEXT: copy the central weight of every event into a new weight")
            ("only-weight-id", po::value<std::string>(&onlyWeight),
             "Keep only this weight and make it the central weight; events without it are dropped");

        po::positional_options_description positional;
        positional.add("input", 1).add("output", 1);

        po::variables_map vm;
        if (!tool::parseCommandLine(argc, argv, kTool, desc, positional, vm, "[input] [output] [options]"))
        {
            return 0;
        }

        WriteOptions options;
        options.weightFormat = tool::weightFormatFromString(format);
        options.compress = vm.count("compress") > 0;

        const Destination destination = Destination::fromPath(output);
        if (options.compress && !destination.isFile())
        {
            throw IncompatibleOutputOptions(
                "Compression is not applied to stdout (use `lhe2lhe " + input + " | gzip`)");
        }

        std::vector<TransformPolicy> policies;
        if (vm.count("append-lhe-weight"))
        {
            if (append.size() != 3)
            {
                throw tool::UsageError("--append-lhe-weight takes exactly 3 values: GROUP ID TEXT");
            }
            policies.push_back(AppendWeight{append[0], append[1], append[2]});
        }
        if (vm.count("only-weight-id"))
        {
            policies.push_back(RestrictToWeight{onlyWeight});
        }

        if (destination.isFile())
        {
            std::filesystem::path parent = std::filesystem::path(output).parent_path();
            if (!parent.empty()) std::filesystem::create_directories(parent);
        }

        std::unique_ptr<EventStream> stream = std::make_unique<LHEFile>(input);
        if (!policies.empty())
        {
            stream = std::make_unique<TransformedStream>(std::move(stream), std::move(policies));
        }

        SafeWriter(options).write(*stream, destination);
        return 0;
    });
}
