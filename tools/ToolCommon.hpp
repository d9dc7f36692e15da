/**
 * @file ToolCommon.hpp
 * @brief Argument parsing and error reporting shared by the tools.
 */

#pragma once

#include "Log.hpp"
#include "lheutils/Errors.hpp"
#include "lheutils/LHEWriter.hpp"
#include "lheutils/Version.hpp"
#include <boost/program_options.hpp>
#include <exception>
#include <iostream>
#include <stdexcept>
#include <string>

namespace lheutils
{
namespace tool
{
    namespace po = boost::program_options;

    /// Command line that parses but makes no sense.
    class UsageError : public std::runtime_error
    {
    public:
        explicit UsageError(const std::string& what) : std::runtime_error(what) {}
    };

    /// Adds --help and --version.
    inline void addCommonOptions(po::options_description& desc)
    {
        desc.add_options()
            ("help,h", "Print this help message")
            ("version", "Print the version and exit");
    }

    /**
     * @brief Parses argv into vm.
     * @return false if --help or --version was handled and the tool
     * should exit successfully.
     * @throws po::error on an invalid command line.
     */
    inline bool parseCommandLine(int argc, char** argv, const char* tool,
                                 const po::options_description& desc,
                                 const po::positional_options_description& positional,
                                 po::variables_map& vm, const std::string& usage)
    {
        po::store(po::command_line_parser(argc, argv)
                  .options(desc)
                  .positional(positional)
                  .run(), vm);

        if (vm.count("help"))
        {
            std::cout << "Usage: " << tool << " " << usage << "\n\n" << desc << "\n";
            return false;
        }
        if (vm.count("version"))
        {
            std::cout << tool << " " << kVersion << "\n";
            return false;
        }
        po::notify(vm);
        return true;
    }

    inline WeightFormat weightFormatFromString(const std::string& name)
    {
        auto format = parseWeightFormat(name);
        if (!format)
        {
            throw UsageError("Invalid weight format '" + name + "' (expected rwgt, weights or none)");
        }
        return *format;
    }

    /**
     * @brief Runs body, turning exceptions into an error line and exit code.
     *
     * Bad command lines exit with 2, every other failure with 1.
     */
    template <typename Body>
    int run(const char* tool, Body&& body)
    {
        try
        {
            return body();
        }
        catch (const po::error& e)
        {
            log::error(tool, std::string(e.what()) + " (see --help)");
            return 2;
        }
        catch (const UsageError& e)
        {
            log::error(tool, std::string(e.what()) + " (see --help)");
            return 2;
        }
        catch (const std::exception& e)
        {
            log::error(tool, e.what());
            return 1;
        }
    }

} // namespace tool
} // namespace lheutils
