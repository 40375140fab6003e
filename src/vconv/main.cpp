/*
 * Copyright (C) 2025 The vconv authors
 *
 * This file is part of vconv.
 *
 * vconv is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * vconv is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with vconv.  If not, see <http://www.gnu.org/licenses/>.
 */

#include <cstdlib>
#include <filesystem>
#include <functional>
#include <iomanip>
#include <iostream>
#include <span>
#include <thread>

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/program_options.hpp>

#include "av/BackendParameters.hpp"
#include "av/CapabilityRegistry.hpp"
#include "av/MediaInfo.hpp"
#include "core/Exception.hpp"
#include "core/IChildProcessManager.hpp"
#include "core/IConfig.hpp"
#include "core/ILogger.hpp"
#include "core/Path.hpp"
#include "core/Service.hpp"
#include "core/String.hpp"
#include "services/conversion/IConversionService.hpp"

namespace vconv
{
    namespace program_options = boost::program_options;

    // Runs the given callback from a dedicated thread on SIGINT/SIGTERM
    class InterruptHandler
    {
    public:
        InterruptHandler(std::function<void()> onInterrupt)
            : _onInterrupt{ std::move(onInterrupt) }
        {
            waitForSignal();
            _thread = std::thread{ [this] { _ioContext.run(); } };
        }

        ~InterruptHandler()
        {
            _ioContext.stop();
            _thread.join();
        }

        InterruptHandler(const InterruptHandler&) = delete;
        InterruptHandler& operator=(const InterruptHandler&) = delete;

    private:
        void waitForSignal()
        {
            _signalSet.async_wait([this](const boost::system::error_code& ec, int signalNumber) { handleSignal(ec, signalNumber); });
        }

        void handleSignal(const boost::system::error_code& ec, int signalNumber)
        {
            if (ec)
                return;

            VCONV_LOG(MAIN, INFO, "Caught signal " << signalNumber << ", aborting...");
            _onInterrupt();

            // the current operation may take some time to stop
            waitForSignal();
        }

        std::function<void()> _onInterrupt;
        boost::asio::io_context _ioContext;
        boost::asio::signal_set _signalSet{ _ioContext, SIGINT, SIGTERM };
        std::thread _thread;
    };

    core::logging::Severity getLogMinSeverity(bool verbose)
    {
        if (verbose)
            return core::logging::Severity::DEBUG;

        core::IConfig* config{ core::Service<core::IConfig>::get() };
        if (!config)
            return core::logging::defaultMinSeverity;

        std::string_view minSeverity{ config->getString("log-min-severity", "info") };
        if (minSeverity == "debug")
            return core::logging::Severity::DEBUG;
        else if (minSeverity == "info")
            return core::logging::Severity::INFO;
        else if (minSeverity == "warning")
            return core::logging::Severity::WARNING;
        else if (minSeverity == "error")
            return core::logging::Severity::ERROR;
        else if (minSeverity == "fatal")
            return core::logging::Severity::FATAL;

        throw core::VconvException{ "Invalid config value for 'log-min-severity'" };
    }

    av::VideoCodec parseCodec(const program_options::variables_map& vm, const std::string& option)
    {
        const std::optional<av::VideoCodec> codec{ av::videoCodecFromString(vm[option].as<std::string>()) };
        if (!codec)
            throw program_options::validation_error{ program_options::validation_error::invalid_option_value, option };

        return *codec;
    }

    void displayProgress(std::string_view label, const av::ProgressSnapshot& snapshot)
    {
        std::cout << "\r" << label << " " << std::fixed << std::setprecision(1) << std::setw(5) << snapshot.percentage << "% "
                  << "frame=" << snapshot.frame << " fps=" << snapshot.fps << " time=" << snapshot.time << " speed=" << std::setprecision(2) << snapshot.speed << "x   " << std::flush;
    }

    void displayCapabilities(conversion::IConversionService& service)
    {
        const av::HardwareCapabilities& capabilities{ service.getHardwareCapabilities() };
        const av::CapabilityRegistry& registry{ av::getDefaultCapabilityRegistry() };

        std::cout << "Encoding engine: " << (service.validateEncoder() ? "available" : "NOT available") << "\n";
        std::cout << "Detected backend: " << av::toString(capabilities.getDetectedBackend()) << "\n";
        std::cout << "Encoders:\n";

        for (const av::VideoCodec codec : registry.getOutputCodecs())
        {
            const av::EncoderSelection selection{ service.selectEncoder(codec) };

            std::vector<std::string_view> hardwareBackends;
            for (const av::Backend backend : capabilities.getAvailableHardwareBackends(codec))
                hardwareBackends.push_back(av::toString(backend));

            std::cout << "\t" << registry.getCodec(codec).name << " (" << av::toString(codec) << "): " << av::getEncoderName(selection.parameters) << " [" << av::toString(selection.backend) << "]";
            if (!hardwareBackends.empty())
                std::cout << ", hardware: " << core::stringUtils::joinStrings(hardwareBackends, ", ");
            std::cout << "\n";
        }
    }

    void displayMediaInfo(conversion::IConversionService& service, const std::filesystem::path& file)
    {
        std::cout << "File " << file << ":\n";

        const std::optional<av::MediaInfo> info{ service.probe(file) };
        if (!info)
        {
            std::cout << "\tCannot probe file\n";
            return;
        }

        std::cout << "\tVideo codec: " << av::getVideoCodecName(*info).value_or("none") << "\n";
        if (const std::optional<std::chrono::duration<double>> duration{ av::getDuration(*info) })
            std::cout << "\tDuration: " << core::stringUtils::formatDuration(*duration) << "\n";
        std::cout << "\tDynamic range: " << (av::hasHdrMetadata(*info) ? "HDR" : "SDR") << "\n";

        if (const av::StreamInfo* videoStream{ av::getVideoStream(*info) })
        {
            if (videoStream->colorTransfer)
                std::cout << "\tColor transfer: " << *videoStream->colorTransfer << "\n";
            if (videoStream->colorPrimaries)
                std::cout << "\tColor primaries: " << *videoStream->colorPrimaries << "\n";
        }

        if (const std::optional<std::uintmax_t> size{ core::pathUtils::getFileSize(file) })
        {
            std::cout << "\tSize: " << core::stringUtils::formatFileSize(*size) << "\n";
            std::cout << "\tEstimated conversion time: " << service.estimateConversionTime(*size) << "\n";
        }
    }

    void displayCommand(const conversion::ConversionPlan& plan)
    {
        std::cout << "Encoder: " << av::getEncoderName(plan.selection.parameters) << " [" << av::toString(plan.selection.backend) << "]\n";
        std::cout << "Command: ffmpeg";
        for (const std::string& arg : plan.args)
            std::cout << " " << core::stringUtils::shellQuote(arg);
        std::cout << "\n";
    }

    int processInfo(conversion::IConversionService& service, std::span<const std::string> files)
    {
        displayCapabilities(service);
        for (const std::string& file : files)
            displayMediaInfo(service, file);

        return EXIT_SUCCESS;
    }

    int processConvert(conversion::IConversionService& service, const program_options::variables_map& vm, std::span<const std::string> args)
    {
        if (args.empty() || args.size() > 2)
        {
            std::cerr << "Usage: convert <input> [output]" << std::endl;
            return EXIT_FAILURE;
        }

        av::ConversionRequest request;
        request.inputFile = args[0];
        request.codec = parseCodec(vm, "codec");
        if (vm.count("quality"))
            request.quality = vm["quality"].as<unsigned>();
        request.preserveHdr = !vm.count("no-hdr");

        if (args.size() == 2)
            request.outputFile = args[1];
        else if (vm.count("output"))
            request.outputFile = vm["output"].as<std::string>();
        else
        {
            conversion::BatchParameters parameters;
            parameters.codec = request.codec;
            request.outputFile = service.getOutputFile(request.inputFile, parameters);
        }

        std::error_code ec;
        if (std::filesystem::exists(request.outputFile, ec) && !vm.count("overwrite"))
        {
            std::cerr << "Output file " << request.outputFile << " already exists, use --overwrite to replace it" << std::endl;
            return EXIT_FAILURE;
        }

        if (vm.count("dry-run"))
        {
            displayMediaInfo(service, request.inputFile);
            std::cout << "Output: " << request.outputFile << "\n";
            displayCommand(service.planConversion(request));
            return EXIT_SUCCESS;
        }

        const bool res{ service.convertFile(request, [](const av::ProgressSnapshot& snapshot) { displayProgress("Converting", snapshot); }) };
        std::cout << std::endl;

        if (!res)
        {
            std::cerr << "Conversion failed" << std::endl;
            return EXIT_FAILURE;
        }

        std::cout << "Converted to " << request.outputFile << std::endl;
        return EXIT_SUCCESS;
    }

    int processBatch(conversion::IConversionService& service, const program_options::variables_map& vm, std::span<const std::string> args)
    {
        if (args.size() != 1)
        {
            std::cerr << "Usage: batch <directory>" << std::endl;
            return EXIT_FAILURE;
        }

        const std::filesystem::path directory{ args[0] };
        const std::optional<av::VideoCodec> sourceCodec{ vm.count("source-codec") ? std::make_optional(parseCodec(vm, "source-codec")) : std::nullopt };

        const std::vector<std::filesystem::path> files{ service.findVideoFiles(directory, sourceCodec, !vm.count("no-recursive")) };
        if (files.empty())
        {
            std::cout << "No video file found in " << directory << std::endl;
            return EXIT_SUCCESS;
        }

        conversion::BatchParameters parameters;
        if (vm.count("output"))
            parameters.outputDirectory = vm["output"].as<std::string>();
        parameters.codec = parseCodec(vm, "codec");
        if (vm.count("quality"))
            parameters.quality = vm["quality"].as<unsigned>();
        parameters.preserveHdr = !vm.count("no-hdr");

        if (vm.count("dry-run"))
        {
            std::size_t toConvertCount{};
            std::uintmax_t totalSize{};
            for (const conversion::PlannedFile& planned : service.planConversions(files, parameters))
            {
                std::cout << planned.inputFile << " -> " << planned.outputFile;
                if (planned.skipReason)
                {
                    std::cout << " (skipped: " << conversion::toString(*planned.skipReason) << ")\n";
                    continue;
                }
                std::cout << "\n";

                toConvertCount++;
                totalSize += core::pathUtils::getFileSize(planned.inputFile).value_or(0);
            }

            std::cout << toConvertCount << "/" << files.size() << " file(s) to convert, " << core::stringUtils::formatFileSize(totalSize) << ", estimated time: " << service.estimateConversionTime(totalSize) << std::endl;
            return EXIT_SUCCESS;
        }

        conversion::BatchCallbacks callbacks;
        callbacks.onProgress = [](const std::filesystem::path& file, std::size_t index, std::size_t count, const av::ProgressSnapshot& snapshot) {
            displayProgress("[" + std::to_string(index + 1) + "/" + std::to_string(count) + "] " + file.filename().string(), snapshot);
        };
        callbacks.onFileDone = [](std::size_t index, std::size_t count, const conversion::ConversionOutcome& outcome) {
            std::cout << "\r[" << (index + 1) << "/" << count << "] " << outcome.inputFile.filename().string() << ": " << conversion::toString(outcome.status);
            if (outcome.skipReason)
                std::cout << " (" << conversion::toString(*outcome.skipReason) << ")";
            else if (!outcome.detail.empty())
                std::cout << " (" << outcome.detail << ")";
            std::cout << std::endl;
        };

        const conversion::BatchResult result{ service.convertFiles(files, parameters, callbacks) };

        std::cout << "Total: " << result.total << ", converted: " << result.successful << ", failed: " << result.failed << ", skipped: " << result.skipped << std::endl;
        return (result.failed == 0 && result.outcomes.size() == result.total) ? EXIT_SUCCESS : EXIT_FAILURE;
    }
} // namespace vconv

int main(int argc, char* argv[])
{
    try
    {
        using namespace vconv;

        program_options::options_description options{ "Options" };
        // clang-format off
        options.add_options()
            ("help,h", "Display this help message")
            ("conf,c", program_options::value<std::string>(), "Config file")
            ("codec", program_options::value<std::string>()->default_value(std::string{ "hevc" }, "hevc"), "Output codec (hevc, h264, av1, vp9)")
            ("quality,q", program_options::value<unsigned>(), "Quality value, lower is better (encoder default if not set)")
            ("no-hdr", "Do not preserve HDR metadata")
            ("output,o", program_options::value<std::string>(), "Output file (convert) or output directory (batch)")
            ("source-codec", program_options::value<std::string>(), "Only convert files using this codec (batch)")
            ("no-recursive", "Do not scan subdirectories (batch)")
            ("dry-run,n", "Only display what would be done")
            ("overwrite", "Replace an existing output file (convert)")
            ("verbose,v", "Enable debug logs");
        // clang-format on

        program_options::options_description hiddenOptions{ "Hidden options" };
        // clang-format off
        hiddenOptions.add_options()
            ("command", program_options::value<std::string>(), "command")
            ("args", program_options::value<std::vector<std::string>>()->composing(), "args");
        // clang-format on

        program_options::options_description allOptions;
        allOptions.add(options).add(hiddenOptions);

        program_options::positional_options_description positional;
        positional.add("command", 1);
        positional.add("args", -1);

        program_options::variables_map vm;
        program_options::store(program_options::command_line_parser(argc, argv)
                                   .options(allOptions)
                                   .positional(positional)
                                   .run(),
                               vm);
        program_options::notify(vm);

        auto displayHelp = [&](std::ostream& os) {
            os << "Usage: " << argv[0] << " [options] command [args...]" << std::endl;
            os << "Commands:" << std::endl;
            os << "  info [file...]              Display encoders and file information" << std::endl;
            os << "  convert <input> [output]    Convert a single file" << std::endl;
            os << "  batch <directory>           Convert all the video files of a directory" << std::endl;
            os << options << std::endl;
        };

        if (vm.count("help"))
        {
            displayHelp(std::cout);
            return EXIT_SUCCESS;
        }

        if (!vm.count("command"))
        {
            std::cerr << "No command provided" << std::endl;
            displayHelp(std::cerr);
            return EXIT_FAILURE;
        }

        core::Service<core::IConfig> config;
        if (vm.count("conf"))
            config.assign(core::createConfig(vm["conf"].as<std::string>()));

        const std::filesystem::path logFile{ config.get() ? config->getPath("log-file", "") : std::filesystem::path{} };
        core::Service<core::logging::ILogger> logger{ core::logging::createLogger(getLogMinSeverity(vm.count("verbose")), logFile) };

        const std::unique_ptr<core::IChildProcessManager> childProcessManager{ core::createChildProcessManager() };
        const std::unique_ptr<conversion::IConversionService> service{ conversion::createConversionService(*childProcessManager) };
        const InterruptHandler interruptHandler{ [&] { service->abort(); } };

        const std::string& command{ vm["command"].as<std::string>() };
        const std::vector<std::string> args{ vm.count("args") ? vm["args"].as<std::vector<std::string>>() : std::vector<std::string>{} };

        if (command == "info")
            return processInfo(*service, args);
        if (command == "convert")
            return processConvert(*service, vm, args);
        if (command == "batch")
            return processBatch(*service, vm, args);

        std::cerr << "Unknown command '" << command << "'" << std::endl;
        displayHelp(std::cerr);
    }
    catch (const boost::program_options::error& e)
    {
        std::cerr << "Invalid command line: " << e.what() << std::endl;
    }
    catch (const std::exception& e)
    {
        std::cerr << "Caught exception: " << e.what() << std::endl;
    }

    return EXIT_FAILURE;
}
