#include <iostream>
#include <fstream>
#include <vector>
#include <memory>
#include <string>
#include <sstream>
#include <iomanip>
#include <algorithm>
#include <cctype>
#include <stdexcept>

#include "common/timer.hpp"
#include "common/csv_logger.hpp"
#include "common/verification.hpp"
#include "common/chunk_executor.hpp"
#include "engines/i_blur_engine.hpp"
#include "engines/blur_builder.hpp"
#include "adapters/blur_codec.hpp"

namespace xorblur
{

    struct Config
    {
        std::vector<size_t> sizesBytes = {64, 256, 4096, 65536, 1024 * 1024, 16 * 1024 * 1024};
        std::vector<Strategy> strategies = {Strategy::Direct, Strategy::Unrolled, Strategy::LookupTable,
                                            Strategy::Batched, Strategy::Adaptive, Strategy::OpenCL};
        int iterations = 5;
        bool verify = true;
        bool parallel = true;
        bool dynamicShift = true;
        int numThreads = 0;
        std::string outputFile = "xorblur_results.csv";
        bool demo = false;
        std::string encoding = "UTF-8";
    };

    void printUsage(const char *progName)
    {
        std::cout << "Usage: " << progName << " [options]\n"
                  << "\nOptions:\n"
                  << "  --sizes <list>       Comma-separated input sizes in bytes, K/M suffix allowed\n"
                  << "                       (default: 64,256,4K,64K,1M,16M)\n"
                  << "  --strategy <list>    Comma-separated strategies: direct,unrolled,table,batched,\n"
                  << "                       adaptive,opencl (default: all)\n"
                  << "  --mode <m>           dynamic or fixed shift (default: dynamic)\n"
                  << "  --iterations <n>     Timed runs per test (default: 5)\n"
                  << "  --parallel           Also run the chunked parallel path (default: on)\n"
                  << "  --no-parallel        Serial path only\n"
                  << "  --threads <n>        Worker threads for the parallel path (default: auto)\n"
                  << "  --verify             Check round trip and cross-strategy digests (default: on)\n"
                  << "  --no-verify          Skip verification\n"
                  << "  --output <file>      CSV output file (default: xorblur_results.csv)\n"
                  << "  --demo               Run the text demo instead of the benchmark\n"
                  << "  --encoding <name>    Charset used by the demo (default: UTF-8)\n"
                  << "  --help               Show this help message\n";
    }

    size_t parseSize(const std::string &token)
    {
        if (token.empty())
        {
            throw std::invalid_argument("Empty size value");
        }

        size_t multiplier = 1;
        std::string digits = token;
        char suffix = static_cast<char>(std::toupper(static_cast<unsigned char>(token.back())));
        if (suffix == 'K')
        {
            multiplier = 1024;
            digits.pop_back();
        }
        else if (suffix == 'M')
        {
            multiplier = 1024 * 1024;
            digits.pop_back();
        }
        return std::stoul(digits) * multiplier;
    }

    std::vector<size_t> parseSizes(const std::string &str)
    {
        std::vector<size_t> sizes;
        std::stringstream ss(str);
        std::string token;
        while (std::getline(ss, token, ','))
        {
            sizes.push_back(parseSize(token));
        }
        return sizes;
    }

    std::vector<Strategy> parseStrategies(const std::string &str)
    {
        std::vector<Strategy> strategies;
        std::stringstream ss(str);
        std::string token;
        while (std::getline(ss, token, ','))
        {
            Strategy strategy;
            if (!parseStrategy(token, strategy))
            {
                throw std::invalid_argument("Unknown strategy: " + token);
            }
            strategies.push_back(strategy);
        }
        return strategies;
    }

    std::string getPlatformName()
    {
#ifdef __APPLE__
        return "macOS";
#elif defined(__linux__)
        std::ifstream procVersion("/proc/version");
        if (procVersion)
        {
            std::string line;
            std::getline(procVersion, line);
            if (line.find("microsoft") != std::string::npos ||
                line.find("Microsoft") != std::string::npos ||
                line.find("WSL") != std::string::npos)
            {
                return "WSL";
            }
        }
        return "Linux";
#elif defined(_WIN32)
        return "Windows";
#else
        return "Unknown";
#endif
    }

    bool parseArgs(int argc, char *argv[], Config &config)
    {
        for (int i = 1; i < argc; ++i)
        {
            std::string arg = argv[i];

            if (arg == "--help" || arg == "-h")
            {
                printUsage(argv[0]);
                return false;
            }
            else if (arg == "--sizes" && i + 1 < argc)
            {
                config.sizesBytes = parseSizes(argv[++i]);
            }
            else if (arg == "--strategy" && i + 1 < argc)
            {
                config.strategies = parseStrategies(argv[++i]);
            }
            else if (arg == "--mode" && i + 1 < argc)
            {
                std::string mode = argv[++i];
                if (mode == "dynamic")
                {
                    config.dynamicShift = true;
                }
                else if (mode == "fixed")
                {
                    config.dynamicShift = false;
                }
                else
                {
                    throw std::invalid_argument("Unknown mode: " + mode);
                }
            }
            else if (arg == "--iterations" && i + 1 < argc)
            {
                config.iterations = std::max(1, std::stoi(argv[++i]));
            }
            else if (arg == "--parallel")
            {
                config.parallel = true;
            }
            else if (arg == "--no-parallel")
            {
                config.parallel = false;
            }
            else if (arg == "--threads" && i + 1 < argc)
            {
                config.numThreads = std::stoi(argv[++i]);
            }
            else if (arg == "--verify")
            {
                config.verify = true;
            }
            else if (arg == "--no-verify")
            {
                config.verify = false;
            }
            else if (arg == "--output" && i + 1 < argc)
            {
                config.outputFile = argv[++i];
            }
            else if (arg == "--demo")
            {
                config.demo = true;
            }
            else if (arg == "--encoding" && i + 1 < argc)
            {
                config.encoding = argv[++i];
            }
            else
            {
                std::cerr << "Ignoring unknown option: " << arg << "\n";
            }
        }
        return true;
    }

    std::string formatSize(size_t bytes)
    {
        std::stringstream label;
        if (bytes >= 1024 * 1024 && bytes % (1024 * 1024) == 0)
            label << (bytes / (1024 * 1024)) << " MB";
        else if (bytes >= 1024 && bytes % 1024 == 0)
            label << (bytes / 1024) << " KB";
        else
            label << bytes << " B";
        return label.str();
    }

    void printHeader()
    {
        std::cout << "\n";
        std::cout << "╔════════════════════════════════════════════════════════════════════╗\n";
        std::cout << "║        XORBLUR - Reversible XOR/rotate obfuscation benchmark       ║\n";
        std::cout << "╠════════════════════════════════════════════════════════════════════╣\n";
        std::cout << "║  Strategies: Direct, Unrolled, LookupTable, Batched, Adaptive,     ║\n";
        std::cout << "║              OpenCL                                                ║\n";
        std::cout << "╚════════════════════════════════════════════════════════════════════╝\n\n";
    }

    void printSystemInfo(const Config &config)
    {
        std::cout << "System Information:\n";
        std::cout << "───────────────────\n";
        std::cout << "  Platform: " << getPlatformName() << "\n";
        std::cout << "  Worker Threads: " << ParallelChunkExecutor::maxThreads() << "\n";
        std::cout << "  Available Backends:\n";
        std::cout << "    ✓ CPU strategies\n";

        if (ParallelChunkExecutor::isParallelAvailable())
        {
            std::cout << "    ✓ OpenMP fork/join chunking\n";
        }
        else
        {
            std::cout << "    ✗ OpenMP (parallel path runs serially)\n";
        }

        BlurEnginePtr probe = createEngine(Strategy::OpenCL, config.dynamicShift
                                                                 ? KeyMaterial::dynamic(DEFAULT_SECRET_KEY, DEFAULT_KEY_SEGMENT)
                                                                 : KeyMaterial::fixed(DEFAULT_SIMPLE_KEY, DEFAULT_SHIFT_VALUE));
        if (probe->isAvailable())
        {
            std::cout << "    ✓ OpenCL device\n";
        }
        else
        {
            std::cout << "    ✗ OpenCL (falls back to CPU)\n";
        }

        std::cout << "\n";
    }

    BenchmarkResult runSingleBenchmark(IBlurEngine *engine,
                                       const std::vector<uint8_t> &data,
                                       const Config &config,
                                       const std::string &referenceDigest)
    {
        BenchmarkResult result;
        result.platform = getPlatformName();
        result.strategy = engine->getEngineName();
        result.mode = toString(engine->getKeyMaterial().mode());
        result.sizeBytes = data.size();
        result.parallel = engine->isParallel();
        result.numThreads = engine->isParallel()
                                ? (config.numThreads > 0 ? config.numThreads : ParallelChunkExecutor::maxThreads())
                                : 1;
        result.iterations = config.iterations;

        std::vector<uint8_t> encrypted(data.size());
        std::vector<uint8_t> decrypted(data.size());

        engine->initialize();

        double totalTime = 0;
        Timer timer;
        for (int iter = 0; iter < config.iterations; ++iter)
        {
            timer.start();
            engine->encrypt(data.data(), encrypted.data(), data.size());
            timer.stop();
            totalTime += timer.elapsedSeconds();
        }

        result.timeSec = totalTime / config.iterations;
        if (result.timeSec > 0)
        {
            result.throughputMBs = static_cast<double>(data.size()) / (1024.0 * 1024.0) / result.timeSec;
        }

        if (config.verify)
        {
            engine->decrypt(encrypted.data(), decrypted.data(), data.size());
            result.verified = verifyBuffers(data.data(), decrypted.data(), data.size());
            result.digest = calculateSHA256(encrypted);
            result.consistent = referenceDigest.empty() || result.digest == referenceDigest;
        }
        else
        {
            result.verified = true;
            result.consistent = true;
        }

        engine->cleanup();
        return result;
    }

    void printResultLine(const BenchmarkResult &result)
    {
        std::cout << "  " << std::left << std::setw(12) << result.strategy
                  << " | " << std::setw(8) << (result.parallel ? "parallel" : "serial")
                  << " | " << std::setw(3) << result.numThreads
                  << " | " << std::fixed << std::setprecision(2) << std::setw(10) << result.throughputMBs << " MB/s"
                  << " | " << std::setprecision(6) << std::setw(10) << result.timeSec << " s"
                  << " | " << std::setprecision(2) << std::setw(7) << result.speedup
                  << " | " << (result.verified ? "PASS" : "FAIL")
                  << " | " << (result.consistent ? "PASS" : "FAIL") << "\n";
    }

    int runBenchmarks(const Config &config)
    {
        std::cout << "Test Configuration:\n";
        std::cout << "───────────────────\n";
        std::cout << "  Sizes: ";
        for (size_t i = 0; i < config.sizesBytes.size(); ++i)
        {
            std::cout << formatSize(config.sizesBytes[i]);
            if (i < config.sizesBytes.size() - 1)
                std::cout << ", ";
        }
        std::cout << "\n";
        std::cout << "  Mode: " << (config.dynamicShift ? "dynamic" : "fixed") << " shift\n";
        std::cout << "  Iterations: " << config.iterations << "\n";
        std::cout << "  Verification: " << (config.verify ? "enabled" : "disabled") << "\n";
        std::cout << "  Parallel Path: " << (config.parallel ? "enabled" : "disabled") << "\n";
        std::cout << "  Output: " << config.outputFile << "\n\n";

        CsvLogger logger(config.outputFile);
        logger.writeHeader();

        BlurBuilder builder;
        builder.withDynamicShift(config.dynamicShift).withNumThreads(config.numThreads);

        int totalPassed = 0;
        int totalFailed = 0;

        for (size_t sizeBytes : config.sizesBytes)
        {
            std::cout << "═══════════════════════════════════════════════════════════════════════════\n";
            std::cout << "Input size " << formatSize(sizeBytes) << "\n";
            std::cout << "═══════════════════════════════════════════════════════════════════════════\n\n";

            std::vector<uint8_t> data(sizeBytes);
            fillRandom(data);

            // Reference digest from the serial Direct strategy.
            std::string referenceDigest;
            double baselineTime = 0;
            {
                BlurEnginePtr reference = BlurBuilder(builder).withStrategy(Strategy::Direct).build();
                BenchmarkResult baseline = runSingleBenchmark(reference.get(), data, config, std::string());
                referenceDigest = baseline.digest;
                baselineTime = baseline.timeSec;
            }

            std::cout << "  " << std::string(100, '-') << "\n";
            std::cout << "  Strategy     | Path     | Thr | Throughput      | Time         | Speedup | Trip | Same\n";
            std::cout << "  " << std::string(100, '-') << "\n";

            std::vector<bool> paths = {false};
            if (config.parallel)
            {
                paths.push_back(true);
            }

            for (Strategy strategy : config.strategies)
            {
                for (bool parallel : paths)
                {
                    BlurEnginePtr engine = BlurBuilder(builder)
                                               .withStrategy(strategy)
                                               .withParallelProcessing(parallel)
                                               .build();

                    BenchmarkResult result = runSingleBenchmark(engine.get(), data, config, referenceDigest);
                    if (baselineTime > 0 && result.timeSec > 0)
                    {
                        result.speedup = baselineTime / result.timeSec;
                    }

                    printResultLine(result);
                    logger.writeResult(result);

                    if (result.verified && result.consistent)
                        totalPassed++;
                    else
                        totalFailed++;
                }
            }

            logger.flush();
            std::cout << "\n";
        }

        int total = totalPassed + totalFailed;
        std::cout << "═══════════════════════════════════════════════════════════════════════════\n";
        std::cout << "VERIFICATION SUMMARY\n";
        std::cout << "═══════════════════════════════════════════════════════════════════════════\n";
        std::cout << "  Total Tests: " << total << "\n";
        if (total > 0)
        {
            std::cout << "  Passed:      " << totalPassed << " (" << (100 * totalPassed / total) << "%)\n";
            std::cout << "  Failed:      " << totalFailed << " (" << (100 * totalFailed / total) << "%)\n";
        }

        if (totalFailed == 0)
        {
            std::cout << "\n  ✓ All strategies round-tripped and agreed with Direct!\n";
        }
        else
        {
            std::cout << "\n  ✗ Some strategies failed verification!\n";
        }

        std::cout << "\nResults saved to: " << config.outputFile << "\n\n";
        return totalFailed == 0 ? 0 : 1;
    }

    void demoEncryption(BlurCodec &codec, const std::string &description, const std::string &text)
    {
        std::cout << "=== " << description << " ===\n";
        std::cout << "  Original:  " << text << "\n";

        std::string encrypted = codec.encryptText(text);
        std::cout << "  Encrypted: " << encrypted << "\n";

        std::string decrypted = codec.decryptStr(encrypted);
        std::cout << "  Decrypted: " << decrypted << "\n";
        std::cout << "  Match:     " << (decrypted == text ? "yes" : "NO") << "\n\n";
    }

    int runDemo(const Config &config)
    {
        const std::string text = "Hello World - reversible XOR/rotate obfuscation demo";

        struct DemoCase
        {
            std::string description;
            Strategy strategy;
            bool dynamicShift;
            bool parallel;
        };

        std::vector<DemoCase> cases = {
            {"Direct, dynamic shift", Strategy::Direct, true, false},
            {"Lookup table, dynamic shift", Strategy::LookupTable, true, false},
            {"Batched, dynamic shift", Strategy::Batched, true, false},
            {"Adaptive, dynamic shift", Strategy::Adaptive, true, false},
            {"Direct, fixed shift", Strategy::Direct, false, false},
            {"Unrolled, fixed shift", Strategy::Unrolled, false, false},
            {"Direct, fixed shift, parallel", Strategy::Direct, false, true},
        };

        for (const auto &demo : cases)
        {
            BlurCodec codec(BlurBuilder()
                                .withStrategy(demo.strategy)
                                .withDynamicShift(demo.dynamicShift)
                                .withParallelProcessing(demo.parallel)
                                .withNumThreads(config.numThreads)
                                .build(),
                            config.encoding);
            demoEncryption(codec, demo.description, text);
        }
        return 0;
    }

} // namespace xorblur

int main(int argc, char *argv[])
{
    using namespace xorblur;

    Config config;

    try
    {
        if (!parseArgs(argc, argv, config))
        {
            return 0;
        }

        if (config.demo)
        {
            return runDemo(config);
        }

        printHeader();
        printSystemInfo(config);
        return runBenchmarks(config);
    }
    catch (const std::exception &e)
    {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
