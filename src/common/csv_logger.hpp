#pragma once

#include <string>
#include <fstream>
#include <cstddef>

namespace xorblur {

struct BenchmarkResult {
    std::string platform;
    std::string strategy;
    std::string mode;
    size_t sizeBytes;
    bool parallel;
    int numThreads;
    int iterations;
    double timeSec;
    double throughputMBs;
    double speedup;
    bool verified;
    bool consistent;
    std::string digest;

    BenchmarkResult() : platform("Unknown"), mode("dynamic"), sizeBytes(0), parallel(false),
                        numThreads(1), iterations(1), timeSec(0), throughputMBs(0),
                        speedup(1.0), verified(false), consistent(false) {}
};

class CsvLogger {
public:
    explicit CsvLogger(const std::string& filename);
    ~CsvLogger();

    void writeHeader();
    void writeResult(const BenchmarkResult& result);
    void flush();

private:
    std::ofstream file_;
    bool headerWritten_;
};

}
