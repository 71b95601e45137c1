#include "csv_logger.hpp"
#include <iomanip>
#include <stdexcept>

namespace xorblur {

CsvLogger::CsvLogger(const std::string& filename)
    : file_(filename), headerWritten_(false) {
    if (!file_.is_open()) {
        throw std::runtime_error("Cannot open CSV file: " + filename);
    }
}

CsvLogger::~CsvLogger() {
    if (file_.is_open()) {
        file_.close();
    }
}

void CsvLogger::writeHeader() {
    if (!headerWritten_) {
        file_ << "Platform,Strategy,Mode,Size_Bytes,Parallel,NumThreads,Iterations,"
                 "Time_Sec,Throughput_MBs,Speedup,RoundTrip,Consistent,SHA256\n";
        headerWritten_ = true;
    }
}

void CsvLogger::writeResult(const BenchmarkResult& result) {
    if (!headerWritten_) {
        writeHeader();
    }

    file_ << result.platform << ","
          << result.strategy << ","
          << result.mode << ","
          << result.sizeBytes << ","
          << (result.parallel ? "yes" : "no") << ","
          << result.numThreads << ","
          << result.iterations << ","
          << std::fixed << std::setprecision(9) << result.timeSec << ","
          << std::fixed << std::setprecision(2) << result.throughputMBs << ","
          << std::fixed << std::setprecision(4) << result.speedup << ","
          << (result.verified ? "PASS" : "FAIL") << ","
          << (result.consistent ? "PASS" : "FAIL") << ","
          << result.digest << "\n";

    if (!file_) {
        throw std::runtime_error("Failed to write CSV row");
    }
}

void CsvLogger::flush() {
    file_.flush();
}

}
