#include "functions/io/DataIO.hpp"
#include "preprocessing/RecordCleaner.hpp"
#include <filesystem>
#include <iostream>

namespace fs = std::filesystem;

int main(int argc, char** argv) {
    const std::string inPath  = argc >= 2 ? argv[1] : "data/raw.csv";
    const std::string outPath = argc >= 3 ? argv[2] : "data/data_clean/cleaned.csv";

    try {
        // 确保输出目录存在
        const fs::path outDir = fs::path(outPath).parent_path();
        if (!outDir.empty()) fs::create_directories(outDir);

        DataIO io;
        auto records = io.readRecords(inPath);
        auto cleaned = preprocessing::RecordCleaner::clean(records);
        io.writeRecords(outPath, cleaned);

        std::cout << "Cleaned " << inPath << " -> " << outPath << std::endl;
    } catch (const std::exception& e) {
        std::cerr << "Error processing " << inPath << ": " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
