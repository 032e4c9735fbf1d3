#include "app/DiagnosisApp.hpp"
#include <cstring>
#include <exception>
#include <iostream>

int main(int argc, char** argv) {
    // 1. 设定默认参数
    ProgramOptions opts;
    opts.trainPath      = "data/train.csv";
    opts.testPath       = "";              // 默认从训练集划分
    opts.outputPath     = "predictions.csv";
    opts.maxDepth       = 10;
    opts.minSamplesLeaf = 2;
    opts.minGainRatio   = 0.0;
    opts.trainRatio     = 0.8;
    opts.printTrees     = false;

    try {
        // 2. 参数解析
        if (argc >= 2) opts.trainPath = argv[1];
        if (argc >= 3 && std::strcmp(argv[2], "-") != 0) opts.testPath = argv[2];
        if (argc >= 4) opts.outputPath = argv[3];
        if (argc >= 5) opts.maxDepth = std::stoi(argv[4]);
        if (argc >= 6) opts.minSamplesLeaf = std::stoi(argv[5]);
        if (argc >= 7) opts.minGainRatio = std::stod(argv[6]);
        if (argc >= 8) opts.trainRatio = std::stod(argv[7]);
        if (argc >= 9) opts.printTrees = std::strcmp(argv[8], "print") == 0;

        // 3. 输出参数
        std::cout << "Train: " << opts.trainPath << " | ";
        std::cout << "Test: " << (opts.testPath.empty() ? "(hold-out)" : opts.testPath) << " | ";
        std::cout << "Depth: " << opts.maxDepth << " | ";
        std::cout << "MinLeaf: " << opts.minSamplesLeaf << " | ";
        std::cout << "MinGainRatio: " << opts.minGainRatio << std::endl;

        // 4. 运行
        runDiagnosisApp(opts);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        std::cerr << "Usage: " << argv[0]
                  << " <train.csv> [test.csv|-] [output.csv] [maxDepth] [minSamplesLeaf]"
                  << " [minGainRatio] [trainRatio] [print]" << std::endl;
        return 1;
    }
    return 0;
}
