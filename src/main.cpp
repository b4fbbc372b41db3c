#include "AnalysisPipeline.h"
#include "AutoConfig.h"
#include "PsynetExceptions.h"

#include <iostream>
#include <string>

int main(int argc, char* argv[]) {
    if (argc >= 2 && (std::string(argv[1]) == "--help" || std::string(argv[1]) == "-h")) {
        std::cout << AutoConfig::usage() << "\n";
        return 0;
    }

    std::cout << "Psynet: network psychometrics pipeline\n";
    try {
        const AutoConfig config = AutoConfig::fromArgs(argc, argv);
        AnalysisPipeline pipeline;
        return pipeline.run(config);
    } catch (const Psynet::PsynetException& e) {
        std::cerr << "[Psynet][Error] " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "[Psynet][Exception] " << e.what() << "\n";
        return 1;
    }
}
