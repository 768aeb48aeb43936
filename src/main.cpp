#include <exception>
#include <iostream>

#include "gitprompt/app.h"
#include "gitprompt/logger.h"

int main(int argc, char** argv) {
    try {
        gitprompt::App app{std::cin, std::cout, std::cerr};
        return app.run(argc, argv);
    } catch (const std::exception& ex) {
        // Keep the prompt intact: reply with an empty line, report on stderr.
        gitprompt::Logger::instance().error("{}", ex.what());
        std::cout << '\n';
        return 1;
    }
}
