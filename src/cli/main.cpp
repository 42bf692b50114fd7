#include "omemo_send/app/send_application.hpp"

#include <iostream>

int main(int argc, char* argv[]) {
    omemo_send::app::SendApplication application(std::cin, std::cout, std::cerr);
    return application.Run(argc, argv);
}
