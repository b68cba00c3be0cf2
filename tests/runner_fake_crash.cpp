#include <csignal>
#include <iostream>
#include <string>

int main()
{
    // Fake runner that dies from a signal after reading the request.
    std::string line;
    (void)std::getline(std::cin, line);
    std::cout << "{\"half\":" << std::flush;
    std::raise(SIGSEGV);
    return 0;
}
