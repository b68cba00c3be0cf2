#include <iostream>
#include <string>

int main()
{
    // Fake runner that answers with something other than a protocol response.
    std::string line;
    (void)std::getline(std::cin, line);
    std::cout << "Traceback (most recent call last): /srv/app/runner.py line 3\n";
    return 0;
}
