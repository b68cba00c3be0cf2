#include <cstdio>
#include <iostream>
#include <string>

int main()
{
    // Fake runner that floods stdout far beyond any output limit.
    std::string line;
    (void)std::getline(std::cin, line);

    const std::string chunk(64 * 1024, 'x');
    for (int i = 0; i < 4096; ++i)
    {
        if (std::fwrite(chunk.data(), 1, chunk.size(), stdout) != chunk.size())
        {
            return 1;
        }
    }
    return 0;
}
