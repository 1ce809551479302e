#include "phash.hpp"

int main(int argc, char **argv)
{
    if (phash::init(argc, argv) == -1)
        return 1;

    return 0;
}
