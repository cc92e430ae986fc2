#include "supercopyMain.hpp"

int main(int argc, char** argv)
{
    return supercopyMain(argc, argv);
}
