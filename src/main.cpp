#include "CommandLine.h"

int main(int argc, char **argv)
{
    return ProofEngine::CommandLine::run(argc, argv);
}
