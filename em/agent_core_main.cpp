#include "launcher.hpp"

int main(int argc, char** argv) {
    return agentcore::em::RunAgentCore(argc, argv);
}
