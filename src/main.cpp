#include <iostream>
#include <vector>
#include <string>
#include "cli/sshbatch_cli.hpp"
#include "cli/theme.hpp"
#include "ssh/connection_factory.hpp"

int main(int argc, char** argv) {
    try {
        ConnectionFactory transport;
        SshBatchCLI cli(transport);

        std::vector<std::string> args(argv + 1, argv + argc);
        return cli.run(args);
    } catch (const std::exception& e) {
        std::cout << theme::fail("Unexpected error: " + std::string(e.what()));
        return 1;
    }
}
